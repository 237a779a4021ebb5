#pragma once

#include <ast.hpp>

#include <ostream>
#include <string>

// Canonical S-expression rendering of a tree. Offsets are left out so
// fixtures can compare shapes; the JSON codec keeps them.
//
//   local x = 1; x + 2    =>   (local ((bind 0 _ (num 1))) (binary + (id 0) (num 2)))
//
// Absent optional children print as `_`. An id referring to an enclosing
// function frame prints its depth: `(id 3 ^1)`.
namespace dson
{

void print(std::ostream& os, const expr& e);
void print(std::ostream& os, const obj_body& body);
void print(std::ostream& os, const params& p);

std::string to_sexpr(const expr& e);
std::string to_sexpr(const obj_body& body);

}
