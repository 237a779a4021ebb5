#pragma once

#include <source_range.hpp>
#include <ast.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <istream>

// Tagged JSON form of a tree, used for test fixtures and by dsonnet-tree.
// Every node is an object with "kind" and "offset"; absent optional children
// are null. Reading a dump back yields a tree equal() to the one dumped.
namespace dson
{

nlohmann::json dump_json(const expr& e);
nlohmann::json dump_json(const obj_body& body);
nlohmann::json dump_json(const params& p);

// Malformed input is reported through the diagnostics manager, positions are
// taken from the offsets stored in the dump and translated with `src`.
std::optional<expr> read_json(const nlohmann::json& j, const source_map& src);
std::optional<expr> read_json(std::istream& is, const source_map& src);

}
