#pragma once

#include <scope.hpp>
#include <ast.hpp>

#include <nlohmann/json.hpp>

#include <vector>

namespace dson
{

// What an evaluator needs to allocate one activation of a frame.
struct frame_layout
{
  // slots bound directly in this frame, parameters included
  slot_t size { 0 };

  // outer slots referenced from this frame or any frame nested in it,
  // depth relative to this frame (always >= 1), in order of first use
  std::vector<slot_ref> captures;
};

frame_layout layout_of(const function& fn);
frame_layout layout_of(const params& p, const expr& body);

// Layout of the top level frame, globals show up as captures of depth 1.
frame_layout layout_of(const expr& top_level);

void to_json(nlohmann::json& j, const frame_layout& layout);

}
