#pragma once

#include <source_range.hpp>
#include <ast.hpp>

#include <string_view>
#include <optional>
#include <string>
#include <vector>

namespace dson
{

struct slot_ref
{
  slot_t slot;
  std::uint32_t depth;

  bool operator==(const slot_ref& other) const
  { return slot == other.slot && depth == other.depth; }
  bool operator!=(const slot_ref& other) const
  { return !(*this == other); }
};

// Hands out slots while a tree is being built and turns names into
// (slot, depth) pairs.
//
// Frames are function boundaries: a function literal, a function valued bind
// or a method field. Slots restart at 0 in every frame. Scopes (local, object,
// comprehension) only limit visibility of names, slots keep increasing inside
// a frame so sibling scopes never share one.
//
// The resolver starts with two frames: the global frame holding `globals` and
// the frame of the top level expression. Globals therefore resolve with depth 1
// from top level code.
class scope_resolver
{
public:
  scope_resolver(const source_map& src, std::vector<std::string> globals = {});

  void open_frame();
  void close_frame(std::size_t offset);

  void open_scope();
  void close_scope(std::size_t offset);

  slot_t declare(std::string name);

  // Declares every parameter of `p` in order. Call it right after open_frame,
  // so the slots handed out agree with the ones params::make assigned. A
  // reader that has not built the list yet declares the names one by one.
  // Either way defaults are resolved afterwards and see all parameters.
  void declare(const params& p);

  // Emits unresolved_identifier if `name` is not bound anywhere.
  std::optional<slot_ref> resolve(std::size_t offset, std::string_view name);
  std::optional<id> identifier(std::size_t offset, std::string_view name);

  bool is_global(std::string_view name) const;

  slot_t frame_size() const { return frames.back().next_slot; }

  // number of open frames below the global one
  std::size_t frame_depth() const { return frames.size() - 1; }
private:
  struct frame
  {
    slot_t next_slot { 0 };
    std::vector<std::pair<std::string, slot_t>> binder_stack;
    std::vector<std::size_t> scope_marks;
  };

  std::optional<slot_ref> find(std::string_view name) const;

  const source_map& src;
  std::vector<frame> frames;
};

}
