#pragma once

#include <config.hpp>

#include <string_view>
#include <optional>
#include <string>

struct tree_tool
{
  // Runs config.emit_class over every configured file, at most
  // config.num_cores of them at a time.
  void go();

  // Reads the JSON tree stored in `module` and renders it as `what` asks.
  // Nothing is returned if the tree could not be read, the reason is in the
  // diagnostics manager.
  static std::optional<std::string> render(std::string_view module, emit_classes what);
};
