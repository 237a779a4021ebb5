#pragma once

#include <nlohmann/json.hpp>

#include <string_view>
#include <cstdio>
#include <vector>

enum class emit_classes
{
  undef,
  help,
  sexpr,
  json,
  frames,
};

NLOHMANN_JSON_SERIALIZE_ENUM( emit_classes, {
  { emit_classes::undef, "undef" },
  { emit_classes::help, "help" },
  { emit_classes::sexpr, "sexpr" },
  { emit_classes::json, "json" },
  { emit_classes::frames, "frames" },
})

const static auto emit_classes_list = {
  emit_classes::help,
  emit_classes::sexpr,
  emit_classes::json,
  emit_classes::frames,
};

void print_emit_classes(std::FILE* f);

struct config_t
{
  bool print_help { false };

  emit_classes emit_class { emit_classes::help };
  std::size_t num_cores { 1 };

  std::vector<std::string_view> files;
};

inline config_t config;
