#pragma once

#include <diagnostic.hpp>

#include <fmt/format.h>

// Every entry carries a fixed code, so a message reads the same no matter
// which translation unit produced it.
namespace diagnostic_db
{

#define db_entry(lv, name, hrc, txt) static const auto name = [](const source_range& range) \
{ return mk_diag::lv(range, hrc, txt); }

#define db_entry_arg(lv, name, hrc, txt) static const auto name = [](const source_range& range, auto t) \
{ return mk_diag::lv(range, hrc, fmt::format(FMT_STRING(txt), t)); }

#define db_entry_arg2(lv, name, hrc, txt) static const auto name = [](const source_range& range, auto t1, auto t2) \
{ return mk_diag::lv(range, hrc, fmt::format(FMT_STRING(txt), t1, t2)); }

namespace args
{

db_entry(error, unknown_arg, 100, "Unknown command line argument!");
db_entry(error, emit_not_present, 101, "Selected emit class is unknown!");
db_entry(error, num_cores_too_small, 102, "Number of cores smaller than one.");
db_entry(warn, num_cores_too_large, 103, "Number of cores bigger than the number of concurrent threads supported by the implementation.");
db_entry_arg(error, num_cores_not_a_number, 104, "\"{}\" is not a number of cores.");

}

namespace ast
{

db_entry_arg(error, duplicate_parameter_name, 200, "Parameter \"{}\" is declared more than once.");
db_entry_arg(error, duplicate_static_field_name, 201, "Field \"{}\" is declared more than once in this object.");

}

namespace sema
{

db_entry_arg(error, unresolved_identifier, 300, "\"{}\" is not bound in any enclosing scope.");
db_entry(error, close_without_scope, 301, "Scope closed without a matching open.");

}

namespace dump
{

db_entry(error, not_json, 400, "Input is not valid JSON.");
db_entry_arg(error, malformed_node, 401, "Malformed tree node: {}.");
db_entry_arg(error, unknown_node_kind, 402, "Unknown node kind \"{}\".");
db_entry_arg(error, unknown_operator, 403, "Unknown operator \"{}\".");
db_entry_arg(error, unknown_visibility, 404, "Unknown field visibility \"{}\".");
db_entry_arg2(error, slot_mismatch, 405, "Parameter \"{}\" is stored with slot {} but parameters are numbered in declaration order.");
db_entry_arg(error, cannot_open, 406, "Cannot open \"{}\" for reading.");

}


#undef db_entry
#undef db_entry_arg
#undef db_entry_arg2

}
