#pragma once

#include <source_range.hpp>
#include <ast_nodes.hpp>
#include <ast_fwd.hpp>

#include <tsl/robin_map.h>

#include <string_view>
#include <optional>
#include <utility>
#include <string>
#include <vector>

namespace dson
{

/// PARAMETERS

struct param
{
  std::size_t offset;
  std::string name;
  std::optional<expr> default_value;
  slot_t slot;
};

// A parameter as the parser sees it. Slots are handed out by params::make.
struct param_decl
{
  std::size_t offset;
  std::string name;
  std::optional<expr> default_value;
};

class params
{
public:
  // Assigns slots 0..N-1 in declaration order. Emits a duplicate_parameter_name
  // diagnostic and returns nothing if two entries share a name.
  static std::optional<params> make(const source_map& src, std::vector<param_decl> decls);

  const std::vector<param>& entries() const { return data; }
  std::size_t size() const { return data.size(); }
  bool empty() const { return data.empty(); }

  std::optional<slot_t> slot_of(std::string_view name) const;

  const tsl::robin_map<std::string, slot_t>& name_to_slot() const { return name_slots; }
  const std::vector<slot_t>& required_slots() const { return required; }
  const std::vector<std::pair<slot_t, expr>>& defaulted_slots() const { return defaulted; }
  const std::vector<slot_t>& all_slots() const { return all; }
private:
  params(std::vector<param> entries, tsl::robin_map<std::string, slot_t> name_slots);

  std::vector<param> data;

  tsl::robin_map<std::string, slot_t> name_slots;
  std::vector<slot_t> required;
  std::vector<std::pair<slot_t, expr>> defaulted;
  std::vector<slot_t> all;
};

// Without params the binding is a plain value, with params it defines a function.
struct bind
{
  std::size_t offset;
  slot_t slot;
  std::optional<params> fn_params;
  expr rhs;
};

struct arg
{
  std::optional<std::string> name; // positional if empty
  expr value;
};

/// OBJECT BODIES

struct fixed_name
{
  std::string value;
};

struct dyn_name
{
  expr value;
};

struct field
{
  std::size_t offset;
  field_name name;
  bool plus; // `+:` merges with the base object's field when extending
  std::optional<params> method_params;
  visibility vis;
  expr rhs;
};

struct bind_stmt
{
  bind value;
};

struct assert_stmt
{
  expr cond;
  std::optional<expr> message;
};

class member_list
{
public:
  // Emits a duplicate_static_field_name diagnostic and returns nothing if two
  // fixed field names collide. Dynamic names are only known when evaluating.
  static std::optional<member_list> make(const source_map& src, std::vector<member> members);

  const std::vector<member>& members() const { return data; }

  std::vector<const field*> fields() const;
  std::vector<const field*> visible_fields() const;
  std::vector<std::string> visible_field_names() const;
  const field* find_field(std::string_view name) const;

  std::vector<const bind_stmt*> binds() const;
  std::vector<const assert_stmt*> asserts() const;
private:
  member_list(std::vector<member> members) : data(std::move(members)) {}

  std::vector<member> data;
};

struct obj_comp
{
  std::vector<bind_stmt> pre_locals;
  expr key;
  expr value;
  std::vector<bind_stmt> post_locals;
  for_spec first;
  std::vector<comp_spec> rest;
};

/// EXPRESSIONS

struct expr_base
{
  explicit expr_base(std::size_t offset) : offset(offset) {}

  std::size_t offset;
};

struct null_lit_ : expr_base { using expr_base::expr_base; };
struct true_lit_ : expr_base { using expr_base::expr_base; };
struct false_lit_ : expr_base { using expr_base::expr_base; };
struct self_ref_ : expr_base { using expr_base::expr_base; };
struct super_ref_ : expr_base { using expr_base::expr_base; };
struct root_ref_ : expr_base { using expr_base::expr_base; };

struct str_ : expr_base
{
  str_(std::size_t offset, std::string value)
    : expr_base(offset), value(std::move(value))
  {  }

  std::string value;
};

struct num_ : expr_base
{
  num_(std::size_t offset, double value)
    : expr_base(offset), value(value)
  {  }

  double value;
};

// `depth` counts the function frames between this reference and the frame
// owning `slot`; 0 is the innermost one.
struct id_ : expr_base
{
  id_(std::size_t offset, slot_t slot, std::uint32_t depth)
    : expr_base(offset), slot(slot), depth(depth)
  {  }

  slot_t slot;
  std::uint32_t depth;
};

struct arr_ : expr_base
{
  arr_(std::size_t offset, std::vector<expr> elements)
    : expr_base(offset), elements(std::move(elements))
  {  }

  std::vector<expr> elements;
};

struct obj_ : expr_base
{
  obj_(std::size_t offset, obj_body body)
    : expr_base(offset), body(std::move(body))
  {  }

  obj_body body;
};

struct obj_extend_ : expr_base
{
  obj_extend_(std::size_t offset, expr base, obj_body ext)
    : expr_base(offset), base(std::move(base)), ext(std::move(ext))
  {  }

  expr base;
  obj_body ext;
};

struct parened_ : expr_base
{
  parened_(std::size_t offset, expr inner)
    : expr_base(offset), inner(std::move(inner))
  {  }

  expr inner;
};

struct unary_op_ : expr_base
{
  unary_op_(std::size_t offset, unary_operator op, expr operand)
    : expr_base(offset), op(op), operand(std::move(operand))
  {  }

  unary_operator op;
  expr operand;
};

struct binary_op_ : expr_base
{
  binary_op_(std::size_t offset, expr lhs, binary_operator op, expr rhs)
    : expr_base(offset), lhs(std::move(lhs)), op(op), rhs(std::move(rhs))
  {  }

  expr lhs;
  binary_operator op;
  expr rhs;
};

struct assert_expr_ : expr_base
{
  assert_expr_(std::size_t offset, assert_stmt assertion, expr returned)
    : expr_base(offset), assertion(std::move(assertion)), returned(std::move(returned))
  {  }

  assert_stmt assertion;
  expr returned;
};

struct local_expr_ : expr_base
{
  local_expr_(std::size_t offset, std::vector<bind> bindings, expr returned)
    : expr_base(offset), bindings(std::move(bindings)), returned(std::move(returned))
  {  }

  std::vector<bind> bindings;
  expr returned;
};

struct if_else_ : expr_base
{
  if_else_(std::size_t offset, expr cond, expr then, std::optional<expr> otherwise)
    : expr_base(offset), cond(std::move(cond)), then(std::move(then)), otherwise(std::move(otherwise))
  {  }

  expr cond;
  expr then;
  std::optional<expr> otherwise;
};

struct error_expr_ : expr_base
{
  error_expr_(std::size_t offset, expr message)
    : expr_base(offset), message(std::move(message))
  {  }

  expr message;
};

struct function_ : expr_base
{
  function_(std::size_t offset, params fn_params, expr body)
    : expr_base(offset), fn_params(std::move(fn_params)), body(std::move(body))
  {  }

  params fn_params;
  expr body;
};

struct apply_ : expr_base
{
  apply_(std::size_t offset, expr target, std::vector<arg> args)
    : expr_base(offset), target(std::move(target)), args(std::move(args))
  {  }

  expr target;
  std::vector<arg> args;
};

struct select_ : expr_base
{
  select_(std::size_t offset, expr target, std::string name)
    : expr_base(offset), target(std::move(target)), name(std::move(name))
  {  }

  expr target;
  std::string name;
};

struct lookup_ : expr_base
{
  lookup_(std::size_t offset, expr target, expr index)
    : expr_base(offset), target(std::move(target)), index(std::move(index))
  {  }

  expr target;
  expr index;
};

struct slice_ : expr_base
{
  slice_(std::size_t offset, expr target, std::optional<expr> start,
                         std::optional<expr> end, std::optional<expr> stride)
    : expr_base(offset), target(std::move(target)), start(std::move(start)),
      end(std::move(end)), stride(std::move(stride))
  {  }

  expr target;
  std::optional<expr> start;
  std::optional<expr> end;
  std::optional<expr> stride;
};

struct import_ : expr_base
{
  import_(std::size_t offset, std::string path)
    : expr_base(offset), path(std::move(path))
  {  }

  std::string path;
};

struct import_str_ : expr_base
{
  import_str_(std::size_t offset, std::string path)
    : expr_base(offset), path(std::move(path))
  {  }

  std::string path;
};

struct if_spec_ : expr_base
{
  if_spec_(std::size_t offset, expr cond)
    : expr_base(offset), cond(std::move(cond))
  {  }

  expr cond;
};

struct for_spec_ : expr_base
{
  for_spec_(std::size_t offset, slot_t slot, expr iterable)
    : expr_base(offset), slot(slot), iterable(std::move(iterable))
  {  }

  slot_t slot;
  expr iterable;
};

struct comp_ : expr_base
{
  comp_(std::size_t offset, expr value, for_spec first, std::vector<comp_spec> rest)
    : expr_base(offset), value(std::move(value)), first(std::move(first)), rest(std::move(rest))
  {  }

  expr value;
  for_spec first;
  std::vector<comp_spec> rest;
};

/// CONSTRUCTION

namespace mk
{
  null_lit lit_null(std::size_t offset);
  true_lit lit_true(std::size_t offset);
  false_lit lit_false(std::size_t offset);
  self_ref self(std::size_t offset);
  super_ref super(std::size_t offset);
  root_ref dollar(std::size_t offset);

  str string(std::size_t offset, std::string value);
  num number(std::size_t offset, double value);
  id ident(std::size_t offset, slot_t slot, std::uint32_t depth = 0);
  arr array(std::size_t offset, std::vector<expr> elements);
  obj object(std::size_t offset, obj_body body);
  obj_extend extend(std::size_t offset, expr base, obj_body ext);
  parened paren(std::size_t offset, expr inner);

  unary_op unary(std::size_t offset, unary_operator op, expr operand);
  binary_op binary(std::size_t offset, expr lhs, binary_operator op, expr rhs);

  assert_expr assertion(std::size_t offset, assert_stmt asserted, expr returned);
  local_expr local(std::size_t offset, std::vector<bind> bindings, expr returned);
  if_else cond(std::size_t offset, expr cond, expr then, std::optional<expr> otherwise = std::nullopt);
  error_expr error(std::size_t offset, expr message);
  function fn(std::size_t offset, params fn_params, expr body);
  apply call(std::size_t offset, expr target, std::vector<arg> args);

  select field_access(std::size_t offset, expr target, std::string name);
  lookup index(std::size_t offset, expr target, expr index);
  slice range(std::size_t offset, expr target, std::optional<expr> start,
              std::optional<expr> end, std::optional<expr> stride);

  import import_code(std::size_t offset, std::string path);
  import_str import_string(std::size_t offset, std::string path);

  if_spec filter(std::size_t offset, expr cond);
  for_spec generator(std::size_t offset, slot_t slot, expr iterable);
  comp comprehension(std::size_t offset, expr value, for_spec first, std::vector<comp_spec> rest = {});
}

/// INSPECTION

std::size_t offset_of(const expr& e);
std::size_t offset_of(const comp_spec& spec);

// canonical tag used by the printer and the JSON codec
std::string_view kind_name(const expr& e);

// Deep comparison of every field, offsets included.
bool equal(const expr& lhs, const expr& rhs);
bool equal(const obj_body& lhs, const obj_body& rhs);
bool equal(const params& lhs, const params& rhs);

}
