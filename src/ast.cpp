#include <ast.hpp>
#include <diagnostic.hpp>
#include <diagnostic_db.hpp>

#include <tsl/robin_map.h>
#include <tsl/robin_set.h>

#include <algorithm>
#include <cmath>

using namespace std::literals::string_view_literals;

namespace dson
{

/// OPERATORS

static const auto unary_symbols_map = tsl::robin_map<std::string_view, unary_operator>({
  { "+"sv, unary_operator::plus },
  { "-"sv, unary_operator::minus },
  { "~"sv, unary_operator::bit_not },
  { "!"sv, unary_operator::logical_not },
});

static const auto binary_symbols_map = tsl::robin_map<std::string_view, binary_operator>({
  { "*"sv,  binary_operator::mul },
  { "/"sv,  binary_operator::div },
  { "%"sv,  binary_operator::mod },
  { "+"sv,  binary_operator::add },
  { "-"sv,  binary_operator::sub },
  { "<<"sv, binary_operator::shl },
  { ">>"sv, binary_operator::shr },
  { "<"sv,  binary_operator::lt },
  { ">"sv,  binary_operator::gt },
  { "<="sv, binary_operator::le },
  { ">="sv, binary_operator::ge },
  { "in"sv, binary_operator::in },
  { "=="sv, binary_operator::eq },
  { "!="sv, binary_operator::ne },
  { "&"sv,  binary_operator::bit_and },
  { "^"sv,  binary_operator::bit_xor },
  { "|"sv,  binary_operator::bit_or },
  { "&&"sv, binary_operator::logical_and },
  { "||"sv, binary_operator::logical_or },
});

std::string_view to_string(unary_operator op)
{
  switch(op)
  {
  case unary_operator::plus: return "+";
  case unary_operator::minus: return "-";
  case unary_operator::bit_not: return "~";
  case unary_operator::logical_not: return "!";
  }
  return "?";
}

std::string_view to_string(binary_operator op)
{
  switch(op)
  {
  case binary_operator::mul: return "*";
  case binary_operator::div: return "/";
  case binary_operator::mod: return "%";
  case binary_operator::add: return "+";
  case binary_operator::sub: return "-";
  case binary_operator::shl: return "<<";
  case binary_operator::shr: return ">>";
  case binary_operator::lt: return "<";
  case binary_operator::gt: return ">";
  case binary_operator::le: return "<=";
  case binary_operator::ge: return ">=";
  case binary_operator::in: return "in";
  case binary_operator::eq: return "==";
  case binary_operator::ne: return "!=";
  case binary_operator::bit_and: return "&";
  case binary_operator::bit_xor: return "^";
  case binary_operator::bit_or: return "|";
  case binary_operator::logical_and: return "&&";
  case binary_operator::logical_or: return "||";
  }
  return "?";
}

std::string_view to_string(visibility vis)
{
  switch(vis)
  {
  case visibility::normal: return "normal";
  case visibility::hidden: return "hidden";
  case visibility::unhide: return "unhide";
  }
  return "?";
}

std::optional<unary_operator> unary_operator_from(std::string_view spelling)
{
  auto it = unary_symbols_map.find(spelling);
  if(it == unary_symbols_map.end())
    return std::nullopt;
  return it->second;
}

std::optional<binary_operator> binary_operator_from(std::string_view spelling)
{
  auto it = binary_symbols_map.find(spelling);
  if(it == binary_symbols_map.end())
    return std::nullopt;
  return it->second;
}

/// PARAMETERS

params::params(std::vector<param> entries, tsl::robin_map<std::string, slot_t> name_slots)
  : data(std::move(entries)), name_slots(std::move(name_slots))
{
  required.reserve(data.size());
  all.reserve(data.size());
  for(auto& p : data)
  {
    if(p.default_value)
      defaulted.emplace_back(p.slot, *p.default_value);
    else
      required.push_back(p.slot);
    all.push_back(p.slot);
  }
}

std::optional<params> params::make(const source_map& src, std::vector<param_decl> decls)
{
  tsl::robin_map<std::string, slot_t> name_slots;
  name_slots.reserve(decls.size());

  std::vector<param> entries;
  entries.reserve(decls.size());

  bool error = false;
  for(auto& d : decls)
  {
    const slot_t slot = static_cast<slot_t>(entries.size());
    if(!name_slots.emplace(d.name, slot).second)
    {
      diagnostic <<= diagnostic_db::ast::duplicate_parameter_name(src.range(d.offset, d.name.size()), d.name);
      error = true;
      continue;
    }
    entries.push_back(param { d.offset, std::move(d.name), std::move(d.default_value), slot });
  }
  if(error)
    return std::nullopt;
  return params(std::move(entries), std::move(name_slots));
}

std::optional<slot_t> params::slot_of(std::string_view name) const
{
  auto it = name_slots.find(std::string(name));
  if(it == name_slots.end())
    return std::nullopt;
  return it->second;
}

/// OBJECT BODIES

std::optional<member_list> member_list::make(const source_map& src, std::vector<member> members)
{
  tsl::robin_set<std::string> seen;

  bool error = false;
  for(auto& m : members)
  {
    auto* f = std::get_if<field>(&m);
    if(f == nullptr)
      continue;
    auto* name = std::get_if<fixed_name>(&f->name);
    if(name == nullptr)
      continue;

    if(!seen.insert(name->value).second)
    {
      diagnostic <<= diagnostic_db::ast::duplicate_static_field_name(src.range(f->offset), name->value);
      error = true;
    }
  }
  if(error)
    return std::nullopt;
  return member_list(std::move(members));
}

std::vector<const field*> member_list::fields() const
{
  std::vector<const field*> to_ret;
  for(auto& m : data)
  {
    if(auto* f = std::get_if<field>(&m))
      to_ret.push_back(f);
  }
  return to_ret;
}

std::vector<const field*> member_list::visible_fields() const
{
  auto to_ret = fields();
  to_ret.erase(std::remove_if(to_ret.begin(), to_ret.end(), [](const field* f) { return !is_visible(f->vis); }),
               to_ret.end());
  return to_ret;
}

std::vector<std::string> member_list::visible_field_names() const
{
  std::vector<std::string> to_ret;
  for(auto* f : visible_fields())
  {
    if(auto* name = std::get_if<fixed_name>(&f->name))
      to_ret.push_back(name->value);
  }
  return to_ret;
}

const field* member_list::find_field(std::string_view name) const
{
  for(auto* f : fields())
  {
    auto* fixed = std::get_if<fixed_name>(&f->name);
    if(fixed != nullptr && fixed->value == name)
      return f;
  }
  return nullptr;
}

std::vector<const bind_stmt*> member_list::binds() const
{
  std::vector<const bind_stmt*> to_ret;
  for(auto& m : data)
  {
    if(auto* b = std::get_if<bind_stmt>(&m))
      to_ret.push_back(b);
  }
  return to_ret;
}

std::vector<const assert_stmt*> member_list::asserts() const
{
  std::vector<const assert_stmt*> to_ret;
  for(auto& m : data)
  {
    if(auto* a = std::get_if<assert_stmt>(&m))
      to_ret.push_back(a);
  }
  return to_ret;
}

/// CONSTRUCTION

namespace mk
{
  null_lit lit_null(std::size_t offset) { return std::make_shared<null_lit_>(offset); }
  true_lit lit_true(std::size_t offset) { return std::make_shared<true_lit_>(offset); }
  false_lit lit_false(std::size_t offset) { return std::make_shared<false_lit_>(offset); }
  self_ref self(std::size_t offset) { return std::make_shared<self_ref_>(offset); }
  super_ref super(std::size_t offset) { return std::make_shared<super_ref_>(offset); }
  root_ref dollar(std::size_t offset) { return std::make_shared<root_ref_>(offset); }

  str string(std::size_t offset, std::string value)
  { return std::make_shared<str_>(offset, std::move(value)); }

  num number(std::size_t offset, double value)
  { return std::make_shared<num_>(offset, value); }

  id ident(std::size_t offset, slot_t slot, std::uint32_t depth)
  { return std::make_shared<id_>(offset, slot, depth); }

  arr array(std::size_t offset, std::vector<expr> elements)
  { return std::make_shared<arr_>(offset, std::move(elements)); }

  obj object(std::size_t offset, obj_body body)
  { return std::make_shared<obj_>(offset, std::move(body)); }

  obj_extend extend(std::size_t offset, expr base, obj_body ext)
  { return std::make_shared<obj_extend_>(offset, std::move(base), std::move(ext)); }

  parened paren(std::size_t offset, expr inner)
  { return std::make_shared<parened_>(offset, std::move(inner)); }

  unary_op unary(std::size_t offset, unary_operator op, expr operand)
  { return std::make_shared<unary_op_>(offset, op, std::move(operand)); }

  binary_op binary(std::size_t offset, expr lhs, binary_operator op, expr rhs)
  { return std::make_shared<binary_op_>(offset, std::move(lhs), op, std::move(rhs)); }

  assert_expr assertion(std::size_t offset, assert_stmt asserted, expr returned)
  { return std::make_shared<assert_expr_>(offset, std::move(asserted), std::move(returned)); }

  local_expr local(std::size_t offset, std::vector<bind> bindings, expr returned)
  { return std::make_shared<local_expr_>(offset, std::move(bindings), std::move(returned)); }

  if_else cond(std::size_t offset, expr cond, expr then, std::optional<expr> otherwise)
  { return std::make_shared<if_else_>(offset, std::move(cond), std::move(then), std::move(otherwise)); }

  error_expr error(std::size_t offset, expr message)
  { return std::make_shared<error_expr_>(offset, std::move(message)); }

  function fn(std::size_t offset, params fn_params, expr body)
  { return std::make_shared<function_>(offset, std::move(fn_params), std::move(body)); }

  apply call(std::size_t offset, expr target, std::vector<arg> args)
  { return std::make_shared<apply_>(offset, std::move(target), std::move(args)); }

  select field_access(std::size_t offset, expr target, std::string name)
  { return std::make_shared<select_>(offset, std::move(target), std::move(name)); }

  lookup index(std::size_t offset, expr target, expr index)
  { return std::make_shared<lookup_>(offset, std::move(target), std::move(index)); }

  slice range(std::size_t offset, expr target, std::optional<expr> start,
              std::optional<expr> end, std::optional<expr> stride)
  { return std::make_shared<slice_>(offset, std::move(target), std::move(start), std::move(end), std::move(stride)); }

  import import_code(std::size_t offset, std::string path)
  { return std::make_shared<import_>(offset, std::move(path)); }

  import_str import_string(std::size_t offset, std::string path)
  { return std::make_shared<import_str_>(offset, std::move(path)); }

  if_spec filter(std::size_t offset, expr cond)
  { return std::make_shared<if_spec_>(offset, std::move(cond)); }

  for_spec generator(std::size_t offset, slot_t slot, expr iterable)
  { return std::make_shared<for_spec_>(offset, slot, std::move(iterable)); }

  comp comprehension(std::size_t offset, expr value, for_spec first, std::vector<comp_spec> rest)
  { return std::make_shared<comp_>(offset, std::move(value), std::move(first), std::move(rest)); }
}

/// INSPECTION

std::size_t offset_of(const expr& e)
{
  return std::visit([](const auto& node) { return node->offset; }, e);
}

std::size_t offset_of(const comp_spec& spec)
{
  return std::visit([](const auto& node) { return node->offset; }, spec);
}

std::string_view kind_name(const expr& e)
{
  return std::visit(base_visitor {
      [](const null_lit&) { return "null"sv; },
      [](const true_lit&) { return "true"sv; },
      [](const false_lit&) { return "false"sv; },
      [](const self_ref&) { return "self"sv; },
      [](const super_ref&) { return "super"sv; },
      [](const root_ref&) { return "$"sv; },
      [](const str&) { return "str"sv; },
      [](const num&) { return "num"sv; },
      [](const id&) { return "id"sv; },
      [](const arr&) { return "arr"sv; },
      [](const obj&) { return "obj"sv; },
      [](const obj_extend&) { return "extend"sv; },
      [](const parened&) { return "paren"sv; },
      [](const unary_op&) { return "unary"sv; },
      [](const binary_op&) { return "binary"sv; },
      [](const assert_expr&) { return "assert"sv; },
      [](const local_expr&) { return "local"sv; },
      [](const if_else&) { return "if"sv; },
      [](const error_expr&) { return "error"sv; },
      [](const function&) { return "function"sv; },
      [](const apply&) { return "apply"sv; },
      [](const select&) { return "select"sv; },
      [](const lookup&) { return "lookup"sv; },
      [](const slice&) { return "slice"sv; },
      [](const import&) { return "import"sv; },
      [](const import_str&) { return "importstr"sv; },
      [](const if_spec&) { return "if-spec"sv; },
      [](const for_spec&) { return "for-spec"sv; },
      [](const comp&) { return "comp"sv; },
    }, e);
}

/// EQUALITY

static bool equal(const std::optional<expr>& lhs, const std::optional<expr>& rhs)
{
  if(lhs.has_value() != rhs.has_value())
    return false;
  return !lhs || equal(*lhs, *rhs);
}

static bool equal(const std::optional<params>& lhs, const std::optional<params>& rhs)
{
  if(lhs.has_value() != rhs.has_value())
    return false;
  return !lhs || equal(*lhs, *rhs);
}

template<typename T, typename Eq>
static bool equal_seq(const std::vector<T>& lhs, const std::vector<T>& rhs, Eq&& eq)
{
  return lhs.size() == rhs.size() && std::equal(lhs.begin(), lhs.end(), rhs.begin(), eq);
}

static bool equal(const bind& lhs, const bind& rhs)
{
  return lhs.offset == rhs.offset && lhs.slot == rhs.slot
      && equal(lhs.fn_params, rhs.fn_params) && equal(lhs.rhs, rhs.rhs);
}

static bool equal(const bind_stmt& lhs, const bind_stmt& rhs)
{ return equal(lhs.value, rhs.value); }

static bool equal(const assert_stmt& lhs, const assert_stmt& rhs)
{ return equal(lhs.cond, rhs.cond) && equal(lhs.message, rhs.message); }

static bool equal(const comp_spec& lhs, const comp_spec& rhs)
{
  if(lhs.index() != rhs.index())
    return false;
  auto as_expr = [](const comp_spec& spec) { return std::visit([](const auto& node) -> expr { return node; }, spec); };
  return equal(as_expr(lhs), as_expr(rhs));
}

static bool equal(const field_name& lhs, const field_name& rhs)
{
  if(lhs.index() != rhs.index())
    return false;
  if(auto* l = std::get_if<fixed_name>(&lhs))
    return l->value == std::get<fixed_name>(rhs).value;
  return equal(std::get<dyn_name>(lhs).value, std::get<dyn_name>(rhs).value);
}

static bool equal(const member& lhs, const member& rhs)
{
  if(lhs.index() != rhs.index())
    return false;
  return std::visit(base_visitor {
      [&rhs](const field& l) {
        auto& r = std::get<field>(rhs);
        return l.offset == r.offset && equal(l.name, r.name) && l.plus == r.plus
            && equal(l.method_params, r.method_params) && l.vis == r.vis && equal(l.rhs, r.rhs);
      },
      [&rhs](const bind_stmt& l) { return equal(l, std::get<bind_stmt>(rhs)); },
      [&rhs](const assert_stmt& l) { return equal(l, std::get<assert_stmt>(rhs)); },
    }, lhs);
}

bool equal(const params& lhs, const params& rhs)
{
  return equal_seq(lhs.entries(), rhs.entries(), [](const param& l, const param& r)
      {
        return l.offset == r.offset && l.name == r.name && l.slot == r.slot
            && equal(l.default_value, r.default_value);
      });
}

bool equal(const obj_body& lhs, const obj_body& rhs)
{
  if(lhs.index() != rhs.index())
    return false;
  if(auto* l = std::get_if<member_list>(&lhs))
  {
    auto& r = std::get<member_list>(rhs);
    return equal_seq(l->members(), r.members(), [](const member& a, const member& b) { return equal(a, b); });
  }
  auto& l = std::get<obj_comp>(lhs);
  auto& r = std::get<obj_comp>(rhs);
  auto eq_bind = [](const bind_stmt& a, const bind_stmt& b) { return equal(a, b); };
  return equal_seq(l.pre_locals, r.pre_locals, eq_bind)
      && equal(l.key, r.key) && equal(l.value, r.value)
      && equal_seq(l.post_locals, r.post_locals, eq_bind)
      && equal(expr(l.first), expr(r.first))
      && equal_seq(l.rest, r.rest, [](const comp_spec& a, const comp_spec& b) { return equal(a, b); });
}

// same_node is only ever called with both sides holding the same alternative

static bool same_node(const null_lit&, const null_lit&) { return true; }
static bool same_node(const true_lit&, const true_lit&) { return true; }
static bool same_node(const false_lit&, const false_lit&) { return true; }
static bool same_node(const self_ref&, const self_ref&) { return true; }
static bool same_node(const super_ref&, const super_ref&) { return true; }
static bool same_node(const root_ref&, const root_ref&) { return true; }

static bool same_node(const str& l, const str& r) { return l->value == r->value; }
// -0 and 0 print and dump differently, so they are different literals
static bool same_node(const num& l, const num& r)
{ return l->value == r->value && std::signbit(l->value) == std::signbit(r->value); }
static bool same_node(const id& l, const id& r) { return l->slot == r->slot && l->depth == r->depth; }

static bool same_node(const arr& l, const arr& r)
{ return equal_seq(l->elements, r->elements, [](const expr& a, const expr& b) { return equal(a, b); }); }

static bool same_node(const obj& l, const obj& r) { return equal(l->body, r->body); }

static bool same_node(const obj_extend& l, const obj_extend& r)
{ return equal(l->base, r->base) && equal(l->ext, r->ext); }

static bool same_node(const parened& l, const parened& r) { return equal(l->inner, r->inner); }

static bool same_node(const unary_op& l, const unary_op& r)
{ return l->op == r->op && equal(l->operand, r->operand); }

static bool same_node(const binary_op& l, const binary_op& r)
{ return l->op == r->op && equal(l->lhs, r->lhs) && equal(l->rhs, r->rhs); }

static bool same_node(const assert_expr& l, const assert_expr& r)
{ return equal(l->assertion, r->assertion) && equal(l->returned, r->returned); }

static bool same_node(const local_expr& l, const local_expr& r)
{
  return equal_seq(l->bindings, r->bindings, [](const bind& a, const bind& b) { return equal(a, b); })
      && equal(l->returned, r->returned);
}

static bool same_node(const if_else& l, const if_else& r)
{ return equal(l->cond, r->cond) && equal(l->then, r->then) && equal(l->otherwise, r->otherwise); }

static bool same_node(const error_expr& l, const error_expr& r) { return equal(l->message, r->message); }

static bool same_node(const function& l, const function& r)
{ return equal(l->fn_params, r->fn_params) && equal(l->body, r->body); }

static bool same_node(const apply& l, const apply& r)
{
  return equal(l->target, r->target)
      && equal_seq(l->args, r->args, [](const arg& a, const arg& b) { return a.name == b.name && equal(a.value, b.value); });
}

static bool same_node(const select& l, const select& r)
{ return l->name == r->name && equal(l->target, r->target); }

static bool same_node(const lookup& l, const lookup& r)
{ return equal(l->target, r->target) && equal(l->index, r->index); }

static bool same_node(const slice& l, const slice& r)
{
  return equal(l->target, r->target) && equal(l->start, r->start)
      && equal(l->end, r->end) && equal(l->stride, r->stride);
}

static bool same_node(const import& l, const import& r) { return l->path == r->path; }
static bool same_node(const import_str& l, const import_str& r) { return l->path == r->path; }

static bool same_node(const if_spec& l, const if_spec& r) { return equal(l->cond, r->cond); }

static bool same_node(const for_spec& l, const for_spec& r)
{ return l->slot == r->slot && equal(l->iterable, r->iterable); }

static bool same_node(const comp& l, const comp& r)
{
  return equal(l->value, r->value) && equal(expr(l->first), expr(r->first))
      && equal_seq(l->rest, r->rest, [](const comp_spec& a, const comp_spec& b) { return equal(a, b); });
}

bool equal(const expr& lhs, const expr& rhs)
{
  if(lhs.index() != rhs.index())
    return false;
  if(offset_of(lhs) != offset_of(rhs))
    return false;

  return std::visit([&rhs](const auto& l) -> bool {
      using node_t = std::decay_t<decltype(l)>;
      return same_node(l, std::get<node_t>(rhs));
    }, lhs);
}

}
