#include <ast_json.hpp>
#include <diagnostic.hpp>
#include <diagnostic_db.hpp>

#include <tsl/robin_map.h>

#include <functional>
#include <limits>

namespace dson
{

/// DUMP

namespace
{

nlohmann::json dump_opt(const std::optional<expr>& e)
{ return e ? dump_json(*e) : nlohmann::json(nullptr); }

nlohmann::json dump_opt(const std::optional<params>& p)
{ return p ? dump_json(*p) : nlohmann::json(nullptr); }

nlohmann::json dump_bind(const bind& b)
{
  return nlohmann::json {
    { "offset", b.offset },
    { "slot", b.slot },
    { "params", dump_opt(b.fn_params) },
    { "rhs", dump_json(b.rhs) },
  };
}

nlohmann::json dump_assert(const assert_stmt& a)
{
  return nlohmann::json {
    { "cond", dump_json(a.cond) },
    { "message", dump_opt(a.message) },
  };
}

nlohmann::json dump_specs(const std::vector<comp_spec>& specs)
{
  auto j = nlohmann::json::array();
  for(auto& spec : specs)
    j.push_back(std::visit([](const auto& node) { return dump_json(expr(node)); }, spec));
  return j;
}

nlohmann::json dump_member(const member& m)
{
  return std::visit(base_visitor {
      [](const field& f) {
        nlohmann::json name;
        if(auto* fixed = std::get_if<fixed_name>(&f.name))
          name["fixed"] = fixed->value;
        else
          name["dyn"] = dump_json(std::get<dyn_name>(f.name).value);

        return nlohmann::json {
          { "kind", "field" },
          { "offset", f.offset },
          { "name", name },
          { "plus", f.plus },
          { "params", dump_opt(f.method_params) },
          { "visibility", f.vis },
          { "rhs", dump_json(f.rhs) },
        };
      },
      [](const bind_stmt& b) {
        auto j = dump_bind(b.value);
        j["kind"] = "bind";
        return j;
      },
      [](const assert_stmt& a) {
        auto j = dump_assert(a);
        j["kind"] = "assert";
        return j;
      },
    }, m);
}

// Adds the node specific fields, "kind" and "offset" are filled in by dump_json.
void dump_fields(nlohmann::json&, const null_lit&) {}
void dump_fields(nlohmann::json&, const true_lit&) {}
void dump_fields(nlohmann::json&, const false_lit&) {}
void dump_fields(nlohmann::json&, const self_ref&) {}
void dump_fields(nlohmann::json&, const super_ref&) {}
void dump_fields(nlohmann::json&, const root_ref&) {}

void dump_fields(nlohmann::json& j, const str& n) { j["value"] = n->value; }
void dump_fields(nlohmann::json& j, const num& n) { j["value"] = n->value; }

void dump_fields(nlohmann::json& j, const id& n)
{
  j["slot"] = n->slot;
  j["depth"] = n->depth;
}

void dump_fields(nlohmann::json& j, const arr& n)
{
  j["elements"] = nlohmann::json::array();
  for(auto& e : n->elements)
    j["elements"].push_back(dump_json(e));
}

void dump_fields(nlohmann::json& j, const obj& n) { j["body"] = dump_json(n->body); }

void dump_fields(nlohmann::json& j, const obj_extend& n)
{
  j["base"] = dump_json(n->base);
  j["ext"] = dump_json(n->ext);
}

void dump_fields(nlohmann::json& j, const parened& n) { j["inner"] = dump_json(n->inner); }

void dump_fields(nlohmann::json& j, const unary_op& n)
{
  j["op"] = std::string(to_string(n->op));
  j["operand"] = dump_json(n->operand);
}

void dump_fields(nlohmann::json& j, const binary_op& n)
{
  j["lhs"] = dump_json(n->lhs);
  j["op"] = std::string(to_string(n->op));
  j["rhs"] = dump_json(n->rhs);
}

void dump_fields(nlohmann::json& j, const assert_expr& n)
{
  j["assertion"] = dump_assert(n->assertion);
  j["returned"] = dump_json(n->returned);
}

void dump_fields(nlohmann::json& j, const local_expr& n)
{
  j["bindings"] = nlohmann::json::array();
  for(auto& b : n->bindings)
    j["bindings"].push_back(dump_bind(b));
  j["returned"] = dump_json(n->returned);
}

void dump_fields(nlohmann::json& j, const if_else& n)
{
  j["cond"] = dump_json(n->cond);
  j["then"] = dump_json(n->then);
  j["else"] = dump_opt(n->otherwise);
}

void dump_fields(nlohmann::json& j, const error_expr& n) { j["message"] = dump_json(n->message); }

void dump_fields(nlohmann::json& j, const function& n)
{
  j["params"] = dump_json(n->fn_params);
  j["body"] = dump_json(n->body);
}

void dump_fields(nlohmann::json& j, const apply& n)
{
  j["target"] = dump_json(n->target);
  j["args"] = nlohmann::json::array();
  for(auto& a : n->args)
  {
    j["args"].push_back(nlohmann::json {
        { "name", a.name ? nlohmann::json(*a.name) : nlohmann::json(nullptr) },
        { "value", dump_json(a.value) },
      });
  }
}

void dump_fields(nlohmann::json& j, const select& n)
{
  j["target"] = dump_json(n->target);
  j["name"] = n->name;
}

void dump_fields(nlohmann::json& j, const lookup& n)
{
  j["target"] = dump_json(n->target);
  j["index"] = dump_json(n->index);
}

void dump_fields(nlohmann::json& j, const slice& n)
{
  j["target"] = dump_json(n->target);
  j["start"] = dump_opt(n->start);
  j["end"] = dump_opt(n->end);
  j["stride"] = dump_opt(n->stride);
}

void dump_fields(nlohmann::json& j, const import& n) { j["path"] = n->path; }
void dump_fields(nlohmann::json& j, const import_str& n) { j["path"] = n->path; }

void dump_fields(nlohmann::json& j, const if_spec& n) { j["cond"] = dump_json(n->cond); }

void dump_fields(nlohmann::json& j, const for_spec& n)
{
  j["slot"] = n->slot;
  j["iterable"] = dump_json(n->iterable);
}

void dump_fields(nlohmann::json& j, const comp& n)
{
  j["value"] = dump_json(n->value);
  j["first"] = dump_json(expr(n->first));
  j["rest"] = dump_specs(n->rest);
}

}

nlohmann::json dump_json(const expr& e)
{
  nlohmann::json j;
  j["kind"] = std::string(kind_name(e));
  j["offset"] = offset_of(e);
  std::visit([&j](const auto& node) { dump_fields(j, node); }, e);
  return j;
}

nlohmann::json dump_json(const obj_body& body)
{
  return std::visit(base_visitor {
      [](const member_list& ml) {
        auto members = nlohmann::json::array();
        for(auto& m : ml.members())
          members.push_back(dump_member(m));
        return nlohmann::json { { "kind", "members" }, { "members", members } };
      },
      [](const obj_comp& oc) {
        auto pre = nlohmann::json::array();
        for(auto& b : oc.pre_locals)
          pre.push_back(dump_bind(b.value));
        auto post = nlohmann::json::array();
        for(auto& b : oc.post_locals)
          post.push_back(dump_bind(b.value));

        return nlohmann::json {
          { "kind", "obj-comp" },
          { "pre_locals", pre },
          { "key", dump_json(oc.key) },
          { "value", dump_json(oc.value) },
          { "post_locals", post },
          { "first", dump_json(expr(oc.first)) },
          { "rest", dump_specs(oc.rest) },
        };
      },
    }, body);
}

nlohmann::json dump_json(const params& p)
{
  auto j = nlohmann::json::array();
  for(auto& entry : p.entries())
  {
    j.push_back(nlohmann::json {
        { "offset", entry.offset },
        { "name", entry.name },
        { "default", dump_opt(entry.default_value) },
        { "slot", entry.slot },
      });
  }
  return j;
}

/// READ

namespace
{

// Thrown once the reason has been reported, unwinds to read_json.
struct read_failure {};

struct json_reader
{
  json_reader(const source_map& src) : src(src) {}

  expr read(const nlohmann::json& j);

  [[noreturn]] void fail(const nlohmann::json& msg)
  {
    diagnostic <<= msg;
    throw read_failure {};
  }

  std::size_t offset(const nlohmann::json& j)
  {
    if(j.is_object() && j.contains("offset") && j["offset"].is_number_unsigned())
      return j["offset"].get<std::size_t>();
    return 0;
  }

  const nlohmann::json& at(const nlohmann::json& j, const char* key)
  {
    if(!j.is_object() || !j.contains(key))
      fail(diagnostic_db::dump::malformed_node(src.range(offset(j)), fmt::format("missing \"{}\"", key)));
    return j[key];
  }

  // offsets, slots and depths, negative or oversized numbers are rejected
  template<typename T>
  T index_at(const nlohmann::json& j, const char* key)
  {
    auto& v = at(j, key);
    if(!v.is_number_unsigned() || v.get<std::uint64_t>() > std::numeric_limits<T>::max())
      fail(diagnostic_db::dump::malformed_node(src.range(offset(j)), fmt::format("\"{}\" must be an unsigned integer", key)));
    return static_cast<T>(v.get<std::uint64_t>());
  }

  const nlohmann::json& array_at(const nlohmann::json& j, const char* key)
  {
    auto& v = at(j, key);
    if(!v.is_array())
      fail(diagnostic_db::dump::malformed_node(src.range(offset(j)), fmt::format("\"{}\" must be an array", key)));
    return v;
  }

  std::optional<expr> read_opt(const nlohmann::json& j, const char* key)
  {
    auto& v = at(j, key);
    if(v.is_null())
      return std::nullopt;
    return read(v);
  }

  std::vector<expr> read_seq(const nlohmann::json& j, const char* key)
  {
    std::vector<expr> to_ret;
    for(auto& e : array_at(j, key))
      to_ret.push_back(read(e));
    return to_ret;
  }

  template<typename T>
  T read_as(const nlohmann::json& j, const char* what)
  {
    auto e = read(j);
    if(!std::holds_alternative<T>(e))
      fail(diagnostic_db::dump::malformed_node(src.range(offset(j)), fmt::format("expected {}", what)));
    return std::get<T>(e);
  }

  comp_spec read_spec(const nlohmann::json& j)
  {
    auto e = read(j);
    if(auto* f = std::get_if<for_spec>(&e))
      return *f;
    if(auto* i = std::get_if<if_spec>(&e))
      return *i;
    fail(diagnostic_db::dump::malformed_node(src.range(offset(j)), "expected a for-spec or an if-spec"));
  }

  std::vector<comp_spec> read_specs(const nlohmann::json& j, const char* key)
  {
    std::vector<comp_spec> to_ret;
    for(auto& e : array_at(j, key))
      to_ret.push_back(read_spec(e));
    return to_ret;
  }

  params read_params(const nlohmann::json& j, std::size_t owner_offset)
  {
    if(!j.is_array())
      fail(diagnostic_db::dump::malformed_node(src.range(owner_offset), "parameters must be an array"));

    std::vector<param_decl> decls;
    for(auto& p : j)
    {
      auto name = at(p, "name").get<std::string>();
      auto slot = index_at<slot_t>(p, "slot");
      if(slot != decls.size())
        fail(diagnostic_db::dump::slot_mismatch(src.range(offset(p)), name, slot));

      decls.push_back(param_decl { index_at<std::size_t>(p, "offset"), std::move(name), read_opt(p, "default") });
    }
    auto to_ret = params::make(src, std::move(decls));
    if(!to_ret)
      throw read_failure {}; // params::make reported it
    return std::move(*to_ret);
  }

  std::optional<params> read_opt_params(const nlohmann::json& j, const char* key, std::size_t owner_offset)
  {
    auto& v = at(j, key);
    if(v.is_null())
      return std::nullopt;
    return read_params(v, owner_offset);
  }

  bind read_bind(const nlohmann::json& j)
  {
    const auto off = index_at<std::size_t>(j, "offset");
    return bind { off, index_at<slot_t>(j, "slot"), read_opt_params(j, "params", off), read(at(j, "rhs")) };
  }

  std::vector<bind_stmt> read_bind_stmts(const nlohmann::json& j, const char* key)
  {
    std::vector<bind_stmt> to_ret;
    for(auto& b : array_at(j, key))
      to_ret.push_back(bind_stmt { read_bind(b) });
    return to_ret;
  }

  assert_stmt read_assert(const nlohmann::json& j)
  {
    return assert_stmt { read(at(j, "cond")), read_opt(j, "message") };
  }

  visibility read_visibility(const nlohmann::json& j)
  {
    auto v = at(j, "visibility").get<std::string>();
    if(v == "normal") return visibility::normal;
    if(v == "hidden") return visibility::hidden;
    if(v == "unhide") return visibility::unhide;
    fail(diagnostic_db::dump::unknown_visibility(src.range(offset(j)), v));
  }

  member read_member(const nlohmann::json& j)
  {
    auto kind = at(j, "kind").get<std::string>();
    if(kind == "bind")
      return bind_stmt { read_bind(j) };
    if(kind == "assert")
      return read_assert(j);
    if(kind != "field")
      fail(diagnostic_db::dump::unknown_node_kind(src.range(offset(j)), kind));

    const auto off = index_at<std::size_t>(j, "offset");
    auto& name = at(j, "name");

    field_name fname = fixed_name { "" };
    if(name.is_object() && name.contains("fixed"))
      fname = fixed_name { name["fixed"].get<std::string>() };
    else if(name.is_object() && name.contains("dyn"))
      fname = dyn_name { read(name["dyn"]) };
    else
      fail(diagnostic_db::dump::malformed_node(src.range(off), "field name must be fixed or dyn"));

    return field { off, std::move(fname), at(j, "plus").get<bool>(),
                   read_opt_params(j, "params", off), read_visibility(j), read(at(j, "rhs")) };
  }

  obj_body read_body(const nlohmann::json& j, std::size_t owner_offset)
  {
    auto kind = at(j, "kind").get<std::string>();
    if(kind == "members")
    {
      std::vector<member> members;
      for(auto& m : array_at(j, "members"))
        members.push_back(read_member(m));

      auto ml = member_list::make(src, std::move(members));
      if(!ml)
        throw read_failure {}; // member_list::make reported it
      return std::move(*ml);
    }
    if(kind == "obj-comp")
    {
      auto pre = read_bind_stmts(j, "pre_locals");
      auto key = read(at(j, "key"));
      auto value = read(at(j, "value"));
      auto post = read_bind_stmts(j, "post_locals");
      auto first = read_as<for_spec>(at(j, "first"), "a for-spec");
      return obj_comp { std::move(pre), std::move(key), std::move(value), std::move(post),
                        std::move(first), read_specs(j, "rest") };
    }
    fail(diagnostic_db::dump::unknown_node_kind(src.range(owner_offset), kind));
  }

  using node_reader = std::function<expr(json_reader&, const nlohmann::json&, std::size_t)>;
  static const tsl::robin_map<std::string, node_reader> node_readers;

  const source_map& src;
};

const tsl::robin_map<std::string, json_reader::node_reader> json_reader::node_readers = {
  { "null",  [](json_reader&, const nlohmann::json&, std::size_t off) -> expr { return mk::lit_null(off); } },
  { "true",  [](json_reader&, const nlohmann::json&, std::size_t off) -> expr { return mk::lit_true(off); } },
  { "false", [](json_reader&, const nlohmann::json&, std::size_t off) -> expr { return mk::lit_false(off); } },
  { "self",  [](json_reader&, const nlohmann::json&, std::size_t off) -> expr { return mk::self(off); } },
  { "super", [](json_reader&, const nlohmann::json&, std::size_t off) -> expr { return mk::super(off); } },
  { "$",     [](json_reader&, const nlohmann::json&, std::size_t off) -> expr { return mk::dollar(off); } },

  { "str", [](json_reader& r, const nlohmann::json& j, std::size_t off) -> expr
    { return mk::string(off, r.at(j, "value").get<std::string>()); } },
  { "num", [](json_reader& r, const nlohmann::json& j, std::size_t off) -> expr
    { return mk::number(off, r.at(j, "value").get<double>()); } },
  { "id", [](json_reader& r, const nlohmann::json& j, std::size_t off) -> expr
    { return mk::ident(off, r.index_at<slot_t>(j, "slot"), r.index_at<std::uint32_t>(j, "depth")); } },
  { "arr", [](json_reader& r, const nlohmann::json& j, std::size_t off) -> expr
    { return mk::array(off, r.read_seq(j, "elements")); } },
  { "obj", [](json_reader& r, const nlohmann::json& j, std::size_t off) -> expr
    { return mk::object(off, r.read_body(r.at(j, "body"), off)); } },
  { "extend", [](json_reader& r, const nlohmann::json& j, std::size_t off) -> expr
    {
      auto base = r.read(r.at(j, "base"));
      return mk::extend(off, std::move(base), r.read_body(r.at(j, "ext"), off));
    } },
  { "paren", [](json_reader& r, const nlohmann::json& j, std::size_t off) -> expr
    { return mk::paren(off, r.read(r.at(j, "inner"))); } },

  { "unary", [](json_reader& r, const nlohmann::json& j, std::size_t off) -> expr
    {
      auto spelling = r.at(j, "op").get<std::string>();
      auto op = unary_operator_from(spelling);
      if(!op)
        r.fail(diagnostic_db::dump::unknown_operator(r.src.range(off), spelling));
      return mk::unary(off, *op, r.read(r.at(j, "operand")));
    } },
  { "binary", [](json_reader& r, const nlohmann::json& j, std::size_t off) -> expr
    {
      auto spelling = r.at(j, "op").get<std::string>();
      auto op = binary_operator_from(spelling);
      if(!op)
        r.fail(diagnostic_db::dump::unknown_operator(r.src.range(off), spelling));
      auto lhs = r.read(r.at(j, "lhs"));
      return mk::binary(off, std::move(lhs), *op, r.read(r.at(j, "rhs")));
    } },

  { "assert", [](json_reader& r, const nlohmann::json& j, std::size_t off) -> expr
    {
      auto asserted = r.read_assert(r.at(j, "assertion"));
      return mk::assertion(off, std::move(asserted), r.read(r.at(j, "returned")));
    } },
  { "local", [](json_reader& r, const nlohmann::json& j, std::size_t off) -> expr
    {
      std::vector<bind> bindings;
      for(auto& b : r.array_at(j, "bindings"))
        bindings.push_back(r.read_bind(b));
      return mk::local(off, std::move(bindings), r.read(r.at(j, "returned")));
    } },
  { "if", [](json_reader& r, const nlohmann::json& j, std::size_t off) -> expr
    {
      auto c = r.read(r.at(j, "cond"));
      auto then = r.read(r.at(j, "then"));
      return mk::cond(off, std::move(c), std::move(then), r.read_opt(j, "else"));
    } },
  { "error", [](json_reader& r, const nlohmann::json& j, std::size_t off) -> expr
    { return mk::error(off, r.read(r.at(j, "message"))); } },
  { "function", [](json_reader& r, const nlohmann::json& j, std::size_t off) -> expr
    {
      auto p = r.read_params(r.at(j, "params"), off);
      return mk::fn(off, std::move(p), r.read(r.at(j, "body")));
    } },
  { "apply", [](json_reader& r, const nlohmann::json& j, std::size_t off) -> expr
    {
      auto target = r.read(r.at(j, "target"));
      std::vector<arg> args;
      for(auto& a : r.array_at(j, "args"))
      {
        auto& name = r.at(a, "name");
        args.push_back(arg { name.is_null() ? std::nullopt : std::optional<std::string>(name.get<std::string>()),
                             r.read(r.at(a, "value")) });
      }
      return mk::call(off, std::move(target), std::move(args));
    } },

  { "select", [](json_reader& r, const nlohmann::json& j, std::size_t off) -> expr
    { return mk::field_access(off, r.read(r.at(j, "target")), r.at(j, "name").get<std::string>()); } },
  { "lookup", [](json_reader& r, const nlohmann::json& j, std::size_t off) -> expr
    {
      auto target = r.read(r.at(j, "target"));
      return mk::index(off, std::move(target), r.read(r.at(j, "index")));
    } },
  { "slice", [](json_reader& r, const nlohmann::json& j, std::size_t off) -> expr
    {
      auto target = r.read(r.at(j, "target"));
      auto start = r.read_opt(j, "start");
      auto end = r.read_opt(j, "end");
      return mk::range(off, std::move(target), std::move(start), std::move(end), r.read_opt(j, "stride"));
    } },

  { "import", [](json_reader& r, const nlohmann::json& j, std::size_t off) -> expr
    { return mk::import_code(off, r.at(j, "path").get<std::string>()); } },
  { "importstr", [](json_reader& r, const nlohmann::json& j, std::size_t off) -> expr
    { return mk::import_string(off, r.at(j, "path").get<std::string>()); } },

  { "if-spec", [](json_reader& r, const nlohmann::json& j, std::size_t off) -> expr
    { return mk::filter(off, r.read(r.at(j, "cond"))); } },
  { "for-spec", [](json_reader& r, const nlohmann::json& j, std::size_t off) -> expr
    { return mk::generator(off, r.index_at<slot_t>(j, "slot"), r.read(r.at(j, "iterable"))); } },
  { "comp", [](json_reader& r, const nlohmann::json& j, std::size_t off) -> expr
    {
      auto value = r.read(r.at(j, "value"));
      auto first = r.read_as<for_spec>(r.at(j, "first"), "a for-spec");
      return mk::comprehension(off, std::move(value), std::move(first), r.read_specs(j, "rest"));
    } },
};

expr json_reader::read(const nlohmann::json& j)
{
  auto kind = at(j, "kind").get<std::string>();
  auto off = index_at<std::size_t>(j, "offset");

  auto it = node_readers.find(kind);
  if(it == node_readers.end())
    fail(diagnostic_db::dump::unknown_node_kind(src.range(off), kind));
  return it->second(*this, j, off);
}

}

std::optional<expr> read_json(const nlohmann::json& j, const source_map& src)
{
  json_reader reader(src);
  try
  {
    return reader.read(j);
  }
  catch(const read_failure&)
  {
    return std::nullopt;
  }
  catch(const nlohmann::json::exception& e)
  {
    // wrong value types, e.g. a string where a slot is expected
    diagnostic <<= diagnostic_db::dump::malformed_node(src.range(0), e.what());
    return std::nullopt;
  }
}

std::optional<expr> read_json(std::istream& is, const source_map& src)
{
  auto j = nlohmann::json::parse(is, nullptr, false);
  if(j.is_discarded())
  {
    diagnostic <<= diagnostic_db::dump::not_json(src.range(0));
    return std::nullopt;
  }
  return read_json(j, src);
}

}
