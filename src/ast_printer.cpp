#include <ast_printer.hpp>

#include <nlohmann/json.hpp>
#include <fmt/format.h>

#include <sstream>
#include <cmath>

namespace dson
{

namespace
{

struct printer_state
{
  std::ostream* os;
};

std::string quoted(const std::string& s)
{
  // JSON string escaping, invalid UTF-8 is replaced instead of thrown on
  return nlohmann::json(s).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string number_text(double v)
{
  if(v == 0 && std::signbit(v))
    return "-0";
  if(std::isfinite(v) && std::trunc(v) == v && std::fabs(v) < 9007199254740992.0)
    return fmt::format("{}", static_cast<long long>(v));
  return fmt::format("{}", v);
}

template<typename Rec>
void print_opt(Rec& rec, const std::optional<expr>& e)
{
  if(e)
    std::visit(rec, *e);
  else
    *rec.state.os << "_";
}

template<typename Rec>
void print_params(Rec& rec, const params& p)
{
  auto& os = *rec.state.os;
  os << "(params";
  for(auto& entry : p.entries())
  {
    os << " (" << quoted(entry.name) << " " << entry.slot << " ";
    print_opt(rec, entry.default_value);
    os << ")";
  }
  os << ")";
}

template<typename Rec>
void print_opt_params(Rec& rec, const std::optional<params>& p)
{
  if(p)
    print_params(rec, *p);
  else
    *rec.state.os << "_";
}

template<typename Rec>
void print_bind(Rec& rec, const bind& b)
{
  auto& os = *rec.state.os;
  os << "(bind " << b.slot << " ";
  print_opt_params(rec, b.fn_params);
  os << " ";
  std::visit(rec, b.rhs);
  os << ")";
}

template<typename Rec>
void print_assert(Rec& rec, const assert_stmt& a)
{
  auto& os = *rec.state.os;
  os << "(assert-stmt ";
  std::visit(rec, a.cond);
  os << " ";
  print_opt(rec, a.message);
  os << ")";
}

template<typename Rec>
void print_specs(Rec& rec, const std::vector<comp_spec>& specs)
{
  for(auto& spec : specs)
  {
    *rec.state.os << " ";
    std::visit([&rec](const auto& node) { rec(node); }, spec);
  }
}

template<typename Rec>
void print_member(Rec& rec, const member& m)
{
  auto& os = *rec.state.os;
  std::visit(base_visitor {
      [&](const field& f) {
        os << "(field ";
        std::visit(base_visitor {
            [&](const fixed_name& n) { os << "(fixed " << quoted(n.value) << ")"; },
            [&](const dyn_name& n) { os << "(dyn "; std::visit(rec, n.value); os << ")"; },
          }, f.name);
        os << (f.plus ? " plus " : " = ") << to_string(f.vis) << " ";
        print_opt_params(rec, f.method_params);
        os << " ";
        std::visit(rec, f.rhs);
        os << ")";
      },
      [&](const bind_stmt& b) { print_bind(rec, b.value); },
      [&](const assert_stmt& a) { print_assert(rec, a); },
    }, m);
}

template<typename Rec>
void print_body(Rec& rec, const obj_body& body)
{
  auto& os = *rec.state.os;
  std::visit(base_visitor {
      [&](const member_list& ml) {
        os << "(members";
        for(auto& m : ml.members())
        {
          os << " ";
          print_member(rec, m);
        }
        os << ")";
      },
      [&](const obj_comp& oc) {
        os << "(obj-comp (pre";
        for(auto& b : oc.pre_locals)
        {
          os << " ";
          print_bind(rec, b.value);
        }
        os << ") ";
        std::visit(rec, oc.key);
        os << " ";
        std::visit(rec, oc.value);
        os << " (post";
        for(auto& b : oc.post_locals)
        {
          os << " ";
          print_bind(rec, b.value);
        }
        os << ") ";
        rec(oc.first);
        print_specs(rec, oc.rest);
        os << ")";
      },
    }, body);
}

// The recursor allows the lambdas to call back into the whole visitor.
// All of them return void, the return type must be stated explicitly.
const auto sexpr_printer = base_visitor {
  [](auto&& rec, const null_lit&) -> void { *rec.state.os << "null"; },
  [](auto&& rec, const true_lit&) -> void { *rec.state.os << "true"; },
  [](auto&& rec, const false_lit&) -> void { *rec.state.os << "false"; },
  [](auto&& rec, const self_ref&) -> void { *rec.state.os << "self"; },
  [](auto&& rec, const super_ref&) -> void { *rec.state.os << "super"; },
  [](auto&& rec, const root_ref&) -> void { *rec.state.os << "$"; },

  [](auto&& rec, const str& s) -> void { *rec.state.os << "(str " << quoted(s->value) << ")"; },
  [](auto&& rec, const num& n) -> void { *rec.state.os << "(num " << number_text(n->value) << ")"; },
  [](auto&& rec, const id& i) -> void {
    *rec.state.os << "(id " << i->slot;
    if(i->depth != 0)
      *rec.state.os << " ^" << i->depth;
    *rec.state.os << ")";
  },

  [](auto&& rec, const arr& a) -> void {
    *rec.state.os << "(arr";
    for(auto& e : a->elements)
    {
      *rec.state.os << " ";
      std::visit(rec, e);
    }
    *rec.state.os << ")";
  },
  [](auto&& rec, const obj& o) -> void {
    *rec.state.os << "(obj ";
    print_body(rec, o->body);
    *rec.state.os << ")";
  },
  [](auto&& rec, const obj_extend& o) -> void {
    *rec.state.os << "(extend ";
    std::visit(rec, o->base);
    *rec.state.os << " ";
    print_body(rec, o->ext);
    *rec.state.os << ")";
  },
  [](auto&& rec, const parened& p) -> void {
    *rec.state.os << "(paren ";
    std::visit(rec, p->inner);
    *rec.state.os << ")";
  },

  [](auto&& rec, const unary_op& u) -> void {
    *rec.state.os << "(unary " << to_string(u->op) << " ";
    std::visit(rec, u->operand);
    *rec.state.os << ")";
  },
  [](auto&& rec, const binary_op& b) -> void {
    *rec.state.os << "(binary " << to_string(b->op) << " ";
    std::visit(rec, b->lhs);
    *rec.state.os << " ";
    std::visit(rec, b->rhs);
    *rec.state.os << ")";
  },

  [](auto&& rec, const assert_expr& a) -> void {
    *rec.state.os << "(assert ";
    print_assert(rec, a->assertion);
    *rec.state.os << " ";
    std::visit(rec, a->returned);
    *rec.state.os << ")";
  },
  [](auto&& rec, const local_expr& l) -> void {
    *rec.state.os << "(local (";
    for(auto it = l->bindings.begin(); it != l->bindings.end(); ++it)
    {
      if(it != l->bindings.begin())
        *rec.state.os << " ";
      print_bind(rec, *it);
    }
    *rec.state.os << ") ";
    std::visit(rec, l->returned);
    *rec.state.os << ")";
  },
  [](auto&& rec, const if_else& i) -> void {
    *rec.state.os << "(if ";
    std::visit(rec, i->cond);
    *rec.state.os << " ";
    std::visit(rec, i->then);
    *rec.state.os << " ";
    print_opt(rec, i->otherwise);
    *rec.state.os << ")";
  },
  [](auto&& rec, const error_expr& e) -> void {
    *rec.state.os << "(error ";
    std::visit(rec, e->message);
    *rec.state.os << ")";
  },
  [](auto&& rec, const function& f) -> void {
    *rec.state.os << "(function ";
    print_params(rec, f->fn_params);
    *rec.state.os << " ";
    std::visit(rec, f->body);
    *rec.state.os << ")";
  },
  [](auto&& rec, const apply& a) -> void {
    *rec.state.os << "(apply ";
    std::visit(rec, a->target);
    *rec.state.os << " (args";
    for(auto& x : a->args)
    {
      *rec.state.os << " ";
      if(x.name)
      {
        *rec.state.os << "(named " << quoted(*x.name) << " ";
        std::visit(rec, x.value);
        *rec.state.os << ")";
      }
      else
        std::visit(rec, x.value);
    }
    *rec.state.os << "))";
  },

  [](auto&& rec, const select& s) -> void {
    *rec.state.os << "(select ";
    std::visit(rec, s->target);
    *rec.state.os << " " << quoted(s->name) << ")";
  },
  [](auto&& rec, const lookup& l) -> void {
    *rec.state.os << "(lookup ";
    std::visit(rec, l->target);
    *rec.state.os << " ";
    std::visit(rec, l->index);
    *rec.state.os << ")";
  },
  [](auto&& rec, const slice& s) -> void {
    *rec.state.os << "(slice ";
    std::visit(rec, s->target);
    *rec.state.os << " ";
    print_opt(rec, s->start);
    *rec.state.os << " ";
    print_opt(rec, s->end);
    *rec.state.os << " ";
    print_opt(rec, s->stride);
    *rec.state.os << ")";
  },

  [](auto&& rec, const import& i) -> void { *rec.state.os << "(import " << quoted(i->path) << ")"; },
  [](auto&& rec, const import_str& i) -> void { *rec.state.os << "(importstr " << quoted(i->path) << ")"; },

  [](auto&& rec, const if_spec& s) -> void {
    *rec.state.os << "(if-spec ";
    std::visit(rec, s->cond);
    *rec.state.os << ")";
  },
  [](auto&& rec, const for_spec& s) -> void {
    *rec.state.os << "(for-spec " << s->slot << " ";
    std::visit(rec, s->iterable);
    *rec.state.os << ")";
  },
  [](auto&& rec, const comp& c) -> void {
    *rec.state.os << "(comp ";
    std::visit(rec, c->value);
    *rec.state.os << " ";
    rec(c->first);
    print_specs(rec, c->rest);
    *rec.state.os << ")";
  },
};

auto make_printer(std::ostream& os)
{
  return stateful_recursor(printer_state { &os }, base_visitor(sexpr_printer));
}

}

void print(std::ostream& os, const expr& e)
{
  auto rec = make_printer(os);
  std::visit(rec, e);
}

void print(std::ostream& os, const obj_body& body)
{
  auto rec = make_printer(os);
  print_body(rec, body);
}

void print(std::ostream& os, const params& p)
{
  auto rec = make_printer(os);
  print_params(rec, p);
}

std::string to_sexpr(const expr& e)
{
  std::stringstream ss;
  print(ss, e);
  return ss.str();
}

std::string to_sexpr(const obj_body& body)
{
  std::stringstream ss;
  print(ss, body);
  return ss.str();
}

}
