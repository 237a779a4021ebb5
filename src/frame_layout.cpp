#include <frame_layout.hpp>

#include <algorithm>

namespace dson
{

namespace
{

struct layout_state
{
  // function frames entered below the analysed one
  std::uint32_t nesting { 0 };
  frame_layout layout;
};

template<typename Rec>
void bound(Rec& rec, slot_t slot)
{
  if(rec.state.nesting == 0)
    rec.state.layout.size = std::max(rec.state.layout.size, static_cast<slot_t>(slot + 1));
}

template<typename Rec>
void visit_opt(Rec& rec, const std::optional<expr>& e)
{
  if(e)
    std::visit(rec, *e);
}

// Parameters, defaults and body all live in the callee frame.
template<typename Rec>
void visit_callee(Rec& rec, const params& p, const expr& body)
{
  ++rec.state.nesting;
  for(auto& entry : p.entries())
    visit_opt(rec, entry.default_value);
  std::visit(rec, body);
  --rec.state.nesting;
}

template<typename Rec>
void visit_bind(Rec& rec, const bind& b)
{
  bound(rec, b.slot);
  if(b.fn_params)
    visit_callee(rec, *b.fn_params, b.rhs);
  else
    std::visit(rec, b.rhs);
}

template<typename Rec>
void visit_assert(Rec& rec, const assert_stmt& a)
{
  std::visit(rec, a.cond);
  visit_opt(rec, a.message);
}

template<typename Rec>
void visit_specs(Rec& rec, const std::vector<comp_spec>& specs)
{
  for(auto& spec : specs)
    std::visit([&rec](const auto& node) { rec(node); }, spec);
}

template<typename Rec>
void visit_body(Rec& rec, const obj_body& body)
{
  std::visit(base_visitor {
      [&rec](const member_list& ml) {
        for(auto& m : ml.members())
        {
          std::visit(base_visitor {
              [&rec](const field& f) {
                if(auto* dyn = std::get_if<dyn_name>(&f.name))
                  std::visit(rec, dyn->value);

                if(f.method_params)
                  visit_callee(rec, *f.method_params, f.rhs);
                else
                  std::visit(rec, f.rhs);
              },
              [&rec](const bind_stmt& b) { visit_bind(rec, b.value); },
              [&rec](const assert_stmt& a) { visit_assert(rec, a); },
            }, m);
        }
      },
      [&rec](const obj_comp& oc) {
        rec(oc.first);
        visit_specs(rec, oc.rest);
        for(auto& b : oc.pre_locals)
          visit_bind(rec, b.value);
        std::visit(rec, oc.key);
        std::visit(rec, oc.value);
        for(auto& b : oc.post_locals)
          visit_bind(rec, b.value);
      },
    }, body);
}

const auto layout_collector = base_visitor {
  // literals, self/super/$ and imports reference no slot
  [](auto&&, const auto&) -> void {  },

  [](auto&& rec, const id& i) -> void {
    if(i->depth <= rec.state.nesting)
      return;

    const slot_ref ref { i->slot, i->depth - rec.state.nesting };
    auto& captures = rec.state.layout.captures;
    if(std::find(captures.begin(), captures.end(), ref) == captures.end())
      captures.push_back(ref);
  },

  [](auto&& rec, const arr& a) -> void {
    for(auto& e : a->elements)
      std::visit(rec, e);
  },
  [](auto&& rec, const obj& o) -> void { visit_body(rec, o->body); },
  [](auto&& rec, const obj_extend& o) -> void {
    std::visit(rec, o->base);
    visit_body(rec, o->ext);
  },
  [](auto&& rec, const parened& p) -> void { std::visit(rec, p->inner); },
  [](auto&& rec, const unary_op& u) -> void { std::visit(rec, u->operand); },
  [](auto&& rec, const binary_op& b) -> void {
    std::visit(rec, b->lhs);
    std::visit(rec, b->rhs);
  },

  [](auto&& rec, const assert_expr& a) -> void {
    visit_assert(rec, a->assertion);
    std::visit(rec, a->returned);
  },
  [](auto&& rec, const local_expr& l) -> void {
    for(auto& b : l->bindings)
      visit_bind(rec, b);
    std::visit(rec, l->returned);
  },
  [](auto&& rec, const if_else& i) -> void {
    std::visit(rec, i->cond);
    std::visit(rec, i->then);
    visit_opt(rec, i->otherwise);
  },
  [](auto&& rec, const error_expr& e) -> void { std::visit(rec, e->message); },
  [](auto&& rec, const function& f) -> void { visit_callee(rec, f->fn_params, f->body); },
  [](auto&& rec, const apply& a) -> void {
    std::visit(rec, a->target);
    for(auto& x : a->args)
      std::visit(rec, x.value);
  },

  [](auto&& rec, const select& s) -> void { std::visit(rec, s->target); },
  [](auto&& rec, const lookup& l) -> void {
    std::visit(rec, l->target);
    std::visit(rec, l->index);
  },
  [](auto&& rec, const slice& s) -> void {
    std::visit(rec, s->target);
    visit_opt(rec, s->start);
    visit_opt(rec, s->end);
    visit_opt(rec, s->stride);
  },

  [](auto&& rec, const if_spec& s) -> void { std::visit(rec, s->cond); },
  [](auto&& rec, const for_spec& s) -> void {
    std::visit(rec, s->iterable);
    bound(rec, s->slot);
  },
  [](auto&& rec, const comp& c) -> void {
    rec(c->first);
    visit_specs(rec, c->rest);
    std::visit(rec, c->value);
  },
};

auto make_collector()
{
  return stateful_recursor(layout_state {}, base_visitor(layout_collector));
}

}

frame_layout layout_of(const params& p, const expr& body)
{
  auto rec = make_collector();
  rec.state.layout.size = static_cast<slot_t>(p.size());
  for(auto& entry : p.entries())
    visit_opt(rec, entry.default_value);
  std::visit(rec, body);
  return std::move(rec.state.layout);
}

frame_layout layout_of(const function& fn)
{
  return layout_of(fn->fn_params, fn->body);
}

frame_layout layout_of(const expr& top_level)
{
  auto rec = make_collector();
  std::visit(rec, top_level);
  return std::move(rec.state.layout);
}

void to_json(nlohmann::json& j, const frame_layout& layout)
{
  j["size"] = layout.size;
  j["captures"] = nlohmann::json::array();
  for(auto& c : layout.captures)
    j["captures"].push_back(nlohmann::json { { "slot", c.slot }, { "depth", c.depth } });
}

}
