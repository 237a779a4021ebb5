#include <scope.hpp>
#include <diagnostic.hpp>
#include <diagnostic_db.hpp>

#include <algorithm>

namespace dson
{

scope_resolver::scope_resolver(const source_map& src, std::vector<std::string> globals)
  : src(src), frames(1)
{
  for(auto& g : globals)
    declare(std::move(g));

  open_frame();
}

void scope_resolver::open_frame()
{
  frames.emplace_back();
}

void scope_resolver::close_frame(std::size_t offset)
{
  // the global and the top level frame stay open
  if(frames.size() <= 2)
  {
    diagnostic <<= diagnostic_db::sema::close_without_scope(src.range(offset));
    return;
  }
  frames.pop_back();
}

void scope_resolver::open_scope()
{
  auto& f = frames.back();
  f.scope_marks.push_back(f.binder_stack.size());
}

void scope_resolver::close_scope(std::size_t offset)
{
  auto& f = frames.back();
  if(f.scope_marks.empty())
  {
    diagnostic <<= diagnostic_db::sema::close_without_scope(src.range(offset));
    return;
  }
  f.binder_stack.resize(f.scope_marks.back());
  f.scope_marks.pop_back();
}

slot_t scope_resolver::declare(std::string name)
{
  auto& f = frames.back();
  const slot_t slot = f.next_slot++;
  f.binder_stack.emplace_back(std::move(name), slot);
  return slot;
}

void scope_resolver::declare(const params& p)
{
  for(auto& entry : p.entries())
    declare(entry.name);
}

std::optional<slot_ref> scope_resolver::find(std::string_view name) const
{
  for(auto f = frames.rbegin(); f != frames.rend(); ++f)
  {
    auto present = std::find_if(f->binder_stack.rbegin(), f->binder_stack.rend(),
        [&name](auto& x) { return x.first == name; });

    if(present != f->binder_stack.rend())
      return slot_ref { present->second, static_cast<std::uint32_t>(f - frames.rbegin()) };
  }
  return std::nullopt;
}

std::optional<slot_ref> scope_resolver::resolve(std::size_t offset, std::string_view name)
{
  auto ref = find(name);
  if(!ref)
    diagnostic <<= diagnostic_db::sema::unresolved_identifier(src.range(offset, name.size()), name);
  return ref;
}

std::optional<id> scope_resolver::identifier(std::size_t offset, std::string_view name)
{
  auto ref = resolve(offset, name);
  if(!ref)
    return std::nullopt;
  return mk::ident(offset, ref->slot, ref->depth);
}

bool scope_resolver::is_global(std::string_view name) const
{
  auto ref = find(name);
  return ref && ref->depth == frames.size() - 1;
}

}
