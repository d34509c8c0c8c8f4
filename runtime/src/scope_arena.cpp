#include "tacit/scope_arena.h"

#include <utility>

#include "tacit/diagnostics.h"

namespace tacit {

ScopeArena::ScopeArena() {
  reset();
}

void ScopeArena::reset() {
  scopes_.clear();
  free_.clear();
  scopes_.emplace_back();
  scopes_[0].live = true;
  live_ = 1;
}

ScopeHandle ScopeArena::create(ScopeHandle parent) {
  ScopeHandle handle = 0;
  if (!free_.empty()) {
    handle = free_.back();
    free_.pop_back();
  } else {
    handle = static_cast<ScopeHandle>(scopes_.size());
    scopes_.emplace_back();
  }
  auto& scope = scopes_[handle];
  scope.parent = parent;
  scope.live = true;
  ++live_;
  return handle;
}

void ScopeArena::release(ScopeHandle handle) {
  if (handle == root() || handle >= scopes_.size() || !scopes_[handle].live) {
    return;
  }
  auto& scope = scopes_[handle];
  scope.bindings.clear();
  scope.live = false;
  free_.push_back(handle);
  --live_;
}

void ScopeArena::bind(ScopeHandle handle, std::uint32_t name, ScopeBinding binding) {
  scopes_[handle].bindings[name] = std::move(binding);
}

const ScopeBinding* ScopeArena::lookup(ScopeHandle handle, std::uint32_t name) const {
  auto current = handle;
  while (true) {
    const auto& scope = scopes_[current];
    const auto found = scope.bindings.find(name);
    if (found != scope.bindings.end()) {
      return &found->second;
    }
    if (current == root()) {
      return nullptr;
    }
    current = scope.parent;
  }
}

}  // namespace tacit
