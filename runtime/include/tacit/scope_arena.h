#pragma once

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

#include "tacit/array.h"

namespace tacit {

using ScopeHandle = std::uint32_t;

// A function value: the body's index in the program's function table and
// the scope it was defined in.
struct Closure {
  std::uint32_t function = 0;
  ScopeHandle scope = 0;
};

struct ScopeBinding {
  enum class Kind {
    Value,
    Function,
  };

  Kind kind = Kind::Value;
  Array value;
  Closure closure;
};

// Scopes addressed by integer handle. Released handles are recycled through
// a free list, so a long-running execution does not grow the arena.
class ScopeArena {
 public:
  ScopeArena();

  ScopeHandle root() const { return 0; }
  ScopeHandle create(ScopeHandle parent);
  void release(ScopeHandle handle);
  void reset();

  void bind(ScopeHandle handle, std::uint32_t name, ScopeBinding binding);
  const ScopeBinding* lookup(ScopeHandle handle, std::uint32_t name) const;

  std::size_t live_count() const { return live_; }
  std::size_t capacity() const { return scopes_.size(); }

 private:
  struct Scope {
    ScopeHandle parent = 0;
    bool live = false;
    std::unordered_map<std::uint32_t, ScopeBinding> bindings;
  };

  std::vector<Scope> scopes_;
  std::vector<ScopeHandle> free_;
  std::size_t live_ = 0;
};

}  // namespace tacit
