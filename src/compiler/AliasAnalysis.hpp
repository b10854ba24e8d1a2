#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

#include "common/IR.hpp"

namespace lsopt::IR {

// One abstract heap slot: an object value and an opaque field offset.
struct MemoryKey {
  Value object;
  int64_t offset = 0;

  bool operator==(const MemoryKey& o) const {
    return offset == o.offset && object == o.object;
  }
  bool operator!=(const MemoryKey& o) const {
    return !(*this == o);
  }
};

struct MemoryKeyHash {
  size_t operator()(const MemoryKey& k) const noexcept;
};

// A memory access with the allocation type of its object resolved.
struct TypedKey {
  const MemoryKey& key;
  ObjectType type;
};

// Type-based alias query, evaluated in order:
//  1. same object: alias iff same offset;
//  2. distinct concrete types: no alias;
//  3. otherwise: may alias.
// Symmetric in its arguments.
bool mayAlias(const TypedKey& a, const TypedKey& b);

}  // namespace lsopt::IR
