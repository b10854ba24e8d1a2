#pragma once

#include <array>
#include <optional>
#include <string_view>

#include "common/Common.hpp"

namespace lsopt::IR {

// Object types known to type-based alias analysis. Objects of two different
// concrete types are never the same allocation.
enum class ObjectType {
  Unknown,  // no provenance: arguments, loaded values, untyped allocs
  Array,
  Hash,
  String,
  Integer,
  Float,
  Symbol,
  Range,
  Regexp,
};

inline constexpr std::array<ObjectType, 8> kConcreteTypes = {
    ObjectType::Array,   ObjectType::Hash,  ObjectType::String,
    ObjectType::Integer, ObjectType::Float, ObjectType::Symbol,
    ObjectType::Range,   ObjectType::Regexp,
};

inline const char* toString(ObjectType t) {
  switch (t) {
    case ObjectType::Unknown:
      return "unknown";
    case ObjectType::Array:
      return "array";
    case ObjectType::Hash:
      return "hash";
    case ObjectType::String:
      return "string";
    case ObjectType::Integer:
      return "integer";
    case ObjectType::Float:
      return "float";
    case ObjectType::Symbol:
      return "symbol";
    case ObjectType::Range:
      return "range";
    case ObjectType::Regexp:
      return "regexp";
  }
  unreachable();
}

inline bool isConcrete(ObjectType t) {
  return t != ObjectType::Unknown;
}

// "alloc" for Unknown, "alloc_<type>" otherwise.
inline std::string_view allocOpcode(ObjectType t) {
  switch (t) {
    case ObjectType::Unknown:
      return "alloc";
    case ObjectType::Array:
      return "alloc_array";
    case ObjectType::Hash:
      return "alloc_hash";
    case ObjectType::String:
      return "alloc_string";
    case ObjectType::Integer:
      return "alloc_integer";
    case ObjectType::Float:
      return "alloc_float";
    case ObjectType::Symbol:
      return "alloc_symbol";
    case ObjectType::Range:
      return "alloc_range";
    case ObjectType::Regexp:
      return "alloc_regexp";
  }
  unreachable();
}

inline std::optional<ObjectType> fromAllocOpcode(std::string_view name) {
  if (name == allocOpcode(ObjectType::Unknown)) {
    return ObjectType::Unknown;
  }
  for (ObjectType t : kConcreteTypes) {
    if (name == allocOpcode(t)) {
      return t;
    }
  }
  return std::nullopt;
}

}  // namespace lsopt::IR
