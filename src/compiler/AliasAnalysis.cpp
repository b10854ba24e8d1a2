#include "compiler/AliasAnalysis.hpp"

#include <string>

namespace lsopt::IR {
namespace {

size_t hashCombine(size_t h, size_t v) {
  h ^= v + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2);
  return h;
}

size_t hashLiteral(const LiteralValue& v) {
  return std::visit(
      [&](auto const& x) -> size_t {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return 0;
        } else {
          return std::hash<T>{}(x);
        }
      },
      v);
}

size_t hashValue(const Value& v) {
  if (isRef(v)) {
    return hashCombine(1, std::hash<InsnId>{}(refId(v)));
  }
  const auto& lit = std::get<Constant>(v).value;
  return hashCombine(hashCombine(2, lit.index()), hashLiteral(lit));
}

}  // namespace

size_t MemoryKeyHash::operator()(const MemoryKey& k) const noexcept {
  return hashCombine(hashValue(k.object), std::hash<int64_t>{}(k.offset));
}

bool mayAlias(const TypedKey& a, const TypedKey& b) {
  if (a.key.object == b.key.object) {
    return a.key.offset == b.key.offset;
  }
  if (isConcrete(a.type) && isConcrete(b.type) && a.type != b.type) {
    return false;
  }
  return true;
}

}  // namespace lsopt::IR
