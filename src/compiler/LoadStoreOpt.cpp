#include "compiler/LoadStoreOpt.hpp"

#include <optional>
#include <sstream>
#include <unordered_map>
#include <vector>

#include "compiler/AliasAnalysis.hpp"

namespace lsopt::IR {
namespace {

// What is known about the heap while walking the block: the value each
// abstract slot currently holds. Owned by one optimizeLoadStore() call.
using MemoryState = std::unordered_map<MemoryKey, Value, MemoryKeyHash>;

class LoadStorePass {
 public:
  LoadStorePass(const Block& in, OptimizeStats& stats)
      : in_(in), stats_(stats) {
    forward_.reserve(in.size());
  }

  Block run() {
    const auto& insns = in_.instructions();
    for (InsnId id = 0; id < insns.size(); ++id) {
      visit(id, insns[id]);
    }
    return std::move(out_);
  }

 private:
  void visit(InsnId id, const Instruction& insn) {
    std::visit(
        [&](auto const& node) {
          using T = std::decay_t<decltype(node)>;
          if constexpr (std::is_same_v<T, AllocObject>) {
            Value v = out_.alloc(node.type);
            types_[refId(v)] = node.type;
            forward_.push_back(v);
          } else if constexpr (std::is_same_v<T, GetArg>) {
            forward_.push_back(out_.getarg(node.index));
          } else if constexpr (std::is_same_v<T, Load>) {
            forward_.push_back(visitLoad(id, node));
          } else if constexpr (std::is_same_v<T, Store>) {
            visitStore(id, node);
            forward_.push_back(std::nullopt);
          } else if constexpr (std::is_same_v<T, Escape>) {
            out_.escape(resolve(id, node.value));
            forward_.push_back(std::nullopt);
          } else {
            static_assert(!sizeof(T*), "unhandled instruction in pass");
          }
        },
        insn.node);
  }

  Value visitLoad(InsnId id, const Load& load) {
    MemoryKey key{resolve(id, load.object), load.offset};
    auto it = memory_.find(key);
    if (it != memory_.end()) {
      ++stats_.loadsForwarded;
      return it->second;
    }
    Value v = out_.load(key.object, key.offset);
    memory_.emplace(std::move(key), v);
    return v;
  }

  void visitStore(InsnId id, const Store& store) {
    MemoryKey key{resolve(id, store.object), store.offset};
    Value value = resolve(id, store.value);

    auto it = memory_.find(key);
    if (it != memory_.end() && it->second == value) {
      // the slot already holds this value
      ++stats_.storesEliminated;
      return;
    }

    TypedKey written{key, typeOf(key.object)};
    for (auto e = memory_.begin(); e != memory_.end();) {
      if (mayAlias(TypedKey{e->first, typeOf(e->first.object)}, written)) {
        e = memory_.erase(e);
        ++stats_.entriesInvalidated;
      } else {
        ++e;
      }
    }

    out_.store(key.object, key.offset, value);
    memory_.insert_or_assign(std::move(key), std::move(value));
  }

  // Maps an operand of input instruction `user` to its value in the output.
  Value resolve(InsnId user, const Value& v) const {
    if (!isRef(v)) {
      return v;
    }
    InsnId def = refId(v);
    if (def >= user) {
      std::ostringstream oss;
      oss << "dangling reference: instruction %" << user << " uses %" << def
          << " before it is defined";
      throw MalformedReference(oss.str());
    }
    if (!forward_[def]) {
      std::ostringstream oss;
      oss << "dangling reference: instruction %" << user << " uses %" << def
          << " which produces no value";
      throw MalformedReference(oss.str());
    }
    return *forward_[def];
  }

  ObjectType typeOf(const Value& v) const {
    if (!isRef(v)) {
      return ObjectType::Unknown;
    }
    auto it = types_.find(refId(v));
    return it == types_.end() ? ObjectType::Unknown : it->second;
  }

  const Block& in_;
  OptimizeStats& stats_;
  Block out_;
  // input id -> output value; nullopt for store/escape
  std::vector<std::optional<Value>> forward_;
  // output id -> allocation type
  std::unordered_map<InsnId, ObjectType> types_;
  MemoryState memory_;
};

}  // namespace

Block optimizeLoadStore(const Block& block) {
  OptimizeStats stats;
  return optimizeLoadStore(block, stats);
}

Block optimizeLoadStore(const Block& block, OptimizeStats& stats) {
  LoadStorePass pass(block, stats);
  return pass.run();
}

}  // namespace lsopt::IR
