#include "common/IR.hpp"

#include <sstream>
#include <unordered_map>

#include "common/Common.hpp"

namespace lsopt::IR {
namespace {

std::string argToSource(const Value& v,
                        const std::unordered_map<InsnId, std::string>& names) {
  return std::visit(
      overloaded{
          [&](const InsnRef& r) -> std::string {
            auto it = names.find(r.id);
            if (it == names.end()) {
              // cannot happen for a block built through append()
              return "<dangling %" + std::to_string(r.id) + ">";
            }
            return it->second;
          },
          [&](const Constant& c) -> std::string {
            return literalToSource(c.value);
          },
      },
      v);
}

}  // namespace

bool hasResult(const Instruction& insn) {
  return std::holds_alternative<AllocObject>(insn.node) ||
         std::holds_alternative<GetArg>(insn.node) ||
         std::holds_alternative<Load>(insn.node);
}

std::string opcodeName(const Instruction& insn) {
  return std::visit(
      [&](auto const& node) -> std::string {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, AllocObject>) {
          return std::string(allocOpcode(node.type));
        } else if constexpr (std::is_same_v<T, GetArg>) {
          return "getarg";
        } else if constexpr (std::is_same_v<T, Load>) {
          return "load";
        } else if constexpr (std::is_same_v<T, Store>) {
          return "store";
        } else if constexpr (std::is_same_v<T, Escape>) {
          return "escape";
        } else {
          static_assert(!sizeof(T*), "unhandled instruction in opcodeName()");
        }
      },
      insn.node);
}

// Value operands only; offsets and argument indices are immediates.
std::vector<Value> operands(const Instruction& insn) {
  return std::visit(
      [&](auto const& node) -> std::vector<Value> {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, AllocObject> ||
                      std::is_same_v<T, GetArg>) {
          return {};
        } else if constexpr (std::is_same_v<T, Load>) {
          return {node.object};
        } else if constexpr (std::is_same_v<T, Store>) {
          return {node.object, node.value};
        } else if constexpr (std::is_same_v<T, Escape>) {
          return {node.value};
        } else {
          static_assert(!sizeof(T*), "unhandled instruction in operands()");
        }
      },
      insn.node);
}

Value Block::alloc(ObjectType type) {
  return ref(append(Instruction{AllocObject{type}}));
}

Value Block::getarg(int64_t index) {
  return ref(append(Instruction{GetArg{index}}));
}

Value Block::load(const Value& object, int64_t offset) {
  return ref(append(Instruction{Load{object, offset}}));
}

InsnId Block::store(const Value& object, int64_t offset, const Value& value) {
  return append(Instruction{Store{object, offset, value}});
}

InsnId Block::escape(const Value& value) {
  return append(Instruction{Escape{value}});
}

InsnId Block::append(Instruction insn) {
  const std::string role = opcodeName(insn) + " operand";
  for (const Value& v : operands(insn)) {
    checkOperand(v, role);
  }
  auto id = static_cast<InsnId>(insns_.size());
  insns_.push_back(std::move(insn));
  return id;
}

const Instruction& Block::at(InsnId id) const {
  if (id >= insns_.size()) {
    throw MalformedReference("dangling reference: no instruction %" +
                             std::to_string(id));
  }
  return insns_[id];
}

ObjectType Block::typeOf(const Value& v) const {
  if (!isRef(v)) {
    return ObjectType::Unknown;
  }
  if (auto* a = std::get_if<AllocObject>(&at(refId(v)).node)) {
    return a->type;
  }
  return ObjectType::Unknown;
}

void Block::checkOperand(const Value& v, const std::string& role) const {
  if (!isRef(v)) {
    return;
  }
  InsnId id = refId(v);
  if (id >= insns_.size()) {
    std::ostringstream oss;
    oss << "dangling reference: " << role << " refers to %" << id
        << " which is not defined before instruction %" << insns_.size();
    throw MalformedReference(oss.str());
  }
  if (!hasResult(insns_[id])) {
    std::ostringstream oss;
    oss << "dangling reference: " << role << " refers to %" << id << " ("
        << opcodeName(insns_[id]) << ") which produces no value";
    throw MalformedReference(oss.str());
  }
}

std::string toSource(const Block& block, const std::string& varPrefix) {
  std::unordered_map<InsnId, std::string> names;
  std::ostringstream oss;
  int next = 0;
  const auto& insns = block.instructions();
  for (InsnId id = 0; id < insns.size(); ++id) {
    const Instruction& insn = insns[id];
    if (hasResult(insn)) {
      std::string name = varPrefix + std::to_string(next++);
      oss << name << " = ";
      names.emplace(id, std::move(name));
    }
    oss << opcodeName(insn) << "(";
    std::visit(
        [&](auto const& node) {
          using T = std::decay_t<decltype(node)>;
          if constexpr (std::is_same_v<T, AllocObject>) {
            // no arguments
          } else if constexpr (std::is_same_v<T, GetArg>) {
            oss << node.index;
          } else if constexpr (std::is_same_v<T, Load>) {
            oss << argToSource(node.object, names) << ", " << node.offset;
          } else if constexpr (std::is_same_v<T, Store>) {
            oss << argToSource(node.object, names) << ", " << node.offset
                << ", " << argToSource(node.value, names);
          } else if constexpr (std::is_same_v<T, Escape>) {
            oss << argToSource(node.value, names);
          } else {
            static_assert(!sizeof(T*), "unhandled instruction in toSource()");
          }
        },
        insn.node);
    oss << ")\n";
  }
  return oss.str();
}

}  // namespace lsopt::IR
