#include "interpreter/Interpreter.hpp"

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include "common/Common.hpp"
#include "common/LiteralValue.hpp"

using namespace lsopt;

namespace {
struct ObjectHandle {
  std::string name;
};
// Content of a slot nobody wrote during this run.
struct InitialContent {
  std::string object;
  int64_t offset;
};

using RuntimeValue = std::variant<LiteralValue, ObjectHandle, InitialContent>;

std::string render(const RuntimeValue& v) {
  return std::visit(
      overloaded{
          [](const LiteralValue& lit) { return literalToSource(lit); },
          [](const ObjectHandle& h) { return "#" + h.name; },
          [](const InitialContent& c) {
            return "<" + c.object + "[" + std::to_string(c.offset) + "]>";
          },
      },
      v);
}

struct VM {
  ExecResult result;
  const std::vector<int64_t>& argIdentities;
  std::vector<std::optional<RuntimeValue>> regs;
  std::map<std::pair<std::string, int64_t>, RuntimeValue> heap;
  int nextObject = 0;

  explicit VM(const std::vector<int64_t>& args) : argIdentities(args) {
  }

  [[noreturn]] void vmFail(const std::string& msg) {
    throw std::runtime_error(msg);
  }
  void vmCheck(bool cond, const std::string& msg) {
    if (!cond) {
      vmFail(msg);
    }
  }

  RuntimeValue eval(const IR::Value& v) {
    if (!IR::isRef(v)) {
      return std::get<IR::Constant>(v).value;
    }
    IR::InsnId id = IR::refId(v);
    vmCheck(id < regs.size() && regs[id].has_value(),
            "dangling reference: %" + std::to_string(id) + " has no value");
    return *regs[id];
  }

  const ObjectHandle& objectOf(const RuntimeValue& v, const char* what) {
    auto* h = std::get_if<ObjectHandle>(&v);
    if (!h) {
      vmFail(std::string(what) + " from non-object value " + render(v));
    }
    return *h;
  }

  std::optional<RuntimeValue> exec(const IR::Instruction& insn) {
    return std::visit(
        [&](auto const& node) -> std::optional<RuntimeValue> {
          using T = std::decay_t<decltype(node)>;
          if constexpr (std::is_same_v<T, IR::AllocObject>) {
            return ObjectHandle{"obj" + std::to_string(nextObject++)};
          } else if constexpr (std::is_same_v<T, IR::GetArg>) {
            vmCheck(node.index >= 0, "negative argument index");
            auto i = static_cast<size_t>(node.index);
            if (i < argIdentities.size()) {
              return ObjectHandle{"arg" + std::to_string(argIdentities[i])};
            }
            return ObjectHandle{"argx" + std::to_string(i)};
          } else if constexpr (std::is_same_v<T, IR::Load>) {
            RuntimeValue obj = eval(node.object);
            const auto& h = objectOf(obj, "load");
            auto it = heap.find({h.name, node.offset});
            if (it == heap.end()) {
              return InitialContent{h.name, node.offset};
            }
            return it->second;
          } else if constexpr (std::is_same_v<T, IR::Store>) {
            RuntimeValue obj = eval(node.object);
            const auto& h = objectOf(obj, "store");
            heap.insert_or_assign({h.name, node.offset}, eval(node.value));
            return std::nullopt;
          } else if constexpr (std::is_same_v<T, IR::Escape>) {
            result.stdout_text += render(eval(node.value));
            result.stdout_text += "\n";
            return std::nullopt;
          } else {
            static_assert(!sizeof(T*), "unhandled instruction in interpreter");
          }
        },
        insn.node);
  }

  void run(const IR::Block& block) {
    try {
      for (auto const& insn : block.instructions()) {
        regs.push_back(exec(insn));
      }
      result.ok = true;
    } catch (const std::exception& e) {
      result.ok = false;
      result.error = e.what();
    }
  }
};

}  // namespace

ExecResult interpret(const IR::Block& block,
                     const std::vector<int64_t>& argIdentities) {
  VM vm(argIdentities);
  vm.run(block);
  return vm.result;
}
