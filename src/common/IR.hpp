#pragma once

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "common/LiteralValue.hpp"
#include "common/Type.hpp"

namespace lsopt::IR {

// Index of an instruction inside its block. Never recycled.
using InsnId = uint32_t;

// Reference to the result of an earlier instruction; equal iff same producer.
struct InsnRef {
  InsnId id;

  bool operator==(const InsnRef& o) const {
    return id == o.id;
  }
  bool operator!=(const InsnRef& o) const {
    return id != o.id;
  }
};

// Immediate literal; equal by value.
struct Constant {
  LiteralValue value;

  bool operator==(const Constant& o) const {
    return sameLiteral(value, o.value);
  }
  bool operator!=(const Constant& o) const {
    return !(*this == o);
  }
};

using Value = std::variant<InsnRef, Constant>;

inline Value ref(InsnId id) {
  return InsnRef{id};
}
inline bool isRef(const Value& v) {
  return std::holds_alternative<InsnRef>(v);
}
inline InsnId refId(const Value& v) {
  return std::get<InsnRef>(v).id;
}

template <class T, std::enable_if_t<std::is_integral_v<T> &&
                                        !std::is_same_v<T, bool>,
                                    int> = 0>
Value constant(T v) {
  return Constant{LiteralValue{static_cast<int64_t>(v)}};
}
inline Value constant(bool v) {
  return Constant{LiteralValue{v}};
}
// Listings have no spelling for inf or nan, so only finite doubles are
// constants.
inline Value constant(double v) {
  if (!std::isfinite(v)) {
    throw std::runtime_error("float constant must be finite");
  }
  return Constant{LiteralValue{v}};
}
inline Value constant(std::string v) {
  return Constant{LiteralValue{std::move(v)}};
}
inline Value constant(const char* v) {
  return Constant{LiteralValue{std::string(v)}};
}
inline Value constant(LiteralValue v) {
  if (auto* d = std::get_if<double>(&v)) {
    return constant(*d);
  }
  return Constant{std::move(v)};
}

// x := alloc_<type>()
struct AllocObject {
  ObjectType type = ObjectType::Unknown;
};
// x := getarg(i), an object handed in from outside the block
struct GetArg {
  int64_t index = 0;
};
// x := load(object, offset)
struct Load {
  Value object;
  int64_t offset = 0;
};
// store(object, offset, value)
struct Store {
  Value object;
  int64_t offset = 0;
  Value value;
};
// escape(value): value is observable outside the block
struct Escape {
  Value value;
};

using InstructionNode = std::variant<AllocObject, GetArg, Load, Store, Escape>;

struct Instruction {
  InstructionNode node;
};

bool hasResult(const Instruction& insn);
std::string opcodeName(const Instruction& insn);
std::vector<Value> operands(const Instruction& insn);

// An instruction referred to a value that is not defined earlier in the
// same block, or to an instruction without a result.
class MalformedReference : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// An opcode outside the closed instruction set.
class UnknownOpcode : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// A straight-line sequence of instructions. The position of an instruction is
// its identity, so values are plain indices into the block.
class Block {
 public:
  Value alloc(ObjectType type = ObjectType::Unknown);
  Value allocArray() {
    return alloc(ObjectType::Array);
  }
  Value allocHash() {
    return alloc(ObjectType::Hash);
  }
  Value allocString() {
    return alloc(ObjectType::String);
  }
  Value allocInteger() {
    return alloc(ObjectType::Integer);
  }
  Value allocFloat() {
    return alloc(ObjectType::Float);
  }
  Value allocSymbol() {
    return alloc(ObjectType::Symbol);
  }
  Value allocRange() {
    return alloc(ObjectType::Range);
  }
  Value allocRegexp() {
    return alloc(ObjectType::Regexp);
  }

  Value getarg(int64_t index);
  Value load(const Value& object, int64_t offset);
  InsnId store(const Value& object, int64_t offset, const Value& value);
  InsnId escape(const Value& value);

  // Appends any instruction after validating its operands. Throws
  // MalformedReference on a dangling operand.
  InsnId append(Instruction insn);

  size_t size() const {
    return insns_.size();
  }
  bool empty() const {
    return insns_.empty();
  }
  const Instruction& at(InsnId id) const;
  const std::vector<Instruction>& instructions() const {
    return insns_;
  }

  // Allocation type of the object a value refers to; Unknown for anything
  // that is not the result of a typed AllocObject.
  ObjectType typeOf(const Value& v) const;

 private:
  void checkOperand(const Value& v, const std::string& role) const;

  std::vector<Instruction> insns_;
};

// One line per instruction, "varN = op(args)" for result-bearing ones.
std::string toSource(const Block& block, const std::string& varPrefix = "var");

}  // namespace lsopt::IR
