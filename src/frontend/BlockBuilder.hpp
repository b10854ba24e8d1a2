#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "LsirParser.h"
#include "common/IR.hpp"

namespace lsopt {

// Builds an IR::Block from a parsed listing. Names bound by `name = op(...)`
// are resolved against earlier instructions only.
class BlockBuilder {
 public:
  IR::Block build(parser::LsirParser::BlockContext* block);

 private:
  void buildInstruction(parser::LsirParser::InstructionContext* insn);
  IR::Value buildOperand(parser::LsirParser::OperandContext* operand);
  int64_t immediate(parser::LsirParser::OperandContext* operand,
                    const char* what);
  std::vector<parser::LsirParser::OperandContext*> operandsOf(
      parser::LsirParser::InstructionContext* insn, size_t arity);

  IR::Block block_;
  std::unordered_map<std::string, IR::Value> names_;
};

// Parses listing text into a block. Syntax errors throw std::runtime_error,
// undefined names throw IR::MalformedReference and unknown opcodes throw
// IR::UnknownOpcode.
IR::Block parseBlock(const std::string& src);

}  // namespace lsopt
