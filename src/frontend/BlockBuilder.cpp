#include "frontend/BlockBuilder.hpp"

#include <optional>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "LsirLexer.h"
#include "antlr4-runtime.h"
#include "common/LiteralValue.hpp"

using Parser = lsopt::parser::LsirParser;

namespace lsopt {
namespace {

class ThrowingErrorListener : public antlr4::BaseErrorListener {
 public:
  void syntaxError(antlr4::Recognizer*, antlr4::Token*, size_t line, size_t col,
                   const std::string& msg, std::exception_ptr) override {
    std::ostringstream oss;
    oss << "syntax error at " << line << ":" << col << " - " << msg;
    throw std::runtime_error(oss.str());
  }
};

std::string unescapeStringBody(std::string_view inner) {
  std::string out;
  out.reserve(inner.size());
  for (size_t i = 0; i < inner.size(); ++i) {
    char c = inner[i];
    if (c == '\\' && i + 1 < inner.size()) {
      char n = inner[i + 1];
      switch (n) {
        case '\\':
          out.push_back('\\');
          break;
        case '"':
          out.push_back('"');
          break;
        case 'n':
          out.push_back('\n');
          break;
        case 't':
          out.push_back('\t');
          break;
        case 'r':
          out.push_back('\r');
          break;
        default:
          out.push_back('\\');
          out.push_back(n);
          break;
      }
      ++i;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::string where(antlr4::ParserRuleContext* ctx) {
  auto* t = ctx->getStart();
  return std::to_string(t->getLine()) + ":" +
         std::to_string(t->getCharPositionInLine());
}

}  // namespace

IR::Block BlockBuilder::build(Parser::BlockContext* block) {
  block_ = IR::Block{};
  names_.clear();
  for (auto* insn : block->instruction()) {
    buildInstruction(insn);
  }
  return std::move(block_);
}

void BlockBuilder::buildInstruction(Parser::InstructionContext* insn) {
  const std::string op = insn->opcode->getText();
  std::optional<IR::Value> result;

  if (auto type = IR::fromAllocOpcode(op)) {
    operandsOf(insn, 0);
    result = block_.alloc(*type);
  } else if (op == "getarg") {
    auto args = operandsOf(insn, 1);
    result = block_.getarg(immediate(args[0], "getarg index"));
  } else if (op == "load") {
    auto args = operandsOf(insn, 2);
    IR::Value object = buildOperand(args[0]);
    result = block_.load(object, immediate(args[1], "load offset"));
  } else if (op == "store") {
    auto args = operandsOf(insn, 3);
    IR::Value object = buildOperand(args[0]);
    int64_t offset = immediate(args[1], "store offset");
    block_.store(object, offset, buildOperand(args[2]));
  } else if (op == "escape") {
    auto args = operandsOf(insn, 1);
    block_.escape(buildOperand(args[0]));
  } else {
    throw IR::UnknownOpcode("unknown opcode '" + op + "' at " + where(insn));
  }

  if (insn->ASSIGN()) {
    const std::string name = insn->ID(0)->getText();
    if (!result) {
      throw std::runtime_error(op + " produces no value to bind to '" + name +
                               "' at " + where(insn));
    }
    names_.insert_or_assign(name, *result);
  }
}

IR::Value BlockBuilder::buildOperand(Parser::OperandContext* operand) {
  if (auto* n = dynamic_cast<Parser::OperandNameContext*>(operand)) {
    const std::string name = n->ID()->getText();
    auto it = names_.find(name);
    if (it == names_.end()) {
      throw IR::MalformedReference("dangling reference: '" + name +
                                   "' is not defined before " +
                                   where(operand));
    }
    return it->second;
  }
  if (auto* i = dynamic_cast<Parser::OperandIntContext*>(operand)) {
    int64_t v = 0;
    if (!parseInteger(i->INT()->getText(), v)) {
      throw std::runtime_error("integer literal out of range at " +
                               where(operand));
    }
    return IR::constant(v);
  }
  if (auto* f = dynamic_cast<Parser::OperandFloatContext*>(operand)) {
    double d = 0.0;
    if (!parseNumber(f->FLOAT()->getText(), d)) {
      throw std::runtime_error("bad float literal at " + where(operand));
    }
    return IR::constant(d);
  }
  if (auto* s = dynamic_cast<Parser::OperandStringContext*>(operand)) {
    std::string raw = s->STRING()->getText();
    return IR::constant(
        unescapeStringBody(std::string_view(raw).substr(1, raw.size() - 2)));
  }
  if (dynamic_cast<Parser::OperandTrueContext*>(operand)) {
    return IR::constant(true);
  }
  if (dynamic_cast<Parser::OperandFalseContext*>(operand)) {
    return IR::constant(false);
  }
  if (dynamic_cast<Parser::OperandNilContext*>(operand)) {
    return IR::constant(LiteralValue{});
  }
  throw std::runtime_error("unknown OperandContext alternative");
}

int64_t BlockBuilder::immediate(Parser::OperandContext* operand,
                                const char* what) {
  auto* i = dynamic_cast<Parser::OperandIntContext*>(operand);
  if (!i) {
    throw std::runtime_error(std::string(what) +
                             " must be an integer literal at " +
                             where(operand));
  }
  int64_t v = 0;
  if (!parseInteger(i->INT()->getText(), v)) {
    throw std::runtime_error(std::string(what) + " out of range at " +
                             where(operand));
  }
  return v;
}

std::vector<Parser::OperandContext*> BlockBuilder::operandsOf(
    Parser::InstructionContext* insn, size_t arity) {
  std::vector<Parser::OperandContext*> args;
  if (auto* list = insn->operandList()) {
    args = list->operand();
  }
  if (args.size() != arity) {
    std::ostringstream oss;
    oss << insn->opcode->getText() << " expects " << arity
        << " operand(s), got " << args.size() << " at " << where(insn);
    throw std::runtime_error(oss.str());
  }
  return args;
}

IR::Block parseBlock(const std::string& src) {
  antlr4::ANTLRInputStream input(src);
  lsopt::parser::LsirLexer lexer(&input);
  ThrowingErrorListener err;
  lexer.removeErrorListeners();
  lexer.addErrorListener(&err);

  antlr4::CommonTokenStream tokens(&lexer);

  lsopt::parser::LsirParser parser(&tokens);
  parser.removeErrorListeners();
  parser.addErrorListener(&err);

  auto* blockCtx = parser.block();

  BlockBuilder bb;
  return bb.build(blockCtx);
}

}  // namespace lsopt
