#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace lsopt {
using LiteralValue =
    std::variant<std::monostate, bool, int64_t, double, std::string>;

bool parseInteger(const std::string& s, int64_t& out);
bool parseNumber(const std::string& s, double& out);

// Listing form: strings are quoted and escaped, doubles keep a '.'.
std::string literalToSource(const LiteralValue& v);

// Value equality. Literals of different kinds never compare equal, so 5 and
// 5.0 are distinct constants.
bool sameLiteral(const LiteralValue& a, const LiteralValue& b);

}  // namespace lsopt
