#include "common/LiteralValue.hpp"

#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <variant>

namespace lsopt {
namespace {
// Shortest form that reads back to the same double. The mantissa always
// carries a '.', so 1e-20 prints as "1.0e-20" and 3 as "3.0".
std::string formatDouble(double x) {
  if (!std::isfinite(x)) {
    // inf / nan have no literal form; IR::constant() rejects them
    std::ostringstream oss;
    oss << x;
    return oss.str();
  }
  std::string s;
  for (int prec = 15; prec <= std::numeric_limits<double>::max_digits10;
       ++prec) {
    std::ostringstream oss;
    oss << std::setprecision(prec) << x;
    s = oss.str();
    if (std::strtod(s.c_str(), nullptr) == x) {
      break;
    }
  }
  size_t exp = s.find_first_of("eE");
  std::string mantissa = s.substr(0, exp);
  if (mantissa.find('.') == std::string::npos) {
    s.insert(exp == std::string::npos ? s.size() : exp, ".0");
  }
  return s;
}

std::string quote(const std::string& x) {
  std::string out = "\"";
  for (char c : x) {
    switch (c) {
      case '\\':
        out += "\\\\";
        break;
      case '"':
        out += "\\\"";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\t':
        out += "\\t";
        break;
      case '\r':
        out += "\\r";
        break;
      default:
        out += c;
        break;
    }
  }
  out += "\"";
  return out;
}
}  // namespace

bool parseInteger(const std::string& s, int64_t& out) {
  try {
    size_t idx = 0;
    long long v = std::stoll(s, &idx, 10);
    if (idx != s.size()) {
      return false;
    }
    out = static_cast<int64_t>(v);
    return true;
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::out_of_range&) {
    return false;
  }
}

bool parseNumber(const std::string& s, double& out) {
  try {
    size_t idx = 0;
    out = std::stod(s, &idx);
    if (idx != s.size()) {
      return false;
    }
    return true;
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::out_of_range&) {
    return false;
  }
}

std::string literalToSource(const LiteralValue& v) {
  return std::visit(
      [&](auto const& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return "nil";
        } else if constexpr (std::is_same_v<T, bool>) {
          return x ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
          return std::to_string(x);
        } else if constexpr (std::is_same_v<T, double>) {
          return formatDouble(x);
        } else if constexpr (std::is_same_v<T, std::string>) {
          return quote(x);
        } else {
          static_assert(!sizeof(T*), "bad literal");
        }
      },
      v);
}

bool sameLiteral(const LiteralValue& a, const LiteralValue& b) {
  if (a.index() != b.index()) {
    return false;
  }
  if (auto* x = std::get_if<double>(&a)) {
    // 0.0 and -0.0 are different values to whoever reads them back
    double y = std::get<double>(b);
    return *x == y && std::signbit(*x) == std::signbit(y);
  }
  return a == b;
}

}  // namespace lsopt
