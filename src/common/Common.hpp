#pragma once

#include <cassert>
#include <cstdlib>

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

[[noreturn]] inline void unreachable() {
#if defined(_MSC_VER)
  __assume(false);
#elif defined(__GNUC__)
  __builtin_unreachable();
#else
  // fallback
  assert(false && "unreachable");
  std::abort();
#endif
}
