#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "common/IR.hpp"

struct ExecResult {
  bool ok = true;
  std::string stdout_text;  // one line per escaped value
  std::string error;
};

// Runs a block against a concrete heap. argIdentities[i] names the heap
// object returned by getarg(i): equal identities are the same object, so
// arguments can alias each other. Indices past the end get distinct objects.
// A slot that was never written holds a symbolic initial value "<obj[off]>".
ExecResult interpret(const lsopt::IR::Block& block,
                     const std::vector<int64_t>& argIdentities = {});
