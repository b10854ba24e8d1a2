#pragma once

#include <cstddef>

#include "common/IR.hpp"

namespace lsopt::IR {

struct OptimizeStats {
  size_t loadsForwarded = 0;
  size_t storesEliminated = 0;
  size_t entriesInvalidated = 0;
};

// Single forward pass over a straight-line block:
//  - a load of a slot whose value is already known is replaced by that value;
//  - a store of the value a slot already holds is removed;
//  - a store forgets every known slot it may alias (type-based, see
//    mayAlias()).
// The input block is not modified. Throws MalformedReference if an operand
// does not refer to an earlier result-bearing instruction.
Block optimizeLoadStore(const Block& block);
Block optimizeLoadStore(const Block& block, OptimizeStats& stats);

}  // namespace lsopt::IR
