#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "common/IR.hpp"
#include "compiler/LoadStoreOpt.hpp"
#include "utils/IRVerify.hpp"
#include "utils/TestUtils.hpp"

using namespace lsopt;
using namespace lsopt::IR;

// -------------------- forwarding and invalidation --------------------

TEST(LoadStoreOpt, TwoLoadsOfSameSlot) {
  Block bb;
  Value var0 = bb.getarg(0);
  Value var1 = bb.load(var0, 0);
  Value var2 = bb.load(var0, 0);
  bb.escape(var1);
  bb.escape(var2);
  EXPECT_EQ(optimizedSource(bb), lines({
                                     "var0 = getarg(0)",
                                     "var1 = load(var0, 0)",
                                     "escape(var1)",
                                     "escape(var1)",
                                 }));
}

TEST(LoadStoreOpt, StoreToSameSlotInvalidatesLoad) {
  Block bb;
  Value var0 = bb.getarg(0);
  Value var1 = bb.load(var0, 0);
  bb.store(var0, 0, constant(5));
  Value var3 = bb.load(var0, 0);
  bb.escape(var1);
  bb.escape(var3);
  EXPECT_EQ(optimizedSource(bb), lines({
                                     "var0 = getarg(0)",
                                     "var1 = load(var0, 0)",
                                     "store(var0, 0, 5)",
                                     "escape(var1)",
                                     "escape(5)",
                                 }));
}

TEST(LoadStoreOpt, StoreToOtherOffsetOfSameObjectKeepsLoad) {
  Block bb;
  Value var0 = bb.getarg(0);
  Value var1 = bb.load(var0, 0);
  bb.store(var0, 4, constant(5));
  Value var3 = bb.load(var0, 0);
  bb.escape(var1);
  bb.escape(var3);
  EXPECT_EQ(optimizedSource(bb), lines({
                                     "var0 = getarg(0)",
                                     "var1 = load(var0, 0)",
                                     "store(var0, 4, 5)",
                                     "escape(var1)",
                                     "escape(var1)",
                                 }));
}

TEST(LoadStoreOpt, LoadAfterStoreIsForwarded) {
  Block bb;
  Value var0 = bb.getarg(0);
  bb.store(var0, 0, constant(5));
  Value var1 = bb.load(var0, 0);
  Value var2 = bb.load(var0, 1);
  bb.escape(var1);
  bb.escape(var2);
  EXPECT_EQ(optimizedSource(bb), lines({
                                     "var0 = getarg(0)",
                                     "store(var0, 0, 5)",
                                     "var1 = load(var0, 1)",
                                     "escape(5)",
                                     "escape(var1)",
                                 }));
}

TEST(LoadStoreOpt, RepeatedStoreOfSameConstantIsDead) {
  Block bb;
  Value arg1 = bb.getarg(0);
  bb.store(arg1, 0, constant(5));
  bb.store(arg1, 0, constant(5));
  EXPECT_EQ(optimizedSource(bb), lines({
                                     "var0 = getarg(0)",
                                     "store(var0, 0, 5)",
                                 }));
}

TEST(LoadStoreOpt, OverwritingStoresAreBothKept) {
  Block bb;
  Value h = bb.allocHash();
  bb.store(h, 0, constant(1));
  bb.store(h, 0, constant(2));
  bb.escape(bb.load(h, 0));
  EXPECT_EQ(optimizedSource(bb), lines({
                                     "var0 = alloc_hash()",
                                     "store(var0, 0, 1)",
                                     "store(var0, 0, 2)",
                                     "escape(2)",
                                 }));
}

TEST(LoadStoreOpt, StoredReferenceIsForwarded) {
  Block bb;
  Value h = bb.allocHash();
  Value arg = bb.getarg(0);
  bb.store(h, 3, arg);
  bb.escape(bb.load(h, 3));
  EXPECT_EQ(optimizedSource(bb), lines({
                                     "var0 = alloc_hash()",
                                     "var1 = getarg(0)",
                                     "store(var0, 3, var1)",
                                     "escape(var1)",
                                 }));
}

TEST(LoadStoreOpt, ForwardedValueIsUsedAsObjectKey) {
  Block bb;
  Value a = bb.allocArray();
  Value p1 = bb.load(a, 0);
  Value p2 = bb.load(a, 0);
  Value x = bb.load(p2, 1);
  Value y = bb.load(p1, 1);
  bb.escape(x);
  bb.escape(y);
  EXPECT_EQ(optimizedSource(bb), lines({
                                     "var0 = alloc_array()",
                                     "var1 = load(var0, 0)",
                                     "var2 = load(var1, 1)",
                                     "escape(var2)",
                                     "escape(var2)",
                                 }));
}

// -------------------- type-based alias analysis --------------------

TEST(LoadStoreOpt, TBAA_DifferentTypesDoNotAlias) {
  Block bb;
  Value array = bb.allocArray();
  Value hash = bb.allocHash();
  Value v1 = bb.load(array, 0);
  bb.store(hash, 0, constant(42));
  Value v2 = bb.load(array, 0);
  bb.escape(v1);
  bb.escape(v2);

  Block opt = optimizeLoadStore(bb);
  EXPECT_EQ(countOp(opt, "load"), 1);
  EXPECT_EQ(IR::toSource(opt), lines({
                                   "var0 = alloc_array()",
                                   "var1 = alloc_hash()",
                                   "var2 = load(var0, 0)",
                                   "store(var1, 0, 42)",
                                   "escape(var2)",
                                   "escape(var2)",
                               }));
}

TEST(LoadStoreOpt, TBAA_SameTypeMayAlias) {
  Block bb;
  Value a1 = bb.allocArray();
  Value a2 = bb.allocArray();
  Value v1 = bb.load(a1, 0);
  bb.store(a2, 0, constant(42));
  Value v2 = bb.load(a1, 0);
  bb.escape(v1);
  bb.escape(v2);
  EXPECT_EQ(optimizedSource(bb), lines({
                                     "var0 = alloc_array()",
                                     "var1 = alloc_array()",
                                     "var2 = load(var0, 0)",
                                     "store(var1, 0, 42)",
                                     "var3 = load(var0, 0)",
                                     "escape(var2)",
                                     "escape(var3)",
                                 }));
}

TEST(LoadStoreOpt, TBAA_StoreThenLoadForwardsConstant) {
  Block bb;
  Value h = bb.allocHash();
  bb.store(h, 0, constant(100));
  Value v = bb.load(h, 0);
  bb.escape(v);
  EXPECT_EQ(optimizedSource(bb), lines({
                                     "var0 = alloc_hash()",
                                     "store(var0, 0, 100)",
                                     "escape(100)",
                                 }));
}

TEST(LoadStoreOpt, StoreOfJustLoadedValueIsDead) {
  Block bb;
  Value a = bb.allocArray();
  Value v = bb.load(a, 0);
  bb.store(a, 0, v);
  bb.escape(v);

  OptimizeStats stats;
  Block opt = optimizeLoadStore(bb, stats);
  EXPECT_EQ(stats.storesEliminated, 1u);
  EXPECT_EQ(IR::toSource(opt), lines({
                                   "var0 = alloc_array()",
                                   "var1 = load(var0, 0)",
                                   "escape(var1)",
                               }));
}

TEST(LoadStoreOpt, TBAA_MultipleTypes) {
  Block bb;
  Value array = bb.allocArray();
  Value hash = bb.allocHash();
  Value string = bb.allocString();
  bb.load(array, 0);
  bb.load(hash, 0);
  bb.load(string, 0);
  bb.store(hash, 0, constant(100));
  Value arr2 = bb.load(array, 0);
  Value hash2 = bb.load(hash, 0);
  Value str2 = bb.load(string, 0);
  bb.escape(arr2);
  bb.escape(hash2);
  bb.escape(str2);
  EXPECT_EQ(optimizedSource(bb), lines({
                                     "var0 = alloc_array()",
                                     "var1 = alloc_hash()",
                                     "var2 = alloc_string()",
                                     "var3 = load(var0, 0)",
                                     "var4 = load(var1, 0)",
                                     "var5 = load(var2, 0)",
                                     "store(var1, 0, 100)",
                                     "escape(var3)",
                                     "escape(100)",
                                     "escape(var5)",
                                 }));
}

TEST(LoadStoreOpt, TBAA_UnknownTypeIsConservative) {
  Block bb;
  Value array = bb.allocArray();
  Value unknown = bb.getarg(0);
  Value v1 = bb.load(array, 0);
  bb.store(unknown, 0, constant(42));
  Value v2 = bb.load(array, 0);
  bb.escape(v1);
  bb.escape(v2);
  EXPECT_EQ(optimizedSource(bb), lines({
                                     "var0 = alloc_array()",
                                     "var1 = getarg(0)",
                                     "var2 = load(var0, 0)",
                                     "store(var1, 0, 42)",
                                     "var3 = load(var0, 0)",
                                     "escape(var2)",
                                     "escape(var3)",
                                 }));
}

TEST(LoadStoreOpt, TBAA_UntypedAllocIsConservative) {
  Block bb;
  Value array = bb.allocArray();
  Value plain = bb.alloc();
  Value v1 = bb.load(array, 0);
  bb.store(plain, 0, constant(1));
  bb.escape(v1);
  bb.escape(bb.load(array, 0));
  EXPECT_EQ(countOp(optimizeLoadStore(bb), "load"), 2);
}

TEST(LoadStoreOpt, UnknownStoreInvalidatesEveryOffsetOfOtherObjects) {
  Block bb;
  Value array = bb.allocArray();
  Value unknown = bb.getarg(0);
  Value v1 = bb.load(array, 0);
  bb.store(unknown, 1, constant(42));
  bb.escape(v1);
  bb.escape(bb.load(array, 0));
  EXPECT_EQ(countOp(optimizeLoadStore(bb), "load"), 2);
}

TEST(LoadStoreOpt, TBAA_AllConcreteTypes) {
  Block bb;
  Value array = bb.allocArray();
  Value hash = bb.allocHash();
  Value string = bb.allocString();
  Value integer = bb.allocInteger();
  Value flt = bb.allocFloat();
  Value symbol = bb.allocSymbol();
  Value range = bb.allocRange();
  Value regexp = bb.allocRegexp();

  bb.load(array, 0);
  bb.store(hash, 0, constant(1));
  bb.store(string, 0, constant(2));
  bb.store(integer, 0, constant(3));
  bb.store(flt, 0, constant(4));
  bb.store(symbol, 0, constant(5));
  bb.store(range, 0, constant(6));
  bb.store(regexp, 0, constant(7));
  Value again = bb.load(array, 0);
  bb.escape(again);

  Block opt = optimizeLoadStore(bb);
  std::string result = IR::toSource(opt);
  EXPECT_NE(result.find("escape(var8)"), std::string::npos) << result;
  EXPECT_EQ(countOp(opt, "load"), 1);
  EXPECT_EQ(countOp(opt, "store"), 7);
}

TEST(LoadStoreOpt, TBAA_StoreLoadDifferentTypes) {
  Block bb;
  Value string = bb.allocString();
  Value integer = bb.allocInteger();
  bb.store(string, 0, constant("hello"));
  bb.store(integer, 0, constant(42));
  Value strVal = bb.load(string, 0);
  Value intVal = bb.load(integer, 0);
  bb.escape(strVal);
  bb.escape(intVal);
  EXPECT_EQ(optimizedSource(bb), lines({
                                     "var0 = alloc_string()",
                                     "var1 = alloc_integer()",
                                     "store(var0, 0, \"hello\")",
                                     "store(var1, 0, 42)",
                                     "escape(\"hello\")",
                                     "escape(42)",
                                 }));
}

// -------------------- dead stores --------------------

TEST(LoadStoreOpt, DeadStoreLeavesOtherKnownSlotsAlone) {
  Block bb;
  Value a1 = bb.allocArray();
  Value a2 = bb.allocArray();
  Value v = bb.load(a1, 0);
  Value w = bb.load(a2, 0);
  bb.store(a1, 0, v);
  bb.escape(w);
  bb.escape(bb.load(a2, 0));
  EXPECT_EQ(optimizedSource(bb), lines({
                                     "var0 = alloc_array()",
                                     "var1 = alloc_array()",
                                     "var2 = load(var0, 0)",
                                     "var3 = load(var1, 0)",
                                     "escape(var3)",
                                     "escape(var3)",
                                 }));
}

TEST(LoadStoreOpt, ValueEqualConstantsMakeStoreDead) {
  Block bb;
  Value h = bb.allocHash();
  bb.store(h, 0, constant("k"));
  bb.store(h, 0, constant(std::string("k")));
  bb.store(h, 1, constant(5));
  bb.store(h, 1, constant(5.0));

  OptimizeStats stats;
  Block opt = optimizeLoadStore(bb, stats);
  EXPECT_EQ(stats.storesEliminated, 1u);
  EXPECT_EQ(IR::toSource(opt), lines({
                                   "var0 = alloc_hash()",
                                   "store(var0, 0, \"k\")",
                                   "store(var0, 1, 5)",
                                   "store(var0, 1, 5.0)",
                               }));
}

TEST(LoadStoreOpt, SignedZerosAreDifferentValues) {
  Block bb;
  Value a = bb.allocArray();
  bb.store(a, 0, constant(0.0));
  bb.store(a, 0, constant(-0.0));
  bb.escape(bb.load(a, 0));

  OptimizeStats stats;
  Block opt = optimizeLoadStore(bb, stats);
  EXPECT_EQ(stats.storesEliminated, 0u);
  EXPECT_EQ(IR::toSource(opt), lines({
                                   "var0 = alloc_array()",
                                   "store(var0, 0, 0.0)",
                                   "store(var0, 0, -0.0)",
                                   "escape(-0.0)",
                               }));

  auto before = interpret(bb);
  auto after = interpret(opt);
  ASSERT_TRUE(before.ok) << before.error;
  EXPECT_EQ(before.stdout_text, "-0.0\n");
  EXPECT_EQ(after.stdout_text, before.stdout_text);
}

TEST(LoadStoreOpt, StoreOfDifferentReferenceIsNotDead) {
  Block bb;
  Value h = bb.allocHash();
  Value x = bb.getarg(0);
  Value y = bb.getarg(1);
  bb.store(h, 0, x);
  bb.store(h, 0, y);
  EXPECT_EQ(countOp(optimizeLoadStore(bb), "store"), 2);
}

// -------------------- contract --------------------

TEST(LoadStoreOpt, EscapesAreNeverRemoved) {
  Block bb;
  Value a = bb.allocArray();
  bb.escape(a);
  bb.escape(constant(1));
  bb.escape(constant(1));
  Value v = bb.load(a, 0);
  bb.escape(v);
  bb.escape(bb.load(a, 0));
  EXPECT_EQ(countOp(optimizeLoadStore(bb), "escape"), 5);
}

TEST(LoadStoreOpt, InputBlockIsNotModified) {
  Block bb;
  Value a = bb.allocArray();
  Value v = bb.load(a, 0);
  bb.store(a, 0, v);
  bb.escape(bb.load(a, 0));
  const std::string before = IR::toSource(bb);
  Block opt = optimizeLoadStore(bb);
  EXPECT_EQ(IR::toSource(bb), before);
  EXPECT_EQ(bb.size(), 4u);
  EXPECT_EQ(opt.size(), 3u);
}

TEST(LoadStoreOpt, EmptyBlock) {
  Block bb;
  Block opt = optimizeLoadStore(bb);
  EXPECT_TRUE(opt.empty());
}

TEST(LoadStoreOpt, StatsCountEliminations) {
  Block bb;
  Value a1 = bb.allocArray();
  Value a2 = bb.allocArray();
  Value v = bb.load(a1, 0);
  bb.load(a1, 0);
  bb.load(a2, 0);
  bb.store(a1, 0, v);
  bb.store(a2, 0, constant(9));
  bb.load(a2, 0);

  OptimizeStats stats;
  optimizeLoadStore(bb, stats);
  EXPECT_EQ(stats.loadsForwarded, 2u);
  EXPECT_EQ(stats.storesEliminated, 1u);
  // the store to a2 forgets both a1[0] and a2[0]
  EXPECT_EQ(stats.entriesInvalidated, 2u);
}

TEST(LoadStoreOpt, OutputIsWellFormedAndMinimal) {
  Block bb;
  Value arg = bb.getarg(0);
  Value a = bb.allocArray();
  Value h = bb.allocHash();
  Value v = bb.load(a, 0);
  bb.store(h, 1, v);
  bb.store(arg, 0, bb.load(h, 1));
  bb.escape(bb.load(a, 0));
  bb.escape(bb.load(h, 1));

  Block opt = optimizeLoadStore(bb);
  auto vr = IR::verify(opt, /*strictMemory=*/true);
  EXPECT_TRUE(vr.ok) << (vr.errors.empty() ? "" : vr.errors.front());
}

TEST(LoadStoreOpt, IsDeterministicAcrossThreads) {
  Block bb;
  Value a = bb.allocArray();
  Value h = bb.allocHash();
  Value arg = bb.getarg(0);
  for (int i = 0; i < 50; ++i) {
    bb.store(i % 2 ? a : h, i % 3, constant(i));
    bb.escape(bb.load(a, i % 3));
    if (i % 7 == 0) {
      bb.store(arg, 0, constant(i));
    }
  }
  const std::string expected = optimizedSource(bb);

  std::vector<std::string> results(4);
  std::vector<std::thread> workers;
  for (size_t t = 0; t < results.size(); ++t) {
    workers.emplace_back([&, t] { results[t] = optimizedSource(bb); });
  }
  for (auto& w : workers) {
    w.join();
  }
  for (auto const& r : results) {
    EXPECT_EQ(r, expected);
  }
}
