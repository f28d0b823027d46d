#include "engine/layout_arbiter.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <vector>

using convgen::engine::LayoutArbiter;
using convgen::engine::ManualConversionTracker;
using convgen::engine::Universe;

namespace {

const char* kModel = R"JSON(
{
  "packages": [
    { "path": "a", "types": [
        { "name": "Count", "kind": "alias", "underlying": "int32" },
        { "name": "Deep", "kind": "record", "members": [
            { "name": "P", "type": "ptr<seq<map<string, int32>>>" },
            { "name": "N", "type": "a.Count" } ] },
        { "name": "Ordered", "kind": "record", "members": [
            { "name": "A", "type": "int32" }, { "name": "B", "type": "string" } ] },
        { "name": "Node", "kind": "record", "members": [ { "name": "Next", "type": "ptr<a.Node>" } ] },
        { "name": "Opaque", "kind": "interface" } ] },
    { "path": "b", "types": [
        { "name": "Deep", "kind": "record", "members": [
            { "name": "P", "type": "ptr<seq<map<string, int32>>>" },
            { "name": "N", "type": "int32" } ] },
        { "name": "Ordered", "kind": "record", "members": [
            { "name": "B", "type": "string" }, { "name": "A", "type": "int32" } ] },
        { "name": "Node", "kind": "record", "members": [ { "name": "Next", "type": "ptr<b.Node>" } ] },
        { "name": "Opaque", "kind": "interface" } ] }
  ]
}
)JSON";

auto type(Universe& universe, std::string_view package, std::string_view name) -> const convgen::engine::Type* {
  return universe.package(package)->type(name);
}

}  // namespace

TEST(LayoutArbiter, NestedChainsOfIdenticalPrimitivesAreEqual) {
  Universe universe;
  ASSERT_TRUE(load_packages(universe, kModel));
  LayoutArbiter arbiter(nullptr, "conversion-gen");
  EXPECT_TRUE(arbiter.can_use_unsafe_conversion(type(universe, "a", "Deep"), type(universe, "b", "Deep")));

  auto* int32 = universe.builtin("int32");
  auto* count = universe.named("a", "Count");
  EXPECT_TRUE(arbiter.equal(universe.pointer_to(universe.sequence_of(int32)),
                            universe.pointer_to(universe.sequence_of(count))));
  EXPECT_FALSE(arbiter.equal(universe.sequence_of(int32), universe.sequence_of(universe.builtin("int64"))));
}

TEST(LayoutArbiter, MemberOrderMatters) {
  Universe universe;
  ASSERT_TRUE(load_packages(universe, kModel));
  LayoutArbiter arbiter(nullptr, "conversion-gen");
  EXPECT_FALSE(arbiter.equal(type(universe, "a", "Ordered"), type(universe, "b", "Ordered")));
}

TEST(LayoutArbiter, DisabledNeverAllowsReinterpretation) {
  Universe universe;
  ASSERT_TRUE(load_packages(universe, kModel));
  LayoutArbiter arbiter(nullptr, "conversion-gen", false);
  EXPECT_TRUE(arbiter.equal(type(universe, "a", "Deep"), type(universe, "b", "Deep")));
  EXPECT_FALSE(arbiter.can_use_unsafe_conversion(type(universe, "a", "Deep"), type(universe, "b", "Deep")));
}

TEST(LayoutArbiter, SelfReferentialTypesTerminate) {
  Universe universe;
  ASSERT_TRUE(load_packages(universe, kModel));
  LayoutArbiter arbiter(nullptr, "conversion-gen");
  EXPECT_FALSE(arbiter.equal(type(universe, "a", "Node"), type(universe, "b", "Node")));
  EXPECT_TRUE(arbiter.equal(type(universe, "a", "Node"), type(universe, "a", "Node")));
}

TEST(LayoutArbiter, UnknownTypesAreNeverEquivalent) {
  Universe universe;
  ASSERT_TRUE(load_packages(universe, kModel));
  LayoutArbiter arbiter(nullptr, "conversion-gen");
  EXPECT_FALSE(arbiter.equal(type(universe, "a", "Opaque"), type(universe, "b", "Opaque")));
}

TEST(LayoutArbiter, ManualConversionDisqualifiesUnlessCopyOnly) {
  Universe universe;
  ASSERT_TRUE(load_packages(universe, kModel));
  ASSERT_TRUE(load_packages(universe, R"JSON(
  { "path": "conv", "functions": [
      { "name": "Convert_a_Deep_To_b_Deep", "results": ["error"], "params": [
          { "name": "in", "type": "ptr<a.Deep>" }, { "name": "out", "type": "ptr<b.Deep>" } ] },
      { "name": "Convert_b_Deep_To_a_Deep", "results": ["error"], "comments": ["+conversion-gen=copy-only"],
        "params": [ { "name": "in", "type": "ptr<b.Deep>" }, { "name": "out", "type": "ptr<a.Deep>" } ] } ] }
  )JSON"));
  auto tracker = ManualConversionTracker::create();
  ASSERT_TRUE(tracker);
  const std::vector<std::string> packages = {"conv"};
  ASSERT_TRUE((*tracker)->discover(universe, packages));

  LayoutArbiter arbiter(*tracker, "conversion-gen");
  EXPECT_FALSE(arbiter.equal(type(universe, "a", "Deep"), type(universe, "b", "Deep")));
  EXPECT_TRUE(arbiter.equal(type(universe, "b", "Deep"), type(universe, "a", "Deep")));
}

TEST(LayoutArbiter, FastConversion) {
  Universe universe;
  ASSERT_TRUE(load_packages(universe, kModel));
  using convgen::engine::is_fast_conversion;
  EXPECT_TRUE(is_fast_conversion(*universe.builtin("int32"), *universe.builtin("int64")));
  EXPECT_TRUE(is_fast_conversion(*type(universe, "a", "Ordered"), *type(universe, "a", "Ordered")));
  EXPECT_FALSE(is_fast_conversion(*type(universe, "a", "Ordered"), *type(universe, "b", "Ordered")));
  EXPECT_FALSE(is_fast_conversion(*type(universe, "a", "Opaque"), *type(universe, "b", "Opaque")));
}
