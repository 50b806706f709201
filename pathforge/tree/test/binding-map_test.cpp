#include "pathforge/binding-map.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "pathforge/binding.hpp"
#include "pathforge/route-definition-error.hpp"
#include "pathforge/want-signature.hpp"

namespace pathforge {

class BindingMapTest : public ::testing::Test {
 protected:
  void add(std::string ident, NameSet before = {}, NameSet after = {}) {
    map.insert(MakeBinding(std::move(ident), std::move(before), std::move(after)));
  }

  std::vector<std::string> order() const {
    std::vector<std::string> ret;
    for (const auto& binding : map.ordered()) {
      ret.push_back(*binding->ident());
    }
    return ret;
  }

  BindingMap map;
};

TEST_F(BindingMapTest, Empty) { EXPECT_TRUE(map.ordered().empty()); }

TEST_F(BindingMapTest, UnconstrainedBindingsAreSortedByIdent) {
  add("zeta");
  add("alpha");
  add("mu");
  EXPECT_EQ(order(), (std::vector<std::string>{"alpha", "mu", "zeta"}));
}

TEST_F(BindingMapTest, BeforeConstraint) {
  add("alpha");
  add("zeta", {"alpha"});
  EXPECT_EQ(order(), (std::vector<std::string>{"zeta", "alpha"}));
}

TEST_F(BindingMapTest, AfterConstraint) {
  add("alpha", {}, {"zeta"});
  add("zeta");
  EXPECT_EQ(order(), (std::vector<std::string>{"zeta", "alpha"}));
}

TEST_F(BindingMapTest, ConstraintsOnlyMoveWhatTheyNeed) {
  add("a");
  add("b");
  add("c", {"a"});
  add("d");
  const auto ordered = order();
  ASSERT_EQ(ordered.size(), 4U);
  EXPECT_EQ(ordered, (std::vector<std::string>{"b", "c", "a", "d"}));
}

TEST_F(BindingMapTest, ChainOfConstraints) {
  add("a", {}, {"b"});
  add("b", {}, {"c"});
  add("c");
  EXPECT_EQ(order(), (std::vector<std::string>{"c", "b", "a"}));
}

TEST_F(BindingMapTest, UnknownSiblingIsIgnored) {
  add("b", {"ghost"}, {"phantom"});
  add("a");
  EXPECT_EQ(order(), (std::vector<std::string>{"a", "b"}));
}

TEST_F(BindingMapTest, CycleIsReported) {
  add("a", {"b"});
  add("b", {"a"});
  try {
    (void)map.ordered();
    FAIL() << "expected a cycle error";
  } catch (const RouteDefinitionError& ex) {
    EXPECT_EQ(ex.kind(), RouteDefinitionError::Kind::CyclicBindingOrder);
  }
}

TEST_F(BindingMapTest, OrderIsRecomputedAfterInsertion) {
  add("b");
  EXPECT_EQ(order(), (std::vector<std::string>{"b"}));
  add("a");
  EXPECT_EQ(order(), (std::vector<std::string>{"a", "b"}));
}

TEST_F(BindingMapTest, SameIdentIsMerged) {
  add("a");
  add("b");
  add("a", {"b"});
  EXPECT_EQ(map.size(), 2U);
  EXPECT_EQ(order(), (std::vector<std::string>{"a", "b"}));
}

}  // namespace pathforge
