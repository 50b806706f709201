#include "pathforge/route-table.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "pathforge/binding.hpp"
#include "pathforge/controller.hpp"
#include "pathforge/delegation.hpp"
#include "pathforge/function.hpp"
#include "pathforge/method.hpp"
#include "pathforge/path.hpp"
#include "pathforge/route-definition-error.hpp"
#include "pathforge/router-config.hpp"

namespace pathforge {

namespace {

FunctionPtr Handler(std::string name) {
  return MakeFunction(std::move(name), {Param::Positional("self")}, [](const CallArgs&) -> Value { return {}; });
}

DelegationPtr UnusedDelegation(std::string name) {
  return std::make_shared<Delegation>(std::move(name), [](const ValueMap&) { return nullptr; });
}

}  // namespace

class RouteTableTest : public ::testing::Test {
 protected:
  RouteTable table;
  FunctionPtr index = Handler("index");
  FunctionPtr show = Handler("show");
};

TEST_F(RouteTableTest, SealIndexesHandlers) {
  table.root()->route({"GET"}, index);
  auto item = table.root()->addPath("items")->addBinding("item_id");
  item->route({"GET", "PUT"}, show);

  EXPECT_FALSE(table.sealed());
  table.seal();
  EXPECT_TRUE(table.sealed());

  EXPECT_EQ(table.handlerElement(*index), table.root());
  EXPECT_EQ(table.handlerElement(*show), item);
  EXPECT_EQ(table.handler("show"), show);
  EXPECT_EQ(table.handler("index"), index);
  EXPECT_EQ(table.handler("missing"), nullptr);
  EXPECT_EQ(table.handlerElement(*Handler("other")), nullptr);
}

TEST_F(RouteTableTest, SealCollectsDelegations) {
  auto first = UnusedDelegation("first");
  auto second = UnusedDelegation("second");
  table.root()->addPath("a")->mount(first);
  table.root()->addPath("b")->mount(second, {"GET", "POST"});
  table.seal();

  ASSERT_EQ(table.delegations().size(), 2U);
  EXPECT_EQ(table.delegations()[0], first);
  EXPECT_EQ(table.delegations()[1], second);
}

TEST_F(RouteTableTest, SealedTableCannotChange) {
  table.seal();
  EXPECT_THROW(table.seal(), std::logic_error);
  EXPECT_THROW(table.add(MakePath("late")), std::logic_error);
  RouteTable other;
  EXPECT_THROW(table.extend(other), std::logic_error);
}

TEST_F(RouteTableTest, InvalidConfigIsReportedOnSeal) {
  RouteTable invalid(RouterConfig{}.withPathInfoKey(""));
  EXPECT_THROW(invalid.seal(), std::invalid_argument);
  EXPECT_FALSE(invalid.sealed());
}

TEST_F(RouteTableTest, CyclicBindingOrderIsReportedOnSeal) {
  table.root()->addBinding("a", {"b"});
  table.root()->addBinding("b", {"a"});
  try {
    table.seal();
    FAIL() << "expected a cyclic binding order error";
  } catch (const RouteDefinitionError& ex) {
    EXPECT_EQ(ex.kind(), RouteDefinitionError::Kind::CyclicBindingOrder);
  }
}

TEST_F(RouteTableTest, AddFreeStandingElement) {
  auto binding = MakeBinding();
  binding->route({"GET"}, show);
  table.add(binding, "item_id");
  table.seal();

  EXPECT_EQ(table.root()->children().bindings.find(std::string_view("item_id")), binding);
  EXPECT_EQ(table.handlerElement(*show), binding);
}

TEST_F(RouteTableTest, ExtendCopiesBaseRoutes) {
  RouteTable base;
  auto baseItems = base.root()->addPath("items");
  baseItems->route({"GET"}, index);

  table.root()->addPath("items")->route({"POST"}, show);
  table.root()->addPath("extra");
  table.extend(base);

  auto items = table.root()->children().paths.find(std::string_view("items"));
  ASSERT_NE(items, nullptr);
  EXPECT_NE(items, baseItems);
  EXPECT_EQ(items->children().methods.size(), 2U);
  EXPECT_TRUE(table.root()->children().paths.contains(std::string_view("extra")));

  // base is left untouched
  EXPECT_EQ(baseItems->children().methods.size(), 1U);
  EXPECT_FALSE(base.root()->children().paths.contains(std::string_view("extra")));

  table.seal();
  EXPECT_EQ(table.handlerElement(*index), items);
}

TEST_F(RouteTableTest, ExtendDoesNotShareDelegations) {
  RouteTable base;
  auto delegation = UnusedDelegation("sub");
  base.root()->addPath("sub")->mount(delegation);
  table.extend(base);
  table.seal();

  ASSERT_EQ(table.delegations().size(), 1U);
  EXPECT_NE(table.delegations().front(), delegation);
  EXPECT_EQ(table.delegations().front()->targetName(), "sub");
}

TEST_F(RouteTableTest, ExtendConflictingHandlers) {
  RouteTable base;
  base.root()->route({"GET"}, index);
  table.root()->route({"GET"}, show);
  EXPECT_THROW(table.extend(base), RouteDefinitionError);
}

}  // namespace pathforge
