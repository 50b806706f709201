#include "pathforge/root.hpp"

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

namespace pathforge {

namespace {

FunctionPtr Handler(std::string name) {
  return MakeFunction(std::move(name), {Param::Positional("self")}, [](const CallArgs&) -> Value { return {}; });
}

}  // namespace

class RootTest : public ::testing::Test {
 protected:
  std::shared_ptr<Root> root = MakeRoot();
  FunctionPtr handler = Handler("get");
};

TEST_F(RootTest, AddElementWithIdent) {
  auto binding = MakeBinding();
  binding->addMethod("GET", handler);

  root->addElement(binding, "sub_id");

  EXPECT_EQ(binding->ident(), "sub_id");
  EXPECT_EQ(binding->parent(), root);
  EXPECT_EQ(root->children().bindings.find(std::string_view("sub_id")), binding);
}

TEST_F(RootTest, AddElementNamesFirstAnonymousAncestor) {
  auto top = MakePath();
  auto leaf = top->addPath("leaf");

  root->addElement(leaf, "top");

  EXPECT_EQ(top->ident(), "top");
  EXPECT_EQ(top->parent(), root);
  EXPECT_EQ(root->children().paths.find(std::string_view("top")), top);
  EXPECT_EQ(top->children().paths.find(std::string_view("leaf")), leaf);
}

TEST_F(RootTest, AddElementWithoutIdentFails) {
  auto path = MakePath();
  try {
    root->addElement(path);
    FAIL() << "expected a missing ident error";
  } catch (const RouteDefinitionError& ex) {
    EXPECT_EQ(ex.kind(), RouteDefinitionError::Kind::MissingIdent);
  }
  EXPECT_TRUE(root->children().paths.empty());
}

TEST_F(RootTest, AddMethodElement) {
  auto method = std::make_shared<Method>(std::nullopt, handler);
  root->addElement(method);
  EXPECT_EQ(root->children().methods.find(std::optional<std::string>()), method);
}

TEST_F(RootTest, AddElementOfSameTreeIsNoop) {
  auto path = root->addPath("a");
  root->addElement(path);
  EXPECT_EQ(root->children().paths.size(), 1U);
  EXPECT_EQ(path->leader(), nullptr);
}

TEST_F(RootTest, AddElementMergesWithExisting) {
  auto existing = root->addPath("a");
  existing->addMethod("GET", handler);
  auto other = MakePath("a");
  auto child = other->addPath("b");

  root->addElement(other);

  EXPECT_EQ(other->leader(), existing);
  EXPECT_EQ(existing->children().paths.find(std::string_view("b")), child);
}

TEST_F(RootTest, CloneIsIndependent) {
  auto books = root->addPath("books");
  auto bookId = books->addBinding("book_id", {"other"});
  bookId->addMethod("GET", handler);

  auto copy = root->clone();
  ASSERT_NE(copy, root);

  auto booksCopy = copy->children().paths.find(std::string_view("books"));
  ASSERT_NE(booksCopy, nullptr);
  EXPECT_NE(booksCopy, books);
  EXPECT_EQ(booksCopy->parent(), copy);

  auto bookIdCopy = booksCopy->children().bindings.find(std::string_view("book_id"));
  ASSERT_NE(bookIdCopy, nullptr);
  EXPECT_EQ(bookIdCopy->before(), (NameSet{"other"}));
  auto methodCopy = bookIdCopy->children().methods.find(std::optional<std::string>("GET"));
  ASSERT_NE(methodCopy, nullptr);
  EXPECT_EQ(methodCopy->handler(), handler);

  booksCopy->addPath("only_in_copy");
  EXPECT_FALSE(books->children().paths.contains(std::string_view("only_in_copy")));
}

TEST_F(RootTest, CloneCopiesDelegations) {
  auto delegation = std::make_shared<Delegation>("target", [](const ValueMap&) { return nullptr; });
  auto mounted = root->addPath("sub");
  mounted->mount(delegation);

  auto copy = root->clone();
  auto mountedCopy = copy->children().paths.find(std::string_view("sub"));
  ASSERT_NE(mountedCopy, nullptr);
  ASSERT_NE(mountedCopy->delegation(), nullptr);
  EXPECT_NE(mountedCopy->delegation(), delegation);
  EXPECT_EQ(mountedCopy->delegation()->targetName(), "target");
  EXPECT_EQ(mountedCopy->delegation()->element(), mountedCopy);
  EXPECT_EQ(delegation->element(), mounted);
}

}  // namespace pathforge
