#include <gtest/gtest.h>

#include <any>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "pathforge/pathforge.hpp"

using namespace pathforge;

namespace {

// Minimal stand-in for what a transport layer would inject for each request.
struct Request {
  std::string path;
  std::string verb;
};

struct Response {
  std::string status;
  std::string allow;
  std::string body;
};

Response Invoke(Controller& controller, std::string_view path, std::string_view verb) {
  Injector injector;
  injector.setDeferred("request", [path, verb]() -> Value { return Request{std::string(path), std::string(verb)}; });

  DispatchResult result = controller.handle(path, verb, injector);
  switch (result.kind) {
    case DispatchResult::Kind::Handled:
      return {"200 OK", "", std::any_cast<std::string>(result.value)};
    case DispatchResult::Kind::Options:
      return {"204 No Content", result.allowHeader(), ""};
    case DispatchResult::Kind::NotImplemented:
      return {"501 Not Implemented", "", ""};
    case DispatchResult::Kind::NotFound:
      break;
  }
  return {"404 Not Found", "", ""};
}

std::string SubId(const CallArgs& args) { return args.getOr<std::string>("sub_id", "None"); }

// Declares (self, request) followed by the given parameters.
std::vector<Param> HandlerParams(std::vector<Param> extra = {}) {
  std::vector<Param> params{Param::Positional("self"), Param::Positional("request")};
  params.insert(params.end(), extra.begin(), extra.end());
  return params;
}

class BookController : public RoutedController<BookController> {
 public:
  static inline const FunctionPtr kIndex =
      MakeFunction("book_index", HandlerParams({Param::Defaulted("sub_id")}), [](const CallArgs& args) -> Value {
        return "book::index(sub_id=" + SubId(args) + ")";
      });

  static inline const FunctionPtr kCreate =
      MakeFunction("book_create", HandlerParams({Param::Defaulted("sub_id")}), [](const CallArgs& args) -> Value {
        return "book::create(sub_id=" + SubId(args) + ")";
      });

  static inline const FunctionPtr kGet = MakeFunction(
      "book_get", HandlerParams({Param::Positional("book_id"), Param::Defaulted("sub_id")}),
      [](const CallArgs& args) -> Value {
        return "book::get(book_id=" + args.get<std::string>("book_id") + ", sub_id=" + SubId(args) + ")";
      });

  static inline const FunctionPtr kUpdate = MakeFunction(
      "book_update", HandlerParams({Param::Positional("book_id"), Param::Defaulted("sub_id")}),
      [](const CallArgs& args) -> Value {
        return "book::update(book_id=" + args.get<std::string>("book_id") + ", sub_id=" + SubId(args) + ")";
      });

  static inline const FunctionPtr kDelete = MakeFunction(
      "book_delete", HandlerParams({Param::Positional("book_id"), Param::Defaulted("sub_id")}),
      [](const CallArgs& args) -> Value {
        return "book::delete(book_id=" + args.get<std::string>("book_id") + ", sub_id=" + SubId(args) + ")";
      });

  static void DefineRoutes(RouteTable& table) {
    const auto& root = table.root();
    root->route({"get"}, kIndex);
    root->route({"post"}, kCreate);

    auto bookId = root->addBinding("book_id");
    bookId->route({"get"}, kGet);
    bookId->route({"put"}, kUpdate);
    bookId->route({"delete"}, kDelete);
  }
};

class SubscriberController : public RoutedController<SubscriberController> {
 public:
  static inline const FunctionPtr kIndex = MakeFunction(
      "sub_index", HandlerParams(), [](const CallArgs&) -> Value { return std::string("sub::index()"); });

  static inline const FunctionPtr kCreate = MakeFunction(
      "sub_create", HandlerParams(), [](const CallArgs&) -> Value { return std::string("sub::create()"); });

  static inline const FunctionPtr kGet =
      MakeFunction("sub_get", HandlerParams({Param::Positional("sub_id")}), [](const CallArgs& args) -> Value {
        return "sub::get(sub_id=" + args.get<std::string>("sub_id") + ")";
      });

  static inline const FunctionPtr kUpdate =
      MakeFunction("sub_update", HandlerParams({Param::Positional("sub_id")}), [](const CallArgs& args) -> Value {
        return "sub::update(sub_id=" + args.get<std::string>("sub_id") + ")";
      });

  static inline const FunctionPtr kDelete =
      MakeFunction("sub_delete", HandlerParams({Param::Positional("sub_id")}), [](const CallArgs& args) -> Value {
        return "sub::delete(sub_id=" + args.get<std::string>("sub_id") + ")";
      });

  static const DelegationPtr& Books() {
    static const DelegationPtr kBooks = Mount<BookController>({}, "books");
    return kBooks;
  }

  static void DefineRoutes(RouteTable& table) {
    const auto& root = table.root();
    root->route({"get"}, kIndex);
    root->route({"post"}, kCreate);

    auto subId = root->addBinding("sub_id");
    subId->route({"get"}, kGet);
    subId->route({"put"}, kUpdate);
    subId->route({"delete"}, kDelete);
    subId->addPath("books")->mount(Books());
  }

  BookController& books() { return static_cast<BookController&>(Books()->get(*this)); }
};

constexpr std::string_view kBase = "http://example.com";
constexpr std::string_view kScriptBase = "http://example.com/api";

}  // namespace

class SubscribersTest : public ::testing::Test {
 protected:
  std::unique_ptr<SubscriberController> controller = MakeController<SubscriberController>();
};

TEST_F(SubscribersTest, SubscriberIndex) {
  auto res = Invoke(*controller, "/", "GET");
  EXPECT_EQ(res.status, "200 OK");
  EXPECT_EQ(res.body, "sub::index()");
}

TEST_F(SubscribersTest, SubscriberCreate) {
  auto res = Invoke(*controller, "/", "POST");
  EXPECT_EQ(res.status, "200 OK");
  EXPECT_EQ(res.body, "sub::create()");
}

TEST_F(SubscribersTest, SubscriberIndexUrlFor) {
  EXPECT_EQ(UrlFor(*controller, *SubscriberController::kIndex, {}, kBase), "http://example.com/");
  EXPECT_EQ(UrlFor(*controller, *SubscriberController::kCreate, {}, kScriptBase), "http://example.com/api/");
}

TEST_F(SubscribersTest, SubscriberOptions) {
  auto res = Invoke(*controller, "/", "OPTIONS");
  EXPECT_EQ(res.status, "204 No Content");
  EXPECT_EQ(res.allow, "GET,HEAD,OPTIONS,POST");
  EXPECT_EQ(res.body, "");
}

TEST_F(SubscribersTest, SubscriberOther) {
  EXPECT_EQ(Invoke(*controller, "/", "OTHER").status, "501 Not Implemented");
}

TEST_F(SubscribersTest, SubscriberById) {
  auto res = Invoke(*controller, "/1234", "GET");
  EXPECT_EQ(res.status, "200 OK");
  EXPECT_EQ(res.body, "sub::get(sub_id=1234)");

  EXPECT_EQ(Invoke(*controller, "/1234", "PUT").body, "sub::update(sub_id=1234)");
  EXPECT_EQ(Invoke(*controller, "/1234", "DELETE").body, "sub::delete(sub_id=1234)");
  EXPECT_EQ(Invoke(*controller, "/1234", "HEAD").body, "sub::get(sub_id=1234)");
}

TEST_F(SubscribersTest, SubscriberByIdUrlFor) {
  const ValueMap values{{"sub_id", std::string("1234")}};
  for (const auto& handler :
       {SubscriberController::kGet, SubscriberController::kUpdate, SubscriberController::kDelete}) {
    EXPECT_EQ(UrlFor(*controller, *handler, values, kBase), "http://example.com/1234");
    EXPECT_EQ(UrlFor(*controller, *handler, values, kScriptBase), "http://example.com/api/1234");
  }
}

TEST_F(SubscribersTest, SubscriberByIdOptions) {
  auto res = Invoke(*controller, "/1234", "OPTIONS");
  EXPECT_EQ(res.status, "204 No Content");
  EXPECT_EQ(res.allow, "DELETE,GET,HEAD,OPTIONS,PUT");
}

TEST_F(SubscribersTest, SubscriberByIdOther) {
  EXPECT_EQ(Invoke(*controller, "/1234", "OTHER").status, "501 Not Implemented");
}

TEST_F(SubscribersTest, BookIndex) {
  auto res = Invoke(*controller, "/1234/books", "GET");
  EXPECT_EQ(res.status, "200 OK");
  EXPECT_EQ(res.body, "book::index(sub_id=1234)");
  EXPECT_EQ(Invoke(*controller, "/1234/books", "POST").body, "book::create(sub_id=1234)");
}

TEST_F(SubscribersTest, BookIndexUrlFor) {
  const ValueMap values{{"sub_id", std::string("1234")}};
  EXPECT_EQ(UrlFor(controller->books(), *BookController::kIndex, values, kBase), "http://example.com/1234/books");
  EXPECT_EQ(UrlFor(controller->books(), *BookController::kCreate, values, kScriptBase),
            "http://example.com/api/1234/books");
}

TEST_F(SubscribersTest, BookOptions) {
  auto res = Invoke(*controller, "/1234/books", "OPTIONS");
  EXPECT_EQ(res.status, "204 No Content");
  EXPECT_EQ(res.allow, "GET,HEAD,OPTIONS,POST");
  EXPECT_EQ(Invoke(*controller, "/1234/books", "OTHER").status, "501 Not Implemented");
}

TEST_F(SubscribersTest, BookById) {
  auto res = Invoke(*controller, "/1234/books/5678", "GET");
  EXPECT_EQ(res.status, "200 OK");
  EXPECT_EQ(res.body, "book::get(book_id=5678, sub_id=1234)");
  EXPECT_EQ(Invoke(*controller, "/1234/books/5678", "PUT").body, "book::update(book_id=5678, sub_id=1234)");
  EXPECT_EQ(Invoke(*controller, "/1234/books/5678", "DELETE").body, "book::delete(book_id=5678, sub_id=1234)");
}

TEST_F(SubscribersTest, BookByIdUrlFor) {
  const ValueMap values{{"sub_id", std::string("1234")}, {"book_id", std::string("5678")}};
  for (const auto& handler : {BookController::kGet, BookController::kUpdate, BookController::kDelete}) {
    EXPECT_EQ(UrlFor(controller->books(), *handler, values, kBase), "http://example.com/1234/books/5678");
    EXPECT_EQ(UrlFor(controller->books(), *handler, values, kScriptBase),
              "http://example.com/api/1234/books/5678");
  }
}

TEST_F(SubscribersTest, BookByIdOptions) {
  auto res = Invoke(*controller, "/1234/books/5678", "OPTIONS");
  EXPECT_EQ(res.status, "204 No Content");
  EXPECT_EQ(res.allow, "DELETE,GET,HEAD,OPTIONS,PUT");
  EXPECT_EQ(Invoke(*controller, "/1234/books/5678", "OTHER").status, "501 Not Implemented");
}

TEST_F(SubscribersTest, UnknownPaths) {
  EXPECT_EQ(Invoke(*controller, "/1234/authors", "GET").status, "404 Not Found");
  EXPECT_EQ(Invoke(*controller, "/1234/books/5678/pages", "GET").status, "404 Not Found");
}

TEST_F(SubscribersTest, BookUnderDirectlyMountedController) {
  auto books = MakeController<BookController>();
  auto res = Invoke(*books, "/5678", "GET");
  EXPECT_EQ(res.body, "book::get(book_id=5678, sub_id=None)");
  EXPECT_EQ(UrlFor(*books, *BookController::kGet, {{"book_id", std::string("5678")}}), "/5678");
}
