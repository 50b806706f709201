#include <any>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pathforge/log.hpp"
#include "pathforge/pathforge.hpp"

using namespace pathforge;

namespace {

std::string SubId(const CallArgs& args) { return args.getOr<std::string>("sub_id", "None"); }

class BookController : public RoutedController<BookController> {
 public:
  static void DefineRoutes(RouteTable& table) {
    const auto& root = table.root();
    root->route({"GET"}, MakeFunction("book_index", {Param::Positional("self"), Param::Defaulted("sub_id")},
                                      [](const CallArgs& args) -> Value { return "books of " + SubId(args); }));

    auto bookId = root->addBinding("book_id");
    bookId->route({"GET"},
                  MakeFunction("book_get",
                               {Param::Positional("self"), Param::Positional("book_id"), Param::Defaulted("sub_id")},
                               [](const CallArgs& args) -> Value {
                                 return "book " + args.get<std::string>("book_id") + " of " + SubId(args);
                               }));
  }
};

class SubscriberController : public RoutedController<SubscriberController> {
 public:
  static void DefineRoutes(RouteTable& table) {
    const auto& root = table.root();
    root->route({"GET"}, MakeFunction("sub_index", {Param::Positional("self")},
                                      [](const CallArgs&) -> Value { return std::string("all subscribers"); }));

    auto subId = root->addBinding("sub_id");
    subId->route({"GET", "PUT"},
                 MakeFunction("sub_get", {Param::Positional("self"), Param::Positional("sub_id")},
                              [](const CallArgs& args) -> Value {
                                return "subscriber " + args.get<std::string>("sub_id");
                              }));
    subId->addPath("books")->mount(Mount<BookController>({}, "books"));
  }
};

void Print(std::string_view verb, std::string_view path, const DispatchResult& result) {
  std::cout << verb << ' ' << path << " -> ";
  switch (result.kind) {
    case DispatchResult::Kind::Handled:
      std::cout << std::any_cast<std::string>(result.value);
      break;
    case DispatchResult::Kind::NotFound:
      std::cout << "not found";
      break;
    case DispatchResult::Kind::NotImplemented:
      std::cout << "not implemented (" << result.verb << ")";
      break;
    case DispatchResult::Kind::Options:
      std::cout << "allow: " << result.allowHeader();
      break;
  }
  std::cout << '\n';
}

}  // namespace

// Usage: subscribers [VERB PATH]...
// Without arguments, dispatches a few sample requests.
int main(int argc, char** argv) {
  if (argc % 2 == 0) {
    std::cerr << "Expected pairs of VERB PATH arguments\n";
    return EXIT_FAILURE;
  }
  std::vector<std::pair<std::string, std::string>> requests;
  for (int argPos = 1; argPos + 1 < argc; argPos += 2) {
    requests.emplace_back(argv[argPos], argv[argPos + 1]);
  }
  if (requests.empty()) {
    requests = {{"GET", "/"},          {"GET", "/1234"},          {"OPTIONS", "/1234"},
                {"GET", "/1234/books"}, {"GET", "/1234/books/5678"}, {"DELETE", "/1234"},
                {"GET", "/1234/nowhere"}};
  }

  log::set_level(log::level::debug);

  try {
    auto controller = MakeController<SubscriberController>();
    for (const auto& [verb, path] : requests) {
      Injector injector;
      Print(verb, path, controller->handle(path, verb, injector));
    }
    Controller& books = controller->routes().delegations().front()->get(*controller);
    const ValueMap values{{"sub_id", std::string("1234")}, {"book_id", 5678}};
    std::cout << "book_get url: " << UrlFor(books, "book_get", values, "http://example.com") << '\n';
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
