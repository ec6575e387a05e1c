#include <cstdlib>
#include <functional>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <waypoint/waypoint.hpp>

using namespace waypoint;

namespace {

struct Response {
  int status;
  std::string body;
};

using Handler = std::function<Response(const PathParams&)>;

}  // namespace

// Resolves each path given on the command line against a small set of routes.
// Example: dispatch /posts /posts/42 /posts/latest /users/7/posts/3 /nope
int main(int argc, char** argv) {
  log::set_level(log::level::debug);

  Router<Handler> router;

  try {
    router.add("/posts", [](const PathParams&) { return Response{200, "all posts"}; });
    router.add("/posts/latest", [](const PathParams&) { return Response{200, "latest post"}; });
    router.add("/posts/:post_id",
               [](const PathParams& params) { return Response{200, "post " + std::string(params.at("post_id"))}; });

    Router<Handler> userRoutes;
    userRoutes.add("/", [](const PathParams& params) {
      return Response{200, "user " + std::string(params.at("user_id"))};
    });
    userRoutes.add("/posts/:post_id", [](const PathParams& params) {
      return Response{200, "post " + std::string(params.at("post_id")) + " of user " +
                               std::string(params.at("user_id"))};
    });
    router.merge("/users/:user_id", std::move(userRoutes));
  } catch (const RouterError& ex) {
    std::cerr << "Invalid route configuration (" << RouterErrcName(ex.code()) << "): " << ex.what() << '\n';
    return EXIT_FAILURE;
  }

  router.forEachRoute([](std::string_view pattern, const Handler&) { log::info("Route {}", pattern); });

  for (int argPos = 1; argPos < argc; ++argPos) {
    const std::string_view path(argv[argPos]);
    const auto res = router.route(path);
    const Response response = res ? (*res.pEndpoint)(res.params) : Response{404, "not found"};
    std::cout << path << " -> " << response.status << ' ' << response.body << '\n';
  }

  return EXIT_SUCCESS;
}
