#include <iostream>
#include <memory>
#include <utility>

#include <conduit/conduit.hpp>

namespace
{
struct CacheHit
{
    bool hit = false;
};
}  // namespace

// Answers /cached paths from memory and forwards everything else.
int main()
{
    conduit::core::Logger::init();

    auto cache = conduit::middleware::fromFn(
        [](conduit::http::Request t_request, conduit::context::Extensions& t_extensions,
           const conduit::middleware::Next& t_next) -> conduit::common::ResultSender<conduit::http::Response> {
            if (t_request.url.path.starts_with("/cached")) {
                t_extensions.insert(CacheHit{true});
                return conduit::common::ResultSender<conduit::http::Response>{
                    stdexec::just(conduit::http::Response::ok("from cache"))};
            }

            return t_next.run(std::move(t_request), t_extensions);
        });

    auto client = conduit::client::ClientBuilder{std::make_shared<conduit::transport::TcpTransport>()}
                      .with(conduit::middlewares::LoggingLayer{})
                      .with(std::move(cache))
                      .build();

    auto result = stdexec::sync_wait(client.get("http://127.0.0.1:8080/cached/item").send());
    if (result) {
        auto [response] = std::move(*result);
        std::cout << response.status_code << " " << response.body << "\n";
    }

    conduit::core::Logger::shutdown();

    return 0;
}
