#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include <conduit/conduit.hpp>

int main(int argc, char** argv)
{
    conduit::core::Logger::init();

    const std::string url = argc > 1 ? argv[1] : "http://127.0.0.1:8080/health";

    auto engine = std::make_shared<conduit::transport::TcpTransport>();

    auto client = conduit::client::ClientBuilder{engine}
                      .with(conduit::middlewares::LoggingLayer{})
                      .with(conduit::middlewares::RetryLayer{3})
                      .withInit(conduit::middlewares::DefaultHeaders::bearer("example-token"))
                      .withInit(conduit::middlewares::RequestIdInitializer{})
                      .build();

    int status = 0;

    try {
        auto result = stdexec::sync_wait(client.get(url).header("Accept", "text/plain").send());
        if (result) {
            auto [response] = std::move(*result);
            std::cout << response.status_code << " " << response.status_text << "\n" << response.body << "\n";
        }
    } catch (const conduit::error::Error& e) {
        std::cerr << e.what() << "\n";
        status = 1;
    }

    conduit::core::Logger::shutdown();

    return status;
}
