// Example 01: Basic Session
//
// Open a BOSH session, announce presence, print what the server sends,
// then close the stream.

#include <boshpp/boshpp.hpp>
#include <boshpp/log/spdlog_logger.hpp>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>

using namespace boshpp;
using namespace std::chrono_literals;

int main() {
    std::cout << "=== Basic BOSH Session Example ===\n\n";

    const char* url_env = std::getenv("BOSH_URL");
    const char* domain_env = std::getenv("BOSH_DOMAIN");

    if (!url_env) {
        std::cerr << "Please set BOSH_URL environment variable\n";
        std::cerr << "Example: export BOSH_URL=\"http://localhost:5280/http-bind\"\n";
        return 1;
    }
    const std::string domain = domain_env ? domain_env : "localhost";

    set_logger(make_spdlog_console_logger(LogLevel::Info));

    // 1. Configure the endpoint
    auto config = BoshConfig::from_url(url_env);
    if (!config) {
        std::cerr << "Bad endpoint: " << config.error().message << "\n";
        return 1;
    }
    config->with_request_timeout(75s);

    // 2. Connect; events arrive in the mailbox
    auto owner = std::make_shared<OwnerMailbox>();
    auto transport = BoshTransport::connect(*config, owner);
    if (!transport) {
        std::cerr << "Failed to start: " << transport.error().message << "\n";
        return 1;
    }

    // 3. Open the stream and say hello
    transport->send(stanza::stream_start(domain));
    transport->send(stanza::presence());

    // 4. Read for a few seconds
    while (auto event = owner->receive_with_timeout(5s)) {
        if (auto* received = std::get_if<StanzaReceived>(&*event)) {
            std::cout << "<< " << to_string(received->stanza) << "\n";
            if (is_stream_end(received->stanza)) {
                break;
            }
        } else {
            const auto& error = std::get<SessionFailed>(*event).error;
            std::cerr << "Session failed: " << error.message << "\n";
            return 1;
        }
    }

    std::cout << "\nsid: " << transport->get_sid().value_or("(none)")
              << ", next rid: " << transport->get_rid() << "\n";

    // 5. Close
    const auto stopped = transport->stop();
    std::cout << "Stop: " << to_string(stopped) << "\n";

    set_logger(nullptr);
    return 0;
}
