// ─────────────────────────────────────────────────────────────────────────────
// boshpp-cli - BOSH Endpoint Testing Tool
// ─────────────────────────────────────────────────────────────────────────────
// Opens a BOSH session against a connection manager, sends a few stanzas and
// prints every stream item the server pushes back.
//
// Usage:
//   # Open a stream and watch what comes back for 10 seconds
//   boshpp-cli --url "http://localhost:5280/http-bind" --to example.com --wait 10
//
//   # Send stanzas once the stream is up
//   boshpp-cli -u "https://xmpp.example.com/http-bind" --to example.com \
//              --stanza "<presence/>" \
//              --stanza "<message to='bob@example.com' type='chat'><body>hi</body></message>"
//
//   # Endpoint settings from a JSON file
//   boshpp-cli --config bosh.json --to example.com -v

#include <cxxopts.hpp>

#include "boshpp/boshpp.hpp"
#include "boshpp/log/spdlog_logger.hpp"
#include "boshpp/xml/xml_stream_parser.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace boshpp;
using namespace std::chrono_literals;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* bold    = "\033[1m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";
    const char* yellow  = "\033[33m";
    const char* cyan    = "\033[36m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Output
// ═══════════════════════════════════════════════════════════════════════════

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_outgoing(const StreamItem& item) {
    std::cout << color::c(color::yellow) << ">> " << color::c(color::reset)
              << to_string(item) << "\n";
}

void print_incoming(const StreamItem& item) {
    std::cout << color::c(color::green) << "<< " << color::c(color::reset)
              << to_string(item) << "\n";
}

void print_failure(const BoshError& error) {
    std::cerr << color::c(color::red) << "!! " << to_string(error.code) << color::c(color::reset)
              << ": " << error.message;
    if (error.http_status.has_value()) {
        std::cerr << " (HTTP " << *error.http_status << ")";
    }
    std::cerr << "\n";
}

// ═══════════════════════════════════════════════════════════════════════════
// Helper Functions
// ═══════════════════════════════════════════════════════════════════════════

// Parse header string "Name: Value" into pair
std::pair<std::string, std::string> parse_header(const std::string& header) {
    auto colon_pos = header.find(':');
    if (colon_pos == std::string::npos) {
        return {header, ""};
    }
    std::string name = header.substr(0, colon_pos);
    std::string value = header.substr(colon_pos + 1);
    auto start = value.find_first_not_of(" \t");
    if (start != std::string::npos) {
        value = value.substr(start);
    }
    return {name, value};
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

BoshResult<BoshConfig> build_config(const cxxopts::ParseResult& result) {
    BoshConfig config;

    if (result.count("config")) {
        const auto path = result["config"].as<std::string>();
        auto text = read_file(path);
        if (!text) {
            return tl::unexpected(BoshError::invalid_config("Cannot read config file: " + path));
        }
        auto loaded = BoshConfig::from_json_string(*text);
        if (!loaded) {
            return loaded;
        }
        config = std::move(*loaded);
    } else if (result.count("url")) {
        auto parsed = BoshConfig::from_url(result["url"].as<std::string>());
        if (!parsed) {
            return parsed;
        }
        config = std::move(*parsed);
    }

    // Individual flags override whatever the URL or file said
    if (result.count("host")) {
        config.with_host(result["host"].as<std::string>());
    }
    if (result.count("port")) {
        config.with_port(result["port"].as<std::uint16_t>());
    }
    if (result.count("path")) {
        config.with_path(result["path"].as<std::string>());
    }
    if (result.count("secure")) {
        config.with_secure(true);
    }
    if (result.count("insecure")) {
        config.verify_ssl = false;
    }
    if (result.count("rid")) {
        config.with_initial_rid(result["rid"].as<std::uint64_t>());
    }
    for (const auto& header : result["header"].as<std::vector<std::string>>()) {
        if (!header.empty()) {
            auto [name, value] = parse_header(header);
            config.with_header(name, value);
        }
    }
    return config;
}

// ═══════════════════════════════════════════════════════════════════════════
// Session Driver
// ═══════════════════════════════════════════════════════════════════════════

// Print events until the deadline passes or the session ends.
// Returns false if the session failed.
bool pump_events(OwnerMailbox& owner, std::chrono::milliseconds duration, bool& stream_ended) {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (!stream_ended) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        auto event = owner.receive_with_timeout(std::min(remaining, std::chrono::milliseconds{250}));
        if (!event) {
            continue;
        }
        if (auto* received = std::get_if<StanzaReceived>(&*event)) {
            print_incoming(received->stanza);
            stream_ended = is_stream_end(received->stanza);
        } else {
            print_failure(std::get<SessionFailed>(*event).error);
            return false;
        }
    }
    return true;
}

int run_session(
    const BoshConfig& config,
    const std::string& to,
    const std::vector<XmlElement>& stanzas,
    std::chrono::milliseconds wait
) {
    auto owner = std::make_shared<OwnerMailbox>();

    std::cout << color::c(color::dim) << "Connecting to " << config.endpoint().url()
              << color::c(color::reset) << "\n";

    auto transport = BoshTransport::connect(config, owner);
    if (!transport) {
        print_error("Failed to start session: " + transport.error().message);
        return 1;
    }

    bool stream_ended = false;

    const StreamItem start = stanza::stream_start(to);
    print_outgoing(start);
    transport->send(start);

    // Wait for the server's stream header before sending anything else
    if (!pump_events(*owner, 2s, stream_ended)) {
        return 1;
    }
    if (transport->get_sid()) {
        std::cout << color::c(color::dim) << "Session id: " << *transport->get_sid()
                  << color::c(color::reset) << "\n";
    }

    for (const auto& element : stanzas) {
        if (stream_ended) {
            break;
        }
        print_outgoing(element);
        transport->send(element);
    }

    if (!pump_events(*owner, wait, stream_ended)) {
        return 1;
    }

    if (!stream_ended) {
        const StreamItem end = stanza::stream_end();
        print_outgoing(end);
        transport->send(end);
        if (!pump_events(*owner, 2s, stream_ended)) {
            return 1;
        }
    }

    const auto stopped = transport->stop();
    std::cout << color::c(color::dim) << "Stopped (" << to_string(stopped)
              << ") at rid " << transport->get_rid() << color::c(color::reset) << "\n";
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("boshpp-cli", "BOSH Endpoint Testing Tool");

    options.add_options()
        // Endpoint
        ("u,url", "BOSH endpoint URL", cxxopts::value<std::string>())
        ("c,config", "JSON file with endpoint settings", cxxopts::value<std::string>())
        ("host", "Connection manager host", cxxopts::value<std::string>())
        ("port", "Connection manager port", cxxopts::value<std::uint16_t>())
        ("path", "Request path", cxxopts::value<std::string>())
        ("secure", "Use https")
        ("insecure", "Skip TLS certificate verification")
        ("H,header", "HTTP header (can be repeated, format: 'Name: Value')",
            cxxopts::value<std::vector<std::string>>()->default_value(""))
        ("rid", "Initial request id", cxxopts::value<std::uint64_t>())

        // Stream
        ("t,to", "Domain to open the stream to", cxxopts::value<std::string>()->default_value("localhost"))
        ("s,stanza", "Stanza XML to send after the stream opens (can be repeated)",
            cxxopts::value<std::vector<std::string>>()->default_value(""))
        ("w,wait", "Seconds to keep listening after sending", cxxopts::value<int>()->default_value("5"))

        // Output
        ("no-color", "Disable colored output")
        ("v,verbose", "Enable debug logging")
        ("trace", "Log every request and reply body")
        ("log-file", "Also write the log to this file", cxxopts::value<std::string>())
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Examples:\n\n";
            std::cout << "    boshpp-cli --url 'http://localhost:5280/http-bind' --to example.com\n";
            std::cout << "    boshpp-cli -u 'https://xmpp.example.com/http-bind' -t example.com -s '<presence/>'\n";
            std::cout << "    boshpp-cli --config bosh.json --to example.com --wait 30 --trace\n";
            return 0;
        }

        color::enabled = !result.count("no-color");

        LogLevel level = LogLevel::Warn;
        if (result.count("trace")) {
            level = LogLevel::Trace;
        } else if (result.count("verbose")) {
            level = LogLevel::Debug;
        }
        if (result.count("log-file")) {
            set_logger(make_spdlog_console_file_logger(result["log-file"].as<std::string>(), level));
        } else {
            set_logger(make_spdlog_console_logger(level));
        }

        auto config = build_config(result);
        if (!config) {
            print_error(config.error().message);
            return 1;
        }

        // Parse stanzas up front so a typo does not leave a half-open session
        std::vector<XmlElement> stanzas;
        XmlStreamParser parser;
        for (const auto& text : result["stanza"].as<std::vector<std::string>>()) {
            if (text.empty()) {
                continue;
            }
            auto element = parser.parse(text);
            if (!element) {
                print_error("Invalid stanza '" + text + "': " + element.error().message);
                return 1;
            }
            stanzas.push_back(std::move(*element));
        }

        const int wait_seconds = result["wait"].as<int>();
        if (wait_seconds < 0) {
            print_error("--wait must not be negative");
            return 1;
        }

        const int exit_code = run_session(
            *config,
            result["to"].as<std::string>(),
            stanzas,
            std::chrono::seconds{wait_seconds}
        );

        set_logger(nullptr);
        return exit_code;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    }
}
