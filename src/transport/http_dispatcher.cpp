#include "boshpp/transport/http_dispatcher.hpp"
#include "boshpp/log/logger.hpp"

#include <exception>
#include <system_error>
#include <thread>

namespace boshpp {

HttpDispatcher::HttpDispatcher(
    std::shared_ptr<IHttpClient> client,
    std::string path,
    std::string content_type
)
    : client_(std::move(client))
    , path_(std::move(path))
    , content_type_(std::move(content_type))
    , in_flight_(std::make_shared<std::atomic<std::size_t>>(0))
{}

void HttpDispatcher::dispatch(std::string body, Completion on_complete) {
    get_logger().trace_fmt("POST {} ({} bytes)", path_, body.size());

    in_flight_->fetch_add(1);

    auto worker = [client = client_,
                   path = path_,
                   content_type = content_type_,
                   in_flight = in_flight_,
                   body = std::move(body),
                   on_complete]() mutable {
        HttpClientResult<HttpClientResponse> result =
            tl::unexpected(HttpClientError::unknown("Request not performed"));
        try {
            result = client->post(path, body, content_type);
        } catch (const std::exception& e) {
            get_logger().error_fmt("HTTP client threw: {}", e.what());
            result = tl::unexpected(HttpClientError::unknown(e.what()));
        }
        in_flight->fetch_sub(1);
        on_complete(std::move(result));
    };

    try {
        std::thread(std::move(worker)).detach();
    } catch (const std::system_error& e) {
        get_logger().error_fmt("Could not start HTTP worker: {}", e.what());
        in_flight_->fetch_sub(1);
        on_complete(tl::unexpected(HttpClientError::unknown(
            std::string("Could not start HTTP worker: ") + e.what())));
    }
}

}  // namespace boshpp
