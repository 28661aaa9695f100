#pragma once

#include "boshpp/transport/http_client.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace boshpp {

// ─────────────────────────────────────────────────────────────────────────────
// HttpDispatcher
// ─────────────────────────────────────────────────────────────────────────────
// Fires one POST per body on its own worker thread and hands the outcome to
// a completion callback on that worker thread. Nothing is queued: two
// dispatches in a row are two concurrent requests, which is exactly the
// BOSH "hold" behaviour of one long-poll plus one outbound request.
//
// The completion is called exactly once per dispatch, with an
// HttpClientError if the worker could not be started or the client threw.
// Callers own the job of getting back onto their own executor.
//
// Workers keep the client alive; a dispatcher may be destroyed while
// requests are still in flight.

class HttpDispatcher {
public:
    using Completion = std::function<void(HttpClientResult<HttpClientResponse>)>;

    HttpDispatcher(
        std::shared_ptr<IHttpClient> client,
        std::string path,
        std::string content_type = "text/xml; charset=utf-8"
    );

    void dispatch(std::string body, Completion on_complete);

    /// Requests started but not yet completed.
    [[nodiscard]] std::size_t in_flight() const noexcept {
        return in_flight_->load();
    }

    [[nodiscard]] const std::string& path() const noexcept {
        return path_;
    }

private:
    std::shared_ptr<IHttpClient> client_;
    std::string path_;
    std::string content_type_;
    std::shared_ptr<std::atomic<std::size_t>> in_flight_;
};

}  // namespace boshpp
