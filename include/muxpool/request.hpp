#pragma once
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include "muxpool/cancellation.hpp"
#include "muxpool/http_method.hpp"
#include "muxpool/metrics.hpp"
#include "muxpool/url.hpp"

namespace muxpool {

    /**
     * @brief An HTTP request as handed to the pooling layer. Header
     * validation and serialization belong to the Transport.
     */
    struct Request {
        HttpMethod method{HttpMethod::Get};
        std::string url;
        std::unordered_map<std::string, std::string> headers;
        std::optional<std::string> body;
    };

    /// @brief A request whose URL has been parsed.
    struct PreparedRequest {
        UrlComponents url;
        const Request* request{nullptr};
        /// Fires when this exchange alone should stop.
        CancellationToken cancellation;
    };

    /**
     * @brief Everything RequestExecutor::execute needs for one exchange.
     */
    struct ExecuteRequest {
        Request request;
        /// Receives the client's name exactly once. Optional.
        std::shared_ptr<MetricsSink> metrics;
        /// Cancels a pending acquire or an in-flight exchange. Optional.
        CancellationToken cancellation;
    };

}  // namespace muxpool
