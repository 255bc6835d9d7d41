#pragma once

#include <string_view>

namespace muxpool {

    /// @brief Metric names reported per request.
    namespace metric_names {
        inline constexpr std::string_view kHttpClientName = "HttpClientName";
    }  // namespace metric_names

    /**
     * @brief Per-request metric collector supplied by the caller.
     *
     * The request executor calls record() with the client's name exactly once
     * per executed request. Implementations must be thread-safe: the call may
     * happen on a worker thread.
     */
    class MetricsSink {
       public:
        virtual ~MetricsSink() = default;

        virtual void record(std::string_view name, std::string_view value) = 0;
    };

}  // namespace muxpool
