#pragma once

#include <string>
#include <unordered_map>

namespace muxpool {

    /**
     * @brief Represents an HTTP response.
     */
    struct Response {
        /** @brief HTTP status code (e.g., 200, 404). */
        int status_code{0};
        /** @brief HTTP response headers, last duplicate wins. */
        std::unordered_map<std::string, std::string> headers;
        /** @brief HTTP response body as a string. */
        std::string body;
        /** @brief Whether the peer allows reusing the connection. */
        bool keep_alive{true};
    };

}  // namespace muxpool
