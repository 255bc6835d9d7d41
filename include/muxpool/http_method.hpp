#pragma once
#include <boost/beast/http/verb.hpp>

namespace muxpool {

    /** @brief Request methods the pooling layer forwards to a Transport. */
    enum class HttpMethod {
        Get,
        Post,
        Put,
        Patch,
        Delete,
        Head,
        Options,
    };

    inline constexpr boost::beast::http::verb to_boost_http_method(
        HttpMethod method) {
        namespace http = boost::beast::http;
        switch (method) {
            case HttpMethod::Get:
                return http::verb::get;
            case HttpMethod::Post:
                return http::verb::post;
            case HttpMethod::Put:
                return http::verb::put;
            case HttpMethod::Patch:
                return http::verb::patch;
            case HttpMethod::Delete:
                return http::verb::delete_;
            case HttpMethod::Head:
                return http::verb::head;
            case HttpMethod::Options:
                return http::verb::options;
        }
        return http::verb::unknown;
    }

    inline constexpr const char* to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::Get:
                return "GET";
            case HttpMethod::Post:
                return "POST";
            case HttpMethod::Put:
                return "PUT";
            case HttpMethod::Patch:
                return "PATCH";
            case HttpMethod::Delete:
                return "DELETE";
            case HttpMethod::Head:
                return "HEAD";
            case HttpMethod::Options:
                return "OPTIONS";
        }
        return "UNKNOWN";
    }

    /// @brief False for values outside the enumeration.
    inline constexpr bool is_known(HttpMethod method) {
        return to_boost_http_method(method) !=
               boost::beast::http::verb::unknown;
    }

    /// @brief A HEAD response carries headers only, even when they announce
    /// a Content-Length.
    inline constexpr bool expects_response_body(HttpMethod method) {
        return method != HttpMethod::Head;
    }

}  // namespace muxpool
