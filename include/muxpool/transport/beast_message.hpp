#pragma once

#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <string>
#include <unordered_map>

#include "muxpool/http_method.hpp"
#include "muxpool/request.hpp"
#include "muxpool/response.hpp"
#include "muxpool/url.hpp"

namespace muxpool {

    /// @brief Apply Request headers into a Boost.Beast header container.
    /// @note Uses `set()`, so duplicate keys overwrite previous values.
    inline void apply_request_headers(
        const std::unordered_map<std::string, std::string>& in,
        boost::beast::http::fields& out) {
        for (const auto& [k, v] : in) {
            out.set(k, v);
        }
    }

    /// @brief Host header value; the port is included when not the default
    /// for the scheme.
    inline std::string host_header(const UrlComponents& url) {
        std::string host = url.host.find(':') != std::string::npos
                               ? "[" + url.host + "]"
                               : url.host;
        if (url.port != url_utils::default_port(url.https)) {
            host += ":" + std::to_string(url.port);
        }
        return host;
    }

    /**
     * @brief Build the HTTP/1.1 message for a request.
     * @param target Request target; origin-form normally, absolute-form when
     * sent to a forward proxy.
     */
    inline boost::beast::http::request<boost::beast::http::string_body>
    prepare_beast_request(const Request& req, const UrlComponents& url,
                          const std::string& target,
                          const std::string& user_agent,
                          const bool keep_alive = true) {
        namespace http = boost::beast::http;
        http::request<http::string_body> beast_req;
        beast_req.version(11);
        beast_req.method(to_boost_http_method(req.method));
        beast_req.target(target);
        beast_req.set(http::field::host, host_header(url));
        beast_req.set(http::field::user_agent, user_agent);
        beast_req.keep_alive(keep_alive);
        apply_request_headers(req.headers, beast_req.base());
        if (req.body.has_value()) {
            beast_req.body() = *req.body;
            beast_req.prepare_payload();
        }
        return beast_req;
    }

    /// @brief Convert a Boost.Beast HTTP response to a muxpool::Response.
    /// @note If duplicate header keys occur, the last one wins.
    inline Response parse_beast_response(
        boost::beast::http::response<boost::beast::http::string_body>&&
            beast_res) {
        Response out;
        out.status_code = static_cast<int>(beast_res.result_int());
        out.keep_alive = beast_res.keep_alive();

        for (const auto& field : beast_res.base()) {
            out.headers[std::string(field.name_string())] =
                std::string(field.value());
        }

        out.body = std::move(beast_res.body());
        return out;
    }

}  // namespace muxpool
