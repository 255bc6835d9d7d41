#pragma once

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>

#include "result.hpp"

namespace muxpool {

    /// @brief Parts of an absolute request URL.
    struct UrlComponents {
        bool https{false};
        std::string host;
        std::uint16_t port{0};
        /// Request target: path plus optional query. Never empty.
        std::string target;
    };

    namespace url_utils {

        /// @brief Check if a URL is an absolute HTTP or HTTPS URL.
        inline bool is_absolute_url_with_protocol(std::string_view s) {
            return (s.rfind("https://", 0) == 0) ||
                   (s.rfind("http://", 0) == 0);
        }

        /// @brief Default port for a scheme.
        inline constexpr std::uint16_t default_port(bool https) noexcept {
            return https ? 443 : 80;
        }

        /// @brief Parse a decimal TCP port in [1, 65535].
        inline bool parse_port(std::string_view s, std::uint16_t& out) {
            if (s.empty() || s.size() > 5) return false;
            unsigned value = 0;
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(),
                                             value);
            if (ec != std::errc{} || ptr != s.data() + s.size()) return false;
            if (value == 0 || value > 65535) return false;
            out = static_cast<std::uint16_t>(value);
            return true;
        }

    }  // namespace url_utils

    /// @brief Parse an absolute URL into its components.
    /// @param url The URL string to parse.
    /// @return UrlComponents on success, InvalidUrl otherwise.
    inline Result<UrlComponents> parse_url(std::string_view url) {
        auto make_err = [](std::string msg) {
            return Result<UrlComponents>::err(Error::Code::InvalidUrl,
                                              std::move(msg));
        };

        std::string_view s(url);

        bool https = false;
        if (s.rfind("https://", 0) == 0) {
            https = true;
            s.remove_prefix(std::string_view("https://").size());
        } else if (s.rfind("http://", 0) == 0) {
            s.remove_prefix(std::string_view("http://").size());
        } else {
            return make_err("URL must start with http:// or https://");
        }

        // Split host[:port] from path (a query may follow the authority
        // directly, as in "http://host?x=1")
        std::string_view hostport = s;
        std::string_view path = "/";
        if (auto cut = s.find_first_of("/?#"); cut != std::string_view::npos) {
            hostport = s.substr(0, cut);
            path = s.substr(cut);
        }
        if (auto frag = path.find('#'); frag != std::string_view::npos) {
            path = path.substr(0, frag);
        }

        if (hostport.empty()) {
            return make_err("URL missing host");
        }
        if (hostport.find('@') != std::string_view::npos) {
            return make_err("URL userinfo is not supported");
        }

        std::string_view host = hostport;
        std::string_view port_str;

        if (hostport.front() == '[') {
            // IPv6 literal: [addr] or [addr]:port
            auto close = hostport.find(']');
            if (close == std::string_view::npos) {
                return make_err("URL has unterminated IPv6 literal");
            }
            host = hostport.substr(1, close - 1);
            auto rest = hostport.substr(close + 1);
            if (!rest.empty()) {
                if (rest.front() != ':') return make_err("URL has bad port");
                port_str = rest.substr(1);
                if (port_str.empty()) return make_err("URL has empty port");
            }
        } else if (auto colon = hostport.rfind(':');
                   colon != std::string_view::npos) {
            host = hostport.substr(0, colon);
            port_str = hostport.substr(colon + 1);
            if (port_str.empty()) {
                return make_err("URL has empty port");
            }
        }

        if (host.empty()) {
            return make_err("URL has empty host");
        }

        UrlComponents out;
        out.https = https;
        out.host = std::string(host);
        if (port_str.empty()) {
            out.port = url_utils::default_port(https);
        } else if (!url_utils::parse_port(port_str, out.port)) {
            return make_err("URL has invalid port: " + std::string(port_str));
        }
        out.target = path.empty() ? "/" : std::string(path);
        if (out.target.front() == '?') out.target.insert(out.target.begin(), '/');
        return Result<UrlComponents>::ok(std::move(out));
    }

}  // namespace muxpool
