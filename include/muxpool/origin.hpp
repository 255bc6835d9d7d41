#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "muxpool/url.hpp"

namespace muxpool {

    /**
     * @brief (scheme, host, port) triple identifying a remote endpoint.
     *
     * The only criterion used to pick a ConnectionPool; path and query never
     * take part. Construct through make() or from_url() so scheme and host
     * are lower-cased and the port is filled in.
     */
    class OriginKey {
       public:
        OriginKey() = default;

        /// @brief Build a normalized key. A zero port means "scheme default".
        static OriginKey make(std::string_view scheme, std::string_view host,
                              std::uint16_t port = 0) {
            OriginKey k;
            k.scheme_ = lower(scheme);
            k.host_ = lower(host);
            k.port_ = port != 0 ? port
                                : url_utils::default_port(k.scheme_ == "https");
            return k;
        }

        /// @brief Origin of a parsed URL.
        static OriginKey from_url(const UrlComponents& u) {
            return make(u.https ? "https" : "http", u.host, u.port);
        }

        /// @brief Parse a URL and return its origin.
        static Result<OriginKey> parse(std::string_view url) {
            auto u = parse_url(url);
            if (u.has_error()) return Result<OriginKey>::err(u.error());
            return Result<OriginKey>::ok(from_url(u.value()));
        }

        const std::string& scheme() const noexcept { return scheme_; }
        const std::string& host() const noexcept { return host_; }
        std::uint16_t port() const noexcept { return port_; }
        bool https() const noexcept { return scheme_ == "https"; }

        /// @brief "scheme://host:port", IPv6 hosts bracketed.
        std::string to_string() const {
            std::string out = scheme_ + "://";
            if (host_.find(':') != std::string::npos) {
                out += '[' + host_ + ']';
            } else {
                out += host_;
            }
            out += ':' + std::to_string(port_);
            return out;
        }

        friend bool operator==(OriginKey const& a, OriginKey const& b) noexcept {
            return a.port_ == b.port_ && a.scheme_ == b.scheme_ &&
                   a.host_ == b.host_;
        }

        friend bool operator!=(OriginKey const& a, OriginKey const& b) noexcept {
            return !(a == b);
        }

       private:
        static std::string lower(std::string_view s) {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            return out;
        }

        std::string scheme_;
        std::string host_;
        std::uint16_t port_{0};
    };

}  // namespace muxpool

namespace std {
    template <>
    struct hash<muxpool::OriginKey> {
        size_t operator()(muxpool::OriginKey const& o) const noexcept {
            // FNV-1a over scheme, host and port.
            size_t h = 1469598103934665603ull;
            auto mix = [&](std::string_view s) {
                for (unsigned char c : s) {
                    h ^= c;
                    h *= 1099511628211ull;
                }
            };
            mix(o.scheme());
            h ^= static_cast<size_t>('|');
            h *= 1099511628211ull;
            mix(o.host());
            h ^= static_cast<size_t>(o.port());
            h *= 1099511628211ull;
            return h;
        }
    };
}  // namespace std
