#include "muxpool/transport/beast_transport.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <atomic>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/system/system_error.hpp>
#include <cctype>
#include <exception>
#include <stdexcept>
#include <variant>

#include "muxpool/logging.hpp"
#include "muxpool/transport/beast_message.hpp"

namespace muxpool {

    namespace beast = boost::beast;
    namespace http = beast::http;
    using tcp = boost::asio::ip::tcp;

    namespace {

        bool set_sni(beast::ssl_stream<beast::tcp_stream>& stream,
                     const std::string& host, boost::system::error_code& ec) {
            if (!SSL_set_tlsext_host_name(stream.native_handle(),
                                          host.c_str())) {
                ec = boost::system::error_code(
                    static_cast<int>(::ERR_get_error()),
                    boost::asio::error::get_ssl_category());
                return false;
            }
            return true;
        }

        void init_tls_on_ssl_context(boost::asio::ssl::context& ssl_context,
                                     bool verify) {
            if (!verify) {
                ssl_context.set_verify_mode(boost::asio::ssl::verify_none);
                return;
            }
            try {
                ssl_context.set_default_verify_paths();
            } catch (const boost::system::system_error& e) {
                throw std::runtime_error(
                    std::string("Failed to set default verify paths: ") +
                    e.what());
            }
            ssl_context.set_verify_mode(boost::asio::ssl::verify_peer);
        }

        std::string lower(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            return s;
        }

        Error from_ec(const boost::system::error_code& ec, Error::Code code,
                      const std::string& what) {
            if (ec == beast::error::timeout) {
                return Error{Error::Code::Timeout, what + " timed out"};
            }
            return Error{code, what + " failed: " + ec.message()};
        }

    }  // namespace

    /// @brief Where a channel's TCP connection goes.
    struct Route {
        std::string host;
        std::uint16_t port{0};
        bool via_proxy{false};
        bool tunnel{false};  ///< CONNECT through the proxy
    };

    /**
     * @brief One HTTP/1.1 connection, connected lazily.
     *
     * The stream is only touched on the strand. close() and abort() only
     * close the socket; the stream object itself is reset by the exchange
     * that observes the failure.
     */
    class BeastChannel final : public Channel,
                               public std::enable_shared_from_this<BeastChannel> {
       public:
        using HttpStream = beast::tcp_stream;
        using HttpsStream = beast::ssl_stream<beast::tcp_stream>;
        using Stream = std::variant<std::monostate,  // "not connected yet"
                                    HttpStream, HttpsStream>;

        struct Outcome {
            std::optional<Response> response;
            std::optional<Error> error;
        };

        BeastChannel(OriginKey origin, Route route,
                     boost::asio::any_io_executor ex)
            : Channel(std::move(origin)),
              route_(std::move(route)),
              strand_(boost::asio::make_strand(std::move(ex))) {}

        bool is_open() const noexcept override {
            return !closed_.load(std::memory_order_acquire);
        }

        const Route& route() const noexcept { return route_; }

        boost::asio::strand<boost::asio::any_io_executor> const& strand()
            const noexcept {
            return strand_;
        }

        /// @brief Mark closed and shut the socket down on the strand.
        void request_close(bool aborted) noexcept {
            if (aborted) aborted_.store(true, std::memory_order_release);
            if (closed_.exchange(true, std::memory_order_acq_rel)) return;
            try {
                boost::asio::post(strand_,
                                  [self = shared_from_this()] {
                                      self->shutdown_socket();
                                  });
            } catch (const std::exception& e) {
                logger()->warn("failed to schedule close of channel to {}: {}",
                               origin().to_string(), e.what());
            }
        }

        static boost::asio::awaitable<Outcome> exchange(
            std::shared_ptr<BeastTransport> transport,
            std::shared_ptr<BeastChannel> ch,
            http::request<http::string_body> req, bool head);

       private:
        /// @brief Best-effort socket close (strand only). No TLS shutdown.
        void shutdown_socket() noexcept {
            boost::system::error_code ec;
            if (auto* s = std::get_if<HttpStream>(&stream_)) {
                s->socket().shutdown(tcp::socket::shutdown_both, ec);
                s->socket().close(ec);
            } else if (auto* s = std::get_if<HttpsStream>(&stream_)) {
                beast::get_lowest_layer(*s).socket().shutdown(
                    tcp::socket::shutdown_both, ec);
                beast::get_lowest_layer(*s).socket().close(ec);
            }
        }

        /// @brief Drop the stream after a failure (strand only, no pending
        /// operation).
        void reset_stream() noexcept {
            shutdown_socket();
            stream_.emplace<std::monostate>();
            closed_.store(true, std::memory_order_release);
        }

        bool connected() const noexcept {
            return !std::holds_alternative<std::monostate>(stream_);
        }

        Error closed_error() const {
            if (aborted_.load(std::memory_order_acquire)) {
                return Error{Error::Code::Cancelled, "exchange aborted"};
            }
            return Error{Error::Code::TransportFailure,
                         "channel to " + origin().to_string() + " is closed"};
        }

        boost::asio::awaitable<std::optional<Error>> connect(
            BeastTransport& transport);

        template <typename S>
        boost::asio::awaitable<std::optional<Error>> write_read(
            S& stream, beast::tcp_stream& lowest,
            const BeastTransportOptions& opts,
            http::request<http::string_body>& req,
            http::response_parser<http::string_body>& parser);

        Route route_;
        boost::asio::strand<boost::asio::any_io_executor> strand_;
        Stream stream_;
        beast::flat_buffer buffer_;
        std::atomic<bool> closed_{false};
        std::atomic<bool> aborted_{false};
    };

    boost::asio::awaitable<std::optional<Error>> BeastChannel::connect(
        BeastTransport& transport) {
        const auto& opts = transport.options_;
        boost::system::error_code ec;

        tcp::resolver resolver(strand_);
        auto results = co_await resolver.async_resolve(
            route_.host, std::to_string(route_.port),
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            co_return Error{Error::Code::ConnectionFailed,
                            "Resolve failed for " + route_.host + ": " +
                                ec.message()};
        }
        if (!is_open()) co_return closed_error();

        auto& plain = stream_.emplace<HttpStream>(strand_);
        plain.expires_after(opts.connect_timeout);
        co_await plain.async_connect(
            results, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            co_return from_ec(ec, Error::Code::ConnectionFailed,
                              "Connect to " + route_.host);
        }
        if (!is_open()) co_return closed_error();

        if (opts.tcp_keep_alive) {
            plain.socket().set_option(boost::asio::socket_base::keep_alive(true),
                                      ec);
            if (ec) {
                logger()->debug("could not enable TCP keep-alive: {}",
                                ec.message());
                ec.clear();
            }
        }

        if (route_.tunnel) {
            const std::string authority =
                origin().host() + ":" + std::to_string(origin().port());
            http::request<http::empty_body> connect_req{http::verb::connect,
                                                        authority, 11};
            connect_req.set(http::field::host, authority);
            connect_req.set(http::field::user_agent, opts.user_agent);

            co_await http::async_write(
                plain, connect_req,
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec) {
                co_return from_ec(ec, Error::Code::ConnectionFailed,
                                  "Proxy CONNECT");
            }

            http::response_parser<http::empty_body> connect_res;
            buffer_.consume(buffer_.size());
            co_await http::async_read_header(
                plain, buffer_, connect_res,
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec) {
                co_return from_ec(ec, Error::Code::ConnectionFailed,
                                  "Proxy CONNECT");
            }
            if (connect_res.get().result_int() != 200) {
                co_return Error{
                    Error::Code::ConnectionFailed,
                    "Proxy CONNECT to " + authority + " failed with status " +
                        std::to_string(connect_res.get().result_int())};
            }
            buffer_.consume(buffer_.size());
        }

        if (!origin().https()) {
            plain.expires_never();
            co_return std::nullopt;
        }

        // Wrap the connected TCP stream in TLS; nothing is pending on it.
        HttpStream moved = std::move(plain);
        auto& tls = stream_.emplace<HttpsStream>(std::move(moved),
                                                 transport.ssl_ctx_);

        if (!set_sni(tls, origin().host(), ec)) {
            co_return Error{Error::Code::TlsHandshakeFailed,
                            "Failed to set SNI: " + ec.message()};
        }
        if (opts.verify_tls) {
            tls.set_verify_callback(
                boost::asio::ssl::host_name_verification(origin().host()));
        }

        beast::get_lowest_layer(tls).expires_after(
            opts.tls_negotiation_timeout);
        co_await tls.async_handshake(
            boost::asio::ssl::stream_base::client,
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            co_return from_ec(ec, Error::Code::TlsHandshakeFailed,
                              "TLS handshake with " + origin().host());
        }
        beast::get_lowest_layer(tls).expires_never();
        co_return std::nullopt;
    }

    template <typename S>
    boost::asio::awaitable<std::optional<Error>> BeastChannel::write_read(
        S& stream, beast::tcp_stream& lowest,
        const BeastTransportOptions& opts,
        http::request<http::string_body>& req,
        http::response_parser<http::string_body>& parser) {
        boost::system::error_code ec;

        lowest.expires_after(opts.write_timeout);
        co_await http::async_write(
            stream, req,
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) co_return from_ec(ec, Error::Code::SendFailed, "Write");

        buffer_.consume(buffer_.size());  // clear but keep capacity
        lowest.expires_after(opts.read_timeout);
        co_await http::async_read(
            stream, buffer_, parser,
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) co_return from_ec(ec, Error::Code::ReceiveFailed, "Read");

        lowest.expires_never();
        co_return std::nullopt;
    }

    boost::asio::awaitable<BeastChannel::Outcome> BeastChannel::exchange(
        std::shared_ptr<BeastTransport> transport,
        std::shared_ptr<BeastChannel> ch, http::request<http::string_body> req,
        bool head) {
        Outcome out;
        const auto& opts = transport->options_;

        if (!ch->is_open()) {
            out.error = ch->closed_error();
            co_return out;
        }

        std::optional<Error> err;
        if (!ch->connected()) err = co_await ch->connect(*transport);

        http::response_parser<http::string_body> parser;
        parser.body_limit(opts.max_body_bytes);
        if (head) parser.skip(true);

        if (!err && !ch->is_open()) err = ch->closed_error();
        if (!err) {
            if (auto* s = std::get_if<HttpStream>(&ch->stream_)) {
                err = co_await ch->write_read(*s, *s, opts, req, parser);
            } else if (auto* s = std::get_if<HttpsStream>(&ch->stream_)) {
                err = co_await ch->write_read(*s, beast::get_lowest_layer(*s),
                                              opts, req, parser);
            } else {
                err = ch->closed_error();
            }
        }

        if (err) {
            // An abort shows up as a socket error; report it as such.
            if (ch->aborted_.load(std::memory_order_acquire)) {
                err = ch->closed_error();
            }
            ch->reset_stream();
            out.error = std::move(err);
            co_return out;
        }

        Response res = parse_beast_response(parser.release());
        if (!res.keep_alive) ch->reset_stream();
        out.response = std::move(res);
        co_return out;
    }

    // -------------------------
    // BeastTransport
    // -------------------------

    BeastTransport::BeastTransport(BeastTransportOptions options)
        : options_(std::move(options)),
          ssl_ctx_(boost::asio::ssl::context::tls_client) {
        init_tls_on_ssl_context(ssl_ctx_, options_.verify_tls);
    }

    bool BeastTransport::uses_proxy(const std::string& host) const {
        if (!options_.proxy || !options_.proxy->enabled()) return false;
        const auto h = lower(host);
        for (const auto& np : options_.proxy->non_proxy_hosts) {
            if (lower(np) == h) return false;
        }
        return true;
    }

    Result<std::shared_ptr<Channel>> BeastTransport::open(
        const OriginKey& origin, const ProtocolLimits& limits,
        boost::asio::any_io_executor ex) {
        using R = Result<std::shared_ptr<Channel>>;

        if (!supports(limits.protocol)) {
            return R::err(Error::Code::TransportFailure,
                          std::string(to_string(limits.protocol)) +
                              " is not supported by this transport");
        }
        if (origin.host().empty()) {
            return R::err(Error::Code::InvalidUrl, "origin has no host");
        }

        Route route{origin.host(), origin.port(), false, false};
        if (uses_proxy(origin.host())) {
            if (options_.proxy->scheme != "http") {
                return R::err(Error::Code::InvalidConfiguration,
                              "TLS connections to the proxy are not "
                              "supported");
            }
            route.host = options_.proxy->host;
            route.port = options_.proxy->port;
            route.via_proxy = true;
            route.tunnel = origin.https();
        }

        return R::ok(std::make_shared<BeastChannel>(origin, std::move(route),
                                                    std::move(ex)));
    }

    boost::asio::awaitable<Result<Response>> BeastTransport::perform_exchange(
        std::shared_ptr<Channel> channel, const PreparedRequest& request) {
        auto ch = std::dynamic_pointer_cast<BeastChannel>(channel);
        if (!ch) {
            co_return Result<Response>::err(
                Error::Code::TransportFailure,
                "channel was not opened by this transport");
        }
        if (!request.request) {
            co_return Result<Response>::err(Error::Code::InvalidUrl,
                                            "prepared request has no request");
        }

        const auto& route = ch->route();
        std::string target = request.url.target;
        if (route.via_proxy && !route.tunnel) {
            target = ch->origin().to_string() + request.url.target;
        }
        auto beast_req = prepare_beast_request(
            *request.request, request.url, target, options_.user_agent);
        const bool head = !expects_response_body(request.request->method);

        auto self = shared_from_this();
        auto on_strand = [self, ch, req = std::move(beast_req),
                          head]() mutable
            -> boost::asio::awaitable<BeastChannel::Outcome> {
            co_return co_await BeastChannel::exchange(self, ch, std::move(req),
                                                      head);
        };
        auto out = co_await boost::asio::co_spawn(
            ch->strand(), std::move(on_strand), boost::asio::use_awaitable);

        if (out.response) {
            co_return Result<Response>::ok(std::move(*out.response));
        }
        if (out.error) co_return Result<Response>::err(std::move(*out.error));
        co_return Result<Response>::err(Error::Code::Unknown,
                                        "exchange finished without an outcome");
    }

    void BeastTransport::close(Channel& channel) noexcept {
        if (auto* ch = dynamic_cast<BeastChannel*>(&channel)) {
            ch->request_close(false);
        }
    }

    void BeastTransport::abort(Channel& channel) noexcept {
        if (auto* ch = dynamic_cast<BeastChannel*>(&channel)) {
            ch->request_close(true);
        }
    }

}  // namespace muxpool
