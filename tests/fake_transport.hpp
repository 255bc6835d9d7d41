// tests/fake_transport.hpp
//
// Scripted Transport: channels are plain objects, exchanges answer from
// memory. Counters let tests see what the pool asked for.

#pragma once

#include <atomic>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "muxpool/transport/transport.hpp"

namespace muxpool_test {

    class FakeChannel : public muxpool::Channel {
       public:
        using Channel::Channel;

        bool is_open() const noexcept override {
            return open.load(std::memory_order_acquire);
        }

        std::atomic<bool> open{true};
        std::atomic<bool> aborted{false};
    };

    class FakeTransport : public muxpool::Transport {
       public:
        enum class Behavior {
            Respond,  ///< 200 with "ok:<target>"
            Fail,     ///< ConnectionFailed
            Throw,    ///< std::runtime_error from the exchange
            Hang      ///< Wait for channel close or request cancellation
        };

        bool supports(muxpool::Protocol) const noexcept override {
            return true;
        }

        muxpool::Result<std::shared_ptr<muxpool::Channel>> open(
            const muxpool::OriginKey& origin, const muxpool::ProtocolLimits&,
            boost::asio::any_io_executor) override {
            using R = muxpool::Result<std::shared_ptr<muxpool::Channel>>;
            if (fail_open.load()) {
                return R::err(muxpool::Error::Code::ConnectionFailed,
                              "scripted open failure");
            }
            opened.fetch_add(1);
            return R::ok(std::make_shared<FakeChannel>(origin));
        }

        boost::asio::awaitable<muxpool::Result<muxpool::Response>>
        perform_exchange(std::shared_ptr<muxpool::Channel> channel,
                         const muxpool::PreparedRequest& request) override {
            using R = muxpool::Result<muxpool::Response>;
            exchanges.fetch_add(1);

            const std::string target = request.url.target;
            auto ch = std::static_pointer_cast<FakeChannel>(channel);
            auto ex = co_await boost::asio::this_coro::executor;

            struct InFlight {
                explicit InFlight(std::atomic<int>& c) : count(c) {
                    count.fetch_add(1);
                }
                ~InFlight() { count.fetch_sub(1); }
                std::atomic<int>& count;
            } guard(in_flight);

            switch (behavior.load()) {
                case Behavior::Fail:
                    co_return R::err(muxpool::Error::Code::ConnectionFailed,
                                     "scripted failure");
                case Behavior::Throw:
                    throw std::runtime_error("scripted throw");
                case Behavior::Hang: {
                    const auto token = request.cancellation;
                    boost::asio::steady_timer t(ex);
                    while (ch->is_open() && !token.is_cancelled()) {
                        t.expires_after(std::chrono::milliseconds(2));
                        co_await t.async_wait(boost::asio::use_awaitable);
                    }
                    if (ch->is_open()) {
                        stream_resets.fetch_add(1);
                        co_return R::err(muxpool::Error::Code::Cancelled,
                                         "stream reset");
                    }
                    co_return R::err(muxpool::Error::Code::Cancelled,
                                     "channel aborted");
                }
                case Behavior::Respond:
                    break;
            }

            if (delay.count() > 0) {
                boost::asio::steady_timer t(ex);
                t.expires_after(delay);
                co_await t.async_wait(boost::asio::use_awaitable);
            }

            muxpool::Response res;
            res.status_code = 200;
            res.body = "ok:" + target;
            co_return R::ok(std::move(res));
        }

        void close(muxpool::Channel& channel) noexcept override {
            closed.fetch_add(1);
            static_cast<FakeChannel&>(channel).open.store(false);
        }

        void abort(muxpool::Channel& channel) noexcept override {
            aborted.fetch_add(1);
            auto& ch = static_cast<FakeChannel&>(channel);
            ch.aborted.store(true);
            ch.open.store(false);
        }

        std::atomic<Behavior> behavior{Behavior::Respond};
        std::atomic<bool> fail_open{false};
        std::chrono::milliseconds delay{0};

        std::atomic<int> opened{0};
        std::atomic<int> closed{0};
        std::atomic<int> aborted{0};
        std::atomic<int> exchanges{0};
        std::atomic<int> in_flight{0};
        std::atomic<int> stream_resets{0};
    };

}  // namespace muxpool_test
