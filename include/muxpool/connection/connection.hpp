#pragma once

#include <chrono>
#include <cstdint>
#include <memory>

#include "muxpool/connection/connection_pool_types.hpp"
#include "muxpool/transport/transport.hpp"

namespace muxpool {

    /**
     * @brief A pooled connection: one Channel plus the capacity accounting
     * the pool needs.
     *
     * Capacity is protocol specific (busy flag vs. stream counter) and is
     * exposed through one interface so the pool never branches on protocol.
     *
     * SAFETY: not thread-safe. Only touched under the owning pool's mutex.
     */
    class PooledConnection {
       public:
        using clock_type = std::chrono::steady_clock;

        PooledConnection(std::uint64_t id, std::shared_ptr<Channel> channel,
                         clock_type::time_point now)
            : id_(id),
              channel_(std::move(channel)),
              created_(now),
              last_used_(now) {}

        virtual ~PooledConnection() = default;

        PooledConnection(const PooledConnection&) = delete;
        PooledConnection& operator=(const PooledConnection&) = delete;

        virtual Protocol protocol() const noexcept = 0;

        /// @brief Max request slots this connection offers at once.
        virtual std::uint64_t max_streams() const noexcept = 0;

        /// @brief Slots currently leased out.
        virtual std::uint64_t active_streams() const noexcept = 0;

        /// @brief Take one slot. False if none is left.
        virtual bool try_reserve() noexcept = 0;

        /// @brief Give one slot back.
        virtual void release_one() noexcept = 0;

        std::uint64_t remaining_capacity() const noexcept {
            return max_streams() - active_streams();
        }

        bool is_idle() const noexcept { return active_streams() == 0; }

        /// @brief Healthy, open and with at least one free slot.
        bool is_leasable() const noexcept {
            return health_ == ConnectionHealth::Healthy && is_open() &&
                   remaining_capacity() > 0;
        }

        bool is_open() const noexcept { return channel_ && channel_->is_open(); }

        ConnectionHealth health() const noexcept { return health_; }

        void mark_degraded() noexcept {
            if (health_ == ConnectionHealth::Healthy)
                health_ = ConnectionHealth::Degraded;
        }

        void mark_closing() noexcept { health_ = ConnectionHealth::Closing; }

        std::uint64_t id() const noexcept { return id_; }

        const std::shared_ptr<Channel>& channel() const noexcept {
            return channel_;
        }

        clock_type::time_point created() const noexcept { return created_; }
        clock_type::time_point last_used() const noexcept { return last_used_; }

        void touch(clock_type::time_point now) noexcept { last_used_ = now; }

        /// @brief Past its time-to-live. A zero ttl never expires.
        bool ttl_expired(clock_type::time_point now,
                         std::chrono::milliseconds ttl) const noexcept {
            return ttl.count() > 0 && now - created_ >= ttl;
        }

        /// @brief Idle for at least max_idle. A zero max_idle never expires.
        bool idle_expired(clock_type::time_point now,
                          std::chrono::milliseconds max_idle) const noexcept {
            return max_idle.count() > 0 && is_idle() &&
                   now - last_used_ >= max_idle;
        }

       private:
        std::uint64_t id_;
        std::shared_ptr<Channel> channel_;
        ConnectionHealth health_{ConnectionHealth::Healthy};
        clock_type::time_point created_;
        clock_type::time_point last_used_;
    };

    /// @brief HTTP/1.1: exactly one request at a time.
    class Http1Connection final : public PooledConnection {
       public:
        using PooledConnection::PooledConnection;

        Protocol protocol() const noexcept override {
            return Protocol::Http1_1;
        }
        std::uint64_t max_streams() const noexcept override { return 1; }
        std::uint64_t active_streams() const noexcept override {
            return busy_ ? 1 : 0;
        }

        bool try_reserve() noexcept override {
            if (busy_) return false;
            busy_ = true;
            return true;
        }

        void release_one() noexcept override { busy_ = false; }

       private:
        bool busy_{false};
    };

    /// @brief HTTP/2: up to max_streams concurrent streams.
    class Http2Connection final : public PooledConnection {
       public:
        Http2Connection(std::uint64_t id, std::shared_ptr<Channel> channel,
                        clock_type::time_point now, std::uint64_t max_streams)
            : PooledConnection(id, std::move(channel), now),
              max_streams_(max_streams == 0 ? 1 : max_streams) {}

        Protocol protocol() const noexcept override { return Protocol::Http2; }
        std::uint64_t max_streams() const noexcept override {
            return max_streams_;
        }
        std::uint64_t active_streams() const noexcept override {
            return open_streams_;
        }

        bool try_reserve() noexcept override {
            if (open_streams_ >= max_streams_) return false;
            ++open_streams_;
            return true;
        }

        void release_one() noexcept override {
            if (open_streams_ > 0) --open_streams_;
        }

       private:
        std::uint64_t max_streams_;
        std::uint64_t open_streams_{0};
    };

    /// @brief Build the variant matching the pool's negotiated protocol.
    std::unique_ptr<PooledConnection> make_pooled_connection(
        const ProtocolLimits& limits, std::uint64_t id,
        std::shared_ptr<Channel> channel,
        PooledConnection::clock_type::time_point now);

}  // namespace muxpool
