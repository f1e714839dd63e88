/**
 * Resilient Channel
 * =================
 *
 * Duplex message channel that owns the connection lifecycle:
 * - exponential backoff with jitter between reconnection attempts,
 *   giving up in OFFLINE after max_retries failed retries
 * - heartbeat pings; a missing acknowledgment forces RECONNECTING even if
 *   the transport never reported a failure
 * - bounded outbound queue (drop-oldest) while not CONNECTED, flushed in
 *   FIFO order before any later send()
 *
 * A clean close (disconnect() or an orderly remote close) never reconnects.
 * Must be owned by a std::shared_ptr; timers and transport callbacks hold
 * weak references only.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include "docflow/backoff_policy.hpp"
#include "docflow/config.hpp"
#include "docflow/outbound_queue.hpp"
#include "docflow/subscriber_list.hpp"
#include "docflow/transport.hpp"
#include "docflow/types.hpp"

namespace docflow {

class ResilientChannel : public std::enable_shared_from_this<ResilientChannel> {
public:
    using StateCallback = std::function<void(ChannelState current, ChannelState previous)>;
    using MessageCallback = std::function<void(const std::string&)>;

    ResilientChannel(boost::asio::any_io_executor executor,
                     TransportFactory factory,
                     const ChannelConfig& config,
                     BackoffPolicy backoff);
    ~ResilientChannel();

    ResilientChannel(const ResilientChannel&) = delete;
    ResilientChannel& operator=(const ResilientChannel&) = delete;

    // Starts connecting from DISCONNECTED; ignored in any other state
    void connect();

    // Manual reconnect: resets the attempt counter, also leaves OFFLINE
    void reconnect();

    // Transmits when CONNECTED, queues otherwise; never fails
    void send(std::string payload);

    // Clean shutdown; the outbound queue is kept for a later connect()
    void disconnect(const std::string& reason);

    SubscriptionId on_state_change(StateCallback callback);
    SubscriptionId on_message(MessageCallback callback);
    void remove_state_listener(SubscriptionId id);
    void remove_message_listener(SubscriptionId id);

    ChannelState state() const;
    size_t queued() const;
    uint32_t attempt() const;
    void clear_queue();

private:
    struct Transition {
        ChannelState current;
        ChannelState previous;
    };

    std::optional<Transition> set_state_locked(ChannelState next);
    std::shared_ptr<Transport> begin_attempt_locked();
    std::optional<Transition> schedule_retry_locked(const std::string& reason);
    void arm_heartbeat_locked();
    void cancel_timers_locked();

    void open_transport(const std::shared_ptr<Transport>& transport, uint64_t generation);
    void handle_open(uint64_t generation);
    void handle_message(uint64_t generation, const std::string& text);
    void handle_close(uint64_t generation, const CloseInfo& info);
    void handle_retry_timer(uint64_t generation);
    void handle_heartbeat_tick(uint64_t generation);
    void handle_liveness_timeout(uint64_t generation);

    void notify(const std::optional<Transition>& transition);

    boost::asio::any_io_executor executor_;
    TransportFactory factory_;
    BackoffPolicy backoff_;
    std::chrono::milliseconds heartbeat_interval_;
    std::chrono::milliseconds heartbeat_timeout_;

    mutable std::mutex mutex_;
    ChannelState state_ = ChannelState::DISCONNECTED;
    std::shared_ptr<Transport> transport_;
    uint64_t generation_ = 0;   // bumped whenever the current transport is superseded
    uint32_t attempt_ = 0;
    bool awaiting_pong_ = false;
    OutboundQueue queue_;

    boost::asio::steady_timer retry_timer_;
    boost::asio::steady_timer heartbeat_timer_;
    boost::asio::steady_timer liveness_timer_;

    SubscriberList<ChannelState, ChannelState> state_subscribers_{"channel state change"};
    SubscriberList<const std::string&> message_subscribers_{"channel message"};
};

} // namespace docflow
