#include "docflow/resilient_channel.hpp"
#include "docflow/logging.hpp"
#include "docflow/metrics.hpp"
#include "docflow/wire_protocol.hpp"
#include <boost/asio/error.hpp>
#include <utility>

namespace docflow {

ResilientChannel::ResilientChannel(boost::asio::any_io_executor executor,
                                   TransportFactory factory,
                                   const ChannelConfig& config,
                                   BackoffPolicy backoff)
    : executor_(executor),
      factory_(std::move(factory)),
      backoff_(std::move(backoff)),
      heartbeat_interval_(config.heartbeat_interval_ms),
      heartbeat_timeout_(config.heartbeat_timeout_ms),
      queue_(config.message_queue_size),
      retry_timer_(executor),
      heartbeat_timer_(executor),
      liveness_timer_(executor) {}

ResilientChannel::~ResilientChannel() {
    std::shared_ptr<Transport> transport;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++generation_;
        transport = std::move(transport_);
    }
    if (transport) {
        transport->close("channel destroyed");
    }
}

void ResilientChannel::connect() {
    std::optional<Transition> transition;
    std::shared_ptr<Transport> transport;
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ChannelState::OFFLINE) {
            DOCFLOW_LOG_WARNING("Channel is OFFLINE; automatic retries stopped, use reconnect()");
            return;
        }
        if (state_ != ChannelState::DISCONNECTED) {
            return;
        }
        transition = set_state_locked(ChannelState::CONNECTING);
        transport = begin_attempt_locked();
        generation = generation_;
    }
    notify(transition);
    open_transport(transport, generation);
}

void ResilientChannel::reconnect() {
    std::optional<Transition> transition;
    std::shared_ptr<Transport> previous;
    std::shared_ptr<Transport> transport;
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancel_timers_locked();
        previous = std::move(transport_);
        attempt_ = 0;
        awaiting_pong_ = false;
        transition = set_state_locked(ChannelState::CONNECTING);
        transport = begin_attempt_locked();
        generation = generation_;
    }
    DOCFLOW_LOG_INFO("Manual reconnect requested");
    if (previous) {
        previous->close("reconnect");
    }
    notify(transition);
    open_transport(transport, generation);
}

void ResilientChannel::send(std::string payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == ChannelState::CONNECTED && transport_) {
        transport_->write(std::move(payload));
        return;
    }

    auto evicted = queue_.push(std::move(payload));
    if (evicted) {
        DOCFLOW_LOG_WARNING("Outbound queue full (" + std::to_string(queue_.capacity()) +
                            "), dropped oldest message of " + std::to_string(evicted->payload.size()) + " bytes");
        Metrics::getInstance().increment_counter("channel_messages_dropped");
    }
}

void ResilientChannel::disconnect(const std::string& reason) {
    std::optional<Transition> transition;
    std::shared_ptr<Transport> transport;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++generation_;
        cancel_timers_locked();
        transport = std::move(transport_);
        awaiting_pong_ = false;
        transition = set_state_locked(ChannelState::DISCONNECTED);
    }
    DOCFLOW_LOG_INFO("Channel disconnect: " + reason);
    if (transport) {
        transport->close(reason);
    }
    notify(transition);
}

SubscriptionId ResilientChannel::on_state_change(StateCallback callback) {
    return state_subscribers_.add(std::move(callback));
}

SubscriptionId ResilientChannel::on_message(MessageCallback callback) {
    return message_subscribers_.add(std::move(callback));
}

void ResilientChannel::remove_state_listener(SubscriptionId id) {
    state_subscribers_.remove(id);
}

void ResilientChannel::remove_message_listener(SubscriptionId id) {
    message_subscribers_.remove(id);
}

ChannelState ResilientChannel::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

size_t ResilientChannel::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

uint32_t ResilientChannel::attempt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempt_;
}

void ResilientChannel::clear_queue() {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.clear();
}

// =============================================================================
// Internals; *_locked() expects mutex_ held
// =============================================================================

std::optional<ResilientChannel::Transition> ResilientChannel::set_state_locked(ChannelState next) {
    if (state_ == next) {
        return std::nullopt;
    }
    Transition transition{next, state_};
    state_ = next;
    return transition;
}

std::shared_ptr<Transport> ResilientChannel::begin_attempt_locked() {
    ++generation_;
    try {
        transport_ = factory_();
    } catch (const std::exception& e) {
        DOCFLOW_LOG_ERROR("Failed to create transport: " + std::string(e.what()));
        transport_.reset();
    }
    return transport_;
}

std::optional<ResilientChannel::Transition> ResilientChannel::schedule_retry_locked(const std::string& reason) {
    if (!backoff_.should_retry(attempt_)) {
        DOCFLOW_LOG_ERROR("Connection lost (" + reason + "); giving up after " +
                          std::to_string(attempt_) + " retries, channel OFFLINE");
        return set_state_locked(ChannelState::OFFLINE);
    }

    ++attempt_;
    auto delay = backoff_.delay(attempt_);
    DOCFLOW_LOG_INFO("Connection lost (" + reason + "); reconnecting in " + std::to_string(delay.count()) +
                     "ms (attempt " + std::to_string(attempt_) + "/" + std::to_string(backoff_.max_retries()) + ")");
    Metrics::getInstance().increment_counter("channel_reconnect_attempts");

    auto transition = set_state_locked(ChannelState::RECONNECTING);

    std::weak_ptr<ResilientChannel> weak = shared_from_this();
    uint64_t generation = generation_;
    retry_timer_.expires_after(delay);
    retry_timer_.async_wait([weak, generation](const boost::system::error_code& ec) {
        if (ec) return;
        if (auto self = weak.lock()) {
            self->handle_retry_timer(generation);
        }
    });
    return transition;
}

void ResilientChannel::arm_heartbeat_locked() {
    std::weak_ptr<ResilientChannel> weak = shared_from_this();
    uint64_t generation = generation_;
    heartbeat_timer_.expires_after(heartbeat_interval_);
    heartbeat_timer_.async_wait([weak, generation](const boost::system::error_code& ec) {
        if (ec) return;
        if (auto self = weak.lock()) {
            self->handle_heartbeat_tick(generation);
        }
    });
}

void ResilientChannel::cancel_timers_locked() {
    retry_timer_.cancel();
    heartbeat_timer_.cancel();
    liveness_timer_.cancel();
}

void ResilientChannel::open_transport(const std::shared_ptr<Transport>& transport, uint64_t generation) {
    if (!transport) {
        handle_close(generation, CloseInfo{false, "transport unavailable"});
        return;
    }

    std::weak_ptr<ResilientChannel> weak = shared_from_this();
    Transport::Handlers handlers;
    handlers.on_open = [weak, generation]() {
        if (auto self = weak.lock()) self->handle_open(generation);
    };
    handlers.on_message = [weak, generation](const std::string& text) {
        if (auto self = weak.lock()) self->handle_message(generation, text);
    };
    handlers.on_close = [weak, generation](const CloseInfo& info) {
        if (auto self = weak.lock()) self->handle_close(generation, info);
    };

    try {
        transport->open(std::move(handlers));
    } catch (const std::exception& e) {
        handle_close(generation, CloseInfo{false, e.what()});
    }
}

void ResilientChannel::handle_open(uint64_t generation) {
    std::optional<Transition> transition;
    size_t flushed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || !transport_) {
            return;
        }
        transition = set_state_locked(ChannelState::CONNECTED);
        attempt_ = 0;
        awaiting_pong_ = false;

        // Queued messages go out before anything sent after this point
        auto pending = queue_.drain();
        flushed = pending.size();
        for (auto& entry : pending) {
            transport_->write(std::move(entry.payload));
        }
        arm_heartbeat_locked();
    }
    if (flushed > 0) {
        DOCFLOW_LOG_INFO("Channel connected, flushed " + std::to_string(flushed) + " queued messages");
    }
    notify(transition);
}

void ResilientChannel::handle_message(uint64_t generation, const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return;
        }
        // Any inbound traffic proves liveness
        awaiting_pong_ = false;
        liveness_timer_.cancel();
    }
    if (wire::is_pong(text)) {
        return;
    }
    message_subscribers_.dispatch(text);
}

void ResilientChannel::handle_close(uint64_t generation, const CloseInfo& info) {
    std::optional<Transition> transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return;
        }
        ++generation_;
        cancel_timers_locked();
        transport_.reset();
        awaiting_pong_ = false;

        if (info.clean) {
            DOCFLOW_LOG_INFO("Channel closed cleanly: " + info.reason);
            transition = set_state_locked(ChannelState::DISCONNECTED);
        } else {
            transition = schedule_retry_locked(info.reason.empty() ? "abnormal closure" : info.reason);
        }
    }
    notify(transition);
}

void ResilientChannel::handle_retry_timer(uint64_t generation) {
    std::shared_ptr<Transport> transport;
    uint64_t current = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || state_ != ChannelState::RECONNECTING) {
            return;
        }
        transport = begin_attempt_locked();
        current = generation_;
    }
    open_transport(transport, current);
}

void ResilientChannel::handle_heartbeat_tick(uint64_t generation) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_ || state_ != ChannelState::CONNECTED || !transport_) {
        return;
    }

    transport_->write(wire::make_ping());
    if (!awaiting_pong_) {
        awaiting_pong_ = true;
        std::weak_ptr<ResilientChannel> weak = shared_from_this();
        liveness_timer_.expires_after(heartbeat_timeout_);
        liveness_timer_.async_wait([weak, generation](const boost::system::error_code& ec) {
            if (ec) return;
            if (auto self = weak.lock()) {
                self->handle_liveness_timeout(generation);
            }
        });
    }
    arm_heartbeat_locked();
}

void ResilientChannel::handle_liveness_timeout(uint64_t generation) {
    std::optional<Transition> transition;
    std::shared_ptr<Transport> dead;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || state_ != ChannelState::CONNECTED || !awaiting_pong_) {
            return;
        }
        DOCFLOW_LOG_WARNING("No heartbeat acknowledgment within " +
                            std::to_string(heartbeat_timeout_.count()) + "ms, treating connection as dead");
        Metrics::getInstance().increment_counter("channel_heartbeat_timeouts");

        ++generation_;
        cancel_timers_locked();
        dead = std::move(transport_);
        awaiting_pong_ = false;
        transition = schedule_retry_locked("heartbeat timeout");
    }
    if (dead) {
        dead->close("heartbeat timeout");
    }
    notify(transition);
}

void ResilientChannel::notify(const std::optional<Transition>& transition) {
    if (!transition) {
        return;
    }
    DOCFLOW_LOG_INFO(std::string("Channel state ") + to_string(transition->previous) + " -> " +
                     to_string(transition->current));
    state_subscribers_.dispatch(transition->current, transition->previous);
}

} // namespace docflow
