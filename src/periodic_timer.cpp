#include "docflow/periodic_timer.hpp"
#include "docflow/error.hpp"
#include "docflow/logging.hpp"

namespace docflow {

PeriodicTimer::PeriodicTimer(boost::asio::any_io_executor executor,
                             std::chrono::milliseconds interval,
                             std::string name,
                             std::function<void()> tick)
    : timer_(executor),
      interval_(interval),
      name_(std::move(name)),
      tick_(std::move(tick)) {
    DOCFLOW_CHECK_ARGUMENT(interval_.count() > 0, "timer interval must be positive");
}

void PeriodicTimer::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    arm();
}

void PeriodicTimer::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
    timer_.cancel();
}

bool PeriodicTimer::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void PeriodicTimer::arm() {
    std::weak_ptr<PeriodicTimer> weak = shared_from_this();
    timer_.expires_after(interval_);
    timer_.async_wait([weak](const boost::system::error_code& ec) {
        if (ec) return;
        if (auto self = weak.lock()) {
            self->fire();
        }
    });
}

void PeriodicTimer::fire() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
    }

    try {
        tick_();
    } catch (const std::exception& e) {
        DOCFLOW_LOG_ERROR("Periodic task '" + name_ + "' failed: " + e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        arm();
    }
}

} // namespace docflow
