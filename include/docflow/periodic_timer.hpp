#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

namespace docflow {

// Runs a callback on a fixed interval until stopped; exceptions from the
// callback are logged and the timer keeps running
class PeriodicTimer : public std::enable_shared_from_this<PeriodicTimer> {
public:
    PeriodicTimer(boost::asio::any_io_executor executor,
                  std::chrono::milliseconds interval,
                  std::string name,
                  std::function<void()> tick);

    void start();
    void stop();
    bool running() const;

private:
    void arm();
    void fire();

    boost::asio::steady_timer timer_;
    std::chrono::milliseconds interval_;
    std::string name_;
    std::function<void()> tick_;
    mutable std::mutex mutex_;
    bool running_ = false;
};

} // namespace docflow
