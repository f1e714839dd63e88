#pragma once

#include <string>
#include <map>
#include <memory>
#include <chrono>
#include <cstdint>

namespace docflow {

using MetricLabels = std::map<std::string, std::string>;

class Metrics {
public:
    static Metrics& getInstance();

    // Counter operations
    void increment_counter(const std::string& name, const MetricLabels& labels = {}, int64_t value = 1);
    int64_t counter_value(const std::string& name, const MetricLabels& labels = {}) const;

    // Gauge operations
    void set_gauge(const std::string& name, double value, const MetricLabels& labels = {});
    void increment_gauge(const std::string& name, double value, const MetricLabels& labels = {});
    void decrement_gauge(const std::string& name, double value, const MetricLabels& labels = {});
    double gauge_value(const std::string& name, const MetricLabels& labels = {}) const;

    // Histogram operations; only the most recent samples are kept per series
    void record_histogram(const std::string& name, double value, const MetricLabels& labels = {});

    // Records elapsed milliseconds into a histogram when stopped or destroyed
    class Timer {
    public:
        Timer(const std::string& name, const MetricLabels& labels = {});
        ~Timer();

        void stop();

    private:
        std::string name_;
        MetricLabels labels_;
        std::chrono::steady_clock::time_point start_;
        bool stopped_;
    };

    // Export metrics in Prometheus text format
    std::string export_prometheus() const;

    void reset();

    Metrics();
    ~Metrics();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

#define DOCFLOW_METRICS_TIMER(name) docflow::Metrics::Timer timer_##name(#name)

} // namespace docflow
