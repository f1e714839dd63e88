#include "docflow/metrics.hpp"
#include <algorithm>
#include <deque>
#include <iomanip>
#include <mutex>
#include <numeric>
#include <sstream>
#include <vector>

namespace docflow {

namespace {

constexpr size_t kMaxHistogramSamples = 1024;

struct SeriesKey {
    std::string name;
    MetricLabels labels;

    bool operator<(const SeriesKey& other) const {
        if (name != other.name) return name < other.name;
        return labels < other.labels;
    }
};

std::string render_labels(const MetricLabels& labels, const std::string& extra = "") {
    if (labels.empty() && extra.empty()) {
        return "";
    }
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& [key, value] : labels) {
        if (!first) oss << ",";
        oss << key << "=\"" << value << "\"";
        first = false;
    }
    if (!extra.empty()) {
        if (!first) oss << ",";
        oss << extra;
    }
    oss << "}";
    return oss.str();
}

double quantile(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) return 0.0;
    size_t index = static_cast<size_t>(q * static_cast<double>(sorted.size() - 1));
    return sorted[index];
}

} // namespace

class Metrics::Impl {
public:
    std::map<SeriesKey, int64_t> counters;
    std::map<SeriesKey, double> gauges;
    std::map<SeriesKey, std::deque<double>> histograms;
    mutable std::mutex metrics_mutex;
};

Metrics::Metrics() : pImpl(std::make_unique<Impl>()) {}

Metrics::~Metrics() = default;

Metrics& Metrics::getInstance() {
    static Metrics instance;
    return instance;
}

void Metrics::increment_counter(const std::string& name, const MetricLabels& labels, int64_t value) {
    std::lock_guard<std::mutex> lock(pImpl->metrics_mutex);
    pImpl->counters[SeriesKey{name, labels}] += value;
}

int64_t Metrics::counter_value(const std::string& name, const MetricLabels& labels) const {
    std::lock_guard<std::mutex> lock(pImpl->metrics_mutex);
    auto it = pImpl->counters.find(SeriesKey{name, labels});
    return it != pImpl->counters.end() ? it->second : 0;
}

void Metrics::set_gauge(const std::string& name, double value, const MetricLabels& labels) {
    std::lock_guard<std::mutex> lock(pImpl->metrics_mutex);
    pImpl->gauges[SeriesKey{name, labels}] = value;
}

void Metrics::increment_gauge(const std::string& name, double value, const MetricLabels& labels) {
    std::lock_guard<std::mutex> lock(pImpl->metrics_mutex);
    pImpl->gauges[SeriesKey{name, labels}] += value;
}

void Metrics::decrement_gauge(const std::string& name, double value, const MetricLabels& labels) {
    std::lock_guard<std::mutex> lock(pImpl->metrics_mutex);
    pImpl->gauges[SeriesKey{name, labels}] -= value;
}

double Metrics::gauge_value(const std::string& name, const MetricLabels& labels) const {
    std::lock_guard<std::mutex> lock(pImpl->metrics_mutex);
    auto it = pImpl->gauges.find(SeriesKey{name, labels});
    return it != pImpl->gauges.end() ? it->second : 0.0;
}

void Metrics::record_histogram(const std::string& name, double value, const MetricLabels& labels) {
    std::lock_guard<std::mutex> lock(pImpl->metrics_mutex);
    auto& samples = pImpl->histograms[SeriesKey{name, labels}];
    samples.push_back(value);
    if (samples.size() > kMaxHistogramSamples) {
        samples.pop_front();
    }
}

Metrics::Timer::Timer(const std::string& name, const MetricLabels& labels)
    : name_(name), labels_(labels), start_(std::chrono::steady_clock::now()), stopped_(false) {}

Metrics::Timer::~Timer() {
    if (!stopped_) {
        stop();
    }
}

void Metrics::Timer::stop() {
    if (!stopped_) {
        auto end = std::chrono::steady_clock::now();
        double elapsed_ms = std::chrono::duration<double, std::milli>(end - start_).count();
        Metrics::getInstance().record_histogram(name_, elapsed_ms, labels_);
        stopped_ = true;
    }
}

std::string Metrics::export_prometheus() const {
    std::lock_guard<std::mutex> lock(pImpl->metrics_mutex);
    std::ostringstream oss;

    std::string last_name;
    for (const auto& [key, value] : pImpl->counters) {
        if (key.name != last_name) {
            oss << "# TYPE docflow_" << key.name << "_total counter\n";
            last_name = key.name;
        }
        oss << "docflow_" << key.name << "_total" << render_labels(key.labels) << " " << value << "\n";
    }

    last_name.clear();
    for (const auto& [key, value] : pImpl->gauges) {
        if (key.name != last_name) {
            oss << "# TYPE docflow_" << key.name << " gauge\n";
            last_name = key.name;
        }
        oss << "docflow_" << key.name << render_labels(key.labels) << " "
            << std::fixed << std::setprecision(6) << value << "\n";
    }

    last_name.clear();
    for (const auto& [key, samples] : pImpl->histograms) {
        if (key.name != last_name) {
            oss << "# TYPE docflow_" << key.name << " summary\n";
            last_name = key.name;
        }
        std::vector<double> sorted(samples.begin(), samples.end());
        std::sort(sorted.begin(), sorted.end());
        const std::string metric = "docflow_" + key.name;
        oss << metric << render_labels(key.labels, "quantile=\"0.5\"") << " " << quantile(sorted, 0.5) << "\n";
        oss << metric << render_labels(key.labels, "quantile=\"0.9\"") << " " << quantile(sorted, 0.9) << "\n";
        oss << metric << render_labels(key.labels, "quantile=\"0.99\"") << " " << quantile(sorted, 0.99) << "\n";
        oss << metric << "_sum" << render_labels(key.labels) << " "
            << std::accumulate(sorted.begin(), sorted.end(), 0.0) << "\n";
        oss << metric << "_count" << render_labels(key.labels) << " " << sorted.size() << "\n";
    }

    return oss.str();
}

void Metrics::reset() {
    std::lock_guard<std::mutex> lock(pImpl->metrics_mutex);
    pImpl->counters.clear();
    pImpl->gauges.clear();
    pImpl->histograms.clear();
}

} // namespace docflow
