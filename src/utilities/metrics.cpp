#include "utilities/metrics.h"
#include <sstream>

namespace ctverify {

MetricsRegistry& MetricsRegistry::instance() {
    static MetricsRegistry inst;
    return inst;
}

static std::string makeKey(const std::string& name, const MetricsRegistry::Labels& labels) {
    return name + MetricsRegistry::labelsToString(labels);
}

static std::string escapeLabel(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '\\' || c == '"') out.push_back('\\');
        if (c == '\n') { out += "\\n"; continue; }
        out.push_back(c);
    }
    return out;
}

void MetricsRegistry::setGauge(const std::string& name, double value, const Labels& labels) {
    std::lock_guard<std::mutex> lg(mtx_);
    gauges_[makeKey(name, labels)] = value;
}

void MetricsRegistry::incrementCounter(const std::string& name, double value,
                                       const Labels& labels) {
    std::lock_guard<std::mutex> lg(mtx_);
    counters_[makeKey(name, labels)] += value;
}

double MetricsRegistry::counter(const std::string& name, const Labels& labels) const {
    std::lock_guard<std::mutex> lg(mtx_);
    auto it = counters_.find(makeKey(name, labels));
    return it == counters_.end() ? 0.0 : it->second;
}

double MetricsRegistry::gauge(const std::string& name, const Labels& labels) const {
    std::lock_guard<std::mutex> lg(mtx_);
    auto it = gauges_.find(makeKey(name, labels));
    return it == gauges_.end() ? 0.0 : it->second;
}

std::string MetricsRegistry::labelsToString(const Labels& labels) {
    if (labels.empty()) return "";
    std::ostringstream oss;
    oss << '{';
    bool first = true;
    for (const auto& kv : labels) {
        if (!first) oss << ',';
        first = false;
        oss << kv.first << "=\"" << escapeLabel(kv.second) << "\"";
    }
    oss << '}';
    return oss.str();
}

std::string MetricsRegistry::toPrometheus() const {
    std::lock_guard<std::mutex> lg(mtx_);
    std::ostringstream oss;
    for (const auto& kv : gauges_) {
        oss << kv.first << ' ' << kv.second << '\n';
    }
    for (const auto& kv : counters_) {
        oss << kv.first << ' ' << kv.second << '\n';
    }
    return oss.str();
}

void MetricsRegistry::reset() {
    std::lock_guard<std::mutex> lg(mtx_);
    gauges_.clear();
    counters_.clear();
}

} // namespace ctverify
