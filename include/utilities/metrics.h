#pragma once
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ctverify {

/**
 * @brief Process-wide counters and gauges exported in Prometheus text format.
 */
class MetricsRegistry {
public:
    using Labels = std::map<std::string, std::string>;

    static MetricsRegistry& instance();

    void setGauge(const std::string& name, double value, const Labels& labels = {});

    void incrementCounter(const std::string& name, double value = 1.0,
                          const Labels& labels = {});

    /** Current counter value, 0 if never incremented. */
    double counter(const std::string& name, const Labels& labels = {}) const;

    /** Current gauge value, 0 if never set. */
    double gauge(const std::string& name, const Labels& labels = {}) const;

    std::string toPrometheus() const;

    /** Clear all stored metrics. Used by tests. */
    void reset();

    static std::string labelsToString(const Labels& labels);

private:
    MetricsRegistry() = default;

    mutable std::mutex mtx_;
    std::unordered_map<std::string, double> gauges_;
    std::unordered_map<std::string, double> counters_;
};

} // namespace ctverify
