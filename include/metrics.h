#pragma once

#include <string>
#include <map>
#include <mutex>
#include <memory>

namespace voxgate {

using MetricTags = std::map<std::string, std::string>;

/**
 * @brief Fire-and-forget metrics collaborator
 *
 * record() must never throw or block the pipeline; implementations swallow
 * their own failures.
 */
class MetricsSink {
public:
    virtual ~MetricsSink() = default;

    virtual void record(const std::string& event_name, double value,
                        const MetricTags& tags = {}) noexcept = 0;

    void increment(const std::string& event_name, const MetricTags& tags = {}) noexcept {
        record(event_name, 1.0, tags);
    }
};

/**
 * @brief Counters plus last observed value per metric name
 *
 * Tags are folded into the key as name{k=v,...} so per-reason counts stay
 * separate.
 */
class InMemoryMetrics : public MetricsSink {
public:
    struct Entry {
        double total = 0.0;   ///< Sum of recorded values
        double last = 0.0;    ///< Most recent value
        int64_t count = 0;    ///< Number of record() calls
    };

    void record(const std::string& event_name, double value,
                const MetricTags& tags = {}) noexcept override;

    /// Entry for an exact key (name or name{tags}); zeroed entry if never recorded
    Entry get(const std::string& key) const;

    /// Number of record() calls for an exact key
    int64_t count(const std::string& key) const { return get(key).count; }

    std::map<std::string, Entry> snapshot() const;

    /// One line per key, for periodic logging
    std::string summary() const;

    static std::string key_for(const std::string& event_name, const MetricTags& tags);

private:
    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
};

/// Sink that discards everything; used when no collaborator is wired
class NullMetrics : public MetricsSink {
public:
    void record(const std::string&, double, const MetricTags&) noexcept override {}
};

} // namespace voxgate
