#include "metrics.h"
#include <sstream>

namespace voxgate {

std::string InMemoryMetrics::key_for(const std::string& event_name, const MetricTags& tags) {
    if (tags.empty()) return event_name;
    std::string key = event_name + "{";
    bool first = true;
    for (const auto& [k, v] : tags) {
        if (!first) key += ",";
        key += k + "=" + v;
        first = false;
    }
    key += "}";
    return key;
}

void InMemoryMetrics::record(const std::string& event_name, double value,
                             const MetricTags& tags) noexcept {
    try {
        std::string key = key_for(event_name, tags);
        std::lock_guard<std::mutex> lock(mutex_);
        auto& plain = entries_[event_name];
        plain.total += value;
        plain.last = value;
        plain.count++;
        if (!tags.empty()) {
            auto& tagged = entries_[key];
            tagged.total += value;
            tagged.last = value;
            tagged.count++;
        }
    } catch (const std::exception&) {
        // Allocation failure while recording; metrics are best-effort
    }
}

InMemoryMetrics::Entry InMemoryMetrics::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        return it->second;
    }
    return Entry{};
}

std::map<std::string, InMemoryMetrics::Entry> InMemoryMetrics::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

std::string InMemoryMetrics::summary() const {
    std::ostringstream oss;
    for (const auto& [key, entry] : snapshot()) {
        oss << key << " count=" << entry.count << " total=" << entry.total
            << " last=" << entry.last << "\n";
    }
    return oss.str();
}

} // namespace voxgate
