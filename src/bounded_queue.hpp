#pragma once

// Internal header -- not installed.
// Capacity-bounded priority queue. Higher priority is served first;
// equal priorities are served in sequence (FIFO) order. When full, the
// lowest-priority band gives up its oldest entry to make room, unless the
// incoming entry ranks strictly below everything queued, in which case
// the incoming entry itself is turned away.

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace offload_cpp::detail {

template <typename T>
class BoundedPriorityQueue {
public:
    explicit BoundedPriorityQueue(std::size_t capacity) : capacity_{capacity} {
        entries_.reserve(capacity);
    }

    /// Insert value. Returns whichever value had to leave to keep
    /// size() <= capacity() (possibly value itself).
    /// @param sequence Tie-breaker within a priority; lower is older.
    auto push(int priority, std::uint64_t sequence, T value) -> std::optional<T> {
        auto entry = Entry{priority, sequence, std::move(value)};
        if (entries_.size() < capacity_) {
            insert(std::move(entry));
            return std::nullopt;
        }
        if (entries_.empty() || priority < entries_.back().priority) {
            return std::move(entry.value);
        }
        auto lowest = entries_.back().priority;
        auto band = std::ranges::find_if(entries_, [lowest](const Entry& e) {
            return e.priority == lowest;
        });
        auto evicted = std::move(band->value);
        entries_.erase(band);
        insert(std::move(entry));
        return evicted;
    }

    /// Remove and return the highest-priority, oldest value.
    auto pop() -> std::optional<T> {
        if (entries_.empty()) return std::nullopt;
        auto value = std::move(entries_.front().value);
        entries_.erase(entries_.begin());
        return value;
    }

    /// Remove everything, in service order.
    auto drain() -> std::vector<T> {
        auto out = std::vector<T>{};
        out.reserve(entries_.size());
        for (auto& e : entries_) out.push_back(std::move(e.value));
        entries_.clear();
        return out;
    }

    auto size() const -> std::size_t { return entries_.size(); }
    auto capacity() const -> std::size_t { return capacity_; }
    auto empty() const -> bool { return entries_.empty(); }

private:
    struct Entry {
        int priority;
        std::uint64_t sequence;
        T value;
    };

    static auto serves_before(const Entry& a, const Entry& b) -> bool {
        if (a.priority != b.priority) return a.priority > b.priority;
        return a.sequence < b.sequence;
    }

    void insert(Entry entry) {
        auto pos = std::ranges::upper_bound(entries_, entry, serves_before);
        entries_.insert(pos, std::move(entry));
    }

    std::size_t capacity_;
    std::vector<Entry> entries_;
};

}  // namespace offload_cpp::detail
