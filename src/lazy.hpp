#pragma once
#include <atomic>
#include <mutex>
#include <optional>
#include <utility>

// A value that is either unresolved or resolved exactly once. Concurrent
// callers of get() block until the first computation finishes. If the
// computation throws, the value stays unresolved and the next get() retries.
template <typename T>
class Lazy {
public:
    template <typename Compute>
    const T& get(Compute&& compute) {
        std::call_once(once_, [&] {
            value_.emplace(std::forward<Compute>(compute)());
            resolved_.store(true, std::memory_order_release);
        });
        return *value_;
    }

    bool resolved() const { return resolved_.load(std::memory_order_acquire); }

private:
    std::once_flag once_;
    std::optional<T> value_;
    std::atomic<bool> resolved_{false};
};
