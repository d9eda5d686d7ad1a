#pragma once
#ifdef RT_LOG_DEBUG
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <set>
#include <source_location>
#include <string>
#include <thread>
#include <unordered_map>

namespace RT {

/**
 * Tagged debug logger writing to stderr from a worker thread.
 *
 * Configured at construction from RENDERTREE_LOG / RENDERTREE_LOG_ENABLED,
 * RENDERTREE_LOG_CLEAR_DEFAULT_SKIPS, RENDERTREE_LOG_SKIP_TAGS and
 * RENDERTREE_LOG_ENABLE_TAGS (comma separated). A message is dropped when
 * any of its tags is skipped, or when enabled tags are set and one of its
 * tags is not among them.
 */
class TaggedLogger {
public:
    struct Entry {
        std::chrono::system_clock::time_point timestamp;
        std::set<std::string>                 tags;
        std::string                           message;
        std::string                           threadName;
        std::source_location                  location;
    };

    TaggedLogger();
    ~TaggedLogger();

    TaggedLogger(TaggedLogger const&)            = delete;
    TaggedLogger& operator=(TaggedLogger const&) = delete;

    template <typename... Tags>
    auto log(std::string const& message, std::source_location const& location, Tags&&... tags) -> void;

    auto setThreadName(std::string const& name) -> void;
    auto setLoggingEnabled(bool enabled) -> void;
    auto setSkipTags(std::set<std::string> tags) -> void;
    auto setEnabledTags(std::set<std::string> tags) -> void;

    // Waits until every queued message has been written.
    auto flush() -> void;

private:
    auto run() -> void;
    auto accepts(std::set<std::string> const& tags) const -> bool;
    auto write(Entry const& entry) const -> void;
    auto threadName(std::thread::id id) -> std::string;

    std::queue<Entry>       pending;
    std::mutex              queueMutex;
    std::condition_variable wake;
    std::condition_variable drained;
    std::size_t             inFlight = 0;
    bool                    running  = true;
    std::atomic<bool>       enabled{false};

    mutable std::mutex    tagsMutex;
    std::set<std::string> skipTags{"Function Called", "INFO"};
    std::set<std::string> enabledTags;

    std::mutex                                       namesMutex;
    std::unordered_map<std::thread::id, std::string> threadNames;

    std::thread worker;
};

auto logger() -> TaggedLogger&;

template <typename... Tags>
auto TaggedLogger::log(std::string const& message, std::source_location const& location, Tags&&... tags) -> void {
    if (!this->enabled.load(std::memory_order_relaxed))
        return;

    auto entry = Entry{.timestamp  = std::chrono::system_clock::now(),
                       .tags       = {std::string(std::forward<Tags>(tags))...},
                       .message    = message,
                       .threadName = this->threadName(std::this_thread::get_id()),
                       .location   = location};

    std::lock_guard<std::mutex> lock(this->queueMutex);
    this->pending.push(std::move(entry));
    this->wake.notify_one();
}

#define rt_log(message, ...) ::RT::logger().log(message, std::source_location::current(), ##__VA_ARGS__)

} // namespace RT

#else
#define rt_log(message, ...) ((void)0)
#endif // RT_LOG_DEBUG
