#ifdef RT_LOG_DEBUG
#include "TaggedLogger.hpp"

#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string_view>

namespace RT {

namespace {

auto env_truthy(char const* name) -> bool {
    char const* value = std::getenv(name);
    if (value == nullptr) {
        return false;
    }
    std::string_view text{value};
    return !(text == "0" || text == "false" || text == "off" || text == "no");
}

auto env_tags(char const* name) -> std::set<std::string> {
    std::set<std::string> tags;
    char const*           value = std::getenv(name);
    if (value == nullptr) {
        return tags;
    }
    std::string_view text{value};
    while (!text.empty()) {
        auto const comma = text.find(',');
        if (auto tag = text.substr(0, comma); !tag.empty()) {
            tags.emplace(tag);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        text.remove_prefix(comma + 1);
    }
    return tags;
}

// "dir/file.cpp" for a full source path.
auto short_path(char const* file) -> std::string {
    std::filesystem::path path{file};
    if (!path.has_parent_path()) {
        return path.filename().string();
    }
    return (path.parent_path().filename() / path.filename()).string();
}

} // namespace

auto logger() -> TaggedLogger& {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() {
    this->enabled = env_truthy("RENDERTREE_LOG_ENABLED") || env_truthy("RENDERTREE_LOG");
    if (env_truthy("RENDERTREE_LOG_CLEAR_DEFAULT_SKIPS")) {
        this->skipTags.clear();
    }
    this->skipTags.merge(env_tags("RENDERTREE_LOG_SKIP_TAGS"));
    this->enabledTags = env_tags("RENDERTREE_LOG_ENABLE_TAGS");
    this->worker      = std::thread(&TaggedLogger::run, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::lock_guard<std::mutex> lock(this->queueMutex);
        this->running = false;
        this->wake.notify_one();
    }
    if (this->worker.joinable()) {
        this->worker.join();
    }
}

auto TaggedLogger::setThreadName(std::string const& name) -> void {
    std::lock_guard<std::mutex> lock(this->namesMutex);
    this->threadNames[std::this_thread::get_id()] = name;
}

auto TaggedLogger::setLoggingEnabled(bool value) -> void {
    this->enabled.store(value, std::memory_order_relaxed);
}

auto TaggedLogger::setSkipTags(std::set<std::string> tags) -> void {
    std::lock_guard<std::mutex> lock(this->tagsMutex);
    this->skipTags = std::move(tags);
}

auto TaggedLogger::setEnabledTags(std::set<std::string> tags) -> void {
    std::lock_guard<std::mutex> lock(this->tagsMutex);
    this->enabledTags = std::move(tags);
}

auto TaggedLogger::flush() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex);
    this->drained.wait(lock, [this] { return this->pending.empty() && this->inFlight == 0; });
}

auto TaggedLogger::run() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex);
    while (true) {
        this->wake.wait(lock, [this] { return !this->pending.empty() || !this->running; });
        while (!this->pending.empty()) {
            auto entry = std::move(this->pending.front());
            this->pending.pop();
            ++this->inFlight;
            lock.unlock();
            this->write(entry);
            lock.lock();
            --this->inFlight;
        }
        this->drained.notify_all();
        if (!this->running) {
            return;
        }
    }
}

auto TaggedLogger::accepts(std::set<std::string> const& tags) const -> bool {
    std::lock_guard<std::mutex> lock(this->tagsMutex);
    for (auto const& tag : tags) {
        if (this->skipTags.contains(tag))
            return false;
        if (!this->enabledTags.empty() && !this->enabledTags.contains(tag))
            return false;
    }
    return true;
}

// Only the worker thread writes, so lines never interleave.
auto TaggedLogger::write(Entry const& entry) const -> void {
    if (!this->accepts(entry.tags)) {
        return;
    }
    auto const millis = std::chrono::duration_cast<std::chrono::milliseconds>(entry.timestamp.time_since_epoch()) % 1000;
    auto const time   = std::chrono::system_clock::to_time_t(entry.timestamp);
    std::tm    local{};
    localtime_r(&time, &local);

    std::ostringstream line;
    line << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis.count() << ' ';
    for (auto const& tag : entry.tags) {
        line << '[' << tag << ']';
    }
    line << " [" << entry.threadName << "] [" << short_path(entry.location.file_name()) << ':' << entry.location.line()
         << "] " << entry.message << '\n';
    std::cerr << line.str() << std::flush;
}

auto TaggedLogger::threadName(std::thread::id id) -> std::string {
    std::lock_guard<std::mutex> lock(this->namesMutex);
    auto [it, inserted] = this->threadNames.try_emplace(id);
    if (inserted) {
        it->second = "Thread " + std::to_string(this->threadNames.size() - 1);
    }
    return it->second;
}

} // namespace RT
#endif // RT_LOG_DEBUG
