#ifdef FSI_LOG_DEBUG
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <set>
#include <source_location>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>

namespace FSI {

/**
 * Asynchronous tagged logger. Records are queued by the calling thread and
 * formatted on a background thread, so logging from inside the namespace
 * lock only costs a queue push.
 *
 * Filtering happens on the worker: a record is written when none of its tags
 * is skipped and, if an enabled set is configured, all of its tags are in it.
 */
class TaggedLogger {
public:
    using Sink = std::function<void(std::string_view line)>;

    struct LogRecord {
        std::chrono::system_clock::time_point timestamp;
        std::set<std::string>                 tags;
        std::string                           message;
        std::string                           threadName;
        std::source_location                  location;
    };

    TaggedLogger();
    ~TaggedLogger();

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;
    TaggedLogger(TaggedLogger&&)                 = delete;
    TaggedLogger& operator=(TaggedLogger&&)      = delete;

    template <typename... Tags>
    auto log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void;

    auto setThreadName(const std::string& name) -> void;
    auto setLoggingEnabled(bool enabled) -> void;
    [[nodiscard]] auto loggingEnabled() const -> bool { return enabled.load(std::memory_order_relaxed); }

    auto setEnabledTags(std::set<std::string> tags) -> void;
    auto setSkippedTags(std::set<std::string> tags) -> void;
    // Applies a filter such as "Snapshot,ImageWriter,-TreeDump": plain names
    // become the enabled set, names prefixed with '-' are added to the skipped set.
    auto applyTagFilter(std::string_view filter) -> void;

    // Replaces the output; the default writes each line to std::cerr.
    auto setSink(Sink sink) -> void;
    // Blocks until every record queued so far has been written or dropped.
    auto flush() -> void;

    static std::mutex outputMutex;

private:
    std::queue<LogRecord>   queue;
    std::size_t             inFlight = 0;
    mutable std::mutex      queueMutex;
    std::condition_variable queued;
    std::condition_variable drained;
    std::thread             worker;
    std::atomic<bool>       running;
    std::atomic<bool>       enabled;

    std::set<std::string> skippedTags{"INFO", "TreeDump"};
    std::set<std::string> enabledTags;
    Sink                  sink;
    mutable std::mutex    configMutex;

    std::unordered_map<std::thread::id, std::string> threadNames;
    mutable std::mutex                               threadNamesMutex;
    std::atomic<int>                                 nextThreadNumber;

    auto        processQueue() -> void;
    auto        write(const LogRecord& record) const -> void;
    auto        threadNameOf(const std::thread::id& id) -> std::string;
    static auto format(const LogRecord& record) -> std::string;
    static auto shortPath(const char* filepath) -> std::string;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    if (!loggingEnabled())
        return;

    auto record = LogRecord{.timestamp  = std::chrono::system_clock::now(),
                            .tags       = {std::string(std::forward<Tags>(tags))...},
                            .message    = message,
                            .threadName = threadNameOf(std::this_thread::get_id()),
                            .location   = location};

    {
        std::lock_guard<std::mutex> lock(this->queueMutex);
        this->queue.push(std::move(record));
        ++this->inFlight;
    }
    this->queued.notify_one();
}

#define fsi_log(message, ...) ::FSI::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);
// Interprets an FSIMAGE_LOG style value: "0" or empty disables logging,
// "1" enables every tag, anything else enables logging with that tag filter.
void configure_logging(std::string_view value);

} // namespace FSI

#else
#define fsi_log(message, ...) ((void)0)
#endif // FSI_LOG_DEBUG
