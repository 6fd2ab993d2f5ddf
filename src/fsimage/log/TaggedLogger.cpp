#ifdef FSI_LOG_DEBUG
#include "TaggedLogger.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace FSI {

namespace {

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
        text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t'))
        text.remove_suffix(1);
    return text;
}

} // namespace

std::mutex TaggedLogger::outputMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() : running(true), enabled(false), nextThreadNumber(0) {
    this->worker = std::thread(&TaggedLogger::processQueue, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::lock_guard<std::mutex> lock(this->queueMutex);
        this->running = false;
    }
    this->queued.notify_one();
    if (this->worker.joinable()) {
        this->worker.join();
    }
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    threadNames[std::this_thread::get_id()] = name;
}

auto TaggedLogger::setLoggingEnabled(bool value) -> void {
    enabled.store(value, std::memory_order_relaxed);
}

auto TaggedLogger::setEnabledTags(std::set<std::string> tags) -> void {
    std::lock_guard<std::mutex> lock(configMutex);
    enabledTags = std::move(tags);
}

auto TaggedLogger::setSkippedTags(std::set<std::string> tags) -> void {
    std::lock_guard<std::mutex> lock(configMutex);
    skippedTags = std::move(tags);
}

auto TaggedLogger::applyTagFilter(std::string_view filter) -> void {
    std::set<std::string> enable;
    std::set<std::string> skip;
    while (!filter.empty()) {
        auto const comma = filter.find(',');
        auto       item  = trim(filter.substr(0, comma));
        filter           = comma == std::string_view::npos ? std::string_view{} : filter.substr(comma + 1);
        if (item.empty())
            continue;
        if (item.front() == '-') {
            item.remove_prefix(1);
            if (!item.empty())
                skip.emplace(item);
        } else {
            enable.emplace(item);
        }
    }

    std::lock_guard<std::mutex> lock(configMutex);
    enabledTags = std::move(enable);
    for (auto const& tag : enabledTags)
        skippedTags.erase(tag);
    skippedTags.merge(skip);
}

auto TaggedLogger::setSink(Sink replacement) -> void {
    std::lock_guard<std::mutex> lock(configMutex);
    sink = std::move(replacement);
}

auto TaggedLogger::flush() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex);
    this->drained.wait(lock, [this] { return this->inFlight == 0; });
}

auto TaggedLogger::processQueue() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex);
    while (true) {
        this->queued.wait(lock, [this] { return !this->queue.empty() || !this->running; });
        if (this->queue.empty() && !this->running) {
            return;
        }
        while (!this->queue.empty()) {
            auto record = std::move(this->queue.front());
            this->queue.pop();
            lock.unlock();
            this->write(record);
            lock.lock();
            --this->inFlight;
        }
        this->drained.notify_all();
    }
}

auto TaggedLogger::write(const LogRecord& record) const -> void {
    Sink out;
    {
        std::lock_guard<std::mutex> lock(configMutex);
        if (!enabledTags.empty()) {
            for (auto const& tag : record.tags)
                if (!enabledTags.contains(tag))
                    return;
        }
        for (auto const& tag : record.tags)
            if (skippedTags.contains(tag))
                return;
        out = sink;
    }

    auto const line = format(record);
    if (out) {
        out(line);
        return;
    }
    std::lock_guard<std::mutex> lock(outputMutex);
    std::cerr << line << std::flush;
}

auto TaggedLogger::format(const LogRecord& record) -> std::string {
    auto const millis = std::chrono::duration_cast<std::chrono::milliseconds>(record.timestamp.time_since_epoch()) % 1000;
    auto const timeT  = std::chrono::system_clock::to_time_t(record.timestamp);
    std::tm    local{};
    localtime_r(&timeT, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis.count() << ' ';
    for (auto const& tag : record.tags)
        oss << '[' << tag << ']';
    oss << " [" << record.threadName << "] "
        << shortPath(record.location.file_name()) << ':' << record.location.line() << ": " << record.message << '\n';
    return oss.str();
}

auto TaggedLogger::shortPath(const char* filepath) -> std::string {
    std::filesystem::path path{filepath};
    if (path.has_parent_path()) {
        return (path.parent_path().filename() / path.filename()).string();
    }
    return path.filename().string();
}

auto TaggedLogger::threadNameOf(const std::thread::id& id) -> std::string {
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    if (auto it = threadNames.find(id); it != threadNames.end()) {
        return it->second;
    }
    auto name       = "Thread " + std::to_string(nextThreadNumber++);
    threadNames[id] = name;
    return name;
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool value) {
    logger().setLoggingEnabled(value);
}

void configure_logging(std::string_view value) {
    value = trim(value);
    if (value.empty() || value == "0") {
        logger().setLoggingEnabled(false);
        return;
    }
    if (value != "1") {
        logger().applyTagFilter(value);
    }
    logger().setLoggingEnabled(true);
}

} // namespace FSI
#endif // FSI_LOG_DEBUG
