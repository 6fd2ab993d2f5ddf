#include "log/TaggedLogger.hpp"

#include <doctest/doctest.h>

#include <mutex>
#include <string>
#include <thread>
#include <vector>

#ifdef FSI_LOG_DEBUG

namespace {

struct CapturedLines {
    std::mutex               mutex;
    std::vector<std::string> lines;

    auto attach(FSI::TaggedLogger& logger) -> void {
        logger.setSink([this](std::string_view line) {
            std::lock_guard<std::mutex> lock(mutex);
            lines.emplace_back(line);
        });
    }
    auto contains(std::string_view needle) -> bool {
        std::lock_guard<std::mutex> lock(mutex);
        for (auto const& line : lines)
            if (line.find(needle) != std::string::npos)
                return true;
        return false;
    }
    auto size() -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex);
        return lines.size();
    }
};

} // namespace

TEST_SUITE_BEGIN("log.tagged_logger");

TEST_CASE("records are dropped while logging is disabled") {
    CapturedLines     captured;
    FSI::TaggedLogger logger;
    captured.attach(logger);
    logger.log_impl("should not appear", std::source_location::current(), "Snapshot");
    logger.flush();
    CHECK(captured.size() == 0);
}

TEST_CASE("a written line carries tags, thread, location and message") {
    CapturedLines     captured;
    FSI::TaggedLogger logger;
    captured.attach(logger);
    logger.setLoggingEnabled(true);
    logger.setThreadName("Saver");
    logger.log_impl("saved image", std::source_location::current(), "ImageWriter");
    logger.flush();

    REQUIRE(captured.size() == 1);
    CHECK(captured.contains("[ImageWriter]"));
    CHECK(captured.contains("[Saver]"));
    CHECK(captured.contains("log/test_TaggedLogger.cpp:"));
    CHECK(captured.contains(": saved image\n"));
}

TEST_CASE("tree dumps and INFO are skipped by default") {
    CapturedLines     captured;
    FSI::TaggedLogger logger;
    captured.attach(logger);
    logger.setLoggingEnabled(true);
    logger.log_impl("/ dir fsimage:supergroup", std::source_location::current(), "TreeDump");
    logger.log_impl("chatter", std::source_location::current(), "INFO");
    logger.log_impl("loaded", std::source_location::current(), "ImageLoader");
    logger.flush();
    CHECK(captured.size() == 1);
    CHECK(captured.contains("loaded"));
}

TEST_CASE("enabled tags gate output") {
    CapturedLines     captured;
    FSI::TaggedLogger logger;
    captured.attach(logger);
    logger.setLoggingEnabled(true);
    logger.setEnabledTags({"Snapshot"});
    logger.log_impl("keep me", std::source_location::current(), "Snapshot");
    logger.log_impl("drop me", std::source_location::current(), "Namesystem");
    logger.log_impl("drop me too", std::source_location::current(), "Snapshot", "ERROR");
    logger.flush();
    CHECK(captured.contains("keep me"));
    CHECK_FALSE(captured.contains("drop me"));
}

TEST_CASE("tag filters enable names and skip dashed names") {
    CapturedLines     captured;
    FSI::TaggedLogger logger;
    captured.attach(logger);
    logger.setLoggingEnabled(true);

    SUBCASE("enabling a default-skipped tag lets it through") {
        logger.applyTagFilter("TreeDump, Snapshot");
        logger.log_impl("/d dir", std::source_location::current(), "TreeDump");
        logger.log_impl("created s0", std::source_location::current(), "Snapshot");
        logger.log_impl("mkdirs /d", std::source_location::current(), "Namesystem");
        logger.flush();
        CHECK(captured.contains("/d dir"));
        CHECK(captured.contains("created s0"));
        CHECK_FALSE(captured.contains("mkdirs"));
    }
    SUBCASE("a dashed name only skips") {
        logger.applyTagFilter("-Namesystem,,");
        logger.log_impl("mkdirs /d", std::source_location::current(), "Namesystem");
        logger.log_impl("checksum mismatch", std::source_location::current(), "ImageLoader", "ERROR");
        logger.flush();
        CHECK(captured.size() == 1);
        CHECK(captured.contains("checksum mismatch"));
    }
}

TEST_CASE("flush waits for records queued from several threads") {
    CapturedLines     captured;
    FSI::TaggedLogger logger;
    captured.attach(logger);
    logger.setLoggingEnabled(true);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&logger] {
            for (int i = 0; i < 25; ++i)
                logger.log_impl("write", std::source_location::current(), "Namesystem");
        });
    }
    for (auto& thread : threads)
        thread.join();
    logger.flush();
    CHECK(captured.size() == 100);
}

TEST_SUITE_END();

#endif // FSI_LOG_DEBUG
