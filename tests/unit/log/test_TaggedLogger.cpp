#include <doctest/doctest.h>

#ifdef KD_LOG_DEBUG
#include <kmsdash/log/TaggedLogger.hpp>

#include <chrono>
#include <functional>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

using namespace std::chrono_literals;

namespace {

auto captureStderr(std::function<void()> fn) -> std::string {
    std::ostringstream buffer;
    std::streambuf*    original = nullptr;
    {
        std::lock_guard<std::mutex> lock(KD::TaggedLogger::coutMutex);
        original = std::cerr.rdbuf(buffer.rdbuf());
    }
    fn();
    std::this_thread::sleep_for(50ms);
    {
        std::lock_guard<std::mutex> lock(KD::TaggedLogger::coutMutex);
        std::cerr.rdbuf(original);
    }
    return buffer.str();
}

} // namespace

TEST_SUITE("log.tagged_logger") {

TEST_CASE("logging_disabled_by_default_drops_messages") {
    auto output = captureStderr([] {
        KD::TaggedLogger logger;
        logger.log_impl("should not appear", std::source_location::current(), "Supervisor");
    });
    CHECK(output.empty());
}

TEST_CASE("enabled_logger_writes_tags_and_thread") {
    auto output = captureStderr([] {
        KD::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.setThreadName("Request-1");
        logger.log_impl("child started", std::source_location::current(), "Supervisor", "Alpha");
    });
    CHECK(output.find("[Alpha][Supervisor]") != std::string::npos);
    CHECK(output.find("[Request-1]") != std::string::npos);
    CHECK(output.find("child started") != std::string::npos);
}

TEST_CASE("no_tags_are_skipped_by_default") {
    auto output = captureStderr([] {
        KD::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.log_impl("appended audit line", std::source_location::current(), "LogSink");
    });
    CHECK(output.find("[LogSink]") != std::string::npos);
    CHECK(output.find("appended audit line") != std::string::npos);
}

TEST_CASE("skipped_tags_can_be_replaced") {
    auto output = captureStderr([] {
        KD::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.setSkippedTags({"Catalog"});
        logger.log_impl("dropped", std::source_location::current(), "Catalog");
        logger.log_impl("tail read", std::source_location::current(), "LogSink");
    });
    CHECK(output.find("dropped") == std::string::npos);
    CHECK(output.find("tail read") != std::string::npos);
}

TEST_CASE("short_path_includes_parent_directory") {
    auto output = captureStderr([] {
        KD::TaggedLogger logger;
        logger.setLoggingEnabled(true);
#line 42 "dir/subdir/TaggedLoggerChild.cpp"
        logger.log_impl("has parent", std::source_location::current(), "Solo");
#line 90 "tests/unit/log/test_TaggedLogger.cpp"
    });
    CHECK(output.find("subdir/TaggedLoggerChild.cpp:42") != std::string::npos);
}

} // TEST_SUITE
#endif // KD_LOG_DEBUG
