#include <doctest/doctest.h>
#include "log/TaggedLogger.hpp"

#ifdef TS_LOG_DEBUG

#include <chrono>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

using namespace std::chrono_literals;

namespace {

auto captureStderr(std::function<void()> fn) -> std::string {
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    fn();
    std::cerr.rdbuf(original);
    return buffer.str();
}

void waitForFlush() {
    std::this_thread::sleep_for(20ms);
}

} // namespace

TEST_SUITE("log.tagged_logger") {

TEST_CASE("logging_disabled_by_default_drops_messages") {
    auto output = captureStderr([] {
        TS::TaggedLogger logger;
        logger.log_impl("should not appear", std::source_location::current(), "TestTag");
        waitForFlush();
    });

    CHECK(output.empty());
}

TEST_CASE("enabled_logger_writes_tags_thread_and_message") {
    auto output = captureStderr([] {
        TS::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.log_impl("hello log", std::source_location::current(), "TestTag");
        waitForFlush();
    });

    CHECK(output.find("[TestTag]") != std::string::npos);
    CHECK(output.find("hello log") != std::string::npos);
    CHECK(output.find("[Thread 0]") != std::string::npos);
    CHECK(output.find("test_TaggedLogger.cpp:") != std::string::npos);
}

TEST_CASE("trace_is_skipped_by_default") {
    auto output = captureStderr([] {
        TS::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.log_impl("filtered", std::source_location::current(), "Reifier", "TRACE");
        waitForFlush();
    });

    CHECK(output.empty());
}

TEST_CASE("skipped_tags_can_be_replaced") {
    auto output = captureStderr([] {
        TS::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.setSkippedTags({"Noisy"});
        logger.log_impl("dropped", std::source_location::current(), "Noisy");
        logger.log_impl("trace kept", std::source_location::current(), "TRACE");
        waitForFlush();
    });

    CHECK(output.find("dropped") == std::string::npos);
    CHECK(output.find("trace kept") != std::string::npos);
}

TEST_CASE("thread_name_is_used_in_output") {
    auto output = captureStderr([] {
        TS::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.setThreadName("Worker-7");
        logger.log_impl("with name", std::source_location::current(), "Test");
        waitForFlush();
    });

    CHECK(output.find("[Worker-7]") != std::string::npos);
}

TEST_CASE("disabling_stops_output") {
    auto output = captureStderr([] {
        TS::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.log_impl("first", std::source_location::current(), "Test");
        logger.setLoggingEnabled(false);
        logger.log_impl("second", std::source_location::current(), "Test");
        waitForFlush();
    });

    CHECK(output.find("first") != std::string::npos);
    CHECK(output.find("second") == std::string::npos);
}

TEST_CASE("global_wrappers_and_macro_emit_joined_tags") {
    auto output = captureStderr([] {
        TS::set_thread_name("WrapperThread");
        TS::set_logging_enabled(true);
        ts_log("via macro", "Alpha", "Beta");
        waitForFlush();
        TS::set_logging_enabled(false);
    });

    CHECK(output.find("[Alpha][Beta]") != std::string::npos);
    CHECK(output.find("[WrapperThread]") != std::string::npos);
    CHECK(output.find("via macro") != std::string::npos);
}

}

#endif // TS_LOG_DEBUG
