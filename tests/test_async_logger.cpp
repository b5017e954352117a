#include <doctest/doctest.h>
#include "logging/logger/async_logger.hpp"
#include <cstdio>
#include <fstream>
#include <thread>
#include <unistd.h>

using namespace MeshBridge::Logging;

TEST_CASE("timestamped log filename keeps stem and extension") {
    std::string log_path = generate_timestamped_log_filename("runtime_logs/run_x", "mesh_bridge.log");
    CHECK(log_path.rfind("runtime_logs/run_x/mesh_bridge_", 0) == 0);
    CHECK(log_path.size() > std::string(".log").size());
    CHECK(log_path.substr(log_path.size() - 4) == ".log");
}

TEST_CASE("thread tags are padded, truncated and per thread") {
    LoggingContext context;
    CHECK(context.get_thread_tag() == "MAIN  ");

    context.set_thread_tag("LINK-A");
    CHECK(context.get_thread_tag() == "LINK-A");
    context.set_thread_tag("HEALTHMON");
    CHECK(context.get_thread_tag() == "HEALTH");
    context.set_thread_tag("LOG");
    CHECK(context.get_thread_tag() == "LOG   ");

    std::string other_thread_tag;
    std::thread other_thread([&context, &other_thread_tag] { other_thread_tag = context.get_thread_tag(); });
    other_thread.join();
    CHECK(other_thread_tag == "MAIN  ");

    context.clear_thread_tag();
    CHECK(context.get_thread_tag() == "MAIN  ");
}

TEST_CASE("queued lines are drained in order") {
    AsyncLogger logger("unused.log");
    logger.running.store(true);
    logger.enqueue("first\n");
    logger.enqueue("second\n");

    std::vector<std::string> message_buffer;
    logger.wait_for_messages(message_buffer, std::chrono::milliseconds(10));
    REQUIRE(message_buffer.size() == 2);
    CHECK(message_buffer[0] == "first\n");
    CHECK(message_buffer[1] == "second\n");

    message_buffer.clear();
    logger.collect_all_available_messages(message_buffer);
    CHECK(message_buffer.empty());
}

TEST_CASE("stop wakes a waiting logging thread") {
    AsyncLogger logger("unused.log");
    logger.running.store(true);

    std::vector<std::string> message_buffer;
    std::chrono::steady_clock::time_point wait_started = std::chrono::steady_clock::now();
    std::thread waiter([&logger, &message_buffer] {
        logger.wait_for_messages(message_buffer, std::chrono::seconds(10));
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    shutdown_global_logger(logger);
    waiter.join();

    CHECK_FALSE(logger.running.load());
    CHECK(message_buffer.empty());
    CHECK(std::chrono::steady_clock::now() - wait_started < std::chrono::seconds(5));
}

TEST_CASE("flushed batch lands in the log file and the buffer is cleared") {
    std::string log_path = "/tmp/mesh_bridge_logger_test_" + std::to_string(::getpid()) + ".log";
    std::remove(log_path.c_str());

    AsyncLogger logger(log_path);
    std::vector<std::string> message_buffer;
    message_buffer.push_back("line one\n");
    message_buffer.push_back("2026-01-01 00:00:00 [MAIN  ]   ERROR: line two\n");
    {
        std::ofstream log_file(logger.get_file_path(), std::ios::app);
        logger.flush_message_buffer(message_buffer, log_file);
    }
    CHECK(message_buffer.empty());

    std::ifstream written(log_path);
    std::string first_line;
    std::string second_line;
    std::getline(written, first_line);
    std::getline(written, second_line);
    CHECK(first_line == "line one");
    CHECK(second_line.find("ERROR: line two") != std::string::npos);
    std::remove(log_path.c_str());
}
