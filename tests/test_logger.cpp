/// @file test_logger.cpp
/// @brief Logger setup, teardown and lazy first use from several threads.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "core/logger.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace astrolabe;

TEST_CASE("Logging before init gets the default loggers")
{
    core::Logger::shutdown();
    REQUIRE(core::Logger::get_core_logger() != nullptr);
    CHECK(core::Logger::get_core_logger()->name() == "ASTROLABE");
    CHECK(core::Logger::get_app_logger()->name() == "APP");
    CHECK(core::Logger::get_core_logger()->level() == spdlog::level::info);
}

TEST_CASE("Repeated init replaces the previous setup")
{
    core::Logger::init({.level = spdlog::level::warn});
    core::Logger::init({.level = spdlog::level::debug});
    CHECK(core::Logger::get_core_logger()->level() == spdlog::level::debug);
    CHECK(spdlog::get("ASTROLABE") == core::Logger::get_core_logger());

    core::Logger::shutdown();
    CHECK(spdlog::get("ASTROLABE") == nullptr);
}

TEST_CASE("Concurrent first use creates one pair of loggers")
{
    core::Logger::shutdown();

    constexpr int kThreads = 8;
    std::atomic<int> ready{0};
    std::atomic<int> missing{0};
    std::vector<std::thread> workers;
    for (int i = 0; i < kThreads; ++i)
    {
        workers.emplace_back([&ready, &missing] {
            ready.fetch_add(1);
            while (ready.load() < kThreads)
            {
                std::this_thread::yield();
            }
            if (!core::Logger::get_core_logger() || !core::Logger::get_app_logger())
            {
                missing.fetch_add(1);
            }
            ASL_CORE_DEBUG("worker logging");
        });
    }
    for (auto& worker : workers)
    {
        worker.join();
    }

    CHECK(missing.load() == 0);
    CHECK(spdlog::get("ASTROLABE") == core::Logger::get_core_logger());
    CHECK(spdlog::get("APP") == core::Logger::get_app_logger());
}
