#include "bitsd/network/http_server_asio.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>

using namespace bitsd::network;

TEST(RunIoContextTest, ReturnsWhenWorkIsDone) {
    asio::io_context io_context;
    std::atomic<int> handled{0};
    for (int i = 0; i < 8; ++i) {
        asio::post(io_context, [&handled] { handled++; });
    }

    run_io_context(io_context, 4);
    EXPECT_EQ(handled.load(), 8);
}

TEST(RunIoContextTest, ThrowingHandlerStopsEveryThread) {
    asio::io_context io_context;
    // Keeps idle threads blocked in run() until stop() releases them
    auto guard = asio::make_work_guard(io_context);
    asio::post(io_context, [] { throw std::runtime_error("handler failed"); });

    run_io_context(io_context, 3);
    EXPECT_TRUE(io_context.stopped());
}

TEST(RunIoContextTest, SingleThreadRunsOnCaller) {
    asio::io_context io_context;
    auto guard = asio::make_work_guard(io_context);
    asio::post(io_context, [] { throw std::logic_error("handler failed"); });

    EXPECT_NO_THROW(run_io_context(io_context, 1));
    EXPECT_TRUE(io_context.stopped());
}
