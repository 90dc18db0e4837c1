#include "gtest/gtest.h"

#include <chrono>
#include <boost/asio.hpp>

#include "Deadline.hpp"

TEST(deadline, cancels_hung_operation)
{
    boost::asio::io_context io;

    // Stands in for a lookup that never answers.
    boost::asio::steady_timer hung(io, std::chrono::seconds(30));
    boost::system::error_code outcome;
    bool completed = false;
    hung.async_wait([&](boost::system::error_code const& ec) { outcome = ec; completed = true; });

    Deadline deadline(io.get_executor(), std::chrono::milliseconds(20), [&hung] { hung.cancel(); });

    auto start = std::chrono::steady_clock::now();
    io.run();

    EXPECT_TRUE(completed);
    EXPECT_EQ(boost::asio::error::operation_aborted, outcome);
    EXPECT_TRUE(deadline.expired());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST(deadline, prompt_operation_is_left_alone)
{
    boost::asio::io_context io;

    boost::asio::steady_timer quick(io, std::chrono::milliseconds(5));
    int cancellations = 0;
    Deadline deadline(io.get_executor(), std::chrono::seconds(30), [&cancellations] { ++cancellations; });

    boost::system::error_code outcome;
    quick.async_wait([&](boost::system::error_code const& ec)
    {
        outcome = ec;
        deadline.disarm();
    });

    auto start = std::chrono::steady_clock::now();
    io.run();

    EXPECT_FALSE(outcome);
    EXPECT_FALSE(deadline.expired());
    EXPECT_EQ(0, cancellations);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}
