// SPDX-License-Identifier: GPL-2.0-or-later
#include <chrono>
#include <optional>
#include <set>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "async/channel.h"
using namespace Svgfx::Async;

namespace {

auto soon(int ms = 1000)
{
    return std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
}

} // namespace

TEST(Channel, DeliversInOrder)
{
    auto [src, dst] = Channel::create<int>();

    EXPECT_TRUE(src);
    EXPECT_TRUE(dst);

    EXPECT_TRUE(src.send(1));
    EXPECT_TRUE(src.send(2));
    EXPECT_TRUE(src.send(3));

    std::vector<int> results;
    for (int i = 0; i < 3; i++) {
        auto value = dst.receive_until(soon());
        ASSERT_TRUE(value);
        results.push_back(*value);
    }

    EXPECT_EQ(results, (std::vector<int>{ 1, 2, 3 }));
}

TEST(Channel, ReceiveTimesOut)
{
    auto [src, dst] = Channel::create<int>();

    auto const start = std::chrono::steady_clock::now();
    auto value = dst.receive_until(start + std::chrono::milliseconds(50));

    EXPECT_FALSE(value);
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(50));
    EXPECT_TRUE(src); // timing out does not close the channel
}

TEST(Channel, CloseDropsValues)
{
    auto test_one = [] (bool soft_close) {
        std::optional<Channel::Source<int>> src;
        std::optional<Channel::Dest<int>> dst;
        std::tie(src, dst) = Channel::create<int>();

        EXPECT_TRUE(src->send(1));

        if (soft_close) {
            dst->close();
            EXPECT_FALSE(*dst);
        } else {
            dst.reset();
        }

        EXPECT_FALSE(*src);
        EXPECT_FALSE(src->send(2));
    };

    test_one(true);
    test_one(false);
}

TEST(Channel, ClosedSourceCannotSend)
{
    auto [src, dst] = Channel::create<int>();
    auto copy = src;

    src.close();
    EXPECT_FALSE(src);
    EXPECT_FALSE(src.send(1));

    // Other copies keep the channel open.
    EXPECT_TRUE(copy.send(2));
    auto value = dst.receive_until(soon());
    ASSERT_TRUE(value);
    EXPECT_EQ(*value, 2);
}

TEST(Channel, ManySenders)
{
    constexpr int N = 8;
    constexpr int PER_THREAD = 100;

    auto [src, dst] = Channel::create<int>();

    std::vector<std::thread> threads;
    for (int t = 0; t < N; t++) {
        threads.emplace_back([src = src, t] {
            for (int i = 0; i < PER_THREAD; i++) {
                src.send(t * PER_THREAD + i);
            }
        });
    }

    std::set<int> seen;
    for (int i = 0; i < N * PER_THREAD; i++) {
        auto value = dst.receive_until(soon(5000));
        ASSERT_TRUE(value);
        seen.insert(*value);
    }

    for (auto &thread : threads) {
        thread.join();
    }

    EXPECT_EQ(seen.size(), static_cast<std::size_t>(N * PER_THREAD));
}
