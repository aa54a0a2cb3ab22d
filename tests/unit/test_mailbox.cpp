/**
 * @file test_mailbox.cpp
 * @brief Unit tests for the bounded MPSC mailbox.
 */

#include "analytics/mailbox.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace search_analytics;
using namespace std::chrono_literals;

TEST(MailboxTest, FifoOrder) {
    BoundedMailbox<int> mailbox(4);
    EXPECT_TRUE(mailbox.try_send(1));
    EXPECT_TRUE(mailbox.try_send(2));

    std::stop_source stop;
    auto deadline = std::chrono::steady_clock::now() + 1s;
    EXPECT_EQ(mailbox.receive_until(deadline, stop.get_token()), 1);
    EXPECT_EQ(mailbox.receive_until(deadline, stop.get_token()), 2);
}

TEST(MailboxTest, FullMailboxDropsWithoutBlocking) {
    BoundedMailbox<int> mailbox(100);
    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(mailbox.try_send(i));
    }

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(mailbox.try_send(100));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, 100ms);
    EXPECT_EQ(mailbox.size(), 100u);
    EXPECT_EQ(mailbox.dropped(), 1u);
}

TEST(MailboxTest, ReceiveTimesOutWhenEmpty) {
    BoundedMailbox<int> mailbox(1);
    std::stop_source stop;
    auto result = mailbox.receive_until(std::chrono::steady_clock::now() + 20ms,
                                        stop.get_token());
    EXPECT_FALSE(result.has_value());
}

TEST(MailboxTest, StopRequestWakesReceiver) {
    BoundedMailbox<int> mailbox(1);
    std::stop_source stop;

    std::thread stopper([&] {
        std::this_thread::sleep_for(20ms);
        stop.request_stop();
    });

    auto start = std::chrono::steady_clock::now();
    auto result = mailbox.receive_until(std::chrono::steady_clock::now() + 10s, stop.get_token());
    auto elapsed = std::chrono::steady_clock::now() - start;
    stopper.join();

    EXPECT_FALSE(result.has_value());
    EXPECT_LT(elapsed, 5s);
}

TEST(MailboxTest, ConcurrentProducersSingleConsumer) {
    constexpr int kProducers = 4;
    constexpr int kPerProducer = 500;
    BoundedMailbox<int> mailbox(16);
    std::atomic<int> accepted{0};

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&] {
            for (int i = 0; i < kPerProducer; ++i) {
                if (mailbox.try_send(i)) ++accepted;
            }
        });
    }

    std::stop_source stop;
    std::atomic<bool> producers_done{false};
    int received = 0;
    std::thread consumer([&] {
        while (true) {
            auto msg = mailbox.receive_until(std::chrono::steady_clock::now() + 20ms,
                                             stop.get_token());
            if (msg) {
                ++received;
            } else if (producers_done.load() && mailbox.size() == 0) {
                break;
            }
        }
    });

    for (auto& t : producers) t.join();
    producers_done.store(true);
    consumer.join();

    EXPECT_EQ(received, accepted.load());
    EXPECT_EQ(static_cast<uint64_t>(accepted.load()) + mailbox.dropped(),
              static_cast<uint64_t>(kProducers * kPerProducer));
}
