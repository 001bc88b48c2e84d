#include <gtest/gtest.h>
#include <ThreadSafeMap.hpp>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

struct Counter {
    int value;
    std::string label;

    Counter(int v = 0, const std::string& l = "") : value(v), label(l) {}
};

class ThreadSafeMapTest : public ::testing::Test {
protected:
    ThreadSafeMap<int64_t, Counter> map;
};

TEST_F(ThreadSafeMapTest, InsertFindAndErase) {
    map.insert(265598, std::make_shared<Counter>(1, "AAPL"));

    auto found = map.find(265598);
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->label, "AAPL");

    EXPECT_TRUE(map.erase(265598));
    EXPECT_FALSE(map.erase(265598));
    EXPECT_EQ(map.find(265598), nullptr);
}

TEST_F(ThreadSafeMapTest, ComputeCreatesWhenAbsent) {
    auto result = map.compute(7, [](std::shared_ptr<Counter> current) {
        EXPECT_EQ(current, nullptr);
        return std::make_shared<Counter>(1, "created");
    });

    ASSERT_NE(result, nullptr);
    EXPECT_EQ(map.find(7)->label, "created");
}

TEST_F(ThreadSafeMapTest, ComputeReturningNullErasesKey) {
    map.insert(7, std::make_shared<Counter>(3));

    auto result = map.compute(7, [](std::shared_ptr<Counter>) { return std::shared_ptr<Counter>(); });

    EXPECT_EQ(result, nullptr);
    EXPECT_FALSE(map.contains(7));
    EXPECT_EQ(map.size(), 0u);
}

TEST_F(ThreadSafeMapTest, ValuesReturnsSnapshot) {
    map.insert(1, std::make_shared<Counter>(10));
    map.insert(2, std::make_shared<Counter>(20));

    auto values = map.values();
    map.clear();

    EXPECT_EQ(values.size(), 2u);
    EXPECT_EQ(map.size(), 0u);
}

// compute(): атомарный read-modify-write: инкременты не теряются
TEST_F(ThreadSafeMapTest, ConcurrentComputeLosesNoUpdates) {
    const int THREADS = 8;
    const int INCREMENTS = 250;

    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([this]() {
            for (int i = 0; i < INCREMENTS; ++i) {
                map.compute(42, [](std::shared_ptr<Counter> current) {
                    int next = current ? current->value + 1 : 1;
                    return std::make_shared<Counter>(next, "shared");
                });
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    auto found = map.find(42);
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->value, THREADS * INCREMENTS);
}

TEST_F(ThreadSafeMapTest, ConcurrentReadersAlwaysSeeValue) {
    map.insert(1, std::make_shared<Counter>(0));

    std::atomic<int> reads(0);
    std::vector<std::thread> threads;

    for (int writer = 0; writer < 4; ++writer) {
        threads.emplace_back([this, writer]() {
            for (int i = 0; i < 50; ++i) {
                map.insert(1, std::make_shared<Counter>(writer * 100 + i));
            }
        });
    }
    for (int reader = 0; reader < 4; ++reader) {
        threads.emplace_back([this, &reads]() {
            for (int i = 0; i < 100; ++i) {
                ASSERT_NE(map.find(1), nullptr);
                reads++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(reads, 400);
}
