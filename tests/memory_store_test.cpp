#include "kvsession/memory_store.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <thread>

using namespace kvsession;

class MemoryStoreTest : public ::testing::Test {
protected:
    MemoryStore store;
};

TEST_F(MemoryStoreTest, PutReturnsKeyAndGetReadsBack) {
    EXPECT_EQ(store.put("a1_0", "payload"), "a1_0");
    EXPECT_EQ(store.get("a1_0"), "payload");
}

TEST_F(MemoryStoreTest, PutOverwrites) {
    store.put("a1_0", "first");
    store.put("a1_0", "second");
    EXPECT_EQ(store.get("a1_0"), "second");
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(MemoryStoreTest, MissingKeyThrowsKeyNotFound) {
    try {
        store.get("missing");
        FAIL() << "expected KeyNotFound";
    } catch (const KeyNotFound& e) {
        EXPECT_EQ(e.key(), "missing");
    }
}

TEST_F(MemoryStoreTest, DeleteIsIdempotent) {
    store.put("a1_0", "x");
    EXPECT_NO_THROW(store.del("a1_0"));
    EXPECT_NO_THROW(store.del("a1_0"));
    EXPECT_FALSE(store.contains("a1_0"));
}

TEST_F(MemoryStoreTest, KeysIsASnapshot) {
    store.put("a", "1");
    store.put("b", "2");

    auto keys = store.keys();
    store.del("a");

    std::sort(keys.begin(), keys.end());
    EXPECT_EQ(keys, (std::vector<std::string>{ "a", "b" }));
    EXPECT_EQ(store.keys(), std::vector<std::string>{ "b" });
}

TEST_F(MemoryStoreTest, ConcurrentWriters) {
    const int num_threads = 8;
    const int keys_per_thread = 200;
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([this, t, keys_per_thread]() {
            for (int i = 0; i < keys_per_thread; ++i) {
                std::string key = std::to_string(t) + "_" + std::to_string(i);
                store.put(key, key);
                EXPECT_EQ(store.get(key), key);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(store.size(), static_cast<size_t>(num_threads * keys_per_thread));
}
