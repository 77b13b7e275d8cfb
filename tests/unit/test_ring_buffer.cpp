#include "instrument-bench/data/RingBuffer.hpp"

#include <gtest/gtest.h>
#include <string>
#include <thread>

using namespace instbench;

TEST(RingBufferTest, KeepsMostRecentInOrder) {
  RingBuffer<int> buffer(3);
  for (int i = 1; i <= 7; ++i) {
    buffer.push(i);
    EXPECT_LE(buffer.size(), 3u);
  }
  EXPECT_TRUE(buffer.full());
  EXPECT_EQ((std::vector<int>{5, 6, 7}), buffer.snapshot());
  EXPECT_EQ(5, buffer.oldest().value());
  EXPECT_EQ(7, buffer.newest().value());
  EXPECT_EQ(7u, buffer.total_pushed());
  EXPECT_EQ(4u, buffer.total_evicted());
}

TEST(RingBufferTest, PushReturnsEvictedElement) {
  RingBuffer<std::string> buffer(2);
  EXPECT_FALSE(buffer.push("a").has_value());
  EXPECT_FALSE(buffer.push("b").has_value());
  EXPECT_EQ("a", buffer.push("c").value());
  EXPECT_EQ("b", buffer.push("d").value());
}

TEST(RingBufferTest, RecentReturnsTail) {
  RingBuffer<int> buffer(5);
  for (int i = 0; i < 8; ++i) {
    buffer.push(i);
  }
  EXPECT_EQ((std::vector<int>{6, 7}), buffer.recent(2));
  EXPECT_EQ((std::vector<int>{3, 4, 5, 6, 7}), buffer.recent(100));
  EXPECT_TRUE(buffer.recent(0).empty());
}

TEST(RingBufferTest, EmptyBuffer) {
  RingBuffer<int> buffer(4);
  EXPECT_TRUE(buffer.empty());
  EXPECT_FALSE(buffer.oldest().has_value());
  EXPECT_FALSE(buffer.newest().has_value());
  EXPECT_TRUE(buffer.snapshot().empty());
}

TEST(RingBufferTest, ZeroCapacityIsRejected) {
  EXPECT_THROW(RingBuffer<int>(0), UsageError);
  RingBuffer<int> buffer(2);
  EXPECT_THROW(buffer.resize(0), UsageError);
}

TEST(RingBufferTest, ClearResets) {
  RingBuffer<int> buffer(3);
  buffer.push(1);
  buffer.push(2);
  buffer.clear();
  EXPECT_TRUE(buffer.empty());
  buffer.push(9);
  EXPECT_EQ((std::vector<int>{9}), buffer.snapshot());
}

TEST(RingBufferTest, ShrinkKeepsNewest) {
  RingBuffer<int> buffer(6);
  for (int i = 1; i <= 8; ++i) {
    buffer.push(i);
  }
  EXPECT_EQ(3u, buffer.resize(3));
  EXPECT_EQ(3u, buffer.capacity());
  EXPECT_EQ((std::vector<int>{6, 7, 8}), buffer.snapshot());

  buffer.push(9);
  EXPECT_EQ((std::vector<int>{7, 8, 9}), buffer.snapshot());
}

TEST(RingBufferTest, GrowKeepsEverything) {
  RingBuffer<int> buffer(3);
  for (int i = 1; i <= 5; ++i) {
    buffer.push(i);
  }
  EXPECT_EQ(0u, buffer.resize(5));
  buffer.push(6);
  EXPECT_EQ((std::vector<int>{3, 4, 5, 6}), buffer.snapshot());
}

TEST(RingBufferTest, SelectFiltersOldestFirst) {
  RingBuffer<int> buffer(10);
  for (int i = 0; i < 10; ++i) {
    buffer.push(i);
  }
  auto even = buffer.select([](int v) { return v % 2 == 0; });
  EXPECT_EQ((std::vector<int>{0, 2, 4, 6, 8}), even);
  EXPECT_EQ((std::vector<int>{0, 2}),
            buffer.select([](int v) { return v % 2 == 0; }, 2));
}

TEST(RingBufferTest, MemoryTracksContents) {
  struct Weighted {
    size_t operator()(const std::string &s) const { return s.size(); }
  };
  RingBuffer<std::string, Weighted> buffer(2);
  size_t base = buffer.memory_bytes();
  buffer.push(std::string(100, 'x'));
  EXPECT_EQ(base + 100, buffer.memory_bytes());
  buffer.push(std::string(10, 'y'));
  buffer.push(std::string(1, 'z'));
  EXPECT_EQ(base + 11, buffer.memory_bytes());
  buffer.clear();
  EXPECT_EQ(base, buffer.memory_bytes());
}

TEST(RingBufferTest, ConcurrentWritersNeverExceedCapacity) {
  RingBuffer<int> buffer(64);
  std::vector<std::thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([&buffer, t] {
      for (int i = 0; i < 1000; ++i) {
        buffer.push(t * 1000 + i);
      }
    });
  }
  for (auto &w : writers) {
    w.join();
  }
  EXPECT_EQ(64u, buffer.size());
  EXPECT_EQ(4000u, buffer.total_pushed());
  EXPECT_EQ(4000u - 64u, buffer.total_evicted());
}
