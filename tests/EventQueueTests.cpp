#include <thread>

#include <gtest/gtest.h>
#include <linux/input-event-codes.h>

#include <EventQueue.hpp>

using namespace rme;

namespace {

  RawEvent key_event(Sequence sequence) {
    return RawEvent::create("dev", EV_KEY, KEY_A, 1, std::chrono::steady_clock::now(), sequence);
  }

}

TEST(EventQueue, DrainReturnsItemsInOrder) {
  EventQueue queue(8);
  for (Sequence s = 1; s <= 3; ++s)
    queue.deliver(key_event(s));

  const auto items = queue.drain();
  ASSERT_EQ(items.size(), 3u);
  for (std::size_t i = 0; i < items.size(); ++i)
    EXPECT_EQ(sequence_of(items[i]), i + 1);
  EXPECT_EQ(queue.size(), 0u);
}

TEST(EventQueue, OverflowDropsOldest) {
  EventQueue queue(3);
  for (Sequence s = 1; s <= 5; ++s)
    queue.deliver(key_event(s));

  EXPECT_EQ(queue.get_dropped_count(), 2u);
  const auto items = queue.drain();
  ASSERT_EQ(items.size(), 3u);
  EXPECT_EQ(sequence_of(items.front()), 3u);
  EXPECT_EQ(sequence_of(items.back()), 5u);
}

TEST(EventQueue, ConcurrentProducerLosesNothingWithinCapacity) {
  EventQueue queue(10000);
  std::thread producer([&] {
    for (Sequence s = 1; s <= 5000; ++s)
      queue.deliver(key_event(s));
  });

  std::vector<CaptureItem> received;
  while (received.size() < 5000) {
    auto items = queue.drain();
    received.insert(received.end(), items.begin(), items.end());
  }
  producer.join();

  for (std::size_t i = 0; i < received.size(); ++i)
    ASSERT_EQ(sequence_of(received[i]), i + 1);
}
