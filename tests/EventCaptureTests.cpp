#include <gtest/gtest.h>

#include <EventCapture.hpp>

#include "Fakes.hpp"

using namespace rme;
using rme::test::FakeEventSource;
using rme::test::key_step;
using rme::test::status_step;
using rme::test::wait_until;

namespace {

  const Device KEYBOARD = test::make_device("/dev/input/event0", "Keyboard", { KEY_A, KEY_B });

}

TEST(EventCapture, DeliversSequencedClassifiedEvents) {
  FakeEventSource source;
  source.script = { key_step(KEY_A, 1), key_step(KEY_A, 2), key_step(KEY_A, 0) };

  EventQueue queue;
  auto handle = start_capture(source, KEYBOARD, queue);
  ASSERT_TRUE(wait_until([&] { return queue.size() == 3; }));
  handle->stop();

  const auto items = queue.drain();
  ASSERT_EQ(items.size(), 3u);

  const EventCategory expected[] = {
    EventCategory::KeyDown, EventCategory::KeyRepeat, EventCategory::KeyUp };
  for (std::size_t i = 0; i < items.size(); ++i) {
    const auto &event = std::get<RawEvent>(items[i]);
    EXPECT_EQ(event.sequence, i + 1);
    EXPECT_EQ(event.device_id, KEYBOARD.id);
    EXPECT_EQ(event.code, KEY_A);
    EXPECT_EQ(event.category, expected[i]);
  }
}

TEST(EventCapture, TimestampsNeverGoBackwards) {
  const auto now = std::chrono::steady_clock::now();

  FakeEventSource source;
  source.script = {
    key_step(KEY_A, 1, now),
    key_step(KEY_A, 0, now - std::chrono::milliseconds(30)),
    key_step(KEY_B, 1, now + std::chrono::milliseconds(5)),
  };

  EventQueue queue;
  auto handle = start_capture(source, KEYBOARD, queue);
  ASSERT_TRUE(wait_until([&] { return queue.size() == 3; }));
  handle->stop();

  const auto items = queue.drain();
  EXPECT_EQ(std::get<RawEvent>(items[1]).timestamp, now);
  EXPECT_EQ(std::get<RawEvent>(items[2]).timestamp, now + std::chrono::milliseconds(5));
}

TEST(EventCapture, KernelOverrunBecomesGap) {
  FakeEventSource source;
  source.script = {
    key_step(KEY_A, 1),
    status_step(EventStream::ReadStatus::Dropped),
    key_step(KEY_A, 0),
  };

  EventQueue queue;
  auto handle = start_capture(source, KEYBOARD, queue);
  ASSERT_TRUE(wait_until([&] { return queue.size() == 3; }));
  handle->stop();

  const auto items = queue.drain();
  const auto *gap = std::get_if<CaptureGap>(&items[1]);
  ASSERT_NE(gap, nullptr);
  EXPECT_EQ(gap->first_missing, 2u);
  EXPECT_EQ(gap->missing_count, 0u);
  EXPECT_EQ(sequence_of(items[2]), 3u);
}

TEST(EventCapture, OpenFailureLeavesNothingRunning) {
  FakeEventSource source;
  source.open_error = "grabbed by another process";

  EventQueue queue;
  EXPECT_THROW(start_capture(source, KEYBOARD, queue), DeviceOpenError);
  EXPECT_EQ(*source.open_streams, 0);
  EXPECT_EQ(queue.size(), 0u);
}

TEST(EventCapture, StopReleasesDeviceAndIsIdempotent) {
  FakeEventSource source;

  EventQueue queue;
  auto handle = start_capture(source, KEYBOARD, queue);
  EXPECT_TRUE(handle->is_active());
  EXPECT_EQ(*source.open_streams, 1);

  handle->stop();
  EXPECT_FALSE(handle->is_active());
  EXPECT_EQ(*source.open_streams, 0);

  EXPECT_NO_THROW(handle->stop());
}

TEST(EventCapture, NothingDeliveredAfterStop) {
  FakeEventSource source;
  for (int i = 0; i < 2000; ++i)
    source.script.push_back(key_step(KEY_A, i % 2));

  EventQueue queue(100000);
  auto handle = start_capture(source, KEYBOARD, queue);
  ASSERT_TRUE(wait_until([&] { return queue.size() > 0; }));
  handle->stop();

  const auto stopped_at = queue.size();
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(queue.size(), stopped_at);
}

TEST(EventCapture, VanishedDeviceEndsCaptureAndStopStillSucceeds) {
  FakeEventSource source;
  source.script = { key_step(KEY_A, 1) };
  source.close_at_end = true;

  EventQueue queue;
  auto handle = start_capture(source, KEYBOARD, queue);
  ASSERT_TRUE(wait_until([&] { return !handle->is_active(); }));

  EXPECT_NO_THROW(handle->stop());
  EXPECT_EQ(queue.size(), 1u);
  EXPECT_EQ(*source.open_streams, 0);
}

TEST(EventCapture, DestructionStops) {
  FakeEventSource source;
  EventQueue queue;
  {
    auto handle = start_capture(source, KEYBOARD, queue);
    EXPECT_EQ(*source.open_streams, 1);
  }
  EXPECT_EQ(*source.open_streams, 0);
}
