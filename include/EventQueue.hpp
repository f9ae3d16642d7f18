#ifndef REMAPEDIT_EVENTQUEUE_HPP
#define REMAPEDIT_EVENTQUEUE_HPP

#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

#include <RawEvent.hpp>

namespace rme {

  class CaptureSink {
  public:
    virtual ~CaptureSink() = default;

    // Called from the capture thread; must not block.
    virtual void deliver(CaptureItem item) = 0;
  };

  // Bounded hand-off between the capture thread and the session. When full,
  // the oldest item is dropped; the consumer sees the sequence gap.
  class EventQueue : public CaptureSink {
  public:
    static constexpr std::size_t DEFAULT_CAPACITY = 4096;

    explicit EventQueue(std::size_t capacity = DEFAULT_CAPACITY);

    void deliver(CaptureItem item) override;

    std::vector<CaptureItem> drain();
    void clear();

    std::size_t size() const;
    std::size_t get_capacity() const { return _capacity; }
    std::size_t get_dropped_count() const;

  private:
    const std::size_t _capacity;
    mutable std::mutex _mutex;
    std::deque<CaptureItem> _items;
    std::size_t _dropped;
  };

}

#endif //REMAPEDIT_EVENTQUEUE_HPP
