#ifndef REMAPEDIT_CAPTURELOG_HPP
#define REMAPEDIT_CAPTURELOG_HPP

#include <cstddef>
#include <deque>

#include <RawEvent.hpp>

namespace rme {

  // The last N captured items in sequence order. Capture can run for as long
  // as the editor is open, so memory is bounded by the capacity.
  class CaptureLog {
  public:
    static constexpr std::size_t DEFAULT_CAPACITY = 1000;

    explicit CaptureLog(std::size_t capacity = DEFAULT_CAPACITY);

    // Returns the number of entries added: an event that skips sequence
    // numbers is preceded by a gap marker. Captures number from 1, so a first
    // item numbered later is preceded by one too.
    std::size_t append(CaptureItem item);
    // Starts over for a new capture.
    void clear();
    // Drops the shown entries but keeps following the current capture.
    void discard_entries();

    const std::deque<CaptureItem> &get_entries() const { return _entries; }
    std::size_t size() const { return _entries.size(); }
    bool empty() const { return _entries.empty(); }
    std::size_t get_capacity() const { return _capacity; }

    // Total entries evicted since the last clear().
    std::size_t get_evicted_count() const { return _evicted; }

  private:
    const std::size_t _capacity;
    std::deque<CaptureItem> _entries;
    Sequence _next_expected;
    std::size_t _evicted;

    void push(CaptureItem item);
  };

}

#endif //REMAPEDIT_CAPTURELOG_HPP
