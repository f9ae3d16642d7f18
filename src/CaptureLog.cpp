#include <algorithm>
#include <utility>

#include <CaptureLog.hpp>

using rme::CaptureLog;

CaptureLog::CaptureLog(std::size_t capacity)
  : _capacity(std::max<std::size_t>(capacity, 1)),
    _next_expected(1),
    _evicted(0)
{
}

std::size_t CaptureLog::append(CaptureItem item) {
  std::size_t added = 0;
  const auto sequence = sequence_of(item);

  if (sequence > _next_expected) {
    push(CaptureGap { _next_expected, sequence - _next_expected });
    ++added;
  }

  // A kernel overrun marker owns one sequence number; a detected gap spans
  // the numbers it reports.
  Sequence next = sequence + 1;
  if (const auto *gap = std::get_if<CaptureGap>(&item))
    next = gap->first_missing + std::max<std::uint64_t>(gap->missing_count, 1);
  _next_expected = std::max(next, _next_expected);

  push(std::move(item));
  return added + 1;
}

void CaptureLog::clear() {
  discard_entries();
  _next_expected = 1;
}

void CaptureLog::discard_entries() {
  _entries.clear();
  _evicted = 0;
}

void CaptureLog::push(CaptureItem item) {
  if (_entries.size() >= _capacity) {
    _entries.pop_front();
    ++_evicted;
  }
  _entries.push_back(std::move(item));
}
