#include <algorithm>
#include <iterator>
#include <utility>

#include <EventQueue.hpp>

using rme::EventQueue;

EventQueue::EventQueue(std::size_t capacity)
  : _capacity(std::max<std::size_t>(capacity, 1)),
    _dropped(0)
{
}

void EventQueue::deliver(CaptureItem item) {
  std::lock_guard<std::mutex> lock(_mutex);

  if (_items.size() >= _capacity) {
    _items.pop_front();
    ++_dropped;
  }
  _items.push_back(std::move(item));
}

std::vector<rme::CaptureItem> EventQueue::drain() {
  std::lock_guard<std::mutex> lock(_mutex);

  std::vector<CaptureItem> items(std::make_move_iterator(_items.begin()),
                                 std::make_move_iterator(_items.end()));
  _items.clear();
  return items;
}

void EventQueue::clear() {
  std::lock_guard<std::mutex> lock(_mutex);
  _items.clear();
}

std::size_t EventQueue::size() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _items.size();
}

std::size_t EventQueue::get_dropped_count() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _dropped;
}
