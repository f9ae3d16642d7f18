#include <Log.hpp>
#include <Session.hpp>

using rme::Session;

Session::Session(EventSource &event_source, std::size_t log_capacity, std::size_t queue_capacity)
  : _event_source(event_source),
    _saved_revision(0),
    _save_ready(false),
    _event_queue(queue_capacity),
    _capture_log(log_capacity)
{
  revalidate();
}

Session::~Session() {
  stop_capture();
}

void Session::new_session() {
  load_session(RuleSet());
}

void Session::load_session(RuleSet rule_set) {
  _rule_set = std::move(rule_set);
  _saved_revision = _rule_set.get_revision();

  REMAPEDIT_LOG_DEBUG("Session reset with " << _rule_set.size() << " entries");
  if (_on_revision_changed)
    _on_revision_changed(_rule_set.get_revision());
  revalidate();
}

void Session::mark_saved() {
  _saved_revision = _rule_set.get_revision();
}

rme::Revision Session::add_entry(RemapEntry entry) {
  return mutated(_rule_set.add_entry(std::move(entry)));
}

rme::Revision Session::remove_entry(std::size_t position) {
  return mutated(_rule_set.remove_entry(position));
}

rme::Revision Session::update_entry(std::size_t position, RemapEntry entry) {
  return mutated(_rule_set.update_entry(position, std::move(entry)));
}

rme::Revision Session::set_device_selector(DeviceSelector selector) {
  return mutated(_rule_set.set_device_selector(std::move(selector)));
}

void Session::bind_device(std::optional<Device> device) {
  _bound_device = std::move(device);
  revalidate();
}

void Session::start_capture(const Device &device) {
  stop_capture();

  _event_queue.clear();
  _capture_log.clear();
  _last_key_down.reset();

  _capture = rme::start_capture(_event_source, device, _event_queue);
}

void Session::stop_capture() {
  if (!_capture)
    return;

  _capture->stop();
  _capture.reset();
  // Items delivered before the stop still belong to the log.
  pump_events();
}

bool Session::is_capturing() const {
  return _capture && _capture->is_active();
}

std::size_t Session::pump_events() {
  auto items = _event_queue.drain();
  if (items.empty())
    return 0;

  std::size_t added = 0;
  for (auto &item : items) {
    if (const auto *event = std::get_if<RawEvent>(&item)) {
      if (event->category == EventCategory::KeyDown)
        _last_key_down = event->code;
    }
    added += _capture_log.append(std::move(item));
  }

  if (_on_capture_appended)
    _on_capture_appended(_capture_log, added);
  return added;
}

void Session::clear_capture_log() {
  // Queued items still advance the expected sequence, or the next event
  // would show up as a gap.
  for (auto &item : _event_queue.drain())
    _capture_log.append(std::move(item));
  _capture_log.discard_entries();
}

rme::Revision Session::mutated(Revision revision) {
  if (_on_revision_changed)
    _on_revision_changed(revision);
  revalidate();
  return revision;
}

void Session::revalidate() {
  const bool was_ready = _save_ready;

  _diagnostics = validate(_rule_set, _bound_device ? &*_bound_device : nullptr);
  _save_ready = rme::is_save_ready(_diagnostics);

  if (_on_diagnostics_changed)
    _on_diagnostics_changed(_diagnostics);
  if (_save_ready != was_ready && _on_save_ready_changed)
    _on_save_ready_changed(_save_ready);
}
