#ifndef REMAPEDIT_SESSION_HPP
#define REMAPEDIT_SESSION_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include <CaptureLog.hpp>
#include <Device.hpp>
#include <EventCapture.hpp>
#include <EventQueue.hpp>
#include <EventSource.hpp>
#include <RuleSet.hpp>
#include <Validator.hpp>

namespace rme {

  // Owns everything one editor window edits and observes: the rule set, the
  // bound device, and at most one live capture. All methods are called from
  // the UI thread; the capture thread only ever touches the event queue.
  class Session {
  public:
    using OnDiagnosticsChangedFn = std::function<void(const std::vector<Diagnostic> &)>;
    using OnCaptureAppendedFn = std::function<void(const CaptureLog &, std::size_t added)>;
    using OnRevisionChangedFn = std::function<void(Revision)>;
    using OnSaveReadyChangedFn = std::function<void(bool)>;

    explicit Session(EventSource &event_source,
                     std::size_t log_capacity = CaptureLog::DEFAULT_CAPACITY,
                     std::size_t queue_capacity = EventQueue::DEFAULT_CAPACITY);
    ~Session();

    Session(const Session &) = delete;
    Session &operator=(const Session &) = delete;

    void on_diagnostics_changed(OnDiagnosticsChangedFn f) { _on_diagnostics_changed = std::move(f); }
    void on_capture_appended(OnCaptureAppendedFn f) { _on_capture_appended = std::move(f); }
    void on_revision_changed(OnRevisionChangedFn f) { _on_revision_changed = std::move(f); }
    void on_save_ready_changed(OnSaveReadyChangedFn f) { _on_save_ready_changed = std::move(f); }

    // --- Lifecycle ---
    void new_session();
    // Replaces the current rule set; unsaved edits are discarded.
    void load_session(RuleSet rule_set);
    void mark_saved();

    // --- Rule editing ---
    Revision add_entry(RemapEntry entry);
    Revision remove_entry(std::size_t position);
    Revision update_entry(std::size_t position, RemapEntry entry);
    Revision set_device_selector(DeviceSelector selector);

    void bind_device(std::optional<Device> device);

    const RuleSet &get_rule_set() const { return _rule_set; }
    RuleSet snapshot() const { return _rule_set; }
    const std::optional<Device> &get_bound_device() const { return _bound_device; }
    const std::vector<Diagnostic> &get_diagnostics() const { return _diagnostics; }
    bool is_save_ready() const { return _save_ready; }
    bool has_unsaved_changes() const { return _rule_set.get_revision() != _saved_revision; }

    // --- Capture ---
    // Stops any running capture first. Throws DeviceOpenError.
    void start_capture(const Device &device);
    void stop_capture();
    bool is_capturing() const;

    // Moves queued capture items into the log. Returns the entries added.
    std::size_t pump_events();
    void clear_capture_log();

    const CaptureLog &get_capture_log() const { return _capture_log; }
    // Candidate input code for the entry being authored.
    std::optional<KeyCode> get_last_key_down() const { return _last_key_down; }

  private:
    EventSource &_event_source;

    RuleSet _rule_set;
    Revision _saved_revision;
    std::optional<Device> _bound_device;
    std::vector<Diagnostic> _diagnostics;
    bool _save_ready;

    EventQueue _event_queue;
    CaptureLog _capture_log;
    std::unique_ptr<CaptureHandle> _capture;
    std::optional<KeyCode> _last_key_down;

    OnDiagnosticsChangedFn _on_diagnostics_changed;
    OnCaptureAppendedFn _on_capture_appended;
    OnRevisionChangedFn _on_revision_changed;
    OnSaveReadyChangedFn _on_save_ready_changed;

    Revision mutated(Revision revision);
    void revalidate();
  };

}

#endif //REMAPEDIT_SESSION_HPP
