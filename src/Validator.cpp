#include <algorithm>
#include <set>

#include <Validator.hpp>

using rme::Diagnostic;
using rme::DiagnosticKind;
using rme::KeyCode;
using rme::RemapEntry;
using rme::Severity;

namespace {

  template <typename... Fs>
  struct overloaded : Fs... {
    using Fs::operator()...;
  };
  template <typename... Fs>
  overloaded(Fs...) -> overloaded<Fs...>;

  std::string describe(KeyCode code) {
    if (auto name = rme::key_name(code))
      return std::string(*name);
    return "code " + std::to_string(code);
  }

  class DiagnosticList {
  public:
    void error(DiagnosticKind kind, std::optional<std::size_t> entry, std::string message) {
      _diagnostics.push_back({ Severity::Error, entry, std::move(message), kind });
    }

    void warning(DiagnosticKind kind, std::optional<std::size_t> entry, std::string message) {
      _diagnostics.push_back({ Severity::Warning, entry, std::move(message), kind });
    }

    std::vector<Diagnostic> take() { return std::move(_diagnostics); }

  private:
    std::vector<Diagnostic> _diagnostics;
  };

  void check_output(DiagnosticList &out, std::size_t position, const char *role,
                    const rme::KeyCombination &keys) {
    if (keys.empty())
      out.error(DiagnosticKind::EmptyKeyCombination, position, std::string(role) + " has no keys");

    for (const auto key : keys.to_keys()) {
      if (!rme::is_valid_key_code(key))
        out.error(DiagnosticKind::InvalidOutputCode, position,
                  std::string(role) + " " + describe(key) + " is not a valid key code");
    }
  }

  void check_entry(DiagnosticList &out, std::size_t position, const RemapEntry &entry,
                   const rme::Device *device) {
    const auto input = rme::input_of(entry);
    if (input.empty())
      out.error(DiagnosticKind::EmptyKeyCombination, position, "Input has no keys");

    for (const auto key : input.to_keys()) {
      if (!rme::is_valid_key_code(key)) {
        out.error(DiagnosticKind::InvalidInputCode, position,
                  "Input " + describe(key) + " is not a valid key code");
      } else if (device && device->available && !device->capabilities.supports_key(key)) {
        out.error(DiagnosticKind::InputNotSupported, position,
                  "Input " + describe(key) + " is not reported by " + device->label);
      }
    }

    // Outputs are checked against the static table only; the daemon emits
    // them through its own virtual device, not the physical one.
    std::visit(overloaded {
      [&](const rme::SimpleRemap &remap) {
        check_output(out, position, "Output", remap.output);
      },
      [&](const rme::DualRoleRemap &remap) {
        check_output(out, position, "Tap output", remap.tap);
        check_output(out, position, "Hold output", remap.hold);

        if (remap.hold_threshold.count() <= 0)
          out.error(DiagnosticKind::NonPositiveHoldThreshold, position,
                    "Hold threshold must be positive, got "
                    + std::to_string(remap.hold_threshold.count()) + " ms");
      },
    }, entry);
  }

  // The daemon tries entries in order and fires the first one whose keys are
  // all down, so an earlier entry needing a subset of a later one's keys
  // always wins.
  bool shadows(const RemapEntry &earlier, const RemapEntry &later) {
    const auto earlier_input = rme::input_of(earlier);
    return !earlier_input.empty() && rme::input_of(later).includes(earlier_input);
  }

}

std::string_view rme::diagnostic_kind_name(DiagnosticKind kind) {
  switch (kind) {
    case DiagnosticKind::BoundDeviceUnavailable: return "BoundDeviceUnavailable";
    case DiagnosticKind::SelectorMismatch: return "SelectorMismatch";
    case DiagnosticKind::InvalidInputCode: return "InvalidInputCode";
    case DiagnosticKind::InputNotSupported: return "InputNotSupported";
    case DiagnosticKind::InvalidOutputCode: return "InvalidOutputCode";
    case DiagnosticKind::EmptyKeyCombination: return "EmptyKeyCombination";
    case DiagnosticKind::NonPositiveHoldThreshold: return "NonPositiveHoldThreshold";
    case DiagnosticKind::DuplicateInput: return "DuplicateInput";
    case DiagnosticKind::DegenerateDualRole: return "DegenerateDualRole";
    case DiagnosticKind::UnreachableEntry: return "UnreachableEntry";
    case DiagnosticKind::EmptyRuleSet: return "EmptyRuleSet";
  }
  return "Unknown";
}

std::string_view rme::severity_name(Severity severity) {
  return severity == Severity::Error ? "error" : "warning";
}

std::vector<Diagnostic> rme::validate(const RuleSet &rule_set, const Device *bound_device) {
  DiagnosticList out;
  const auto &entries = rule_set.get_entries();
  const auto &selector = rule_set.get_device_selector();

  if (bound_device) {
    if (!bound_device->available)
      out.warning(DiagnosticKind::BoundDeviceUnavailable, std::nullopt,
                  bound_device->label + " is unavailable, input capabilities were not checked");
    if (!selector.empty() && !selector.matches(*bound_device))
      out.warning(DiagnosticKind::SelectorMismatch, std::nullopt,
                  "Device selector `" + selector.name + "` does not match " + bound_device->label);
  }

  for (std::size_t i = 0; i < entries.size(); ++i)
    check_entry(out, i, entries[i], bound_device);

  // Re-checked here because a loaded file never went through RuleSet::add_entry.
  std::set<std::size_t> duplicates;
  for (std::size_t j = 0; j < entries.size(); ++j) {
    const auto input = input_of(entries[j]);
    for (std::size_t i = 0; i < j; ++i) {
      if (input_of(entries[i]).key_set() == input.key_set()) {
        out.error(DiagnosticKind::DuplicateInput, j,
                  "Input " + input.describe() + " is already used by entry "
                  + std::to_string(i));
        duplicates.insert(j);
        break;
      }
    }
  }

  for (std::size_t i = 0; i < entries.size(); ++i) {
    if (const auto *remap = std::get_if<DualRoleRemap>(&entries[i])) {
      if (!remap->tap.empty() && remap->tap.key_set() == remap->hold.key_set())
        out.warning(DiagnosticKind::DegenerateDualRole, i,
                    "Tap and hold both emit " + remap->tap.describe()
                    + "; this behaves like a simple remap");
    }
  }

  for (std::size_t j = 0; j < entries.size(); ++j) {
    if (duplicates.count(j))
      continue;
    for (std::size_t i = 0; i < j; ++i) {
      if (shadows(entries[i], entries[j])) {
        out.warning(DiagnosticKind::UnreachableEntry, j,
                    "Entry is never reached, entry " + std::to_string(i)
                    + " matches " + input_of(entries[i]).describe() + " first");
        break;
      }
    }
  }

  if (entries.empty())
    out.warning(DiagnosticKind::EmptyRuleSet, std::nullopt, "The configuration has no remaps");

  return out.take();
}

bool rme::is_save_ready(const std::vector<Diagnostic> &diagnostics) {
  return count_severity(diagnostics, Severity::Error) == 0;
}

std::size_t rme::count_severity(const std::vector<Diagnostic> &diagnostics, Severity severity) {
  return static_cast<std::size_t>(std::count_if(diagnostics.begin(), diagnostics.end(),
      [&](const Diagnostic &d) { return d.severity == severity; }));
}
