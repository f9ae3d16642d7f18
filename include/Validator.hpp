#ifndef REMAPEDIT_VALIDATOR_HPP
#define REMAPEDIT_VALIDATOR_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <Device.hpp>
#include <RuleSet.hpp>

namespace rme {

  enum class Severity {
    Error,
    Warning,
  };

  enum class DiagnosticKind {
    BoundDeviceUnavailable,
    SelectorMismatch,
    InvalidInputCode,
    InputNotSupported,
    InvalidOutputCode,
    EmptyKeyCombination,
    NonPositiveHoldThreshold,
    DuplicateInput,
    DegenerateDualRole,
    UnreachableEntry,
    EmptyRuleSet,
  };

  std::string_view diagnostic_kind_name(DiagnosticKind kind);
  std::string_view severity_name(Severity severity);

  struct Diagnostic {
    Severity severity;
    std::optional<std::size_t> entry;  // none for set-level issues
    std::string message;
    DiagnosticKind kind;

    bool operator==(const Diagnostic &other) const = default;
  };

  // Pure: the same rule set and device always give the same diagnostics in
  // the same order. Never throws for invalid content.
  std::vector<Diagnostic> validate(const RuleSet &rule_set, const Device *bound_device = nullptr);

  // Zero errors; warnings are allowed.
  bool is_save_ready(const std::vector<Diagnostic> &diagnostics);

  std::size_t count_severity(const std::vector<Diagnostic> &diagnostics, Severity severity);

}

#endif //REMAPEDIT_VALIDATOR_HPP
