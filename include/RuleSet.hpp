#ifndef REMAPEDIT_RULESET_HPP
#define REMAPEDIT_RULESET_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <Device.hpp>
#include <KeyCodes.hpp>
#include <KeyCombination.hpp>

namespace rme {

  using Revision = std::uint64_t;

  struct SimpleRemap {
    KeyCombination input;
    KeyCombination output;

    bool operator==(const SimpleRemap &other) const = default;
  };

  // Tapping `input` emits `tap`; holding it, or pressing another key while it
  // is down, emits `hold`.
  struct DualRoleRemap {
    static constexpr std::chrono::milliseconds DEFAULT_HOLD_THRESHOLD{ 200 };

    KeyCode input;
    KeyCombination tap;
    KeyCombination hold;
    std::chrono::milliseconds hold_threshold = DEFAULT_HOLD_THRESHOLD;

    bool operator==(const DualRoleRemap &other) const = default;
  };

  using RemapEntry = std::variant<SimpleRemap, DualRoleRemap>;

  // The keys that trigger an entry.
  KeyCombination input_of(const RemapEntry &entry);

  // Which device a configuration targets: an exact name (as the daemon
  // expects) or a name pattern, optionally narrowed by phys.
  struct DeviceSelector {
    std::string name;
    std::optional<std::string> phys;
    bool is_pattern = false;

    static DeviceSelector from_device(const Device &device);
    static DeviceSelector from_pattern(std::string pattern);

    bool empty() const { return name.empty() && !phys; }
    bool matches(const Device &device) const;

    bool operator==(const DeviceSelector &other) const = default;
  };

  class RuleSet {
  public:
    RuleSet() = default;
    // Taken as-is; a loaded file may hold entries the validator will reject.
    RuleSet(DeviceSelector selector, std::vector<RemapEntry> entries);

    Revision add_entry(RemapEntry entry);
    Revision remove_entry(std::size_t position);
    Revision update_entry(std::size_t position, RemapEntry entry);
    Revision set_device_selector(DeviceSelector selector);

    const DeviceSelector &get_device_selector() const { return _selector; }
    const std::vector<RemapEntry> &get_entries() const { return _entries; }
    const RemapEntry &get_entry(std::size_t position) const;
    std::size_t size() const { return _entries.size(); }
    bool empty() const { return _entries.empty(); }

    Revision get_revision() const { return _revision; }

    // Same selector and entries; revisions are not compared.
    bool equivalent_to(const RuleSet &other) const;

  private:
    DeviceSelector _selector;
    std::vector<RemapEntry> _entries;
    Revision _revision = 0;

    std::optional<std::size_t> find_input(const KeyCombination &input,
                                          std::optional<std::size_t> skip) const;
    void check_position(std::size_t position) const;
  };

}

#endif //REMAPEDIT_RULESET_HPP
