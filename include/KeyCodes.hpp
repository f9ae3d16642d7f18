#ifndef REMAPEDIT_KEYCODES_HPP
#define REMAPEDIT_KEYCODES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rme {

  using KeyCode = std::uint16_t;
  using EventType = std::uint16_t;

  // Key and button codes libevdev has a name for, independent of any device.
  bool is_valid_key_code(KeyCode code);

  std::optional<std::string_view> key_name(KeyCode code);
  std::optional<KeyCode> key_code_from_name(std::string_view name);

  // All valid codes, ordered by name.
  const std::vector<KeyCode> &list_key_codes();

  std::string_view event_type_name(EventType type);
  std::optional<EventType> event_type_from_name(std::string_view name);

  // "KEY_ESC", "REL_WHEEL", "SYN_REPORT"; falls back to the number.
  std::string event_code_name(EventType type, std::uint16_t code);

  bool is_modifier(KeyCode code);
  // FN, then left/right ALT, META, CTRL, SHIFT.
  const std::vector<KeyCode> &list_modifiers();

}

#endif //REMAPEDIT_KEYCODES_HPP
