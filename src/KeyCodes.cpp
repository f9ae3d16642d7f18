#include <algorithm>
#include <string>

#include <libevdev/libevdev.h>

#include <KeyCodes.hpp>

namespace {

  bool is_key_or_button(std::string_view name) {
    return name.rfind("KEY_", 0) == 0 || name.rfind("BTN_", 0) == 0;
  }

}

bool rme::is_valid_key_code(KeyCode code) {
  return key_name(code).has_value();
}

std::optional<std::string_view> rme::key_name(KeyCode code) {
  if (code == KEY_RESERVED || code >= KEY_MAX)
    return std::nullopt;

  const char *name = libevdev_event_code_get_name(EV_KEY, code);
  if (!name || !is_key_or_button(name))
    return std::nullopt;
  return std::string_view(name);
}

std::optional<rme::KeyCode> rme::key_code_from_name(std::string_view name) {
  const auto code = libevdev_event_code_from_name_n(EV_KEY, name.data(), name.size());
  if (code < 0 || !is_valid_key_code(static_cast<KeyCode>(code)))
    return std::nullopt;
  return static_cast<KeyCode>(code);
}

const std::vector<rme::KeyCode> &rme::list_key_codes() {
  static const auto codes = [] {
    std::vector<KeyCode> result;
    for (unsigned int code = KEY_RESERVED + 1; code < KEY_MAX; ++code) {
      if (is_valid_key_code(static_cast<KeyCode>(code)))
        result.push_back(static_cast<KeyCode>(code));
    }

    std::sort(result.begin(), result.end(),
        [](KeyCode a, KeyCode b) { return *key_name(a) < *key_name(b); });
    return result;
  }();
  return codes;
}

std::string_view rme::event_type_name(EventType type) {
  if (const char *name = libevdev_event_type_get_name(type))
    return name;
  return "EV_UNKNOWN";
}

std::optional<rme::EventType> rme::event_type_from_name(std::string_view name) {
  const auto type = libevdev_event_type_from_name_n(name.data(), name.size());
  if (type < 0)
    return std::nullopt;
  return static_cast<EventType>(type);
}

std::string rme::event_code_name(EventType type, std::uint16_t code) {
  if (type == EV_KEY) {
    if (auto name = key_name(code))
      return std::string(*name);
  } else if (const char *name = libevdev_event_code_get_name(type, code)) {
    return name;
  }
  return std::to_string(code);
}

bool rme::is_modifier(KeyCode code) {
  const auto &modifiers = list_modifiers();
  return std::find(modifiers.begin(), modifiers.end(), code) != modifiers.end();
}

const std::vector<rme::KeyCode> &rme::list_modifiers() {
  // Same set and order as the daemon.
  static const std::vector<KeyCode> modifiers = {
    KEY_FN, KEY_LEFTALT, KEY_RIGHTALT, KEY_LEFTMETA, KEY_RIGHTMETA,
    KEY_LEFTCTRL, KEY_RIGHTCTRL, KEY_LEFTSHIFT, KEY_RIGHTSHIFT,
  };
  return modifiers;
}
