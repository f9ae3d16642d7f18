#include <algorithm>
#include <bit>

#include <KeyCombination.hpp>

using rme::KeyCode;
using rme::KeyCombination;

namespace {

  std::optional<std::size_t> modifier_bit(KeyCode key) {
    const auto &modifiers = rme::list_modifiers();
    const auto it = std::find(modifiers.begin(), modifiers.end(), key);
    if (it == modifiers.end())
      return std::nullopt;
    return static_cast<std::size_t>(it - modifiers.begin());
  }

  std::string describe_key(KeyCode key) {
    if (auto name = rme::key_name(key))
      return std::string(*name);
    return std::to_string(key);
  }

}

KeyCombination::KeyCombination(KeyCode key) {
  push(key);
}

KeyCombination::KeyCombination(std::initializer_list<KeyCode> keys) {
  for (const auto key : keys)
    push(key);
}

KeyCombination::KeyCombination(const std::vector<KeyCode> &keys) {
  for (const auto key : keys)
    push(key);
}

void KeyCombination::push(KeyCode key) {
  if (auto bit = modifier_bit(key))
    _modifiers |= static_cast<std::uint16_t>(1u << *bit);
  else if (std::find(_keys.begin(), _keys.end(), key) == _keys.end())
    _keys.push_back(key);
}

std::optional<KeyCode> KeyCombination::pop() {
  if (!_keys.empty()) {
    const auto key = _keys.back();
    _keys.pop_back();
    return key;
  }

  const auto &modifiers = list_modifiers();
  for (auto i = modifiers.size(); i-- > 0;) {
    if (_modifiers & (1u << i)) {
      _modifiers &= static_cast<std::uint16_t>(~(1u << i));
      return modifiers[i];
    }
  }
  return std::nullopt;
}

void KeyCombination::clear() {
  _modifiers = 0;
  _keys.clear();
}

std::vector<KeyCode> KeyCombination::to_keys() const {
  std::vector<KeyCode> keys;
  const auto &modifiers = list_modifiers();
  for (std::size_t i = 0; i < modifiers.size(); ++i) {
    if (_modifiers & (1u << i))
      keys.push_back(modifiers[i]);
  }
  keys.insert(keys.end(), _keys.begin(), _keys.end());
  return keys;
}

std::set<KeyCode> KeyCombination::key_set() const {
  const auto keys = to_keys();
  return std::set<KeyCode>(keys.begin(), keys.end());
}

std::size_t KeyCombination::size() const {
  return static_cast<std::size_t>(std::popcount(_modifiers)) + _keys.size();
}

bool KeyCombination::contains(KeyCode key) const {
  if (auto bit = modifier_bit(key))
    return _modifiers & (1u << *bit);
  return std::find(_keys.begin(), _keys.end(), key) != _keys.end();
}

bool KeyCombination::includes(const KeyCombination &other) const {
  const auto keys = other.to_keys();
  return std::all_of(keys.begin(), keys.end(), [this](KeyCode key) { return contains(key); });
}

std::string KeyCombination::describe() const {
  std::string text;
  for (const auto key : to_keys()) {
    if (!text.empty())
      text += "+";
    text += describe_key(key);
  }
  return text.empty() ? "(no keys)" : text;
}
