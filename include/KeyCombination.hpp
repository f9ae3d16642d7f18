#ifndef REMAPEDIT_KEYCOMBINATION_HPP
#define REMAPEDIT_KEYCOMBINATION_HPP

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <KeyCodes.hpp>

namespace rme {

  // Keys pressed together. Modifiers always come first, in the daemon's
  // modifier order; other keys keep the order they were added in. No key
  // appears twice.
  class KeyCombination {
  public:
    KeyCombination() = default;
    KeyCombination(KeyCode key);
    KeyCombination(std::initializer_list<KeyCode> keys);
    explicit KeyCombination(const std::vector<KeyCode> &keys);

    void push(KeyCode key);
    // Last plain key first, then the modifiers from the back.
    std::optional<KeyCode> pop();
    void clear();

    std::vector<KeyCode> to_keys() const;
    std::set<KeyCode> key_set() const;

    bool empty() const { return _modifiers == 0 && _keys.empty(); }
    std::size_t size() const;
    bool contains(KeyCode key) const;
    // Every key of `other` is also in this combination.
    bool includes(const KeyCombination &other) const;

    // "KEY_LEFTALT+KEY_TAB"
    std::string describe() const;

    bool operator==(const KeyCombination &other) const = default;

  private:
    std::uint16_t _modifiers = 0;  // bit i: list_modifiers()[i]
    std::vector<KeyCode> _keys;
  };

}

#endif //REMAPEDIT_KEYCOMBINATION_HPP
