#ifndef REMAPEDIT_CONFIGFILE_HPP
#define REMAPEDIT_CONFIGFILE_HPP

#include <iosfwd>
#include <string>

#include <RuleSet.hpp>

namespace rme {

  // The daemon's TOML configuration:
  //
  //   device_name = "AT Translated Set 2 keyboard"
  //   phys = "isa0060/serio0/input0"
  //
  //   [[dual_role]]
  //   input = "KEY_CAPSLOCK"
  //   hold = ["KEY_LEFTCTRL"]
  //   tap = ["KEY_ESC"]
  //
  //   [[remap]]
  //   input = ["KEY_RIGHTALT"]
  //   output = ["KEY_COMPOSE"]
  //
  // Key lists are chords. Entries keep the order they appear in, whichever
  // kind they are; keys and tables this editor does not know are skipped.
  // Loading is all-or-nothing.

  // Throws ParseError.
  RuleSet parse_rule_set(std::istream &in);
  void write_rule_set(std::ostream &out, const RuleSet &rule_set);

  // Throw ParseError / IoError.
  RuleSet load_rule_set(const std::string &path);
  void save_rule_set(const RuleSet &rule_set, const std::string &path);

}

#endif //REMAPEDIT_CONFIGFILE_HPP
