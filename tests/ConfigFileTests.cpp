#include <cstdio>
#include <fstream>
#include <sstream>

#include <gtest/gtest.h>

#include <ConfigFile.hpp>
#include <Errors.hpp>

#include "Fakes.hpp"

using namespace rme;

namespace {

  RuleSet parse(const std::string &text) {
    std::istringstream in(text);
    return parse_rule_set(in);
  }

  std::string write(const RuleSet &rule_set) {
    std::ostringstream out;
    write_rule_set(out, rule_set);
    return out.str();
  }

  std::size_t parse_error_line(const std::string &text) {
    try {
      parse(text);
    } catch (const ParseError &e) {
      return e.get_line();
    }
    ADD_FAILURE() << "no ParseError for:\n" << text;
    return 0;
  }

  std::string parse_error_reason(const std::string &text) {
    try {
      parse(text);
    } catch (const ParseError &e) {
      return e.what();
    }
    ADD_FAILURE() << "no ParseError for:\n" << text;
    return {};
  }

  const char *EXAMPLE = R"(# laptop keyboard
device_name = "AT Translated Set 2 keyboard"
phys = "isa0060/serio0/input0"

[[dual_role]]
input = "KEY_CAPSLOCK"
hold = ["KEY_LEFTCTRL"]
tap = ["KEY_ESC"]

[[remap]]
input = ["KEY_RIGHTALT"]   # compose
output = ["KEY_COMPOSE"]

[[dual_role]]
input = "KEY_SPACE"
hold = [
  "KEY_LEFTSHIFT",
  "KEY_LEFTMETA",
]
tap = ["KEY_SPACE"]
hold_threshold_ms = 350
)";

}

TEST(ConfigFile, ParsesDaemonConfig) {
  const auto rule_set = parse(EXAMPLE);

  const auto &selector = rule_set.get_device_selector();
  EXPECT_EQ(selector.name, "AT Translated Set 2 keyboard");
  EXPECT_EQ(selector.phys, "isa0060/serio0/input0");
  EXPECT_FALSE(selector.is_pattern);

  ASSERT_EQ(rule_set.size(), 3u);

  const auto &capslock = std::get<DualRoleRemap>(rule_set.get_entry(0));
  EXPECT_EQ(capslock.input, KEY_CAPSLOCK);
  EXPECT_EQ(capslock.hold, KeyCombination(KEY_LEFTCTRL));
  EXPECT_EQ(capslock.tap, KeyCombination(KEY_ESC));
  EXPECT_EQ(capslock.hold_threshold, DualRoleRemap::DEFAULT_HOLD_THRESHOLD);

  const auto &compose = std::get<SimpleRemap>(rule_set.get_entry(1));
  EXPECT_EQ(compose.input, KeyCombination(KEY_RIGHTALT));
  EXPECT_EQ(compose.output, KeyCombination(KEY_COMPOSE));

  const auto &space = std::get<DualRoleRemap>(rule_set.get_entry(2));
  EXPECT_EQ(space.hold, (KeyCombination { KEY_LEFTSHIFT, KEY_LEFTMETA }));
  EXPECT_EQ(space.hold_threshold, std::chrono::milliseconds(350));
}

TEST(ConfigFile, WriteThenParseIsEquivalent) {
  RuleSet rule_set;
  rule_set.set_device_selector(DeviceSelector { "Keyboard \"Pro\"", "usb-1/input0", false });
  rule_set.add_entry(DualRoleRemap { KEY_CAPSLOCK, KEY_ESC, KEY_LEFTCTRL });
  rule_set.add_entry(SimpleRemap { KEY_RIGHTALT, KEY_COMPOSE });
  rule_set.add_entry(DualRoleRemap { KEY_SPACE, KEY_SPACE, { KEY_LEFTSHIFT, KEY_LEFTALT, KEY_LEFTMETA },
                                     std::chrono::milliseconds(300) });
  rule_set.add_entry(SimpleRemap { KEY_A, 0x2fe });
  rule_set.add_entry(SimpleRemap { { KEY_LEFTALT, KEY_TAB }, { KEY_LEFTMETA, KEY_TAB } });

  EXPECT_TRUE(parse(write(rule_set)).equivalent_to(rule_set));
}

TEST(ConfigFile, PatternSelectorRoundTrips) {
  RuleSet rule_set;
  rule_set.set_device_selector(DeviceSelector::from_pattern(".*Gaming Mouse.*"));
  rule_set.add_entry(SimpleRemap { BTN_SIDE, KEY_BACK });

  const auto text = write(rule_set);
  EXPECT_NE(text.find("device_name_regex"), std::string::npos);
  EXPECT_EQ(text.find("device_name ="), std::string::npos);
  EXPECT_TRUE(parse(text).equivalent_to(rule_set));
}

TEST(ConfigFile, DefaultThresholdIsNotWritten) {
  RuleSet rule_set;
  rule_set.add_entry(DualRoleRemap { KEY_CAPSLOCK, KEY_ESC, KEY_LEFTCTRL });

  const auto text = write(rule_set);
  EXPECT_EQ(text.find("hold_threshold_ms"), std::string::npos);
  EXPECT_TRUE(parse(text).equivalent_to(rule_set));
}

TEST(ConfigFile, EmptyFileIsEmptyRuleSet) {
  const auto rule_set = parse("# nothing here\n\n");
  EXPECT_TRUE(rule_set.empty());
  EXPECT_TRUE(rule_set.get_device_selector().empty());
}

TEST(ConfigFile, DuplicatesAreLoadedForTheValidator) {
  const auto rule_set = parse(R"([[remap]]
input = ["KEY_A"]
output = ["KEY_B"]

[[remap]]
input = ["KEY_A"]
output = ["KEY_C"]
)");
  EXPECT_EQ(rule_set.size(), 2u);
}

TEST(ConfigFile, ErrorsCarryLineNumbers) {
  EXPECT_EQ(parse_error_line("[[remap]]\ninput = [\"KEY_A\"]\noutput = [\"KEY_NOPE\"]\n"), 3u);
  EXPECT_EQ(parse_error_line("[[remap]]\ninput = \"KEY_A\"\noutput = [\"KEY_B\"]\n"), 2u);
  EXPECT_EQ(parse_error_line("device_name = \"Keyboard\"\nphys = 5\n"), 2u);
  EXPECT_EQ(parse_error_line("[[dual_role]]\ninput = \"KEY_A\"\nhold = [\"KEY_B\"]\n"
                             "tap = [\"KEY_C\"]\nhold_threshold_ms = \"fast\"\n"), 5u);
  EXPECT_EQ(parse_error_line("phys = \"a\"\nphys = \"b\"\n"), 2u);
  EXPECT_EQ(parse_error_line("device_name = \"unterminated\n"), 1u);
}

TEST(ConfigFile, MissingKeyIsNamed) {
  EXPECT_NE(parse_error_reason("[[remap]]\ninput = [\"KEY_A\"]\noutput = [\"KEY_B\"]\n\n"
                               "[[dual_role]]\ninput = \"KEY_B\"\ntap = [\"KEY_C\"]\n").find("hold"),
            std::string::npos);
}

TEST(ConfigFile, ChordsAreParsed) {
  const auto rule_set = parse(R"([[remap]]
input = ["KEY_TAB", "KEY_LEFTALT"]
output = ["KEY_LEFTMETA", "KEY_TAB"]
)");

  ASSERT_EQ(rule_set.size(), 1u);
  const auto &remap = std::get<SimpleRemap>(rule_set.get_entry(0));
  EXPECT_EQ(remap.input, (KeyCombination { KEY_LEFTALT, KEY_TAB }));
  EXPECT_EQ(remap.output.to_keys(), (std::vector<KeyCode> { KEY_LEFTMETA, KEY_TAB }));
}

TEST(ConfigFile, MixedEntriesKeepFileOrder) {
  const auto rule_set = parse(R"([[remap]]
input = ["KEY_A"]
output = ["KEY_B"]

[[dual_role]]
input = "KEY_CAPSLOCK"
hold = ["KEY_LEFTCTRL"]
tap = ["KEY_ESC"]

[[remap]]
input = ["KEY_C"]
output = ["KEY_D"]
)");

  ASSERT_EQ(rule_set.size(), 3u);
  EXPECT_EQ(input_of(rule_set.get_entry(0)), KeyCombination(KEY_A));
  EXPECT_EQ(input_of(rule_set.get_entry(1)), KeyCombination(KEY_CAPSLOCK));
  EXPECT_EQ(input_of(rule_set.get_entry(2)), KeyCombination(KEY_C));

  EXPECT_TRUE(parse(write(rule_set)).equivalent_to(rule_set));
}

TEST(ConfigFile, NameAndPatternAreExclusive) {
  EXPECT_EQ(parse_error_line("device_name = \"a\"\ndevice_name_regex = \"b\"\n"), 2u);
}

TEST(ConfigFile, UnknownKeysAreIgnored) {
  const auto rule_set = parse(R"(device_name = "Keyboard"
comment = "kept by someone else"

[keyboard]
layout = "us"

[[macro]]
keys = ["KEY_A"]

[[remap]]
input = ["KEY_A"]
output = ["KEY_B"]
note = "ignored"
)");
  EXPECT_EQ(rule_set.size(), 1u);
}

TEST(ConfigFile, HashInsideStringIsNotAComment) {
  const auto rule_set = parse("device_name = \"Keyboard #2\" # second\n");
  EXPECT_EQ(rule_set.get_device_selector().name, "Keyboard #2");
}

TEST(ConfigFile, SaveAndLoadFile) {
  const auto path = ::testing::TempDir() + "remapedit_config_test.toml";

  RuleSet rule_set;
  rule_set.set_device_selector(DeviceSelector { "Keyboard", std::nullopt, false });
  rule_set.add_entry(SimpleRemap { KEY_CAPSLOCK, KEY_ESC });

  save_rule_set(rule_set, path);
  EXPECT_TRUE(load_rule_set(path).equivalent_to(rule_set));
  std::remove(path.c_str());
}

TEST(ConfigFile, MissingFileIsIoError) {
  EXPECT_THROW(load_rule_set("/nonexistent/remapedit/config.toml"), IoError);
  EXPECT_THROW(save_rule_set(RuleSet(), "/nonexistent/remapedit/config.toml"), IoError);
}
