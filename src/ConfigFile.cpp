#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <fstream>
#include <string_view>
#include <utility>
#include <vector>

#include <toml++/toml.hpp>

#include <ConfigFile.hpp>
#include <Errors.hpp>
#include <KeyCodes.hpp>
#include <Log.hpp>

using rme::KeyCode;
using rme::KeyCombination;
using rme::ParseError;
using rme::RemapEntry;

namespace {

  constexpr std::string_view DUAL_ROLE_TABLE = "dual_role";
  constexpr std::string_view REMAP_TABLE = "remap";

  using PlacedEntry = std::pair<std::size_t, RemapEntry>;

  std::size_t line_of(const toml::node &node) {
    return node.source().begin.line;
  }

  [[noreturn]] void fail(const toml::node &node, const std::string &reason) {
    throw ParseError(line_of(node), reason);
  }

  void ignore_unknown_keys(const toml::table &table, std::initializer_list<std::string_view> known) {
    for (auto &&[key, node] : table) {
      if (std::find(known.begin(), known.end(), key.str()) == known.end())
        REMAPEDIT_LOG_DEBUG("line " << line_of(node) << ": ignoring unknown key `" << key.str() << "`");
    }
  }

  const toml::node &require(const toml::table &table, std::string_view key) {
    const auto *node = table.get(key);
    if (!node)
      fail(table, "missing `" + std::string(key) + "`");
    return *node;
  }

  std::optional<std::string> optional_string(const toml::table &table, std::string_view key) {
    const auto *node = table.get(key);
    if (!node)
      return std::nullopt;
    if (const auto *text = node->as_string())
      return text->get();
    fail(*node, "`" + std::string(key) + "` must be a string");
  }

  KeyCode parse_key(const toml::node &node) {
    const auto *text = node.as_string();
    if (!text)
      fail(node, "keys are given by name, such as \"KEY_ESC\"");

    const auto &name = text->get();
    if (auto code = rme::key_code_from_name(name))
      return *code;

    // Codes without a name are written as plain numbers.
    if (!name.empty() && name.size() <= 5 &&
        std::all_of(name.begin(), name.end(), [](unsigned char c) { return std::isdigit(c); })) {
      const auto value = std::stoul(name);
      if (value <= 0xffff)
        return static_cast<KeyCode>(value);
    }
    fail(node, "unknown key `" + name + "`");
  }

  KeyCombination parse_keys(const toml::table &table, std::string_view key) {
    const auto &node = require(table, key);
    const auto *array = node.as_array();
    if (!array)
      fail(node, "`" + std::string(key) + "` must be a list of key names");

    KeyCombination keys;
    for (const auto &element : *array)
      keys.push(parse_key(element));
    return keys;
  }

  RemapEntry to_dual_role(const toml::table &table) {
    ignore_unknown_keys(table, { "input", "hold", "tap", "hold_threshold_ms" });

    rme::DualRoleRemap remap {};
    remap.input = parse_key(require(table, "input"));
    remap.hold = parse_keys(table, "hold");
    remap.tap = parse_keys(table, "tap");

    if (const auto *threshold = table.get("hold_threshold_ms")) {
      const auto *ms = threshold->as_integer();
      if (!ms)
        fail(*threshold, "`hold_threshold_ms` must be an integer");
      remap.hold_threshold = std::chrono::milliseconds(ms->get());
    }
    return remap;
  }

  RemapEntry to_remap(const toml::table &table) {
    ignore_unknown_keys(table, { "input", "output" });
    return rme::SimpleRemap { parse_keys(table, "input"), parse_keys(table, "output") };
  }

  void collect(const toml::table &root, std::string_view name,
               RemapEntry (*to_entry)(const toml::table &), std::vector<PlacedEntry> &entries) {
    const auto *node = root.get(name);
    if (!node)
      return;

    const auto *array = node->as_array();
    if (!array)
      fail(*node, "`" + std::string(name) + "` must be written as [[" + std::string(name) + "]] tables");

    for (const auto &element : *array) {
      const auto *table = element.as_table();
      if (!table)
        fail(element, "`" + std::string(name) + "` entries must be tables");
      entries.emplace_back(line_of(*table), to_entry(*table));
    }
  }

  rme::DeviceSelector to_selector(const toml::table &root) {
    ignore_unknown_keys(root, { "device_name", "device_name_regex", "phys",
                                DUAL_ROLE_TABLE, REMAP_TABLE });

    const auto name = optional_string(root, "device_name");
    const auto regex = optional_string(root, "device_name_regex");
    if (name && regex)
      fail(*root.get("device_name_regex"), "`device_name` and `device_name_regex` are exclusive");

    rme::DeviceSelector selector;
    if (name) {
      selector.name = *name;
    } else if (regex) {
      selector.name = *regex;
      selector.is_pattern = true;
    }
    selector.phys = optional_string(root, "phys");
    return selector;
  }

  std::string key_text(KeyCode code) {
    if (auto name = rme::key_name(code))
      return std::string(*name);
    return std::to_string(code);
  }

  toml::array key_array(const KeyCombination &keys) {
    toml::array array;
    for (const auto key : keys.to_keys())
      array.push_back(key_text(key));
    return array;
  }

  void write_table(std::ostream &out, const toml::table &table) {
    out << toml::toml_formatter { table, toml::format_flags::none } << "\n";
  }

}

rme::RuleSet rme::parse_rule_set(std::istream &in) {
  toml::table root;
  try {
    root = toml::parse(in);
  } catch (const toml::parse_error &e) {
    throw ParseError(e.source().begin.line, std::string(e.description()));
  }

  // The two kinds live in separate arrays; their tables' positions in the
  // file give back the order they were written in.
  std::vector<PlacedEntry> placed;
  collect(root, DUAL_ROLE_TABLE, to_dual_role, placed);
  collect(root, REMAP_TABLE, to_remap, placed);
  std::stable_sort(placed.begin(), placed.end(),
      [](const PlacedEntry &a, const PlacedEntry &b) { return a.first < b.first; });

  std::vector<RemapEntry> entries;
  entries.reserve(placed.size());
  for (auto &[line, entry] : placed)
    entries.push_back(std::move(entry));

  return RuleSet(to_selector(root), std::move(entries));
}

void rme::write_rule_set(std::ostream &out, const RuleSet &rule_set) {
  const auto &selector = rule_set.get_device_selector();

  toml::table root;
  if (selector.is_pattern)
    root.insert("device_name_regex", selector.name);
  else if (!selector.name.empty())
    root.insert("device_name", selector.name);
  if (selector.phys)
    root.insert("phys", *selector.phys);
  if (!root.empty())
    write_table(out, root);

  // Written table by table so that mixed entry kinds keep their order.
  for (const auto &entry : rule_set.get_entries()) {
    toml::table table;
    if (const auto *remap = std::get_if<DualRoleRemap>(&entry)) {
      table.insert("input", key_text(remap->input));
      table.insert("hold", key_array(remap->hold));
      table.insert("tap", key_array(remap->tap));
      if (remap->hold_threshold != DualRoleRemap::DEFAULT_HOLD_THRESHOLD)
        table.insert("hold_threshold_ms", static_cast<std::int64_t>(remap->hold_threshold.count()));
      out << "\n[[" << DUAL_ROLE_TABLE << "]]\n";
    } else {
      const auto &simple = std::get<SimpleRemap>(entry);
      table.insert("input", key_array(simple.input));
      table.insert("output", key_array(simple.output));
      out << "\n[[" << REMAP_TABLE << "]]\n";
    }
    write_table(out, table);
  }
}

rme::RuleSet rme::load_rule_set(const std::string &path) {
  std::ifstream in(path);
  if (!in)
    throw IoError(path, errno ? errno : EIO);

  auto rule_set = parse_rule_set(in);
  REMAPEDIT_LOG_INFO("Loaded " << rule_set.size() << " remaps from " << path);
  return rule_set;
}

void rme::save_rule_set(const RuleSet &rule_set, const std::string &path) {
  std::ofstream out(path, std::ios::trunc);
  if (!out)
    throw IoError(path, errno ? errno : EIO);

  write_rule_set(out, rule_set);
  out.flush();
  if (!out)
    throw IoError(path, errno ? errno : EIO);

  REMAPEDIT_LOG_INFO("Saved " << rule_set.size() << " remaps to " << path);
}
