#include <DeviceFilter.hpp>
#include <Errors.hpp>
#include <Log.hpp>
#include <RuleSet.hpp>

using rme::DeviceSelector;
using rme::RuleSet;

rme::KeyCombination rme::input_of(const RemapEntry &entry) {
  return std::visit([](const auto &remap) { return KeyCombination(remap.input); }, entry);
}

DeviceSelector DeviceSelector::from_device(const Device &device) {
  return DeviceSelector { device.name, device.phys, false };
}

DeviceSelector DeviceSelector::from_pattern(std::string pattern) {
  return DeviceSelector { std::move(pattern), std::nullopt, true };
}

bool DeviceSelector::matches(const Device &device) const {
  // The daemon looks a device up by phys when one is given, by name otherwise.
  DeviceFilter::Criteria criteria;
  try {
    if (phys)
      criteria.phys.assign(DeviceFilter::escape(*phys), std::regex::nosubs);
    else
      criteria.name.assign(is_pattern ? name : DeviceFilter::escape(name),
                           std::regex::optimize | std::regex::nosubs);
  } catch (const std::regex_error &e) {
    REMAPEDIT_LOG_DEBUG("Invalid device name pattern `" << name << "`: " << e.what());
    return false;
  }

  return DeviceFilter(std::move(criteria))(device);
}

RuleSet::RuleSet(DeviceSelector selector, std::vector<RemapEntry> entries)
  : _selector(std::move(selector)),
    _entries(std::move(entries))
{
}

rme::Revision RuleSet::add_entry(RemapEntry entry) {
  if (auto existing = find_input(input_of(entry), std::nullopt))
    throw DuplicateInputError(input_of(entry), *existing);

  _entries.push_back(std::move(entry));
  return ++_revision;
}

rme::Revision RuleSet::remove_entry(std::size_t position) {
  check_position(position);

  _entries.erase(_entries.begin() + static_cast<std::ptrdiff_t>(position));
  return ++_revision;
}

rme::Revision RuleSet::update_entry(std::size_t position, RemapEntry entry) {
  check_position(position);
  if (auto existing = find_input(input_of(entry), position))
    throw DuplicateInputError(input_of(entry), *existing);

  _entries[position] = std::move(entry);
  return ++_revision;
}

rme::Revision RuleSet::set_device_selector(DeviceSelector selector) {
  _selector = std::move(selector);
  return ++_revision;
}

const rme::RemapEntry &RuleSet::get_entry(std::size_t position) const {
  check_position(position);
  return _entries[position];
}

bool RuleSet::equivalent_to(const RuleSet &other) const {
  return _selector == other._selector && _entries == other._entries;
}

// Inputs are pressed together, so the order of their keys does not matter.
std::optional<std::size_t> RuleSet::find_input(const KeyCombination &input,
                                               std::optional<std::size_t> skip) const {
  const auto keys = input.key_set();
  for (std::size_t i = 0; i < _entries.size(); ++i) {
    if (skip && *skip == i)
      continue;
    if (input_of(_entries[i]).key_set() == keys)
      return i;
  }
  return std::nullopt;
}

void RuleSet::check_position(std::size_t position) const {
  if (position >= _entries.size())
    throw IndexOutOfRangeError(position, _entries.size());
}
