#include <utility>

#include <DeviceFilter.hpp>

using rme::DeviceFilter;

DeviceFilter::Criteria::Criteria()
  : name { ".*", std::regex::optimize | std::regex::nosubs },
    phys { ".*", std::regex::optimize | std::regex::nosubs }
{
}

DeviceFilter::DeviceFilter(DeviceFilter::Criteria criteria)
  : _criteria(std::move(criteria))
{
}

bool DeviceFilter::operator()(const Device &device) const {
  return (std::regex_match(device.name, _criteria.name) &&
          std::regex_match(device.phys ? *device.phys : "", _criteria.phys));
}

std::string DeviceFilter::escape(const std::string &text) {
  static const std::string SPECIAL = R"(\^$.|?*+()[]{})";

  std::string escaped;
  escaped.reserve(text.size());
  for (const char c : text) {
    if (SPECIAL.find(c) != std::string::npos)
      escaped.push_back('\\');
    escaped.push_back(c);
  }
  return escaped;
}
