#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

#include <Log.hpp>

namespace {

  constexpr std::array<std::string_view, 6> LEVEL_NAMES = {
      "off", "error", "warn", "info", "debug", "trace" };

  std::atomic<rme::log::Level> current_level{ rme::log::DEFAULT_LEVEL };
  std::mutex write_mutex;

}

std::optional<rme::log::Level> rme::log::parse_level(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  for (std::size_t i = 0; i < LEVEL_NAMES.size(); ++i) {
    if (LEVEL_NAMES[i] == lowered)
      return static_cast<Level>(i);
  }
  return std::nullopt;
}

std::string_view rme::log::level_name(Level level) {
  return LEVEL_NAMES.at(static_cast<std::size_t>(level));
}

void rme::log::set_level(Level level) {
  current_level.store(level);
}

rme::log::Level rme::log::level() {
  return current_level.load();
}

void rme::log::init_from_env() {
  const char *value = std::getenv(ENV_VARIABLE);
  if (!value)
    return;

  if (auto parsed = parse_level(value)) {
    set_level(*parsed);
  } else {
    set_level(DEFAULT_LEVEL);
    REMAPEDIT_LOG_WARN(ENV_VARIABLE << "=" << value << " is not a log level, using "
                       << level_name(DEFAULT_LEVEL));
  }
}

void rme::log::write(Level message_level, const std::string &line) {
  std::lock_guard<std::mutex> lock(write_mutex);
  std::cerr << "[" << level_name(message_level) << "] " << line << std::endl;
}
