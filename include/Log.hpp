#ifndef REMAPEDIT_LOG_HPP
#define REMAPEDIT_LOG_HPP

#include <optional>
#include <sstream>
#include <string_view>

namespace rme::log {

  enum class Level {
    Off,
    Error,
    Warn,
    Info,
    Debug,
    Trace,
  };

  constexpr Level DEFAULT_LEVEL = Level::Warn;
  constexpr const char *ENV_VARIABLE = "REMAPEDIT_LOG";

  // Accepts off/error/warn/info/debug/trace in any case.
  std::optional<Level> parse_level(std::string_view text);
  std::string_view level_name(Level level);

  void set_level(Level level);
  Level level();

  // Reads REMAPEDIT_LOG; unset keeps the default, garbage warns and keeps it.
  void init_from_env();

  inline bool enabled(Level message_level) {
    return message_level != Level::Off && message_level <= level();
  }

  // Writes one whole line, so lines from the capture thread never interleave.
  void write(Level message_level, const std::string &line);

}

#define REMAPEDIT_LOG(level, expr)                                  \
  do {                                                              \
    if (::rme::log::enabled(level)) {                               \
      std::ostringstream _remapedit_log_stream;                     \
      _remapedit_log_stream << expr;                                \
      ::rme::log::write(level, _remapedit_log_stream.str());        \
    }                                                               \
  } while (0)

#define REMAPEDIT_LOG_ERROR(expr) REMAPEDIT_LOG(::rme::log::Level::Error, expr)
#define REMAPEDIT_LOG_WARN(expr) REMAPEDIT_LOG(::rme::log::Level::Warn, expr)
#define REMAPEDIT_LOG_INFO(expr) REMAPEDIT_LOG(::rme::log::Level::Info, expr)
#define REMAPEDIT_LOG_DEBUG(expr) REMAPEDIT_LOG(::rme::log::Level::Debug, expr)
#define REMAPEDIT_LOG_TRACE(expr) REMAPEDIT_LOG(::rme::log::Level::Trace, expr)

#endif //REMAPEDIT_LOG_HPP
