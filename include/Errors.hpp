#ifndef REMAPEDIT_ERRORS_HPP
#define REMAPEDIT_ERRORS_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <KeyCombination.hpp>

namespace rme {

  class DeviceEnumerationError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  class DeviceQueryError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  class DeviceOpenError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  class DuplicateInputError : public std::runtime_error {
  public:
    DuplicateInputError(KeyCombination input, std::size_t existing_position);

    const KeyCombination &get_input() const { return _input; }
    std::size_t get_existing_position() const { return _existing_position; }

  private:
    KeyCombination _input;
    std::size_t _existing_position;
  };

  class IndexOutOfRangeError : public std::out_of_range {
  public:
    IndexOutOfRangeError(std::size_t position, std::size_t size);
  };

  class ParseError : public std::runtime_error {
  public:
    ParseError(std::size_t line, std::string reason);

    // 1-based; 0 when the error has no location.
    std::size_t get_line() const { return _line; }
    const std::string &get_reason() const { return _reason; }

  private:
    std::size_t _line;
    std::string _reason;
  };

  class IoError : public std::runtime_error {
  public:
    IoError(const std::string &path, int error);

    int get_error() const { return _error; }

  private:
    int _error;
  };

}

#endif //REMAPEDIT_ERRORS_HPP
