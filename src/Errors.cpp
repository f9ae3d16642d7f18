#include <cstring>
#include <utility>

#include <Errors.hpp>

rme::DuplicateInputError::DuplicateInputError(KeyCombination input, std::size_t existing_position)
  : std::runtime_error("Input " + input.describe() + " is already remapped by entry "
                       + std::to_string(existing_position)),
    _input(std::move(input)),
    _existing_position(existing_position)
{
}

rme::IndexOutOfRangeError::IndexOutOfRangeError(std::size_t position, std::size_t size)
  : std::out_of_range("Entry position " + std::to_string(position)
                      + " is out of range (" + std::to_string(size) + " entries)")
{
}

rme::ParseError::ParseError(std::size_t line, std::string reason)
  : std::runtime_error(line ? "line " + std::to_string(line) + ": " + reason : reason),
    _line(line),
    _reason(std::move(reason))
{
}

rme::IoError::IoError(const std::string &path, int error)
  : std::runtime_error(path + ": " + std::strerror(error)),
    _error(error)
{
}
