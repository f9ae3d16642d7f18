#ifndef REMAPEDIT_FILEDESCRIPTOR_HPP
#define REMAPEDIT_FILEDESCRIPTOR_HPP

#include <utility>

#include <unistd.h>

namespace rme {

  // Closes the descriptor on destruction. Anything built on top of the fd
  // (an evdevw::Evdev) must be destroyed first.
  class FileDescriptor {
  public:
    FileDescriptor() : _fd(-1) {}
    explicit FileDescriptor(int fd) : _fd(fd) {}

    ~FileDescriptor() {
      if (_fd >= 0)
        ::close(_fd);
    }

    FileDescriptor(const FileDescriptor &) = delete;
    FileDescriptor &operator=(const FileDescriptor &) = delete;

    FileDescriptor(FileDescriptor &&other) noexcept
      : _fd(std::exchange(other._fd, -1))
    {
    }

    FileDescriptor &operator=(FileDescriptor &&other) noexcept {
      if (this != &other) {
        if (_fd >= 0)
          ::close(_fd);
        _fd = std::exchange(other._fd, -1);
      }
      return *this;
    }

    int get() const { return _fd; }
    explicit operator bool() const { return _fd >= 0; }

  private:
    int _fd;
  };

}

#endif //REMAPEDIT_FILEDESCRIPTOR_HPP
