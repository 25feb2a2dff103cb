#ifndef PROCESS_FD_H_
#define PROCESS_FD_H_

#include <unistd.h>

namespace webui_init {

// An owned file descriptor, closed on destruction.
class Fd {
 public:
  Fd() = default;
  ~Fd() { reset(); }

  // Takes ownership of 'fd'. A negative 'fd' produces an empty Fd.
  static Fd take(int fd) { return Fd(fd); }

  // Delete copies.
  Fd(const Fd&) = delete;
  Fd& operator=(const Fd&) = delete;

  Fd(Fd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  Fd& operator=(Fd&& other) noexcept {
    if (this != &other) {
      reset();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  bool valid() const { return fd_ >= 0; }
  int operator*() const { return fd_; }

  void reset() {
    if (fd_ >= 0) close(fd_);
    fd_ = -1;
  }

 private:
  explicit Fd(int fd) : fd_(fd < 0 ? -1 : fd) {}

  int fd_ = -1;
};

}  // namespace webui_init

#endif
