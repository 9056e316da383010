#pragma once
/*
 * UniqueFd
 *
 * Purpose: owning POSIX file descriptor; closes on destruction, move-only.
 */
#include <unistd.h>
#include <utility>

class UniqueFd {
public:
  explicit UniqueFd(int fd = -1) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    UniqueFd tmp(std::move(other));
    std::swap(fd_, tmp.fd_);
    return *this;
  }
  ~UniqueFd() { if (fd_ >= 0) ::close(fd_); }

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  int release() { return std::exchange(fd_, -1); }
private:
  int fd_;
};
