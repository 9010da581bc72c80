#pragma once
#include <cstddef>
#include <sys/mman.h>
#include <unistd.h>

/*owning file descriptor; closed on destruction*/
class UniqueFd {
public:
  UniqueFd() : fd_(-1) {}
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) reset(other.release());
    return *this;
  }
  ~UniqueFd() { reset(); }
  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  int release() { int fd = fd_; fd_ = -1; return fd; }
  void reset(int fd = -1) {
    if (fd_ >= 0) ::close(fd_);
    fd_ = fd;
  }
private:
  int fd_;
};

/*read-only private mapping of a whole file; unmapped on destruction*/
class MappedRegion {
public:
  MappedRegion(int fd, size_t len) : len_(len) {
    void* p = ::mmap(nullptr, len, PROT_READ, MAP_PRIVATE, fd, 0);
    if (p != MAP_FAILED) data_ = static_cast<const char*>(p);
  }
  MappedRegion(const MappedRegion&) = delete;
  MappedRegion& operator=(const MappedRegion&) = delete;
  ~MappedRegion() { if (data_) ::munmap(const_cast<char*>(data_), len_); }
  bool valid() const { return data_ != nullptr; }
  const char* data() const { return data_; }
  size_t size() const { return len_; }
private:
  const char* data_ = nullptr;
  size_t len_ = 0;
};
