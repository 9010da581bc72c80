#include "file_reader.hpp"
#include <fcntl.h>
#include <sys/stat.h>
#include "posix_fd.hpp"

static void push_line(std::vector<std::string>& out, const char* data, size_t start, size_t end) {
  if (end > start && data[end - 1] == '\r') end--;
  out.emplace_back(data + start, end - start);
}

bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg) {
  out_lines.clear();
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY));
  if (!fd.valid()) { msg = std::string("can not open file: ") + path.string(); return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = std::string("can not read file stat: ") + path.string(); return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) {
    out_lines.emplace_back("");
    msg = std::string("opened file: ") + path.string();
    return true;
  }
  MappedRegion region(fd.get(), n);
  if (!region.valid()) { msg = std::string("can not mmap file: ") + path.string(); return false; }
  const char* data = region.data();
  (void)::madvise(const_cast<char*>(data), n, MADV_SEQUENTIAL);

  size_t start = 0;
  for (size_t i = 0; i < n; ++i) {
    if (data[i] != '\n') continue;
    push_line(out_lines, data, start, i);
    start = i + 1;
  }
  push_line(out_lines, data, start, n);
  msg = std::string("opened file: ") + path.string();
  return true;
}
