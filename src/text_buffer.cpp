#include "text_buffer.hpp"
#include <algorithm>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include "config.hpp"
#include "file_reader.hpp"
#include "posix_fd.hpp"

TextBuffer::TextBuffer() { ensure_not_empty(); }

std::string_view TextBuffer::backend_name() const { return core_.get_name(); }

int TextBuffer::line_count() const { return core_.line_count(); }
std::string TextBuffer::line(int r) const { return std::string(core_.line_view(r)); }
std::string_view TextBuffer::line_view(int r) const { return core_.line_view(r); }

void TextBuffer::ensure_not_empty() {
  if (line_count() == 0) core_.insert_line(0, std::string_view());
}

void TextBuffer::init_from_lines(std::vector<std::string> lines) {
  core_.init_from_lines(std::move(lines));
  ensure_not_empty();
}

void TextBuffer::insert_line(int row, std::string_view s) {
  core_.insert_line(static_cast<size_t>(std::max(0, row)), s);
}

void TextBuffer::erase_line(int row) {
  if (row < 0) return;
  core_.erase_line(static_cast<size_t>(row));
  ensure_not_empty();
}

void TextBuffer::erase_lines(int start_row, int end_row) {
  core_.erase_lines(static_cast<size_t>(std::max(0, start_row)), static_cast<size_t>(std::max(0, end_row)));
  ensure_not_empty();
}

void TextBuffer::replace_line(int row, std::string_view s) {
  if (row < 0) return;
  core_.replace_line(static_cast<size_t>(row), s);
}

TextBuffer TextBuffer::from_text(std::string_view text) {
  std::vector<std::string> ls;
  size_t start = 0;
  while (start < text.size()) {
    size_t nl = text.find('\n', start);
    if (nl == std::string_view::npos) { ls.emplace_back(text.substr(start)); break; }
    ls.emplace_back(text.substr(start, nl - start));
    start = nl + 1;
  }
  TextBuffer b;
  b.init_from_lines(std::move(ls));
  return b;
}

TextBuffer TextBuffer::from_file(const std::filesystem::path& path, std::string& msg, bool& ok) {
  TextBuffer b;
  std::vector<std::string> ls;
  ok = mmap_readlines(path, ls, msg);
  if (!ok) return b;
  b.init_from_lines(std::move(ls));
  return b;
}

static bool write_all(int fd, const char* p, size_t len) {
  while (len > 0) {
    ssize_t w = ::write(fd, p, len);
    if (w < 0) return false;
    p += w;
    len -= static_cast<size_t>(w);
  }
  return true;
}

bool TextBuffer::write_file(const std::filesystem::path& path, std::string& msg) const {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  UniqueFd ufd(::open(tmp.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if (!ufd.valid()) {
    msg = std::string("write file failed: ") + tmp.string();
    return false;
  }
  std::vector<char> buf(static_cast<size_t>(IG_WRITE_CHUNK_SIZE));
  size_t used = 0;
  auto append = [&](const char* p, size_t len) -> bool {
    if (len > buf.size() - used) {
      if (!write_all(ufd.get(), buf.data(), used)) return false;
      used = 0;
      if (len >= buf.size()) return write_all(ufd.get(), p, len);
    }
    std::memcpy(buf.data() + used, p, len);
    used += len;
    return true;
  };
  int n = line_count();
  for (int i = 0; i < n; ++i) {
    std::string_view s = line_view(i);
    bool ok = append(s.data(), s.size());
    if (ok && i + 1 < n) ok = append("\n", 1);
    if (!ok) { msg = std::string("write file failed: ") + tmp.string(); return false; }
  }
  if (used > 0 && !write_all(ufd.get(), buf.data(), used)) {
    msg = std::string("write file failed: ") + tmp.string();
    return false;
  }
#if defined(__APPLE__)
  if (::fsync(ufd.get()) != 0) { msg = std::string("write file failed: ") + tmp.string(); return false; }
#else
  if (::fdatasync(ufd.get()) != 0) { msg = std::string("write file failed: ") + tmp.string(); return false; }
#endif
  ufd.reset();
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) { msg = std::string("write file failed: ") + path.string(); return false; }
  msg = std::string("saved file: ") + path.string();
  return true;
}
