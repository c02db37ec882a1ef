#include "common/codec.hpp"

#include <cerrno>
#include <cstdint>

#include <unistd.h>

namespace voicecmd {

ssize_t write_exact(int fd, const void* buffer, std::size_t length) {
  const auto* in = static_cast<const std::uint8_t*>(buffer);
  std::size_t total = 0;
  while (total < length) {
    ssize_t n = ::write(fd, in + total, length - total);
    if (n < 0) {
      if (errno == EINTR) continue;
      return -1;
    }
    total += static_cast<std::size_t>(n);
  }
  return static_cast<ssize_t>(total);
}

bool is_valid_utf8(const std::string& s) {
  const unsigned char* bytes =
      reinterpret_cast<const unsigned char*>(s.data());
  std::size_t len = s.size();
  std::size_t i = 0;
  while (i < len) {
    unsigned char c = bytes[i];
    std::size_t remaining = 0;
    if (c <= 0x7F) {
      remaining = 0;
    } else if ((c >> 5) == 0x6) {
      remaining = 1;
      if ((c & 0x1E) == 0) return false;  // overlong two-byte form
    } else if ((c >> 4) == 0xE) {
      remaining = 2;
    } else if ((c >> 3) == 0x1E) {
      remaining = 3;
    } else {
      return false;
    }
    if (i + remaining >= len) return false;
    for (std::size_t j = 1; j <= remaining; ++j) {
      if ((bytes[i + j] >> 6) != 0x2) return false;
    }
    i += remaining + 1;
  }
  return true;
}

bool encode_line(const std::string& text, std::string& line, std::string& error) {
  if (text.find(kTerminator) != std::string::npos) {
    error = "command contains a line terminator";
    return false;
  }
  if (!is_valid_utf8(text)) {
    error = "command not valid UTF-8";
    return false;
  }
  line = text;
  line += kTerminator;
  return true;
}

bool write_line(int fd, const std::string& text, std::string& error) {
  std::string line;
  if (!encode_line(text, line, error)) return false;
  ssize_t n = write_exact(fd, line.data(), line.size());
  if (n != static_cast<ssize_t>(line.size())) {
    error = "failed to write full line";
    return false;
  }
  return true;
}

}  // namespace voicecmd
