#include "common/frame_receiver.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <utility>
#include <vector>

#include <unistd.h>

namespace voicecmd {

ssize_t FdStream::receive_some(std::string& out, std::size_t max_bytes,
                               std::string& error) {
  if (chunk_.size() < max_bytes) chunk_.resize(max_bytes);
  while (true) {
    ssize_t n = ::read(fd_, chunk_.data(), max_bytes);
    if (n < 0) {
      if (errno == EINTR) continue;
      error = std::string("read failed: ") + std::strerror(errno);
      return -1;
    }
    out.append(chunk_.data(), static_cast<std::size_t>(n));
    return n;
  }
}

std::string to_string(ReceiveStatus status) {
  switch (status) {
    case ReceiveStatus::Frame:
      return "frame";
    case ReceiveStatus::EndOfStream:
      return "end of stream";
    case ReceiveStatus::FrameTooLong:
      return "frame too long";
    case ReceiveStatus::IncompleteFrame:
      return "incomplete frame";
    case ReceiveStatus::IoError:
      return "I/O error";
  }
  return "unknown";
}

FrameReceiver::FrameReceiver(ByteStream& stream, std::string terminator,
                             std::size_t max_frame_length, std::size_t chunk_size)
    : stream_(stream),
      terminator_(std::move(terminator)),
      max_frame_length_(max_frame_length),
      chunk_size_(chunk_size == 0 ? kReceiveChunk : chunk_size) {
  if (terminator_.empty()) {
    throw std::invalid_argument("frame terminator must not be empty");
  }
}

ReceiveStatus FrameReceiver::receive(std::string& frame, std::string& error) {
  const std::size_t term_len = terminator_.size();
  while (true) {
    const std::size_t len = buffered();
    std::size_t pos = std::string::npos;
    if (next_find_idx_ < len) {
      pos = buf_.find(terminator_, start_ + next_find_idx_);
    }

    if (pos == std::string::npos) {
      if (next_find_idx_ < len) bytes_scanned_ += len - next_find_idx_;
      if (len > max_frame_length_) {
        error = "frame too long";
        return ReceiveStatus::FrameTooLong;
      }
      // Resume where this search stopped, minus a possible partial terminator.
      next_find_idx_ = len >= term_len ? len - term_len + 1 : 0;
      compact();
      ssize_t n = stream_.receive_some(buf_, chunk_size_, error);
      if (n < 0) {
        return ReceiveStatus::IoError;
      }
      if (n == 0) {
        if (buffered() > 0) {
          error = "incomplete frame";
          return ReceiveStatus::IncompleteFrame;
        }
        return ReceiveStatus::EndOfStream;
      }
      continue;
    }

    bytes_scanned_ += pos + term_len - (start_ + next_find_idx_);
    frame.assign(buf_, start_, pos - start_);
    start_ = pos + term_len;
    next_find_idx_ = 0;
    if (start_ == buf_.size()) {
      buf_.clear();
      start_ = 0;
    }
    return ReceiveStatus::Frame;
  }
}

// Delivered frames are only dropped from the front before the next read,
// so each byte is moved at most once per read instead of once per frame.
void FrameReceiver::compact() {
  if (start_ == 0) return;
  buf_.erase(0, start_);
  start_ = 0;
}

}  // namespace voicecmd
