#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "common/codec.hpp"

namespace voicecmd {

// Source of bytes for a FrameReceiver.
class ByteStream {
 public:
  virtual ~ByteStream() = default;

  // Appends up to max_bytes to out. Returns the number of bytes appended,
  // 0 on orderly close, or -1 on error (error filled).
  virtual ssize_t receive_some(std::string& out, std::size_t max_bytes,
                               std::string& error) = 0;
};

// Reads from a connected socket or pipe. Does not own the descriptor.
class FdStream : public ByteStream {
 public:
  explicit FdStream(int fd) : fd_(fd) {}

  ssize_t receive_some(std::string& out, std::size_t max_bytes,
                       std::string& error) override;

  // Size of the read buffer; it grows to the largest request and is reused.
  std::size_t buffer_size() const { return chunk_.size(); }

 private:
  int fd_;
  std::vector<char> chunk_;
};

enum class ReceiveStatus { Frame, EndOfStream, FrameTooLong, IncompleteFrame, IoError };

std::string to_string(ReceiveStatus status);

// Splits a byte stream into frames ending in a fixed terminator.
//
// Two protections against hostile peers:
//  - a frame may not grow past max_frame_length without a terminator;
//  - bytes already searched are never searched again, so a peer dribbling
//    one byte per read costs O(n) scanning in total instead of O(n^2).
class FrameReceiver {
 public:
  FrameReceiver(ByteStream& stream,
                std::string terminator = kTerminator,
                std::size_t max_frame_length = kDefaultMaxFrameLength,
                std::size_t chunk_size = kReceiveChunk);

  FrameReceiver(const FrameReceiver&) = delete;
  FrameReceiver& operator=(const FrameReceiver&) = delete;

  // On Frame, `frame` holds the payload without the terminator. On the
  // fatal statuses `error` describes the failure; EndOfStream is not one.
  ReceiveStatus receive(std::string& frame, std::string& error);

  std::size_t buffered() const { return buf_.size() - start_; }
  // Total bytes examined by terminator searches so far.
  std::size_t bytes_scanned() const { return bytes_scanned_; }

 private:
  void compact();

  ByteStream& stream_;
  std::string terminator_;
  std::size_t max_frame_length_;
  std::size_t chunk_size_;
  std::string buf_;
  std::size_t start_{0};          // first undelivered byte in buf_
  std::size_t next_find_idx_{0};  // relative to start_
  std::size_t bytes_scanned_{0};
};

}  // namespace voicecmd
