#pragma once

#include <cstddef>
#include <string>

#include <sys/types.h>

namespace voicecmd {

constexpr char kTerminator[] = "\n";
constexpr std::size_t kDefaultMaxFrameLength = 16384;
constexpr std::size_t kReceiveChunk = 4096;

// Low-level helper for POSIX-style file descriptors.
// Returns total bytes written or -1 on unrecoverable error.
ssize_t write_exact(int fd, const void* buffer, std::size_t length);

bool is_valid_utf8(const std::string& s);

// Turn one command into a wire line (text + terminator).
// Fails when the text is not UTF-8 or contains the terminator.
bool encode_line(const std::string& text, std::string& line, std::string& error);

// Encode and write a single command line to fd.
bool write_line(int fd, const std::string& text, std::string& error);

}  // namespace voicecmd
