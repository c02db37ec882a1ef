#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <csignal>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <string>

#include "common/codec.hpp"

// Sends each argument (or each line of stdin) as one command line.
int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <socket_path> [command...]\n";
    return 1;
  }
  std::string path = argv[1];

  std::signal(SIGPIPE, SIG_IGN);

  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  if (path.size() >= sizeof(addr.sun_path)) {
    std::cerr << "Socket path too long\n";
    return 1;
  }
  std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);

  int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  if (fd < 0) {
    std::perror("socket");
    return 1;
  }
  if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    std::perror("connect");
    ::close(fd);
    return 1;
  }

  int failures = 0;
  auto send = [&](const std::string& text) {
    std::string err;
    if (!voicecmd::write_line(fd, text, err)) {
      std::cerr << "send error: " << err << "\n";
      ++failures;
    }
  };

  if (argc > 2) {
    for (int i = 2; i < argc; ++i) send(argv[i]);
  } else {
    std::string line;
    while (std::getline(std::cin, line)) send(line);
  }

  ::close(fd);
  return failures == 0 ? 0 : 1;
}
