#include "httptunnel/app/runner.hpp"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

struct Options {
  std::string mode;
  std::string listen_addr = "127.0.0.1:8080";
  std::string relay_addr;
  std::string dest_addr;
  std::string out_file;
  int seconds = 0; // 0 = run until signalled
  bool buffered = false;
  std::optional<int> poll_ms;
  std::optional<int> idle_ms;
};

static void Usage() {
  std::cerr << "usage: httptunnel -m relay -l host:port [-t seconds] "
               "[-o traffic.log] [--poll-ms N] [--idle-ms N]\n"
               "       httptunnel -m client -r relay:port -d dest:port [-b] "
               "[--idle-ms N]\n";
}

static Options ParseArgs(int argc, char **argv) {
  Options opt;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if ((a == "-m" || a == "--mode") && i + 1 < argc)
      opt.mode = argv[++i];
    else if ((a == "-l" || a == "--listen") && i + 1 < argc)
      opt.listen_addr = argv[++i];
    else if ((a == "-r" || a == "--relay") && i + 1 < argc)
      opt.relay_addr = argv[++i];
    else if ((a == "-d" || a == "--dest") && i + 1 < argc)
      opt.dest_addr = argv[++i];
    else if ((a == "-o" || a == "--out") && i + 1 < argc)
      opt.out_file = argv[++i];
    else if ((a == "-t" || a == "--seconds") && i + 1 < argc)
      opt.seconds = std::max(0, std::atoi(argv[++i]));
    else if (a == "-b" || a == "--buffered")
      opt.buffered = true;
    else if (a == "--poll-ms" && i + 1 < argc)
      opt.poll_ms = std::max(1, std::atoi(argv[++i]));
    else if (a == "--idle-ms" && i + 1 < argc)
      opt.idle_ms = std::max(1, std::atoi(argv[++i]));
  }
  return opt;
}

int main(int argc, char **argv) {
  auto opt = ParseArgs(argc, argv);
  if (opt.mode == "relay") {
    return httptunnel::app::RunRelay({.listen_addr = opt.listen_addr,
                                      .seconds = opt.seconds,
                                      .traffic_file = opt.out_file,
                                      .poll_ms = opt.poll_ms,
                                      .idle_ms = opt.idle_ms});
  }
  if (opt.mode == "client") {
    if (opt.relay_addr.empty() || opt.dest_addr.empty()) {
      Usage();
      return 2;
    }
    return httptunnel::app::RunClient({.relay_addr = opt.relay_addr,
                                       .dest_addr = opt.dest_addr,
                                       .buffered = opt.buffered,
                                       .idle_ms = opt.idle_ms});
  }
  Usage();
  return 2;
}
