// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include <catch2/catch_session.hpp>
#include <string>

void InitializeTestLogging(const std::string &level);
void ShutdownTestLogging();

int main(int argc, char *argv[]) {
  Catch::Session session;

  std::string log_level = "error";
  using namespace Catch::Clara;
  auto cli = session.cli() |
             Opt(log_level, "level")["--loglevel"](
                 "console log level for lanpeer components (default: error)");
  session.cli(cli);

  const int rc = session.applyCommandLine(argc, argv);
  if (rc != 0) {
    return rc;
  }

  InitializeTestLogging(log_level);
  const int result = session.run();
  ShutdownTestLogging();
  return result;
}
