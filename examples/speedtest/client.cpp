/**
 * @file client.cpp
 * @brief Speed-test client: waits for offers and runs a test against each.
 *
 * Usage: nspeed_client [--config speedtest.ini] [--size N] [--tcp N] [--udp N]
 *                      [--batch]
 *
 * Values missing from the command line are asked for on stdin unless
 * --batch is given, in which case the configured values are used. An empty
 * answer keeps the configured value.
 */

#include "nspeed/client.hpp"
#include "nspeed/log.hpp"
#include "nspeed/settings.hpp"
#include "nspeed/shutdown.hpp"

#include <cstdio>
#include <cstring>

namespace {

bool HasFlag(int argc, char* argv[], const char* name) {
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], name) == 0) return true;
  }
  return false;
}

/// Take @p arg if given, otherwise prompt. A blank answer keeps @p current;
/// non-numeric input returns false.
bool ReadCount(const char* arg, const char* prompt, bool interactive,
               uint64_t current, uint64_t& out) {
  if (arg != nullptr) return nspeed::ParseCount(arg, out);
  out = current;
  if (!interactive) return true;
  std::printf("%s[%llu] ", prompt, static_cast<unsigned long long>(current));
  std::fflush(stdout);
  char line[64];
  if (std::fgets(line, sizeof(line), stdin) == nullptr) return true;
  return nspeed::ParseCountOrKeep(line, current, out);
}

}  // namespace

int main(int argc, char* argv[]) {
  nspeed::log::Init();

  nspeed::Settings settings;
  const char* path = nspeed::FindArg(argc, argv, "--config");
  auto loaded = nspeed::LoadSettings(path ? path : "speedtest.ini", settings);
  if (!loaded.has_value() &&
      loaded.get_error() != nspeed::ConfigError::kFileNotFound) {
    return 1;
  }
  nspeed::log::SetLevel(settings.log_level);

  const bool interactive = !HasFlag(argc, argv, "--batch");
  uint64_t file_size = 0;
  uint64_t tcp = 0;
  uint64_t udp = 0;
  const bool ok =
      ReadCount(nspeed::FindArg(argc, argv, "--size"), "Enter file size: ",
                interactive, settings.file_size, file_size) &&
      ReadCount(nspeed::FindArg(argc, argv, "--tcp"),
                "Enter number of TCP connections: ", interactive,
                settings.tcp_connections, tcp) &&
      ReadCount(nspeed::FindArg(argc, argv, "--udp"),
                "Enter number of UDP connections: ", interactive,
                settings.udp_connections, udp);
  if (!ok || tcp > UINT32_MAX || udp > UINT32_MAX) {
    NSPEED_LOG_WARN("CLIENT", "Invalid input. Falling back to defaults.");
    file_size = nspeed::kDefaultFileSize;
    tcp = 1U;
    udp = 1U;
  }
  settings.file_size = file_size;
  settings.tcp_connections = static_cast<uint32_t>(tcp);
  settings.udp_connections = static_cast<uint32_t>(udp);

  nspeed::ShutdownManager shutdown;
  if (!shutdown.IsValid() || !shutdown.InstallSignalHandlers().has_value()) {
    NSPEED_LOG_ERROR("CLIENT", "Cannot install signal handlers");
    return 1;
  }

  nspeed::SpeedTestClient client(settings);
  if (!client.Start().has_value()) {
    return 1;
  }
  (void)shutdown.Register(
      [](int, void* ctx) { static_cast<nspeed::SpeedTestClient*>(ctx)->Stop(); },
      &client);

  shutdown.WaitForShutdown();
  nspeed::log::Shutdown();
  return 0;
}
