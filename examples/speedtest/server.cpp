/**
 * @file server.cpp
 * @brief Speed-test server: broadcasts offers and serves TCP/UDP downloads.
 *
 * Usage: nspeed_server [--config speedtest.ini]
 *
 * Runs until SIGINT/SIGTERM.
 */

#include "nspeed/log.hpp"
#include "nspeed/server.hpp"
#include "nspeed/settings.hpp"
#include "nspeed/shutdown.hpp"

#include <cstdio>

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

  nspeed::ShutdownManager shutdown;
  if (!shutdown.IsValid() || !shutdown.InstallSignalHandlers().has_value()) {
    NSPEED_LOG_ERROR("SERVER", "Cannot install signal handlers");
    return 1;
  }

  nspeed::SpeedTestServer server(settings);
  if (!server.Start().has_value()) {
    return 1;
  }
  (void)shutdown.Register(
      [](int, void* ctx) { static_cast<nspeed::SpeedTestServer*>(ctx)->Stop(); },
      &server);

  shutdown.WaitForShutdown();

  NSPEED_LOG_INFO("SERVER", "Served %llu TCP and %llu UDP requests",
                  static_cast<unsigned long long>(
                      server.Tcp() ? server.Tcp()->ConnectionsServed() : 0U),
                  static_cast<unsigned long long>(
                      server.Udp() ? server.Udp()->RequestsServed() : 0U));
  nspeed::log::Shutdown();
  return 0;
}
