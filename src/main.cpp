#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include "core/config.hpp"
#include "core/display_loop.hpp"
#include "sinks/renderer.hpp"
#include "sinks/stdout_debug.hpp"
#include "sinks/terminal.hpp"
#include "store/status_store.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

}  // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);
  std::signal(SIGHUP, handle_shutdown_signal);

  const std::string config_path = argc > 1 ? argv[1] : agent_presence::core::default_config_path();

  agent_presence::core::PresenceConfig config{};
  try {
    config = agent_presence::core::load_presence_config_or_default(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << "[display] loaded config from " << config_path << " | "
            << agent_presence::core::format_presence_config(config) << '\n';

  auto store = agent_presence::store::make_status_store(config);

  std::unique_ptr<agent_presence::sinks::Renderer> renderer;
  if (config.display.stdout_debug) {
    renderer = std::make_unique<agent_presence::sinks::StdoutDebugRenderer>();
  } else {
    renderer = std::make_unique<agent_presence::sinks::TerminalRenderer>();
  }

  agent_presence::core::DisplayLoop display{config, *store, *renderer, {}, config_path};
  display.run_until(g_shutdown_requested);
  display.stop();

  std::cerr << "[display] shutdown signal received; exiting cleanly\n";

  return 0;
}
