#include "api/api.hpp"
#include "config/config.hpp"
#include "deploy/orchestrator.hpp"
#include "host/filesystem.hpp"
#include "host/identity_probe.hpp"
#include "runtime/gateway.hpp"
#include "runtime/transport.hpp"

#include <atomic>
#include <chrono>
#include <clocale>
#include <csignal>
#include <cstdlib>
#include <execinfo.h>
#include <locale>
#include <spdlog/spdlog.h>
#include <thread>
#include <unistd.h>

std::atomic<bool> running{true};

void print_backtrace() {
  void *buffer[100];
  int size = backtrace(buffer, 100);
  char **symbols = backtrace_symbols(buffer, size);

  spdlog::error("=== BACKTRACE ===");
  for (int i = 0; i < size; i++) {
    spdlog::error("{}: {}", i, symbols[i]);
  }
  spdlog::error("=================");

  free(symbols);
}

void signal_handler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    running = false;
    return;
  }

  spdlog::error("Received signal {} in PID {}", signal, getpid());
  print_backtrace();
  spdlog::error("Critical signal received, exiting...");
  _exit(1);
}

void setup_safe_locale() {
  if (std::setlocale(LC_ALL, "C") != nullptr) {
    spdlog::info("Locale set to C");
  } else {
    spdlog::warn("Failed to set C locale, using default");
  }

  try {
    std::locale::global(std::locale::classic());
  } catch (const std::exception &e) {
    spdlog::warn("Failed to set C++ locale: {}", e.what());
  }
}

dbdock::deploy::TemplateCatalog
load_templates(const dbdock::config::ServerConfig &config) {
  dbdock::deploy::TemplateCatalog catalog;
  for (const auto &[name, repository] : config.template_repositories) {
    auto engine = dbdock::deploy::parse_engine(name);
    if (!engine) {
      spdlog::warn("Ignoring template override for unknown engine {}", name);
      continue;
    }
    catalog.override_repository(*engine, repository);
  }
  return catalog;
}

int main(int argc, char *argv[]) {
  using namespace dbdock;

  try {
    setup_safe_locale();

    std::signal(SIGSEGV, signal_handler);
    std::signal(SIGABRT, signal_handler);
    std::signal(SIGILL, signal_handler);
    std::signal(SIGFPE, signal_handler);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    spdlog::set_level(spdlog::level::info);

    const std::string config_path = argc > 1 ? argv[1] : "config.server.json";
    auto loaded = config::load_config(config_path);
    if (!loaded) {
      spdlog::error("Configuration error: {}", loaded.error());
      return EXIT_FAILURE;
    }
    auto settings = std::move(loaded).value();
    config::apply_env_overrides(settings);
    config::setup_logging(settings.logging);

    spdlog::info("Starting dbdock...");

    auto endpoint =
        runtime::discover_endpoint(config::socket_candidates(settings));
    if (!endpoint) {
      spdlog::error("No container runtime socket: {}",
                    endpoint.error().message());
      return EXIT_FAILURE;
    }
    spdlog::info("Using {} socket at {}",
                 runtime::to_string(endpoint.value().dialect()),
                 endpoint.value().socket_path());

    auto gateway = std::make_shared<runtime::RuntimeGateway>(
        endpoint.value(), std::make_shared<runtime::UnixSocketTransport>());
    auto filesystem = std::make_shared<host::LocalFilesystem>();

    const bool docker = endpoint.value().dialect() == runtime::Dialect::Docker;
    auto identity_probe = std::make_shared<host::CliIdentityProbe>(
        docker ? "docker" : "podman", docker ? "podman" : "docker");

    auto orchestrator = std::make_shared<deploy::Orchestrator>(
        gateway, filesystem, identity_probe, load_templates(settings),
        settings.storage.default_mode);

    auto handlers = std::make_shared<api::ApiHandlers>(
        gateway, orchestrator, filesystem, identity_probe);

    api::DbDockApi server(settings.server, handlers);
    server.init();
    server.start();

    while (running) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    server.shutdown();
    spdlog::info("dbdock shutdown complete");
    return EXIT_SUCCESS;
  } catch (const std::exception &e) {
    spdlog::error("Fatal error: {}", e.what());
    print_backtrace();
    return EXIT_FAILURE;
  }
}
