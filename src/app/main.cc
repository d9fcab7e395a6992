#include <signal.h>

#include <chrono>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

#include "realmlink/config/app_config.h"
#include "realmlink/config/data_files.h"
#include "realmlink/config/parse_error.h"
#include "realmlink/directory/connection_directory.h"
#include "realmlink/event/libevent_dispatcher.h"
#include "realmlink/gateway/command_gateway.h"
#include "realmlink/gateway/http_server.h"
#include "realmlink/http/http_client.h"
#include "realmlink/logging/log_macros.h"
#include "realmlink/logging/log_sink.h"
#include "realmlink/transport/ssl_context.h"
#include "realmlink/transport/transport_factory.h"

using namespace realmlink;

namespace {

void printUsage(const char* program_name) {
  std::cout << "Usage: " << program_name << " [--config <file>] [--help]"
            << std::endl;
  std::cout << std::endl;
  std::cout << "Keeps logged-in connections to the configured game servers and"
            << std::endl;
  std::cout << "serves their commands over HTTP." << std::endl;
  std::cout << std::endl;
  std::cout << "Options:" << std::endl;
  std::cout << "  --config <file>     YAML or JSON configuration file"
            << std::endl;
  std::cout << "  --help, -h          Show this help message" << std::endl;
  std::cout << std::endl;
  std::cout << "Without --config the file is looked up through REALMLINK_CONFIG,"
            << std::endl;
  std::cout << "./config/realmlink.{yaml,json} and /etc/realmlink/." << std::endl;
}

void configureLogging(const config::LoggingConfig& config) {
  auto& registry = logging::LoggerRegistry::instance();

  std::shared_ptr<logging::LogSink> sink;
  if (config.file.empty()) {
    sink = logging::SinkFactory::createStdioSink(true);
  } else {
    sink = logging::SinkFactory::createFileSink(config.file);
  }
  if (config.format == "json") {
    sink->setFormatter(std::make_unique<logging::JsonFormatter>());
  }
  registry.setDefaultSink(sink);

  registry.setGlobalLevel(logging::stringToLogLevel(config.level));
  registry.clearPatterns();
  for (const auto& pattern : config.patterns) {
    registry.setPattern(pattern.first,
                        logging::stringToLogLevel(pattern.second));
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;

  for (int i = 1; i < argc; i++) {
    if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      config_path = argv[++i];
    } else if (std::strcmp(argv[i], "--help") == 0 ||
               std::strcmp(argv[i], "-h") == 0) {
      printUsage(argv[0]);
      return 0;
    } else {
      std::cerr << "ERROR: Unknown argument: " << argv[i] << std::endl;
      printUsage(argv[0]);
      return 1;
    }
  }

  config::AppConfig app_config;
  try {
    app_config = config::loadAppConfig(config_path);
  } catch (const config::ConfigParseError& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 1;
  }

  configureLogging(app_config.logging);
  if (app_config.source.empty()) {
    LOG_INFO("No configuration file found, using defaults");
  } else {
    LOG_INFO("Configuration loaded from {}", app_config.source);
  }

  // Writes to a peer that went away must surface as errors, not kill us
  ::signal(SIGPIPE, SIG_IGN);

  config::DataFiles data = config::DataFiles::load(app_config.data_dir);
  LOG_INFO("{} allowed instances, {} credentials, {} command mappings",
           data.allowed().size(), data.credentialCount(), data.commandCount());

  transport::SslContextConfig ssl_config;
  ssl_config.verify_peer = app_config.tls.verify_peer;
  ssl_config.ca_cert_file = app_config.tls.ca_file;
  auto ssl = transport::SslContext::create(ssl_config);
  if (isError(ssl)) {
    LOG_CRITICAL("Failed to create TLS context: {}", getError(ssl).message);
    return 1;
  }

  http::HttpClient::Config http_config;
  http_config.verify_ssl_certificates = app_config.tls.verify_peer;
  http_config.ca_bundle_path = app_config.tls.ca_file;

  int exit_code = 0;
  try {
    event::LibeventDispatcher dispatcher("main");
    http::HttpClient http_client(http_config);

    directory::DirectoryOptions options;
    options.transports =
        transport::createTransportFactory(dispatcher, getValue(ssl));
    options.stream_transports = transport::createTcpTransportFactory(dispatcher);
    options.housekeeping = app_config.housekeeping;

    directory::ConnectionDirectory directory(
        dispatcher, std::move(data),
        directory::makeHttpFeedFetcher(http_client, dispatcher),
        std::move(options));
    gateway::CommandGateway gateway(directory);
    std::unique_ptr<gateway::HttpServer> server;

    auto listen_timer = dispatcher.createTimer([&]() {
      server = std::make_unique<gateway::HttpServer>(dispatcher, gateway);
      auto bound = server->bind(app_config.server.bind_address,
                                app_config.server.port);
      if (isError(bound)) {
        LOG_CRITICAL("{}", getError(bound).message);
        exit_code = 1;
        dispatcher.exit();
      }
    });

    directory.discover(app_config.feeds, [&]() {
      LOG_INFO("Starting {} connections", directory.size());
      directory.connectAll();
      listen_timer->enableTimer(
          std::chrono::milliseconds(app_config.server.listen_delay_ms));
    });

    auto on_sigint = dispatcher.listenForSignal(SIGINT, [&]() {
      LOG_INFO("Received SIGINT, shutting down");
      dispatcher.exit();
    });
    auto on_sigterm = dispatcher.listenForSignal(SIGTERM, [&]() {
      LOG_INFO("Received SIGTERM, shutting down");
      dispatcher.exit();
    });

    dispatcher.run();

    listen_timer.reset();
    server.reset();
  } catch (const std::runtime_error& e) {
    LOG_CRITICAL("Fatal: {}", e.what());
    exit_code = 1;
  }

  logging::LoggerRegistry::instance().getDefaultSink()->flush();
  return exit_code;
}
