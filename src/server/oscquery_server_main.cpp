#include "oscquery-server/Logger.hpp"
#include "oscquery-server/QueryResolver.hpp"
#include "oscquery-server/ServerConfig.hpp"
#include "oscquery-server/server/OscQueryHttpServer.hpp"
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

using namespace oscquery;

static volatile std::sig_atomic_t g_running = 1;

void signal_handler(int sig) {
  (void)sig;
  g_running = 0;
}

void print_usage() {
  std::cout << "Usage: oscquery-server <command> [options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  serve <config>       Serve the configured address space\n";
  std::cout << "  dump <config> [target]\n";
  std::cout << "                       Print the answer to one request target "
               "(default: /)\n";
  std::cout << "  validate <config>    Check a configuration file\n";
  std::cout << "\nServe options:\n";
  std::cout << "  --port <port>        HTTP port (overrides http.port)\n";
  std::cout << "  --bind <address>     Bind address (overrides "
               "http.bind_address)\n";
  std::cout << "  --log-level <level>  trace|debug|info|warn|error\n";
  std::cout << "\nExamples:\n";
  std::cout << "  oscquery-server serve server.yaml --port 8080\n";
  std::cout << "  oscquery-server dump server.yaml '/synth/volume?RANGE'\n";
}

void print_warnings(const ServerConfig &config) {
  for (const auto &warning : config.warnings) {
    std::cerr << "Warning: " << warning << "\n";
  }
}

int cmd_serve(int argc, char **argv);
int cmd_dump(int argc, char **argv);
int cmd_validate(int argc, char **argv);

int main(int argc, char **argv) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::string command = argv[1];

  if (command == "serve") {
    return cmd_serve(argc - 2, argv + 2);
  } else if (command == "dump") {
    return cmd_dump(argc - 2, argv + 2);
  } else if (command == "validate") {
    return cmd_validate(argc - 2, argv + 2);
  } else if (command == "--help" || command == "-h") {
    print_usage();
    return 0;
  } else {
    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage();
    return 1;
  }
}

int cmd_serve(int argc, char **argv) {
  if (argc < 1) {
    std::cerr << "Error: serve requires config file\n";
    std::cerr << "Usage: oscquery-server serve <config> [--port <port>] "
                 "[--bind <address>] [--log-level <level>]\n";
    return 1;
  }

  std::string config_path = argv[0];
  std::string port_arg;
  std::string bind_arg;
  std::string log_level;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--port" && i + 1 < argc) {
      port_arg = argv[++i];
    } else if (arg == "--bind" && i + 1 < argc) {
      bind_arg = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      log_level = argv[++i];
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      return 1;
    }
  }

  try {
    auto config = load_server_config(config_path);

    if (!port_arg.empty()) {
      int port = std::stoi(port_arg);
      if (port < 0 || port > 65535) {
        std::cerr << "Error: port out of range: " << port_arg << "\n";
        return 1;
      }
      config.http.port = static_cast<uint16_t>(port);
    }
    if (!bind_arg.empty()) {
      config.http.bind_address = bind_arg;
    }
    if (!log_level.empty()) {
      config.logging.level = log_level;
    }

    OscQueryLogger::instance().init(config.logging.file,
                                    parse_log_level(config.logging.level));
    LOG_INFO("MAIN", "SERVE", "Starting OSCQuery server from {}", config_path);
    for (const auto &warning : config.warnings) {
      LOG_WARN("MAIN", "SERVE", "{}", warning);
    }

    auto tree = build_address_tree(config);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    server::OscQueryHttpServer http(tree);
    if (!http.start(config.http.bind_address, config.http.port)) {
      std::cerr << "Failed to start HTTP server on "
                << config.http.bind_address << ":" << config.http.port << "\n";
      return 1;
    }

    std::cout << "Serving " << config.endpoints.size() << " endpoints on http://"
              << config.http.bind_address << ":" << http.port() << "/\n";

    while (g_running && http.is_running()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    LOG_INFO("MAIN", "SERVE", "Shutting down");
    http.stop();
    return 0;

  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}

int cmd_dump(int argc, char **argv) {
  if (argc < 1) {
    std::cerr << "Error: dump requires config file\n";
    std::cerr << "Usage: oscquery-server dump <config> [target]\n";
    return 1;
  }

  std::string config_path = argv[0];
  std::string target = argc > 1 ? argv[1] : "/";

  try {
    auto config = load_server_config(config_path);
    print_warnings(config);
    auto tree = build_address_tree(config);
    auto result = resolve_query(*tree, parse_request_target(target));
    std::cout << dump_body(result.body, 2) << "\n";
    return result.status == QueryStatus::Ok ? 0 : 1;

  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}

int cmd_validate(int argc, char **argv) {
  if (argc < 1) {
    std::cerr << "Error: validate requires config file\n";
    std::cerr << "Usage: oscquery-server validate <config>\n";
    return 1;
  }

  std::string config_path = argv[0];

  try {
    auto config = load_server_config(config_path);
    print_warnings(config);
    auto tree = build_address_tree(config);
    std::cout << "Configuration valid: " << config.endpoints.size()
              << " endpoints, " << tree->root().subtree_size() << " nodes\n";
    return 0;

  } catch (const ConfigError &e) {
    std::cerr << "Invalid configuration: " << e.what() << "\n";
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  }
}
