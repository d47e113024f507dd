#include "config.hpp"
#include "mirror_error.hpp"
#include "mirror_logging.hpp"
#include "mirror_run.hpp"
#include "mirror_server.hpp"
#include "run_configuration.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <execinfo.h>
#include <grpcpp/grpcpp.h>
#include <iostream>
#include <map>
#include <memory>
#include <string>

namespace {
constexpr int EXIT_RUN_FAILED = 1;
constexpr int EXIT_TABLES_FAILED = 2;
constexpr int EXIT_USAGE = 64;

constexpr const char *USAGE =
    "Usage: dbmirror --port <PORT>\n"
    "       dbmirror run <key>=<value>...\n"
    "Keys: source_database, source_database_path, name_suffix, "
    "backup_directory, remote_address, remote_database, remote_user, "
    "remote_password, failure_policy, deadline_seconds\n";

// Token of the run in progress, read by the signal handler
std::atomic<CancellationToken *> active_token{nullptr};

void RunServer(const std::string &port) {
  std::string server_address = "0.0.0.0:" + port;
  MirrorServiceImpl service;

  grpc::EnableDefaultHealthCheckService(true);

  grpc::ServerBuilder builder;

  builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
  std::cout << "Server listening on " << server_address << std::endl;

  server->Wait();
}

void cancelRun(int) {
  CancellationToken *token = active_token.load();
  if (token != nullptr) {
    token->cancel();
  }
}

int RunOnce(int argc, char **argv, int first_arg) {
  std::map<std::string, std::string> properties;
  for (auto i = first_arg; i < argc; i++) {
    const std::string arg = argv[i];
    const auto eq = arg.find('=');
    if (eq == std::string::npos || eq == 0) {
      std::cerr << "Invalid argument <" << arg << ">\n" << USAGE;
      return EXIT_USAGE;
    }
    const auto key = arg.substr(0, eq);
    if (!config::is_known_property(key)) {
      std::cerr << "Unknown property <" << key << ">\n" << USAGE;
      return EXIT_USAGE;
    }
    properties[key] = arg.substr(eq + 1);
  }
  if (properties.find(config::PROP_REMOTE_PASSWORD) == properties.end()) {
    const char *password = std::getenv(config::ENV_REMOTE_PASSWORD);
    if (password != nullptr) {
      properties[config::PROP_REMOTE_PASSWORD] = password;
    }
  }

  auto logger = mirlog::Logger::CreateMultiSinkLogger(nullptr);
  try {
    const auto config = RunConfiguration::FromMap(properties);
    auto token = make_cancellation_token(config);
    active_token = &token;
    std::signal(SIGINT, cancelRun);
    std::signal(SIGTERM, cancelRun);

    const auto report = execute_mirror_run(config, token, logger);
    active_token = nullptr;
    std::cout << report.to_json() << std::endl;
    return report.all_succeeded() ? EXIT_SUCCESS : EXIT_TABLES_FAILED;
  } catch (const mirror_error::MirrorError &ex) {
    active_token = nullptr;
    logger.severe("Mirror run aborted (" +
                  std::string(mirror_error::to_string(ex.GetKind())) +
                  "): " + ex.what());
    return EXIT_RUN_FAILED;
  } catch (const std::invalid_argument &ex) {
    active_token = nullptr;
    std::cerr << ex.what() << "\n" << USAGE;
    return EXIT_USAGE;
  } catch (const std::exception &ex) {
    active_token = nullptr;
    logger.severe("Mirror run aborted: " + std::string(ex.what()));
    return EXIT_RUN_FAILED;
  }
}
} // namespace

void logCrash(int sig) {
  void *array[512];
  size_t size = backtrace(array, 512);
  char **strings = backtrace_symbols(array, size);

  std::cerr << "Crash signal " << sig << std::endl;
  std::cerr << "Stack trace: " << std::endl;

  for (size_t i = 0; i < size; i++) {
    std::cerr << strings[i] << std::endl;
  }

  free(strings);
  std::exit(sig);
}

int main(int argc, char **argv) {
  std::signal(SIGSEGV, logCrash);
  std::signal(SIGABRT, logCrash);

  if (argc >= 2 && strcmp(argv[1], "run") == 0) {
    return RunOnce(argc, argv, 2);
  }

  std::string port = "50052";
  for (auto i = 1; i < argc; i++) {
    if (strcmp(argv[i], "--port") == 0) {
      if (i + 1 >= argc) {
        std::cerr << "Please provide a port number.\n" << USAGE;
        return EXIT_USAGE;
      }
      port = argv[++i];
    } else {
      std::cerr << "Unknown argument <" << argv[i] << ">\n" << USAGE;
      return EXIT_USAGE;
    }
  }

  RunServer(port);
  return 0;
}
