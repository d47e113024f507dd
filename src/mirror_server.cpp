#include "mirror_server.hpp"

#include "dbmirror.grpc.pb.h"
#include "mirror_error.hpp"
#include "mirror_logging.hpp"
#include "mirror_run.hpp"
#include "run_configuration.hpp"

#include <chrono>
#include <exception>
#include <future>
#include <grpcpp/grpcpp.h>
#include <string>

namespace {
constexpr std::chrono::milliseconds CANCELLATION_POLL_INTERVAL(200);

::grpc::StatusCode status_code_for(const mirror_error::ErrorKind kind) {
  if (kind == mirror_error::ErrorKind::Cancelled) {
    return ::grpc::StatusCode::CANCELLED;
  }
  if (mirror_error::is_run_fatal(kind)) {
    return ::grpc::StatusCode::FAILED_PRECONDITION;
  }
  return ::grpc::StatusCode::INTERNAL;
}
} // namespace

void fill_response(const SyncReport &report,
                   ::dbmirror::v1::RunResponse *response) {
  response->set_backup_file(report.backup.full_path);
  for (const auto &table : report.tables) {
    auto *out = response->add_tables();
    out->set_source_table(table.source.qualified_name());
    out->set_target_table(table.target_table);
    out->set_status(to_string(table.status));
    if (table.error_kind.has_value()) {
      out->set_error_kind(mirror_error::to_string(table.error_kind.value()));
    }
    out->set_message(table.message);
    out->set_rows_copied(table.rows_copied);
    out->set_created(table.created);
  }
}

grpc::Status MirrorServiceImpl::Run(::grpc::ServerContext *context,
                                    const ::dbmirror::v1::RunRequest *request,
                                    ::dbmirror::v1::RunResponse *response) {
  auto logger = mirlog::Logger::CreateMultiSinkLogger(nullptr);
  try {
    logger.info("Endpoint <Run>: started");
    const auto config = RunConfiguration::FromMap(request->configuration());
    auto token = make_cancellation_token(config);

    // Forward client cancellation to the run, which checks the token between
    // steps and row chunks
    auto pending = std::async(std::launch::async, [&]() {
      return execute_mirror_run(config, token, logger);
    });
    while (pending.wait_for(CANCELLATION_POLL_INTERVAL) !=
           std::future_status::ready) {
      if (context != nullptr && context->IsCancelled()) {
        token.cancel();
      }
    }
    const auto report = pending.get();
    fill_response(report, response);
  } catch (const mirror_error::MirrorError &e) {
    logger.severe("Run endpoint failed (" +
                  std::string(mirror_error::to_string(e.GetKind())) +
                  "): " + e.what());
    return ::grpc::Status(
        status_code_for(e.GetKind()),
        mirror_error::truncate_for_grpc_header(
            std::string(mirror_error::to_string(e.GetKind())) + ": " +
            e.what()));
  } catch (const std::invalid_argument &e) {
    logger.severe("Run endpoint rejected configuration: " +
                  std::string(e.what()));
    return ::grpc::Status(::grpc::StatusCode::INVALID_ARGUMENT,
                          mirror_error::truncate_for_grpc_header(e.what()));
  } catch (const std::exception &e) {
    logger.severe("Run endpoint failed: " + std::string(e.what()));
    return ::grpc::Status(::grpc::StatusCode::INTERNAL,
                          mirror_error::truncate_for_grpc_header(e.what()));
  }

  logger.info("Endpoint <Run>: ended");
  return ::grpc::Status(::grpc::StatusCode::OK, "");
}
