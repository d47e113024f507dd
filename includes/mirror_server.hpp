#pragma once

#include "dbmirror.grpc.pb.h"
#include "sync_report.hpp"

class MirrorServiceImpl final : public dbmirror::v1::MirrorService::Service {
public:
  MirrorServiceImpl() = default;
  ~MirrorServiceImpl() = default;

  ::grpc::Status Run(::grpc::ServerContext *context,
                     const ::dbmirror::v1::RunRequest *request,
                     ::dbmirror::v1::RunResponse *response) override;
};

void fill_response(const SyncReport &report,
                   ::dbmirror::v1::RunResponse *response);
