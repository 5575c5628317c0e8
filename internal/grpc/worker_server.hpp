#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/worker_service.hpp"
#include "streamlift/v1/worker_service.grpc.pb.h"

namespace streamlift::grpc {

class WorkerServer final : public streamlift::v1::WorkerService::Service {
 public:
  explicit WorkerServer(std::shared_ptr<streamlift::service::WorkerService> svc);

  ::grpc::Status Enqueue(::grpc::ServerContext*, const streamlift::v1::EnqueueRequest*, streamlift::v1::EnqueueResponse*) override;

  ::grpc::Status UploadMedia(::grpc::ServerContext*, const streamlift::v1::UploadMediaRequest*, streamlift::v1::EnqueueResponse*) override;

  ::grpc::Status ListJobs(::grpc::ServerContext*, const streamlift::v1::ListJobsRequest*, streamlift::v1::ListJobsResponse*) override;

  ::grpc::Status ListObjects(::grpc::ServerContext*, const streamlift::v1::ListObjectsRequest*,
                             streamlift::v1::ListObjectsResponse*) override;

  ::grpc::Status CheckTranscoder(::grpc::ServerContext*, const streamlift::v1::CheckTranscoderRequest*,
                                 streamlift::v1::CheckTranscoderResponse*) override;

 private:
  std::shared_ptr<streamlift::service::WorkerService> service_;
};

} // namespace streamlift::grpc
