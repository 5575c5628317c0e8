#include "worker_server.hpp"

#include "grpc_error.hpp"

namespace streamlift::grpc {

WorkerServer::WorkerServer(std::shared_ptr<streamlift::service::WorkerService> svc) : service_(std::move(svc)) {
}

::grpc::Status WorkerServer::Enqueue(::grpc::ServerContext*, const streamlift::v1::EnqueueRequest* req, streamlift::v1::EnqueueResponse* resp) {
  try {
    *resp = service_->Enqueue(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkerServer::UploadMedia(::grpc::ServerContext*, const streamlift::v1::UploadMediaRequest* req,
                                         streamlift::v1::EnqueueResponse* resp) {
  try {
    *resp = service_->UploadMedia(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkerServer::ListJobs(::grpc::ServerContext*, const streamlift::v1::ListJobsRequest* req,
                                      streamlift::v1::ListJobsResponse* resp) {
  try {
    *resp = service_->ListJobs(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkerServer::ListObjects(::grpc::ServerContext*, const streamlift::v1::ListObjectsRequest* req,
                                         streamlift::v1::ListObjectsResponse* resp) {
  try {
    *resp = service_->ListObjects(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkerServer::CheckTranscoder(::grpc::ServerContext*, const streamlift::v1::CheckTranscoderRequest* req,
                                             streamlift::v1::CheckTranscoderResponse* resp) {
  try {
    *resp = service_->CheckTranscoder(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace streamlift::grpc
