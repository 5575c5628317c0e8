#include <grpcpp/grpcpp.h>

#include <iostream>
#include <memory>
#include <string>

#include <google/protobuf/util/time_util.h>

#include "api/streamlift/v1.hpp"

using namespace streamlift::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  streamliftctl <addr> upload <media_id> <movie|episode>\n"
            << "  streamliftctl <addr> enqueue '<raw json message>'\n"
            << "  streamliftctl <addr> jobs\n"
            << "  streamliftctl <addr> list-media\n"
            << "  streamliftctl <addr> list-playlists\n"
            << "  streamliftctl <addr> check-ffmpeg\n";
}

static const char* StateName(JobState state) {
  switch (state) {
    case JOB_STATE_QUEUED:
      return "queued";
    case JOB_STATE_UPLOADING:
      return "uploading";
    default:
      return "unknown";
  }
}

static int ListObjects(WorkerService::Stub& stub, ObjectScope scope) {
  grpc::ClientContext ctx;
  ListObjectsRequest  req;
  req.set_scope(scope);
  ListObjectsResponse resp;

  auto status = stub.ListObjects(&ctx, req, &resp);
  if (!status.ok()) {
    std::cerr << status.error_message() << "\n";
    return 2;
  }

  for (const auto& key : resp.keys()) std::cout << key << "\n";
  std::cout << "total=" << resp.keys_size() << "\n";
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = WorkerService::NewStub(channel);

  // ------------------------------------------------------------

  if (cmd == "upload") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    grpc::ClientContext ctx;
    UploadMediaRequest  req;
    req.set_media_id(argv[3]);
    req.set_media_type(argv[4]);
    EnqueueResponse resp;

    auto status = stub->UploadMedia(&ctx, req, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "message_id=" << resp.message_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "enqueue") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    grpc::ClientContext ctx;
    EnqueueRequest      req;
    req.set_body(argv[3]);
    EnqueueResponse resp;

    auto status = stub->Enqueue(&ctx, req, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "message_id=" << resp.message_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "jobs") {
    grpc::ClientContext ctx;
    ListJobsRequest     req;
    ListJobsResponse    resp;

    auto status = stub->ListJobs(&ctx, req, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    for (const auto& job : resp.jobs()) {
      std::cout << job.job_id() << " state=" << StateName(job.state())
                << " queued_at=" << google::protobuf::util::TimeUtil::ToString(job.queue_time());
      if (job.has_start_time()) {
        std::cout << " started_at=" << google::protobuf::util::TimeUtil::ToString(job.start_time());
      }
      std::cout << "\n";
    }
    std::cout << "in_flight=" << resp.in_flight() << "\n";
    std::cout << "queued=" << resp.queued() << "\n";
    std::cout << "inbox_depth=" << resp.inbox_depth() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list-media") {
    return ListObjects(*stub, OBJECT_SCOPE_MEDIA);
  }

  if (cmd == "list-playlists") {
    return ListObjects(*stub, OBJECT_SCOPE_PLAYLIST);
  }

  // ------------------------------------------------------------

  if (cmd == "check-ffmpeg") {
    grpc::ClientContext     ctx;
    CheckTranscoderRequest  req;
    CheckTranscoderResponse resp;

    auto status = stub->CheckTranscoder(&ctx, req, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << (resp.available() ? "available" : "unavailable") << "\n" << resp.detail() << "\n";
    return resp.available() ? 0 : 3;
  }

  Usage();
  return 1;
}
