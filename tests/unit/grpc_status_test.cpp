#include <arrow/buffer.h>

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <variant>

#include <grpcpp/grpcpp.h>

#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/worker_server.hpp"
#include "internal/queue/command.hpp"
#include "internal/service/worker_service.hpp"
#include "internal/storage/memory/memory_object_store.hpp"
#include "test_support.hpp"

namespace {

using streamlift::grpc::ToStatus;
using streamlift::grpc::WorkerServer;

class FixedCredentials final : public streamlift::auth::CredentialProvider {
 public:
  streamlift::auth::Credentials credentials;

  streamlift::auth::Credentials Current() override {
    return credentials;
  }

  streamlift::auth::Credentials Refresh() override {
    return credentials;
  }
};

class StubTranscoder final : public streamlift::transcode::Transcoder {
 public:
  bool available = true;

  streamlift::transcode::MediaInfo Probe(const std::string&, const streamlift::util::CancellationToken&) override {
    return {};
  }

  streamlift::transcode::TranscodeResult Transcode(const std::string&, const std::string&, const streamlift::transcode::CodecPlan&,
                                                   const streamlift::transcode::ProgressCallback&,
                                                   const streamlift::util::CancellationToken&) override {
    return {};
  }

  void ExtractSubtitle(const std::string&, int, const std::string&, const streamlift::util::CancellationToken&) override {
  }

  std::string CheckAvailable() override {
    if (!available) throw streamlift::util::TransientIoError("ffmpeg not found on PATH");
    return "ffmpeg version 6.1";
  }
};

struct Fixture {
  std::shared_ptr<FixedCredentials>                    credentials = std::make_shared<FixedCredentials>();
  std::shared_ptr<streamlift::storage::MemoryObjectStore> store    = std::make_shared<streamlift::storage::MemoryObjectStore>();
  std::shared_ptr<StubTranscoder>                      transcoder  = std::make_shared<StubTranscoder>();
  std::shared_ptr<streamlift::queue::InboxQueue>       inbox = std::make_shared<streamlift::queue::InboxQueue>(std::chrono::seconds(30));
  std::shared_ptr<streamlift::scheduler::JobScheduler> scheduler =
      std::make_shared<streamlift::scheduler::JobScheduler>([](const streamlift::model::TransferJob&) {}, 1);
  std::unique_ptr<WorkerServer> server;

  Fixture() {
    credentials->credentials.identity_id = "tenant-a";

    streamlift::service::WorkerContext ctx;
    ctx.credentials = credentials;
    ctx.store_for   = [this](const streamlift::auth::Credentials&) -> streamlift::storage::ObjectStorePtr { return store; };
    ctx.layout      = streamlift::storage::common::KeyLayout("media", "playlists");
    ctx.transcoder  = transcoder;
    ctx.inbox       = inbox;
    ctx.scheduler   = scheduler;
    server          = std::make_unique<WorkerServer>(std::make_shared<streamlift::service::WorkerService>(ctx));
  }
};

void TestExceptionMapping() {
  using namespace streamlift::util;
  assert(ToStatus(NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(InputError("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(std::invalid_argument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(CredentialExpired("x")).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
  assert(ToStatus(TransientIoError("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(Cancelled("x")).error_code() == ::grpc::StatusCode::CANCELLED);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(std::runtime_error("boom")).error_message() == "boom");
}

void TestUploadMediaEnqueuesCommand() {
  Fixture                                f;
  streamlift::v1::UploadMediaRequest     req;
  streamlift::v1::EnqueueResponse        resp;
  ::grpc::ServerContext                  ctx;
  req.set_media_id("m-42");
  req.set_media_type("episode");

  const auto status = f.server->UploadMedia(&ctx, &req, &resp);
  assert(status.ok());
  assert(!resp.message_id().empty());

  auto message = f.inbox->Receive(std::chrono::milliseconds(10));
  assert(message.has_value());
  assert(message->message_id == resp.message_id());
  auto command = streamlift::queue::ParseCommand(message->body);
  auto* upload = std::get_if<streamlift::queue::UploadMediaCommand>(&command);
  assert(upload != nullptr);
  assert(upload->media_id == "m-42");
  assert(upload->kind == streamlift::model::MediaKind::kEpisode);
}

void TestInvalidRequestsReturnInvalidArgument() {
  Fixture               f;
  ::grpc::ServerContext ctx;

  streamlift::v1::UploadMediaRequest upload;
  streamlift::v1::EnqueueResponse    resp;
  upload.set_media_id("m-1");
  upload.set_media_type("show");
  assert(f.server->UploadMedia(&ctx, &upload, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  streamlift::v1::EnqueueRequest enqueue;
  assert(f.server->Enqueue(&ctx, &enqueue, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  streamlift::v1::ListObjectsRequest  list;
  streamlift::v1::ListObjectsResponse list_resp;
  assert(f.server->ListObjects(&ctx, &list, &list_resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(f.inbox->Depth() == 0);
}

void TestListJobsReportsSchedulerAndInbox() {
  Fixture               f;
  ::grpc::ServerContext ctx;

  streamlift::v1::EnqueueRequest  enqueue;
  streamlift::v1::EnqueueResponse enqueue_resp;
  enqueue.set_body(streamlift::queue::EncodeUploadMedia("m-1", streamlift::model::MediaKind::kMovie));
  assert(f.server->Enqueue(&ctx, &enqueue, &enqueue_resp).ok());

  // Not started: the job stays admitted but never runs.
  f.scheduler->Submit(streamlift::testing::MakeJob("m-9"));

  streamlift::v1::ListJobsRequest  req;
  streamlift::v1::ListJobsResponse resp;
  assert(f.server->ListJobs(&ctx, &req, &resp).ok());
  assert(resp.jobs_size() == 1);
  assert(resp.jobs(0).job_id() == "m-9");
  assert(resp.jobs(0).state() == streamlift::v1::JOB_STATE_UPLOADING);
  assert(resp.jobs(0).has_start_time());
  assert(resp.in_flight() == 1);
  assert(resp.queued() == 0);
  assert(resp.inbox_depth() == 1);
}

void TestListObjectsScopedToTenant() {
  Fixture f;
  std::shared_ptr<arrow::Buffer> body = arrow::Buffer::FromString("x");
  f.store->Put("media/tenant-a/movie/m-1/segments/segment_000000.ts", body, {});
  f.store->Put("media/tenant-b/movie/m-2/segments/segment_000000.ts", body, {});
  f.store->Put("playlists/tenant-a/movie/m-1/playlist.m3u8", body, {});

  ::grpc::ServerContext               ctx;
  streamlift::v1::ListObjectsRequest  req;
  streamlift::v1::ListObjectsResponse resp;
  req.set_scope(streamlift::v1::OBJECT_SCOPE_MEDIA);
  assert(f.server->ListObjects(&ctx, &req, &resp).ok());
  assert(resp.keys_size() == 1);
  assert(resp.keys(0) == "media/tenant-a/movie/m-1/segments/segment_000000.ts");

  resp.Clear();
  req.set_scope(streamlift::v1::OBJECT_SCOPE_PLAYLIST);
  assert(f.server->ListObjects(&ctx, &req, &resp).ok());
  assert(resp.keys_size() == 1);
}

void TestCheckTranscoder() {
  Fixture                                 f;
  ::grpc::ServerContext                   ctx;
  streamlift::v1::CheckTranscoderRequest  req;
  streamlift::v1::CheckTranscoderResponse resp;

  assert(f.server->CheckTranscoder(&ctx, &req, &resp).ok());
  assert(resp.available());
  assert(resp.detail() == "ffmpeg version 6.1");

  f.transcoder->available = false;
  resp.Clear();
  assert(f.server->CheckTranscoder(&ctx, &req, &resp).ok());
  assert(!resp.available());
}

} // namespace

int main() {
  TestExceptionMapping();
  TestUploadMediaEnqueuesCommand();
  TestInvalidRequestsReturnInvalidArgument();
  TestListJobsReportsSchedulerAndInbox();
  TestListObjectsScopedToTenant();
  TestCheckTranscoder();

  std::cout << "streamlift_unit_grpc_status: pass\n";
  return 0;
}
