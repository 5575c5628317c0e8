#include "worker_service.hpp"

#include <chrono>
#include <string>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/queue/command.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace streamlift::service {

using namespace streamlift::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  streamlift::observability::TraceSpan span(route);

  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };
  try {
    auto result = fn();
    streamlift::observability::Metrics::Instance().RecordRequest(route, true);
    streamlift::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    return result;
  } catch (const std::exception& ex) {
    span.Fail(ex.what());
    STREAMLIFT_LOG_ERROR("RPC failed",
                         {streamlift::observability::StringField("route", route), streamlift::observability::StringField("error", ex.what())});
    streamlift::observability::Metrics::Instance().RecordRequest(route, false);
    streamlift::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

JobState ToProto(scheduler::JobState state) {
  switch (state) {
    case scheduler::JobState::kQueued:
      return JOB_STATE_QUEUED;
    case scheduler::JobState::kUploading:
      return JOB_STATE_UPLOADING;
  }
  return JOB_STATE_UNSPECIFIED;
}

} // namespace

WorkerService::WorkerService(WorkerContext ctx) : ctx_(std::move(ctx)) {
}

EnqueueResponse WorkerService::Enqueue(const EnqueueRequest& req) {
  return ObserveRpc("WorkerService.Enqueue", [&] {
    if (req.body().empty()) {
      throw util::InputError("message body must not be empty");
    }
    EnqueueResponse resp;
    resp.set_message_id(ctx_.inbox->Send(req.body()));
    return resp;
  });
}

EnqueueResponse WorkerService::UploadMedia(const UploadMediaRequest& req) {
  return ObserveRpc("WorkerService.UploadMedia", [&] {
    if (req.media_id().empty()) {
      throw util::InputError("media_id must not be empty");
    }
    auto kind = model::ParseMediaKind(req.media_type());
    if (!kind) {
      throw util::InputError("media_type must be movie or episode, got '" + req.media_type() + "'");
    }

    EnqueueResponse resp;
    resp.set_message_id(ctx_.inbox->Send(queue::EncodeUploadMedia(req.media_id(), *kind)));
    STREAMLIFT_LOG_INFO("Upload requested", {streamlift::observability::StringField("media_id", req.media_id()),
                                             streamlift::observability::StringField("message_id", resp.message_id())});
    return resp;
  });
}

ListJobsResponse WorkerService::ListJobs(const ListJobsRequest&) {
  return ObserveRpc("WorkerService.ListJobs", [&] {
    ListJobsResponse resp;
    for (const auto& record : ctx_.scheduler->List()) {
      auto* job = resp.add_jobs();
      job->set_job_id(record.job_id);
      job->set_state(ToProto(record.state));
      *job->mutable_queue_time() = util::ToProto(record.queue_time);
      if (record.start_time) {
        *job->mutable_start_time() = util::ToProto(*record.start_time);
      }
    }
    resp.set_in_flight(ctx_.scheduler->InFlight());
    resp.set_queued(ctx_.scheduler->Queued());
    resp.set_inbox_depth(ctx_.inbox->Depth());
    return resp;
  });
}

ListObjectsResponse WorkerService::ListObjects(const ListObjectsRequest& req) {
  return ObserveRpc("WorkerService.ListObjects", [&] {
    std::string root;
    switch (req.scope()) {
      case OBJECT_SCOPE_MEDIA:
        root = ctx_.layout.MediaPath();
        break;
      case OBJECT_SCOPE_PLAYLIST:
        root = ctx_.layout.PlaylistPath();
        break;
      default:
        throw util::InputError("object scope must be MEDIA or PLAYLIST");
    }

    const auto credentials = ctx_.credentials->Current();
    storage::common::ValidateKeyComponent(credentials.identity_id, "tenant");
    const auto prefix = storage::common::JoinKey(root, credentials.identity_id) + "/";

    ListObjectsResponse resp;
    for (auto& key : ctx_.store_for(credentials)->List(prefix)) {
      resp.add_keys(std::move(key));
    }
    return resp;
  });
}

CheckTranscoderResponse WorkerService::CheckTranscoder(const CheckTranscoderRequest&) {
  return ObserveRpc("WorkerService.CheckTranscoder", [&] {
    CheckTranscoderResponse resp;
    try {
      resp.set_detail(ctx_.transcoder->CheckAvailable());
      resp.set_available(true);
    } catch (const util::TransientIoError& ex) {
      resp.set_available(false);
      resp.set_detail(ex.what());
    }
    return resp;
  });
}

} // namespace streamlift::service
