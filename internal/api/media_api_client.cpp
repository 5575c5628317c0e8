#include "media_api_client.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "streamlift/v1/media_api.pb.h"

namespace streamlift::api {

using streamlift::observability::BoolField;
using streamlift::observability::IntField;
using streamlift::observability::StringField;

namespace {

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = false;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to encode request body: " + std::string(status.message()));
  }
  return json;
}

} // namespace

MediaApiClient::MediaApiClient(std::string base_url, std::shared_ptr<http::HttpClient> http)
    : base_url_(std::move(base_url)), http_(std::move(http)) {
  while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
  if (base_url_.empty()) {
    throw std::invalid_argument("api.base_url is required");
  }
}

std::string MediaApiClient::MediaUrl(const model::TransferJob& job, const std::string& suffix) const {
  return base_url_ + "/" + http::EscapeUrlComponent(job.tenant) + "/media/" + http::EscapeUrlComponent(job.job_id) + suffix;
}

void MediaApiClient::Finalize(const model::TransferJob& job, uint32_t segment_count, uint32_t total_segments, bool is_complete) {
  streamlift::v1::PlaylistProcessRequest request;
  request.set_segment_count(segment_count);
  request.set_total_segments(total_segments);
  request.set_is_complete(is_complete);

  http_->PostJson(MediaUrl(job, "/playlist/process"), ToJson(request));

  STREAMLIFT_LOG_DEBUG("Playlist processing requested", {StringField("job_id", job.job_id), IntField("segment_count", segment_count),
                                                          IntField("total_segments", total_segments), BoolField("is_complete", is_complete)});
}

void MediaApiClient::Push(const model::TransferJob& job, const StatusUpdate& update) {
  streamlift::v1::StatusUpdateRequest request;
  request.set_percentage(update.percentage);
  request.set_stage_name(update.stage_name);
  request.set_message(update.message);
  if (update.eta) {
    *request.mutable_eta() = util::ToProto(*update.eta);
  }

  http_->PostJson(MediaUrl(job, "/status"), ToJson(request));
}

} // namespace streamlift::api
