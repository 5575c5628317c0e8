#pragma once

#include "api/streamlift/v1.hpp"
#include "worker_context.hpp"

namespace streamlift::service {

class WorkerService {
 public:
  explicit WorkerService(WorkerContext ctx);

  streamlift::v1::EnqueueResponse Enqueue(const streamlift::v1::EnqueueRequest& req);

  // Builds an upload-media message and enqueues it.
  streamlift::v1::EnqueueResponse UploadMedia(const streamlift::v1::UploadMediaRequest& req);

  streamlift::v1::ListJobsResponse ListJobs(const streamlift::v1::ListJobsRequest& req);

  // Keys under the tenant's media or playlist root.
  streamlift::v1::ListObjectsResponse ListObjects(const streamlift::v1::ListObjectsRequest& req);

  streamlift::v1::CheckTranscoderResponse CheckTranscoder(const streamlift::v1::CheckTranscoderRequest& req);

 private:
  WorkerContext ctx_;
};

} // namespace streamlift::service
