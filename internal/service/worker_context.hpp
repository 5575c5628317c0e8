#pragma once

#include <memory>

#include "internal/auth/credential_provider.hpp"
#include "internal/pipeline/upload_pipeline.hpp"
#include "internal/queue/inbox_queue.hpp"
#include "internal/scheduler/job_scheduler.hpp"
#include "internal/storage/common/key_layout.hpp"
#include "internal/transcode/transcoder.hpp"

namespace streamlift::service {

/*
  Dependency container shared by the worker services.

  Passed explicitly; nothing here is reachable through a global.
*/
struct WorkerContext {
  std::shared_ptr<auth::CredentialProvider> credentials;
  pipeline::ObjectStoreProvider             store_for;
  storage::common::KeyLayout                layout{"", ""};
  transcode::TranscoderPtr                  transcoder;
  std::shared_ptr<queue::InboxQueue>        inbox;
  std::shared_ptr<scheduler::JobScheduler>  scheduler;
};

} // namespace streamlift::service
