#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/config/config_loader.hpp"
#include "internal/queue/queue_consumer.hpp"
#include "internal/service/worker_context.hpp"
#include "internal/util/cancellation.hpp"

namespace streamlift::factory {

/*
  Application

  Owns all long-lived components of the worker.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  config::WorkerSettings                      settings;
  service::WorkerContext                      context;
  std::shared_ptr<queue::QueueConsumer>       consumer;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Constructs the entire worker from runtime config. Jobs observe cancel,
  so tripping it aborts in-flight transfers at the next segment boundary.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete store, transcoder and
  HTTP client types.
*/
Application Build(const streamlift::runtime::config::RuntimeConfig& config, util::CancellationToken cancel);

} // namespace streamlift::factory
