#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace rulebook::db {
class Repository;
}
namespace rulebook::queue {
class QueueService;
}
namespace rulebook::worker {
class ProcessingWorker;
class ReconciliationSweeper;
}

namespace rulebook::factory {

/*
  Application

  Owns every long-lived component of the process. Workers and the
  sweeper are already running when Build() returns.
*/
struct Application {
  std::shared_ptr<db::Repository>    repository;
  std::shared_ptr<queue::QueueService> queue;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  std::vector<std::shared_ptr<worker::ProcessingWorker>> workers;
  std::shared_ptr<worker::ReconciliationSweeper>         sweeper; // null when disabled
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB, queue, storage
  and AI client types.
*/
Application Build(const rulebook::runtime::config::RuntimeConfig& config);

// Stops the sweeper and the workers (in-flight jobs finish), then closes the queue.
void Shutdown(Application& app);

} // namespace rulebook::factory
