#pragma once

#include <memory>

namespace rulebook::core {
class BatchManager;
class RetrievalEngine;
}

namespace rulebook::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<rulebook::core::BatchManager>    batches;
  std::shared_ptr<rulebook::core::RetrievalEngine> retrieval;
};

} // namespace rulebook::service
