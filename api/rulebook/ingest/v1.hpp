#pragma once

#include "rulebook/ingest/core/v1/types.pb.h"

#include "rulebook/ingest/queue/v1/job.pb.h"

#include "rulebook/ingest/services/v1/ingest_service.pb.h"
#include "rulebook/ingest/services/v1/retrieval_service.pb.h"

#include "rulebook/ingest/services/v1/ingest_service.grpc.pb.h"
#include "rulebook/ingest/services/v1/retrieval_service.grpc.pb.h"

namespace rulebook::ingest::v1 {
using namespace ::rulebook::ingest::core::v1;
using namespace ::rulebook::ingest::queue::v1;
using namespace ::rulebook::ingest::services::v1;
}
