#pragma once

#include <memory>

namespace streamledger::core { class StreamLedger; }

namespace streamledger::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<streamledger::core::StreamLedger> ledger;
};

}
