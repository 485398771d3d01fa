#pragma once

#include <grpcpp/grpcpp.h>

#include "internal/util/errors.hpp"
#include "streamledger/core/v1/types.pb.h"

namespace streamledger::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  Several ledger errors share a status code, so the LedgerError enum name
  (e.g. "LEDGER_ERROR_INSUFFICIENT_PAYMENT") travels in error_details.
*/

streamledger::core::v1::LedgerError LedgerErrorOf(const std::exception& e);

::grpc::Status ToStatus(const std::exception& e);

} // namespace streamledger::grpc
