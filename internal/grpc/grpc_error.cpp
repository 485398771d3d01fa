#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace streamledger::grpc {

using streamledger::core::v1::LedgerError;

LedgerError LedgerErrorOf(const std::exception& e) {
  using namespace streamledger::util;
  using namespace streamledger::core::v1;

  if (dynamic_cast<const NotAuthorized*>(&e)) return LEDGER_ERROR_NOT_AUTHORIZED;
  if (dynamic_cast<const InvalidState*>(&e)) return LEDGER_ERROR_INVALID_STATE;
  if (dynamic_cast<const InsufficientPayment*>(&e)) return LEDGER_ERROR_INSUFFICIENT_PAYMENT;
  if (dynamic_cast<const InvalidQuality*>(&e)) return LEDGER_ERROR_INVALID_QUALITY;
  if (dynamic_cast<const InvalidArgument*>(&e)) return LEDGER_ERROR_INVALID_ARGUMENT;
  if (dynamic_cast<const NotFound*>(&e)) return LEDGER_ERROR_NOT_FOUND;
  if (dynamic_cast<const AlreadyExists*>(&e)) return LEDGER_ERROR_ALREADY_EXISTS;
  if (dynamic_cast<const Overflow*>(&e)) return LEDGER_ERROR_OVERFLOW;
  if (dynamic_cast<const InsufficientFunds*>(&e)) return LEDGER_ERROR_INSUFFICIENT_FUNDS;
  return LEDGER_ERROR_UNSPECIFIED;
}

::grpc::Status ToStatus(const std::exception& e) {
  using namespace streamledger::core::v1;

  const auto error   = LedgerErrorOf(e);
  const auto details = LedgerError_Name(error);

  switch (error) {
    case LEDGER_ERROR_NOT_AUTHORIZED:
      return {::grpc::StatusCode::PERMISSION_DENIED, e.what(), details};
    case LEDGER_ERROR_INVALID_STATE:
    case LEDGER_ERROR_INSUFFICIENT_PAYMENT:
    case LEDGER_ERROR_INSUFFICIENT_FUNDS:
      return {::grpc::StatusCode::FAILED_PRECONDITION, e.what(), details};
    case LEDGER_ERROR_INVALID_QUALITY:
    case LEDGER_ERROR_OVERFLOW:
      return {::grpc::StatusCode::OUT_OF_RANGE, e.what(), details};
    case LEDGER_ERROR_INVALID_ARGUMENT:
      return {::grpc::StatusCode::INVALID_ARGUMENT, e.what(), details};
    case LEDGER_ERROR_NOT_FOUND:
      return {::grpc::StatusCode::NOT_FOUND, e.what(), details};
    case LEDGER_ERROR_ALREADY_EXISTS:
      return {::grpc::StatusCode::ALREADY_EXISTS, e.what(), details};
    default:
      break;
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace streamledger::grpc
