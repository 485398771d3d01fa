#pragma once

#include "service_context.hpp"
#include "streamledger/v1.hpp"

namespace streamledger::service {

class RegistryService {
 public:
  explicit RegistryService(ServiceContext ctx);

  streamledger::v1::GetRegistryResponse  GetRegistry(const streamledger::v1::GetRegistryRequest& req);
  streamledger::v1::ListCategoryResponse ListCategory(const streamledger::v1::ListCategoryRequest& req);
  streamledger::v1::ListEventsResponse   ListEvents(const streamledger::v1::ListEventsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace streamledger::service
