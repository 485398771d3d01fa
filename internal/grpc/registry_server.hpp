#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/registry_service.hpp"
#include "streamledger/v1.hpp"

namespace streamledger::grpc {

class RegistryServer final : public streamledger::v1::RegistryService::Service {
public:
  explicit RegistryServer(std::shared_ptr<streamledger::service::RegistryService> svc);

  ::grpc::Status GetRegistry(::grpc::ServerContext*,
                             const streamledger::v1::GetRegistryRequest*,
                             streamledger::v1::GetRegistryResponse*) override;

  ::grpc::Status ListCategory(::grpc::ServerContext*,
                              const streamledger::v1::ListCategoryRequest*,
                              streamledger::v1::ListCategoryResponse*) override;

  ::grpc::Status ListEvents(::grpc::ServerContext*,
                            const streamledger::v1::ListEventsRequest*,
                            streamledger::v1::ListEventsResponse*) override;

private:
  std::shared_ptr<streamledger::service::RegistryService> service_;
};

} // namespace streamledger::grpc
