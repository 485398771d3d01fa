#include "registry_service.hpp"

#include <optional>

#include "internal/core/stream_ledger.hpp"
#include "observe_rpc.hpp"

namespace streamledger::service {

using namespace streamledger::v1;

RegistryService::RegistryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

GetRegistryResponse RegistryService::GetRegistry(const GetRegistryRequest&) {
  return ObserveRpc("RegistryService.GetRegistry", "", [&] {
    GetRegistryResponse resp;
    *resp.mutable_registry() = ctx_.ledger->GetRegistry();
    return resp;
  });
}

ListCategoryResponse RegistryService::ListCategory(const ListCategoryRequest& req) {
  return ObserveRpc("RegistryService.ListCategory", "", [&] {
    ListCategoryResponse resp;
    for (auto& id : ctx_.ledger->ListCategory(req.category())) {
      *resp.add_streams() = std::move(id);
    }
    return resp;
  });
}

ListEventsResponse RegistryService::ListEvents(const ListEventsRequest& req) {
  return ObserveRpc("RegistryService.ListEvents", "", [&] {
    std::optional<uint64_t> max_events;
    if (req.max_events() > 0) {
      max_events = req.max_events();
    }

    ListEventsResponse resp;
    for (auto& event : ctx_.ledger->ListEvents(req.after_sequence(), max_events)) {
      *resp.add_events() = std::move(event);
    }
    return resp;
  });
}

} // namespace streamledger::service
