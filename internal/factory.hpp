#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/core/stream_ledger.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/ledger/quality.hpp"
#include "internal/util/time.hpp"

namespace streamledger::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>             repository;
  std::shared_ptr<core::StreamLedger>         ledger;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

// Quality limits from the ledger config section, defaults where unset.
ledger::QualityPolicy ResolveQualityPolicy(const streamledger::runtime::config::LedgerConfig& config);

// Opens the configured backend and bootstraps its schema.
std::shared_ptr<db::Repository> BuildRepository(const streamledger::runtime::config::RuntimeConfig& config);

/*
  Build

  Constructs the entire backend based on runtime config.

  This is the composition root of the application and the only place that
  knows concrete DB types. clock defaults to the system clock.
*/
Application Build(const streamledger::runtime::config::RuntimeConfig& config, std::shared_ptr<util::TimeSource> clock = nullptr);

} // namespace streamledger::factory
