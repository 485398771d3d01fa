#pragma once

#include <memory>
#include <pqxx/pqxx>
#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace streamledger::db::postgres {

// Serializable pqxx transaction; aborts on destruction when it was never committed.
class PgTransaction final : public db::Transaction {
public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);

  using SerializableWork = pqxx::transaction<pqxx::isolation_level::serializable>;

  SerializableWork& Work() { return *tx_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  // declared before tx_ so the work is destroyed first
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<SerializableWork> tx_;
  bool committed_ = false;
};

}
