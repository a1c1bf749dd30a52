#pragma once

#include <memory>

#include "internal/db/sql/sql_repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace warranty::db::postgres {

class PgRepository final : public sql::SqlRepository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  void Migrate();

  std::unique_ptr<Transaction> Begin() override;

 protected:
  sql::Executor& Exec(Transaction& t) override;

 private:
  std::shared_ptr<PgPool> pool_;
};

} // namespace warranty::db::postgres
