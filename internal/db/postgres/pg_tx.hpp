#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "internal/db/sql/sql_executor.hpp"
#include "pg_pool.hpp"

namespace warranty::db::postgres {

// Maps libpqxx exception types onto the portable codes.
ErrorCode TranslateException(const std::exception& e);

// Rewrites '?' placeholders to $1..$n, skipping quoted literals.
std::string Renumber(const std::string& sql);

class PgTransaction final : public db::Transaction, public sql::Executor {
 public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction() override;

  pqxx::work& Work() {
    return *tx_;
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return done_;
  }

  Result Execute(const std::string& sql, const sql::Params& params) override;
  Result Query(const std::string& sql, const sql::Params& params, const std::function<void(const sql::Row&)>& on_row) override;

 private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       tx_;
  bool                              done_ = false;
};

} // namespace warranty::db::postgres
