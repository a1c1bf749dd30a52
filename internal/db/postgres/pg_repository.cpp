#include "pg_repository.hpp"

namespace warranty::db::postgres {

namespace {

// DDL runs outside a transaction block, one statement at a time.
class PgMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::connection& conn) : conn_(conn) {
  }

  void ExecuteSQL(const std::string& sql) override {
    pqxx::nontransaction tx(conn_);
    tx.exec(sql);
  }

 private:
  pqxx::connection& conn_;
};

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

void PgRepository::Migrate() {
  auto                conn = pool_->Acquire();
  PgMigrationExecutor executor(*conn);
  sql::RunMigrations(executor, sql::PostgresSchema());
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

sql::Executor& PgRepository::Exec(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

} // namespace warranty::db::postgres
