#pragma once

#include <memory>

#include "internal/db/sql/sql_repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace warranty::db::sqlite {

class SqliteRepository final : public sql::SqlRepository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  // Creates missing tables and indexes.
  void Migrate();

  std::unique_ptr<Transaction> Begin() override;

 protected:
  sql::Executor& Exec(Transaction& t) override;

 private:
  std::shared_ptr<SqliteDB> db_;
};

} // namespace warranty::db::sqlite
