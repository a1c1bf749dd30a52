#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "internal/db/sql/sql_executor.hpp"
#include "sqlite_db.hpp"

namespace warranty::db::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later

  Holds the connection's transaction mutex for its whole lifetime, so a
  thread must never open a second transaction while one is live.
*/
class SqliteTransaction final : public db::Transaction, public sql::Executor {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return done_;
  }

  Result Execute(const std::string& sql, const sql::Params& params) override;
  Result Query(const std::string& sql, const sql::Params& params, const std::function<void(const sql::Row&)>& on_row) override;

 private:
  Result Fail(int rc) const;

  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  bool                         done_ = false;
};

} // namespace warranty::db::sqlite
