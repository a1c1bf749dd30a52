#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/sql/migrations.hpp"

namespace warranty::db::sqlite {

// Maps an sqlite3 (extended) result code onto the portable codes.
ErrorCode TranslateCode(int rc);

/*
  Thin RAII wrapper around one sqlite3* connection.

  The connection is shared by every transaction; TxMutex() serializes
  them so BEGIN..COMMIT never interleaves on the handle.
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (pragmas, migrations, BEGIN/COMMIT).
  // Throws db::DbError with the translated code.
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  // WAL, foreign keys, busy timeout.
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace warranty::db::sqlite
