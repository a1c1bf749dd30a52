#include "sqlite_repository.hpp"

namespace warranty::db::sqlite {

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteRepository::Migrate() {
  std::lock_guard lock(db_->TxMutex());
  sql::RunMigrations(*db_, sql::SqliteSchema());
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

sql::Executor& SqliteRepository::Exec(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

} // namespace warranty::db::sqlite
