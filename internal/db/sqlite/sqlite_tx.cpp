#include "sqlite_tx.hpp"

#include <variant>

#include "internal/observability/logging.hpp"

namespace warranty::db::sqlite {

namespace {

class SqliteRow final : public sql::Row {
 public:
  explicit SqliteRow(sqlite3_stmt* st) : st_(st) {
  }

  std::string GetText(int col) const override {
    const unsigned char* t = sqlite3_column_text(st_, col);
    return t ? reinterpret_cast<const char*>(t) : "";
  }

  int GetInt(int col) const override {
    return sqlite3_column_int(st_, col);
  }

  int64_t GetInt64(int col) const override {
    return sqlite3_column_int64(st_, col);
  }

  double GetDouble(int col) const override {
    return sqlite3_column_double(st_, col);
  }

  bool IsNull(int col) const override {
    return sqlite3_column_type(st_, col) == SQLITE_NULL;
  }

 private:
  sqlite3_stmt* st_;
};

// Finalizes on scope exit.
struct Statement {
  sqlite3_stmt* st = nullptr;
  ~Statement() {
    if (st) sqlite3_finalize(st);
  }
};

int Bind(sqlite3_stmt* st, const sql::Params& params) {
  for (std::size_t i = 0; i < params.size(); ++i) {
    const int idx = static_cast<int>(i + 1);
    int       rc  = std::visit(
        [&](const auto& v) -> int {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return sqlite3_bind_null(st, idx);
          } else if constexpr (std::is_same_v<T, std::string>) {
            return sqlite3_bind_text(st, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
          } else if constexpr (std::is_same_v<T, double>) {
            return sqlite3_bind_double(st, idx, v);
          } else {
            return sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
          }
        },
        params[i]);
    if (rc != SQLITE_OK) return rc;
  }
  return SQLITE_OK;
}

} // namespace

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (done_) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    WARRANTY_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  try {
    db_->Exec("COMMIT;");
  } catch (const DbError&) {
    // a failed COMMIT leaves the transaction open
    db_->Exec("ROLLBACK;");
    done_ = true;
    throw;
  }
  done_ = true;
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  done_ = true;
}

Result SqliteTransaction::Fail(int rc) const {
  return Result::Err(TranslateCode(rc), sqlite3_errmsg(Handle()));
}

Result SqliteTransaction::Execute(const std::string& sql, const sql::Params& params) {
  Statement stmt;
  if (int rc = sqlite3_prepare_v2(Handle(), sql.c_str(), -1, &stmt.st, nullptr); rc != SQLITE_OK) return Fail(rc);
  if (int rc = Bind(stmt.st, params); rc != SQLITE_OK) return Fail(rc);

  int rc = sqlite3_step(stmt.st);
  while (rc == SQLITE_ROW) {
    rc = sqlite3_step(stmt.st);
  }
  if (rc != SQLITE_DONE) return Fail(sqlite3_extended_errcode(Handle()));
  return Result::Ok(static_cast<std::size_t>(sqlite3_changes(Handle())));
}

Result SqliteTransaction::Query(const std::string& sql, const sql::Params& params, const std::function<void(const sql::Row&)>& on_row) {
  Statement stmt;
  if (int rc = sqlite3_prepare_v2(Handle(), sql.c_str(), -1, &stmt.st, nullptr); rc != SQLITE_OK) return Fail(rc);
  if (int rc = Bind(stmt.st, params); rc != SQLITE_OK) return Fail(rc);

  SqliteRow row(stmt.st);
  int       rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.st)) == SQLITE_ROW) {
    on_row(row);
  }
  if (rc != SQLITE_DONE) return Fail(sqlite3_extended_errcode(Handle()));
  return Result::Ok();
}

} // namespace warranty::db::sqlite
