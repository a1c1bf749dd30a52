#include "pg_tx.hpp"

#include <variant>

#include "internal/observability/logging.hpp"

namespace warranty::db::postgres {

namespace {

class PgRow final : public sql::Row {
 public:
  explicit PgRow(const pqxx::row& row) : row_(row) {
  }

  std::string GetText(int col) const override {
    return row_[col].is_null() ? std::string() : std::string(row_[col].c_str());
  }

  int GetInt(int col) const override {
    return row_[col].is_null() ? 0 : row_[col].as<int>();
  }

  int64_t GetInt64(int col) const override {
    return row_[col].is_null() ? 0 : row_[col].as<int64_t>();
  }

  double GetDouble(int col) const override {
    return row_[col].is_null() ? 0.0 : row_[col].as<double>();
  }

  bool IsNull(int col) const override {
    return row_[col].is_null();
  }

 private:
  const pqxx::row& row_;
};

pqxx::params ToPqxx(const sql::Params& params) {
  pqxx::params out;
  for (const auto& p : params) {
    std::visit(
        [&](const auto& v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out.append();
          } else if constexpr (std::is_same_v<T, uint64_t>) {
            out.append(static_cast<int64_t>(v));
          } else {
            out.append(v);
          }
        },
        p);
  }
  return out;
}

} // namespace

ErrorCode TranslateException(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return ErrorCode::AlreadyExists;
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return ErrorCode::ConstraintViolation;
  if (dynamic_cast<const pqxx::transaction_rollback*>(&e)) return ErrorCode::SerializationFailure;
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return ErrorCode::IOError;
  if (dynamic_cast<const pqxx::in_doubt_error*>(&e)) return ErrorCode::IOError;
  return ErrorCode::InternalError;
}

std::string Renumber(const std::string& sql) {
  std::string out;
  out.reserve(sql.size() + 16);
  int  n        = 0;
  bool in_quote = false;
  for (char c : sql) {
    if (c == '\'') in_quote = !in_quote;
    if (c == '?' && !in_quote) {
      out += '$';
      out += std::to_string(++n);
      continue;
    }
    out += c;
  }
  return out;
}

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  conn_ = pool->Acquire();
  tx_   = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (done_) return;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    WARRANTY_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const std::exception& e) {
    done_ = true;
    throw DbError(TranslateException(e), e.what());
  }
  done_ = true;
}

void PgTransaction::Rollback() {
  tx_->abort();
  done_ = true;
}

Result PgTransaction::Execute(const std::string& sql, const sql::Params& params) {
  try {
    auto res = tx_->exec_params(Renumber(sql), ToPqxx(params));
    return Result::Ok(static_cast<std::size_t>(res.affected_rows()));
  } catch (const std::exception& e) {
    return Result::Err(TranslateException(e), e.what());
  }
}

Result PgTransaction::Query(const std::string& sql, const sql::Params& params, const std::function<void(const sql::Row&)>& on_row) {
  pqxx::result res;
  try {
    res = tx_->exec_params(Renumber(sql), ToPqxx(params));
  } catch (const std::exception& e) {
    return Result::Err(TranslateException(e), e.what());
  }
  for (const auto& row : res) {
    on_row(PgRow(row));
  }
  return Result::Ok();
}

} // namespace warranty::db::postgres
