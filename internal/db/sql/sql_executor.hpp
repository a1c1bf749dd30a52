#pragma once

#include <functional>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_row.hpp"

namespace warranty::db::sql {

/*
  Statement execution inside an open backend transaction.

  Implemented by each SQL backend's transaction type, so repository
  logic is written once against this interface.
*/
class Executor {
 public:
  virtual ~Executor() = default;

  // INSERT / UPDATE / DELETE. Result::affected carries the changed row count.
  virtual Result Execute(const std::string& sql, const Params& params) = 0;

  // SELECT. on_row is invoked once per row, in order.
  virtual Result Query(const std::string& sql, const Params& params, const std::function<void(const Row&)>& on_row) = 0;
};

} // namespace warranty::db::sql
