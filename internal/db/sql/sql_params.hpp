#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace warranty::db::sql {

/*
  Parameter abstraction.

  Postgres: $1 $2 $3
  SQLite:   ? ? ?

  Both use ordered binding; queries are written with '?' and the
  Postgres executor renumbers them.
*/

using Param = std::variant<
    std::nullptr_t,
    int32_t,
    int64_t,
    uint64_t,
    double,
    std::string
>;

using Params = std::vector<Param>;

}
