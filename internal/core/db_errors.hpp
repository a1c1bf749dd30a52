#pragma once

#include <string>

#include "internal/db/api/result.hpp"

namespace warranty::core {

// Maps a repository Result onto the util exception taxonomy.
void ThrowIfDbError(const db::Result& result, const std::string& context);

// Same mapping for failures raised by Commit() or a backend read.
[[noreturn]] void ThrowDbError(const db::DbError& error, const std::string& context);

} // namespace warranty::core
