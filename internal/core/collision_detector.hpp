#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>

#include "internal/db/api/repository.hpp"
#include "internal/model/batch.hpp"

namespace warranty::core {

// Strings accepted into one running batch but not yet committed.
class BatchReservations {
 public:
  // false when the string is already held by this batch.
  bool Reserve(const std::string& barcode);
  void Release(const std::string& barcode);

  std::size_t Size() const;

 private:
  mutable std::mutex              mutex_;
  std::unordered_set<std::string> held_;
};

/*
  Checks a candidate against the running batch, then the store.

  The store's unique index stays the final arbiter: a candidate can pass
  here and still lose at chunk commit to a concurrent writer.
*/
class CollisionDetector {
 public:
  explicit CollisionDetector(std::shared_ptr<db::Repository> repository);

  // nullopt = accepted and reserved in `batch`.
  std::optional<warranty::model::CollisionType> Check(BatchReservations& batch, const std::string& candidate);

  bool ExistsInStore(const std::string& candidate);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace warranty::core
