#include "collision_detector.hpp"

#include "db_errors.hpp"

namespace warranty::core {

using warranty::model::CollisionType;

bool BatchReservations::Reserve(const std::string& barcode) {
  std::lock_guard lock(mutex_);
  return held_.insert(barcode).second;
}

void BatchReservations::Release(const std::string& barcode) {
  std::lock_guard lock(mutex_);
  held_.erase(barcode);
}

std::size_t BatchReservations::Size() const {
  std::lock_guard lock(mutex_);
  return held_.size();
}

CollisionDetector::CollisionDetector(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::optional<CollisionType> CollisionDetector::Check(BatchReservations& batch, const std::string& candidate) {
  if (!batch.Reserve(candidate)) {
    return CollisionType::kDuplicateInBatch;
  }

  bool exists = false;
  try {
    exists = ExistsInStore(candidate);
  } catch (const std::exception&) {
    batch.Release(candidate);
    throw;
  }

  if (exists) {
    batch.Release(candidate);
    return CollisionType::kDuplicateInStore;
  }
  return std::nullopt;
}

bool CollisionDetector::ExistsInStore(const std::string& candidate) {
  try {
    auto tx     = repository_->Begin();
    bool exists = repository_->BarcodeExists(*tx, candidate);
    tx->Rollback();
    return exists;
  } catch (const db::DbError& e) {
    ThrowDbError(e, "barcode lookup");
  }
}

} // namespace warranty::core
