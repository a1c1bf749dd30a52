#pragma once

#include <cstdint>
#include <memory>

namespace warranty::core {
class BatchJob;
}

namespace warranty::batch {

// One barcode slot of a running batch.
struct SlotTask {
  std::shared_ptr<warranty::core::BatchJob> job;
  uint32_t                                  slot = 0;
};

} // namespace warranty::batch
