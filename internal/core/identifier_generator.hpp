#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace warranty::core {

/*
  Barcode identifier generation.

  Format: <PREFIX>-<YYYY>-<BODY>
    PREFIX  2..10 upper-case letters
    BODY    48-bit payload in base36, zero-padded to 10 characters

  The payload mixes the batch entropy seed with (slot, attempt), so two
  workers holding different slots never derive the same body from a seed.
  Collisions with other batches are possible and left to CollisionDetector.
*/

struct GeneratorInput {
  std::string prefix;
  int         year    = 0;
  uint64_t    seed    = 0;
  uint32_t    slot    = 0;
  uint32_t    attempt = 0;
};

class BarcodeGenerator {
 public:
  virtual ~BarcodeGenerator() = default;

  virtual std::string Generate(const GeneratorInput& input) const = 0;
};

class EntropyBarcodeGenerator final : public BarcodeGenerator {
 public:
  std::string Generate(const GeneratorInput& input) const override;
};

uint64_t    Payload48(uint64_t seed, uint32_t slot, uint32_t attempt);
std::string EncodeBase36(uint64_t value, std::size_t width);

bool IsValidPrefix(std::string_view prefix);
bool IsWellFormedBarcode(std::string_view barcode);

// Fresh per-batch seed from the platform random device.
uint64_t DrawEntropySeed();

// BATCH-2024-000001, WAR-2024-000042, RPR-2024-000007
std::string FormatSequenceNumber(std::string_view kind, int year, uint64_t value);

} // namespace warranty::core
