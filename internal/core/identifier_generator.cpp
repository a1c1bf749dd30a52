#include "identifier_generator.hpp"

#include <cctype>
#include <random>

#include <spdlog/fmt/fmt.h>

namespace warranty::core {

namespace {

constexpr uint64_t    kPayloadMask = (uint64_t{1} << 48) - 1;
constexpr std::size_t kBodyWidth   = 10;
constexpr char        kDigits[]    = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";

uint64_t SplitMix64(uint64_t x) {
  x += 0x9E3779B97F4A7C15ULL;
  x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
  x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
  return x ^ (x >> 31);
}

bool IsUpper(char c) {
  return c >= 'A' && c <= 'Z';
}

bool IsDigit(char c) {
  return c >= '0' && c <= '9';
}

} // namespace

uint64_t Payload48(uint64_t seed, uint32_t slot, uint32_t attempt) {
  const uint64_t counter = (static_cast<uint64_t>(attempt) << 32) | slot;
  return SplitMix64(SplitMix64(seed) ^ counter) & kPayloadMask;
}

std::string EncodeBase36(uint64_t value, std::size_t width) {
  std::string out;
  do {
    out.insert(out.begin(), kDigits[value % 36]);
    value /= 36;
  } while (value > 0);
  if (out.size() < width) {
    out.insert(0, width - out.size(), '0');
  }
  return out;
}

std::string EntropyBarcodeGenerator::Generate(const GeneratorInput& input) const {
  return fmt::format("{}-{:04d}-{}", input.prefix, input.year, EncodeBase36(Payload48(input.seed, input.slot, input.attempt), kBodyWidth));
}

bool IsValidPrefix(std::string_view prefix) {
  if (prefix.size() < 2 || prefix.size() > 10) return false;
  for (char c : prefix) {
    if (!IsUpper(c)) return false;
  }
  return true;
}

bool IsWellFormedBarcode(std::string_view barcode) {
  const auto first = barcode.find('-');
  if (first == std::string_view::npos) return false;
  const auto second = barcode.find('-', first + 1);
  if (second == std::string_view::npos) return false;

  const auto prefix = barcode.substr(0, first);
  const auto year   = barcode.substr(first + 1, second - first - 1);
  const auto body   = barcode.substr(second + 1);

  if (!IsValidPrefix(prefix) || year.size() != 4) return false;
  for (char c : year) {
    if (!IsDigit(c)) return false;
  }
  if (body.size() < 8 || body.size() > 16) return false;
  for (char c : body) {
    if (!IsDigit(c) && !IsUpper(c)) return false;
  }
  return true;
}

uint64_t DrawEntropySeed() {
  std::random_device rd;
  return (static_cast<uint64_t>(rd()) << 32) ^ rd();
}

std::string FormatSequenceNumber(std::string_view kind, int year, uint64_t value) {
  return fmt::format("{}-{:04d}-{:06d}", kind, year, value);
}

} // namespace warranty::core
