#include "signature_scanner.hpp"

#include <algorithm>
#include <cctype>

namespace warranty::adapters {

SignatureScanner::SignatureScanner(std::vector<std::string> blocked_extensions) : blocked_extensions_(std::move(blocked_extensions)) {
}

warranty::core::ScanVerdict SignatureScanner::Scan(const std::string& storage_ref) {
  std::string ref = storage_ref;
  std::transform(ref.begin(), ref.end(), ref.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  for (const auto& ext : blocked_extensions_) {
    if (ref.size() >= ext.size() && ref.compare(ref.size() - ext.size(), ext.size(), ext) == 0) {
      return {false, "blocked file extension " + ext};
    }
  }
  return {true, "clean"};
}

} // namespace warranty::adapters
