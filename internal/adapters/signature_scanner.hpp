#pragma once

#include <string>
#include <vector>

#include "internal/core/collaborators.hpp"

namespace warranty::adapters {

// In-process scanner that rejects references with blocked extensions.
class SignatureScanner final : public warranty::core::AttachmentScanner {
 public:
  explicit SignatureScanner(std::vector<std::string> blocked_extensions = {".exe", ".bat", ".cmd", ".js", ".scr", ".vbs"});

  warranty::core::ScanVerdict Scan(const std::string& storage_ref) override;

 private:
  std::vector<std::string> blocked_extensions_;
};

} // namespace warranty::adapters
