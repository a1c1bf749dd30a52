#pragma once

#include "internal/core/collaborators.hpp"

namespace warranty::adapters {

// Writes each notification to the process log instead of delivering it.
class LogNotifier final : public warranty::core::Notifier {
 public:
  void Notify(const std::string& recipient, const std::string& template_id, const std::map<std::string, std::string>& payload) override;
};

} // namespace warranty::adapters
