#include "log_notifier.hpp"

#include "internal/observability/logging.hpp"

namespace warranty::adapters {

void LogNotifier::Notify(const std::string& recipient, const std::string& template_id, const std::map<std::string, std::string>& payload) {
  std::string body;
  for (const auto& [key, value] : payload) {
    if (!body.empty()) body += ",";
    body += key + "=" + value;
  }
  WARRANTY_LOG_INFO("notification", {observability::StringField("recipient", recipient), observability::StringField("template", template_id),
                                     observability::StringField("payload", body)});
}

} // namespace warranty::adapters
