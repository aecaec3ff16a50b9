#include "pipeload/core/result.hpp"

#include <utility>

#include "pipeload/core/entities.hpp"

namespace pipeload::core {

bool ValidationResult::has_errors() const {
  for (const auto& issue : issues) {
    if (issue.severity == ValidationSeverity::kError) {
      return true;
    }
  }
  return false;
}

void ValidationResult::add_error(std::string code, std::string message, ObjectId object_id) {
  issues.push_back({ValidationSeverity::kError, std::move(code), std::move(message), object_id});
}

void ValidationResult::add_warning(std::string code, std::string message, ObjectId object_id) {
  issues.push_back({ValidationSeverity::kWarning, std::move(code), std::move(message), object_id});
}

void ValidationResult::append(const ValidationResult& other) {
  issues.insert(issues.end(), other.issues.begin(), other.issues.end());
}

std::string ValidationResult::summary() const {
  std::string text;
  for (const auto& issue : issues) {
    if (issue.severity != ValidationSeverity::kError) {
      continue;
    }
    if (!text.empty()) {
      text += "; ";
    }
    text += issue.message;
  }
  return text;
}

std::vector<std::string> LoadingPlan::warning_messages() const {
  std::vector<std::string> messages;
  messages.reserve(warnings.size());
  for (const PlanWarning& warning : warnings) {
    messages.push_back(warning.message);
  }
  return messages;
}

}  // namespace pipeload::core
