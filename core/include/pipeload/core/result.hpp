#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "pipeload/core/id.hpp"

namespace pipeload::core {

enum class ValidationSeverity : std::uint8_t {
  kError = 0,
  kWarning = 1,
};

struct ValidationIssue {
  ValidationSeverity severity = ValidationSeverity::kError;
  std::string code{};
  std::string message{};
  ObjectId object_id = kInvalidObjectId;
};

struct ValidationResult {
  std::vector<ValidationIssue> issues;

  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool ok() const { return !has_errors(); }

  void add_error(std::string code, std::string message, ObjectId object_id = kInvalidObjectId);
  void add_warning(std::string code, std::string message, ObjectId object_id = kInvalidObjectId);
  void append(const ValidationResult& other);
  // Single line joining every error message, used as EngineResult::error.
  [[nodiscard]] std::string summary() const;
};

template <typename TValue>
struct EngineResult {
  bool ok = false;
  TValue value{};
  std::string error{};
  ValidationResult validation{};
};

}  // namespace pipeload::core
