#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "pipeload/core/loading_engine.hpp"
#include "pipeload/core/result.hpp"

namespace pipeload::core {

struct SettingsLoadResult {
  EngineSettings settings{};
  std::vector<std::string> warnings{};
  bool file_found = false;
};

// Flat key=value lines; '#' starts a comment. Unknown keys and malformed values
// leave the default in place and add a warning.
[[nodiscard]] SettingsLoadResult parse_engine_settings(std::string_view content);
[[nodiscard]] SettingsLoadResult load_engine_settings(const std::filesystem::path& path);

[[nodiscard]] std::string serialize_engine_settings(const EngineSettings& settings);
EngineResult<bool> save_engine_settings(const EngineSettings& settings, const std::filesystem::path& path);

}  // namespace pipeload::core
