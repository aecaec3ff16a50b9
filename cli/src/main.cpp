#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "pipeload/core/loading_engine.hpp"
#include "pipeload/core/order_import.hpp"
#include "pipeload/core/plan_report.hpp"
#include "pipeload/core/settings_file.hpp"

namespace {

struct CommandLine {
  std::string order_path{};
  std::string settings_path{};
  int template_index = 0;
  double pipe_length_m = 12.0;
  std::optional<bool> enable_nesting{};
  std::optional<int> max_levels{};
  bool include_trace = false;
  bool list_templates = false;
};

void PrintUsage(std::ostream& os) {
  os << "usage: pipeload_plan <order.csv> [--settings FILE] [--template N] [--length M]\n"
     << "                     [--no-nesting] [--max-levels N] [--trace]\n"
     << "       pipeload_plan --list-templates\n";
}

std::optional<CommandLine> ParseCommandLine(int argc, char** argv) {
  CommandLine cmd{};
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    const bool has_value = i + 1 < argc;
    try {
      if (arg == "--settings" && has_value) {
        cmd.settings_path = argv[++i];
      } else if (arg == "--template" && has_value) {
        cmd.template_index = std::stoi(argv[++i]);
      } else if (arg == "--length" && has_value) {
        cmd.pipe_length_m = std::stod(argv[++i]);
      } else if (arg == "--max-levels" && has_value) {
        cmd.max_levels = std::stoi(argv[++i]);
      } else if (arg == "--no-nesting") {
        cmd.enable_nesting = false;
      } else if (arg == "--trace") {
        cmd.include_trace = true;
      } else if (arg == "--list-templates") {
        cmd.list_templates = true;
      } else if (!arg.empty() && arg.front() != '-' && cmd.order_path.empty()) {
        cmd.order_path = std::string(arg);
      } else {
        std::cerr << "[error] unexpected argument '" << arg << "'\n";
        return std::nullopt;
      }
    } catch (const std::invalid_argument&) {
      std::cerr << "[error] malformed value for " << arg << "\n";
      return std::nullopt;
    } catch (const std::out_of_range&) {
      std::cerr << "[error] value out of range for " << arg << "\n";
      return std::nullopt;
    }
  }
  if (!cmd.list_templates && cmd.order_path.empty()) {
    return std::nullopt;
  }
  return cmd;
}

void PrintIssues(const pipeload::core::ValidationResult& validation) {
  for (const auto& issue : validation.issues) {
    const char* tag = issue.severity == pipeload::core::ValidationSeverity::kError ? "[error] " : "[warn] ";
    std::cerr << tag << issue.code << ": " << issue.message << "\n";
  }
}

}  // namespace

int main(int argc, char** argv) {
  const std::optional<CommandLine> cmd = ParseCommandLine(argc, argv);
  if (!cmd.has_value()) {
    PrintUsage(std::cerr);
    return 2;
  }

  const std::vector<pipeload::core::ContainerTemplate> templates = pipeload::core::default_container_templates();
  if (cmd->list_templates) {
    for (std::size_t i = 0; i < templates.size(); ++i) {
      const auto& t = templates[i];
      std::cout << i << ": " << t.name << " (" << t.max_payload_kg << " kg, " << t.internal_length_mm << " x "
                << t.internal_width_mm << " x " << t.internal_height_mm << " mm)\n";
    }
    return 0;
  }
  if (cmd->template_index < 0 || static_cast<std::size_t>(cmd->template_index) >= templates.size()) {
    std::cerr << "[error] template index " << cmd->template_index << " out of range (0.."
              << templates.size() - 1 << ")\n";
    return 2;
  }

  pipeload::core::LoadingEngine engine;
  if (!cmd->settings_path.empty()) {
    const pipeload::core::SettingsLoadResult loaded = pipeload::core::load_engine_settings(cmd->settings_path);
    if (!loaded.file_found) {
      std::cerr << "[warn] settings file " << cmd->settings_path << " not found, using defaults\n";
    }
    for (const std::string& warning : loaded.warnings) {
      std::cerr << "[warn] " << cmd->settings_path << " " << warning << "\n";
    }
    const auto applied = engine.UpdateSettings(loaded.settings);
    if (!applied.ok) {
      PrintIssues(applied.validation);
      return 1;
    }
  }

  const pipeload::core::OrderParseResult parsed = pipeload::core::parse_order_csv_file(cmd->order_path);
  for (const std::string& warning : parsed.warnings) {
    std::cerr << "[warn] " << warning << "\n";
  }
  for (const std::string& error : parsed.errors) {
    std::cerr << "[error] " << error << "\n";
  }
  if (!parsed.ok()) {
    return 1;
  }

  const auto lines = pipeload::core::resolve_order_lines(parsed, engine.catalog());
  if (!lines.ok) {
    PrintIssues(lines.validation);
    return 1;
  }

  pipeload::core::OrderRequest request = engine.MakeRequest();
  request.lines = lines.value;
  request.pipe_length_m = cmd->pipe_length_m;
  request.enable_nesting = cmd->enable_nesting.value_or(request.enable_nesting);
  request.max_nesting_levels = cmd->max_levels.value_or(request.max_nesting_levels);
  request.container = templates[static_cast<std::size_t>(cmd->template_index)];

  const auto result = engine.Optimize(request);
  if (!result.ok) {
    PrintIssues(result.validation);
    return 1;
  }

  for (const auto& warning : result.value.warnings) {
    std::cerr << "[warn] " << warning.message << "\n";
  }
  std::cout << pipeload::core::format_plan_report(result.value, cmd->include_trace);
  return result.value.unplaceable.empty() ? EXIT_SUCCESS : 3;
}
