#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pipeload/core/catalog.hpp"
#include "pipeload/core/entities.hpp"
#include "pipeload/core/result.hpp"

namespace pipeload::core {

struct ParsedOrderRow {
  int dn_mm = 0;
  std::string pressure_class{};
  int quantity = 0;
  std::string code{};
  // 1-based line number in the source, header included.
  int row_number = 0;
};

struct OrderParseResult {
  std::vector<ParsedOrderRow> rows{};
  std::vector<std::string> errors{};
  std::vector<std::string> warnings{};
  std::size_t total_rows = 0;

  [[nodiscard]] bool ok() const { return errors.empty(); }
};

// Most frequent of , ; TAB | in the first five lines. Ties keep that order.
[[nodiscard]] char detect_delimiter(std::string_view content);

// Without a header the columns are read as DN, PN, quantity.
[[nodiscard]] OrderParseResult parse_order_csv(
    std::string_view content,
    std::optional<char> delimiter = std::nullopt,
    bool has_header = true);

[[nodiscard]] OrderParseResult parse_order_csv_file(const std::filesystem::path& path);

[[nodiscard]] std::optional<int> parse_dn_value(std::string_view value);
[[nodiscard]] std::optional<std::string> parse_pressure_class(std::string_view value);

// Resolves by code first, then by DN and pressure class.
[[nodiscard]] EngineResult<std::vector<OrderLine>> resolve_order_lines(
    const OrderParseResult& parsed,
    const PipeCatalog& catalog);

}  // namespace pipeload::core
