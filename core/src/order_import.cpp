#include "pipeload/core/order_import.hpp"

#include <array>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace pipeload::core {

namespace {

enum class OrderColumn {
  kDiameter = 0,
  kPressureClass = 1,
  kSdr = 2,
  kQuantity = 3,
  kCode = 4,
};

const std::unordered_map<std::string, OrderColumn>& column_aliases() {
  static const std::unordered_map<std::string, OrderColumn> aliases = {
      {"dn", OrderColumn::kDiameter},
      {"dn_mm", OrderColumn::kDiameter},
      {"diameter", OrderColumn::kDiameter},
      {"diametru", OrderColumn::kDiameter},
      {"outer_diameter", OrderColumn::kDiameter},
      {"od", OrderColumn::kDiameter},
      {"pn", OrderColumn::kPressureClass},
      {"pn_class", OrderColumn::kPressureClass},
      {"pressure", OrderColumn::kPressureClass},
      {"pressure_class", OrderColumn::kPressureClass},
      {"presiune", OrderColumn::kPressureClass},
      {"clasa_presiune", OrderColumn::kPressureClass},
      {"sdr", OrderColumn::kSdr},
      {"qty", OrderColumn::kQuantity},
      {"quantity", OrderColumn::kQuantity},
      {"cantitate", OrderColumn::kQuantity},
      {"buc", OrderColumn::kQuantity},
      {"bucati", OrderColumn::kQuantity},
      {"count", OrderColumn::kQuantity},
      {"nr", OrderColumn::kQuantity},
      {"code", OrderColumn::kCode},
      {"pipe_code", OrderColumn::kCode},
      {"cod", OrderColumn::kCode},
      {"product", OrderColumn::kCode},
      {"produs", OrderColumn::kCode},
  };
  return aliases;
}

std::string trim(std::string_view value) {
  std::size_t begin = 0;
  std::size_t end = value.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
    --end;
  }
  return std::string(value.substr(begin, end - begin));
}

std::string to_upper(std::string value) {
  for (char& c : value) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return value;
}

std::string normalize_column_name(std::string_view name) {
  std::string cleaned = trim(name);
  for (char& c : cleaned) {
    if (c == ' ' || c == '-') {
      c = '_';
    } else {
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
  }
  return cleaned;
}

bool starts_with(std::string_view value, std::string_view prefix) {
  return value.substr(0, prefix.size()) == prefix;
}

bool ends_with(std::string_view value, std::string_view suffix) {
  return value.size() >= suffix.size() && value.substr(value.size() - suffix.size()) == suffix;
}

// Whole-string number; trailing garbage makes it malformed.
std::optional<double> parse_number(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  try {
    std::size_t consumed = 0;
    const double value = std::stod(text, &consumed);
    if (consumed != text.size() || !std::isfinite(value)) {
      return std::nullopt;
    }
    return value;
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

std::optional<int> parse_quantity(std::string_view value) {
  const std::optional<double> number = parse_number(trim(value));
  if (!number.has_value() || *number < 1.0 || *number > 1.0e9) {
    return std::nullopt;
  }
  return static_cast<int>(*number);
}

std::string pressure_class_for_sdr(std::string_view sdr) {
  if (sdr == "26") {
    return "PN6";
  }
  if (sdr == "21") {
    return "PN8";
  }
  if (sdr == "17") {
    return "PN10";
  }
  if (sdr == "11") {
    return "PN16";
  }
  return {};
}

// Splits one record; double quotes protect delimiters and "" escapes a quote.
std::vector<std::string> split_record(std::string_view line, char delimiter) {
  std::vector<std::string> cells;
  std::string cell;
  bool quoted = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quoted) {
      if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
        cell.push_back('"');
        ++i;
      } else if (c == '"') {
        quoted = false;
      } else {
        cell.push_back(c);
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == delimiter) {
      cells.push_back(std::move(cell));
      cell.clear();
    } else {
      cell.push_back(c);
    }
  }
  cells.push_back(std::move(cell));
  return cells;
}

std::vector<std::string> split_lines(std::string_view content) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (start <= content.size()) {
    std::size_t end = content.find('\n', start);
    if (end == std::string_view::npos) {
      end = content.size();
    }
    std::string_view line = content.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines.emplace_back(line);
    start = end + 1;
  }
  while (!lines.empty() && trim(lines.back()).empty()) {
    lines.pop_back();
  }
  return lines;
}

bool is_blank_record(const std::vector<std::string>& cells) {
  for (const std::string& cell : cells) {
    if (!trim(cell).empty()) {
      return false;
    }
  }
  return true;
}

std::string cell_at(const std::vector<std::string>& cells, std::optional<std::size_t> column) {
  if (!column.has_value() || *column >= cells.size()) {
    return {};
  }
  return trim(cells[*column]);
}

}  // namespace

char detect_delimiter(std::string_view content) {
  std::size_t sample_end = 0;
  for (int line = 0; line < 5; ++line) {
    const std::size_t newline = content.find('\n', sample_end);
    if (newline == std::string_view::npos) {
      sample_end = content.size();
      break;
    }
    sample_end = newline + 1;
  }
  const std::string_view sample = content.substr(0, sample_end);

  constexpr std::array<char, 4> kCandidates = {',', ';', '\t', '|'};
  char best = kCandidates.front();
  std::size_t best_count = 0;
  for (const char candidate : kCandidates) {
    std::size_t count = 0;
    for (const char c : sample) {
      if (c == candidate) {
        ++count;
      }
    }
    if (count > best_count) {
      best = candidate;
      best_count = count;
    }
  }
  return best;
}

std::optional<int> parse_dn_value(std::string_view value) {
  std::string cleaned = to_upper(trim(value));
  if (cleaned.empty()) {
    return std::nullopt;
  }
  // Accepts 200, DN200, OD200, D200, 200mm and the diameter sign.
  for (std::string_view prefix : {std::string_view("DN"), std::string_view("\xC3\x98"), std::string_view("\xC3\xB8"),
                                   std::string_view("D"), std::string_view("OD")}) {
    if (starts_with(cleaned, prefix)) {
      cleaned.erase(0, prefix.size());
    }
  }
  for (std::string_view suffix : {std::string_view("MM"), std::string_view("M")}) {
    if (ends_with(cleaned, suffix)) {
      cleaned.erase(cleaned.size() - suffix.size());
    }
  }
  const std::optional<double> number = parse_number(trim(cleaned));
  if (!number.has_value() || *number <= 0.0 || *number > 1.0e6) {
    return std::nullopt;
  }
  return static_cast<int>(*number);
}

std::optional<std::string> parse_pressure_class(std::string_view value) {
  std::string cleaned = to_upper(trim(value));
  if (cleaned.empty()) {
    return std::nullopt;
  }
  if (starts_with(cleaned, "SDR")) {
    std::string mapped = pressure_class_for_sdr(trim(std::string_view(cleaned).substr(3)));
    if (mapped.empty()) {
      return std::nullopt;
    }
    return mapped;
  }
  if (starts_with(cleaned, "PN")) {
    cleaned = trim(std::string_view(cleaned).substr(2));
  }
  if (cleaned == "6" || cleaned == "8" || cleaned == "10" || cleaned == "16") {
    return "PN" + cleaned;
  }
  return std::nullopt;
}

OrderParseResult parse_order_csv(std::string_view content, std::optional<char> delimiter, bool has_header) {
  OrderParseResult result;
  if (trim(content).empty()) {
    result.errors.push_back("Empty file");
    return result;
  }
  const char separator = delimiter.value_or(detect_delimiter(content));
  const std::vector<std::string> lines = split_lines(content);

  std::optional<std::size_t> dn_column;
  std::optional<std::size_t> pn_column;
  std::optional<std::size_t> sdr_column;
  std::optional<std::size_t> quantity_column;
  std::optional<std::size_t> code_column;
  std::size_t first_data_line = 0;

  if (has_header) {
    const std::vector<std::string> header = split_record(lines.front(), separator);
    for (std::size_t i = 0; i < header.size(); ++i) {
      const auto it = column_aliases().find(normalize_column_name(header[i]));
      if (it == column_aliases().end()) {
        result.warnings.push_back("Unrecognized column: '" + trim(header[i]) + "'");
        continue;
      }
      switch (it->second) {
      case OrderColumn::kDiameter:
        dn_column = i;
        break;
      case OrderColumn::kPressureClass:
        pn_column = i;
        break;
      case OrderColumn::kSdr:
        sdr_column = i;
        break;
      case OrderColumn::kQuantity:
        quantity_column = i;
        break;
      case OrderColumn::kCode:
        code_column = i;
        break;
      }
    }
    first_data_line = 1;
    result.total_rows = lines.size() - 1;
    if (!dn_column.has_value()) {
      result.errors.push_back("Missing required column: DN/Diameter");
    }
    if (!quantity_column.has_value()) {
      result.errors.push_back("Missing required column: Quantity");
    }
    if (!result.errors.empty()) {
      return result;
    }
  } else {
    dn_column = 0;
    pn_column = 1;
    quantity_column = 2;
    result.total_rows = lines.size();
  }

  for (std::size_t line_index = first_data_line; line_index < lines.size(); ++line_index) {
    const int row_number = static_cast<int>(line_index) + 1;
    const std::vector<std::string> cells = split_record(lines[line_index], separator);
    if (is_blank_record(cells)) {
      continue;
    }

    const std::optional<int> dn = parse_dn_value(cell_at(cells, dn_column));
    const std::optional<int> quantity = parse_quantity(cell_at(cells, quantity_column));
    std::optional<std::string> pressure_class = parse_pressure_class(cell_at(cells, pn_column));
    if (!pressure_class.has_value()) {
      std::string sdr = cell_at(cells, sdr_column);
      if (!sdr.empty() && std::isdigit(static_cast<unsigned char>(sdr.front()))) {
        sdr = "SDR" + sdr;
      }
      pressure_class = parse_pressure_class(sdr);
    }

    std::string row_error;
    if (!dn.has_value()) {
      row_error = "Invalid DN value";
    }
    if (!quantity.has_value()) {
      row_error += row_error.empty() ? "Invalid quantity" : ", Invalid quantity";
    }
    if (!row_error.empty()) {
      result.errors.push_back("Row " + std::to_string(row_number) + ": " + row_error);
      continue;
    }

    if (!pressure_class.has_value()) {
      pressure_class = "PN6";
      result.warnings.push_back("Row " + std::to_string(row_number) + ": PN not specified, defaulting to PN6");
    }

    ParsedOrderRow row{};
    row.dn_mm = *dn;
    row.pressure_class = *pressure_class;
    row.quantity = *quantity;
    row.row_number = row_number;
    row.code = cell_at(cells, code_column);
    if (row.code.empty()) {
      char buffer[64];
      std::snprintf(buffer, sizeof(buffer), "TPE%03d/%s", row.dn_mm, row.pressure_class.c_str());
      row.code = buffer;
    }
    result.rows.push_back(std::move(row));
  }
  return result;
}

OrderParseResult parse_order_csv_file(const std::filesystem::path& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs.is_open()) {
    OrderParseResult result;
    result.errors.push_back("File not found: " + path.string());
    return result;
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();
  std::string content = oss.str();
  if (starts_with(content, "\xEF\xBB\xBF")) {
    content.erase(0, 3);
  }
  return parse_order_csv(content);
}

EngineResult<std::vector<OrderLine>> resolve_order_lines(const OrderParseResult& parsed, const PipeCatalog& catalog) {
  EngineResult<std::vector<OrderLine>> result;
  for (const ParsedOrderRow& row : parsed.rows) {
    const PipeType* pipe_type = catalog.FindByCode(row.code);
    if (pipe_type == nullptr) {
      pipe_type = catalog.FindByDiameter(static_cast<double>(row.dn_mm), row.pressure_class);
    }
    if (pipe_type == nullptr) {
      result.validation.add_error("order_line.unknown_pipe_type",
                                  "Row " + std::to_string(row.row_number) + ": " + row.code + " (DN" +
                                      std::to_string(row.dn_mm) + " " + row.pressure_class + ") not in catalog");
      continue;
    }
    result.value.push_back({pipe_type->id, row.quantity});
  }
  if (result.value.empty() && !result.validation.has_errors()) {
    result.validation.add_error("order.empty", "order file holds no valid rows");
  }
  if (result.validation.has_errors()) {
    result.error = result.validation.summary();
    return result;
  }
  result.ok = true;
  return result;
}

}  // namespace pipeload::core
