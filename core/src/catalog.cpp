#include "pipeload/core/catalog.hpp"

#include <cmath>
#include <string>

namespace pipeload::core {

namespace {

struct CatalogRow {
  const char* code;
  int sdr;
  const char* pressure_class;
  double outer_diameter_mm;
  double wall_mm;
  double inner_diameter_mm;
  double weight_per_meter_kg;
};

constexpr CatalogRow kHdpeRows[] = {
    {"TPE020/PN6", 26, "PN6", 20.0, 2.0, 16.0, 0.12},
    {"TPE025/PN6", 26, "PN6", 25.0, 2.0, 21.0, 0.15},
    {"TPE032/PN6", 26, "PN6", 32.0, 2.0, 28.0, 0.19},
    {"TPE040/PN6", 26, "PN6", 40.0, 2.0, 36.0, 0.24},
    {"TPE050/PN6", 26, "PN6", 50.0, 2.0, 46.0, 0.31},
    {"TPE063/PN6", 26, "PN6", 63.0, 2.5, 58.0, 0.48},
    {"TPE075/PN6", 26, "PN6", 75.0, 2.9, 69.2, 0.67},
    {"TPE090/PN6", 26, "PN6", 90.0, 3.5, 83.0, 0.97},
    {"TPE110/PN6", 26, "PN6", 110.0, 4.2, 101.6, 1.42},
    {"TPE125/PN6", 26, "PN6", 125.0, 4.8, 115.4, 1.83},
    {"TPE140/PN6", 26, "PN6", 140.0, 5.4, 129.2, 2.31},
    {"TPE160/PN6", 26, "PN6", 160.0, 6.2, 147.6, 3.03},
    {"TPE180/PN6", 26, "PN6", 180.0, 6.9, 166.2, 3.78},
    {"TPE200/PN6", 26, "PN6", 200.0, 7.7, 184.6, 4.73},
    {"TPE225/PN6", 26, "PN6", 225.0, 8.6, 207.8, 5.93},
    {"TPE250/PN6", 26, "PN6", 250.0, 9.6, 230.8, 7.34},
    {"TPE280/PN6", 26, "PN6", 280.0, 10.7, 258.6, 9.16},
    {"TPE315/PN6", 26, "PN6", 315.0, 12.1, 290.8, 11.71},
    {"TPE355/PN6", 26, "PN6", 355.0, 13.6, 327.8, 14.79},
    {"TPE400/PN6", 26, "PN6", 400.0, 15.3, 369.4, 18.80},
    {"TPE450/PN6", 26, "PN6", 450.0, 17.2, 415.6, 23.72},
    {"TPE500/PN6", 26, "PN6", 500.0, 19.1, 461.8, 29.34},
    {"TPE560/PN6", 26, "PN6", 560.0, 21.4, 517.2, 36.81},
    {"TPE630/PN6", 26, "PN6", 630.0, 24.1, 581.8, 46.64},
    {"TPE710/PN6", 26, "PN6", 710.0, 27.2, 655.6, 59.28},
    {"TPE800/PN6", 26, "PN6", 800.0, 30.6, 738.8, 75.19},
    {"TPE020/PN8", 21, "PN8", 20.0, 2.0, 16.0, 0.12},
    {"TPE025/PN8", 21, "PN8", 25.0, 2.0, 21.0, 0.15},
    {"TPE032/PN8", 21, "PN8", 32.0, 2.0, 28.0, 0.19},
    {"TPE040/PN8", 21, "PN8", 40.0, 2.0, 36.0, 0.24},
    {"TPE050/PN8", 21, "PN8", 50.0, 2.4, 45.2, 0.37},
    {"TPE063/PN8", 21, "PN8", 63.0, 3.0, 57.0, 0.57},
    {"TPE075/PN8", 21, "PN8", 75.0, 3.6, 67.8, 0.82},
    {"TPE090/PN8", 21, "PN8", 90.0, 4.3, 81.4, 1.17},
    {"TPE110/PN8", 21, "PN8", 110.0, 5.3, 99.4, 1.77},
    {"TPE125/PN8", 21, "PN8", 125.0, 6.0, 113.0, 2.27},
    {"TPE140/PN8", 21, "PN8", 140.0, 6.7, 126.6, 2.83},
    {"TPE160/PN8", 21, "PN8", 160.0, 7.7, 144.6, 3.74},
    {"TPE180/PN8", 21, "PN8", 180.0, 8.6, 162.8, 4.68},
    {"TPE200/PN8", 21, "PN8", 200.0, 9.6, 180.8, 5.83},
    {"TPE225/PN8", 21, "PN8", 225.0, 10.8, 203.4, 7.38},
    {"TPE250/PN8", 21, "PN8", 250.0, 11.9, 226.2, 9.02},
    {"TPE280/PN8", 21, "PN8", 280.0, 13.4, 253.2, 11.38},
    {"TPE315/PN8", 21, "PN8", 315.0, 15.0, 285.0, 14.36},
    {"TPE355/PN8", 21, "PN8", 355.0, 16.9, 321.2, 18.19},
    {"TPE400/PN8", 21, "PN8", 400.0, 19.1, 361.8, 23.17},
    {"TPE450/PN8", 21, "PN8", 450.0, 21.5, 407.0, 29.38},
    {"TPE500/PN8", 21, "PN8", 500.0, 23.9, 452.2, 36.29},
    {"TPE560/PN8", 21, "PN8", 560.0, 26.7, 506.6, 45.36},
    {"TPE630/PN8", 21, "PN8", 630.0, 30.0, 570.0, 57.32},
    {"TPE710/PN8", 21, "PN8", 710.0, 33.9, 642.2, 73.06},
    {"TPE800/PN8", 21, "PN8", 800.0, 38.1, 723.8, 92.49},
    {"TPE020/PN10", 17, "PN10", 20.0, 2.0, 16.0, 0.12},
    {"TPE025/PN10", 17, "PN10", 25.0, 2.0, 21.0, 0.15},
    {"TPE032/PN10", 17, "PN10", 32.0, 2.0, 28.0, 0.19},
    {"TPE040/PN10", 17, "PN10", 40.0, 2.4, 35.2, 0.29},
    {"TPE050/PN10", 17, "PN10", 50.0, 3.0, 44.0, 0.45},
    {"TPE063/PN10", 17, "PN10", 63.0, 3.8, 55.4, 0.72},
    {"TPE075/PN10", 17, "PN10", 75.0, 4.5, 66.0, 1.01},
    {"TPE090/PN10", 17, "PN10", 90.0, 5.4, 79.2, 1.45},
    {"TPE110/PN10", 17, "PN10", 110.0, 6.6, 96.8, 2.18},
    {"TPE125/PN10", 17, "PN10", 125.0, 7.4, 110.2, 2.77},
    {"TPE140/PN10", 17, "PN10", 140.0, 8.3, 123.4, 3.48},
    {"TPE160/PN10", 17, "PN10", 160.0, 9.5, 141.0, 4.56},
    {"TPE180/PN10", 17, "PN10", 180.0, 10.7, 158.6, 5.77},
    {"TPE200/PN10", 17, "PN10", 200.0, 11.9, 176.2, 7.14},
    {"TPE225/PN10", 17, "PN10", 225.0, 13.4, 198.2, 9.04},
    {"TPE250/PN10", 17, "PN10", 250.0, 14.8, 220.4, 11.10},
    {"TPE280/PN10", 17, "PN10", 280.0, 16.6, 246.8, 13.95},
    {"TPE315/PN10", 17, "PN10", 315.0, 18.7, 277.6, 17.68},
    {"TPE355/PN10", 17, "PN10", 355.0, 21.1, 312.8, 22.47},
    {"TPE400/PN10", 17, "PN10", 400.0, 23.7, 352.6, 28.47},
    {"TPE450/PN10", 17, "PN10", 450.0, 26.7, 396.6, 36.04},
    {"TPE500/PN10", 17, "PN10", 500.0, 29.7, 440.6, 44.60},
    {"TPE560/PN10", 17, "PN10", 560.0, 33.2, 493.6, 55.76},
    {"TPE630/PN10", 17, "PN10", 630.0, 37.4, 555.2, 70.75},
    {"TPE710/PN10", 17, "PN10", 710.0, 42.1, 625.8, 89.73},
    {"TPE800/PN10", 17, "PN10", 800.0, 47.4, 705.2, 113.68},
    {"TPE020/PN16", 11, "PN16", 20.0, 2.0, 16.0, 0.12},
    {"TPE025/PN16", 11, "PN16", 25.0, 2.3, 20.4, 0.17},
    {"TPE032/PN16", 11, "PN16", 32.0, 3.0, 26.0, 0.28},
    {"TPE040/PN16", 11, "PN16", 40.0, 3.7, 32.6, 0.43},
    {"TPE050/PN16", 11, "PN16", 50.0, 4.6, 40.8, 0.67},
    {"TPE063/PN16", 11, "PN16", 63.0, 5.8, 51.4, 1.06},
    {"TPE075/PN16", 11, "PN16", 75.0, 6.8, 61.4, 1.47},
    {"TPE090/PN16", 11, "PN16", 90.0, 8.2, 73.6, 2.14},
    {"TPE110/PN16", 11, "PN16", 110.0, 10.0, 90.0, 3.19},
    {"TPE125/PN16", 11, "PN16", 125.0, 11.4, 102.2, 4.13},
    {"TPE140/PN16", 11, "PN16", 140.0, 12.7, 114.6, 5.15},
    {"TPE160/PN16", 11, "PN16", 160.0, 14.6, 130.8, 6.78},
    {"TPE180/PN16", 11, "PN16", 180.0, 16.4, 147.2, 8.56},
    {"TPE200/PN16", 11, "PN16", 200.0, 18.2, 163.6, 10.57},
    {"TPE225/PN16", 11, "PN16", 225.0, 20.5, 184.0, 13.38},
    {"TPE250/PN16", 11, "PN16", 250.0, 22.7, 204.6, 16.45},
    {"TPE280/PN16", 11, "PN16", 280.0, 25.4, 229.2, 20.63},
    {"TPE315/PN16", 11, "PN16", 315.0, 28.6, 257.8, 26.13},
    {"TPE355/PN16", 11, "PN16", 355.0, 32.2, 290.6, 33.11},
    {"TPE400/PN16", 11, "PN16", 400.0, 36.3, 327.4, 42.09},
    {"TPE450/PN16", 11, "PN16", 450.0, 40.9, 368.2, 53.35},
    {"TPE500/PN16", 11, "PN16", 500.0, 45.4, 409.2, 65.80},
    {"TPE560/PN16", 11, "PN16", 560.0, 50.8, 458.4, 82.44},
    {"TPE630/PN16", 11, "PN16", 630.0, 57.2, 515.6, 104.47},
    {"TPE710/PN16", 11, "PN16", 710.0, 64.5, 581.0, 132.68},
    {"TPE800/PN16", 11, "PN16", 800.0, 72.6, 654.8, 168.70},
};

}  // namespace

ValidationResult validate_pipe_type(const PipeType& pipe_type) {
  ValidationResult validation;
  if (pipe_type.code.empty()) {
    validation.add_error("pipe_type.missing_code", "pipe type has no catalog code", pipe_type.id);
  }
  if (!(pipe_type.outer_diameter_mm > 0.0) || !(pipe_type.inner_diameter_mm > 0.0) ||
      pipe_type.inner_diameter_mm >= pipe_type.outer_diameter_mm) {
    validation.add_error("pipe_type.invalid_diameters",
                         pipe_type.code + ": inner diameter must be positive and below outer diameter", pipe_type.id);
  }
  if (!(pipe_type.weight_per_meter_kg > 0.0)) {
    validation.add_error("pipe_type.invalid_weight", pipe_type.code + ": weight per metre must be positive",
                         pipe_type.id);
  }
  if (pipe_type.wall_mm < 0.0) {
    validation.add_error("pipe_type.invalid_wall", pipe_type.code + ": wall thickness is negative", pipe_type.id);
  }
  return validation;
}

EngineResult<PipeTypeId> PipeCatalog::AddPipeType(const PipeType& pipe_type) {
  EngineResult<PipeTypeId> result;
  result.validation = validate_pipe_type(pipe_type);
  if (store_.contains_code(pipe_type.code)) {
    result.validation.add_error("pipe_type.duplicate_code", "catalog already contains " + pipe_type.code);
  }
  if (result.validation.has_errors()) {
    result.error = result.validation.summary();
    return result;
  }

  PipeType record = pipe_type;
  record.id = id_generator_.next();
  const PipeTypeId id = record.id;
  if (!store_.insert(std::move(record))) {
    result.error = "catalog insert failed for " + pipe_type.code;
    return result;
  }
  result.ok = true;
  result.value = id;
  return result;
}

const PipeType* PipeCatalog::FindByDiameter(double outer_diameter_mm, std::string_view pressure_class) const {
  for (const PipeType& pipe : store_.items()) {
    if (std::abs(pipe.outer_diameter_mm - outer_diameter_mm) < 1e-6 && pipe.pressure_class == pressure_class) {
      return &pipe;
    }
  }
  return nullptr;
}

PipeCatalog make_default_catalog() {
  PipeCatalog catalog;
  for (const CatalogRow& row : kHdpeRows) {
    PipeType pipe{};
    pipe.code = row.code;
    pipe.sdr = row.sdr;
    pipe.pressure_class = row.pressure_class;
    pipe.outer_diameter_mm = row.outer_diameter_mm;
    pipe.wall_mm = row.wall_mm;
    pipe.inner_diameter_mm = row.inner_diameter_mm;
    pipe.weight_per_meter_kg = row.weight_per_meter_kg;
    (void)catalog.AddPipeType(pipe);
  }
  return catalog;
}

std::vector<ContainerTemplate> default_container_templates() {
  return {
      {"Standard 24t Romania", 24000.0, 13600.0, 2480.0, 2700.0},
      {"Mega Trailer Romania", 24000.0, 13600.0, 2480.0, 3000.0},
      {"Standard 24t EU", 24000.0, 13600.0, 2450.0, 2700.0},
  };
}

}  // namespace pipeload::core
