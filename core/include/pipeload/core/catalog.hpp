#pragma once

#include <string_view>
#include <vector>

#include "pipeload/core/catalog_store.hpp"
#include "pipeload/core/entities.hpp"
#include "pipeload/core/result.hpp"

namespace pipeload::core {

class PipeCatalog {
 public:
  PipeCatalog() = default;

  // The id field of the argument is ignored; the catalog assigns one.
  EngineResult<PipeTypeId> AddPipeType(const PipeType& pipe_type);

  [[nodiscard]] const PipeType* Find(PipeTypeId id) const { return store_.find(id); }
  [[nodiscard]] const PipeType* FindByCode(std::string_view code) const { return store_.find_by_code(code); }
  [[nodiscard]] const PipeType* FindByDiameter(double outer_diameter_mm, std::string_view pressure_class) const;

  [[nodiscard]] std::size_t size() const { return store_.size(); }
  [[nodiscard]] const std::vector<PipeType>& items() const { return store_.items(); }

 private:
  CatalogStore<PipeType> store_{};
  IdGenerator id_generator_{};
};

[[nodiscard]] ValidationResult validate_pipe_type(const PipeType& pipe_type);

// HDPE PE100 table, DN20..DN800 for SDR26/PN6, SDR21/PN8, SDR17/PN10 and SDR11/PN16.
PipeCatalog make_default_catalog();

std::vector<ContainerTemplate> default_container_templates();

}  // namespace pipeload::core
