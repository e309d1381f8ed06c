#pragma once

#include "dailyops/core/error.hpp"
#include "dailyops/model/operational_dataset.hpp"

#include <string_view>

namespace dailyops {

// Reads the operational dataset from YAML:
//
//   workers:      [{id, name, email, role, shift, active}]
//   buildings:    [{id, name, address, type, floors, ...}]
//   tasks:        [{worker_id, building_id, title, category, recurrence, ...}]
//   capabilities: [{worker_id, can_upload_photos, ...}]
//
// Structural problems fail with ParseError; content problems are left to
// validate_dataset().
class DatasetLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<OperationalDataset>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<OperationalDataset>;
};

}  // namespace dailyops
