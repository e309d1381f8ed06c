#pragma once

#include "dailyops/core/error.hpp"
#include "dailyops/model/operational_dataset.hpp"

#include <string>
#include <string_view>

namespace dailyops {

// Canonical serialization: nlohmann::json with object keys sorted and
// arrays kept in dataset order. Strings that are not valid UTF-8 fail with
// SerializationError.
[[nodiscard]] auto canonical_json(const OperationalDataset& ds)
    -> Result<std::string>;

// Lowercase hex SHA-256.
[[nodiscard]] auto sha256_hex(std::string_view data) -> Result<std::string>;

// sha256_hex(canonical_json(ds)). Same dataset, same digest, on every run.
[[nodiscard]] auto compute_checksum(const OperationalDataset& ds)
    -> Result<std::string>;

}  // namespace dailyops
