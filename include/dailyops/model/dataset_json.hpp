#pragma once

#include "dailyops/model/operational_dataset.hpp"

#include <nlohmann/json.hpp>

// nlohmann::json conversions (found by ADL). The field order of the emitted
// objects does not matter: nlohmann::json sorts object keys, which is what
// makes the serialized form canonical for checksumming.
namespace dailyops {

void to_json(nlohmann::json& j, const WorkerRecord& w);
void from_json(const nlohmann::json& j, WorkerRecord& w);

void to_json(nlohmann::json& j, const BuildingRecord& b);
void from_json(const nlohmann::json& j, BuildingRecord& b);

void to_json(nlohmann::json& j, const TaskAssignment& t);
void from_json(const nlohmann::json& j, TaskAssignment& t);

void to_json(nlohmann::json& j, const WorkerCapabilityRecord& c);
void from_json(const nlohmann::json& j, WorkerCapabilityRecord& c);

void to_json(nlohmann::json& j, const OperationalDataset& ds);
void from_json(const nlohmann::json& j, OperationalDataset& ds);

}  // namespace dailyops
