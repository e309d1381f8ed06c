#pragma once

#include "dailyops/config/config.hpp"
#include "dailyops/core/error.hpp"

#include <optional>
#include <string>

namespace dailyops::cli {

// Every command loads the config file (when given) and lets --db override
// storage.db_file.
struct CommonOptions {
  std::string config_file;
  std::optional<std::string> db_file;
};

struct ServeOptions {
  CommonOptions common;
  bool daemon{false};
  std::optional<std::string> log_file;
};

struct RunOptions {
  CommonOptions common;
  bool force{false};
};

struct MigrateOptions {
  CommonOptions common;
};

struct GenerateOptions {
  CommonOptions common;
  std::optional<std::string> date;  // YYYY-MM-DD, defaults to today
};

struct SweepOptions {
  CommonOptions common;
  std::optional<int> days;
};

struct StatusOptions {
  CommonOptions common;
};

struct ValidateOptions {
  CommonOptions common;
  std::optional<std::string> dataset_file;
};

// Defaults when no config file was given.
[[nodiscard]] auto load_config(const CommonOptions& opts) -> Result<Config>;

[[nodiscard]] auto cmd_serve(const ServeOptions& opts) -> int;
[[nodiscard]] auto cmd_run(const RunOptions& opts) -> int;
[[nodiscard]] auto cmd_migrate(const MigrateOptions& opts) -> int;
[[nodiscard]] auto cmd_generate(const GenerateOptions& opts) -> int;
[[nodiscard]] auto cmd_sweep(const SweepOptions& opts) -> int;
[[nodiscard]] auto cmd_status(const StatusOptions& opts) -> int;
[[nodiscard]] auto cmd_validate(const ValidateOptions& opts) -> int;

}  // namespace dailyops::cli
