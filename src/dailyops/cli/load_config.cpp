#include "dailyops/cli/commands.hpp"

namespace dailyops::cli {

auto load_config(const CommonOptions& opts) -> Result<Config> {
  Config config;
  if (!opts.config_file.empty()) {
    auto result = ConfigLoader::load_from_file(opts.config_file);
    if (!result)
      return fail(result.error());
    config = std::move(*result);
  }
  if (opts.db_file) {
    config.storage.db_file = *opts.db_file;
  }
  return config;
}

}  // namespace dailyops::cli
