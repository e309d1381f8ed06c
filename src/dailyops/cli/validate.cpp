#include "dailyops/cli/commands.hpp"
#include "dailyops/config/dataset_loader.hpp"
#include "dailyops/migration/checksum.hpp"

#include <print>

namespace dailyops::cli {

auto cmd_validate(const ValidateOptions& opts) -> int {
  auto config = load_config(opts.common);
  if (!config) {
    std::println(stderr, "Error: {}", config.error().message());
    return 1;
  }

  const auto path = opts.dataset_file.value_or(config->migration.dataset_file);
  auto dataset = DatasetLoader::load_from_file(path);
  if (!dataset) {
    std::println(stderr, "Error: {}: {}", path, dataset.error().message());
    return 1;
  }

  auto n = count(*dataset);
  std::println("{}: {} workers, {} buildings, {} tasks, {} capability sets",
               path, n.workers, n.buildings, n.tasks, n.capabilities);

  auto checksum = compute_checksum(*dataset);
  if (!checksum) {
    std::println(stderr, "Error: {}", checksum.error().message());
    return 1;
  }
  std::println("Checksum: {}", *checksum);

  auto problems = validate_dataset(*dataset);
  if (problems.empty()) {
    std::println("Dataset is valid");
    return 0;
  }
  for (const auto& p : problems) {
    std::println(stderr, "  - {}", p);
  }
  std::println(stderr, "{} problem(s) found", problems.size());
  return 1;
}

}  // namespace dailyops::cli
