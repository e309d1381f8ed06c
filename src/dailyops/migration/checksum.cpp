#include "dailyops/migration/checksum.hpp"

#include "dailyops/model/dataset_json.hpp"
#include "dailyops/util/log.hpp"

#include <nlohmann/json.hpp>
#include <openssl/evp.h>

#include <array>
#include <format>
#include <iterator>

namespace dailyops {

auto canonical_json(const OperationalDataset& ds) -> Result<std::string> {
  try {
    nlohmann::json j = ds;
    return j.dump();
  } catch (const nlohmann::json::exception& e) {
    log::error("Dataset serialization failed: {}", e.what());
    return fail(Error::SerializationError);
  }
}

auto sha256_hex(std::string_view data) -> Result<std::string> {
  std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), md.data(), &len, EVP_sha256(),
                 nullptr) != 1) {
    log::error("SHA-256 digest failed");
    return fail(Error::SerializationError);
  }

  std::string hex;
  hex.reserve(len * 2);
  for (unsigned int i = 0; i < len; ++i) {
    std::format_to(std::back_inserter(hex), "{:02x}", md[i]);
  }
  return hex;
}

auto compute_checksum(const OperationalDataset& ds) -> Result<std::string> {
  return canonical_json(ds).and_then(
      [](const std::string& json) { return sha256_hex(json); });
}

}  // namespace dailyops
