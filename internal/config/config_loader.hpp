#pragma once

#include <string>

#include "config/config.pb.h"

namespace pulsetx::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unset fields are filled from the defaults below before validation.
*/
class ConfigLoader {
 public:
  static constexpr const char* kDefaultBindAddress     = "0.0.0.0:50061";
  static constexpr const char* kDefaultRpcUrl          = "https://api.mainnet-beta.solana.com";
  static constexpr uint32_t    kDefaultPageLimit       = 30;
  static constexpr uint32_t    kMaxPageLimit           = 1000;
  static constexpr int64_t     kDefaultRequestTimeoutS = 10;
  static constexpr int64_t     kDefaultConnectTimeoutS = 5;

  static pulsetx::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(pulsetx::runtime::config::RuntimeConfig& config);
  static void Validate(const pulsetx::runtime::config::RuntimeConfig& config);
};

} // namespace pulsetx::config
