#pragma once
#include "oscquery-server/AddressTree.hpp"
#include "oscquery-server/EndpointDescriptor.hpp"
#include "oscquery-server/HostInfo.hpp"
#include "oscquery-server/export.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace oscquery {

/// Invalid or unreadable configuration. key() names the offending entry,
/// e.g. "endpoints[2].type".
class OSCQUERY_SERVER_API ConfigError : public std::runtime_error {
public:
  ConfigError(const std::string &key, const std::string &message);

  const std::string &key() const { return key_; }

private:
  std::string key_;
};

struct HttpSettings {
  std::string bind_address{"127.0.0.1"};
  uint16_t port{5678};
};

struct LoggingSettings {
  std::string level{"info"};
  std::string file{"oscquery_server.log"};
};

struct ServerConfig {
  std::optional<HostInfo> host_info;
  HttpSettings http;
  LoggingSettings logging;
  std::vector<EndpointDescriptor> endpoints; // file order
  // Entries accepted with a problem, e.g. a lone min or max. Also logged,
  // but loading usually runs before the logger is up.
  std::vector<std::string> warnings;
};

/// Load a YAML server description from disk
OSCQUERY_SERVER_API ServerConfig load_server_config(const std::string &yaml_path);

/// Parse an already loaded YAML document
OSCQUERY_SERVER_API ServerConfig parse_server_config(const YAML::Node &doc);

/// Insert every configured endpoint and publish the tree.
/// Throws ConfigError on the first endpoint the tree rejects.
OSCQUERY_SERVER_API std::shared_ptr<const AddressTree>
build_address_tree(const ServerConfig &config);

/// "none" | "r" | "w" | "rw" or 0..3
OSCQUERY_SERVER_API std::optional<Access> parse_access(const std::string &text);

} // namespace oscquery
