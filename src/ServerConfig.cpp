#include "oscquery-server/ServerConfig.hpp"
#include "oscquery-server/Logger.hpp"

#include <fmt/format.h>

namespace oscquery {

ConfigError::ConfigError(const std::string &key, const std::string &message)
    : std::runtime_error(key.empty() ? message : key + ": " + message),
      key_(key) {}

namespace {

template <typename T> T read_scalar(const YAML::Node &node, const std::string &key) {
  if (!node || !node.IsScalar()) {
    throw ConfigError(key, "expected a scalar value");
  }
  try {
    return node.as<T>();
  } catch (const YAML::Exception &) {
    throw ConfigError(key, fmt::format("invalid value '{}'", node.Scalar()));
  }
}

std::string read_string(const YAML::Node &parent, const std::string &field,
                        const std::string &key) {
  return read_scalar<std::string>(parent[field], key);
}

uint16_t read_port(const YAML::Node &node, const std::string &key) {
  int port = read_scalar<int>(node, key);
  if (port < 0 || port > 65535) {
    throw ConfigError(key, fmt::format("port {} out of range", port));
  }
  return static_cast<uint16_t>(port);
}

uint8_t read_byte(const YAML::Node &node, const std::string &key) {
  int v = read_scalar<int>(node, key);
  if (v < 0 || v > 255) {
    throw ConfigError(key, fmt::format("byte value {} out of range", v));
  }
  return static_cast<uint8_t>(v);
}

YAML::Node require_sequence(const YAML::Node &node, const std::string &key,
                            std::size_t size) {
  if (!node || !node.IsSequence() || (size != 0 && node.size() != size)) {
    throw ConfigError(key, size ? fmt::format("expected a list of {}", size)
                                : std::string("expected a list"));
  }
  return node;
}

OscColor parse_color(const std::string &text, const std::string &key) {
  if (text.size() != 9 || text[0] != '#') {
    throw ConfigError(key, "color must be written as #RRGGBBAA");
  }
  try {
    auto byte_at = [&text](std::size_t pos) {
      return static_cast<uint8_t>(std::stoul(text.substr(pos, 2), nullptr, 16));
    };
    return OscColor{byte_at(1), byte_at(3), byte_at(5), byte_at(7)};
  } catch (const std::exception &) {
    throw ConfigError(key, fmt::format("invalid color '{}'", text));
  }
}

// Value of an endpoint for a given OSC type tag. A missing node yields the
// tag's zero value.
OscValue value_from_yaml(char tag, const YAML::Node &node,
                         const std::string &key) {
  if (!node || node.IsNull()) {
    try {
      return default_value_for_tag(tag);
    } catch (const std::invalid_argument &) {
      throw ConfigError(key, fmt::format("unsupported OSC type tag '{}'", tag));
    }
  }

  switch (tag) {
  case 'i':
    return read_scalar<int32_t>(node, key);
  case 'h':
    return read_scalar<int64_t>(node, key);
  case 'f':
    return read_scalar<float>(node, key);
  case 'd':
    return read_scalar<double>(node, key);
  case 's':
    return read_scalar<std::string>(node, key);
  case 'c': {
    auto s = read_scalar<std::string>(node, key);
    if (s.size() != 1) {
      throw ConfigError(key, "char value must be a single character");
    }
    return OscChar{s[0]};
  }
  case 'T':
  case 'F':
    return read_scalar<bool>(node, key);
  case 'N':
  case 'I':
    return default_value_for_tag(tag);
  case 'b': {
    OscBlob blob;
    const auto &seq = require_sequence(node, key, 0);
    for (std::size_t i = 0; i < seq.size(); ++i) {
      blob.data.push_back(read_byte(seq[i], fmt::format("{}[{}]", key, i)));
    }
    return blob;
  }
  case 't': {
    const auto &seq = require_sequence(node, key, 2);
    return OscTimeTag{read_scalar<uint32_t>(seq[0], key + "[0]"),
                      read_scalar<uint32_t>(seq[1], key + "[1]")};
  }
  case 'r':
    return parse_color(read_scalar<std::string>(node, key), key);
  case 'm': {
    const auto &seq = require_sequence(node, key, 4);
    return OscMidi{read_byte(seq[0], key + "[0]"), read_byte(seq[1], key + "[1]"),
                   read_byte(seq[2], key + "[2]"), read_byte(seq[3], key + "[3]")};
  }
  default:
    throw ConfigError(key, fmt::format("unsupported OSC type tag '{}'", tag));
  }
}

HostInfo parse_host_info(const YAML::Node &node) {
  if (!node.IsMap()) {
    throw ConfigError("host_info", "expected a map");
  }

  HostInfo info(read_string(node, "name", "host_info.name"),
                read_string(node, "osc_ip", "host_info.osc_ip"),
                read_port(node["osc_port"], "host_info.osc_port"));

  if (node["osc_transport"]) {
    auto transport =
        read_string(node, "osc_transport", "host_info.osc_transport");
    if (transport == "UDP") {
      info.osc_transport = OscTransport::Udp;
    } else if (transport == "TCP") {
      info.osc_transport = OscTransport::Tcp;
    } else {
      throw ConfigError("host_info.osc_transport",
                        fmt::format("unknown transport '{}'", transport));
    }
  }

  if (node["extensions"]) {
    const auto &exts = require_sequence(node["extensions"],
                                        "host_info.extensions", 0);
    for (std::size_t i = 0; i < exts.size(); ++i) {
      auto key = fmt::format("host_info.extensions[{}]", i);
      auto name = read_scalar<std::string>(exts[i], key);
      auto ext = parse_extension(name);
      if (!ext) {
        throw ConfigError(key, fmt::format("unknown extension '{}'", name));
      }
      info.extensions.enable(*ext);
    }
  }
  return info;
}

EndpointDescriptor parse_endpoint(const YAML::Node &node,
                                  const std::string &prefix,
                                  std::vector<std::string> &warnings) {
  if (!node.IsMap()) {
    throw ConfigError(prefix, "expected a map");
  }

  EndpointDescriptor d;
  d.path = read_string(node, "path", prefix + ".path");

  auto type = read_string(node, "type", prefix + ".type");
  if (type.size() != 1) {
    throw ConfigError(prefix + ".type",
                      fmt::format("expected one OSC type tag, got '{}'", type));
  }
  char tag = type[0];
  d.initial_value = value_from_yaml(tag, node["value"], prefix + ".value");

  if (node["description"]) {
    d.description = read_string(node, "description", prefix + ".description");
  }

  if (node["access"]) {
    auto text = read_string(node, "access", prefix + ".access");
    auto access = parse_access(text);
    if (!access) {
      throw ConfigError(prefix + ".access",
                        fmt::format("unknown access mode '{}'", text));
    }
    d.access = *access;
  }

  if (node["min"]) {
    d.min = read_scalar<float>(node["min"], prefix + ".min");
  }
  if (node["max"]) {
    d.max = read_scalar<float>(node["max"], prefix + ".max");
  }
  if (d.min.has_value() != d.max.has_value()) {
    auto warning = fmt::format("{} ({}): range needs both min and max, ignored",
                               prefix, d.path);
    LOG_WARN("CONFIG", "ENDPOINT", "{}", warning);
    warnings.push_back(std::move(warning));
  }

  if (node["values"]) {
    auto key = prefix + ".values";
    const auto &vals = require_sequence(node["values"], key, 0);
    for (std::size_t i = 0; i < vals.size(); ++i) {
      d.allowed_values.push_back(
          value_from_yaml(tag, vals[i], fmt::format("{}[{}]", key, i)));
    }
  }

  if (node["unit"]) {
    auto text = read_string(node, "unit", prefix + ".unit");
    auto unit = parse_unit(text);
    if (!unit) {
      throw ConfigError(prefix + ".unit",
                        fmt::format("unknown unit '{}'", text));
    }
    d.unit = *unit;
  }

  return d;
}

} // namespace

std::optional<Access> parse_access(const std::string &text) {
  if (text == "none" || text == "0")
    return Access::NoValue;
  if (text == "r" || text == "1")
    return Access::ReadOnly;
  if (text == "w" || text == "2")
    return Access::WriteOnly;
  if (text == "rw" || text == "3")
    return Access::ReadWrite;
  return std::nullopt;
}

ServerConfig parse_server_config(const YAML::Node &doc) {
  if (!doc.IsMap()) {
    throw ConfigError("", "configuration root must be a map");
  }

  ServerConfig config;

  if (doc["host_info"]) {
    config.host_info = parse_host_info(doc["host_info"]);
  }

  if (const auto http = doc["http"]) {
    if (http["bind_address"]) {
      config.http.bind_address =
          read_string(http, "bind_address", "http.bind_address");
    }
    if (http["port"]) {
      config.http.port = read_port(http["port"], "http.port");
    }
  }

  if (const auto logging = doc["logging"]) {
    if (logging["level"]) {
      config.logging.level = read_string(logging, "level", "logging.level");
    }
    if (logging["file"]) {
      config.logging.file = read_string(logging, "file", "logging.file");
    }
  }

  if (doc["endpoints"]) {
    const auto &endpoints = require_sequence(doc["endpoints"], "endpoints", 0);
    for (std::size_t i = 0; i < endpoints.size(); ++i) {
      config.endpoints.push_back(
          parse_endpoint(endpoints[i], fmt::format("endpoints[{}]", i),
                         config.warnings));
    }
  }

  return config;
}

ServerConfig load_server_config(const std::string &yaml_path) {
  LOG_INFO("CONFIG", "LOAD", "Loading server configuration from: {}",
           yaml_path);

  YAML::Node doc;
  try {
    doc = YAML::LoadFile(yaml_path);
  } catch (const YAML::Exception &ex) {
    throw ConfigError("", fmt::format("cannot read '{}': {}", yaml_path,
                                      ex.what()));
  }
  return parse_server_config(doc);
}

std::shared_ptr<const AddressTree>
build_address_tree(const ServerConfig &config) {
  TreeBuilder builder(config.host_info);

  for (std::size_t i = 0; i < config.endpoints.size(); ++i) {
    const auto &endpoint = config.endpoints[i];
    auto status = builder.insert(endpoint);
    if (status != InsertStatus::Ok) {
      throw ConfigError(fmt::format("endpoints[{}].path", i),
                        fmt::format("cannot add '{}': {}", endpoint.path,
                                    to_string(status)));
    }
  }

  LOG_INFO("CONFIG", "BUILD", "Built address tree with {} endpoints",
           config.endpoints.size());
  return builder.publish();
}

} // namespace oscquery
