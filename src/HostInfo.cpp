#include "oscquery-server/HostInfo.hpp"

#include <utility>

namespace oscquery {

const std::array<Extension, EXTENSION_COUNT> &all_extensions() {
  static const std::array<Extension, EXTENSION_COUNT> order = {
      Extension::Access,       Extension::Value,    Extension::Range,
      Extension::Description,  Extension::Tags,     Extension::ExtendedType,
      Extension::Unit,         Extension::Critical, Extension::ClipMode,
      Extension::Listen,       Extension::PathChanged};
  return order;
}

const char *to_string(Extension ext) {
  switch (ext) {
  case Extension::Access:
    return "ACCESS";
  case Extension::Value:
    return "VALUE";
  case Extension::Range:
    return "RANGE";
  case Extension::Description:
    return "DESCRIPTION";
  case Extension::Tags:
    return "TAGS";
  case Extension::ExtendedType:
    return "EXTENDED_TYPE";
  case Extension::Unit:
    return "UNIT";
  case Extension::Critical:
    return "CRITICAL";
  case Extension::ClipMode:
    return "CLIPMODE";
  case Extension::Listen:
    return "LISTEN";
  case Extension::PathChanged:
    return "PATH_CHANGED";
  }
  return "";
}

std::optional<Extension> parse_extension(const std::string &name) {
  for (auto ext : all_extensions()) {
    if (name == to_string(ext))
      return ext;
  }
  return std::nullopt;
}

void ExtensionSet::enable(Extension ext) {
  flags_[static_cast<std::size_t>(ext)] = true;
}

bool ExtensionSet::is_enabled(Extension ext) const {
  return flags_[static_cast<std::size_t>(ext)];
}

nlohmann::ordered_json ExtensionSet::to_json() const {
  nlohmann::ordered_json j = nlohmann::ordered_json::object();
  for (auto ext : all_extensions()) {
    j[to_string(ext)] = is_enabled(ext);
  }
  return j;
}

HostInfo::HostInfo(std::string name, std::string osc_ip, uint16_t osc_port)
    : name(std::move(name)), osc_ip(std::move(osc_ip)), osc_port(osc_port) {}

nlohmann::ordered_json HostInfo::to_json() const {
  nlohmann::ordered_json j;
  j["NAME"] = name;
  j["OSC_IP"] = osc_ip;
  j["OSC_PORT"] = osc_port;
  j["OSC_TRANSPORT"] = osc_transport == OscTransport::Tcp ? "TCP" : "UDP";
  j["EXTENSIONS"] = extensions.to_json();
  return j;
}

} // namespace oscquery
