#pragma once
#include "oscquery-server/export.h"

#include <array>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace oscquery {

/// Optional OSCQuery capabilities a server can advertise in HOST_INFO
enum class Extension {
  Access,
  Value,
  Range,
  Description,
  Tags,
  ExtendedType,
  Unit,
  Critical,
  ClipMode,
  Listen,
  PathChanged
};

constexpr std::size_t EXTENSION_COUNT = 11;

/// All extensions in HOST_INFO.EXTENSIONS serialization order
OSCQUERY_SERVER_API const std::array<Extension, EXTENSION_COUNT> &
all_extensions();

/// Wire name of an extension ("ACCESS", "EXTENDED_TYPE", ...)
OSCQUERY_SERVER_API const char *to_string(Extension ext);

/// Inverse of to_string(Extension). Returns std::nullopt for unknown names.
OSCQUERY_SERVER_API std::optional<Extension>
parse_extension(const std::string &name);

/// Advertised capability flags. Every flag starts disabled.
/// A flag states what clients may ask for; it does not control which
/// attributes the serializer emits.
class OSCQUERY_SERVER_API ExtensionSet {
public:
  void enable(Extension ext);
  bool is_enabled(Extension ext) const;

  /// Object with every known flag name mapped to an explicit boolean
  nlohmann::ordered_json to_json() const;

private:
  std::array<bool, EXTENSION_COUNT> flags_{};
};

enum class OscTransport { Udp, Tcp };

/// Server identity advertised at the root (HOST_INFO)
struct HostInfo {
  std::string name;
  std::string osc_ip;
  uint16_t osc_port{0};
  OscTransport osc_transport{OscTransport::Udp};
  ExtensionSet extensions;

  HostInfo() = default;
  HostInfo(std::string name, std::string osc_ip, uint16_t osc_port);

  nlohmann::ordered_json to_json() const;
};

} // namespace oscquery
