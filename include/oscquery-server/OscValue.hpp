#pragma once
#include "oscquery-server/export.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include <vector>

namespace oscquery {

/// Raw OSC blob ('b')
struct OscBlob {
  std::vector<uint8_t> data;
};

/// NTP-format OSC time tag ('t')
struct OscTimeTag {
  uint32_t seconds{0};
  uint32_t fraction{0};
};

/// Single ASCII character ('c')
struct OscChar {
  char value{' '};
};

/// 32-bit RGBA color ('r')
struct OscColor {
  uint8_t red{0};
  uint8_t green{0};
  uint8_t blue{0};
  uint8_t alpha{0};
};

/// 4-byte MIDI message ('m')
struct OscMidi {
  uint8_t port{0};
  uint8_t status{0};
  uint8_t data1{0};
  uint8_t data2{0};
};

/// Nil ('N')
struct OscNil {};

/// Infinitum / impulse ('I')
struct OscInfinitum {};

/// Typed OSC argument as stored on a leaf endpoint.
/// bool covers both 'T' and 'F'; the tag follows the stored value.
using OscValue =
    std::variant<int32_t, float, std::string, OscBlob, OscTimeTag, int64_t,
                 double, OscChar, OscColor, OscMidi, bool, OscNil,
                 OscInfinitum>;

/// OSC type tag character of a single value ('f', 'i', 'T', ...)
OSCQUERY_SERVER_API char type_tag(const OscValue &value);

/// Concatenated type tag string of a value sequence ("f", "ff", "iT", ...)
OSCQUERY_SERVER_API std::string type_tag(const std::vector<OscValue> &values);

/// JSON encoding of one value as it appears inside VALUE / VALS arrays
OSCQUERY_SERVER_API nlohmann::ordered_json
value_to_json(const OscValue &value);

/// JSON number for a single-precision float, printed with the shortest
/// representation that round-trips the float (0.1f -> 0.1, not 0.100000001)
OSCQUERY_SERVER_API nlohmann::ordered_json float_to_json(float value);

/// Zero value for a type tag character.
/// Throws std::invalid_argument for tags that do not name a scalar OSC type.
OSCQUERY_SERVER_API OscValue default_value_for_tag(char tag);

} // namespace oscquery
