#pragma once
#include "oscquery-server/export.h"

#include <optional>
#include <string>
#include <variant>

namespace oscquery {

enum class DistanceUnit {
  Meter,
  Kilometer,
  Decimeter,
  Centimeter,
  Millimeter,
  Micrometer,
  Nanometer,
  Picometer,
  Inch,
  Feet,
  Mile,
  Pixels
};

enum class AngleUnit { Degree, Radian };

/// linear: normalized, maps to (-inf, 0dB]; db is clipped to the headroom
/// minimum, db-raw is not
enum class GainUnit { Linear, MidiGain, Db, DbRaw };

enum class TimeUnit {
  Second,
  Bark,
  Bpm,
  Cents,
  Hz,
  Mel,
  MidiNote,
  Millisecond,
  Speed,
  Samples
};

enum class SpeedUnit {
  MetersPerSecond,
  MilesPerHour,
  KilometersPerHour,
  Knots,
  FeetPerSecond,
  FeetPerHour,
  PixelsPerSecond
};

/// OSCQuery UNIT vocabulary, serialized as "<category>.<name>"
/// (e.g. "distance.cm", "speed.km/h")
using OscUnit =
    std::variant<DistanceUnit, AngleUnit, GainUnit, TimeUnit, SpeedUnit>;

OSCQUERY_SERVER_API std::string to_string(const OscUnit &unit);

/// Parse "<category>.<name>". Returns std::nullopt for unknown units.
OSCQUERY_SERVER_API std::optional<OscUnit> parse_unit(const std::string &text);

} // namespace oscquery
