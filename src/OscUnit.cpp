#include "oscquery-server/OscUnit.hpp"

#include <array>
#include <type_traits>
#include <utility>

namespace oscquery {

namespace {

constexpr std::array<std::pair<DistanceUnit, const char *>, 12> DISTANCE_NAMES{
    {{DistanceUnit::Meter, "m"},
     {DistanceUnit::Kilometer, "km"},
     {DistanceUnit::Decimeter, "dm"},
     {DistanceUnit::Centimeter, "cm"},
     {DistanceUnit::Millimeter, "mm"},
     {DistanceUnit::Micrometer, "um"},
     {DistanceUnit::Nanometer, "nm"},
     {DistanceUnit::Picometer, "pm"},
     {DistanceUnit::Inch, "inch"},
     {DistanceUnit::Feet, "feet"},
     {DistanceUnit::Mile, "mile"},
     {DistanceUnit::Pixels, "pixels"}}};

constexpr std::array<std::pair<AngleUnit, const char *>, 2> ANGLE_NAMES{
    {{AngleUnit::Degree, "degree"}, {AngleUnit::Radian, "radian"}}};

constexpr std::array<std::pair<GainUnit, const char *>, 4> GAIN_NAMES{
    {{GainUnit::Linear, "linear"},
     {GainUnit::MidiGain, "midigain"},
     {GainUnit::Db, "db"},
     {GainUnit::DbRaw, "db-raw"}}};

constexpr std::array<std::pair<TimeUnit, const char *>, 10> TIME_NAMES{
    {{TimeUnit::Second, "second"},
     {TimeUnit::Bark, "bark"},
     {TimeUnit::Bpm, "bpm"},
     {TimeUnit::Cents, "cents"},
     {TimeUnit::Hz, "hz"},
     {TimeUnit::Mel, "mel"},
     {TimeUnit::MidiNote, "midinote"},
     {TimeUnit::Millisecond, "ms"},
     {TimeUnit::Speed, "speed"},
     {TimeUnit::Samples, "samples"}}};

constexpr std::array<std::pair<SpeedUnit, const char *>, 7> SPEED_NAMES{
    {{SpeedUnit::MetersPerSecond, "m/s"},
     {SpeedUnit::MilesPerHour, "mph"},
     {SpeedUnit::KilometersPerHour, "km/h"},
     {SpeedUnit::Knots, "knots"},
     {SpeedUnit::FeetPerSecond, "ft/s"},
     {SpeedUnit::FeetPerHour, "ft/h"},
     {SpeedUnit::PixelsPerSecond, "pix/s"}}};

template <typename Enum, std::size_t N>
const char *name_of(const std::array<std::pair<Enum, const char *>, N> &table,
                    Enum value) {
  for (const auto &entry : table) {
    if (entry.first == value)
      return entry.second;
  }
  return "";
}

template <typename Enum, std::size_t N>
std::optional<OscUnit>
lookup(const std::array<std::pair<Enum, const char *>, N> &table,
       const std::string &name) {
  for (const auto &entry : table) {
    if (name == entry.second)
      return OscUnit{entry.first};
  }
  return std::nullopt;
}

} // namespace

std::string to_string(const OscUnit &unit) {
  return std::visit(
      [](auto &&u) -> std::string {
        using T = std::decay_t<decltype(u)>;
        if constexpr (std::is_same_v<T, DistanceUnit>)
          return std::string("distance.") + name_of(DISTANCE_NAMES, u);
        else if constexpr (std::is_same_v<T, AngleUnit>)
          return std::string("angle.") + name_of(ANGLE_NAMES, u);
        else if constexpr (std::is_same_v<T, GainUnit>)
          return std::string("gain.") + name_of(GAIN_NAMES, u);
        else if constexpr (std::is_same_v<T, TimeUnit>)
          return std::string("time.") + name_of(TIME_NAMES, u);
        else
          return std::string("speed.") + name_of(SPEED_NAMES, u);
      },
      unit);
}

std::optional<OscUnit> parse_unit(const std::string &text) {
  // Category ends at the first '.'
  auto dot = text.find('.');
  if (dot == std::string::npos)
    return std::nullopt;

  std::string category = text.substr(0, dot);
  std::string name = text.substr(dot + 1);

  if (category == "distance")
    return lookup(DISTANCE_NAMES, name);
  if (category == "angle")
    return lookup(ANGLE_NAMES, name);
  if (category == "gain")
    return lookup(GAIN_NAMES, name);
  if (category == "time")
    return lookup(TIME_NAMES, name);
  if (category == "speed")
    return lookup(SPEED_NAMES, name);
  return std::nullopt;
}

} // namespace oscquery
