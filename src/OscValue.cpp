#include "oscquery-server/OscValue.hpp"

#include <cmath>
#include <fmt/format.h>
#include <locale>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace oscquery {

char type_tag(const OscValue &value) {
  return std::visit(
      [](auto &&arg) -> char {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, int32_t>)
          return 'i';
        else if constexpr (std::is_same_v<T, float>)
          return 'f';
        else if constexpr (std::is_same_v<T, std::string>)
          return 's';
        else if constexpr (std::is_same_v<T, OscBlob>)
          return 'b';
        else if constexpr (std::is_same_v<T, OscTimeTag>)
          return 't';
        else if constexpr (std::is_same_v<T, int64_t>)
          return 'h';
        else if constexpr (std::is_same_v<T, double>)
          return 'd';
        else if constexpr (std::is_same_v<T, OscChar>)
          return 'c';
        else if constexpr (std::is_same_v<T, OscColor>)
          return 'r';
        else if constexpr (std::is_same_v<T, OscMidi>)
          return 'm';
        else if constexpr (std::is_same_v<T, bool>)
          return arg ? 'T' : 'F';
        else if constexpr (std::is_same_v<T, OscNil>)
          return 'N';
        else
          return 'I';
      },
      value);
}

std::string type_tag(const std::vector<OscValue> &values) {
  std::string tags;
  tags.reserve(values.size());
  for (const auto &v : values) {
    tags += type_tag(v);
  }
  return tags;
}

nlohmann::ordered_json float_to_json(float value) {
  // fmt prints the shortest decimal that reads back as the same float;
  // widening that text to double keeps it short in the JSON output.
  // Read it back in the classic locale, whatever LC_NUMERIC the host set.
  if (!std::isfinite(value))
    return static_cast<double>(value);
  std::istringstream text(fmt::format("{}", value));
  text.imbue(std::locale::classic());
  double widened = 0.0;
  if (!(text >> widened))
    widened = static_cast<double>(value);
  return widened;
}

nlohmann::ordered_json value_to_json(const OscValue &value) {
  return std::visit(
      [](auto &&arg) -> nlohmann::ordered_json {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, float>) {
          return float_to_json(arg);
        } else if constexpr (std::is_same_v<T, OscBlob>) {
          nlohmann::ordered_json bytes = nlohmann::ordered_json::array();
          for (auto b : arg.data) {
            bytes.push_back(static_cast<unsigned>(b));
          }
          return bytes;
        } else if constexpr (std::is_same_v<T, OscTimeTag>) {
          return nlohmann::ordered_json::array({arg.seconds, arg.fraction});
        } else if constexpr (std::is_same_v<T, OscChar>) {
          return std::string(1, arg.value);
        } else if constexpr (std::is_same_v<T, OscColor>) {
          return fmt::format("#{:02x}{:02x}{:02x}{:02x}",
                             static_cast<unsigned>(arg.red),
                             static_cast<unsigned>(arg.green),
                             static_cast<unsigned>(arg.blue),
                             static_cast<unsigned>(arg.alpha));
        } else if constexpr (std::is_same_v<T, OscMidi>) {
          return nlohmann::ordered_json::array(
              {static_cast<unsigned>(arg.port),
               static_cast<unsigned>(arg.status),
               static_cast<unsigned>(arg.data1),
               static_cast<unsigned>(arg.data2)});
        } else if constexpr (std::is_same_v<T, OscNil> ||
                             std::is_same_v<T, OscInfinitum>) {
          return nullptr;
        } else {
          // i, h, d, s, T/F map directly
          return arg;
        }
      },
      value);
}

OscValue default_value_for_tag(char tag) {
  switch (tag) {
  case 'i':
    return int32_t{0};
  case 'f':
    return 0.0f;
  case 's':
    return std::string();
  case 'b':
    return OscBlob{};
  case 't':
    return OscTimeTag{};
  case 'h':
    return int64_t{0};
  case 'd':
    return 0.0;
  case 'c':
    return OscChar{};
  case 'r':
    return OscColor{};
  case 'm':
    return OscMidi{};
  case 'T':
    return true;
  case 'F':
    return false;
  case 'N':
    return OscNil{};
  case 'I':
    return OscInfinitum{};
  default:
    throw std::invalid_argument(
        fmt::format("Unsupported OSC type tag '{}'", tag));
  }
}

} // namespace oscquery
