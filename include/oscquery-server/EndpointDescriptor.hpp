#pragma once

#include "oscquery-server/OscUnit.hpp"
#include "oscquery-server/OscValue.hpp"

#include <optional>
#include <string>
#include <vector>

namespace oscquery {

/// OSCQuery ACCESS values (serialized as the integer)
enum class Access : int {
  NoValue = 0,
  ReadOnly = 1,
  WriteOnly = 2,
  ReadWrite = 3
};

/// Description of one leaf endpoint, consumed by TreeBuilder::insert()
struct EndpointDescriptor {
  std::string path;   // absolute OSC address, e.g. "/mixer/gain"
  OscValue initial_value;
  std::optional<std::string> description;
  std::optional<float> min; // RANGE MIN, used only together with max
  std::optional<float> max;
  std::vector<OscValue> allowed_values; // RANGE VALS
  Access access{Access::ReadWrite};
  std::optional<OscUnit> unit;
};

} // namespace oscquery
