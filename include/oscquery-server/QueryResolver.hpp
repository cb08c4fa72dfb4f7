#pragma once
#include "oscquery-server/AddressTree.hpp"
#include "oscquery-server/export.h"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace oscquery {

/// OSCQuery attribute names as they appear on the wire
namespace attr {
constexpr const char *FULL_PATH = "FULL_PATH";
constexpr const char *DESCRIPTION = "DESCRIPTION";
constexpr const char *ACCESS = "ACCESS";
constexpr const char *CONTENTS = "CONTENTS";
constexpr const char *TYPE = "TYPE";
constexpr const char *VALUE = "VALUE";
constexpr const char *RANGE = "RANGE";
constexpr const char *UNIT = "UNIT";
constexpr const char *HOST_INFO = "HOST_INFO";
} // namespace attr

enum class QueryStatus { Ok, NotFound };

struct QueryResult {
  QueryStatus status{QueryStatus::Ok};
  nlohmann::ordered_json body;
};

/// HTTP request target split into OSC address and attribute query
struct RequestTarget {
  std::string path;
  std::optional<std::string> attribute;
};

/// "/foo/bar?VALUE" -> {"/foo/bar", "VALUE"}. The path is percent-decoded;
/// only the first query key is kept ("?VALUE=1&x" -> "VALUE").
OSCQUERY_SERVER_API RequestTarget
parse_request_target(const std::string &target);

/// Single attribute of a node, std::nullopt when the node does not carry it
/// (RANGE/UNIT not set, CONTENTS on a leaf, TYPE on a group, unknown names)
OSCQUERY_SERVER_API std::optional<nlohmann::ordered_json>
node_attribute(const AddressNode &node, const std::string &attribute);

/// Full node object with CONTENTS expanded recursively. HOST_INFO is not
/// included; resolve_query() adds it for the root.
OSCQUERY_SERVER_API nlohmann::ordered_json node_to_json(const AddressNode &node);

/// Answer one query against a published tree:
///  - attribute HOST_INFO: the host info object, whatever the path
///  - unknown path: NotFound, body {"error": "not found", "path": ...}
///  - no attribute: the full node object (plus HOST_INFO at the root)
///  - attribute: {"<ATTR>": value}, or {} when the node lacks it
OSCQUERY_SERVER_API QueryResult
resolve_query(const AddressTree &tree, const std::string &path,
              const std::optional<std::string> &attribute = std::nullopt);

OSCQUERY_SERVER_API QueryResult resolve_query(const AddressTree &tree,
                                              const RequestTarget &target);

/// Serialize a response body. Invalid UTF-8 (a percent-decoded path, a YAML
/// description) is replaced with U+FFFD instead of throwing.
OSCQUERY_SERVER_API std::string dump_body(const nlohmann::ordered_json &body,
                                          int indent = -1);

} // namespace oscquery
