#include "oscquery-server/QueryResolver.hpp"
#include "oscquery-server/Logger.hpp"

#include <array>
#include <type_traits>

using json = nlohmann::ordered_json;

namespace oscquery {

namespace {

// Key order of a serialized node
constexpr std::array<const char *, 8> NODE_ATTRIBUTES = {
    attr::DESCRIPTION, attr::FULL_PATH, attr::ACCESS, attr::CONTENTS,
    attr::TYPE,        attr::VALUE,     attr::RANGE,  attr::UNIT};

int hex_digit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

std::string percent_decode(const std::string &in) {
  std::string out;
  out.reserve(in.size());
  for (std::size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '%' && i + 2 < in.size()) {
      int hi = hex_digit(in[i + 1]);
      int lo = hex_digit(in[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        continue;
      }
    }
    out.push_back(in[i]);
  }
  return out;
}

json values_to_json(const std::vector<OscValue> &values) {
  json arr = json::array();
  for (const auto &v : values) {
    arr.push_back(value_to_json(v));
  }
  return arr;
}

json range_to_json(const std::vector<RangeSpec> &range) {
  json arr = json::array();
  for (const auto &r : range) {
    json entry = json::object();
    if (r.min)
      entry["MIN"] = float_to_json(*r.min);
    if (r.max)
      entry["MAX"] = float_to_json(*r.max);
    if (!r.vals.empty())
      entry["VALS"] = values_to_json(r.vals);
    arr.push_back(std::move(entry));
  }
  return arr;
}

json units_to_json(const std::vector<OscUnit> &units) {
  json arr = json::array();
  for (const auto &u : units) {
    arr.push_back(to_string(u));
  }
  return arr;
}

std::optional<json> group_attribute(const GroupBody &group,
                                    const std::string &attribute) {
  if (attribute == attr::CONTENTS) {
    json contents = json::object();
    for (const auto &child : group.children) {
      contents[child->segment()] = node_to_json(*child);
    }
    return contents;
  }
  return std::nullopt;
}

std::optional<json> leaf_attribute(const LeafBody &leaf,
                                   const std::string &attribute) {
  if (attribute == attr::TYPE)
    return json(type_tag(leaf.values));
  if (attribute == attr::VALUE)
    return values_to_json(leaf.values);
  if (attribute == attr::RANGE && leaf.range)
    return range_to_json(*leaf.range);
  if (attribute == attr::UNIT && leaf.unit)
    return units_to_json(*leaf.unit);
  return std::nullopt;
}

} // namespace

RequestTarget parse_request_target(const std::string &target) {
  RequestTarget out;
  auto qpos = target.find('?');
  out.path = percent_decode(target.substr(0, qpos));
  if (qpos == std::string::npos)
    return out;

  std::string query = target.substr(qpos + 1);
  auto end = query.find_first_of("&=");
  std::string key = percent_decode(query.substr(0, end));
  if (!key.empty())
    out.attribute = key;
  return out;
}

std::optional<json> node_attribute(const AddressNode &node,
                                   const std::string &attribute) {
  if (attribute == attr::FULL_PATH)
    return json(node.full_path());
  if (attribute == attr::DESCRIPTION)
    return json(node.description());
  if (attribute == attr::ACCESS)
    return json(static_cast<int>(node.access()));

  return std::visit(
      [&attribute](auto &&body) -> std::optional<json> {
        using T = std::decay_t<decltype(body)>;
        if constexpr (std::is_same_v<T, GroupBody>)
          return group_attribute(body, attribute);
        else
          return leaf_attribute(body, attribute);
      },
      node.body());
}

json node_to_json(const AddressNode &node) {
  json j = json::object();
  for (const char *name : NODE_ATTRIBUTES) {
    if (auto value = node_attribute(node, name)) {
      j[name] = std::move(*value);
    }
  }
  return j;
}

QueryResult resolve_query(const AddressTree &tree, const std::string &path,
                          const std::optional<std::string> &attribute) {
  QueryResult result;

  // HOST_INFO is answered from the root whatever the requested path
  if (attribute && *attribute == attr::HOST_INFO) {
    result.body = tree.host_info() ? tree.host_info()->to_json()
                                   : json::object();
    return result;
  }

  const AddressNode *node = tree.find(path);
  if (!node) {
    LOG_DEBUG("QUERY", "RESOLVE", "No node at '{}'", path);
    result.status = QueryStatus::NotFound;
    result.body["error"] = "not found";
    result.body["path"] = path;
    return result;
  }

  if (!attribute) {
    result.body = node_to_json(*node);
    if (node == &tree.root() && tree.host_info()) {
      result.body[attr::HOST_INFO] = tree.host_info()->to_json();
    }
    return result;
  }

  result.body = json::object();
  if (auto value = node_attribute(*node, *attribute)) {
    result.body[*attribute] = std::move(*value);
  }
  return result;
}

QueryResult resolve_query(const AddressTree &tree,
                          const RequestTarget &target) {
  return resolve_query(tree, target.path, target.attribute);
}

std::string dump_body(const json &body, int indent) {
  return body.dump(indent, ' ', false, json::error_handler_t::replace);
}

} // namespace oscquery
