#pragma once
#include "oscquery-server/EndpointDescriptor.hpp"
#include "oscquery-server/HostInfo.hpp"
#include "oscquery-server/OscUnit.hpp"
#include "oscquery-server/OscValue.hpp"
#include "oscquery-server/export.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace oscquery {

class AddressNode;

/// One RANGE entry. MIN/MAX and VALS are each optional on the wire.
struct RangeSpec {
  std::optional<float> min;
  std::optional<float> max;
  std::vector<OscValue> vals;
};

/// Payload of an endpoint. range/unit, when present, have one entry per value.
struct LeafBody {
  Access access{Access::ReadWrite};
  std::vector<OscValue> values;
  std::optional<std::vector<RangeSpec>> range;
  std::optional<std::vector<OscUnit>> unit;
};

/// Children of a container node, kept in insertion order
struct GroupBody {
  std::vector<std::unique_ptr<AddressNode>> children;
  std::unordered_map<std::string, std::size_t> index; // segment -> position
};

/// Node of the OSC address space: exactly one of group or leaf
class OSCQUERY_SERVER_API AddressNode {
  // Only members and TreeBuilder can name this, so only they can construct.
  struct ConstructionKey {
    explicit ConstructionKey() = default;
  };

public:
  using Body = std::variant<GroupBody, LeafBody>;

  AddressNode(ConstructionKey, std::string segment, std::string full_path,
              std::string description, Body body);

  static std::unique_ptr<AddressNode> make_group(std::string segment,
                                                 std::string full_path);
  static std::unique_ptr<AddressNode> make_leaf(std::string segment,
                                                std::string full_path,
                                                std::string description,
                                                LeafBody leaf);

  /// Last path component ("" for the root)
  const std::string &segment() const { return segment_; }
  const std::string &full_path() const { return full_path_; }
  const std::string &description() const { return description_; }

  /// Leaf access mode; groups always report Access::NoValue
  Access access() const;

  bool is_group() const { return std::holds_alternative<GroupBody>(body_); }
  bool is_leaf() const { return std::holds_alternative<LeafBody>(body_); }

  const Body &body() const { return body_; }
  const GroupBody *group() const { return std::get_if<GroupBody>(&body_); }
  const LeafBody *leaf() const { return std::get_if<LeafBody>(&body_); }

  /// Direct child by segment, nullptr if absent or if this is a leaf
  const AddressNode *child(const std::string &segment) const;

  /// Number of nodes in this subtree, including this one
  std::size_t subtree_size() const;

private:
  friend class TreeBuilder;

  AddressNode *mutable_child(const std::string &segment);

  // Append a child to a group; returns the attached node
  AddressNode *attach(std::unique_ptr<AddressNode> node);

  std::string segment_;
  std::string full_path_;
  std::string description_;
  Body body_;
};

/// Published, read-only address tree. Safe to share between threads.
class OSCQUERY_SERVER_API AddressTree {
  friend class TreeBuilder;

  struct ConstructionKey {
    explicit ConstructionKey() = default;
  };

public:
  AddressTree(ConstructionKey, std::unique_ptr<AddressNode> root,
              std::optional<HostInfo> host_info);

  const AddressNode &root() const { return *root_; }
  const std::optional<HostInfo> &host_info() const { return host_info_; }

  /// Resolve an address ("/" or "" is the root). nullptr when absent.
  const AddressNode *find(const std::string &path) const;

private:
  std::unique_ptr<AddressNode> root_;
  std::optional<HostInfo> host_info_;
};

enum class InsertStatus { Ok, InvalidPath, PathConflict };

OSCQUERY_SERVER_API const char *to_string(InsertStatus status);

/// Build phase of an address tree.
///
/// Endpoints are inserted one at a time; publish() then hands the finished
/// tree out as an immutable shared handle and the builder is spent. No
/// locking is done: build on one thread, before serving.
class OSCQUERY_SERVER_API TreeBuilder {
public:
  explicit TreeBuilder(std::optional<HostInfo> host_info = std::nullopt);

  /// Add a leaf at descriptor.path, creating missing parent groups.
  /// On InvalidPath or PathConflict the tree is left untouched.
  /// Throws std::logic_error once publish() has been called.
  InsertStatus insert(const EndpointDescriptor &descriptor);

  /// Current root (valid until publish())
  const AddressNode &root() const;
  const std::optional<HostInfo> &host_info() const { return host_info_; }

  bool is_published() const { return root_ == nullptr; }

  std::shared_ptr<const AddressTree> publish();

private:
  std::unique_ptr<AddressNode> root_;
  std::optional<HostInfo> host_info_;
};

/// True for "/" and for absolute addresses with no empty segment
OSCQUERY_SERVER_API bool is_valid_address(const std::string &path);

/// Split "/a/b/c" into {"a", "b", "c"}. Empty segments are kept.
OSCQUERY_SERVER_API std::vector<std::string>
split_address(const std::string &path);

/// Resolve an address below `root` using the query rules ("" and "/" name
/// the root, one trailing '/' is ignored). nullptr when absent.
OSCQUERY_SERVER_API const AddressNode *find_node(const AddressNode &root,
                                                 const std::string &path);

} // namespace oscquery
