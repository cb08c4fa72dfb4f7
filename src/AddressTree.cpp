#include "oscquery-server/AddressTree.hpp"
#include "oscquery-server/Logger.hpp"

#include <stdexcept>
#include <utility>

namespace oscquery {

namespace {

// Any non-empty text is a segment; "/my synth" is a legal address.
bool is_valid_segment(const std::string &segment) { return !segment.empty(); }

std::string child_path(const std::string &parent, const std::string &segment) {
  if (parent == "/")
    return "/" + segment;
  return parent + "/" + segment;
}

} // namespace

// AddressNode

AddressNode::AddressNode(ConstructionKey, std::string segment,
                         std::string full_path, std::string description,
                         Body body)
    : segment_(std::move(segment)), full_path_(std::move(full_path)),
      description_(std::move(description)), body_(std::move(body)) {}

std::unique_ptr<AddressNode> AddressNode::make_group(std::string segment,
                                                     std::string full_path) {
  return std::make_unique<AddressNode>(ConstructionKey{}, std::move(segment),
                                       std::move(full_path), "", GroupBody{});
}

std::unique_ptr<AddressNode> AddressNode::make_leaf(std::string segment,
                                                    std::string full_path,
                                                    std::string description,
                                                    LeafBody leaf) {
  return std::make_unique<AddressNode>(ConstructionKey{}, std::move(segment),
                                       std::move(full_path),
                                       std::move(description), std::move(leaf));
}

Access AddressNode::access() const {
  if (const auto *l = leaf())
    return l->access;
  return Access::NoValue;
}

const AddressNode *AddressNode::child(const std::string &segment) const {
  const auto *g = group();
  if (!g)
    return nullptr;
  auto it = g->index.find(segment);
  if (it == g->index.end())
    return nullptr;
  return g->children[it->second].get();
}

AddressNode *AddressNode::mutable_child(const std::string &segment) {
  return const_cast<AddressNode *>(std::as_const(*this).child(segment));
}

AddressNode *AddressNode::attach(std::unique_ptr<AddressNode> node) {
  auto *g = std::get_if<GroupBody>(&body_);
  if (!g) {
    throw std::logic_error("cannot attach '" + node->full_path() +
                           "' below leaf '" + full_path_ + "'");
  }
  AddressNode *raw = node.get();
  g->index.emplace(node->segment(), g->children.size());
  g->children.push_back(std::move(node));
  return raw;
}

std::size_t AddressNode::subtree_size() const {
  std::size_t count = 1;
  if (const auto *g = group()) {
    for (const auto &c : g->children) {
      count += c->subtree_size();
    }
  }
  return count;
}

// AddressTree

AddressTree::AddressTree(ConstructionKey, std::unique_ptr<AddressNode> root,
                         std::optional<HostInfo> host_info)
    : root_(std::move(root)), host_info_(std::move(host_info)) {}

const AddressNode *AddressTree::find(const std::string &path) const {
  return find_node(*root_, path);
}

// TreeBuilder

const char *to_string(InsertStatus status) {
  switch (status) {
  case InsertStatus::Ok:
    return "Ok";
  case InsertStatus::InvalidPath:
    return "InvalidPath";
  case InsertStatus::PathConflict:
    return "PathConflict";
  }
  return "Unknown";
}

TreeBuilder::TreeBuilder(std::optional<HostInfo> host_info)
    : root_(AddressNode::make_group("", "/")),
      host_info_(std::move(host_info)) {}

const AddressNode &TreeBuilder::root() const {
  if (!root_)
    throw std::logic_error("address tree already published");
  return *root_;
}

InsertStatus TreeBuilder::insert(const EndpointDescriptor &descriptor) {
  if (!root_)
    throw std::logic_error("cannot insert '" + descriptor.path +
                           "': address tree already published");

  const std::string &path = descriptor.path;
  if (!is_valid_address(path)) {
    LOG_WARN("TREE", "INSERT", "Invalid OSC address '{}'", path);
    return InsertStatus::InvalidPath;
  }

  auto segments = split_address(path);
  if (segments.empty()) {
    LOG_WARN("TREE", "INSERT", "Cannot place an endpoint on the root");
    return InsertStatus::PathConflict;
  }

  // Follow the existing prefix. Conflicts can only occur on existing nodes,
  // so everything is checked before the first group is created.
  AddressNode *parent = root_.get();
  std::size_t depth = 0;
  for (; depth + 1 < segments.size(); ++depth) {
    AddressNode *next = parent->mutable_child(segments[depth]);
    if (!next)
      break;
    if (next->is_leaf()) {
      LOG_WARN("TREE", "INSERT", "Cannot insert '{}': '{}' is an endpoint",
               path, next->full_path());
      return InsertStatus::PathConflict;
    }
    parent = next;
  }

  if (depth + 1 == segments.size() && parent->child(segments.back())) {
    LOG_WARN("TREE", "INSERT", "Cannot insert '{}': address already in use",
             path);
    return InsertStatus::PathConflict;
  }

  for (; depth + 1 < segments.size(); ++depth) {
    parent = parent->attach(AddressNode::make_group(
        segments[depth], child_path(parent->full_path(), segments[depth])));
    LOG_TRACE("TREE", "INSERT", "Created group '{}'", parent->full_path());
  }

  LeafBody leaf;
  leaf.access = descriptor.access;
  leaf.values.push_back(descriptor.initial_value);

  bool has_bounds = descriptor.min.has_value() && descriptor.max.has_value();
  if (has_bounds || !descriptor.allowed_values.empty()) {
    RangeSpec range;
    if (has_bounds) {
      range.min = descriptor.min;
      range.max = descriptor.max;
    }
    range.vals = descriptor.allowed_values;
    leaf.range = std::vector<RangeSpec>{std::move(range)};
  }

  if (descriptor.unit) {
    leaf.unit = std::vector<OscUnit>{*descriptor.unit};
  }

  const std::string &segment = segments.back();
  parent->attach(AddressNode::make_leaf(
      segment, child_path(parent->full_path(), segment),
      descriptor.description.value_or(""), std::move(leaf)));

  LOG_DEBUG("TREE", "INSERT", "Added endpoint '{}' type '{}'", path,
            type_tag(descriptor.initial_value));
  return InsertStatus::Ok;
}

std::shared_ptr<const AddressTree> TreeBuilder::publish() {
  if (!root_)
    throw std::logic_error("address tree already published");

  LOG_INFO("TREE", "PUBLISH", "Publishing address tree with {} nodes",
           root_->subtree_size());
  return std::make_shared<AddressTree>(AddressTree::ConstructionKey{},
                                       std::move(root_), std::move(host_info_));
}

// Address helpers

bool is_valid_address(const std::string &path) {
  if (path.empty() || path.front() != '/')
    return false;
  if (path == "/")
    return true;
  for (const auto &segment : split_address(path)) {
    if (!is_valid_segment(segment))
      return false;
  }
  return true;
}

std::vector<std::string> split_address(const std::string &path) {
  std::vector<std::string> segments;
  std::size_t start = (!path.empty() && path.front() == '/') ? 1 : 0;
  if (start >= path.size())
    return segments;

  while (true) {
    auto slash = path.find('/', start);
    if (slash == std::string::npos) {
      segments.push_back(path.substr(start));
      break;
    }
    segments.push_back(path.substr(start, slash - start));
    start = slash + 1;
  }
  return segments;
}

const AddressNode *find_node(const AddressNode &root, const std::string &path) {
  if (path.empty() || path == "/")
    return &root;
  if (path.front() != '/')
    return nullptr;

  std::string trimmed = path;
  if (trimmed.back() == '/')
    trimmed.pop_back();
  if (trimmed.empty() || trimmed == "/")
    return nullptr;

  const AddressNode *node = &root;
  for (const auto &segment : split_address(trimmed)) {
    if (segment.empty())
      return nullptr;
    node = node->child(segment);
    if (!node)
      return nullptr;
  }
  return node;
}

} // namespace oscquery
