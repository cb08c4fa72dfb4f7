#include "../test_utils/TestFixtures.hpp"
#include "oscquery-server/AddressTree.hpp"

#include <type_traits>

using namespace oscquery;
using namespace oscquery::test;

class AddressTreeTest : public OscQueryTest {};

TEST_F(AddressTreeTest, EmptyRootIsGroupAtSlash) {
  TreeBuilder builder;
  const auto &root = builder.root();
  EXPECT_TRUE(root.is_group());
  EXPECT_EQ(root.full_path(), "/");
  EXPECT_EQ(root.description(), "");
  EXPECT_EQ(root.access(), Access::NoValue);
  EXPECT_TRUE(root.group()->children.empty());
  EXPECT_FALSE(builder.host_info().has_value());
}

TEST_F(AddressTreeTest, InsertCreatesIntermediateGroups) {
  TreeBuilder builder;
  ASSERT_EQ(builder.insert(make_endpoint("/a/b/c", 1.0f)), InsertStatus::Ok);

  const auto *a = builder.root().child("a");
  ASSERT_NE(a, nullptr);
  EXPECT_TRUE(a->is_group());
  EXPECT_EQ(a->full_path(), "/a");
  EXPECT_EQ(a->access(), Access::NoValue);

  const auto *b = a->child("b");
  ASSERT_NE(b, nullptr);
  EXPECT_TRUE(b->is_group());
  EXPECT_EQ(b->full_path(), "/a/b");

  const auto *c = b->child("c");
  ASSERT_NE(c, nullptr);
  EXPECT_TRUE(c->is_leaf());
  EXPECT_EQ(c->full_path(), "/a/b/c");
  EXPECT_EQ(c->segment(), "c");
}

TEST_F(AddressTreeTest, LeafCopiesDescriptorFields) {
  TreeBuilder builder;
  auto d = make_endpoint("/gain", 0.5f, Access::ReadOnly);
  d.description = "Output gain";
  d.min = 0.0f;
  d.max = 1.0f;
  d.unit = GainUnit::Linear;
  ASSERT_EQ(builder.insert(d), InsertStatus::Ok);

  const auto *leaf = builder.root().child("gain");
  ASSERT_NE(leaf, nullptr);
  EXPECT_EQ(leaf->description(), "Output gain");
  EXPECT_EQ(leaf->access(), Access::ReadOnly);

  const auto *body = leaf->leaf();
  ASSERT_NE(body, nullptr);
  ASSERT_EQ(body->values.size(), 1u);
  EXPECT_FLOAT_EQ(std::get<float>(body->values[0]), 0.5f);

  ASSERT_TRUE(body->range.has_value());
  ASSERT_EQ(body->range->size(), body->values.size());
  EXPECT_FLOAT_EQ(*(*body->range)[0].min, 0.0f);
  EXPECT_FLOAT_EQ(*(*body->range)[0].max, 1.0f);

  ASSERT_TRUE(body->unit.has_value());
  ASSERT_EQ(body->unit->size(), body->values.size());
  EXPECT_EQ(std::get<GainUnit>((*body->unit)[0]), GainUnit::Linear);
}

TEST_F(AddressTreeTest, RangeNeedsBothBounds) {
  TreeBuilder builder;
  auto only_min = make_endpoint("/only_min", 1.0f);
  only_min.min = 0.0f;
  ASSERT_EQ(builder.insert(only_min), InsertStatus::Ok);
  EXPECT_FALSE(builder.root().child("only_min")->leaf()->range.has_value());

  auto plain = make_endpoint("/plain", int32_t{4});
  ASSERT_EQ(builder.insert(plain), InsertStatus::Ok);
  const auto *leaf = builder.root().child("plain")->leaf();
  EXPECT_FALSE(leaf->range.has_value());
  EXPECT_FALSE(leaf->unit.has_value());
}

TEST_F(AddressTreeTest, AllowedValuesBecomeRangeVals) {
  TreeBuilder builder;
  auto mode = make_endpoint("/mode", std::string("sine"));
  mode.allowed_values = {std::string("sine"), std::string("saw")};
  ASSERT_EQ(builder.insert(mode), InsertStatus::Ok);

  const auto *leaf = builder.root().child("mode")->leaf();
  ASSERT_TRUE(leaf->range.has_value());
  const auto &range = (*leaf->range)[0];
  EXPECT_FALSE(range.min.has_value());
  EXPECT_FALSE(range.max.has_value());
  EXPECT_EQ(range.vals.size(), 2u);
}

TEST_F(AddressTreeTest, InvalidPathsAreRejected) {
  TreeBuilder builder;
  EXPECT_EQ(builder.insert(make_endpoint("", 1.0f)), InsertStatus::InvalidPath);
  EXPECT_EQ(builder.insert(make_endpoint("noslash", 1.0f)),
            InsertStatus::InvalidPath);
  EXPECT_EQ(builder.insert(make_endpoint("/a//b", 1.0f)),
            InsertStatus::InvalidPath);
  EXPECT_EQ(builder.insert(make_endpoint("/a/", 1.0f)),
            InsertStatus::InvalidPath);
  EXPECT_TRUE(builder.root().group()->children.empty());
}

TEST_F(AddressTreeTest, SegmentsMayHoldAnyNonEmptyText) {
  TreeBuilder builder;
  EXPECT_EQ(builder.insert(make_endpoint("/my synth/gain", 1.0f)),
            InsertStatus::Ok);
  EXPECT_EQ(builder.insert(make_endpoint("/wild*", 1.0f)), InsertStatus::Ok);
  EXPECT_EQ(builder.insert(make_endpoint("/q?", 1.0f)), InsertStatus::Ok);

  auto tree = builder.publish();
  const auto *group = tree->find("/my synth");
  ASSERT_NE(group, nullptr);
  EXPECT_TRUE(group->is_group());
  EXPECT_EQ(group->segment(), "my synth");
  ASSERT_NE(tree->find("/my synth/gain"), nullptr);
  EXPECT_EQ(tree->find("/my synth/gain")->full_path(), "/my synth/gain");
  EXPECT_NE(tree->find("/wild*"), nullptr);
}

TEST_F(AddressTreeTest, NodesAreOnlyBuiltByFactories) {
  static_assert(!std::is_constructible<AddressNode, std::string, std::string,
                                       std::string, AddressNode::Body>::value,
                "nodes come from make_group/make_leaf");
  static_assert(!std::is_constructible<AddressTree, std::unique_ptr<AddressNode>,
                                       std::optional<HostInfo>>::value,
                "trees come from TreeBuilder::publish");

  auto group = AddressNode::make_group("g", "/g");
  EXPECT_TRUE(group->is_group());
  EXPECT_EQ(group->full_path(), "/g");
  EXPECT_EQ(group->access(), Access::NoValue);
}

TEST_F(AddressTreeTest, RootCannotBeAnEndpoint) {
  TreeBuilder builder;
  EXPECT_EQ(builder.insert(make_endpoint("/", 1.0f)),
            InsertStatus::PathConflict);
}

TEST_F(AddressTreeTest, DuplicateLeafIsConflictAndKeepsFirst) {
  TreeBuilder builder;
  ASSERT_EQ(builder.insert(make_endpoint("/x", 1.0f)), InsertStatus::Ok);
  EXPECT_EQ(builder.insert(make_endpoint("/x", int32_t{2})),
            InsertStatus::PathConflict);

  const auto *x = builder.root().child("x");
  ASSERT_NE(x, nullptr);
  EXPECT_EQ(type_tag(x->leaf()->values), "f");
  EXPECT_EQ(builder.root().group()->children.size(), 1u);
}

TEST_F(AddressTreeTest, LeafOnExistingGroupIsConflict) {
  TreeBuilder builder;
  ASSERT_EQ(builder.insert(make_endpoint("/a/b", 1.0f)), InsertStatus::Ok);
  EXPECT_EQ(builder.insert(make_endpoint("/a", 1.0f)),
            InsertStatus::PathConflict);
  EXPECT_TRUE(builder.root().child("a")->is_group());
}

TEST_F(AddressTreeTest, DescendingThroughLeafIsConflictWithoutSideEffects) {
  TreeBuilder builder;
  ASSERT_EQ(builder.insert(make_endpoint("/a", 1.0f)), InsertStatus::Ok);
  EXPECT_EQ(builder.insert(make_endpoint("/a/b/c", 1.0f)),
            InsertStatus::PathConflict);
  EXPECT_EQ(builder.root().subtree_size(), 2u);
  EXPECT_TRUE(builder.root().child("a")->is_leaf());
}

TEST_F(AddressTreeTest, FailedInsertCreatesNoGroups) {
  TreeBuilder builder;
  ASSERT_EQ(builder.insert(make_endpoint("/g/leaf", 1.0f)), InsertStatus::Ok);
  EXPECT_EQ(builder.insert(make_endpoint("/g/leaf/deeper/x", 1.0f)),
            InsertStatus::PathConflict);
  EXPECT_EQ(builder.root().subtree_size(), 3u);
}

TEST_F(AddressTreeTest, ChildrenKeepInsertionOrder) {
  TreeBuilder builder;
  for (const char *path : {"/zeta", "/alpha", "/mid/x", "/beta"}) {
    ASSERT_EQ(builder.insert(make_endpoint(path, 1.0f)), InsertStatus::Ok);
  }

  std::vector<std::string> order;
  for (const auto &child : builder.root().group()->children) {
    order.push_back(child->segment());
  }
  EXPECT_EQ(order,
            (std::vector<std::string>{"zeta", "alpha", "mid", "beta"}));
}

TEST_F(AddressTreeTest, FullPathIsParentPlusSegment) {
  TreeBuilder builder;
  ASSERT_EQ(builder.insert(make_endpoint("/synth/osc1/freq", 440.0f)),
            InsertStatus::Ok);
  ASSERT_EQ(builder.insert(make_endpoint("/synth/osc2/freq", 220.0f)),
            InsertStatus::Ok);

  auto tree = builder.publish();
  for (const char *path :
       {"/synth", "/synth/osc1", "/synth/osc1/freq", "/synth/osc2/freq"}) {
    const auto *node = tree->find(path);
    ASSERT_NE(node, nullptr) << path;
    EXPECT_EQ(node->full_path(), path);
  }
}

TEST_F(AddressTreeTest, PublishHandsOverTreeAndHostInfo) {
  TreeBuilder builder(reference_host_info());
  ASSERT_EQ(builder.insert(make_endpoint("/a", 1.0f)), InsertStatus::Ok);

  auto tree = builder.publish();
  EXPECT_TRUE(builder.is_published());
  ASSERT_TRUE(tree->host_info().has_value());
  EXPECT_EQ(tree->host_info()->name, "My OSC Server");
  EXPECT_NE(tree->find("/a"), nullptr);

  EXPECT_THROW(builder.insert(make_endpoint("/b", 1.0f)), std::logic_error);
  EXPECT_THROW(builder.publish(), std::logic_error);
  EXPECT_THROW(builder.root(), std::logic_error);
}

TEST_F(AddressTreeTest, FindFollowsQueryPathRules) {
  auto tree = build_reference_tree();
  EXPECT_EQ(tree->find("/"), &tree->root());
  EXPECT_EQ(tree->find(""), &tree->root());
  EXPECT_NE(tree->find("/endpoint1"), nullptr);
  EXPECT_EQ(tree->find("/endpoint1/"), tree->find("/endpoint1"));
  EXPECT_EQ(tree->find("endpoint1"), nullptr);
  EXPECT_EQ(tree->find("//"), nullptr);
  EXPECT_EQ(tree->find("/endpoint1//"), nullptr);
  EXPECT_EQ(tree->find("/missing"), nullptr);
  EXPECT_EQ(tree->find("/endpoint1/below"), nullptr);
}

TEST(AddressHelpersTest, SplitAddress) {
  EXPECT_EQ(split_address("/a/b/c"),
            (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_EQ(split_address("/a//b"), (std::vector<std::string>{"a", "", "b"}));
  EXPECT_TRUE(split_address("/").empty());
}

TEST(AddressHelpersTest, ValidAddresses) {
  EXPECT_TRUE(is_valid_address("/"));
  EXPECT_TRUE(is_valid_address("/a"));
  EXPECT_TRUE(is_valid_address("/synth/osc-1/freq_hz"));
  EXPECT_FALSE(is_valid_address(""));
  EXPECT_FALSE(is_valid_address("a/b"));
  EXPECT_FALSE(is_valid_address("//"));
  EXPECT_FALSE(is_valid_address("/a/"));
  EXPECT_TRUE(is_valid_address("/a/{b,c}"));
  EXPECT_TRUE(is_valid_address("/my synth"));
}
