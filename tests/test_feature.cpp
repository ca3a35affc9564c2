/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include <gtest/gtest.h>

#include "feature.h"
#include "fk_assert.h"

using namespace fk;

namespace {

feature_ptr make_feature(const string& id, pos_t start, pos_t end, strand_t strand = pos_strand)
{
	auto f         = std::make_unique<feature_t>();
	f->primary_id  = id;
	f->seq_id      = "chr1";
	f->start       = start;
	f->end         = end;
	f->strand      = strand;
	f->primary_tag = "exon";
	return f;
}

class scored_feature : public feature_t {
public:
	scored_feature() = default;
	int rank{};
	feature_ptr clone() const override
	{
		auto dst = std::unique_ptr<scored_feature>(new scored_feature(*this));
		clone_children_into(*dst);
		return dst;
	}

protected:
	scored_feature(const scored_feature& src) : feature_t(src), rank(src.rank) {}
};

class scored_factory : public feature_factory {
public:
	feature_ptr make() const override { return std::make_unique<scored_feature>(); }
};

}  // namespace

TEST(FeatureTest, Tags)
{
	feature_t f;
	f.add_tag_value("Note", "a");
	f.add_tag_value("Note", "b");
	f.add_tag_value("color", "red");
	EXPECT_TRUE(f.has_tag("Note"));
	EXPECT_EQ(f.tag_values("Note"), (attr_values_t{ "a", "b" }));
	EXPECT_EQ(f.tag_value("color"), "red");
	EXPECT_TRUE(f.tag_values("missing").empty());
	EXPECT_EQ(f.tag_value("missing"), "");

	f.set_tag_value("Note", "c");
	EXPECT_EQ(f.tag_values("Note"), (attr_values_t{ "c" }));
	EXPECT_TRUE(f.remove_tag("color"));
	EXPECT_FALSE(f.remove_tag("color"));
	EXPECT_FALSE(f.has_tag("color"));
}

TEST(FeatureTest, NameFallsBackToId)
{
	feature_t f;
	f.primary_id = "tx1";
	EXPECT_EQ(f.name(), "tx1");
	f.display_name = "Transcript One";
	EXPECT_EQ(f.name(), "Transcript One");
}

TEST(FeatureTest, ChildrenHaveParent)
{
	auto root  = make_feature("tx", 1, 100);
	auto child = root->add_child(make_feature("tx.exon1", 1, 10));
	EXPECT_EQ(child->parent, root.get());
	EXPECT_TRUE(root->is_ancestor_of(child));
	EXPECT_FALSE(child->is_ancestor_of(root.get()));
	EXPECT_EQ(root->count_nodes(), 2u);

	auto removed = root->remove_child(child);
	EXPECT_EQ(removed->parent, nullptr);
	EXPECT_TRUE(root->children.empty());
	EXPECT_THROW(root->remove_child(removed.get()), key_error);
}

TEST(FeatureTest, SortChildrenForwardStrand)
{
	auto root = make_feature("tx", 1, 100);
	root->add_child(make_feature("c", 50, 60));
	root->add_child(make_feature("b", 10, 20));
	root->add_child(make_feature("a", 10, 40));
	root->sort_children();
	EXPECT_EQ(root->children[0]->primary_id, "a");  // longer first on ties
	EXPECT_EQ(root->children[1]->primary_id, "b");
	EXPECT_EQ(root->children[2]->primary_id, "c");
}

TEST(FeatureTest, SortChildrenReverseStrand)
{
	auto root = make_feature("tx", 1, 100, neg_strand);
	root->add_child(make_feature("a", 10, 20, neg_strand));
	root->add_child(make_feature("c", 50, 60, neg_strand));
	root->add_child(make_feature("b", 55, 60, neg_strand));
	root->sort_children();
	EXPECT_EQ(root->children[0]->primary_id, "c");
	EXPECT_EQ(root->children[1]->primary_id, "b");
	EXPECT_EQ(root->children[2]->primary_id, "a");
}

TEST(FeatureTest, RenameCarriesDerivedIds)
{
	auto root = make_feature("tx", 1, 100);
	root->add_child(make_feature("tx.exon1", 1, 10));
	root->add_child(make_feature("other", 20, 30));
	root->rename("tx.1");
	EXPECT_EQ(root->primary_id, "tx.1");
	EXPECT_EQ(root->children[0]->primary_id, "tx.1.exon1");
	EXPECT_EQ(root->children[1]->primary_id, "other");
}

TEST(FeatureTest, GrowToCover)
{
	auto a = make_feature("a", 10, 20);
	auto b = make_feature("b", 5, 15);
	a->grow_to_cover(*b);
	EXPECT_EQ(a->start, 5);
	EXPECT_EQ(a->end, 20);
	EXPECT_EQ(a->length(), 16);
	EXPECT_TRUE(a->overlaps(*b));
}

TEST(FeatureTest, CloneIsDeep)
{
	auto root   = make_feature("tx", 1, 100);
	root->score = 3.5;
	root->add_tag_value("k", "v");
	root->add_child(make_feature("tx.exon1", 1, 10));

	auto copy = root->clone();
	EXPECT_EQ(copy->primary_id, "tx");
	EXPECT_EQ(copy->score, 3.5);
	EXPECT_EQ(copy->tag_value("k"), "v");
	ASSERT_EQ(copy->children.size(), 1u);
	EXPECT_NE(copy->children[0].get(), root->children[0].get());
	EXPECT_EQ(copy->children[0]->parent, copy.get());
	EXPECT_EQ(copy->parent, nullptr);
}

TEST(FeatureTest, FactorySubclassSurvivesClone)
{
	scored_factory factory;
	auto f = factory.make();
	ASSERT_NE(dynamic_cast<scored_feature*>(f.get()), nullptr);
	static_cast<scored_feature&>(*f).rank = 7;

	auto copy = f->clone();
	auto sf   = dynamic_cast<scored_feature*>(copy.get());
	ASSERT_NE(sf, nullptr);
	EXPECT_EQ(sf->rank, 7);
}

TEST(FeatureTest, AsStr)
{
	auto f = make_feature("tx", 1, 100, neg_strand);
	EXPECT_EQ(f->as_str(), "exon:tx chr1:1-100(-)");
}
