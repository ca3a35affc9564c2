/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include <gtest/gtest.h>

#include "fk_assert.h"
#include "gff_decoder.h"
#include "id_linker.h"

using namespace fk;

namespace {

feature_cluster record(const string& id, const string& tag, pos_t start, pos_t end, vector<string> parents = {},
					   const string& seq_id = "chr1")
{
	feature_cluster rec;
	rec.feature              = std::make_unique<feature_t>();
	rec.feature->primary_id  = id;
	rec.feature->primary_tag = tag;
	rec.feature->seq_id      = seq_id;
	rec.feature->start       = start;
	rec.feature->end         = end;
	rec.feature->strand      = pos_strand;
	rec.parents              = std::move(parents);
	return rec;
}

// A GTF exon record, which names its transcript and gene but nothing declares them.
feature_cluster gtf_exon(const string& gene_id, const string& tran_id, pos_t start, pos_t end)
{
	auto rec = record(fk::format("chr1:{}-{}", start, end), "exon", start, end, { tran_id });
	rec.feature->add_tag_value("gene_id", gene_id);
	rec.feature->add_tag_value("transcript_id", tran_id);
	rec.synthetic_id = true;
	return rec;
}

parent_synthesizer gtf_synthesizer()
{
	return [](const feature_t& child, const string& parent_id, string& grandparent) {
		return synthesize_gtf_parent(child, parent_id, grandparent, *default_feature_factory(), true);
	};
}

}  // namespace

TEST(IdRegistryTest, AddUniqueRenames)
{
	feature_t a, b, c;
	a.primary_id = b.primary_id = c.primary_id = "x";
	id_registry ids;
	ids.add(a);
	EXPECT_THROW(ids.add(b), duplicate_identifier_error);
	ids.add_unique(b);
	ids.add_unique(c);
	EXPECT_EQ(b.primary_id, "x.1");
	EXPECT_EQ(c.primary_id, "x.2");
	EXPECT_EQ(ids.find("x.2"), &c);
	EXPECT_EQ(ids.size(), 3u);
	ids.remove("x.1");
	EXPECT_FALSE(ids.contains("x.1"));
}

TEST(IdLinkerTest, ParentsBeforeChildren)
{
	id_linker linker;
	linker.add(record("gene1", "gene", 1, 1000));
	linker.add(record("tx1", "mRNA", 1, 500, { "gene1" }));
	linker.add(record("exon1", "exon", 1, 100, { "tx1" }));
	linker.reconcile();

	ASSERT_EQ(linker.roots().size(), 1u);
	auto& gene = *linker.roots()[0];
	ASSERT_EQ(gene.children.size(), 1u);
	EXPECT_EQ(gene.children[0]->primary_id, "tx1");
	EXPECT_EQ(gene.children[0]->children[0]->parent, gene.children[0].get());
	EXPECT_EQ(linker.loaded().size(), 3u);
	EXPECT_EQ(linker.orphan_count(), 0u);
}

TEST(IdLinkerTest, ForwardReferences)
{
	id_linker linker;
	linker.add(record("exon1", "exon", 1, 100, { "tx2" }));
	linker.add(record("tx2", "mRNA", 1, 500, { "gene2" }));
	EXPECT_EQ(linker.pending_count(), 2u);
	linker.add(record("gene2", "gene", 1, 1000));
	linker.reconcile();

	EXPECT_EQ(linker.pending_count(), 0u);
	ASSERT_EQ(linker.roots().size(), 1u);
	EXPECT_EQ(linker.roots()[0]->count_nodes(), 3u);
	EXPECT_EQ(linker.orphan_count(), 0u);
}

TEST(IdLinkerTest, UnresolvedOrphansAreCounted)
{
	id_linker linker;
	linker.add(record("gene1", "gene", 1, 1000));
	linker.add(record("a", "mRNA", 1, 100, { "missing1" }));
	linker.add(record("b", "mRNA", 1, 100, { "missing2" }));
	linker.add(record("b.exon", "exon", 1, 50, { "b" }));
	linker.reconcile();

	EXPECT_EQ(linker.roots().size(), 1u);
	EXPECT_EQ(linker.orphan_count(), 2u);
	EXPECT_EQ(linker.loaded().size(), 1u);
	EXPECT_FALSE(linker.loaded().contains("b.exon"));
}

TEST(IdLinkerTest, DuplicateIdThrows)
{
	id_linker linker;
	linker.add(record("gene1", "gene", 1, 1000));
	EXPECT_THROW(linker.add(record("gene1", "gene", 2000, 3000, {}, "chr2")), duplicate_identifier_error);
	// same id, different type
	linker.add(record("cds1", "CDS", 1, 10, { "gene1" }));
	EXPECT_THROW(linker.add(record("cds1", "exon", 20, 30, { "gene1" })), duplicate_identifier_error);
}

TEST(IdLinkerTest, SplitFeatureGetsSuffixes)
{
	id_linker linker;
	linker.add(record("tx1", "mRNA", 1, 500));
	linker.add(record("cds1", "CDS", 10, 50, { "tx1" }));
	linker.add(record("cds1", "CDS", 100, 150, { "tx1" }));
	linker.add(record("cds1", "CDS", 200, 250, { "tx1" }));
	linker.reconcile();

	auto& tx = *linker.roots()[0];
	ASSERT_EQ(tx.children.size(), 3u);
	EXPECT_EQ(tx.children[0]->primary_id, "cds1");
	EXPECT_EQ(tx.children[1]->primary_id, "cds1.1");
	EXPECT_EQ(tx.children[2]->primary_id, "cds1.2");
}

TEST(IdLinkerTest, MultipleParentsCloneTheRecord)
{
	id_linker linker;
	linker.add(record("tx1", "mRNA", 1, 500));
	linker.add(record("tx2", "mRNA", 1, 600));
	linker.add(record("e1", "exon", 1, 100, { "tx1", "tx2" }));
	linker.reconcile();

	ASSERT_EQ(linker.roots().size(), 2u);
	EXPECT_EQ(linker.roots()[0]->children[0]->primary_id, "e1");
	EXPECT_EQ(linker.roots()[1]->children[0]->primary_id, "e1.2");
	EXPECT_TRUE(linker.loaded().contains("e1.2"));
}

TEST(IdLinkerTest, CyclesAreDropped)
{
	id_linker linker;
	linker.add(record("a", "mRNA", 1, 100, { "b" }));
	linker.add(record("b", "mRNA", 1, 100, { "a" }));
	linker.add(record("root", "gene", 1, 100));
	linker.reconcile();

	EXPECT_EQ(linker.roots().size(), 1u);
	EXPECT_GE(linker.orphan_count(), 1u);
	EXPECT_FALSE(linker.loaded().contains("a"));
	EXPECT_FALSE(linker.loaded().contains("b"));
}

TEST(IdLinkerTest, SelfParentIsDropped)
{
	id_linker linker;
	linker.add(record("a", "mRNA", 1, 100, { "a" }));
	linker.add(record("root", "gene", 1, 100));
	linker.reconcile();

	ASSERT_EQ(linker.roots().size(), 1u);
	EXPECT_EQ(linker.roots()[0]->primary_id, "root");
	EXPECT_EQ(linker.orphan_count(), 1u);
	EXPECT_FALSE(linker.loaded().contains("a"));
}

TEST(IdLinkerTest, SkippedParentPromotesChildren)
{
	id_linker linker;
	linker.skip("g1");
	linker.add(record("t1", "mRNA", 1, 100, { "g1" }));
	linker.add(record("t2", "mRNA", 200, 300, { "g2" }));  // queued before g2 is skipped
	linker.add(record("e2", "exon", 200, 250, { "t2" }));
	linker.skip("g2");
	linker.reconcile();

	ASSERT_EQ(linker.roots().size(), 2u);
	EXPECT_EQ(linker.roots()[0]->primary_id, "t1");
	EXPECT_EQ(linker.roots()[1]->primary_id, "t2");
	EXPECT_EQ(linker.roots()[1]->children.size(), 1u);
	EXPECT_EQ(linker.orphan_count(), 0u);
}

TEST(IdLinkerTest, ChildrenAreSorted)
{
	id_linker linker;
	linker.add(record("tx1", "mRNA", 1, 500));
	linker.add(record("e2", "exon", 300, 400, { "tx1" }));
	linker.add(record("e1", "exon", 1, 100, { "tx1" }));
	linker.reconcile();
	EXPECT_EQ(linker.roots()[0]->children[0]->primary_id, "e1");
}

TEST(IdLinkerTest, GtfParentsAreSynthesized)
{
	id_linker linker(false, gtf_synthesizer());
	linker.add(gtf_exon("g1", "t1", 100, 200));
	linker.add(gtf_exon("g1", "t1", 300, 400));
	linker.add(gtf_exon("g1", "t2", 150, 450));
	linker.add(gtf_exon("g2", "t3", 5000, 5100));
	linker.reconcile();

	ASSERT_EQ(linker.roots().size(), 2u);
	EXPECT_EQ(linker.orphan_count(), 0u);
	auto g1 = linker.loaded().find("g1");
	ASSERT_NE(g1, nullptr);
	EXPECT_EQ(g1->primary_tag, "gene");
	EXPECT_EQ(g1->parent, nullptr);
	EXPECT_EQ(g1->children.size(), 2u);
	EXPECT_EQ(g1->start, 100);
	EXPECT_EQ(g1->end, 450);

	auto t1 = linker.loaded().find("t1");
	ASSERT_NE(t1, nullptr);
	EXPECT_EQ(t1->primary_tag, "transcript");
	EXPECT_EQ(t1->start, 100);
	EXPECT_EQ(t1->end, 400);
	EXPECT_EQ(t1->children.size(), 2u);
}

TEST(IdLinkerTest, StreamingHandsOutClosedTrees)
{
	id_linker linker(true);
	linker.add(record("gene1", "gene", 1, 1000));
	linker.add(record("tx1", "mRNA", 1, 500, { "gene1" }));
	EXPECT_EQ(linker.pop_finished(), nullptr);

	linker.add(record("gene2", "gene", 2000, 3000));
	auto first = linker.pop_finished();
	ASSERT_TRUE(first);
	EXPECT_EQ(first->primary_id, "gene1");
	EXPECT_EQ(first->children.size(), 1u);
	EXPECT_FALSE(linker.loaded().contains("gene1"));

	// gene1 is closed, so a late child has nowhere to go
	linker.add(record("tx_late", "mRNA", 1, 200, { "gene1" }));
	EXPECT_EQ(linker.orphan_count(), 1u);

	linker.reconcile();
	auto second = linker.pop_finished();
	ASSERT_TRUE(second);
	EXPECT_EQ(second->primary_id, "gene2");
	EXPECT_EQ(linker.pop_finished(), nullptr);
}

TEST(IdLinkerTest, StreamingGtfSynthesizesAtOnce)
{
	id_linker linker(true, gtf_synthesizer());
	linker.add(gtf_exon("g1", "t1", 100, 200));
	linker.add(gtf_exon("g1", "t2", 150, 450));
	linker.add(gtf_exon("g2", "t3", 5000, 5100));
	linker.close_open();

	auto g1 = linker.pop_finished();
	auto g2 = linker.pop_finished();
	ASSERT_TRUE(g1 && g2);
	EXPECT_EQ(g1->primary_id, "g1");
	EXPECT_EQ(g1->children.size(), 2u);
	EXPECT_EQ(g1->end, 450);
	EXPECT_EQ(g2->primary_id, "g2");
	EXPECT_EQ(g2->count_nodes(), 3u);
	EXPECT_EQ(linker.orphan_count(), 0u);
}
