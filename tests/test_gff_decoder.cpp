/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include <gtest/gtest.h>

#include "fk_assert.h"
#include "gff_decoder.h"

using namespace fk;

namespace {

class GffDecoderTest : public ::testing::Test {
protected:
	feature_cluster decode(std::string_view line, filetype_t ft = filetype_t::gff3, bool simplify = false)
	{
		decode_context ctx{ ft, {}, *factory, source, override_source, do_gene };
		return decode_gff(line, ctx, simplify);
	}

	std::shared_ptr<const feature_factory> factory = default_feature_factory();
	string source = "genes.gff3";
	bool override_source = false;
	bool do_gene = true;
};

}  // namespace

TEST_F(GffDecoderTest, Gff3Record)
{
	auto c = decode("chr1\tHAVANA\tmRNA\t100\t500\t12.5\t-\t.\tID=tx1;Parent=gene1;Name=Forward%3BRef;Note=a,b");
	auto& f = *c.feature;
	EXPECT_EQ(f.primary_id, "tx1");
	EXPECT_EQ(f.display_name, "Forward;Ref");
	EXPECT_EQ(f.seq_id, "chr1");
	EXPECT_EQ(f.source_tag, "HAVANA");
	EXPECT_EQ(f.primary_tag, "mRNA");
	EXPECT_EQ(f.start, 100);
	EXPECT_EQ(f.end, 500);
	EXPECT_EQ(f.score, 12.5);
	EXPECT_EQ(f.strand, neg_strand);
	EXPECT_FALSE(f.phase.has_value());
	EXPECT_EQ(c.parents, (vector<string>{ "gene1" }));
	EXPECT_FALSE(f.has_tag("ID"));
	EXPECT_FALSE(f.has_tag("Parent"));
	EXPECT_EQ(f.tag_values("Note"), (attr_values_t{ "a", "b" }));
	EXPECT_FALSE(c.synthetic_id);
}

TEST_F(GffDecoderTest, MultipleParents)
{
	auto c = decode("chr1\t.\texon\t100\t200\t.\t+\t.\tID=e1;Parent=tx1,tx2");
	EXPECT_EQ(c.parents, (vector<string>{ "tx1", "tx2" }));
	EXPECT_EQ(c.feature->source_tag, "genes.gff3");  // "." falls back to the default
}

TEST_F(GffDecoderTest, TrailingCommaAddsNoValue)
{
	auto c = decode("chr1\t.\texon\t100\t200\t.\t+\t.\tID=e1;Parent=tx1,;");
	EXPECT_EQ(c.parents, (vector<string>{ "tx1" }));
}

TEST_F(GffDecoderTest, SyntheticId)
{
	auto c = decode("chr2\tsrc\tCDS\t10\t40\t.\t+\t2\tParent=tx1");
	EXPECT_TRUE(c.synthetic_id);
	EXPECT_EQ(c.feature->primary_id, "chr2:10-40");
	EXPECT_EQ(c.feature->phase, 2);
}

TEST_F(GffDecoderTest, EmptyAttributes)
{
	auto c = decode("chr1\tsrc\tregion\t1\t10\t.\t.\t.\t");
	EXPECT_TRUE(c.feature->attributes.empty());
	EXPECT_EQ(c.feature->strand, unknown_strand);
	c = decode("chr1\tsrc\tregion\t1\t10\t.\t?\t.\t.");
	EXPECT_TRUE(c.synthetic_id);
}

TEST_F(GffDecoderTest, OverrideSource)
{
	override_source = true;
	source          = "mine";
	auto c = decode("chr1\tHAVANA\tgene\t1\t10\t.\t+\t.\tID=g");
	EXPECT_EQ(c.feature->source_tag, "mine");
}

TEST_F(GffDecoderTest, Simplify)
{
	auto c = decode("chr1\tsrc\tgene\t1\t10\t.\t+\t.\tID=g;Note=x;Dbxref=y", filetype_t::gff3, true);
	EXPECT_EQ(c.feature->primary_id, "g");
	EXPECT_TRUE(c.feature->attributes.empty());
}

TEST_F(GffDecoderTest, GtfRecords)
{
	auto exon = decode("chr1\tsrc\texon\t100\t200\t.\t+\t.\tgene_id \"g1\"; transcript_id \"t1\"; note \"a;b\"; level 2;",
					   filetype_t::gtf);
	EXPECT_EQ(exon.parents, (vector<string>{ "t1" }));
	EXPECT_TRUE(exon.synthetic_id);
	EXPECT_EQ(exon.feature->tag_value("note"), "a;b");
	EXPECT_EQ(exon.feature->tag_value("level"), "2");

	auto tx = decode("chr1\tsrc\ttranscript\t100\t500\t.\t+\t.\tgene_id \"g1\"; transcript_id \"t1\"; transcript_name \"T1\";",
					 filetype_t::gtf);
	EXPECT_EQ(tx.feature->primary_id, "t1");
	EXPECT_EQ(tx.feature->display_name, "T1");
	EXPECT_EQ(tx.parents, (vector<string>{ "g1" }));

	auto gene = decode("chr1\tsrc\tgene\t100\t500\t.\t+\t.\tgene_id \"g1\"; gene_name \"G1\";", filetype_t::gtf);
	EXPECT_EQ(gene.feature->primary_id, "g1");
	EXPECT_EQ(gene.feature->display_name, "G1");
	EXPECT_TRUE(gene.parents.empty());
}

TEST_F(GffDecoderTest, GtfWithoutGenes)
{
	do_gene = false;
	auto tx = decode("chr1\tsrc\ttranscript\t100\t500\t.\t+\t.\tgene_id \"g1\"; transcript_id \"t1\";", filetype_t::gtf);
	EXPECT_TRUE(tx.parents.empty());
}

TEST_F(GffDecoderTest, GtfRepeatedKeysAndSimplify)
{
	feature_t f;
	parse_gtf_attributes("gene_id \"g1\"; tag \"basic\"; tag \"CCDS\";", f);
	EXPECT_EQ(f.tag_values("tag"), (attr_values_t{ "basic", "CCDS" }));

	auto c = decode("chr1\tsrc\texon\t1\t10\t.\t+\t.\tgene_id \"g1\"; transcript_id \"t1\"; tag \"basic\";",
					filetype_t::gtf, true);
	ASSERT_EQ(c.feature->attributes.size(), 2u);
	EXPECT_FALSE(c.feature->has_tag("tag"));
}

TEST_F(GffDecoderTest, SynthesizeParents)
{
	auto exon = decode("chr1\tsrc\texon\t100\t200\t.\t+\t.\tgene_id \"g1\"; transcript_id \"t1\"; gene_name \"G1\";",
					   filetype_t::gtf);
	string grandparent;
	auto tx = synthesize_gtf_parent(*exon.feature, "t1", grandparent, *factory, true);
	ASSERT_TRUE(tx);
	EXPECT_EQ(tx->primary_tag, "transcript");
	EXPECT_EQ(tx->start, 100);
	EXPECT_EQ(tx->end, 200);
	EXPECT_EQ(grandparent, "g1");

	grandparent.clear();
	auto gene = synthesize_gtf_parent(*tx, "g1", grandparent, *factory, true);
	ASSERT_TRUE(gene);
	EXPECT_EQ(gene->primary_tag, "gene");
	EXPECT_EQ(gene->display_name, "G1");
	EXPECT_TRUE(grandparent.empty());

	EXPECT_FALSE(synthesize_gtf_parent(*exon.feature, "unrelated", grandparent, *factory, true));
}

TEST_F(GffDecoderTest, TypeFilter)
{
	build_flags none{};
	EXPECT_TRUE(keep_gff_type("mRNA", none, true));
	EXPECT_TRUE(keep_gff_type("gene", none, true));
	EXPECT_FALSE(keep_gff_type("gene", none, false));
	EXPECT_FALSE(keep_gff_type("exon", none, true));
	EXPECT_TRUE(keep_gff_type("exon", { true, false, false, false }, true));
	EXPECT_FALSE(keep_gff_type("five_prime_UTR", none, true));
	EXPECT_FALSE(keep_gff_type("stop_codon", none, true));
	EXPECT_TRUE(keep_gff_type("enhancer", none, true));
	EXPECT_TRUE(is_transcript_type("lnc_RNA"));
	EXPECT_TRUE(is_gene_type("pseudogene"));
}

TEST_F(GffDecoderTest, MalformedLines)
{
	EXPECT_THROW(decode("chr1\tsrc\tgene\t1\t10\t.\t+\t."), malformed_line_error);
	EXPECT_THROW(decode("chr1\tsrc\tgene\t10\t1\t.\t+\t.\tID=g"), malformed_line_error);
	EXPECT_THROW(decode("chr1\tsrc\tgene\t0\t10\t.\t+\t.\tID=g"), malformed_line_error);
	EXPECT_THROW(decode("chr1\tsrc\tCDS\t1\t10\t.\t+\t3\tID=g"), malformed_line_error);
	EXPECT_THROW(decode("chr1\tsrc\tgene\t1\t10\t.\t+\t.\tID"), malformed_line_error);
	EXPECT_THROW(decode("chr1\tsrc\tgene\tone\t10\t.\t+\t.\tID=g"), value_error);
	EXPECT_THROW(decode("chr1\tsrc\tgene\t1\t10\t.\tx\t.\tID=g"), value_error);
	EXPECT_THROW(decode("chr1\tsrc\texon\t1\t10\t.\t+\t.\tgene_id \"g1", filetype_t::gtf), malformed_line_error);
}
