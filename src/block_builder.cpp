/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "block_builder.h"
#include "fk_assert.h"
#include <algorithm>

BEGIN_NAMESPACE_FK

namespace {

// Removes n bases from the 5' end of blocks held in transcription order.
blocks_t take_5p(blocks_t& blocks, pos_t n, strand_t strand)
{
	blocks_t out;
	while (n > 0 && !blocks.empty()) {
		block_t& b = blocks.front();
		pos_t    k = std::min(n, b.size());
		if (strand == neg_strand) {
			out.push_back({ b.end - k, b.end });
			b.end -= k;
		} else {
			out.push_back({ b.start, b.start + k });
			b.start += k;
		}
		if (b.empty())
			blocks.erase(blocks.begin());
		n -= k;
	}
	return out;
}

// Removes n bases from the 3' end of blocks held in transcription order.
blocks_t take_3p(blocks_t& blocks, pos_t n, strand_t strand)
{
	blocks_t out;
	while (n > 0 && !blocks.empty()) {
		block_t& b = blocks.back();
		pos_t    k = std::min(n, b.size());
		if (strand == neg_strand) {
			out.push_back({ b.start, b.start + k });
			b.start += k;
		} else {
			out.push_back({ b.end - k, b.end });
			b.end -= k;
		}
		if (b.empty())
			blocks.pop_back();
		n -= k;
	}
	std::reverse(out.begin(), out.end());
	return out;
}

// Number of bases to skip from the 5' end of piece to reach the first
// complete codon, measured against the spliced CDS.
int phase_of(const blocks_t& cds, const block_t& piece, strand_t strand)
{
	pos_t offset = 0;
	for (auto& b : cds) {
		if (b.overlaps(piece)) {
			offset += strand == neg_strand ? b.end - piece.end : piece.start - b.start;
			break;
		}
		offset += b.size();
	}
	return (3 - offset % 3) % 3;
}

struct child_maker {
	const transcript_blocks& tx;
	const feature_factory&   factory;
	const string&            source;
	feature_t&               root;

	feature_t* add(const block_t& b, const char* tag, string id) const
	{
		auto f         = factory.make();
		f->primary_id  = std::move(id);
		f->seq_id      = tx.seq_id;
		f->start       = b.start + 1;
		f->end         = b.end;
		f->strand      = tx.strand;
		f->primary_tag = tag;
		f->source_tag  = source;
		return root.add_child(std::move(f));
	}

	void add_pieces(const blocks_t& pieces, const char* tag) const
	{
		for (size_t i = 0; i < pieces.size(); ++i)
			add(pieces[i], tag, i == 0 ? fk::format("{}.{}", tx.name, tag) : fk::format("{}.{}.{}", tx.name, tag, i + 1));
	}
};

}  // namespace

feature_ptr build_transcript(const transcript_blocks& tx,
							 const build_flags& flags,
							 const feature_factory& factory,
							 const string& source,
							 std::string_view noncoding_tag)
{
	FK_CHECK(!tx.exons.empty(), value, "Transcript {} has no exons", tx.name);
	FK_CHECK(tx.tx_start < tx.tx_end, value, "Transcript {} has start {} not before end {}", tx.name, tx.tx_start, tx.tx_end);
	FK_CHECK(tx.cds_start <= tx.cds_end, value, "Transcript {} has CDS start {} after CDS end {}", tx.name, tx.cds_start, tx.cds_end);
	const bool coding = tx.cds_start < tx.cds_end;
	if (coding)
		FK_CHECK(tx.cds_start >= tx.tx_start && tx.cds_end <= tx.tx_end, value,
				 "Transcript {} has CDS [{},{}) outside of [{},{})", tx.name, tx.cds_start, tx.cds_end, tx.tx_start, tx.tx_end);

	// Some sources list exons out of order
	blocks_t exons = tx.exons;
	std::sort(exons.begin(), exons.end());
	for (size_t i = 0; i < exons.size(); ++i) {
		FK_CHECK(!exons[i].empty(), value, "Transcript {} has empty exon {}", tx.name, exons[i].as_str());
		if (i > 0)
			FK_CHECK(!exons[i - 1].overlaps(exons[i]), value, "Transcript {} has overlapping exons {} and {}",
					 tx.name, exons[i - 1].as_str(), exons[i].as_str());
	}
	const bool reverse = tx.strand == neg_strand;
	if (reverse)
		std::reverse(exons.begin(), exons.end());  // transcription order from here on

	auto root          = factory.make();
	root->primary_id   = tx.name;
	root->display_name = tx.name;
	root->seq_id       = tx.seq_id;
	root->start        = tx.tx_start + 1;
	root->end          = tx.tx_end;
	root->strand       = tx.strand;
	root->primary_tag  = coding ? string("mRNA") : string(noncoding_tag);
	root->source_tag   = source;

	const child_maker make{ tx, factory, source, *root };
	if (flags.do_exon)
		for (size_t i = 0; i < exons.size(); ++i)
			make.add(exons[i], "exon", fk::format("{}.exon{}", tx.name, i + 1));

	if (coding) {
		const block_t cds{ tx.cds_start, tx.cds_end };
		blocks_t utr5, cdss, utr3;
		for (auto& e : exons) {
			block_t lo{ e.start, std::min(e.end, cds.start) };
			block_t hi{ std::max(e.start, cds.end), e.end };
			block_t mid = e.intersect(cds);
			const block_t& head = reverse ? hi : lo;
			const block_t& tail = reverse ? lo : hi;
			if (!head.empty())
				utr5.push_back(head);
			if (!mid.empty())
				cdss.push_back(mid);
			if (!tail.empty())
				utr3.push_back(tail);
		}

		const blocks_t full_cds = cdss;
		blocks_t start_codon, stop_codon;
		if (flags.do_codon && total_size(cdss) >= 6) {
			start_codon = take_5p(cdss, 3, tx.strand);
			stop_codon  = take_3p(cdss, 3, tx.strand);
		}

		if (flags.do_utr) {
			int n = 0;
			for (auto& b : utr5)
				make.add(b, "five_prime_UTR", fk::format("{}.utr{}", tx.name, ++n));
			for (auto& b : utr3)
				make.add(b, "three_prime_UTR", fk::format("{}.utr{}", tx.name, ++n));
		}
		if (flags.do_cds) {
			int n = 0;
			for (auto& b : cdss)
				make.add(b, "CDS", fk::format("{}.cds{}", tx.name, ++n))->phase = phase_of(full_cds, b, tx.strand);
		}
		if (flags.do_codon) {
			make.add_pieces(start_codon, "start_codon");
			make.add_pieces(stop_codon, "stop_codon");
		}
	}

	root->sort_children();
	return root;
}

END_NAMESPACE_FK
