/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "parser.h"
#include "bed_decoder.h"
#include "fk_assert.h"
#include "gff_decoder.h"
#include "ucsc_decoder.h"
#include <algorithm>

BEGIN_NAMESPACE_FK

const char* as_str(parser_state state)
{
	switch (state) {
	case parser_state::unopened:      return "unopened";
	case parser_state::open:          return "open";
	case parser_state::streaming:     return "streaming";
	case parser_state::materializing: return "materializing";
	case parser_state::exhausted:     return "exhausted";
	}
	FK_UNREACHABLE();
}

parser_t::parser_t(parser_options options)
: _opts(std::move(options))
, _factory(_opts.factory ? _opts.factory : default_feature_factory())
, _flags{ _opts.do_exon, _opts.do_cds, _opts.do_utr, _opts.do_codon }
{
}

parser_t::parser_t(const string& path, parser_options options)
: parser_t(std::move(options))
{
	open(path);
}

void parser_t::open(const string& path)
{
	if (!_file.empty()) {
		FK_CHECK(path == _file, invalid_mode_transition, "Cannot open {} on a parser already reading {}; use a new parser",
				 path, _file);
		return;
	}
	if (!_format)
		_format = _opts.format ? *_opts.format : taste_file(path);
	_file   = path;
	_source = _opts.source ? *_opts.source : base_name(path);
	if (_format->flavor == flavor_t::ucsc)
		_tables = std::make_unique<ucsc_tables>(_opts.ucsc);
	_lr    = std::make_unique<zline_reader>(path);
	_state = parser_state::open;
}

/////////////////////////////////////////////////////////////////

void parser_t::begin(mode_t mode)
{
	FK_CHECK(_state != parser_state::unopened, invalid_mode_transition, "No annotation file is open");
	if (_mode == mode)
		return;
	FK_CHECK(_mode == mode_t::none, invalid_mode_transition,
			 "Cannot {} {}: the parser is already {}", mode == mode_t::streaming ? "stream features from" : "materialize",
			 _file, mode == mode_t::streaming ? "materializing" : "streaming");

	_mode  = mode;
	_state = mode == mode_t::streaming ? parser_state::streaming : parser_state::materializing;
	if (_format->flavor == flavor_t::gff) {
		parent_synthesizer synth;
		if (_format->filetype == filetype_t::gtf) {
			synth = [factory = _factory, do_gene = _opts.do_gene](const feature_t& child, const string& parent_id, string& grandparent) {
				return synthesize_gtf_parent(child, parent_id, grandparent, *factory, do_gene);
			};
		}
		_linker = std::make_unique<id_linker>(mode == mode_t::streaming, std::move(synth));
	}
	if (_opts.verbose)
		print("  Parsing {} format file {}...\n", as_str(_format->filetype), _file);
}

void parser_t::finish()
{
	_lr.reset();
	_input_done = true;
	_state      = parser_state::exhausted;
	if (_opts.verbose) {
		if (_mode == mode_t::materializing)
			print("  Loaded {} top-level features, {} features in total\n", roots().size(), number_loaded());
		if (orphan_count() > 0)
			print("  Dropped {} features whose parent was never found\n", orphan_count());
	}
}

// Leaves the reader on the next data line, recording comments on the way.
// For GFF a "###" directive also stops the search.
bool parser_t::seek_data_line()
{
	if (_input_done || !_lr)
		return false;
	const bool gff = _format->flavor == flavor_t::gff;
	for (; !_lr->done(); ++*_lr) {
		auto line = _lr->line();
		if (gff && line == "###")
			return true;
		if (gff && startswith(line, "##FASTA")) {
			_comments.emplace_back(line);
			return false;
		}
		if (is_comment_line(line)) {
			if (!strip(line).empty())
				_comments.emplace_back(line);
			continue;
		}
		return true;
	}
	return false;
}

feature_cluster parser_t::decode(string_view line)
{
	const decode_context ctx{ _format->filetype, _flags, *_factory, _source, _opts.source.has_value(), _opts.do_gene };
	feature_cluster rec;
	try {
		switch (_format->flavor) {
		case flavor_t::bed:  rec = decode_bed(line, ctx); break;
		case flavor_t::ucsc: rec = decode_ucsc(line, ctx, *_tables); break;
		case flavor_t::gff:  rec = decode_gff(line, ctx, _opts.simplify); break;
		}
	}
	FK_RETHROW("In {} file: {}:{}", as_str(_format->filetype), _file, _lr->line_num());

	if (_opts.verbose && _mode == mode_t::materializing && _lr->line_num() % 8000 == 1)
		print("  {} lines, {} top-level features...\r", _lr->line_num(), roots().size());
	return rec;
}

void parser_t::account(const feature_t& root)
{
	root.visit([&](const feature_t& f) {
		auto [it, inserted] = _seq_lengths.try_emplace(f.seq_id, f.end);
		if (inserted)
			_seq_order.push_back(f.seq_id);
		else
			it->second = std::max(it->second, f.end);
		if (_type_set.insert(f.primary_tag).second)
			_types.push_back(f.primary_tag);
	});
}

/////////////////////////////////////////////////////////////////
// streaming
/////////////////////////////////////////////////////////////////

feature_ptr parser_t::next_feature()
{
	begin(mode_t::streaming);
	if (_state == parser_state::exhausted)
		return nullptr;

	feature_ptr f;
	switch (_format->flavor) {
	case flavor_t::bed:  f = next_bed(); break;
	case flavor_t::ucsc: f = next_ucsc(); break;
	case flavor_t::gff:  f = next_gff(); break;
	}
	if (f) {
		account(*f);
		return f;
	}
	finish();
	return nullptr;
}

feature_ptr parser_t::next_bed()
{
	if (!seek_data_line())
		return nullptr;
	auto rec = decode(_lr->line());
	++*_lr;
	return std::move(rec.feature);
}

feature_ptr parser_t::make_gene(feature_cluster& rec) const
{
	const feature_t& tran = *rec.feature;
	auto gene          = _factory->make();
	// Without a gene name the transcript name stands in; keep the transcript's id
	gene->primary_id   = rec.gene_name == tran.primary_id ? rec.gene_name + ".gene" : rec.gene_name;
	gene->display_name = rec.gene_name;
	gene->seq_id       = tran.seq_id;
	gene->start        = tran.start;
	gene->end          = tran.end;
	gene->strand       = tran.strand;
	gene->primary_tag  = "gene";
	gene->source_tag   = tran.source_tag;
	gene->add_child(std::move(rec.feature));
	return gene;
}

// Consecutive transcripts of one gene are returned together.
feature_ptr parser_t::next_ucsc()
{
	while (seek_data_line()) {
		auto rec = decode(_lr->line());
		++*_lr;
		if (!_opts.do_gene)
			return std::move(rec.feature);

		feature_t* gene = _open_gene.get();
		if (gene && gene->display_name == rec.gene_name && gene->strand == rec.feature->strand
			&& gene->overlaps(*rec.feature)) {
			gene->grow_to_cover(*rec.feature);
			gene->add_child(std::move(rec.feature));
			continue;
		}
		feature_ptr done = std::move(_open_gene);
		_open_gene       = make_gene(rec);
		if (done) {
			done->sort_children();
			return done;
		}
	}
	if (_open_gene)
		_open_gene->sort_children();
	return std::move(_open_gene);
}

feature_ptr parser_t::next_gff()
{
	for (;;) {
		if (auto f = _linker->pop_finished())
			return f;
		if (_input_done)
			return nullptr;
		if (!seek_data_line()) {
			_linker->reconcile();
			_input_done = true;
			continue;
		}
		if (_lr->line() == "###") {
			++*_lr;
			_linker->reconcile();
			continue;
		}
		feed_gff(decode(_lr->line()));
		++*_lr;
	}
}

// Called while the reader is still on the record's line.
void parser_t::feed_gff(feature_cluster rec)
{
	const string& type = rec.feature->primary_tag;
	if (!keep_gff_type(type, _flags, _opts.do_gene)) {
		// children of a skipped gene are promoted to the top level
		if (is_gene_type(type))
			_linker->skip(rec.feature->primary_id);
		return;
	}
	try {
		_linker->add(std::move(rec));
	}
	FK_RETHROW("In {} file: {}:{}", as_str(_format->filetype), _file, _lr->line_num());
}

/////////////////////////////////////////////////////////////////
// materializing
/////////////////////////////////////////////////////////////////

void parser_t::parse_file()
{
	begin(mode_t::materializing);
	if (_state == parser_state::exhausted)
		return;

	switch (_format->flavor) {
	case flavor_t::bed:  parse_bed(); break;
	case flavor_t::ucsc: parse_ucsc(); break;
	case flavor_t::gff:  parse_gff(); break;
	}
	for (auto& root : roots())
		account(*root);
	finish();
}

void parser_t::parse_bed()
{
	while (seek_data_line()) {
		auto rec = decode(_lr->line());
		++*_lr;
		_top.push_back(std::move(rec.feature));
	}
	for (auto& root : _top)
		_loaded.add_tree_unique(*root);
}

void parser_t::parse_ucsc()
{
	// Transcripts of one gene name on one chromosome and strand join the
	// first gene they overlap.
	string_map<string, vector<feature_t*>> genes;
	while (seek_data_line()) {
		auto rec = decode(_lr->line());
		++*_lr;
		if (!_opts.do_gene) {
			_top.push_back(std::move(rec.feature));
			continue;
		}
		auto& candidates = genes[fk::format("{}\t{}\t{}", rec.gene_name, rec.feature->seq_id, strand_as_char(rec.feature->strand))];
		auto  it = std::find_if(candidates.begin(), candidates.end(), [&](feature_t* g) { return g->overlaps(*rec.feature); });
		if (it != candidates.end()) {
			(*it)->grow_to_cover(*rec.feature);
			(*it)->add_child(std::move(rec.feature));
		} else {
			_top.push_back(make_gene(rec));
			candidates.push_back(_top.back().get());
		}
	}
	for (auto& root : _top) {
		root->sort_children();
		_loaded.add_tree_unique(*root);
	}
}

void parser_t::parse_gff()
{
	while (seek_data_line()) {
		if (_lr->line() == "###") {
			++*_lr;
			_linker->reconcile();
			continue;
		}
		feed_gff(decode(_lr->line()));
		++*_lr;
	}
	_linker->reconcile();
}

const feature_list& parser_t::top_features()
{
	parse_file();
	return roots();
}

const feature_t* parser_t::next_top_feature()
{
	auto& top = top_features();
	if (_top_index >= top.size()) {
		_top_index = 0;
		return nullptr;
	}
	return top[_top_index++].get();
}

const feature_t* parser_t::fetch(string_view id)
{
	parse_file();
	return _linker ? _linker->loaded().find(id) : _loaded.find(id);
}

size_t parser_t::number_loaded() const
{
	return _linker ? _linker->loaded().size() : _loaded.size();
}

string parser_t::typelist() const
{
	switch (filetype()) {
	case filetype_t::bed12:      return "mRNA,ncRNA,exon,CDS";
	case filetype_t::narrowPeak:
	case filetype_t::broadPeak:  return "peak";
	case filetype_t::gappedPeak: return "gappedPeak,peak";
	default: break;
	}
	if (format().flavor == flavor_t::bed)
		return "region";
	string out;
	for (auto& t : _types) {
		if (!out.empty())
			out += ',';
		out += t;
	}
	return out;
}

END_NAMESPACE_FK
