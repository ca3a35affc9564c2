/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __FEATURE_KIT_PARSER_H__
#define __FEATURE_KIT_PARSER_H__

#include "feature.h"
#include "file.h"
#include "filetype.h"
#include "id_linker.h"
#include "strutil.h"
#include "ucsc_tables.h"
#include "util.h"
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

BEGIN_NAMESPACE_FK

struct parser_options {
	bool do_gene{true};   // assemble genes (UCSC, GFF); ignored for BED
	bool do_exon{};
	bool do_cds{};
	bool do_utr{};
	bool do_codon{};
	bool simplify{};      // GFF: keep only identifying attributes
	std::optional<string> source;                     // source_tag override; default is the file's base name
	std::shared_ptr<const feature_factory> factory;   // null means plain feature_t
	std::optional<file_format> format;                // skip tasting
	ucsc_table_paths ucsc;                            // UCSC side tables
	bool verbose{verbose_from_env()};
};

enum class parser_state : uint8_t {
	unopened,
	open,
	streaming,
	materializing,
	exhausted
};

const char* as_str(parser_state state);

/////////////////////////////////////////////////////////////////
// parser_t
/////////////////////////////////////////////////////////////////

// Reads one annotation file into feature trees.
//
// A session is used in exactly one of two ways. Streaming: next_feature()
// hands out one complete top-level tree per call and keeps nothing.
// Materializing: parse_file() (or top_features(), fetch(), ...) reads
// everything, resolves forward references and keeps the trees. Mixing the
// two throws invalid_mode_transition_error.
class parser_t {
public:
	explicit parser_t(parser_options options = {});
	explicit parser_t(const string& path, parser_options options = {});
	NOCOPY(parser_t)

	void open(const string& path);

	// Streaming
	feature_ptr next_feature();   // null once the input is exhausted

	// Materializing
	void                parse_file();
	const feature_list& top_features();
	const feature_t*    next_top_feature();   // null after the last one, then starts over
	const feature_t*    fetch(string_view id);

	INLINE parser_state      state() const { return _state; }
	INLINE const string&     file() const { return _file; }
	INLINE const file_format& format() const { FK_CHECK(_format, invalid_mode_transition, "No file is open"); return *_format; }
	INLINE filetype_t        filetype() const { return format().filetype; }
	INLINE const vector<string>& comments() const { return _comments; }
	INLINE const string_map<string, pos_t>& seq_id_lengths() const { return _seq_lengths; }
	INLINE const vector<string>& seq_ids() const { return _seq_order; }  // in order of first appearance
	INLINE size_t            orphan_count() const { return _linker ? _linker->orphan_count() : 0; }
	size_t                   number_loaded() const;
	string                   typelist() const;

private:
	enum class mode_t : uint8_t { none, streaming, materializing };

	void begin(mode_t mode);
	void finish();
	bool seek_data_line();
	feature_cluster decode(string_view line);
	void account(const feature_t& root);

	feature_ptr next_bed();
	feature_ptr next_ucsc();
	feature_ptr next_gff();
	void        parse_bed();
	void        parse_ucsc();
	void        parse_gff();
	void        feed_gff(feature_cluster rec);
	feature_ptr make_gene(feature_cluster& rec) const;

	INLINE feature_list& roots() { return _linker ? _linker->roots() : _top; }

	parser_options                 _opts;
	std::shared_ptr<const feature_factory> _factory;
	build_flags                    _flags;
	string                         _file;
	string                         _source;
	std::optional<file_format>     _format;
	parser_state                   _state{parser_state::unopened};
	mode_t                         _mode{mode_t::none};
	std::unique_ptr<zline_reader>  _lr;
	bool                           _input_done{};
	std::unique_ptr<ucsc_tables>   _tables;
	std::unique_ptr<id_linker>     _linker;      // GFF only
	feature_ptr                    _open_gene;   // UCSC streaming: gene still collecting transcripts
	feature_list                   _top;         // BED / UCSC
	id_registry                    _loaded;      // BED / UCSC
	size_t                         _top_index{};
	vector<string>                 _comments;
	string_map<string, pos_t>      _seq_lengths;
	vector<string>                 _seq_order;
	vector<string>                 _types;       // primary tags in order of first appearance
	string_set<string>             _type_set;
};

END_NAMESPACE_FK

#endif // __FEATURE_KIT_PARSER_H__
