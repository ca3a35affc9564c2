/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __FEATURE_KIT_UCSC_TABLES_H__
#define __FEATURE_KIT_UCSC_TABLES_H__

#include "feature.h"
#include "strutil.h"
#include <string>
#include <vector>

BEGIN_NAMESPACE_FK

// Paths of optional UCSC side tables; empty means "not supplied".
struct ucsc_table_paths {
	string refseqstat;     // refSeqStatus:      mrnaAcc status mol
	string refseqsum;      // refSeqSummary:     mrnaAcc completeness summary
	string kgxref;         // kgXref:            kgID mRNA spID spDisplayID geneSymbol refseq protAcc description ...
	string ensembltogene;  // ensemblToGeneName: name value
	string ensemblsource;  // ensemblSource:     name source
};

// Read-only lookups into UCSC side tables, keyed by transcript name.
// Loaded once per session and consulted while decoding transcripts.
class ucsc_tables {
public:
	ucsc_tables() = default;
	explicit ucsc_tables(const ucsc_table_paths& paths);

	bool empty() const;

	// Gene symbol the tables give for a transcript, or empty.
	string gene_name(string_view tran_id) const;

	// Tag for a noncoding transcript: a recognized Ensembl biotype, else a
	// keyword from the kgXref description or RefSeq summary, else "ncRNA".
	string noncoding_tag(string_view tran_id) const;

	// Attaches what the tables know about the transcript as attributes.
	void annotate(feature_t& tran) const;

private:
	using table_t = string_map<string, vector<string>>;  // first column -> remaining columns
	static void load(const string& path, size_t width, table_t& table);
	static const vector<string>* find(const table_t& table, string_view key);

	table_t _refseqstat;
	table_t _refseqsum;
	table_t _kgxref;
	table_t _ensembltogene;
	table_t _ensemblsource;
};

END_NAMESPACE_FK

#endif // __FEATURE_KIT_UCSC_TABLES_H__
