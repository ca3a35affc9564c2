/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "filetype.h"
#include "file.h"
#include "fk_assert.h"
#include "strutil.h"
#include "util.h"
#include <array>

BEGIN_NAMESPACE_FK

namespace {

struct filetype_info {
	filetype_t  type;
	flavor_t    flavor;
	int         columns;
	const char* name;
};

// clang-format off
constexpr std::array<filetype_info, 21> filetypes = {{
	{ filetype_t::bed3,           flavor_t::bed,   3, "bed3" },
	{ filetype_t::bed4,           flavor_t::bed,   4, "bed4" },
	{ filetype_t::bed5,           flavor_t::bed,   5, "bed5" },
	{ filetype_t::bed6,           flavor_t::bed,   6, "bed6" },
	{ filetype_t::bed7,           flavor_t::bed,   7, "bed7" },
	{ filetype_t::bed8,           flavor_t::bed,   8, "bed8" },
	{ filetype_t::bed9,           flavor_t::bed,   9, "bed9" },
	{ filetype_t::bed10,          flavor_t::bed,  10, "bed10" },
	{ filetype_t::bed11,          flavor_t::bed,  11, "bed11" },
	{ filetype_t::bed12,          flavor_t::bed,  12, "bed12" },
	{ filetype_t::bedGraph,       flavor_t::bed,   4, "bedGraph" },
	{ filetype_t::narrowPeak,     flavor_t::bed,  10, "narrowPeak" },
	{ filetype_t::broadPeak,      flavor_t::bed,   9, "broadPeak" },
	{ filetype_t::gappedPeak,     flavor_t::bed,  15, "gappedPeak" },
	{ filetype_t::gff3,           flavor_t::gff,   9, "gff3" },
	{ filetype_t::gtf,            flavor_t::gff,   9, "gtf" },
	{ filetype_t::genePred,       flavor_t::ucsc, 10, "genePred" },
	{ filetype_t::refFlat,        flavor_t::ucsc, 11, "refFlat" },
	{ filetype_t::knownGene,      flavor_t::ucsc, 12, "knownGene" },
	{ filetype_t::genePredExt,    flavor_t::ucsc, 15, "genePredExt" },
	{ filetype_t::genePredExtBin, flavor_t::ucsc, 16, "genePredExtBin" },
}};
// clang-format on

const filetype_info& info(filetype_t ft)
{
	auto i = as_ordinal(ft);
	FK_ASSERT(i < filetypes.size() && filetypes[i].type == ft);
	return filetypes[i];
}

// What a file name alone says about the file.
enum class ext_class {
	exact,   // extension names the filetype outright
	bed,     // some BED variant; column count decides
	gff,     // GFF3 or GTF
	ucsc,    // some genePred variant
	generic  // .txt, .tab or unknown; anything goes
};

struct ext_rule {
	const char* ext;
	ext_class   cls;
	filetype_t  type;  // only meaningful for ext_class::exact
};

// clang-format off
constexpr ext_rule ext_rules[] = {
	{ "narrowpeak",  ext_class::exact,   filetype_t::narrowPeak },
	{ "broadpeak",   ext_class::exact,   filetype_t::broadPeak  },
	{ "gappedpeak",  ext_class::exact,   filetype_t::gappedPeak },
	{ "bedgraph",    ext_class::exact,   filetype_t::bedGraph   },
	{ "bdg",         ext_class::exact,   filetype_t::bedGraph   },
	{ "gff3",        ext_class::exact,   filetype_t::gff3       },
	{ "gtf",         ext_class::exact,   filetype_t::gtf        },
	{ "refflat",     ext_class::exact,   filetype_t::refFlat    },
	{ "knowngene",   ext_class::exact,   filetype_t::knownGene  },
	{ "bed",         ext_class::bed,     filetype_t::bed3       },
	{ "peak",        ext_class::bed,     filetype_t::bed3       },
	{ "gff",         ext_class::gff,     filetype_t::gff3       },
	{ "genepred",    ext_class::ucsc,    filetype_t::genePred   },
	{ "genepredext", ext_class::ucsc,    filetype_t::genePred   },
	{ "ucsc",        ext_class::ucsc,    filetype_t::genePred   },
};
// clang-format on

ext_rule classify_extension(const string& path)
{
	string name = to_lower(base_name(path));
	if (endswith(name, ".gz"))
		name.resize(name.size() - 3);
	auto dot = name.rfind('.');
	string_view ext = dot == string::npos ? string_view{} : string_view(name).substr(dot + 1);
	for (auto& rule : ext_rules)
		if (ext == rule.ext)
			return rule;
	return { "", ext_class::generic, filetype_t::bed3 };
}

std::optional<flavor_t> restriction(ext_class cls)
{
	switch (cls) {
	case ext_class::bed:  return flavor_t::bed;
	case ext_class::gff:  return flavor_t::gff;
	case ext_class::ucsc: return flavor_t::ucsc;
	default:              return std::nullopt;
	}
}

bool is_rgb(string_view s) { return contains(s, ",") || s == "0"; }

std::optional<filetype_t> taste_gff(const vector<string_view>& cols)
{
	if (size(cols) != 9 || !is_integer(cols[3]) || !is_integer(cols[4]))
		return std::nullopt;
	if (!(cols[6] == "+" || cols[6] == "-" || cols[6] == "." || cols[6] == "?"))
		return std::nullopt;
	string_view attrs = cols[8];
	// GTF writes `key "value";`, GFF3 writes `key=value;`
	if (contains(attrs, "gene_id \"") || contains(attrs, "transcript_id \""))
		return filetype_t::gtf;
	return filetype_t::gff3;
}

std::optional<filetype_t> taste_ucsc(const vector<string_view>& cols)
{
	filetype_t ft;
	int strand_col;
	switch (size(cols)) {
	case 10: ft = filetype_t::genePred;       strand_col = 2; break;
	case 11: ft = filetype_t::refFlat;        strand_col = 3; break;
	case 12: ft = filetype_t::knownGene;      strand_col = 2; break;
	case 15: ft = filetype_t::genePredExt;    strand_col = 2; break;
	case 16: ft = filetype_t::genePredExtBin; strand_col = 3; break;
	default: return std::nullopt;
	}
	if (cols[strand_col] != "+" && cols[strand_col] != "-")
		return std::nullopt;
	// txStart txEnd cdsStart cdsEnd exonCount exonStarts exonEnds follow the strand
	for (int i = 1; i <= 5; ++i)
		if (!is_integer(cols[strand_col + i]))
			return std::nullopt;
	if (!is_comma_integers(cols[strand_col + 6]) || !is_comma_integers(cols[strand_col + 7]))
		return std::nullopt;
	return ft;
}

std::optional<filetype_t> taste_bed(const vector<string_view>& cols, bool generic)
{
	const int n = int_cast<int>(size(cols));
	if (n < 3 || !is_integer(cols[1]) || !is_integer(cols[2]))
		return std::nullopt;
	auto numeric = [&](int first, int last) {
		for (int i = first; i <= last; ++i)
			if (!is_numeric(cols[i]))
				return false;
		return true;
	};
	switch (n) {
	case 4:
		return generic && is_numeric(cols[3]) ? filetype_t::bedGraph : filetype_t::bed4;
	case 9:
		if (is_integer(cols[6]) && is_integer(cols[7]) && is_rgb(cols[8]))
			return filetype_t::bed9;
		if (numeric(6, 8))
			return filetype_t::broadPeak;
		return filetype_t::bed9;
	case 10:
		return numeric(6, 9) ? filetype_t::narrowPeak : filetype_t::bed10;
	case 15:
		if (is_integer(cols[9]) && is_comma_integers(cols[10]) && is_comma_integers(cols[11]) && numeric(12, 14))
			return filetype_t::gappedPeak;
		return std::nullopt;
	default:
		if (n <= 12)
			return scast<filetype_t>(as_ordinal(filetype_t::bed3) + (n - 3));
		return std::nullopt;
	}
}

std::optional<file_format> taste_columns(const vector<string_view>& cols, std::optional<flavor_t> only, bool generic)
{
	if (!only || *only == flavor_t::gff)
		if (auto ft = taste_gff(cols))
			return as_format(*ft);
	if (!only || *only == flavor_t::ucsc)
		if (auto ft = taste_ucsc(cols))
			return as_format(*ft);
	if (!only || *only == flavor_t::bed)
		if (auto ft = taste_bed(cols, generic))
			return as_format(*ft);
	return std::nullopt;
}

// Hints gathered from lines preceding the first record.
struct header_hints {
	std::optional<filetype_t> track_type;   // track type=narrowPeak
	std::optional<filetype_t> gff_version;  // ##gff-version
	std::optional<filetype_t> ucsc_header;  // #name chrom strand ... column names
};

void read_hint(string_view line, header_hints& hints)
{
	if (startswith(line, "##gtf-version")) {
		hints.gff_version = filetype_t::gtf;
	} else if (startswith(line, "##gff-version")) {
		auto v = strip(line.substr(13));
		hints.gff_version = startswith(v, "2") ? filetype_t::gtf : filetype_t::gff3;
	} else if (startswith(line, "track")) {
		auto pos = line.find("type=");
		if (pos != string_view::npos) {
			auto type = line.substr(pos + 5);
			type      = type.substr(0, type.find_first_of(" \t"));
			if (auto ft = as_filetype(type))
				hints.track_type = ft;
		}
	} else if (startswith(line, "#") && contains(line, "exonStarts")) {
		if (contains(line, "geneName"))
			hints.ucsc_header = filetype_t::refFlat;
		else if (contains(line, "proteinID") || contains(line, "alignID"))
			hints.ucsc_header = filetype_t::knownGene;
		else if (contains(line, "name2"))
			hints.ucsc_header = startswith(line, "#bin") ? filetype_t::genePredExtBin : filetype_t::genePredExt;
		else
			hints.ucsc_header = filetype_t::genePred;
	}
}

}  // namespace

/////////////////////////////////////////////////////////////////

flavor_t flavor_of(filetype_t ft) { return info(ft).flavor; }
file_format as_format(filetype_t ft) { return { flavor_of(ft), ft }; }
int expected_columns(filetype_t ft) { return info(ft).columns; }
const char* as_str(filetype_t ft) { return info(ft).name; }

const char* as_str(flavor_t fl)
{
	switch (fl) {
	case flavor_t::bed:  return "bed";
	case flavor_t::gff:  return "gff";
	case flavor_t::ucsc: return "ucsc";
	}
	FK_UNREACHABLE();
}

std::optional<filetype_t> as_filetype(string_view name)
{
	for (auto& ft : filetypes)
		if (iequal(name, ft.name))
			return ft.type;
	return std::nullopt;
}

bool is_comment_line(string_view line)
{
	return strip(line).empty() || startswith(line, "#") || startswith(line, "track") || startswith(line, "browser");
}

std::optional<file_format> taste_line(string_view line, std::optional<flavor_t> only)
{
	vector<string_view> cols;
	split_view(line, '\t', cols);
	return taste_columns(cols, only, !only.has_value());
}

file_format taste_file(const string& path)
{
	const ext_rule rule = classify_extension(path);
	if (rule.cls == ext_class::exact)
		return as_format(rule.type);

	header_hints hints;
	vector<string_view> cols;
	std::optional<file_format> result;
	try {
		for (zline_reader lr(path); !lr.done(); ++lr) {
			string_view line = lr.line();
			if (is_comment_line(line)) {
				read_hint(line, hints);
				continue;
			}
			split_view(line, '\t', cols);

			// A declared type wins when the line has its shape.
			if (hints.track_type && expected_columns(*hints.track_type) == int_cast<int>(size(cols))
				&& (rule.cls == ext_class::generic || rule.cls == ext_class::bed)) {
				result = as_format(*hints.track_type);
			} else if (hints.ucsc_header && taste_ucsc(cols) == hints.ucsc_header) {
				result = as_format(*hints.ucsc_header);
			} else {
				result = taste_columns(cols, restriction(rule.cls), rule.cls == ext_class::generic);
				if (result && result->filetype == filetype_t::gff3 && hints.gff_version == filetype_t::gtf)
					result = as_format(filetype_t::gtf);
			}
			FK_CHECK(result, unrecognized_format, "Could not recognize the format of {}; first data line has {} columns: \"{}\"",
					 path, size(cols), line);
			return *result;
		}
	}
	FK_CATCH_THROW_NESTED(file, "Could not taste {}", path)

	// No data lines at all
	if (rule.cls == ext_class::gff || hints.gff_version)
		return as_format(hints.gff_version.value_or(filetype_t::gff3));
	if (hints.track_type)
		return as_format(*hints.track_type);
	FK_THROW(unrecognized_format, "Could not recognize the format of {}; it has no data lines", path);
}

END_NAMESPACE_FK
