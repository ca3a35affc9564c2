/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __FEATURE_KIT_FEATURE_H__
#define __FEATURE_KIT_FEATURE_H__

#include "interval.h"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

BEGIN_NAMESPACE_FK
using std::string;
using std::string_view;
using std::unique_ptr;
using std::vector;

using attr_values_t = vector<string>;
using attributes_t  = vector<std::pair<string, attr_values_t>>;  // insertion ordered

class feature_t;
using feature_ptr  = unique_ptr<feature_t>;
using feature_list = vector<feature_ptr>;

/////////////////////////////////////////////////////////////////
// feature_t
/////////////////////////////////////////////////////////////////

// One annotated interval and the sub-features it owns.
//
// Coordinates are 1-based and closed whatever dialect the feature came
// from. A feature owns its children exclusively; `parent` is a non-owning
// back pointer that is null for top-level features.
//
// Subclasses created through a feature_factory must override clone() if
// they add state of their own.
class feature_t {
public:
	feature_t() = default;
	virtual ~feature_t() = default;
	feature_t& operator=(const feature_t&) = delete;

	string            primary_id;    // unique within one parsed file
	string            display_name;  // empty means "same as primary_id"
	string            seq_id;
	pos_t             start{};       // 1-based
	pos_t             end{};         // 1-based inclusive
	strand_t          strand{unknown_strand};
	string            primary_tag;
	string            source_tag;
	std::optional<double> score;
	std::optional<int>    phase;     // GFF column 8
	attributes_t      attributes;
	feature_list      children;
	feature_t*        parent{};

	INLINE const string& name() const { return display_name.empty() ? primary_id : display_name; }
	INLINE pos_t length() const { return end - start + 1; }
	INLINE bool  overlaps(const feature_t& f) const { return seq_id == f.seq_id && start <= f.end && f.start <= end; }

	// Attributes
	void add_tag_value(string_view tag, string value);
	void set_tag_value(string_view tag, string value);
	bool remove_tag(string_view tag);
	bool has_tag(string_view tag) const;
	const attr_values_t& tag_values(string_view tag) const;     // empty if missing
	string_view          tag_value(string_view tag) const;      // first value, or empty

	// Structure
	feature_t* add_child(feature_ptr child);
	feature_ptr remove_child(const feature_t* child);
	void sort_children();                         // along strand; ties put the longer feature first
	void grow_to_cover(const feature_t& f);       // union of extents
	bool is_ancestor_of(const feature_t* f) const;
	size_t count_nodes() const;                   // this node plus all descendants

	// Renames this feature. Descendant identifiers derived from the old
	// one ("<old>.exon1") are carried along ("<new>.exon1").
	void rename(const string& new_id);

	virtual feature_ptr clone() const;
	virtual string as_str() const;

	// Pre-order walk over this node and its descendants.
	template <typename F>
	void visit(F&& fn)
	{
		fn(*this);
		for (auto& c : children)
			c->visit(fn);
	}
	template <typename F>
	void visit(F&& fn) const
	{
		fn(*this);
		for (auto& c : children)
			std::as_const(*c).visit(fn);
	}

protected:
	feature_t(const feature_t& src);  // copies everything but children and parent
	void clone_children_into(feature_t& dst) const;
};

/////////////////////////////////////////////////////////////////
// feature_factory
/////////////////////////////////////////////////////////////////

// Creates every feature a parser emits. Supplying a subclass lets a caller
// substitute its own feature_t implementation.
class feature_factory {
public:
	virtual ~feature_factory() = default;
	virtual feature_ptr make() const;
};

std::shared_ptr<const feature_factory> default_feature_factory();

END_NAMESPACE_FK

#endif // __FEATURE_KIT_FEATURE_H__
