/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __FEATURE_KIT_ID_LINKER_H__
#define __FEATURE_KIT_ID_LINKER_H__

#include "decoder.h"
#include "feature.h"
#include "strutil.h"
#include <deque>
#include <functional>
#include <string>
#include <unordered_set>
#include <vector>

BEGIN_NAMESPACE_FK

/////////////////////////////////////////////////////////////////
// id_registry
/////////////////////////////////////////////////////////////////

// Maps primary_id to a feature owned elsewhere.
class id_registry {
public:
	INLINE size_t size() const { return _ids.size(); }
	INLINE bool   contains(string_view id) const { return _ids.find(id) != _ids.end(); }
	feature_t*    find(string_view id) const;

	void add(feature_t& f);        // throws duplicate_identifier_error if the id is taken
	void add_unique(feature_t& f); // on collision renames f to "<id>.1", "<id>.2", ...
	void add_tree_unique(feature_t& root);
	void remove(string_view id);
	void remove_tree(const feature_t& root);
	void clear() { _ids.clear(); }

private:
	string_map<string, feature_t*> _ids;
};

/////////////////////////////////////////////////////////////////
// id_linker
/////////////////////////////////////////////////////////////////

// Builds a missing parent for `child`. Returns null to leave the child
// orphaned; may set `grandparent` to the identifier the new parent should
// itself be linked to.
using parent_synthesizer = std::function<feature_ptr(const feature_t& child, const string& parent_id, string& grandparent)>;

// Assembles records into trees through declared parent identifiers.
//
// Materializing mode works in two phases. add() registers each record and
// attaches it to its parent when the parent is already known, otherwise it
// queues the record as an orphan. reconcile() retries every orphan against
// the complete table, and drops (and counts) those still unresolved.
//
// Records whose parent was skipped (see skip()) are promoted to the top
// level, whether the skipped parent came before or after them.
//
// Streaming mode keeps one open top-level tree. A new top-level record
// closes it, making it available from pop_finished(); a record whose parent
// is not in the open tree is dropped and counted at once.
class id_linker {
public:
	explicit id_linker(bool streaming = false, parent_synthesizer synth = {});
	NOCOPY(id_linker)

	void add(feature_cluster rec);
	void skip(const string& id);   // id names a record left out on purpose
	void reconcile();     // phase boundary: ### or end of input
	void close_open();    // streaming: finish the open tree

	feature_ptr pop_finished();            // streaming: next completed tree, or null
	INLINE feature_list& roots() { return _roots; }
	INLINE const id_registry& loaded() const { return _ids; }
	INLINE size_t orphan_count() const { return _orphan_count; }
	INLINE size_t pending_count() const { return _orphans.size(); }

private:
	struct orphan_t {
		feature_ptr feature;
		string      parent_id;
	};

	void add_one(feature_ptr f, string parent_id, bool synthetic);
	void register_id(feature_t& f, const string& parent_id, bool synthetic);
	void attach(feature_t& parent, feature_ptr child);
	bool synthesize(const feature_t& child, const string& parent_id);
	void drop(feature_ptr f);

	bool               _streaming;
	parent_synthesizer _synth;
	id_registry        _ids;
	feature_list       _roots;          // materializing: every top-level tree; streaming: the open one
	std::deque<feature_ptr> _finished;  // streaming: trees ready to hand out
	vector<orphan_t>   _orphans;
	string_map<string, string> _declared_parent;   // declared id -> its parent id, for split features
	std::unordered_set<const feature_t*> _synthesized;
	string_set<string> _skipped;
	size_t             _orphan_count{};
};

END_NAMESPACE_FK

#endif // __FEATURE_KIT_ID_LINKER_H__
