/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "id_linker.h"
#include "fk_assert.h"
#include <utility>

BEGIN_NAMESPACE_FK

feature_t* id_registry::find(string_view id) const
{
	auto it = _ids.find(id);
	return it == _ids.end() ? nullptr : it->second;
}

void id_registry::add(feature_t& f)
{
	auto [it, inserted] = _ids.emplace(f.primary_id, &f);
	FK_CHECK(inserted, duplicate_identifier, "Duplicate ID \"{}\": {} conflicts with {}", f.primary_id, f.as_str(),
			 it->second->as_str());
}

void id_registry::add_unique(feature_t& f)
{
	if (contains(f.primary_id)) {
		string id;
		for (int i = 1;; ++i) {
			id = fk::format("{}.{}", f.primary_id, i);
			if (!contains(id))
				break;
		}
		f.rename(id);
	}
	_ids.emplace(f.primary_id, &f);
}

void id_registry::add_tree_unique(feature_t& root)
{
	// Parents first, so a renamed parent has already renamed the ids derived from it
	add_unique(root);
	for (auto& c : root.children)
		add_tree_unique(*c);
}

void id_registry::remove(string_view id)
{
	if (auto it = _ids.find(id); it != _ids.end())
		_ids.erase(it);
}

void id_registry::remove_tree(const feature_t& root)
{
	root.visit([&](const feature_t& f) {
		if (auto it = _ids.find(f.primary_id); it != _ids.end() && it->second == &f)
			_ids.erase(it);
	});
}

/////////////////////////////////////////////////////////////////

id_linker::id_linker(bool streaming, parent_synthesizer synth)
: _streaming(streaming)
, _synth(std::move(synth))
{
}

void id_linker::add(feature_cluster rec)
{
	FK_ASSERT(rec.feature);
	auto& parents = rec.parents;
	if (!_skipped.empty())
		std::erase_if(parents, [&](const string& p) { return _skipped.contains(p); });
	if (parents.size() <= 1) {
		add_one(std::move(rec.feature), parents.empty() ? string() : std::move(parents[0]), rec.synthetic_id);
		return;
	}

	// One copy per parent; the k-th copy is named "<id>.k"
	vector<feature_ptr> copies;
	for (size_t k = 1; k < parents.size(); ++k) {
		copies.push_back(rec.feature->clone());
		copies.back()->rename(fk::format("{}.{}", rec.feature->primary_id, k + 1));
	}
	add_one(std::move(rec.feature), std::move(parents[0]), rec.synthetic_id);
	for (size_t k = 1; k < parents.size(); ++k)
		add_one(std::move(copies[k - 1]), std::move(parents[k]), true);
}

void id_linker::skip(const string& id)
{
	_skipped.insert(id);
}

void id_linker::register_id(feature_t& f, const string& parent_id, bool synthetic)
{
	if (synthetic) {
		_ids.add_unique(f);
		return;
	}
	if (feature_t* existing = _ids.find(f.primary_id)) {
		// A feature split over several lines (e.g. a multi-exon CDS) repeats
		// its ID with the same type, sequence and parent.
		auto declared = _declared_parent.find(f.primary_id);
		bool split = declared != _declared_parent.end() && declared->second == parent_id
					 && existing->primary_tag == f.primary_tag && existing->seq_id == f.seq_id;
		FK_CHECK(split, duplicate_identifier, "Duplicate ID \"{}\": {} conflicts with {}", f.primary_id, f.as_str(),
				 existing->as_str());
		_ids.add_unique(f);
		return;
	}
	_ids.add(f);
	_declared_parent[f.primary_id] = parent_id;
}

void id_linker::add_one(feature_ptr f, string parent_id, bool synthetic)
{
	register_id(*f, parent_id, synthetic);
	if (parent_id.empty()) {
		if (_streaming)
			close_open();
		_roots.push_back(std::move(f));
		return;
	}
	if (feature_t* parent = _ids.find(parent_id)) {
		if (f->is_ancestor_of(parent))
			drop(std::move(f));  // names itself as parent
		else
			attach(*parent, std::move(f));
		return;
	}
	if (_streaming) {
		// No second chance while streaming
		if (synthesize(*f, parent_id))
			if (feature_t* parent = _ids.find(parent_id)) {
				attach(*parent, std::move(f));
				return;
			}
		drop(std::move(f));
		return;
	}
	_orphans.push_back({ std::move(f), std::move(parent_id) });
}

void id_linker::attach(feature_t& parent, feature_ptr child)
{
	const feature_t* covered = parent.add_child(std::move(child));
	for (feature_t* p = &parent; p && _synthesized.count(p); covered = p, p = p->parent)
		p->grow_to_cover(*covered);
}

bool id_linker::synthesize(const feature_t& child, const string& parent_id)
{
	if (!_synth)
		return false;
	string grandparent;
	feature_ptr p = _synth(child, parent_id, grandparent);
	if (!p)
		return false;
	FK_ASSERT(p->primary_id == parent_id);
	_synthesized.insert(p.get());
	add_one(std::move(p), std::move(grandparent), false);
	return true;
}

void id_linker::drop(feature_ptr f)
{
	++_orphan_count;
	_ids.remove_tree(*f);
	f->visit([&](const feature_t& g) {
		_synthesized.erase(&g);
		_declared_parent.erase(g.primary_id);
	});
}

void id_linker::reconcile()
{
	if (_streaming) {
		close_open();
		return;
	}

	bool progress = true;
	while (progress && !_orphans.empty()) {
		progress = false;
		vector<orphan_t> pending = std::move(_orphans);
		_orphans.clear();
		for (auto& o : pending) {
			feature_t* parent = _ids.find(o.parent_id);
			if (parent && !o.feature->is_ancestor_of(parent)) {
				attach(*parent, std::move(o.feature));
				progress = true;
			} else if (!parent && _skipped.contains(o.parent_id)) {
				_roots.push_back(std::move(o.feature));  // parent was skipped after this record was queued
				progress = true;
			} else {
				_orphans.push_back(std::move(o));  // still missing, or a cycle
			}
		}
		if (!progress) {
			// synthesize() may append to _orphans; only the entries present now are visited
			const size_t n = _orphans.size();
			for (size_t i = 0; i < n; ++i) {
				if (_ids.contains(_orphans[i].parent_id))
					continue;
				const string     parent_id = _orphans[i].parent_id;
				const feature_t& child     = *_orphans[i].feature;
				if (synthesize(child, parent_id))
					progress = true;
			}
		}
	}

	for (auto& o : _orphans)
		drop(std::move(o.feature));
	_orphans.clear();

	for (auto& root : _roots)
		root->visit([](feature_t& f) { f.sort_children(); });
}

void id_linker::close_open()
{
	if (!_streaming || _roots.empty())
		return;
	feature_ptr root = std::move(_roots.back());
	_roots.clear();
	root->visit([&](feature_t& f) {
		f.sort_children();
		_synthesized.erase(&f);
		_declared_parent.erase(f.primary_id);
	});
	_ids.remove_tree(*root);
	_finished.push_back(std::move(root));
}

feature_ptr id_linker::pop_finished()
{
	if (_finished.empty())
		return nullptr;
	feature_ptr f = std::move(_finished.front());
	_finished.pop_front();
	return f;
}

END_NAMESPACE_FK
