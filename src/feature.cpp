/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "feature.h"
#include "strutil.h"
#include <algorithm>

BEGIN_NAMESPACE_FK

feature_t::feature_t(const feature_t& src)
: primary_id(src.primary_id)
, display_name(src.display_name)
, seq_id(src.seq_id)
, start(src.start)
, end(src.end)
, strand(src.strand)
, primary_tag(src.primary_tag)
, source_tag(src.source_tag)
, score(src.score)
, phase(src.phase)
, attributes(src.attributes)
{
}

/////////////////////////////////////////////////////////////////

void feature_t::add_tag_value(string_view tag, string value)
{
	for (auto& [key, values] : attributes) {
		if (key == tag) {
			values.push_back(std::move(value));
			return;
		}
	}
	attributes.emplace_back(string(tag), attr_values_t{ std::move(value) });
}

void feature_t::set_tag_value(string_view tag, string value)
{
	remove_tag(tag);
	attributes.emplace_back(string(tag), attr_values_t{ std::move(value) });
}

bool feature_t::remove_tag(string_view tag)
{
	auto it = std::find_if(attributes.begin(), attributes.end(), [&](const auto& a) { return a.first == tag; });
	if (it == attributes.end())
		return false;
	attributes.erase(it);
	return true;
}

bool feature_t::has_tag(string_view tag) const
{
	return std::any_of(attributes.begin(), attributes.end(), [&](const auto& a) { return a.first == tag; });
}

const attr_values_t& feature_t::tag_values(string_view tag) const
{
	static const attr_values_t none;
	for (auto& [key, values] : attributes)
		if (key == tag)
			return values;
	return none;
}

string_view feature_t::tag_value(string_view tag) const
{
	auto& values = tag_values(tag);
	return values.empty() ? string_view{} : string_view(values.front());
}

/////////////////////////////////////////////////////////////////

feature_t* feature_t::add_child(feature_ptr child)
{
	FK_ASSERT(child);
	child->parent = this;
	children.push_back(std::move(child));
	return children.back().get();
}

feature_ptr feature_t::remove_child(const feature_t* child)
{
	auto it = std::find_if(children.begin(), children.end(), [&](const feature_ptr& c) { return c.get() == child; });
	FK_CHECK(it != children.end(), key, "{} is not a child of {}", child->primary_id, primary_id);
	feature_ptr out = std::move(*it);
	children.erase(it);
	out->parent = nullptr;
	return out;
}

void feature_t::sort_children()
{
	if (strand == neg_strand) {
		std::stable_sort(children.begin(), children.end(), [](const feature_ptr& a, const feature_ptr& b) {
			return a->end != b->end ? a->end > b->end : a->start < b->start;
		});
	} else {
		std::stable_sort(children.begin(), children.end(), [](const feature_ptr& a, const feature_ptr& b) {
			return a->start != b->start ? a->start < b->start : a->end > b->end;
		});
	}
}

void feature_t::grow_to_cover(const feature_t& f)
{
	start = std::min(start, f.start);
	end   = std::max(end, f.end);
}

bool feature_t::is_ancestor_of(const feature_t* f) const
{
	for (; f; f = f->parent)
		if (f == this)
			return true;
	return false;
}

size_t feature_t::count_nodes() const
{
	size_t n = 1;
	for (auto& c : children)
		n += c->count_nodes();
	return n;
}

void feature_t::rename(const string& new_id)
{
	const string old_prefix = primary_id + '.';
	primary_id = new_id;
	for (auto& c : children) {
		c->visit([&](feature_t& f) {
			if (startswith(f.primary_id, old_prefix))
				f.primary_id = new_id + f.primary_id.substr(old_prefix.size() - 1);
		});
	}
}

feature_ptr feature_t::clone() const
{
	feature_ptr dst(new feature_t(*this));
	clone_children_into(*dst);
	return dst;
}

void feature_t::clone_children_into(feature_t& dst) const
{
	for (auto& c : children)
		dst.add_child(c->clone());
}

string feature_t::as_str() const
{
	return fk::format("{}:{} {}:{}-{}({})", primary_tag, primary_id, seq_id, start, end, strand_as_char(strand));
}

/////////////////////////////////////////////////////////////////

feature_ptr feature_factory::make() const
{
	return std::make_unique<feature_t>();
}

std::shared_ptr<const feature_factory> default_feature_factory()
{
	static const auto factory = std::make_shared<const feature_factory>();
	return factory;
}

END_NAMESPACE_FK
