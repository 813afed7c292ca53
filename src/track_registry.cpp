/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "track_registry.h"
#include <fmt/format.h>
#include <algorithm>

BEGIN_NAMESPACE_SK

const char* track_type_as_str(track_type_t type)
{
	switch (type) {
	case track_type_t::seqs:  return "seqs";
	case track_type_t::feats: return "feats";
	case track_type_t::links: return "links";
	}
	SK_UNREACHABLE();
}

void track_registry::set_seqs(vector<seq_rec> seqs)
{
	_seqs = std::make_shared<const vector<seq_rec>>(std::move(seqs));
}

void track_registry::check_new_id(string_view id) const
{
	SK_CHECK(!strip(id).empty(), configuration, "Track id must not be empty.");
	SK_CHECK(id != "seqs", configuration, "Track id \"seqs\" is reserved for the sequence table.");
	SK_CHECK(!has_track(id), configuration, "A track named \"{}\" already exists.", id);
}

void track_registry::add_feats(string id, vector<feat_rec> rows)
{
	check_new_id(id);
	for (size_t i = 0; i < rows.size(); ++i)
		if (rows[i].feat_id.empty())
			rows[i].feat_id = fmt::format("{}_{}", id, i + 1);
	auto shared = std::make_shared<const vector<feat_rec>>(std::move(rows));
	_feats.push_back(feat_track{std::move(id), std::move(shared)});
}

void track_registry::add_links(string id, vector<link_rec> rows)
{
	check_new_id(id);
	auto shared = std::make_shared<const vector<link_rec>>(std::move(rows));
	_links.push_back(link_track{std::move(id), std::move(shared)});
}

void track_registry::replace_feats(string_view id, vector<feat_rec> rows)
{
	auto it = std::find_if(_feats.begin(), _feats.end(), [id](const feat_track& t) { return t.id == id; });
	SK_CHECK(it != _feats.end(), configuration, "No feature track named \"{}\".", id);
	SK_ASSERT(rows.size() == it->rows->size());
	it->rows = std::make_shared<const vector<feat_rec>>(std::move(rows));
}

bool track_registry::has_track(string_view id) const
{
	return std::any_of(_feats.begin(), _feats.end(), [id](const feat_track& t) { return t.id == id; })
		|| std::any_of(_links.begin(), _links.end(), [id](const link_track& t) { return t.id == id; });
}

track_type_t track_registry::track_type(string_view id) const
{
	if (id == "seqs")
		return track_type_t::seqs;
	if (std::any_of(_feats.begin(), _feats.end(), [id](const feat_track& t) { return t.id == id; }))
		return track_type_t::feats;
	if (std::any_of(_links.begin(), _links.end(), [id](const link_track& t) { return t.id == id; }))
		return track_type_t::links;
	SK_THROW(configuration, "No track named \"{}\".", id);
}

const feat_track& track_registry::feats(string_view id) const
{
	for (const auto& t : _feats)
		if (t.id == id)
			return t;
	SK_THROW(configuration, "No feature track named \"{}\".", id);
}

const link_track& track_registry::links(string_view id) const
{
	for (const auto& t : _links)
		if (t.id == id)
			return t;
	SK_THROW(configuration, "No link track named \"{}\".", id);
}

string track_registry::unnamed_track_id(track_type_t type, bool genes) const
{
	SK_CHECK(type != track_type_t::seqs, configuration, "The sequence table is not a named track.");
	string base = genes ? "genes" : track_type_as_str(type);
	if (!has_track(base))
		return base;
	for (int i = 2;; ++i) {
		auto id = fmt::format("{}_{}", base, i);
		if (!has_track(id))
			return id;
	}
}

END_NAMESPACE_SK
