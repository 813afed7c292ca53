/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "layout.h"
#include <utility>

BEGIN_NAMESPACE_SK

const char* layout_state_as_str(layout_state_t state)
{
	switch (state) {
	case layout_state_t::unlaid:      return "unlaid";
	case layout_state_t::laid:        return "laid";
	case layout_state_t::transformed: return "transformed";
	}
	SK_UNREACHABLE();
}

layout layout::make(track_registry registry, layout_options options)
{
	layout out;
	out._seqs     = layout_sequences(registry, options);
	out._registry = std::move(registry);
	out._options  = std::move(options);
	out._state    = layout_state_t::laid;
	out.project_all();
	return out;
}

void layout::check_laid() const
{
	SK_CHECK(_state != layout_state_t::unlaid, configuration, "Layout has not been laid out yet.");
}

const seq_layout& layout::seqs() const
{
	check_laid();
	return _seqs;
}

const projected_feats& layout::feats(string_view track_id) const
{
	check_laid();
	for (const auto& p : _feats)
		if (p.track_id == track_id)
			return p;
	SK_THROW(configuration, "No feature track named \"{}\".", track_id);
}

const projected_links& layout::links(string_view track_id) const
{
	check_laid();
	for (const auto& p : _links)
		if (p.track_id == track_id)
			return p;
	SK_THROW(configuration, "No link track named \"{}\".", track_id);
}

const string& layout::default_feats_id() const
{
	check_laid();
	SK_CHECK(!_feats.empty(), configuration, "Layout has no feature tracks.");
	return _feats.front().track_id;
}

const string& layout::default_links_id() const
{
	check_laid();
	SK_CHECK(!_links.empty(), configuration, "Layout has no link tracks.");
	return _links.front().track_id;
}

void layout::project_all()
{
	_feats.clear();
	_links.clear();
	for (const auto& track : _registry.feat_tracks())
		_feats.push_back(project_feats(_seqs, track, _options.policy, _marginal));
	for (const auto& track : _registry.link_tracks())
		_links.push_back(project_links(_seqs, track, _options.policy, _marginal));
}

layout layout::with_seqs(seq_layout seqs) const
{
	return with_seqs(std::move(seqs), _marginal);
}

layout layout::with_seqs(seq_layout seqs, marginal_t marginal) const
{
	check_laid();
	layout out;
	out._state    = layout_state_t::transformed;
	out._options  = _options;
	out._registry = _registry;
	out._seqs     = std::move(seqs);
	out._marginal = marginal;
	out.project_all();
	return out;
}

layout layout::with_registry(track_registry registry) const
{
	check_laid();
	layout out;
	out._state    = layout_state_t::transformed;
	out._options  = _options;
	out._registry = std::move(registry);
	out._seqs     = _seqs;
	out._marginal = _marginal;
	out.project_all();
	return out;
}

END_NAMESPACE_SK
