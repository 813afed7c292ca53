/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __SYNTENY_KIT_LAYOUT_H__
#define __SYNTENY_KIT_LAYOUT_H__

#include "projector.h"

BEGIN_NAMESPACE_SK

enum class layout_state_t : uint8_t { unlaid, laid, transformed };

const char* layout_state_as_str(layout_state_t state);

// Tracks, sequence layout and every track projected onto it.
//
// A layout is a value: transforms take a layout and return a new one, so
// a failing transform leaves its input untouched. Copies share the
// original track rows; only the sequence layout and projections are copied.
class layout {
public:
	layout() = default;  // unlaid

	// Lay out the registry's sequences and project all of its tracks.
	static layout make(track_registry registry, layout_options options);

	INLINE layout_state_t        state()    const { return _state; }
	INLINE const layout_options& options()  const { return _options; }
	INLINE const track_registry& registry() const { return _registry; }
	INLINE marginal_t            marginal() const { return _marginal; }
	const seq_layout&            seqs()     const;

	// Projection of a named track; configuration_error if there is none.
	const projected_feats& feats(string_view track_id) const;
	const projected_links& links(string_view track_id) const;

	INLINE const vector<projected_feats>& feat_projections() const { return _feats; }
	INLINE const vector<projected_links>& link_projections() const { return _links; }

	// Id of the first feat/link track; configuration_error if there is none.
	const string& default_feats_id() const;
	const string& default_links_id() const;

	// Successor states. Each re-projects every track.
	layout with_seqs(seq_layout seqs) const;
	layout with_seqs(seq_layout seqs, marginal_t marginal) const;
	layout with_registry(track_registry registry) const;

private:
	void check_laid() const;
	void project_all();

	layout_state_t        _state{layout_state_t::unlaid};
	layout_options        _options;
	track_registry        _registry;
	seq_layout            _seqs;
	marginal_t            _marginal{marginal_t::keep};
	vector<projected_feats> _feats;
	vector<projected_links> _links;
};

END_NAMESPACE_SK

#endif // __SYNTENY_KIT_LAYOUT_H__
