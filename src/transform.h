/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __SYNTENY_KIT_TRANSFORM_H__
#define __SYNTENY_KIT_TRANSFORM_H__

#include "layout.h"
#include <functional>

BEGIN_NAMESPACE_SK

// Every transform returns a new layout and leaves its input untouched.
// Unknown or repeated ids throw validation_error before anything changes.
// A sequence id shown in several bins must be written as <bin_id>/<seq_id>.

enum class flip_target_t : uint8_t { bins, seqs };

layout flip(const layout& in, const vector<string>& ids, flip_target_t target);
INLINE layout flip_bins(const layout& in, const vector<string>& bin_ids) { return flip(in, bin_ids, flip_target_t::bins); }
INLINE layout flip_seqs(const layout& in, const vector<string>& seq_ids) { return flip(in, seq_ids, flip_target_t::seqs); }

// Keep only the listed bins, in the listed order.
layout pick(const layout& in, const vector<string>& bin_ids);

// Keep only the listed sequences, in the listed order; bins follow their first listed sequence.
layout pick_seqs(const layout& in, const vector<string>& seq_ids);

// Move whole bins along x.
layout shift(const layout& in, const vector<string>& bin_ids, pos_t by);

// Flip bins, top to bottom, whose links to the bins above are mostly inverted
// (weighted by link width). Uses the first link track if track_id is empty.
layout sync(const layout& in, string_view track_id = {});

/////////////////////////////////////////////////////////////////

using feat_predicate = std::function<bool(const feat_rec&)>;
using link_predicate = std::function<bool(const link_rec&)>;

// Region to focus on regardless of any predicate. seq_id may name a
// displayed sequence (<bin_id>/<seq_id> if shown in several bins) or the
// source sequence of one.
struct locus_rec {
	string seq_id;
	span_t span;
};

struct focus_options {
	pos_t             upstream{0};   // margin added 5' of each target
	pos_t             dnstream{0};   // margin added 3' of each target
	pos_t             max_dist{0};   // targets closer than this share one locus
	marginal_t        marginal{marginal_t::trim};
	vector<locus_rec> loci;
};

// Narrow the layout to loci around the visible rows of a track that match pred,
// plus opts.loci. A null predicate matches nothing.
layout focus_feats(const layout& in, string_view feats_id, const feat_predicate& pred, const focus_options& opts);
layout focus_links(const layout& in, string_view links_id, const link_predicate& pred, const focus_options& opts);
layout focus_loci(const layout& in, const focus_options& opts);

/////////////////////////////////////////////////////////////////

// Maps a sub-feature span, relative to its parent, before it is placed on the parent.
using coord_transform = std::function<span_t(const span_t&)>;

span_t identity_coords(const span_t& s);
span_t aa_to_nt(const span_t& s);  // protein residues to nucleotides

layout add_feats(const layout& in, string track_id, vector<feat_rec> rows);
layout add_links(const layout& in, string track_id, vector<link_rec> rows);

// Sub-features whose seq_id names a feat_id of parent_id, with coordinates
// relative to that feature's 5' end. Stored as a regular feature track.
layout add_subfeats(const layout& in, string_view parent_id, string track_id, const vector<feat_rec>& subfeats,
					const coord_transform& transform = identity_coords);

// Links whose seq_id1/seq_id2 name features of parent_id, coordinates as for add_subfeats.
layout add_sublinks(const layout& in, string_view parent_id, string track_id, const vector<link_rec>& sublinks,
					const coord_transform& transform = identity_coords);

// Tag the features of parent_id with their cluster_id and link consecutive
// members of each cluster that sit in different displayed bins.
layout add_clusters(const layout& in, string_view parent_id, string track_id, const vector<cluster_rec>& clusters);

END_NAMESPACE_SK

#endif // __SYNTENY_KIT_TRANSFORM_H__
