/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __SYNTENY_KIT_PROJECTOR_H__
#define __SYNTENY_KIT_PROJECTOR_H__

#include "seq_layout.h"

BEGIN_NAMESPACE_SK

// What happens to a feature or link end that crosses the border of its window.
enum class marginal_t : uint8_t {
	keep,  // left as is; may extend past the displayed sequence
	trim,  // clipped to the window
	drop   // removed
};

marginal_t  as_marginal(string_view s);
const char* marginal_as_str(marginal_t marginal);

enum class orientation_t : uint8_t { colinear, inverted };

const char* orientation_as_str(orientation_t orientation);

struct projection_report {
	size_t         num_rows{};        // rows in the track
	size_t         num_unresolved{};  // referred to a sequence that does not exist
	vector<string> unresolved_ids;    // a few of the offending seq_ids
	size_t         num_hidden{};      // on a sequence that is not displayed
	size_t         num_outside{};     // outside every window, or dropped at a window border
	size_t         num_trimmed{};     // clipped to a window border
};

/////////////////////////////////////////////////////////////////

struct proj_feat_t {
	uint32_t row;       // index into the track's rows
	int      seq;       // index into seq_layout::seqs()
	span_t   span;      // after the marginal policy
	pos_t    x;
	pos_t    xend;
	int      y;
};

struct projected_feats {
	string                track_id;
	shared_rows<feat_rec> rows;
	vector<proj_feat_t>   items;
	projection_report     report;
};

// x > xend on a side means that side runs right to left.
struct proj_link_t {
	uint32_t      row;
	int           seq1;
	int           seq2;
	span_t        span1;
	span_t        span2;
	pos_t         x;
	pos_t         xend;
	int           y;
	pos_t         x2;
	pos_t         xend2;
	int           y2;
	orientation_t orientation;
};

struct projected_links {
	string                track_id;
	shared_rows<link_rec> rows;
	vector<proj_link_t>   items;
	projection_report     report;
};

/////////////////////////////////////////////////////////////////

// Finds the displayed sequence that a (bin_id, seq_id, span) reference lands on.
// When a source is split into several loci the one with the largest overlap wins.
class seq_resolver {
public:
	enum class status_t : uint8_t { resolved, unknown, hidden, outside };
	struct hit_t {
		status_t status;
		int      seq;
	};

	explicit seq_resolver(const seq_layout& seqs);
	hit_t resolve(string_view bin_id, string_view seq_id, const span_t& span) const;

private:
	const seq_layout&               _seqs;
	string_map<string, vector<int>> _displayed; // source_id -> indices of displayed seqs
};

// Applies the marginal policy to a span on seq. Returns false if it is dropped.
bool apply_marginal(const seq_t& seq, marginal_t marginal, span_t& span, projection_report& report);

// Record a row that names an unknown sequence (or parent feature).
void note_unresolved(projection_report& report, const string& seq_id);

// Throws reference_error (strict) or logs one aggregated warning (lenient)
// if any rows were unresolved.
void check_unresolved(const projection_report& report, const string& track_id, const char* kind, resolve_policy_t policy,
					  const char* target = "sequences");

projected_feats project_feats(const seq_layout& seqs, const feat_track& track, resolve_policy_t policy, marginal_t marginal);
projected_links project_links(const seq_layout& seqs, const link_track& track, resolve_policy_t policy, marginal_t marginal);

END_NAMESPACE_SK

#endif // __SYNTENY_KIT_PROJECTOR_H__
