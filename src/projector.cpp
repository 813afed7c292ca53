/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "projector.h"
#include "util.h"
#include <algorithm>
#include <fmt/ranges.h>

BEGIN_NAMESPACE_SK

static constexpr size_t max_reported_ids = 5;

marginal_t as_marginal(string_view s)
{
	if (s == "keep") return marginal_t::keep;
	if (s == "trim") return marginal_t::trim;
	if (s == "drop") return marginal_t::drop;
	SK_THROW(value, "Expected marginal policy \"keep\", \"trim\" or \"drop\" but found \"{}\".", s);
}

const char* marginal_as_str(marginal_t marginal)
{
	switch (marginal) {
	case marginal_t::keep: return "keep";
	case marginal_t::trim: return "trim";
	case marginal_t::drop: return "drop";
	}
	SK_UNREACHABLE();
}

const char* orientation_as_str(orientation_t orientation)
{
	return orientation == orientation_t::colinear ? "colinear" : "inverted";
}

/////////////////////////////////////////////////////////////////

seq_resolver::seq_resolver(const seq_layout& seqs)
: _seqs(seqs)
{
	for (int i = 0; i < seqs.num_seqs(); ++i)
		_displayed[seqs.seq(i).source_id].push_back(i);
}

seq_resolver::hit_t seq_resolver::resolve(string_view bin_id, string_view seq_id, const span_t& span) const
{
	if (!_seqs.is_known_source(bin_id, seq_id))
		return {status_t::unknown, -1};

	auto it = _displayed.find(seq_id);
	if (it == _displayed.end())
		return {status_t::hidden, -1};

	int   best = -1;
	int   num_candidates = 0;
	pos_t best_overlap = 0;
	for (int i : it->second) {
		const auto& s = _seqs.seq(i);
		if (!bin_id.empty() && s.bin_id != bin_id)
			continue;
		if (num_candidates++ == 0 && !s.is_windowed())
			best = i;  // whole sequence; keeps rows lying past its end
		pos_t overlap = s.window.overlap(span);
		if (overlap > best_overlap) {
			best = i;
			best_overlap = overlap;
		}
	}
	if (num_candidates == 0)
		return {status_t::hidden, -1};
	if (best_overlap == 0 && (num_candidates > 1 || best < 0))
		return {status_t::outside, -1};
	return {status_t::resolved, best};
}

/////////////////////////////////////////////////////////////////

bool apply_marginal(const seq_t& seq, marginal_t marginal, span_t& span, projection_report& report)
{
	if (seq.window.contains(span))
		return true;
	switch (marginal) {
	case marginal_t::keep:
		return true;
	case marginal_t::trim:
		if (seq.window.overlap(span) == 0)
			return false;
		span = seq.window.clip(span);
		++report.num_trimmed;
		return true;
	case marginal_t::drop:
		return false;
	}
	SK_UNREACHABLE();
}

void note_unresolved(projection_report& report, const string& seq_id)
{
	++report.num_unresolved;
	auto& ids = report.unresolved_ids;
	if (ids.size() < max_reported_ids && std::find(ids.begin(), ids.end(), seq_id) == ids.end())
		ids.push_back(seq_id);
}

void check_unresolved(const projection_report& report, const string& track_id, const char* kind, resolve_policy_t policy,
					  const char* target)
{
	if (report.num_unresolved == 0)
		return;
	SK_CHECK(policy != resolve_policy_t::strict, reference,
			 "{} of {} {} in track \"{}\" refer to unknown {}, e.g. {}.",
			 report.num_unresolved, report.num_rows, kind, track_id, target, fmt::join(report.unresolved_ids, ", "));
	inform("Warning: dropped {} of {} {} in track \"{}\" that refer to unknown {}, e.g. {}.",
		   report.num_unresolved, report.num_rows, kind, track_id, target, fmt::join(report.unresolved_ids, ", "));
}

// Counts a row that did not resolve; returns false if the caller should skip it.
static bool count_miss(seq_resolver::status_t status, projection_report& report)
{
	using status_t = seq_resolver::status_t;
	switch (status) {
	case status_t::resolved: return true;
	case status_t::hidden:   ++report.num_hidden;  return false;
	case status_t::outside:  ++report.num_outside; return false;
	case status_t::unknown:  return false;  // counted by the caller, which knows the id
	}
	SK_UNREACHABLE();
}

projected_feats project_feats(const seq_layout& seqs, const feat_track& track, resolve_policy_t policy, marginal_t marginal)
{
	projected_feats out{track.id, track.rows, {}, {}};
	auto& report = out.report;
	report.num_rows = track.rows->size();

	seq_resolver resolver(seqs);
	const auto& rows = *track.rows;
	for (size_t i = 0; i < rows.size(); ++i) {
		const auto& f = rows[i];
		auto hit = resolver.resolve(f.bin_id, f.seq_id, f.span);
		if (hit.status == seq_resolver::status_t::unknown)
			note_unresolved(report, f.seq_id);
		if (!count_miss(hit.status, report))
			continue;

		const auto& s = seqs.seq(hit.seq);
		span_t span = f.span;
		if (!apply_marginal(s, marginal, span, report)) {
			++report.num_outside;
			continue;
		}
		auto [lo, hi] = s.project(span);
		out.items.push_back(proj_feat_t{(uint32_t)i, hit.seq, span, lo, hi, s.y});
	}
	check_unresolved(report, track.id, "features", policy);
	return out;
}

projected_links project_links(const seq_layout& seqs, const link_track& track, resolve_policy_t policy, marginal_t marginal)
{
	using status_t = seq_resolver::status_t;

	projected_links out{track.id, track.rows, {}, {}};
	auto& report = out.report;
	report.num_rows = track.rows->size();

	seq_resolver resolver(seqs);
	const auto& rows = *track.rows;
	for (size_t i = 0; i < rows.size(); ++i) {
		const auto& l = rows[i];
		auto hit1 = resolver.resolve(l.bin_id1, l.seq_id1, l.span1);
		auto hit2 = resolver.resolve(l.bin_id2, l.seq_id2, l.span2);
		if (hit1.status == status_t::unknown || hit2.status == status_t::unknown) {
			note_unresolved(report, hit1.status == status_t::unknown ? l.seq_id1 : l.seq_id2);
			continue;
		}
		bool ok1 = count_miss(hit1.status, report);
		bool ok2 = count_miss(hit2.status, report);
		if (!ok1 || !ok2)
			continue;

		// Trims count only for links that are kept.
		const auto& s1 = seqs.seq(hit1.seq);
		const auto& s2 = seqs.seq(hit2.seq);
		span_t span1 = l.span1, span2 = l.span2;
		projection_report sides;
		ok1 = apply_marginal(s1, marginal, span1, sides);
		ok2 = apply_marginal(s2, marginal, span2, sides);
		if (!ok1 || !ok2) {
			++report.num_outside;
			continue;
		}
		report.num_trimmed += sides.num_trimmed;

		bool rev1 = s1.is_flipped();
		bool rev2 = s2.is_flipped() != (l.strand == neg_strand);
		auto [lo1, hi1] = s1.project(span1);
		auto [lo2, hi2] = s2.project(span2);

		proj_link_t item;
		item.row   = (uint32_t)i;
		item.seq1  = hit1.seq;
		item.seq2  = hit2.seq;
		item.span1 = span1;
		item.span2 = span2;
		item.x     = rev1 ? hi1 : lo1;
		item.xend  = rev1 ? lo1 : hi1;
		item.y     = s1.y;
		item.x2    = rev2 ? hi2 : lo2;
		item.xend2 = rev2 ? lo2 : hi2;
		item.y2    = s2.y;
		item.orientation = rev1 == rev2 ? orientation_t::colinear : orientation_t::inverted;
		out.items.push_back(item);
	}
	check_unresolved(report, track.id, "links", policy);
	return out;
}

END_NAMESPACE_SK
