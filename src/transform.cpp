/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "transform.h"
#include "util.h"
#include <algorithm>
#include <fmt/format.h>
#include <utility>

BEGIN_NAMESPACE_SK

// Resolves ids to indices with find(id) -> index or -1, rejecting unknown and repeated ids.
template <class F>
static vector<int> resolve_ids(const vector<string>& ids, const char* what, F find)
{
	vector<int> out;
	out.reserve(ids.size());
	for (const auto& id : ids) {
		int i = find(id);
		SK_CHECK(i >= 0, validation, "Unknown {} \"{}\".", what, id);
		SK_CHECK(std::find(out.begin(), out.end(), i) == out.end(), validation, "{} \"{}\" is listed more than once.", what, id);
		out.push_back(i);
	}
	return out;
}

static vector<int> resolve_bins(const seq_layout& seqs, const vector<string>& ids)
{
	return resolve_ids(ids, "bin", [&seqs](const string& id) { return seqs.find_bin(id); });
}

static vector<int> resolve_seqs(const seq_layout& seqs, const vector<string>& ids)
{
	return resolve_ids(ids, "sequence", [&seqs](const string& id) { return seqs.find_seq(id); });
}

layout flip(const layout& in, const vector<string>& ids, flip_target_t target)
{
	auto seqs = in.seqs();
	if (target == flip_target_t::bins) {
		for (int b : resolve_bins(seqs, ids))
			seqs.flip_bin(b);
	} else {
		for (int i : resolve_seqs(seqs, ids))
			seqs.flip_seq(i);
	}
	return in.with_seqs(std::move(seqs));
}

layout pick(const layout& in, const vector<string>& bin_ids)
{
	SK_CHECK(!bin_ids.empty(), validation, "Must pick at least one bin.");
	auto seqs = in.seqs();
	seqs.select_bins(resolve_bins(seqs, bin_ids));
	return in.with_seqs(std::move(seqs));
}

layout pick_seqs(const layout& in, const vector<string>& seq_ids)
{
	SK_CHECK(!seq_ids.empty(), validation, "Must pick at least one sequence.");
	auto seqs = in.seqs();
	seqs.select_seqs(resolve_seqs(seqs, seq_ids));
	return in.with_seqs(std::move(seqs));
}

layout shift(const layout& in, const vector<string>& bin_ids, pos_t by)
{
	auto seqs = in.seqs();
	for (int b : resolve_bins(seqs, bin_ids))
		seqs.shift_bin(b, by);
	return in.with_seqs(std::move(seqs));
}

layout sync(const layout& in, string_view track_id)
{
	const auto& links = in.links(track_id.empty() ? string_view(in.default_links_id()) : track_id);
	auto seqs = in.seqs();

	vector<bool> flipped(seqs.num_bins());
	for (int b = 1; b < seqs.num_bins(); ++b) {
		pos_t colinear = 0, inverted = 0;
		for (const auto& item : links.items) {
			int b1 = seqs.seq(item.seq1).bin_index;
			int b2 = seqs.seq(item.seq2).bin_index;
			if (b1 == b2 || max(b1, b2) != b)
				continue;
			int other = b1 == b ? b2 : b1;
			bool is_inverted = (item.orientation == orientation_t::inverted) != flipped[other];
			(is_inverted ? inverted : colinear) += item.span1.size() + item.span2.size();
		}
		flipped[b] = inverted > colinear;
	}

	for (int b = 0; b < seqs.num_bins(); ++b)
		if (flipped[b])
			seqs.flip_bin(b);
	return in.with_seqs(std::move(seqs));
}

/////////////////////////////////////////////////////////////////

struct focus_target {
	int      seq;
	span_t   span;
	strand_t strand;
};

// Turns focus targets into loci and lays them out in place of their sequences.
static layout focus_targets(const layout& in, vector<focus_target> targets, const focus_options& opts)
{
	SK_CHECK(opts.upstream >= 0 && opts.dnstream >= 0, validation, "Focus margins must be non-negative.");
	SK_CHECK(opts.max_dist >= 0, validation, "Focus max_dist must be non-negative.");

	const auto& seqs = in.seqs();
	for (const auto& locus : opts.loci) {
		int i = seqs.find_seq(locus.seq_id);
		if (i < 0) {
			auto hit = seq_resolver(seqs).resolve({}, locus.seq_id, locus.span);
			SK_CHECK(hit.status == seq_resolver::status_t::resolved, validation,
					 "Locus {}:{} is not on a displayed sequence.", locus.seq_id, locus.span);
			i = hit.seq;
		}
		targets.push_back(focus_target{i, locus.span, pos_strand});
	}
	SK_CHECK(!targets.empty(), validation, "Nothing to focus on: no rows matched and no loci were given.");

	vector<vector<window_t>> windows(seqs.num_seqs());
	for (const auto& t : targets) {
		const auto& s = seqs.seq(t.seq);
		auto w = window_t::from_span(t.span.expand(opts.upstream, opts.dnstream, t.strand)).intersect(s.window);
		if (w.width() > 0)
			windows[t.seq].push_back(w);
	}

	vector<seq_t> focused;
	for (int i = 0; i < seqs.num_seqs(); ++i) {
		const auto& s = seqs.seq(i);
		auto loci = merge_windows(std::move(windows[i]), opts.max_dist);
		if (s.is_flipped())
			std::reverse(loci.begin(), loci.end());  // keep loci in display order
		for (const auto& w : loci) {
			seq_t locus = s;
			locus.window = w;
			if (w != s.window)
				locus.seq_id = fmt::format("{}:{}-{}", s.source_id, w.start + 1, w.end);
			focused.push_back(std::move(locus));
		}
	}
	SK_CHECK(!focused.empty(), validation, "Nothing to focus on: no locus overlaps a displayed sequence.");

	auto out = seqs;
	out.replace_seqs(std::move(focused));
	return in.with_seqs(std::move(out), opts.marginal);
}

layout focus_feats(const layout& in, string_view feats_id, const feat_predicate& pred, const focus_options& opts)
{
	const auto& feats = in.feats(feats_id);
	vector<focus_target> targets;
	if (pred) {
		for (const auto& item : feats.items) {
			const auto& f = (*feats.rows)[item.row];
			if (pred(f))
				targets.push_back(focus_target{item.seq, item.span, f.strand});
		}
	}
	return focus_targets(in, std::move(targets), opts);
}

layout focus_links(const layout& in, string_view links_id, const link_predicate& pred, const focus_options& opts)
{
	const auto& links = in.links(links_id);
	vector<focus_target> targets;
	if (pred) {
		for (const auto& item : links.items) {
			if (pred((*links.rows)[item.row])) {
				targets.push_back(focus_target{item.seq1, item.span1, pos_strand});
				targets.push_back(focus_target{item.seq2, item.span2, pos_strand});
			}
		}
	}
	return focus_targets(in, std::move(targets), opts);
}

layout focus_loci(const layout& in, const focus_options& opts)
{
	return focus_targets(in, {}, opts);
}

/////////////////////////////////////////////////////////////////

span_t identity_coords(const span_t& s) { return s; }

span_t aa_to_nt(const span_t& s) { return span_t{s.start * 3 - 2, s.end * 3}; }

layout add_feats(const layout& in, string track_id, vector<feat_rec> rows)
{
	auto registry = in.registry();
	registry.add_feats(std::move(track_id), std::move(rows));
	return in.with_registry(std::move(registry));
}

layout add_links(const layout& in, string track_id, vector<link_rec> rows)
{
	auto registry = in.registry();
	registry.add_links(std::move(track_id), std::move(rows));
	return in.with_registry(std::move(registry));
}

// Parent features by feat_id. The first of duplicated ids wins.
static string_map<string, const feat_rec*> index_feats(const feat_track& track)
{
	string_map<string, const feat_rec*> index;
	for (const auto& f : *track.rows)
		index.try_emplace(f.feat_id, &f);
	return index;
}

// Places a span given relative to parent's 5' end onto the parent's sequence.
static span_t on_parent(const feat_rec& parent, const span_t& rel, const coord_transform& transform)
{
	auto t = transform(rel);
	SK_CHECK(t.start <= t.end, value, "Sub-feature span {} maps to an empty span {}.", rel, t);
	if (parent.strand == neg_strand)
		return span_t{parent.span.end - t.end + 1, parent.span.end - t.start + 1};
	return span_t{parent.span.start + t.start - 1, parent.span.start + t.end - 1};
}

layout add_subfeats(const layout& in, string_view parent_id, string track_id, const vector<feat_rec>& subfeats,
					const coord_transform& transform)
{
	const auto& parent_track = in.registry().feats(parent_id);
	auto parents = index_feats(parent_track);

	projection_report report;
	report.num_rows = subfeats.size();
	vector<feat_rec> rows;
	for (const auto& sub : subfeats) {
		auto it = parents.find(sub.seq_id);
		if (it == parents.end()) {
			note_unresolved(report, sub.seq_id);
			continue;
		}
		const auto& parent = *it->second;
		feat_rec f   = sub;
		f.seq_id     = parent.seq_id;
		f.bin_id     = parent.bin_id;
		f.parent_id  = parent.feat_id;
		f.span       = on_parent(parent, sub.span, transform);
		f.strand     = sub.strand == no_strand ? parent.strand : combine_strands(parent.strand, sub.strand);
		rows.push_back(std::move(f));
	}
	check_unresolved(report, track_id, "sub-features", in.options().policy, "parent features");
	return add_feats(in, std::move(track_id), std::move(rows));
}

layout add_sublinks(const layout& in, string_view parent_id, string track_id, const vector<link_rec>& sublinks,
					const coord_transform& transform)
{
	const auto& parent_track = in.registry().feats(parent_id);
	auto parents = index_feats(parent_track);

	projection_report report;
	report.num_rows = sublinks.size();
	vector<link_rec> rows;
	for (const auto& sub : sublinks) {
		auto it1 = parents.find(sub.seq_id1);
		auto it2 = parents.find(sub.seq_id2);
		if (it1 == parents.end() || it2 == parents.end()) {
			note_unresolved(report, it1 == parents.end() ? sub.seq_id1 : sub.seq_id2);
			continue;
		}
		const auto& p1 = *it1->second;
		const auto& p2 = *it2->second;
		link_rec l = sub;
		l.seq_id1  = p1.seq_id;
		l.bin_id1  = p1.bin_id;
		l.span1    = on_parent(p1, sub.span1, transform);
		l.seq_id2  = p2.seq_id;
		l.bin_id2  = p2.bin_id;
		l.span2    = on_parent(p2, sub.span2, transform);
		if ((p1.strand == neg_strand) != (p2.strand == neg_strand))
			l.strand = opp_strand(l.strand);
		l.attrs.set("feat_id1", p1.feat_id);
		l.attrs.set("feat_id2", p2.feat_id);
		rows.push_back(std::move(l));
	}
	check_unresolved(report, track_id, "sub-links", in.options().policy, "parent features");
	return add_links(in, std::move(track_id), std::move(rows));
}

layout add_clusters(const layout& in, string_view parent_id, string track_id, const vector<cluster_rec>& clusters)
{
	const auto& parent = in.feats(parent_id);
	const auto& seqs   = in.seqs();
	const auto& rows   = *parent.rows;

	string_map<string, uint32_t> row_of;
	for (uint32_t i = 0; i < rows.size(); ++i)
		row_of.try_emplace(rows[i].feat_id, i);

	// Current position of every visible parent row.
	vector<const proj_feat_t*> visible(rows.size());
	for (const auto& item : parent.items)
		visible[item.row] = &item;

	projection_report report;
	report.num_rows = clusters.size();
	auto annotated = rows;
	vector<string> cluster_ids;                 // in order of first appearance
	string_map<string, vector<uint32_t>> members;
	for (const auto& c : clusters) {
		auto it = row_of.find(c.feat_id);
		if (it == row_of.end()) {
			note_unresolved(report, c.feat_id);
			continue;
		}
		annotated[it->second].attrs.set("cluster_id", c.cluster_id);
		auto [m, inserted] = members.try_emplace(c.cluster_id);
		if (inserted)
			cluster_ids.push_back(c.cluster_id);
		m->second.push_back(it->second);
	}
	check_unresolved(report, track_id, "cluster members", in.options().policy, "features");

	vector<link_rec> links;
	for (const auto& cluster_id : cluster_ids) {
		vector<const proj_feat_t*> shown;
		for (auto row : members[cluster_id])
			if (visible[row])
				shown.push_back(visible[row]);
		std::stable_sort(shown.begin(), shown.end(), [&seqs](const proj_feat_t* a, const proj_feat_t* b) {
			int ba = seqs.seq(a->seq).bin_index, bb = seqs.seq(b->seq).bin_index;
			return ba != bb ? ba < bb : a->x < b->x;
		});
		for (size_t k = 1; k < shown.size(); ++k) {
			const auto* a = shown[k - 1];
			const auto* b = shown[k];
			if (seqs.seq(a->seq).bin_index == seqs.seq(b->seq).bin_index)
				continue;
			const auto& fa = rows[a->row];
			const auto& fb = rows[b->row];
			link_rec l;
			l.seq_id1 = fa.seq_id;
			l.bin_id1 = seqs.seq(a->seq).bin_id;
			l.span1   = fa.span;
			l.seq_id2 = fb.seq_id;
			l.bin_id2 = seqs.seq(b->seq).bin_id;
			l.span2   = fb.span;
			l.strand  = combine_strands(fa.strand, fb.strand);
			l.attrs.set("cluster_id", cluster_id);
			l.attrs.set("feat_id1", fa.feat_id);
			l.attrs.set("feat_id2", fb.feat_id);
			links.push_back(std::move(l));
		}
	}

	auto registry = in.registry();
	registry.replace_feats(parent_id, std::move(annotated));
	registry.add_links(std::move(track_id), std::move(links));
	return in.with_registry(std::move(registry));
}

END_NAMESPACE_SK
