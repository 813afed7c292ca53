/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "seq_layout.h"
#include "util.h"
#include <algorithm>
#include <iterator>
#include <numeric>

BEGIN_NAMESPACE_SK

int seq_layout::find_seq(string_view bin_id, string_view seq_id) const
{
	int found = -1;
	for (int i = 0; i < num_seqs(); ++i) {
		const auto& s = _seqs[i];
		if (s.seq_id != seq_id || (!bin_id.empty() && s.bin_id != bin_id))
			continue;
		SK_CHECK(found < 0, validation, "Sequence \"{}\" is shown in bins \"{}\" and \"{}\"; refer to it as \"<bin_id>/{}\".",
				 seq_id, _seqs[found].bin_id, s.bin_id, seq_id);
		found = i;
	}
	return found;
}

int seq_layout::find_seq(string_view ref) const
{
	int i = find_seq({}, ref);
	auto slash = ref.find('/');
	if (i < 0 && slash != string_view::npos)
		i = find_seq(ref.substr(0, slash), ref.substr(slash + 1));
	return i;
}

int seq_layout::find_bin(string_view bin_id) const
{
	auto it = std::find_if(_bins.begin(), _bins.end(), [bin_id](const bin_t& b) { return b.bin_id == bin_id; });
	return it != _bins.end() ? (int)(it - _bins.begin()) : -1;
}

bool seq_layout::is_known_source(string_view bin_id, string_view source_id) const
{
	if (!_sources)
		return false;
	auto it = _sources->find(source_id);
	if (it == _sources->end())
		return false;
	return bin_id.empty() || std::find(it->second.begin(), it->second.end(), bin_id) != it->second.end();
}

seq_layout seq_layout::from_seqs(vector<seq_t> seqs, pos_t spacing, pos_t wrap, const string_map<string, pos_t>& shifts)
{
	SK_CHECK(spacing >= 0, configuration, "Spacing must be non-negative, not {}.", spacing);
	SK_CHECK(wrap >= 0, configuration, "Wrap width must be non-negative, not {}.", wrap);

	auto sources = std::make_shared<string_map<string, vector<string>>>();
	for (const auto& s : seqs) {
		auto& bins = (*sources)[s.source_id];
		if (std::find(bins.begin(), bins.end(), s.bin_id) == bins.end())
			bins.push_back(s.bin_id);
	}

	seq_layout out;
	out._spacing = spacing;
	out._wrap    = wrap;
	out._sources = std::move(sources);
	out.regroup(std::move(seqs), shifts);
	return out;
}

void seq_layout::regroup(vector<seq_t> seqs, const string_map<string, pos_t>& shifts)
{
	string_set<string> keys;
	for (const auto& s : seqs)
		SK_CHECK(keys.insert(s.bin_id + '\t' + s.seq_id).second, configuration,
				 "Sequence \"{}\" appears more than once in bin \"{}\".", s.seq_id, s.bin_id);

	vector<vector<seq_t>> groups;
	string_map<string, size_t> group_of;
	for (auto& s : seqs) {
		auto [it, inserted] = group_of.try_emplace(s.bin_id, groups.size());
		if (inserted)
			groups.emplace_back();
		groups[it->second].push_back(std::move(s));
	}

	_seqs.clear();
	_bins.clear();
	for (auto& group : groups) {
		bin_t bin;
		bin.bin_id    = group.front().bin_id;
		bin.shift     = find_or(shifts, bin.bin_id, pos_t{0});
		bin.first_seq = (int)_seqs.size();
		bin.num_seqs  = (int)group.size();
		_bins.push_back(std::move(bin));
		std::move(group.begin(), group.end(), std::back_inserter(_seqs));
	}
	arrange();
}

void seq_layout::arrange()
{
	int y = 0;
	for (int b = 0; b < num_bins(); ++b) {
		auto& bin = _bins[b];
		bin.y = y;
		pos_t x = 0;
		int row = 0;
		for (int i = 0; i < bin.num_seqs; ++i) {
			auto& s = _seqs[bin.first_seq + i];
			if (_wrap > 0 && i > 0 && x + s.width() > _wrap) {
				++row;
				x = 0;
			}
			s.bin_index = b;
			s.seq_index = i;
			s.x_offset  = bin.shift + x;
			s.y         = y + row;
			x += s.width() + _spacing;
		}
		bin.num_rows = row + 1;
		y += bin.num_rows;
	}
}

static string_map<string, pos_t> bin_shifts(const vector<bin_t>& bins)
{
	string_map<string, pos_t> shifts;
	for (const auto& b : bins)
		shifts[b.bin_id] = b.shift;
	return shifts;
}

void seq_layout::select_bins(const vector<int>& order)
{
	vector<seq_t> seqs;
	for (int b : order) {
		SK_ASSERT(b >= 0 && b < num_bins());
		const auto& bin = _bins[b];
		std::copy_n(_seqs.begin() + bin.first_seq, bin.num_seqs, std::back_inserter(seqs));
	}
	regroup(std::move(seqs), bin_shifts(_bins));
}

void seq_layout::select_seqs(const vector<int>& order)
{
	vector<seq_t> seqs;
	seqs.reserve(order.size());
	for (int i : order) {
		SK_ASSERT(i >= 0 && i < num_seqs());
		seqs.push_back(_seqs[i]);
	}
	regroup(std::move(seqs), bin_shifts(_bins));
}

void seq_layout::flip_seq(int i)
{
	SK_ASSERT(i >= 0 && i < num_seqs());
	_seqs[i].strand = opp_strand(_seqs[i].strand);
	arrange();
}

void seq_layout::flip_bin(int b)
{
	SK_ASSERT(b >= 0 && b < num_bins());
	auto first = _seqs.begin() + _bins[b].first_seq;
	auto last  = first + _bins[b].num_seqs;
	for (auto it = first; it != last; ++it)
		it->strand = opp_strand(it->strand);
	std::reverse(first, last);
	arrange();
}

void seq_layout::shift_bin(int b, pos_t by)
{
	SK_ASSERT(b >= 0 && b < num_bins());
	_bins[b].shift += by;
	arrange();
}

void seq_layout::replace_seqs(vector<seq_t> seqs)
{
	regroup(std::move(seqs), bin_shifts(_bins));
}

/////////////////////////////////////////////////////////////////

// Indices 0..n-1 with the listed ids first (in the given order), the rest after.
// find(id) returns an index or -1.
template <class F>
static vector<int> listed_first(int n, const vector<string>& order, const char* what, F find)
{
	vector<int> out;
	vector<bool> used(n);
	for (const auto& id : order) {
		int i = find(id);
		SK_CHECK(i >= 0, validation, "Unknown {} \"{}\" in {} order.", what, id, what);
		SK_CHECK(!used[i], validation, "{} \"{}\" is listed more than once.", what, id);
		used[i] = true;
		out.push_back(i);
	}
	for (int i = 0; i < n; ++i)
		if (!used[i])
			out.push_back(i);
	return out;
}

static seq_t as_seq(const seq_rec& rec)
{
	seq_t s;
	s.seq_id    = rec.seq_id;
	s.bin_id    = rec.bin_id.empty() ? rec.seq_id : rec.bin_id;
	s.source_id = rec.source_id.empty() ? rec.seq_id : rec.source_id;
	s.length    = rec.length;
	s.window    = rec.window.value_or(window_t{0, rec.length});
	s.strand    = rec.strand == neg_strand ? neg_strand : pos_strand;
	s.attrs     = rec.attrs;
	return s;
}

// Observed extent of each (bin_id, seq_id), in order of first appearance.
class seq_inferrer {
public:
	void observe(string_view bin_id, string_view seq_id, const span_t& span)
	{
		string bin = bin_id.empty() ? string(seq_id) : string(bin_id);
		auto [it, inserted] = _index.try_emplace(bin + '\t' + string(seq_id), _extents.size());
		if (inserted) {
			_extents.push_back(extent_t{std::move(bin), string(seq_id), span.start, span.end});
		} else {
			auto& e = _extents[it->second];
			e.min_start = min(e.min_start, span.start);
			e.max_end   = max(e.max_end, span.end);
		}
	}

	vector<seq_t> seqs(infer_start_t infer_start) const
	{
		vector<seq_t> out;
		for (const auto& e : _extents) {
			seq_t s;
			s.seq_id = s.source_id = e.seq_id;
			s.bin_id = e.bin_id;
			s.length = max<pos_t>(e.max_end, 0);
			s.window = window_t{infer_start == infer_start_t::zero ? 0 : std::clamp<pos_t>(e.min_start - 1, 0, s.length), s.length};
			out.push_back(std::move(s));
		}
		return out;
	}

	INLINE bool empty() const { return _extents.empty(); }

private:
	struct extent_t {
		string bin_id;
		string seq_id;
		pos_t  min_start;
		pos_t  max_end;
	};
	vector<extent_t>           _extents;
	string_map<string, size_t> _index;
};

static vector<seq_t> infer_seqs(const track_registry& registry, infer_start_t infer_start)
{
	seq_inferrer inferrer;
	for (const auto& track : registry.feat_tracks()) {
		for (const auto& f : *track.rows)
			inferrer.observe(f.bin_id, f.seq_id, f.span);
		if (!inferrer.empty()) {
			inform("No seqs provided, inferring seqs from feats \"{}\".", track.id);
			return inferrer.seqs(infer_start);
		}
	}
	for (const auto& track : registry.link_tracks()) {
		for (const auto& l : *track.rows) {
			inferrer.observe(l.bin_id1, l.seq_id1, l.span1);
			inferrer.observe(l.bin_id2, l.seq_id2, l.span2);
		}
		if (!inferrer.empty()) {
			inform("No seqs provided, inferring seqs from links \"{}\".", track.id);
			return inferrer.seqs(infer_start);
		}
	}
	SK_THROW(configuration, "Need seqs, feats or links to lay out sequences.");
}

seq_layout layout_sequences(const track_registry& registry, const layout_options& options)
{
	vector<seq_t> seqs;
	string_map<string, pos_t> shifts;
	if (registry.has_seqs()) {
		for (const auto& rec : *registry.seqs()) {
			seqs.push_back(as_seq(rec));
			const auto& bin_id = seqs.back().bin_id;
			auto it = shifts.try_emplace(bin_id, rec.shift).first;
			SK_CHECK(it->second == rec.shift, configuration,
					 "Bin \"{}\" has sequences with different shifts ({} and {}).", bin_id, it->second, rec.shift);
		}
		SK_CHECK(!seqs.empty(), configuration, "The sequence table is empty.");
	} else {
		seqs = infer_seqs(registry, options.infer_start);
	}

	auto out = seq_layout::from_seqs(std::move(seqs), options.spacing, options.wrap, shifts);

	if (!options.bin_order.empty())
		out.select_bins(listed_first(out.num_bins(), options.bin_order, "bin",
									 [&out](const string& id) { return out.find_bin(id); }));

	if (!options.seq_order.empty()) {
		auto order = listed_first(out.num_seqs(), options.seq_order, "sequence",
								  [&out](const string& id) { return out.find_seq(id); });
		vector<int> rank(order.size());
		for (int k = 0; k < (int)order.size(); ++k)
			rank[order[k]] = k;

		// Sequences move only within their bin.
		vector<int> idx(order.size());
		std::iota(idx.begin(), idx.end(), 0);
		std::stable_sort(idx.begin(), idx.end(), [&](int a, int b) {
			const auto& sa = out.seq(a);
			const auto& sb = out.seq(b);
			return sa.bin_index != sb.bin_index ? sa.bin_index < sb.bin_index : rank[a] < rank[b];
		});
		out.select_seqs(idx);
	}
	return out;
}

END_NAMESPACE_SK
