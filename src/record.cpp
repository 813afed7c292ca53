/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "record.h"
#include "util.h"
#include <algorithm>
#include <utility>

BEGIN_NAMESPACE_SK

void attr_map::set(string_view name, string value)
{
	for (auto& item : _items) {
		if (item.first == name) {
			item.second = std::move(value);
			return;
		}
	}
	_items.emplace_back(string(name), std::move(value));
}

const string* attr_map::find(string_view name) const
{
	auto it = std::find_if(_items.begin(), _items.end(), [name](const item_t& item) { return item.first == name; });
	return it != _items.end() ? &it->second : nullptr;
}

const string& attr_map::get(string_view name) const
{
	auto value = find(name);
	SK_CHECK(value, key, "No column \"{}\".", name);
	return *value;
}

///////////////////////////////////////////////////////////////////////

int raw_table::col(string_view name) const
{
	auto it = std::find(columns.begin(), columns.end(), name);
	return it != columns.end() ? (int)(it - columns.begin()) : -1;
}

void raw_table::require(std::initializer_list<const char*> names, const char* role) const
{
	for (auto name : names)
		SK_CHECK(col(name) >= 0, configuration, "{} table {} is missing required column \"{}\".", role, source, name);
}

// Cell access by column index for one row; absent columns read as empty.
class row_cursor {
public:
	row_cursor(const raw_table& table, const string_set<string>& reserved): _table(table)
	{
		for (int c = 0; c < (int)table.columns.size(); ++c)
			if (!reserved.contains(table.columns[c]))
				_extra.push_back(c);
	}

	INLINE void seek(size_t row) { _row = &_table.rows[row]; }

	INLINE string_view operator[](int c) const
	{
		return c >= 0 && c < (int)_row->size() ? string_view((*_row)[c]) : string_view();
	}

	void fill_attrs(attr_map& attrs) const
	{
		for (int c : _extra)
			attrs.set(_table.columns[c], string((*this)[c]));
	}

private:
	const raw_table&      _table;
	const vector<string>* _row{};
	vector<int>           _extra;
};

// Converts each row with fn, prefixing value errors with the table source and row number.
template <class T, class F>
static vector<T> convert_rows(const raw_table& table, const string_set<string>& reserved, F fn)
{
	vector<T> out;
	out.reserve(table.rows.size());
	row_cursor cursor(table, reserved);
	for (size_t i = 0; i < table.rows.size(); ++i) {
		cursor.seek(i);
		try {
			out.push_back(fn(cursor));
			cursor.fill_attrs(out.back().attrs);
		} catch (const value_error& e) {
			SK_THROW(value, "{}: row {}: {}", table.source, i + 1, e.message());
		}
	}
	return out;
}

static string nonempty_id(string_view s, const char* column)
{
	s = strip(s);
	SK_CHECK(!s.empty(), value, "Empty \"{}\".", column);
	return string(s);
}

static span_t as_span(string_view start, string_view end)
{
	return span_t{as_pos(start), as_pos(end)};
}

vector<seq_rec> seqs_from_table(const raw_table& table)
{
	table.require({"seq_id", "length"}, "Sequence");
	static const string_set<string> reserved = {"seq_id", "bin_id", "source_id", "length", "strand", "start", "end", "shift"};
	int c_seq = table.col("seq_id"), c_bin = table.col("bin_id"), c_src = table.col("source_id");
	int c_len = table.col("length"), c_strand = table.col("strand"), c_shift = table.col("shift");
	int c_start = table.col("start"), c_end = table.col("end");

	return convert_rows<seq_rec>(table, reserved, [&](const row_cursor& row) {
		seq_rec seq;
		seq.seq_id    = nonempty_id(row[c_seq], "seq_id");
		seq.bin_id    = row[c_bin].empty()    ? seq.seq_id : string(row[c_bin]);
		seq.source_id = row[c_src].empty()    ? seq.seq_id : string(row[c_src]);
		seq.length    = as_pos(row[c_len]);
		seq.shift     = row[c_shift].empty()  ? 0 : as_pos(row[c_shift]);
		seq.strand    = row[c_strand].empty() ? pos_strand : as_strand(row[c_strand]);
		if (seq.strand == no_strand)
			seq.strand = pos_strand;
		SK_CHECK(seq.length >= 0, value, "Sequence \"{}\" has negative length {}.", seq.seq_id, seq.length);
		if (!row[c_start].empty() || !row[c_end].empty()) {
			window_t w{row[c_start].empty() ? 0 : as_pos(row[c_start]),
					   row[c_end].empty() ? seq.length : as_pos(row[c_end])};
			SK_CHECK(0 <= w.start && w.start <= w.end && w.end <= seq.length, value,
					 "Sequence \"{}\" window [{}, {}) is not within [0, {}).", seq.seq_id, w.start, w.end, seq.length);
			seq.window = w;
		}
		return seq;
	});
}

vector<feat_rec> feats_from_table(const raw_table& table)
{
	table.require({"seq_id", "start", "end"}, "Feature");
	static const string_set<string> reserved = {"feat_id", "seq_id", "bin_id", "start", "end", "strand", "parent_id"};
	int c_feat = table.col("feat_id"), c_seq = table.col("seq_id"), c_bin = table.col("bin_id");
	int c_start = table.col("start"), c_end = table.col("end"), c_strand = table.col("strand");
	int c_parent = table.col("parent_id");

	return convert_rows<feat_rec>(table, reserved, [&](const row_cursor& row) {
		feat_rec feat;
		feat.feat_id   = string(strip(row[c_feat]));
		feat.seq_id    = nonempty_id(row[c_seq], "seq_id");
		feat.bin_id    = string(strip(row[c_bin]));
		feat.span      = as_span(row[c_start], row[c_end]);
		feat.strand    = as_strand(row[c_strand]);
		feat.parent_id = string(strip(row[c_parent]));
		SK_CHECK(feat.span.start <= feat.span.end, value, "Feature on \"{}\" has start {} > end {}.",
				 feat.seq_id, feat.span.start, feat.span.end);
		return feat;
	});
}

vector<link_rec> links_from_table(const raw_table& table)
{
	table.require({"seq_id1", "start1", "end1", "seq_id2", "start2", "end2"}, "Link");
	static const string_set<string> reserved = {"seq_id1", "bin_id1", "start1", "end1", "seq_id2", "bin_id2",
												"start2", "end2", "strand"};
	int c_seq1 = table.col("seq_id1"), c_bin1 = table.col("bin_id1");
	int c_start1 = table.col("start1"), c_end1 = table.col("end1");
	int c_seq2 = table.col("seq_id2"), c_bin2 = table.col("bin_id2");
	int c_start2 = table.col("start2"), c_end2 = table.col("end2");
	int c_strand = table.col("strand");

	return convert_rows<link_rec>(table, reserved, [&](const row_cursor& row) {
		link_rec link;
		link.seq_id1 = nonempty_id(row[c_seq1], "seq_id1");
		link.bin_id1 = string(strip(row[c_bin1]));
		link.span1   = as_span(row[c_start1], row[c_end1]);
		link.seq_id2 = nonempty_id(row[c_seq2], "seq_id2");
		link.bin_id2 = string(strip(row[c_bin2]));
		link.span2   = as_span(row[c_start2], row[c_end2]);
		link.strand  = as_strand(row[c_strand]);
		if (link.strand == no_strand)
			link.strand = pos_strand;
		normalize_link(link);
		return link;
	});
}

vector<cluster_rec> clusters_from_table(const raw_table& table)
{
	table.require({"cluster_id", "feat_id"}, "Cluster");
	int c_cluster = table.col("cluster_id"), c_feat = table.col("feat_id");

	vector<cluster_rec> out;
	out.reserve(table.rows.size());
	for (size_t i = 0; i < table.rows.size(); ++i) {
		const auto& row = table.rows[i];
		SK_CHECK((int)row.size() > std::max(c_cluster, c_feat), value, "{}: row {}: too few columns.", table.source, i + 1);
		SK_CHECK(!strip(row[c_feat]).empty(), value, "{}: row {}: empty \"feat_id\".", table.source, i + 1);
		out.push_back(cluster_rec{string(strip(row[c_cluster])), string(strip(row[c_feat]))});
	}
	return out;
}

///////////////////////////////////////////////////////////////////////

void normalize_link(link_rec& link)
{
	// Aligners report reverse hits with start > end on one side.
	if (link.span1.start > link.span1.end) {
		std::swap(link.span1.start, link.span1.end);
		link.strand = opp_strand(link.strand);
	}
	if (link.span2.start > link.span2.end) {
		std::swap(link.span2.start, link.span2.end);
		link.strand = opp_strand(link.strand);
	}
}

vector<link_rec> swap_query(vector<link_rec> links)
{
	if (links.empty())
		return links;

	// All rows of a table carry the same passthrough columns.
	vector<std::pair<string, string>> pairs;
	const auto& first = links.front().attrs;
	for (const auto& item : first) {
		const string& name = item.first;
		if (endswith(name, "2"))
			continue;
		string base = endswith(name, "1") && !first.contains(name + "2") ? name.substr(0, name.size() - 1) : name;
		if (first.contains(base + "2"))
			pairs.emplace_back(name, base + "2");
	}

	for (auto& link : links) {
		std::swap(link.seq_id1, link.seq_id2);
		std::swap(link.bin_id1, link.bin_id2);
		std::swap(link.span1, link.span2);
		for (const auto& [a, b] : pairs) {
			string value = link.attrs.get(a);
			link.attrs.set(a, link.attrs.get(b));
			link.attrs.set(b, std::move(value));
		}
	}

	if (!pairs.empty()) {
		string names;
		for (const auto& [a, b] : pairs)
			names += fmt::format(" {}/{}", a, b);
		inform("Swapping query/subject-associated columns:{}", names);
	}
	return links;
}

END_NAMESPACE_SK
