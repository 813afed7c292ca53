/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "accessor.h"
#include "strutil.h"
#include <algorithm>
#include <cstdlib>

BEGIN_NAMESPACE_SK

bool table_view::has(string_view name) const
{
	return std::find(_names.begin(), _names.end(), name) != _names.end();
}

const column_t& table_view::operator[](string_view name) const
{
	auto it = std::find(_names.begin(), _names.end(), name);
	SK_CHECK(it != _names.end(), key, "No column \"{}\".", name);
	return _columns[it - _names.begin()];
}

void table_view::add(string name, column_t column)
{
	size_t n = std::visit([](const auto& c) { return c.size(); }, column);
	SK_ASSERT(_names.empty() || n == _num_rows, "Column \"{}\" has {} rows, expected {}.", name, n, _num_rows);
	SK_ASSERT(!has(name), "Duplicate column \"{}\".", name);
	_num_rows = n;
	_names.push_back(std::move(name));
	_columns.push_back(std::move(column));
}

static bool is_double(const string& s)
{
	char* endptr;
	strtod(s.c_str(), &endptr);
	return !s.empty() && *endptr == '\0';
}

column_t infer_column(vector<string> values)
{
	if (values.empty())
		return string_column(std::move(values));
	if (std::all_of(values.begin(), values.end(), [](const string& v) { return is_int(v); })) {
		int_column out;
		out.reserve(values.size());
		for (const auto& v : values)
			out.push_back(as_int64(v));
		return out;
	}
	if (std::all_of(values.begin(), values.end(), is_double)) {
		double_column out;
		out.reserve(values.size());
		for (const auto& v : values)
			out.push_back(as_double(v));
		return out;
	}
	return string_column(std::move(values));
}

// Appends one column per passthrough name, in order of first appearance.
template <class F>
static void add_attrs(table_view& table, size_t num_rows, F attrs_of)
{
	vector<string> names;
	for (size_t i = 0; i < num_rows; ++i)
		for (const auto& item : attrs_of(i))
			if (std::find(names.begin(), names.end(), item.first) == names.end())
				names.push_back(item.first);

	for (const auto& name : names) {
		if (table.has(name))
			continue;  // a passthrough column never shadows a layout column
		vector<string> values;
		values.reserve(num_rows);
		for (size_t i = 0; i < num_rows; ++i) {
			const auto* v = attrs_of(i).find(name);
			values.push_back(v ? *v : string());
		}
		table.add(name, infer_column(std::move(values)));
	}
}

static string strand_str(strand_t s) { return string(1, strand_as_char(s)); }

/////////////////////////////////////////////////////////////////

table_view get_seqs(const layout& lay)
{
	const auto& seqs = lay.seqs().seqs();
	string_column seq_id, bin_id, source_id, strand;
	int_column length, start, end, shift, bin_index, seq_index, x_offset, x, xend, y;
	for (const auto& s : seqs) {
		seq_id.push_back(s.seq_id);
		bin_id.push_back(s.bin_id);
		source_id.push_back(s.source_id);
		length.push_back(s.length);
		start.push_back(s.window.start);
		end.push_back(s.window.end);
		strand.push_back(strand_str(s.strand));
		shift.push_back(lay.seqs().bins()[s.bin_index].shift);
		bin_index.push_back(s.bin_index);
		seq_index.push_back(s.seq_index);
		x_offset.push_back(s.x_offset);
		x.push_back(s.x());
		xend.push_back(s.xend());
		y.push_back(s.y);
	}

	table_view out;
	out.add("seq_id", std::move(seq_id));
	out.add("bin_id", std::move(bin_id));
	out.add("source_id", std::move(source_id));
	out.add("length", std::move(length));
	out.add("start", std::move(start));
	out.add("end", std::move(end));
	out.add("strand", std::move(strand));
	out.add("shift", std::move(shift));
	out.add("bin_index", std::move(bin_index));
	out.add("seq_index", std::move(seq_index));
	out.add("x_offset", std::move(x_offset));
	out.add("x", std::move(x));
	out.add("xend", std::move(xend));
	out.add("y", std::move(y));
	add_attrs(out, seqs.size(), [&seqs](size_t i) -> const attr_map& { return seqs[i].attrs; });
	return out;
}

table_view get_bins(const layout& lay)
{
	const auto& seqs = lay.seqs();
	string_column bin_id;
	int_column bin_index, y, num_rows, x, xend;
	for (int b = 0; b < seqs.num_bins(); ++b) {
		const auto& bin = seqs.bins()[b];
		pos_t lo = 0, hi = 0;
		for (int i = 0; i < bin.num_seqs; ++i) {
			const auto& s = seqs.seq(bin.first_seq + i);
			lo = i == 0 ? s.x() : min(lo, s.x());
			hi = i == 0 ? s.xend() : max(hi, s.xend());
		}
		bin_id.push_back(bin.bin_id);
		bin_index.push_back(b);
		y.push_back(bin.y);
		num_rows.push_back(bin.num_rows);
		x.push_back(lo);
		xend.push_back(hi);
	}

	table_view out;
	out.add("bin_id", std::move(bin_id));
	out.add("bin_index", std::move(bin_index));
	out.add("y", std::move(y));
	out.add("num_rows", std::move(num_rows));
	out.add("x", std::move(x));
	out.add("xend", std::move(xend));
	return out;
}

table_view get_feats(const layout& lay, string_view track_id)
{
	const auto& proj = lay.feats(track_id.empty() ? string_view(lay.default_feats_id()) : track_id);
	const auto& rows = *proj.rows;
	const auto& seqs = lay.seqs();

	string_column feat_id, seq_id, bin_id, strand, parent_id, track;
	int_column start, end, x, xend, y;
	for (const auto& item : proj.items) {
		const auto& f = rows[item.row];
		feat_id.push_back(f.feat_id);
		seq_id.push_back(f.seq_id);
		bin_id.push_back(seqs.seq(item.seq).bin_id);
		start.push_back(item.span.start);
		end.push_back(item.span.end);
		strand.push_back(strand_str(f.strand));
		parent_id.push_back(f.parent_id);
		track.push_back(proj.track_id);
		x.push_back(item.x);
		xend.push_back(item.xend);
		y.push_back(item.y);
	}

	table_view out;
	out.add("feat_id", std::move(feat_id));
	out.add("seq_id", std::move(seq_id));
	out.add("bin_id", std::move(bin_id));
	out.add("start", std::move(start));
	out.add("end", std::move(end));
	out.add("strand", std::move(strand));
	out.add("parent_id", std::move(parent_id));
	out.add("track_id", std::move(track));
	out.add("x", std::move(x));
	out.add("xend", std::move(xend));
	out.add("y", std::move(y));
	add_attrs(out, proj.items.size(), [&](size_t i) -> const attr_map& { return rows[proj.items[i].row].attrs; });
	return out;
}

table_view get_links(const layout& lay, string_view track_id)
{
	const auto& proj = lay.links(track_id.empty() ? string_view(lay.default_links_id()) : track_id);
	const auto& rows = *proj.rows;
	const auto& seqs = lay.seqs();

	string_column seq_id1, bin_id1, seq_id2, bin_id2, strand, track, orientation;
	int_column start1, end1, start2, end2, x, xend, y, x2, xend2, y2;
	for (const auto& item : proj.items) {
		const auto& l = rows[item.row];
		seq_id1.push_back(l.seq_id1);
		bin_id1.push_back(seqs.seq(item.seq1).bin_id);
		start1.push_back(item.span1.start);
		end1.push_back(item.span1.end);
		seq_id2.push_back(l.seq_id2);
		bin_id2.push_back(seqs.seq(item.seq2).bin_id);
		start2.push_back(item.span2.start);
		end2.push_back(item.span2.end);
		strand.push_back(strand_str(l.strand));
		track.push_back(proj.track_id);
		x.push_back(item.x);
		xend.push_back(item.xend);
		y.push_back(item.y);
		x2.push_back(item.x2);
		xend2.push_back(item.xend2);
		y2.push_back(item.y2);
		orientation.push_back(orientation_as_str(item.orientation));
	}

	table_view out;
	out.add("seq_id1", std::move(seq_id1));
	out.add("bin_id1", std::move(bin_id1));
	out.add("start1", std::move(start1));
	out.add("end1", std::move(end1));
	out.add("seq_id2", std::move(seq_id2));
	out.add("bin_id2", std::move(bin_id2));
	out.add("start2", std::move(start2));
	out.add("end2", std::move(end2));
	out.add("strand", std::move(strand));
	out.add("track_id", std::move(track));
	out.add("x", std::move(x));
	out.add("xend", std::move(xend));
	out.add("y", std::move(y));
	out.add("x2", std::move(x2));
	out.add("xend2", std::move(xend2));
	out.add("y2", std::move(y2));
	out.add("orientation", std::move(orientation));
	add_attrs(out, proj.items.size(), [&](size_t i) -> const attr_map& { return rows[proj.items[i].row].attrs; });
	return out;
}

table_view track_info(const layout& lay)
{
	string_column track_id, type;
	int_column num_rows, num_visible, num_unresolved, num_hidden, num_outside;
	auto add_row = [&](const string& id, track_type_t t, const projection_report& r, size_t visible) {
		track_id.push_back(id);
		type.push_back(track_type_as_str(t));
		num_rows.push_back((int64_t)r.num_rows);
		num_visible.push_back((int64_t)visible);
		num_unresolved.push_back((int64_t)r.num_unresolved);
		num_hidden.push_back((int64_t)r.num_hidden);
		num_outside.push_back((int64_t)r.num_outside);
	};

	projection_report seqs_report;
	seqs_report.num_rows = lay.registry().has_seqs() ? lay.registry().seqs()->size() : (size_t)lay.seqs().num_seqs();
	add_row("seqs", track_type_t::seqs, seqs_report, (size_t)lay.seqs().num_seqs());
	for (const auto& p : lay.feat_projections())
		add_row(p.track_id, track_type_t::feats, p.report, p.items.size());
	for (const auto& p : lay.link_projections())
		add_row(p.track_id, track_type_t::links, p.report, p.items.size());

	table_view out;
	out.add("track_id", std::move(track_id));
	out.add("type", std::move(type));
	out.add("num_rows", std::move(num_rows));
	out.add("num_visible", std::move(num_visible));
	out.add("num_unresolved", std::move(num_unresolved));
	out.add("num_hidden", std::move(num_hidden));
	out.add("num_outside", std::move(num_outside));
	return out;
}

END_NAMESPACE_SK
