/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
// This file is only included when compiled as an executable,
// not when included as a python extension. It's intended to
// run built-in C++ unit tests.
#ifdef _WANT_MAIN

#include "synteny_kit.h"
#include "file.h"
#include "strutil.h"
#include "util.h"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fmt/ranges.h>
#include <fstream>
#include <memory>
#include <typeinfo>
#include <vector>

USING_NAMESPACE_SK

using std::ofstream;

static const string data_dir = "tests/data/";

template <class E, class F>
void expect_error(F fn, const char* what)
{
	try {
		(void)fn();
	} catch (const E&) {
		return;
	}
	SK_THROW(assertion, "Expected {} to throw.", what);
}

static void expect_ints(const table_view& t, const char* name, const int_column& expected)
{
	const auto& actual = t.get<int64_t>(name);
	SK_CHECK(actual == expected, assertion, "Column {}: expected [{}] but found [{}].", name,
			 fmt::join(expected, ", "), fmt::join(actual, ", "));
}

static void expect_strs(const table_view& t, const char* name, const string_column& expected)
{
	const auto& actual = t.get<string>(name);
	SK_CHECK(actual == expected, assertion, "Column {}: expected [{}] but found [{}].", name,
			 fmt::join(expected, ", "), fmt::join(actual, ", "));
}

static seq_rec make_seq(const string& seq_id, const string& bin_id, pos_t length)
{
	seq_rec s;
	s.seq_id    = seq_id;
	s.bin_id    = bin_id;
	s.source_id = seq_id;
	s.length    = length;
	return s;
}

static feat_rec make_feat(const string& seq_id, pos_t start, pos_t end, strand_t strand = pos_strand, const string& feat_id = {})
{
	feat_rec f;
	f.feat_id = feat_id;
	f.seq_id  = seq_id;
	f.span    = span_t{start, end};
	f.strand  = strand;
	return f;
}

static link_rec make_link(const string& seq_id1, pos_t start1, pos_t end1,
						  const string& seq_id2, pos_t start2, pos_t end2, strand_t strand = pos_strand)
{
	link_rec l;
	l.seq_id1 = seq_id1;
	l.span1   = span_t{start1, end1};
	l.seq_id2 = seq_id2;
	l.span2   = span_t{start2, end2};
	l.strand  = strand;
	return l;
}

// A(100) and B(50) in one bin, one feature on B at 10-20.
static layout example_layout(resolve_policy_t policy = resolve_policy_t::lenient)
{
	track_registry reg;
	reg.set_seqs({make_seq("A", "1", 100), make_seq("B", "1", 50)});
	reg.add_feats("feats", {make_feat("B", 10, 20, pos_strand, "f1")});
	layout_options opts;
	opts.policy = policy;
	return layout::make(std::move(reg), std::move(opts));
}

// Three genomes from tests/data; one feature names an unknown sequence.
static layout genomes_layout(layout_options opts = {})
{
	track_registry reg;
	reg.set_seqs(read_seqs_table(data_dir + "seqs.tsv"));
	reg.add_feats("genes", read_feats_table(data_dir + "feats.tsv"));
	reg.add_links("links", read_links_table(data_dir + "links.tsv"));
	return layout::make(std::move(reg), std::move(opts));
}

// Selected columns of a table_view as a raw table of strings.
static raw_table as_raw_table(const table_view& t, const vector<string>& names)
{
	raw_table out;
	out.source  = "<table_view>";
	out.columns = names;
	out.rows.resize(t.num_rows());
	for (const auto& name : names) {
		std::visit([&out](const auto& col) {
			for (size_t r = 0; r < col.size(); ++r)
				out.rows[r].push_back(fmt::format("{}", col[r]));
		}, t[name]);
	}
	return out;
}

static void write_text(const string& path, const char* text)
{
	ofstream out(path, std::ios::binary);
	out << text;
	SK_CHECK(out.good(), file, "Could not write {}.", path);
}

/////////////////////////////////////////////////////////////////

void interval_test()
{
	span_t s{101, 400};
	SK_ASSERT(s.size() == 300);
	SK_ASSERT((s.expand(50, 10, pos_strand) == span_t{51, 410}));
	SK_ASSERT((s.expand(50, 10, neg_strand) == span_t{91, 450}));

	window_t w{200, 700};
	SK_ASSERT(w.overlap(s) == 200);
	SK_ASSERT((w.clip(s) == span_t{201, 400}));
	SK_ASSERT(!w.contains(s));
	SK_ASSERT((w.contains(span_t{201, 700})));
	SK_ASSERT((w.overlap(span_t{701, 800}) == 0));
	SK_ASSERT((window_t::from_span(s) == window_t{100, 400}));

	auto merged = merge_windows({{330, 400}, {200, 300}, {500, 600}}, 30);
	SK_ASSERT(merged.size() == 2);
	SK_ASSERT((merged[0] == window_t{200, 400}));
	SK_ASSERT((merged[1] == window_t{500, 600}));
	SK_ASSERT(merge_windows({{200, 300}, {331, 400}}, 30).size() == 2);

	SK_ASSERT(as_strand("-") == neg_strand);
	SK_ASSERT(as_strand("") == no_strand);
	SK_ASSERT(as_strand('.') == no_strand);
	SK_ASSERT(opp_strand(no_strand) == no_strand);
	SK_ASSERT(combine_strands(neg_strand, neg_strand) == pos_strand);
	SK_ASSERT(combine_strands(pos_strand, neg_strand) == neg_strand);
	expect_error<value_error>([] { return as_strand("x"); }, "as_strand(\"x\")");
	expect_error<value_error>([] { return as_pos("12a"); }, "as_pos(\"12a\")");
	SK_ASSERT(as_pos(" +42 ") == 42);
}

void line_reader_test()
{
	const string path = "synteny_kit_test_lines.txt";
	write_text(path, "a\r\nb\n\nc");
	vector<string> lines;
	for (zline_reader lr(path); !lr.done(); ++lr)
		lines.emplace_back(lr.line());
	std::remove(path.c_str());
	SK_ASSERT(lines.size() == 4, "read {} lines", lines.size());
	SK_ASSERT(lines[0] == "a" && lines[1] == "b" && lines[2].empty() && lines[3] == "c");

	vector<string_view> cols;
	split_view("x\t\ty\t", '\t', cols);
	SK_ASSERT(cols.size() == 4 && cols[1].empty() && cols[2] == "y" && cols[3].empty());
}

void read_tables_test()
{
	auto seqs = read_seqs_table(data_dir + "seqs.tsv");
	SK_ASSERT(seqs.size() == 4);
	SK_ASSERT(seqs[1].seq_id == "G1_c2" && seqs[1].bin_id == "G1" && seqs[1].length == 500);
	SK_ASSERT(!seqs[1].window.has_value());

	auto feats = read_feats_table(data_dir + "feats.tsv");
	SK_ASSERT(feats.size() == 7);
	SK_ASSERT(feats[1].strand == neg_strand);
	SK_ASSERT(feats[1].attrs.get("name") == "dnaN");
	SK_ASSERT(!feats[1].attrs.contains("seq_id"));

	auto links = read_links_table(data_dir + "links.tsv");
	SK_ASSERT(links.size() == 3);
	SK_ASSERT((links[2].span2 == span_t{101, 400}));
	SK_ASSERT(links[2].strand == neg_strand);
	SK_ASSERT(links[0].strand == pos_strand);
	SK_ASSERT(links[0].attrs.get("pident") == "98.5");

	auto clusters = read_clusters_table(data_dir + "clusters.tsv");
	SK_ASSERT(clusters.size() == 5 && clusters[4].cluster_id == "dnaN" && clusters[4].feat_id == "g5");

	const string path = "synteny_kit_test_table.tsv";
	write_text(path, "seq_id\tstart\nA\t1\n");
	expect_error<configuration_error>([&] { return read_feats_table(path); }, "feats table without end");
	write_text(path, "seq_id\tstart\tend\nA\t1\tten\n");
	expect_error<value_error>([&] { return read_feats_table(path); }, "feats table with bad end");
	write_text(path, "seq_id\tstart\tend\nA\t20\t10\n");
	expect_error<value_error>([&] { return read_feats_table(path); }, "feature with start > end");
	write_text(path, "seq_id\tstart\tend\nA\t1\n");
	expect_error<value_error>([&] { return read_feats_table(path); }, "row with too few columns");
	write_text(path, "seq_id\tlength\nA\t-5\n");
	expect_error<value_error>([&] { return read_seqs_table(path); }, "negative length");
	std::remove(path.c_str());
	expect_error<file_error>([] { return read_table("no/such/file.tsv"); }, "missing file");
}

void registry_test()
{
	track_registry reg;
	SK_ASSERT(reg.unnamed_track_id(track_type_t::feats) == "feats");
	SK_ASSERT(reg.unnamed_track_id(track_type_t::feats, true) == "genes");
	reg.add_feats("feats", {make_feat("A", 1, 10), make_feat("A", 5, 20, neg_strand, "named")});
	SK_ASSERT(reg.unnamed_track_id(track_type_t::feats) == "feats_2");
	SK_ASSERT((*reg.feats("feats").rows)[0].feat_id == "feats_1");
	SK_ASSERT((*reg.feats("feats").rows)[1].feat_id == "named");

	reg.add_links("links", {});
	SK_ASSERT(reg.track_type("links") == track_type_t::links);
	SK_ASSERT(reg.track_type("seqs") == track_type_t::seqs);
	expect_error<configuration_error>([&] { reg.add_feats("links", {}); }, "feats named like a link track");
	expect_error<configuration_error>([&] { reg.add_links("feats", {}); }, "links named like a feat track");
	expect_error<configuration_error>([&] { reg.add_feats("", {}); }, "empty track id");
	expect_error<configuration_error>([&] { return reg.feats("missing"); }, "unknown feat track");
	expect_error<configuration_error>([&] { return reg.track_type("missing"); }, "unknown track");
}

void example_offsets_test()
{
	auto lay = example_layout();
	SK_ASSERT(lay.state() == layout_state_t::laid);

	auto seqs = get_seqs(lay);
	expect_ints(seqs, "x_offset", {0, 100});
	expect_ints(seqs, "bin_index", {0, 0});
	expect_ints(seqs, "seq_index", {0, 1});
	auto feats = get_feats(lay);
	expect_ints(feats, "x", {110});
	expect_ints(feats, "xend", {120});

	auto flipped = flip_seqs(lay, {"B"});
	SK_ASSERT(flipped.state() == layout_state_t::transformed);
	expect_ints(get_seqs(flipped), "x_offset", {0, 100});
	expect_strs(get_seqs(flipped), "strand", {"+", "-"});
	expect_ints(get_feats(flipped), "x", {130});
	expect_ints(get_feats(flipped), "xend", {140});

	// The input state and earlier snapshots are untouched.
	expect_ints(get_feats(lay), "x", {110});
	expect_ints(feats, "x", {110});

	auto twice = flip_seqs(flipped, {"B"});
	SK_ASSERT(get_seqs(twice).columns() == get_seqs(lay).columns());
	SK_ASSERT(get_feats(twice).columns() == get_feats(lay).columns());

	expect_error<validation_error>([&] { return flip_seqs(lay, {"C"}); }, "flip of unknown sequence");
	expect_error<validation_error>([&] { return flip_bins(lay, {"B"}); }, "flip of unknown bin");
}

void spacing_and_wrap_test()
{
	track_registry reg;
	reg.set_seqs({make_seq("A", "1", 100), make_seq("B", "1", 50), make_seq("C", "1", 80), make_seq("D", "2", 10)});

	layout_options spaced;
	spaced.spacing = 10;
	auto lay = layout::make(reg, spaced);
	expect_ints(get_seqs(lay), "x_offset", {0, 110, 170, 0});
	expect_ints(get_seqs(lay), "y", {0, 0, 0, 1});

	layout_options wrapped;
	wrapped.wrap = 160;
	lay = layout::make(reg, wrapped);
	expect_ints(get_seqs(lay), "x_offset", {0, 100, 0, 0});
	expect_ints(get_seqs(lay), "y", {0, 0, 1, 2});
	expect_ints(get_bins(lay), "num_rows", {2, 1});
	expect_ints(get_bins(lay), "y", {0, 2});
	expect_ints(get_bins(lay), "xend", {150, 10});

	layout_options negative;
	negative.spacing = -1;
	expect_error<configuration_error>([&] { return layout::make(reg, negative); }, "negative spacing");
}

void order_options_test()
{
	layout_options opts;
	opts.bin_order = {"G3"};
	opts.seq_order = {"G1_c2"};
	auto lay = genomes_layout(opts);
	expect_strs(get_bins(lay), "bin_id", {"G3", "G1", "G2"});
	expect_strs(get_seqs(lay), "seq_id", {"G3_c1", "G1_c2", "G1_c1", "G2_c1"});
	expect_ints(get_seqs(lay), "x_offset", {0, 0, 500, 0});

	opts.bin_order = {"G9"};
	expect_error<validation_error>([&] { return genomes_layout(opts); }, "unknown id in bin order");
}

void infer_seqs_test()
{
	track_registry reg;
	reg.add_feats("genes", {make_feat("X", 101, 200), make_feat("X", 301, 500), make_feat("Y", 11, 60)});

	auto lay = layout::make(reg, {});
	auto seqs = get_seqs(lay);
	expect_strs(seqs, "seq_id", {"X", "Y"});
	expect_strs(seqs, "bin_id", {"X", "Y"});
	expect_ints(seqs, "length", {500, 60});
	expect_ints(seqs, "start", {100, 10});
	expect_ints(seqs, "end", {500, 60});
	expect_ints(get_feats(lay), "x", {1, 201, 1});

	layout_options zero;
	zero.infer_start = infer_start_t::zero;
	lay = layout::make(reg, zero);
	expect_ints(get_seqs(lay), "start", {0, 0});
	expect_ints(get_feats(lay), "x", {101, 301, 11});

	track_registry links_only;
	links_only.add_links("links", {make_link("P", 1, 100, "Q", 51, 150)});
	lay = layout::make(links_only, {});
	expect_strs(get_seqs(lay), "seq_id", {"P", "Q"});
	expect_ints(get_seqs(lay), "start", {0, 50});
	expect_ints(get_links(lay), "x2", {1});

	expect_error<configuration_error>([] { return layout::make(track_registry{}, {}); }, "layout of nothing");
}

void unresolved_test()
{
	auto lay = genomes_layout();
	auto feats = get_feats(lay, "genes");
	SK_ASSERT(feats.num_rows() == 6);
	expect_strs(feats, "feat_id", {"g1", "g2", "g3", "g4", "g5", "g6"});

	const auto& report = lay.feats("genes").report;
	SK_ASSERT(report.num_unresolved == 1);
	SK_ASSERT(report.unresolved_ids == vector<string>{"G4_c1"});

	auto info = track_info(lay);
	expect_strs(info, "track_id", {"seqs", "genes", "links"});
	expect_ints(info, "num_unresolved", {0, 1, 0});
	expect_ints(info, "num_visible", {4, 6, 3});

	layout_options strict;
	strict.policy = resolve_policy_t::strict;
	expect_error<reference_error>([&] { return genomes_layout(strict); }, "strict layout with unknown sequence");
}

void link_orientation_test()
{
	auto lay = genomes_layout();
	auto links = get_links(lay);
	expect_strs(links, "orientation", {"colinear", "colinear", "inverted"});
	expect_ints(links, "x", {101, 601, 201});
	expect_ints(links, "xend", {400, 900, 500});
	expect_ints(links, "y", {0, 0, 1});
	expect_ints(links, "x2", {201, 701, 400});
	expect_ints(links, "xend2", {500, 1000, 101});
	expect_ints(links, "y2", {1, 1, 2});
	SK_ASSERT(std::get<double_column>(links["pident"])[0] == 98.5);

	auto flipped = flip_bins(lay, {"G3"});
	links = get_links(flipped);
	expect_strs(links, "orientation", {"colinear", "colinear", "colinear"});
	expect_ints(links, "x2", {201, 701, 500});
	expect_ints(links, "xend2", {500, 1000, 799});

	flipped = flip_bins(lay, {"G2"});
	expect_strs(get_links(flipped), "orientation", {"inverted", "inverted", "colinear"});

	// Flipping twice restores every link coordinate.
	SK_ASSERT(get_links(flip_bins(flip_bins(lay, {"G3"}), {"G3"})).columns() == get_links(lay).columns());
	SK_ASSERT(get_links(flip_seqs(flip_seqs(lay, {"G2_c1"}), {"G2_c1"})).columns() == get_links(lay).columns());
}

void link_report_test()
{
	auto seq = [](const char* id, const char* bin, pos_t length, window_t window) {
		seq_t s;
		s.seq_id = s.source_id = id;
		s.bin_id = bin;
		s.length = length;
		s.window = window;
		return s;
	};
	auto seqs = seq_layout::from_seqs({seq("A", "a", 100, {0, 100}), seq("B", "b", 100, {0, 100}),
									   seq("C", "c", 100, {0, 50})}, 0, 0);
	seqs.select_bins({0, 2});  // B is known but not displayed

	auto rows = std::make_shared<const vector<link_rec>>(vector<link_rec>{
		make_link("A", 90, 110, "B", 10, 20),    // B hidden
		make_link("B", 10, 20, "C", 80, 90),     // B hidden, C outside its window
		make_link("A", 90, 110, "A", 150, 160),  // trimmed, then dropped past the end of A
		make_link("A", 91, 100, "C", 41, 60),    // C trimmed
	});
	auto proj = project_links(seqs, link_track{"links", rows}, resolve_policy_t::lenient, marginal_t::trim);
	SK_ASSERT(proj.items.size() == 1 && proj.items[0].row == 3);
	SK_ASSERT(proj.items[0].span2 == (span_t{41, 50}));
	SK_ASSERT(proj.report.num_hidden == 2, "{}", proj.report.num_hidden);
	SK_ASSERT(proj.report.num_outside == 2, "{}", proj.report.num_outside);
	SK_ASSERT(proj.report.num_trimmed == 1, "{}", proj.report.num_trimmed);
}

void pick_test()
{
	auto lay = genomes_layout();
	auto picked = pick(lay, {"G3", "G1", "G2"});
	expect_strs(get_bins(picked), "bin_id", {"G3", "G1", "G2"});
	expect_ints(get_links(picked), "y", {1, 1, 2});
	expect_ints(get_links(picked), "y2", {2, 2, 0});

	auto restored = pick(picked, {"G1", "G2", "G3"});
	SK_ASSERT(get_seqs(restored).columns() == get_seqs(lay).columns());
	SK_ASSERT(get_links(restored).columns() == get_links(lay).columns());

	auto subset = pick(lay, {"G2"});
	expect_strs(get_feats(subset, "genes"), "feat_id", {"g4", "g5"});
	expect_ints(get_feats(subset, "genes"), "y", {0, 0});
	SK_ASSERT(get_links(subset).num_rows() == 0);
	SK_ASSERT(subset.links("links").report.num_hidden == 3);
	SK_ASSERT(subset.feats("genes").report.num_hidden == 4);

	expect_error<validation_error>([&] { return pick(lay, {"G9"}); }, "pick of unknown bin");
	expect_error<validation_error>([&] { return pick(lay, {"G1", "G1"}); }, "pick of repeated bin");
	expect_error<validation_error>([&] { return pick(lay, {}); }, "pick of nothing");
	SK_ASSERT(get_seqs(lay).num_rows() == 4);

	auto seqs = pick_seqs(lay, {"G1_c2", "G2_c1"});
	expect_strs(get_seqs(seqs), "seq_id", {"G1_c2", "G2_c1"});
	expect_ints(get_seqs(seqs), "x_offset", {0, 0});
	expect_strs(get_feats(seqs, "genes"), "feat_id", {"g3", "g4", "g5"});
	expect_ints(get_feats(seqs, "genes"), "x", {51, 201, 701});

	auto shifted = shift(lay, {"G2"}, 250);
	expect_ints(get_seqs(shifted), "x_offset", {0, 1000, 250, 0});
	expect_ints(get_links(shifted), "x2", {451, 951, 400});
	expect_error<validation_error>([&] { return shift(lay, {"G1_c1"}, 5); }, "shift of unknown bin");
}

void sync_test()
{
	auto lay = genomes_layout();
	auto synced = sync(lay);
	expect_strs(get_seqs(synced), "strand", {"+", "+", "+", "-"});
	expect_strs(get_links(synced), "orientation", {"colinear", "colinear", "colinear"});

	// Already in sync: nothing flips.
	SK_ASSERT(get_seqs(sync(synced)).columns() == get_seqs(synced).columns());
	expect_error<configuration_error>([] { return sync(example_layout()); }, "sync without links");
}

void focus_test()
{
	auto lay = genomes_layout();

	focus_options opts;
	opts.upstream = 50;
	auto is_dnaA = [](const feat_rec& f) { return f.attrs.get("name") == "dnaA"; };
	auto focused = focus_feats(lay, "genes", is_dnaA, opts);
	auto seqs = get_seqs(focused);
	expect_strs(seqs, "seq_id", {"G1_c1:51-400", "G2_c1:151-500", "G3_c1:101-450"});
	expect_strs(seqs, "source_id", {"G1_c1", "G2_c1", "G3_c1"});
	expect_ints(seqs, "start", {50, 150, 100});
	expect_ints(seqs, "end", {400, 500, 450});
	expect_ints(seqs, "x_offset", {0, 0, 0});

	auto feats = get_feats(focused, "genes");
	expect_strs(feats, "feat_id", {"g1", "g4", "g6"});
	expect_ints(feats, "x", {51, 51, 1});
	expect_ints(feats, "xend", {350, 350, 300});
	SK_ASSERT(get_links(focused).num_rows() == 2);
	SK_ASSERT(focused.feats("genes").report.num_outside == 2);
	SK_ASSERT(focused.feats("genes").report.num_hidden == 1);
	SK_ASSERT(get_seqs(lay).num_rows() == 4);

	expect_error<validation_error>([&] { return focus_feats(lay, "genes", [](const feat_rec&) { return false; }, {}); },
								   "focus matching nothing");
	expect_error<configuration_error>([&] { return focus_feats(lay, "nope", is_dnaA, {}); }, "focus on unknown track");

	// Links select both of their ends.
	auto by_link = focus_links(lay, "links", [](const link_rec& l) { return l.attrs.get("pident") == "88.2"; }, {});
	expect_strs(get_seqs(by_link), "seq_id", {"G2_c1:201-500", "G3_c1:101-400"});
	expect_strs(get_bins(by_link), "bin_id", {"G2", "G3"});
	expect_strs(get_links(by_link), "orientation", {"inverted"});
}

void focus_marginal_test()
{
	auto lay = genomes_layout();

	focus_options opts;
	opts.loci = {{"G1_c1", {201, 700}}};
	auto trimmed = focus_loci(lay, opts);
	expect_strs(get_seqs(trimmed), "seq_id", {"G1_c1:201-700"});
	auto feats = get_feats(trimmed, "genes");
	expect_strs(feats, "feat_id", {"g1", "g2"});
	expect_ints(feats, "start", {201, 601});
	expect_ints(feats, "end", {400, 700});
	expect_ints(feats, "x", {1, 401});
	expect_ints(feats, "xend", {200, 500});
	SK_ASSERT(trimmed.feats("genes").report.num_trimmed == 2);

	opts.marginal = marginal_t::keep;
	expect_ints(get_feats(focus_loci(lay, opts), "genes"), "x", {-99, 401});

	opts.loci = {{"G1_c1", {151, 900}}};
	opts.marginal = marginal_t::drop;
	auto dropped = focus_loci(lay, opts);
	expect_strs(get_feats(dropped, "genes"), "feat_id", {"g2"});

	// Neither trim nor drop leaves anything outside its window.
	for (marginal_t m : {marginal_t::trim, marginal_t::drop}) {
		opts.marginal = m;
		auto f = focus_loci(lay, opts);
		const auto& seqs = f.seqs();
		for (const auto& item : f.feats("genes").items) {
			const auto& s = seqs.seq(item.seq);
			SK_ASSERT(item.x >= s.x() && item.xend <= s.xend(), "{} row {}", marginal_as_str(m), item.row);
		}
	}
	expect_error<validation_error>([&] {
		focus_options bad;
		bad.loci = {{"G9_c1", {1, 10}}};
		return focus_loci(lay, bad);
	}, "focus on unknown sequence");
}

void focus_split_test()
{
	auto lay = genomes_layout();

	focus_options opts;
	opts.loci = {{"G2_c1", {201, 300}}, {"G2_c1", {901, 1000}}};
	auto split = focus_loci(lay, opts);
	auto seqs = get_seqs(split);
	expect_strs(seqs, "seq_id", {"G2_c1:201-300", "G2_c1:901-1000"});
	expect_strs(seqs, "bin_id", {"G2", "G2"});
	expect_ints(seqs, "seq_index", {0, 1});
	expect_ints(seqs, "x_offset", {0, 100});
	auto feats = get_feats(split, "genes");
	expect_strs(feats, "feat_id", {"g4", "g5"});
	expect_ints(feats, "x", {1, 101});
	expect_ints(feats, "xend", {100, 200});

	// Loci of a flipped sequence stay in display order.
	auto flipped = focus_loci(flip_bins(lay, {"G2"}), opts);
	expect_strs(get_seqs(flipped), "seq_id", {"G2_c1:901-1000", "G2_c1:201-300"});

	opts.loci = {{"G2_c1", {201, 300}}, {"G2_c1", {331, 400}}};
	opts.max_dist = 30;
	expect_strs(get_seqs(focus_loci(lay, opts)), "seq_id", {"G2_c1:201-400"});
}

void round_trip_test()
{
	auto lay = flip_seqs(flip_bins(genomes_layout(), {"G2"}), {"G1_c2"});
	focus_options opts;
	opts.loci = {{"G1_c1", {51, 700}}, {"G2_c1", {1, 1200}}};
	for (const auto& l : {lay, focus_loci(lay, opts)}) {
		const auto& seqs = l.seqs();
		for (const auto& p : l.feat_projections())
			for (const auto& item : p.items)
				SK_ASSERT(seqs.seq(item.seq).unproject(item.x, item.xend) == item.span, "feature row {}", item.row);
		for (const auto& p : l.link_projections()) {
			for (const auto& item : p.items) {
				SK_ASSERT(seqs.seq(item.seq1).unproject(item.x, item.xend) == item.span1, "link row {}", item.row);
				SK_ASSERT(seqs.seq(item.seq2).unproject(item.x2, item.xend2) == item.span2, "link row {}", item.row);
			}
		}
	}
}

void add_tracks_test()
{
	auto lay = genomes_layout();

	auto sub = add_subfeats(lay, "genes", "domains", read_feats_table(data_dir + "subfeats.tsv"), aa_to_nt);
	auto domains = get_feats(sub, "domains");
	expect_strs(domains, "seq_id", {"G1_c1", "G1_c1"});
	expect_strs(domains, "parent_id", {"g1", "g2"});
	expect_ints(domains, "start", {101, 841});
	expect_ints(domains, "end", {250, 870});
	expect_strs(domains, "strand", {"+", "-"});
	expect_strs(domains, "name", {"HTH", "clamp"});
	SK_ASSERT(get_seqs(sub).columns() == get_seqs(lay).columns());
	SK_ASSERT(get_feats(sub, "genes").columns() == get_feats(lay, "genes").columns());

	expect_error<configuration_error>([&] { return add_feats(lay, "genes", {}); }, "add of existing track");
	expect_error<configuration_error>([&] { return add_subfeats(lay, "nope", "x", {}); }, "sub-features of unknown track");

	auto orphan = add_subfeats(example_layout(), "feats", "sub", {make_feat("missing", 1, 5)});
	SK_ASSERT(get_feats(orphan, "sub").num_rows() == 0);
	expect_error<reference_error>([] {
		return add_subfeats(example_layout(resolve_policy_t::strict), "feats", "sub", {make_feat("missing", 1, 5)});
	}, "strict sub-feature of unknown parent");

	auto sublinks = add_sublinks(lay, "genes", "domain_links", {make_link("g1", 1, 10, "g4", 1, 10)}, aa_to_nt);
	auto dl = get_links(sublinks, "domain_links");
	expect_ints(dl, "start1", {101});
	expect_ints(dl, "end1", {130});
	expect_ints(dl, "start2", {201});
	expect_ints(dl, "end2", {230});
	expect_strs(dl, "orientation", {"colinear"});

	auto clustered = add_clusters(lay, "genes", "clusters", read_clusters_table(data_dir + "clusters.tsv"));
	auto cl = get_links(clustered, "clusters");
	expect_strs(cl, "cluster_id", {"dnaA", "dnaA", "dnaN"});
	expect_strs(cl, "feat_id1", {"g1", "g4", "g2"});
	expect_strs(cl, "feat_id2", {"g4", "g6", "g5"});
	expect_strs(cl, "orientation", {"colinear", "inverted", "colinear"});
	expect_strs(get_feats(clustered, "genes"), "cluster_id", {"dnaA", "dnaN", "", "dnaA", "dnaN", "dnaA"});
}

void swap_query_test()
{
	auto l = make_link("A", 1, 10, "B", 21, 30, neg_strand);
	l.attrs.set("name", "qa");
	l.attrs.set("name2", "sb");
	l.attrs.set("score", "5");
	auto out = swap_query({l});
	SK_ASSERT(out[0].seq_id1 == "B" && out[0].seq_id2 == "A");
	SK_ASSERT((out[0].span1 == span_t{21, 30}));
	SK_ASSERT(out[0].strand == neg_strand);
	SK_ASSERT(out[0].attrs.get("name") == "sb" && out[0].attrs.get("name2") == "qa");
	SK_ASSERT(out[0].attrs.get("score") == "5");
}

void relayout_test()
{
	focus_options opts;
	opts.loci = {{"G1_c1", {101, 900}}, {"G2_c1", {201, 1000}}};
	auto lay = focus_loci(flip_seqs(genomes_layout(), {"G2_c1"}), opts);

	auto table = as_raw_table(get_seqs(lay), {"seq_id", "bin_id", "source_id", "length", "start", "end", "strand"});
	track_registry reg;
	reg.set_seqs(seqs_from_table(table));
	reg.add_feats("genes", read_feats_table(data_dir + "feats.tsv"));
	auto again = layout::make(std::move(reg), {});

	for (const char* col : {"x_offset", "start", "end", "y"})
		SK_ASSERT(get_seqs(again).get<int64_t>(col) == get_seqs(lay).get<int64_t>(col), "column {}", col);
	SK_ASSERT(get_seqs(again).get<string>("strand") == get_seqs(lay).get<string>("strand"));
	SK_ASSERT(get_feats(again, "genes").get<int64_t>("x") == get_feats(lay, "genes").get<int64_t>("x"));
	SK_ASSERT(get_feats(again, "genes").get<int64_t>("xend") == get_feats(lay, "genes").get<int64_t>("xend"));

	// Bin shifts are part of the sequence table.
	auto shifted = shift(genomes_layout(), {"G2"}, 30);
	expect_ints(get_seqs(shifted), "shift", {0, 0, 30, 0});
	auto shifted_table = as_raw_table(get_seqs(shifted), {"seq_id", "bin_id", "length", "shift"});
	auto relay = [&shifted_table] {
		track_registry reg;
		reg.set_seqs(seqs_from_table(shifted_table));
		return layout::make(std::move(reg), {});
	};
	expect_ints(get_seqs(relay()), "x_offset", {0, 1000, 30, 0});
	expect_ints(get_seqs(relay()), "shift", {0, 0, 30, 0});

	shifted_table.rows[1][3] = "5";  // G1_c2 disagrees with G1_c1
	expect_error<configuration_error>(relay, "sequences of one bin with different shifts");
}

void seq_ref_test()
{
	auto make = [](layout_options opts) {
		track_registry reg;
		reg.set_seqs({make_seq("chr1", "g1", 100), make_seq("chr1", "g2", 80), make_seq("chr2", "g2", 50)});
		return layout::make(std::move(reg), std::move(opts));
	};
	auto lay = make({});

	expect_error<validation_error>([&] { return flip_seqs(lay, {"chr1"}); }, "flip of a seq_id shown in two bins");
	expect_error<validation_error>([&] { return pick_seqs(lay, {"chr1"}); }, "pick of a seq_id shown in two bins");
	expect_error<validation_error>([&] { return flip_seqs(lay, {"g3/chr1"}); }, "flip in unknown bin");
	expect_strs(get_seqs(flip_seqs(lay, {"g2/chr1"})), "strand", {"+", "-", "+"});
	expect_strs(get_seqs(flip_seqs(lay, {"chr2"})), "strand", {"+", "+", "-"});
	expect_strs(get_bins(pick_seqs(lay, {"g2/chr1", "g1/chr1"})), "bin_id", {"g2", "g1"});

	layout_options opts;
	opts.seq_order = {"chr1"};
	expect_error<validation_error>([&] { return make(opts); }, "seq_order with a seq_id shown in two bins");
	opts.seq_order = {"chr2", "g2/chr1"};
	auto ordered = get_seqs(make(opts));
	expect_strs(ordered, "seq_id", {"chr1", "chr2", "chr1"});
	expect_strs(ordered, "bin_id", {"g1", "g2", "g2"});

	focus_options focus;
	focus.loci = {{"chr1", {1, 10}}};
	expect_error<validation_error>([&] { return focus_loci(lay, focus); }, "focus on a seq_id shown in two bins");
	focus.loci = {{"g1/chr1", {1, 10}}};
	auto focused = get_seqs(focus_loci(lay, focus));
	expect_strs(focused, "seq_id", {"chr1:1-10"});
	expect_strs(focused, "bin_id", {"g1"});
}

void focus_duplicate_test()
{
	// Two views of source X in one bin.
	seq_rec s1 = make_seq("S1", "b", 100), s2 = make_seq("S2", "b", 100);
	s1.source_id = s2.source_id = "X";
	track_registry reg;
	reg.set_seqs({s1, s2});
	auto lay = layout::make(std::move(reg), {});

	focus_options opts;
	opts.loci = {{"S1", {11, 20}}, {"S2", {31, 40}}};
	expect_strs(get_seqs(focus_loci(lay, opts)), "seq_id", {"X:11-20", "X:31-40"});

	opts.loci = {{"S1", {11, 20}}, {"S2", {11, 20}}};
	expect_error<configuration_error>([&] { return focus_loci(lay, opts); }, "focus giving two loci the same id");
	SK_ASSERT(get_seqs(lay).num_rows() == 2);
}

void write_table_test()
{
	auto lay = genomes_layout();
	const string path = "synteny_kit_test_feats.tsv.gz";
	write_table(path, get_feats(lay, "genes"));
	auto back = read_feats_table(path);
	std::remove(path.c_str());
	SK_ASSERT(back.size() == 6);
	SK_ASSERT(back[0].feat_id == "g1" && back[0].bin_id == "G1");
	SK_ASSERT(back[0].attrs.get("x") == "101");
	SK_ASSERT(back[0].attrs.get("track_id") == "genes");
}

void unlaid_test()
{
	layout empty;
	SK_ASSERT(empty.state() == layout_state_t::unlaid);
	expect_error<configuration_error>([&] { return get_seqs(empty); }, "accessor on unlaid layout");
	expect_error<configuration_error>([&] { return flip_bins(empty, {}); }, "transform of unlaid layout");
}

/////////////////////////////////////////////////////////////////

void nested_exception_print(const std::exception& e, int level = 0)
{
	print("{:>{}}: {}\n", typeid(e).name(), strlen(typeid(e).name()) + level, e.what());
	try {
		std::rethrow_if_nested(e);
	} catch (const std::exception& e) {
		nested_exception_print(e, level + 2);
	}
}

int main(int argc, char* argv[])
{
	try {
		putenv((char*)"SYNTENYKIT_QUIET=1");

		interval_test();
		line_reader_test();
		read_tables_test();
		registry_test();
		example_offsets_test();
		spacing_and_wrap_test();
		order_options_test();
		infer_seqs_test();
		unresolved_test();
		link_orientation_test();
		link_report_test();
		pick_test();
		sync_test();
		focus_test();
		focus_marginal_test();
		focus_split_test();
		round_trip_test();
		add_tracks_test();
		swap_query_test();
		relayout_test();
		seq_ref_test();
		focus_duplicate_test();
		write_table_test();
		unlaid_test();

		println("All tests passed.");
	} catch (const std::exception& e) {
		nested_exception_print(e);
		return -1;
	}
	return 0;
}

#endif // _WANT_MAIN
