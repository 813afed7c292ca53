/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "py_util.h" // Include first to avoid POSIX warnings due to Python header inclusion order
#include "py_layout.h"
#include "strutil.h"
#include <new>
#include <utility>

BEGIN_NAMESPACE_SK

/////////////////////////////////////////////////////////////////
// Argument conversion
/////////////////////////////////////////////////////////////////

// A table is a dict whose values are column sequences; a dict whose values
// are all dicts is a set of named tables.
static bool is_named_tables(PyObject* obj)
{
	if (!PyDict_Check(obj) || PyDict_Size(obj) == 0)
		return false;
	PyObject* key;
	PyObject* value;
	Py_ssize_t pos = 0;
	while (PyDict_Next(obj, &pos, &key, &value))
		if (!PyDict_Check(value))
			return false;
	return true;
}

// One table, a dict of name -> table, or a list of tables. Unnamed tables get an empty id.
static vector<std::pair<string, raw_table>> as_track_tables(PyObject* obj, const char* role)
{
	vector<std::pair<string, raw_table>> out;
	if (!obj || obj == Py_None)
		return out;
	if (is_named_tables(obj)) {
		PyObject* key;
		PyObject* value;
		Py_ssize_t pos = 0;
		while (PyDict_Next(obj, &pos, &key, &value)) {
			auto name = as_string(key);
			out.emplace_back(name, as_raw_table(value, name.c_str()));
		}
	} else if (PyList_Check(obj)) {
		for (Py_ssize_t i = 0; i < PyList_GET_SIZE(obj); ++i)
			out.emplace_back(string(), as_raw_table(PyList_GET_ITEM(obj, i), role));
	} else {
		out.emplace_back(string(), as_raw_table(obj, role));
	}
	return out;
}

static void add_feat_tracks(track_registry& registry, PyObject* obj, bool genes)
{
	for (auto& [id, table] : as_track_tables(obj, genes ? "genes" : "feats")) {
		if (id.empty())
			id = registry.unnamed_track_id(track_type_t::feats, genes);
		registry.add_feats(id, feats_from_table(table));
	}
}

static void add_link_tracks(track_registry& registry, PyObject* obj)
{
	for (auto& [id, table] : as_track_tables(obj, "links")) {
		if (id.empty())
			id = registry.unnamed_track_id(track_type_t::links);
		registry.add_links(id, links_from_table(table));
	}
}

static infer_start_t as_infer_start(string_view s)
{
	if (s == "observed") return infer_start_t::observed;
	if (s == "zero")     return infer_start_t::zero;
	SK_THROW(value, "Expected infer_start \"observed\" or \"zero\" but found \"{}\".", s);
}

static coord_transform as_coord_transform(string_view s)
{
	if (s == "none" || s.empty()) return identity_coords;
	if (s == "aa2nt")             return aa_to_nt;
	SK_THROW(value, "Expected transform \"none\" or \"aa2nt\" but found \"{}\".", s);
}

static vector<locus_rec> as_loci(PyObject* obj)
{
	vector<locus_rec> loci;
	if (!obj || obj == Py_None)
		return loci;
	PyAutoRef seq{PySequence_Fast(obj, "loci must be a sequence of (seq_id, start, end) tuples.")};
	if (!seq)
		SK_THROW(python, "loci must be a sequence.");
	for (Py_ssize_t i = 0; i < PySequence_Fast_GET_SIZE(seq.get()); ++i) {
		const char* seq_id = nullptr;
		long long start = 0, end = 0;
		if (!PyArg_ParseTuple(PySequence_Fast_GET_ITEM(seq.get(), i), "sLL", &seq_id, &start, &end))
			SK_THROW(python, "Each locus must be a (seq_id, start, end) tuple.");
		SK_CHECK(start <= end, value, "Locus {}:{}-{} has start > end.", seq_id, start, end);
		loci.push_back(locus_rec{seq_id, span_t{start, end}});
	}
	return loci;
}

// New reference to a row passed to a Python predicate.
template <typename F>
static PyObject* PyDict_FromRow(const attr_map& attrs, F add_fields)
{
	PyObject* dict = PyDict_New();
	SKPY_TAKEREF(dict);
	if (!dict)
		SK_THROW(python, "Could not allocate dict.");
	auto set = [dict](const char* name, PyObject* value) {
		PyAutoRef ref{value};
		if (!value || PyDict_SetItemString(dict, name, value) < 0)
			SK_THROW(python, "Could not set {}.", name);
	};
	add_fields(set);
	for (const auto& [name, value] : attrs)
		set(name.c_str(), PyString_FromSV(value));
	SKPY_FORGETREF(dict);
	return dict;
}

static bool call_predicate(PyObject* where, PyObject* row)
{
	PyAutoRef row_ref{row};
	PyAutoRef result{PyObject_CallFunctionObjArgs(where, row, nullptr)};
	if (!result)
		SK_THROW(python, "Focus predicate raised.");
	int truth = PyObject_IsTrue(result.get());
	if (truth < 0)
		SK_THROW(python, "Focus predicate returned a value without a truth value.");
	return truth != 0;
}

static feat_predicate as_feat_predicate(PyObject* where, const vector<string>& ids)
{
	if (where && where != Py_None) {
		SK_CHECK(PyCallable_Check(where), type, "where must be callable.");
		return [where](const feat_rec& f) {
			return call_predicate(where, PyDict_FromRow(f.attrs, [&f](auto set) {
				set("feat_id", PyString_FromSV(f.feat_id));
				set("seq_id", PyString_FromSV(f.seq_id));
				set("bin_id", PyString_FromSV(f.bin_id));
				set("start", PyLong_FromLongLong(f.span.start));
				set("end", PyLong_FromLongLong(f.span.end));
				set("strand", PyString_FromSV(string(1, strand_as_char(f.strand))));
				set("parent_id", PyString_FromSV(f.parent_id));
			}));
		};
	}
	if (!ids.empty()) {
		auto id_set = std::make_shared<string_set<string>>(ids.begin(), ids.end());
		return [id_set](const feat_rec& f) { return id_set->contains(f.feat_id); };
	}
	return nullptr;
}

static link_predicate as_link_predicate(PyObject* where)
{
	if (!where || where == Py_None)
		return nullptr;
	SK_CHECK(PyCallable_Check(where), type, "where must be callable.");
	return [where](const link_rec& l) {
		return call_predicate(where, PyDict_FromRow(l.attrs, [&l](auto set) {
			set("seq_id1", PyString_FromSV(l.seq_id1));
			set("bin_id1", PyString_FromSV(l.bin_id1));
			set("start1", PyLong_FromLongLong(l.span1.start));
			set("end1", PyLong_FromLongLong(l.span1.end));
			set("seq_id2", PyString_FromSV(l.seq_id2));
			set("bin_id2", PyString_FromSV(l.bin_id2));
			set("start2", PyLong_FromLongLong(l.span2.start));
			set("end2", PyLong_FromLongLong(l.span2.end));
			set("strand", PyString_FromSV(string(1, strand_as_char(l.strand))));
		}));
	};
}

static string as_track_id(const char* s) { return s ? string(s) : string(); }

/////////////////////////////////////////////////////////////////
// Layout
/////////////////////////////////////////////////////////////////

PyObject* PyLayout_FromValue(layout value)
{
	PyLayout::EnsureInit();
	PyObject* selfo = PyLayout::Type->tp_alloc(PyLayout::Type, 0);
	if (!selfo)
		SK_THROW(python, "Could not allocate Layout.");
	auto* self = (PyLayout*)selfo;
	new (&self->lay) layout(std::move(value));
	self->lay_constructed = true;
	return selfo;
}

PyObject* PyDict_FromRawTable(const raw_table& table)
{
	table_view view;
	for (size_t c = 0; c < table.columns.size(); ++c) {
		vector<string> values;
		values.reserve(table.rows.size());
		for (const auto& row : table.rows)
			values.emplace_back(row[c]);
		view.add(table.columns[c], infer_column(std::move(values)));
	}
	return PyDict_FromTableView(view);
}

SKPY_NEW_BEGIN(Layout)
	PyObject* seqs      = Py_None;
	PyObject* genes     = Py_None;
	PyObject* feats     = Py_None;
	PyObject* links     = Py_None;
	long long spacing   = 0;
	long long wrap      = 0;
	const char* infer_start = "observed";
	int strict          = 0;
	PyObject* bin_order = Py_None;
	PyObject* seq_order = Py_None;
	static char* kwlist[] = { "seqs", "genes", "feats", "links", "spacing", "wrap", "infer_start", "strict",
							  "bin_order", "seq_order", nullptr };
	if (!PyArg_ParseTupleAndKeywords(args, kwds, "|OOOOLLspOO", kwlist, &seqs, &genes, &feats, &links, &spacing,
									 &wrap, &infer_start, &strict, &bin_order, &seq_order))
		return nullptr;

	track_registry registry;
	if (seqs != Py_None)
		registry.set_seqs(seqs_from_table(as_raw_table(seqs, "seqs")));
	add_feat_tracks(registry, genes, true);
	add_feat_tracks(registry, feats, false);
	add_link_tracks(registry, links);

	layout_options options;
	options.spacing     = spacing;
	options.wrap        = wrap;
	options.infer_start = as_infer_start(infer_start);
	options.policy      = strict ? resolve_policy_t::strict : resolve_policy_t::lenient;
	options.bin_order   = as_string_list(bin_order);
	options.seq_order   = as_string_list(seq_order);

	SK_TENTATIVE_INPLACE_CONSTRUCT(lay, layout, layout::make(std::move(registry), std::move(options)));
	SK_FINALIZE_CONSTRUCT(lay);
	self->lay_constructed = true;
SKPY_NEW_END

SKPY_DEALLOC_BEGIN(Layout)
	if (self->lay_constructed)
		destruct(&self->lay);
SKPY_DEALLOC_END

static PyObject* PyLayout_Repr(PyObject* selfo)
{
	SKPY_TRY
	const auto& lay = PyLayout::value(selfo);
	if (lay.state() == layout_state_t::unlaid)
		return PyString_FromString("<Layout unlaid>");
	auto s = fmt::format("<Layout {}: {} bins, {} seqs, {} feat tracks, {} link tracks>",
						 layout_state_as_str(lay.state()), lay.seqs().num_bins(), lay.seqs().num_seqs(),
						 lay.feat_projections().size(), lay.link_projections().size());
	return PyString_FromSV(s);
	SKPY_CATCH_RETURN_NULL
}

SKPY_GETATTRO_BEGIN(Layout)
	SKPY_GETATTR_CASE("state")  { return PyString_FromString(layout_state_as_str(self->lay.state())); }
	SKPY_GETATTR_CASE("spacing") { return PyLong_FromLongLong(self->lay.options().spacing); }
	SKPY_GETATTR_CASE("wrap")   { return PyLong_FromLongLong(self->lay.options().wrap); }
	SKPY_GETATTR_CASE("strict") { return PyBool_FromLong(self->lay.options().policy == resolve_policy_t::strict); }
	return PyObject_GenericGetAttr(selfo, attro);
SKPY_GETATTRO_END

/////////////////////////////////////////////////////////////////
// Transforms

#define SKPY_IDS_METHOD(method, kwname, fn) \
	SKPY_OMETHOD_BEGIN(Layout, method) \
		PyObject* ids = nullptr; \
		static char* kwlist[] = { kwname, nullptr }; \
		if (!PyArg_ParseTupleAndKeywords(args, kwds, "O", kwlist, &ids)) \
			return nullptr; \
		return PyLayout_FromValue(fn(self->lay, as_string_list(ids))); \
	SKPY_OMETHOD_END

SKPY_IDS_METHOD(flip_seqs, "seqs", flip_seqs)
SKPY_IDS_METHOD(flip_bins, "bins", flip_bins)
SKPY_IDS_METHOD(pick,      "bins", pick)
SKPY_IDS_METHOD(pick_seqs, "seqs", pick_seqs)

SKPY_OMETHOD_BEGIN(Layout, shift)
	PyObject* bins = nullptr;
	long long by   = 0;
	static char* kwlist[] = { "bins", "by", nullptr };
	if (!PyArg_ParseTupleAndKeywords(args, kwds, "OL", kwlist, &bins, &by))
		return nullptr;
	return PyLayout_FromValue(shift(self->lay, as_string_list(bins), by));
SKPY_OMETHOD_END

SKPY_OMETHOD_BEGIN(Layout, sync)
	const char* track = nullptr;
	static char* kwlist[] = { "track", nullptr };
	if (!PyArg_ParseTupleAndKeywords(args, kwds, "|z", kwlist, &track))
		return nullptr;
	return PyLayout_FromValue(sync(self->lay, as_track_id(track)));
SKPY_OMETHOD_END

SKPY_OMETHOD_BEGIN(Layout, focus)
	const char* track   = nullptr;
	PyObject* where     = Py_None;
	PyObject* ids       = Py_None;
	PyObject* loci      = Py_None;
	long long upstream  = 0;
	long long dnstream  = 0;
	long long max_dist  = 0;
	const char* marginal = "trim";
	static char* kwlist[] = { "track", "where", "ids", "loci", "upstream", "dnstream", "max_dist", "marginal", nullptr };
	if (!PyArg_ParseTupleAndKeywords(args, kwds, "|zOOOLLLs", kwlist, &track, &where, &ids, &loci, &upstream,
									 &dnstream, &max_dist, &marginal))
		return nullptr;

	focus_options opts;
	opts.upstream = upstream;
	opts.dnstream = dnstream;
	opts.max_dist = max_dist;
	opts.marginal = as_marginal(marginal);
	opts.loci     = as_loci(loci);

	const auto& lay = self->lay;
	auto feat_ids   = as_string_list(ids);
	bool has_filter = where != Py_None || !feat_ids.empty();
	if (!track && !has_filter)
		return PyLayout_FromValue(focus_loci(lay, opts));

	string track_id = track ? string(track) : lay.default_feats_id();
	if (lay.registry().track_type(track_id) == track_type_t::links) {
		SK_CHECK(feat_ids.empty(), value, "ids selects features; use where to select links.");
		return PyLayout_FromValue(focus_links(lay, track_id, as_link_predicate(where), opts));
	}
	return PyLayout_FromValue(focus_feats(lay, track_id, as_feat_predicate(where, feat_ids), opts));
SKPY_OMETHOD_END

SKPY_OMETHOD_BEGIN(Layout, add_feats)
	PyObject* table = nullptr;
	const char* name = nullptr;
	static char* kwlist[] = { "table", "name", nullptr };
	if (!PyArg_ParseTupleAndKeywords(args, kwds, "O|z", kwlist, &table, &name))
		return nullptr;
	auto id = name ? string(name) : self->lay.registry().unnamed_track_id(track_type_t::feats);
	return PyLayout_FromValue(add_feats(self->lay, id, feats_from_table(as_raw_table(table, id.c_str()))));
SKPY_OMETHOD_END

SKPY_OMETHOD_BEGIN(Layout, add_links)
	PyObject* table = nullptr;
	const char* name = nullptr;
	static char* kwlist[] = { "table", "name", nullptr };
	if (!PyArg_ParseTupleAndKeywords(args, kwds, "O|z", kwlist, &table, &name))
		return nullptr;
	auto id = name ? string(name) : self->lay.registry().unnamed_track_id(track_type_t::links);
	return PyLayout_FromValue(add_links(self->lay, id, links_from_table(as_raw_table(table, id.c_str()))));
SKPY_OMETHOD_END

SKPY_OMETHOD_BEGIN(Layout, add_subfeats)
	PyObject* table = nullptr;
	const char* parent = nullptr;
	const char* name = nullptr;
	const char* transform = "none";
	static char* kwlist[] = { "table", "parent", "name", "transform", nullptr };
	if (!PyArg_ParseTupleAndKeywords(args, kwds, "O|zzs", kwlist, &table, &parent, &name, &transform))
		return nullptr;
	const auto& lay = self->lay;
	string parent_id = parent ? string(parent) : lay.default_feats_id();
	auto id = name ? string(name) : lay.registry().unnamed_track_id(track_type_t::feats);
	auto rows = feats_from_table(as_raw_table(table, id.c_str()));
	return PyLayout_FromValue(add_subfeats(lay, parent_id, id, rows, as_coord_transform(transform)));
SKPY_OMETHOD_END

SKPY_OMETHOD_BEGIN(Layout, add_sublinks)
	PyObject* table = nullptr;
	const char* parent = nullptr;
	const char* name = nullptr;
	const char* transform = "none";
	static char* kwlist[] = { "table", "parent", "name", "transform", nullptr };
	if (!PyArg_ParseTupleAndKeywords(args, kwds, "O|zzs", kwlist, &table, &parent, &name, &transform))
		return nullptr;
	const auto& lay = self->lay;
	string parent_id = parent ? string(parent) : lay.default_feats_id();
	auto id = name ? string(name) : lay.registry().unnamed_track_id(track_type_t::links);
	auto rows = links_from_table(as_raw_table(table, id.c_str()));
	return PyLayout_FromValue(add_sublinks(lay, parent_id, id, rows, as_coord_transform(transform)));
SKPY_OMETHOD_END

SKPY_OMETHOD_BEGIN(Layout, add_clusters)
	PyObject* table = nullptr;
	const char* parent = nullptr;
	const char* name = nullptr;
	static char* kwlist[] = { "table", "parent", "name", nullptr };
	if (!PyArg_ParseTupleAndKeywords(args, kwds, "O|zz", kwlist, &table, &parent, &name))
		return nullptr;
	const auto& lay = self->lay;
	string parent_id = parent ? string(parent) : lay.default_feats_id();
	auto id = name ? string(name) : lay.registry().unnamed_track_id(track_type_t::links);
	auto rows = clusters_from_table(as_raw_table(table, id.c_str()));
	return PyLayout_FromValue(add_clusters(lay, parent_id, id, rows));
SKPY_OMETHOD_END

/////////////////////////////////////////////////////////////////
// Accessors

SKPY_METHOD_BEGIN_NOARG(Layout, seqs)
	return PyDict_FromTableView(get_seqs(self->lay));
SKPY_METHOD_END

SKPY_METHOD_BEGIN_NOARG(Layout, bins)
	return PyDict_FromTableView(get_bins(self->lay));
SKPY_METHOD_END

SKPY_METHOD_BEGIN_NOARG(Layout, track_info)
	return PyDict_FromTableView(track_info(self->lay));
SKPY_METHOD_END

SKPY_OMETHOD_BEGIN(Layout, feats)
	const char* track = nullptr;
	static char* kwlist[] = { "track", nullptr };
	if (!PyArg_ParseTupleAndKeywords(args, kwds, "|z", kwlist, &track))
		return nullptr;
	return PyDict_FromTableView(get_feats(self->lay, as_track_id(track)));
SKPY_OMETHOD_END

SKPY_OMETHOD_BEGIN(Layout, links)
	const char* track = nullptr;
	static char* kwlist[] = { "track", nullptr };
	if (!PyArg_ParseTupleAndKeywords(args, kwds, "|z", kwlist, &track))
		return nullptr;
	return PyDict_FromTableView(get_links(self->lay, as_track_id(track)));
SKPY_OMETHOD_END

SKPY_METHODS_BEGIN(Layout)
	SKPY_METHOD_ENTRY(Layout, flip_seqs,    METH_VARARGS | METH_KEYWORDS, "Flip the listed sequences.")
	SKPY_METHOD_ENTRY(Layout, flip_bins,    METH_VARARGS | METH_KEYWORDS, "Flip the listed bins and reverse their sequence order.")
	SKPY_METHOD_ENTRY(Layout, pick,         METH_VARARGS | METH_KEYWORDS, "Keep only the listed bins, in the listed order.")
	SKPY_METHOD_ENTRY(Layout, pick_seqs,    METH_VARARGS | METH_KEYWORDS, "Keep only the listed sequences, in the listed order.")
	SKPY_METHOD_ENTRY(Layout, shift,        METH_VARARGS | METH_KEYWORDS, "Move the listed bins along x.")
	SKPY_METHOD_ENTRY(Layout, sync,         METH_VARARGS | METH_KEYWORDS, "Flip bins whose links to the bins above are mostly inverted.")
	SKPY_METHOD_ENTRY(Layout, focus,        METH_VARARGS | METH_KEYWORDS, "Narrow the layout to loci around selected rows.")
	SKPY_METHOD_ENTRY(Layout, add_feats,    METH_VARARGS | METH_KEYWORDS, nullptr)
	SKPY_METHOD_ENTRY(Layout, add_links,    METH_VARARGS | METH_KEYWORDS, nullptr)
	SKPY_METHOD_ENTRY(Layout, add_subfeats, METH_VARARGS | METH_KEYWORDS, "Add features positioned relative to parent features.")
	SKPY_METHOD_ENTRY(Layout, add_sublinks, METH_VARARGS | METH_KEYWORDS, "Add links positioned relative to parent features.")
	SKPY_METHOD_ENTRY(Layout, add_clusters, METH_VARARGS | METH_KEYWORDS, "Link consecutive members of feature clusters.")
	SKPY_METHOD_ENTRY(Layout, seqs,         METH_NOARGS, nullptr)
	SKPY_METHOD_ENTRY(Layout, bins,         METH_NOARGS, nullptr)
	SKPY_METHOD_ENTRY(Layout, feats,        METH_VARARGS | METH_KEYWORDS, nullptr)
	SKPY_METHOD_ENTRY(Layout, links,        METH_VARARGS | METH_KEYWORDS, nullptr)
	SKPY_METHOD_ENTRY(Layout, track_info,   METH_NOARGS, nullptr)
SKPY_METHODS_END

SKPY_TYPEOBJ_BEGIN(Layout)
	tp_doc = "Sequences, features and links laid out on a shared coordinate system.";
	tp_new = PyLayout_New;
	tp_dealloc = PyLayout_Dealloc;
	tp_repr = PyLayout_Repr;
	tp_getattro = PyLayout_GetAttro;
	tp_methods = PyLayout_Methods;
SKPY_TYPEOBJ_END

END_NAMESPACE_SK
