/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#define NO_DISABLE_IMPORT_ARRAY // ensure that the global Array_API variable for import_array() is defined in this .cpp file
#include "py_util.h"

#include "py_layout.h"
#include "synteny_kit.h"

#include <numpy/arrayobject.h>

BEGIN_NAMESPACE_SK

/////////////////////////////////////////////////

// Reads a table file, checks it against the schema of its role, and returns its columns.
template <typename F>
static PyObject* py_read_table_as(PyObject* args, PyObject* kwds, F validate)
{
	SKPY_TRY
	const char* path      = nullptr;
	const char* delimiter = "\t";
	const char* comment   = "#";
	static char* kwlist[] = { "path", "delimiter", "comment", nullptr };
	if (!PyArg_ParseTupleAndKeywords(args, kwds, "s|ss", kwlist, &path, &delimiter, &comment))
		return nullptr;
	SK_CHECK(strlen(delimiter) == 1, value, "delimiter must be a single character, not \"{}\".", delimiter);

	table_read_options options;
	options.delimiter = delimiter[0];
	options.comment   = comment;
	auto table = read_table(path, options);
	validate(table);
	return PyDict_FromRawTable(table);
	SKPY_CATCH_RETURN_NULL
}

static PyObject* py_read_seqs(PyObject*, PyObject* args, PyObject* kwds)
{
	return py_read_table_as(args, kwds, [](const raw_table& t) { seqs_from_table(t); });
}

static PyObject* py_read_feats(PyObject*, PyObject* args, PyObject* kwds)
{
	return py_read_table_as(args, kwds, [](const raw_table& t) { feats_from_table(t); });
}

static PyObject* py_read_links(PyObject*, PyObject* args, PyObject* kwds)
{
	return py_read_table_as(args, kwds, [](const raw_table& t) { links_from_table(t); });
}

static PyObject* py_read_clusters(PyObject*, PyObject* args, PyObject* kwds)
{
	return py_read_table_as(args, kwds, [](const raw_table& t) { clusters_from_table(t); });
}

static const char py_read_doc[] =
"read_*(path, delimiter='\\t', comment='#')\n--\n\n"
"Read a delimited table file, optionally gzip-compressed, and check that it\n"
"has the columns its role requires. Returns a dict of column name to values,\n"
"numpy arrays for integer and float columns and lists for the rest.\n"
;

/////////////////////////////////////////////////////////////////////////

static struct PyMethodDef py_exports[] = {
	{ "read_seqs",     (PyCFunction)(void(*)(void))py_read_seqs,     METH_VARARGS | METH_KEYWORDS, py_read_doc },
	{ "read_feats",    (PyCFunction)(void(*)(void))py_read_feats,    METH_VARARGS | METH_KEYWORDS, py_read_doc },
	{ "read_links",    (PyCFunction)(void(*)(void))py_read_links,    METH_VARARGS | METH_KEYWORDS, py_read_doc },
	{ "read_clusters", (PyCFunction)(void(*)(void))py_read_clusters, METH_VARARGS | METH_KEYWORDS, py_read_doc },
	{ nullptr, nullptr, 0, nullptr } // sentinel
};

// Creates <module>.<name> as a subclass of ValueError.
static int add_exception(PyObject* module, PyObject*& exc, const char* name)
{
	auto qualname = fmt::format("{}._cxx.{}", SKPY_LIBNAME_STR, name);
	exc = PyErr_NewException(qualname.c_str(), PyExc_ValueError, nullptr);
	if (!exc)
		return -1;
	Py_INCREF(exc);
	return PyModule_AddObject(module, name, exc);
}

END_NAMESPACE_SK

USING_NAMESPACE_SK

static int py_mod_exec(PyObject* module)
{
#ifdef NPY_1_7_API_VERSION
	auto ret = _import_array(); // Initialize numpy
	if (ret != 0)
		return ret;
#endif

	SKPY_TRY
	if (add_exception(module, PyExc_ConfigurationError, "ConfigurationError") < 0
		|| add_exception(module, PyExc_UnresolvedReferenceError, "UnresolvedReferenceError") < 0
		|| add_exception(module, PyExc_ValidationError, "ValidationError") < 0)
		return -1;

	PyLayout::Register(module);
	return 0;
	SKPY_CATCH_RETURN_VALUE(-1);
}

extern "C" {

EX_PYTHON_INIT PyObject* PyInit__cxx(void)
{
	static struct PyModuleDef_Slot py_slots[]
		= { { Py_mod_exec, (void*)py_mod_exec }, { 0, nullptr } };
	static struct PyModuleDef moduledef
		= { PyModuleDef_HEAD_INIT, "_cxx", "SyntenyKit C++ extension module", 0, py_exports, py_slots };
	return PyModuleDef_Init(&moduledef);
}

} // extern "C"
