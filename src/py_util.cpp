/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "py_util.h"
#include "strutil.h"
#include <numpy/arrayobject.h>
#include <vector>

BEGIN_NAMESPACE_SK

PyObject* PyExc_ConfigurationError       = nullptr;
PyObject* PyExc_UnresolvedReferenceError = nullptr;
PyObject* PyExc_ValidationError          = nullptr;

void get_nested_exception_what(std::string& out, const std::exception& e, int level)
{
	out.append(level, ' ');
	// Python users see the message without the C++ source location.
	const auto* sk_error = dynamic_cast<const runtime_error*>(&e);
	out += sk_error ? sk_error->message() : e.what();
	try {
		std::rethrow_if_nested(e);
	} catch (const std::exception& e) {
		out += '\n';
		get_nested_exception_what(out, e, level+2);
	}
}

string as_string(PyObject* obj)
{
	if (obj == Py_None)
		return {};
	if (PyString_Check(obj)) {
		Py_ssize_t size = 0;
		const char* s = PyUnicode_AsUTF8AndSize(obj, &size);
		if (!s)
			SK_THROW(python, "Could not decode string.");
		return string(s, (size_t)size);
	}
	PyAutoRef str{PyObject_Str(obj)};
	if (!str)
		SK_THROW(python, "Could not convert value to string.");
	return as_string(str.get());
}

vector<string> as_string_list(PyObject* obj)
{
	vector<string> out;
	if (!obj || obj == Py_None)
		return out;
	if (PyString_Check(obj)) {
		out.push_back(as_string(obj));
		return out;
	}
	PyAutoRef seq{PySequence_Fast(obj, "Expected a string or a sequence of strings.")};
	if (!seq)
		SK_THROW(python, "Expected a string or a sequence of strings.");
	Py_ssize_t n = PySequence_Fast_GET_SIZE(seq.get());
	for (Py_ssize_t i = 0; i < n; ++i)
		out.push_back(as_string(PySequence_Fast_GET_ITEM(seq.get(), i)));
	return out;
}

raw_table as_raw_table(PyObject* dict, const char* source)
{
	SK_CHECK(PyDict_Check(dict), type, "Expected {} table as a dict of columns, not '{}'.", source, Py_TYPE(dict)->tp_name);

	raw_table table;
	table.source = source;

	PyObject* key;
	PyObject* value;
	Py_ssize_t pos = 0;
	while (PyDict_Next(dict, &pos, &key, &value)) {
		table.columns.push_back(as_string(key));
		PyAutoRef seq{PySequence_Fast(value, "Table columns must be sequences.")};
		if (!seq)
			SK_THROW(python, "Column {} of {} table is not a sequence.", table.columns.back(), source);
		Py_ssize_t n = PySequence_Fast_GET_SIZE(seq.get());
		if (table.columns.size() == 1)
			table.rows.resize((size_t)n);
		SK_CHECK((size_t)n == table.rows.size(), value, "Column \"{}\" of {} table has {} values, expected {}.",
				 table.columns.back(), source, n, table.rows.size());
		for (Py_ssize_t i = 0; i < n; ++i)
			table.rows[i].push_back(as_string(PySequence_Fast_GET_ITEM(seq.get(), i)));
	}
	return table;
}

template <typename T>
static PyObject* PyArray_FromColumn(const vector<T>& col, int typenum)
{
	npy_intp dims[1] = { (npy_intp)col.size() };
	PyObject* arr = PyArray_SimpleNew(1, dims, typenum);
	if (!arr)
		SK_THROW(python, "Could not allocate array.");
	if (!col.empty())
		std::memcpy(PyArray_DATA((PyArrayObject*)arr), col.data(), col.size() * sizeof(T));
	return arr;
}

static PyObject* PyList_FromColumn(const string_column& col)
{
	PyObject* list = PyList_New((Py_ssize_t)col.size());
	SKPY_TAKEREF(list);
	if (!list)
		SK_THROW(python, "Could not allocate list.");
	for (size_t i = 0; i < col.size(); ++i) {
		PyObject* s = PyString_FromSV(col[i]);
		if (!s)
			SK_THROW(python, "Could not decode string in column.");
		PyList_SET_ITEM(list, (Py_ssize_t)i, s); // steals reference
	}
	SKPY_FORGETREF(list);
	return list;
}

PyObject* PyDict_FromTableView(const table_view& table)
{
	PyObject* dict = PyDict_New();
	SKPY_TAKEREF(dict);
	if (!dict)
		SK_THROW(python, "Could not allocate dict.");
	for (size_t c = 0; c < table.num_cols(); ++c) {
		PyAutoRef col{std::visit([](const auto& values) -> PyObject* {
			using T = typename std::decay_t<decltype(values)>::value_type;
			if constexpr (std::is_same_v<T, int64_t>)
				return PyArray_FromColumn(values, NPY_INT64);
			else if constexpr (std::is_same_v<T, double>)
				return PyArray_FromColumn(values, NPY_FLOAT64);
			else
				return PyList_FromColumn(values);
		}, table.columns()[c])};
		if (PyDict_SetItemString(dict, table.names()[c].c_str(), col.get()) < 0)
			SK_THROW(python, "Could not set column {}.", table.names()[c]);
	}
	SKPY_FORGETREF(dict);
	return dict;
}

END_NAMESPACE_SK
