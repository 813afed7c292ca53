/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __SYNTENY_KIT_PY_UTIL_H__
#define __SYNTENY_KIT_PY_UTIL_H__

#ifdef _DEBUG
#define WAS_DEBUG
#undef _DEBUG
#endif
#include <Python.h>

#define PyString_AsString PyUnicode_AsUTF8
#define PyString_AS_STRING PyUnicode_AsUTF8
#define PyString_Check PyUnicode_Check
#define PyString_FromString(v) PyUnicode_DecodeUTF8(v, strlen(v), nullptr)
#define PyString_FromStringAndSize(v, l) PyUnicode_DecodeUTF8(v, l, nullptr)

template <class T>
auto PyString_FromSV(T s) {
	return PyString_FromStringAndSize(s.data(), s.size());
}

// numpy definitions for extensions that have numpy API
#define NPY_NO_DEPRECATED_API NPY_1_7_API_VERSION
#define PY_ARRAY_UNIQUE_SYMBOL SyntenyKit_Array_API
#ifndef NO_DISABLE_IMPORT_ARRAY
#define NO_IMPORT_ARRAY
#endif

#ifdef WAS_DEBUG
#define _DEBUG
#endif

#include "accessor.h"
#include "defines.h"
#include "sk_assert.h"
#include "util.h"
#include <cstring>
#include <memory>

#ifndef SKPY_LIBNAME
#error Must define SKPY_LIBNAME so that the module knows the name of the Python package it is part of
#endif

#define _SKPY_LIBNAME_STR(name) SK_EXPAND_STR(name)
#define SKPY_LIBNAME_STR        _SKPY_LIBNAME_STR(SKPY_LIBNAME)

BEGIN_NAMESPACE_SK

////////////////////////////////////////////////////////////////////

// A Python callback raised; the Python error state is already set.
SK_DECL_ERROR_CLASS(python_error, runtime_error)

// Module-level exception types, all subclasses of ValueError.
// Created when the module is executed.
extern PyObject* PyExc_ConfigurationError;
extern PyObject* PyExc_UnresolvedReferenceError;
extern PyObject* PyExc_ValidationError;

void get_nested_exception_what(std::string& out, const std::exception& e, int level=0);

// The SKPY_TRY mechanism converts C++ exceptions to a Python exception
// and then sets the global Python exception state.
// Once an exception is caught like this, it's up to the calling code to
// return control back to the interpreter without raising further exceptions
// so that the original exception is the one seen by Python.
// A python_error means a Python callback already set the error state,
// so it is passed through untouched.
//
#define SKPY_TRY try {
#define SKPY_CATCH_CASE(cpp_etype, py_etype, return_stmt) \
                         } catch (const cpp_etype& e) {\
                             std::string what; \
                             get_nested_exception_what(what, e); \
                             PyErr_SetString(py_etype, what.c_str()); \
                             return_stmt;

#define _SKPY_CATCH(return_stmt) \
	} catch (const sk::python_error&) { \
		return_stmt; \
	SKPY_CATCH_CASE(sk::assertion_error, PyExc_AssertionError, return_stmt) \
	SKPY_CATCH_CASE(sk::file_error, PyExc_OSError, return_stmt) \
	SKPY_CATCH_CASE(sk::type_error, PyExc_TypeError, return_stmt) \
	SKPY_CATCH_CASE(sk::value_error, PyExc_ValueError, return_stmt) \
	SKPY_CATCH_CASE(sk::index_error, PyExc_IndexError, return_stmt) \
	SKPY_CATCH_CASE(sk::key_error, PyExc_KeyError, return_stmt) \
	SKPY_CATCH_CASE(sk::configuration_error, PyExc_ConfigurationError, return_stmt) \
	SKPY_CATCH_CASE(sk::reference_error, PyExc_UnresolvedReferenceError, return_stmt) \
	SKPY_CATCH_CASE(sk::validation_error, PyExc_ValidationError, return_stmt) \
	SKPY_CATCH_CASE(sk::unreachable_code_error, PyExc_RuntimeError, return_stmt) \
	SKPY_CATCH_CASE(sk::runtime_error, PyExc_RuntimeError, return_stmt) \
	SKPY_CATCH_CASE(std::exception, PyExc_RuntimeError, return_stmt) \
    }\
	return_stmt;

#define SKPY_CATCH_RETURN_VALUE(x) _SKPY_CATCH(return x)
#define SKPY_CATCH_RETURN_NULL     _SKPY_CATCH(return NULL)
#define SKPY_CATCH                 _SKPY_CATCH(return)

////////////////////////////////////////////////////////////////////////

#define SKPY_RETURN_NONE  do { Py_INCREF(Py_None);  return Py_None; } while (0)
#define SKPY_RETURN_INCREF(value) do { PyObject* tmp_value = value; Py_INCREF(tmp_value); return tmp_value; } while (0)

////////////////////////////////////////////////////////////////////

// Class to make Py_INCREF/Py_DECREF exception safe, when an error occurs and
// the stack needs to be unwound all the way to the last Python-to-C entry point.
struct PyObjectDecrementer {
	void operator()(PyObject* obj) const noexcept {
#if PY_VERSION_HEX >= 0x030B0000 // >= py311
		// Interpreter may already be finalized when static references are released.
		if (PyThreadState_Get() != nullptr) {
			Py_XDECREF(obj);
		}
#else
		Py_XDECREF(obj);
#endif
	};
};
using PyAutoRef = std::unique_ptr<PyObject, PyObjectDecrementer>;

// Use when there's no need to call Py_INCREF on acquire
#define SKPY_TAKEREF(obj_ptr)  PyAutoRef _##obj_ptr##_ref(obj_ptr);

// Use when there's no longer a need to call Py_DECREF, i.e. the responsibility is
// about to be passed on to another function, or to to Python interpreter.
#define SKPY_FORGETREF(obj_ptr)  _##obj_ptr##_ref.release();

/////////////////////////////////////////////////////////////////////////////////////////////

#define SKPY_TYPE_BEGIN(name) \
	struct Py##name: public PyObject { \
		static PyTypeObject* Type; /* C++-defined Python type */ \
		static void EnsureInit(); /* Make sure Init() called at least once */ \
		static void Init(); /* Initialize 'Type' members, if not already initialized */ \
		static void Register(PyObject* module);

#define SKPY_TYPE_END \
	};

#define SKPY_TYPEOBJ_BEGIN(name) \
	PyTypeObject* Py##name::Type = 0;\
	void Py##name::Register(PyObject* module)\
	{\
		EnsureInit(); \
		Py_INCREF((PyObject*)Type);\
		PyModule_AddObject(module, #name, (PyObject*)Type);\
	}\
	void Py##name::EnsureInit()\
	{\
		if (!Type || !Py_TYPE(Type)) \
			Init(); \
	}\
	void Py##name::Init()\
	{\
		const char* tp_name = SKPY_LIBNAME_STR "._cxx." #name;\
		Py_ssize_t tp_basicsize = sizeof(Py##name);\
		destructor tp_dealloc = 0;\
		reprfunc tp_repr = 0;\
		getattrofunc tp_getattro = 0;\
		long tp_flags = Py_TPFLAGS_DEFAULT;\
		const char* tp_doc = 0;\
		PyMethodDef* tp_methods = 0;\
		initproc tp_init = 0;\
		newfunc tp_new = 0;\
		{

#define SKPY_TYPEOBJ_END \
		}\
		static PyTypeObject StaticType = { PyVarObject_HEAD_INIT(nullptr, 0) };\
		Type = &StaticType;\
		auto& _typeobj = *Type;\
		_typeobj.tp_name = tp_name;\
		_typeobj.tp_basicsize = tp_basicsize;\
		_typeobj.tp_dealloc = tp_dealloc;\
		_typeobj.tp_repr = tp_repr;\
		_typeobj.tp_getattro = tp_getattro;\
		_typeobj.tp_flags = tp_flags;\
		_typeobj.tp_doc = tp_doc;\
		_typeobj.tp_methods = tp_methods;\
		_typeobj.tp_init = tp_init;\
		_typeobj.tp_new = tp_new;\
		SK_CHECK(PyType_Ready(&_typeobj) == 0, runtime, "Could not initialize type {}.", tp_name);\
	}

//////////////////////////////////////////////////////////////

#define SKPY_NEW_BEGIN(name)\
	PyObject* Py##name##_New(PyTypeObject* type, PyObject* args, PyObject* kwds)\
	{\
		SKPY_TRY\
		PyObject* selfo = type->tp_alloc(type, 0);\
		if (!selfo)\
			return nullptr;\
		Py##name* self = (Py##name*)selfo; \
		SKPY_TAKEREF(selfo);

#define SKPY_NEW_END \
	SKPY_FORGETREF(selfo);\
		return selfo;\
	SKPY_CATCH_RETURN_NULL \
	}

#define SKPY_DEALLOC_BEGIN(name) \
	void Py##name##_Dealloc(PyObject* selfo) \
	{ \
		SKPY_TRY \
		[[maybe_unused]] Py##name* self = *((Py##name**)&selfo);

#define SKPY_DEALLOC_END \
		Py_TYPE(selfo)->tp_free(selfo); \
	SKPY_CATCH \
	}

#define SKPY_GETATTRO_BEGIN(name)\
	PyObject* Py##name##_GetAttro(PyObject* selfo, PyObject* attro)\
	{\
		SKPY_TRY\
		[[maybe_unused]] Py##name* self = *((Py##name**)&selfo);\
		[[maybe_unused]] const char* attr = PyString_AS_STRING(attro);

#define SKPY_GETATTR_CASE(name) if (!strcmp(attr, name))

#define SKPY_GETATTRO_END\
	SKPY_CATCH_RETURN_NULL\
	}

#define SKPY_OMETHOD_BEGIN(name, method)\
	PyObject* Py##name##_##method(PyObject *selfo, PyObject *args, PyObject *kwds)\
	{\
		SKPY_TRY\
		[[maybe_unused]] Py##name* self = *((Py##name**)&selfo);

#define SKPY_OMETHOD_END\
	SKPY_CATCH_RETURN_NULL\
	}

#define SKPY_METHODS_BEGIN(type_name) \
	static PyMethodDef Py##type_name##_Methods[] = {

#define SKPY_METHOD_ENTRY(type_name, method_name, method_type, docstr) \
    {#method_name, (PyCFunction)Py##type_name##_##method_name, method_type, docstr},

#define SKPY_METHODS_END \
		{NULL}  /* Sentinel */ \
	};

#define SKPY_METHOD_BEGIN_NOARG(name, method_name) \
	PyObject* Py##name##_##method_name(PyObject* selfo, PyObject*) \
	{ \
		SKPY_TRY \
		[[maybe_unused]] Py##name* self = (Py##name*)selfo;

#define SKPY_METHOD_END \
		SKPY_CATCH_RETURN_NULL \
	}

//////////////////////////////////////////////////////////////

// Conversions between Python objects and C++ values. All throw on bad input.

// str(obj), or "" for None.
string as_string(PyObject* obj);

// None -> empty; a str -> one id; any other sequence -> its items as strings.
vector<string> as_string_list(PyObject* obj);

// dict of column name -> sequence of values, all of the same length.
raw_table as_raw_table(PyObject* dict, const char* source);

// dict of column name -> numpy array (int64 or float64 columns) or list of str.
PyObject* PyDict_FromTableView(const table_view& table);

//////////////////////////////////////////////////////////////

// Needed to override default export visibility on GCC when -fvisibility=hidden is set.
#ifdef _MSC_VER
#define EX_PYTHON_INIT
#else
#define EX_PYTHON_INIT __attribute__ ((visibility ("default")))
#endif

END_NAMESPACE_SK

#endif // __SYNTENY_KIT_PY_UTIL_H__
