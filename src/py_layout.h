/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __SYNTENY_KIT_PY_LAYOUT_H__
#define __SYNTENY_KIT_PY_LAYOUT_H__

#include "py_util.h"
#include "synteny_kit.h"

BEGIN_NAMESPACE_SK

SKPY_TYPE_BEGIN(Layout)
	layout lay;
	bool   lay_constructed; // Flag indicating whether __new__ succeeded

	INLINE static layout& value(PyObject* obj) { return ((PyLayout*)obj)->lay; }
SKPY_TYPE_END

// New reference to a Layout object holding value.
PyObject* PyLayout_FromValue(layout value);

// dict of columns from a table file, typed like the accessor columns.
PyObject* PyDict_FromRawTable(const raw_table& table);

END_NAMESPACE_SK

#endif // __SYNTENY_KIT_PY_LAYOUT_H__
