/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "util.h"
#include <cstdlib>

BEGIN_NAMESPACE_SK

bool is_quiet()
{
	// Looked up on every call so that tests and callers can toggle it at runtime.
	return getenv("SYNTENYKIT_QUIET") != nullptr;
}

END_NAMESPACE_SK
