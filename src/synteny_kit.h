/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __SYNTENY_KIT_API_H__
#define __SYNTENY_KIT_API_H__

#include "accessor.h"
#include "interval.h"
#include "layout.h"
#include "table_io.h"
#include "transform.h"

#endif // __SYNTENY_KIT_API_H__
