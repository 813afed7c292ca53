/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __DEFINES_H__
#define __DEFINES_H__

#ifndef NDEBUG
#ifndef SK_DEBUG
#define SK_DEBUG
#endif
#endif

#if (defined _MSC_VER) || (defined __CYGWIN__)
#define INLINE __forceinline
#define LIKELY(exp) exp
#elif (defined __GNUC__)
#define INLINE inline __attribute__((always_inline))
#define LIKELY(exp) __builtin_expect(!!(exp), 1)
#else
#error Unsupported compiler.
#endif

#include <cstdint>

#define NOCOPY(C) C(const C&) = delete; C& operator=(const C&) = delete;

#define BEGIN_NAMESPACE_SK namespace sk {
#define END_NAMESPACE_SK   }
#define USING_NAMESPACE_SK using namespace sk;

#define SK_EXPAND(x) x
#define SK_EXPAND_STR(x) #x

#define SK_VA_HEAD(head, ...)  head
#define SK_VA_COMMA_TAIL(head, ...)  __VA_OPT__(,) __VA_ARGS__

// Shorthand so that casting is not so verbose
#define scast static_cast
#define ccast const_cast

#endif // __DEFINES_H__
