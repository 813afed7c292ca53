/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __SYNTENY_KIT_UTIL_H__
#define __SYNTENY_KIT_UTIL_H__

#include "defines.h"
#include "sk_assert.h"
#include <algorithm>
#include <cstdlib>
#include <fmt/format.h>
#include <iostream>
#include <new>
#include <type_traits>
#include <utility>

BEGIN_NAMESPACE_SK

template<typename ...T>
void print(fmt::format_string<T...> fmtstr, T&&... args)
{
	std::cerr << fmt::format(fmtstr, std::forward<T>(args)...);
}

template <typename... T>
void println(fmt::format_string<T...> fmtstr, T&&... args)
{
	std::cerr << fmt::format(fmtstr, std::forward<T>(args)...) << '\n';
}

// True when SYNTENYKIT_QUIET is set; informational messages and
// lenient-mode warnings are then suppressed.
bool is_quiet();

// Like println, but only when not quiet.
template <typename... T>
void inform(fmt::format_string<T...> fmtstr, T&&... args)
{
	if (!is_quiet())
		println(fmtstr, std::forward<T>(args)...);
}

///////////////////////////////////////////////////

template <class Enum>
constexpr std::underlying_type_t<Enum> as_ordinal(Enum e) noexcept
{
	return static_cast<std::underlying_type_t<Enum>>(e);
}

template <class C, class K>
const typename C::mapped_type& find_or(const C& container, const K& key, const typename C::mapped_type& default_value)
{
	if (auto it = container.find(key); it != std::cend(container)) {
		return it->second;
	}
	return default_value;
}

////////////////////////////////////////////////////

template <typename T> INLINE void destruct(T* x) { x->~T(); }

// Automatically calls destructor (but not delete!) on an object if it was not told to release the object.
template <typename T>
class constructor_tag { NOCOPY(constructor_tag)
public:
	INLINE constructor_tag(T* ptr) noexcept : _ptr(ptr) { }
	INLINE ~constructor_tag() { if (_ptr) destruct(_ptr); }
	INLINE void release() noexcept { _ptr = nullptr; }

private:
	T* _ptr;
};

#define SK_TENTATIVE_INPLACE_CONSTRUCT(member_name, type, ...) \
	new (&(self->member_name)) type(__VA_ARGS__);\
	constructor_tag<type> member_name##_tag(&self->member_name)

#define SK_FINALIZE_CONSTRUCT(tag) tag##_tag.release()

END_NAMESPACE_SK

#endif // __SYNTENY_KIT_UTIL_H__
