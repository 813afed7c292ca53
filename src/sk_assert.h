/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __SK_ASSERT_H__
#define __SK_ASSERT_H__

#include "defines.h"
#include <cstdlib>
#include <fmt/format.h>
#include <stdexcept>
#include <string>

BEGIN_NAMESPACE_SK

static const auto sk_debugbreak = getenv("SK_DEBUGBREAK") != nullptr;

class runtime_error : public std::runtime_error {
public:
	runtime_error(const char* msg, const char* file, int line): std::runtime_error(msg), file(file), line(line) {}
	runtime_error(const std::string& msg, const char* file, int line): std::runtime_error(msg), file(file), line(line) {}
	const char* what() const noexcept;

	// Message without the file:line prefix, for presenting to end users.
	const char* message() const noexcept { return std::runtime_error::what(); }

private:
	std::string buf;
	const char* file;
	int         line;
};

#define SK_DECL_ERROR_CLASS(error_class, base_class) \
	class error_class : public base_class { \
	public: \
		error_class(const char* msg, const char* file, int line): base_class(msg, file, line) { } \
		error_class(const std::string& msg, const char* file, int line): base_class(msg, file, line) { } \
	};

SK_DECL_ERROR_CLASS(assertion_error, runtime_error)
SK_DECL_ERROR_CLASS(file_error,      runtime_error)
SK_DECL_ERROR_CLASS(type_error,      runtime_error)
SK_DECL_ERROR_CLASS(value_error,     runtime_error)
SK_DECL_ERROR_CLASS(index_error,     runtime_error)
SK_DECL_ERROR_CLASS(key_error,       runtime_error)
SK_DECL_ERROR_CLASS(unreachable_code_error, runtime_error)
// Layout errors. Missing columns or track identity, no derivable sequences.
SK_DECL_ERROR_CLASS(configuration_error, runtime_error)
// A feature or link names a sequence that does not exist (strict mode only).
SK_DECL_ERROR_CLASS(reference_error,     runtime_error)
// Caller-supplied ids that do not exist, or a focus that selects nothing.
SK_DECL_ERROR_CLASS(validation_error,    runtime_error)

extern bool is_debugger_running();

// When SK_DEBUGBREAK is set in the environment and a debugger is attached,
// SK_THROW, SK_CHECK and SK_ASSERT trap before throwing.
#if defined(_MSC_VER)
	#define SK_DEBUGBREAK { if (sk_debugbreak && sk::is_debugger_running()) __debugbreak(); }
#elif defined(__clang__)
	#define SK_DEBUGBREAK { if (sk_debugbreak && sk::is_debugger_running()) __builtin_debugtrap(); }
#elif defined(__GNUC__)
	#define SK_DEBUGBREAK { if (sk_debugbreak && sk::is_debugger_running()) __builtin_trap(); }
#else
	#error Unsupported compiler.
#endif

//! \brief Throw an SK exception of the specified type.
//!
//! SK_THROW(etype, msg) throws sk::etype_error with the given message.
//!
//! SK_THROW(etype, msg, ...) formats the message with fmt::format.
//!
#define SK_MAKE_ERROR(etype, msg, ...) \
	sk::etype##_error(fmt::format(msg __VA_OPT__(, ) __VA_ARGS__), __FILE__, __LINE__)
#define SK_THROW(etype, ...) throw SK_MAKE_ERROR(etype, __VA_ARGS__)
#define SK_DEBUGBREAK_THROW(etype, ...) \
	SK_DEBUGBREAK; \
	SK_THROW(etype, __VA_ARGS__)
#define SK_LIKELY_OR(cond, expr) \
	do { \
		if (LIKELY(cond)) { \
		} else { \
			expr; \
		} \
	} while (0)

//! \brief If expr is false, throw an assertion_error.
//!
//! SK_ASSERT(expr) appends the failed expression to the error message.
//! SK_ASSERT(expr, msg, ...) also appends a formatted message.
//!
#define SK_ASSERT(expr, ...) SK_LIKELY_OR(expr, SK_DEBUGBREAK_THROW(assertion, "({}): " SK_VA_HEAD(__VA_ARGS__), #expr SK_VA_COMMA_TAIL(__VA_ARGS__)))

//! \brief If expr is false, throw a specific type of exception.
//!
//! SK_CHECK(expr, etype, msg, ...) throws sk::etype_error with a
//! message formatted by fmt::format.
//!
#define SK_CHECK(expr, etype, ...)  SK_LIKELY_OR(expr, SK_DEBUGBREAK_THROW(etype, __VA_ARGS__))

#define SK_UNREACHABLE()            do { SK_DEBUGBREAK_THROW(unreachable_code, ""); } while (0)

#ifdef SK_DEBUG
#ifndef SK_ENABLE_DBASSERT
#define SK_ENABLE_DBASSERT
#endif
#endif

#ifdef SK_ENABLE_DBASSERT
#define SK_DBASSERT(...)      SK_ASSERT(__VA_ARGS__)
#else
#define SK_DBASSERT(...)      { }
#endif

END_NAMESPACE_SK

#endif  // __SK_ASSERT_H__
