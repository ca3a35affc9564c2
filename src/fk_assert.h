/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __FK_ASSERT_H__
#define __FK_ASSERT_H__

#include "defines.h"
#include "format.h"
#include <exception>
#include <stdexcept>
#include <string>

BEGIN_NAMESPACE_FK

class runtime_error : public std::runtime_error {
public:
	runtime_error(const char* msg, const char* file, int line): std::runtime_error(msg), file(file), line(line) {}
	runtime_error(const std::string& msg, const char* file, int line): std::runtime_error(msg), file(file), line(line) {}
	const char* what() const noexcept override;

private:
	std::string buf;
	const char* file;
	int         line;
};

#define FK_DECL_ERROR_CLASS(error_class, base_class) \
	class error_class : public base_class { \
	public: \
		error_class(const char* msg, const char* file, int line): base_class(msg, file, line) { } \
		error_class(const std::string& msg, const char* file, int line): base_class(msg, file, line) { } \
	};

FK_DECL_ERROR_CLASS(assertion_error, runtime_error)
FK_DECL_ERROR_CLASS(file_error,      runtime_error)
FK_DECL_ERROR_CLASS(value_error,     runtime_error)
FK_DECL_ERROR_CLASS(key_error,       runtime_error)
FK_DECL_ERROR_CLASS(unreachable_code_error, runtime_error)
// Annotation parsing errors
FK_DECL_ERROR_CLASS(unrecognized_format_error,     runtime_error)  // no dialect matches extension or content
FK_DECL_ERROR_CLASS(malformed_line_error,          runtime_error)  // data line does not fit its dialect
FK_DECL_ERROR_CLASS(duplicate_identifier_error,    runtime_error)  // GFF3 ID collision
FK_DECL_ERROR_CLASS(invalid_mode_transition_error, runtime_error)  // streaming and materializing mixed on one session

// Walks a chain of nested exceptions and joins their messages, outermost first.
std::string nested_what(const std::exception& e);

//! \brief Throw an FK exception of the specified type.
//!
//! FK_THROW(etype, msg, ...) throws etype##_error with a message
//! formatted from msg and the remaining arguments.
//!
#define FK_MAKE_ERROR(etype, msg, ...) \
	fk::etype##_error(fk::format(msg __VA_OPT__(, ) __VA_ARGS__), __FILE__, __LINE__)
#define FK_THROW(etype, ...) throw FK_MAKE_ERROR(etype, __VA_ARGS__)
#define FK_CATCH_THROW_NESTED_AS(from, to, ...) \
	catch (const fk::from##_error&) \
	{ \
		std::throw_with_nested(FK_MAKE_ERROR(to, __VA_ARGS__)); \
	}
#define FK_CATCH_THROW_NESTED(etype, ...) FK_CATCH_THROW_NESTED_AS(etype, etype, __VA_ARGS__)
#define FK_LIKELY_OR(cond, expr) \
	do { \
		if (LIKELY(cond)) { \
		} else { \
			expr; \
		} \
	} while (0)

// Add file/line context to an error escaping a per-line decode.
// Conversion failures inside a data line are reported as malformed lines.
// ordered from derived -> base
#define FK_RETHROW(...) \
	FK_CATCH_THROW_NESTED(malformed_line, __VA_ARGS__) \
	FK_CATCH_THROW_NESTED_AS(value, malformed_line, __VA_ARGS__) \
	FK_CATCH_THROW_NESTED(duplicate_identifier, __VA_ARGS__) \
	FK_CATCH_THROW_NESTED(unrecognized_format, __VA_ARGS__) \
	FK_CATCH_THROW_NESTED(invalid_mode_transition, __VA_ARGS__) \
	FK_CATCH_THROW_NESTED(assertion, __VA_ARGS__) \
	FK_CATCH_THROW_NESTED(file, __VA_ARGS__) \
	FK_CATCH_THROW_NESTED(key, __VA_ARGS__) \
	FK_CATCH_THROW_NESTED(unreachable_code, __VA_ARGS__) \
	FK_CATCH_THROW_NESTED(runtime, __VA_ARGS__)

//! \brief If expr is false, throw an assertion_error.
//!
//! FK_ASSERT(expr) appends the failed expression to the message;
//! FK_ASSERT(expr, msg, ...) also appends a custom formatted message.
//!
#define FK_ASSERT(expr, ...) FK_LIKELY_OR(expr, FK_THROW(assertion, "({}): " FK_VA_HEAD(__VA_ARGS__), #expr FK_VA_COMMA_TAIL(__VA_ARGS__)))

//! \brief If expr is false, throw a specific type of exception.
//!
//! FK_CHECK(expr, etype, msg, ...) throws etype##_error with a
//! custom formatted message.
//!
#define FK_CHECK(expr, etype, ...)  FK_LIKELY_OR(expr, FK_THROW(etype, __VA_ARGS__))

//! \brief Throw an unreachable_code_error exception.
#define FK_UNREACHABLE()            do { FK_THROW(unreachable_code, ""); } while (0)

#ifdef FK_DEBUG
#ifndef FK_ENABLE_DBASSERT
#define FK_ENABLE_DBASSERT
#endif
#endif

#ifdef FK_ENABLE_DBASSERT
#define FK_DBASSERT(...)      FK_ASSERT(__VA_ARGS__)
#else
#define FK_DBASSERT(...)      { }
#endif

END_NAMESPACE_FK

#endif  // __FK_ASSERT_H__
