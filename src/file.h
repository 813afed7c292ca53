/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __SYNTENY_KIT_FILE_H__
#define __SYNTENY_KIT_FILE_H__

#include "sk_assert.h"
#include <cstdio>
#include <memory>
#include <string>
#include <string_view>

struct gzFile_s;

BEGIN_NAMESPACE_SK
using std::string;

// Reads a text file one line at a time.
// Results do not include the newline character itself, nor a trailing '\r'.
// The view returned by line() is valid until the reader is advanced.
class line_reader {
public:
	explicit line_reader(const string& path) { open(path.c_str()); }
	virtual ~line_reader() = default;

	INLINE bool             done()     const { return _done; }
	INLINE std::string_view line()     const { return _line; }
	INLINE long long        line_num() const { return _line_num; }
	INLINE const string&    path()     const { return _path; }
	INLINE line_reader& operator++() { SK_DBASSERT(!done()); advance(); return *this; }

protected:
	line_reader() = default;
	void open(const char* path);
	void advance();
	virtual size_t fread(char* dst, unsigned bytes);

	using unique_file = std::unique_ptr<std::FILE, decltype(&std::fclose)>;

	string           _path;
	string           _buf;       // bytes read but not yet returned, starting at _start
	size_t           _start{};   // start of the next line within _buf
	size_t           _scan{};    // position from which to keep looking for '\n'
	std::string_view _line;
	long long        _line_num{};
	bool             _eof{};
	bool             _done{};
	unique_file      _fh { nullptr, [](auto) { return 0; } };
};

/////////////////////////////////////////////////////////////////////

// Same as line_reader, but transparently decompresses files ending in .gz
class zline_reader: public line_reader {
public:
	explicit zline_reader(const string& path) { open(path.c_str()); }

private:
	void open(const char* path); // not virtual
	size_t fread(char* dst, unsigned bytes) override;

	std::unique_ptr<gzFile_s, int (*)(gzFile_s*)> _zfh
		{ nullptr, [](auto) { return 0; } };
};

END_NAMESPACE_SK

#endif // __SYNTENY_KIT_FILE_H__
