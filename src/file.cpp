/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "file.h"
#include "sk_assert.h"
#include "strutil.h"
#include <cerrno>
#include <cstring>
#include <zlib.h>

BEGIN_NAMESPACE_SK

static constexpr size_t read_chunk_size = (1 << 16);

void line_reader::open(const char* path)
{
	_path = path;
	_fh = unique_file{ std::fopen(path, "rb"), &std::fclose };
	SK_CHECK(_fh, file, "Could not open {} for reading ({}).", path, strerror(errno));
	advance();
}

void line_reader::advance()
{
	for (;;) {
		auto nl = _buf.find('\n', _scan);
		if (nl != string::npos || (_eof && _start < _buf.size())) {
			// Final line of a file without a trailing newline is returned as-is.
			size_t stop = nl != string::npos ? nl : _buf.size();
			size_t len  = stop - _start;
			if (len > 0 && _buf[_start + len - 1] == '\r')
				--len;
			_line  = std::string_view(_buf).substr(_start, len);
			_start = _scan = stop + (nl != string::npos ? 1 : 0);
			_line_num++;
			return;
		}
		if (_eof) {
			_line = {};
			_done = true;
			return;
		}

		// Drop returned lines from the buffer and append the next chunk.
		_buf.erase(0, _start);
		_start = 0;
		_scan  = _buf.size();
		_buf.resize(_scan + read_chunk_size);
		size_t nread = fread(&_buf[_scan], (unsigned)read_chunk_size);
		_buf.resize(_scan + nread);
		if (nread == 0)
			_eof = true;
	}
}

size_t line_reader::fread(char* dst, unsigned bytes)
{
	size_t n = std::fread(dst, 1, bytes, _fh.get());
	SK_CHECK(n == bytes || !std::ferror(_fh.get()), file, "I/O error reading {} ({}).", _path, strerror(errno));
	return n;
}

///////////////////////////////////////////////////////////

void zline_reader::open(const char* path)
{
	if (endswith(path, ".gz")) {
		_path = path;
		_zfh = { gzopen(path, "rb"), &gzclose };
		SK_CHECK(_zfh, file, "Could not open {} for reading ({}).", path, strerror(errno));
		advance();  // OK to call virtual because VMT for zline_reader will be loaded by now
	} else {
		line_reader::open(path);
	}
}

size_t zline_reader::fread(char* dst, unsigned bytes)
{
	if (_zfh) {
		int result = gzread(_zfh.get(), dst, bytes);
		SK_CHECK(result >= 0, file, "I/O error reading compressed file {} ({}).", _path, strerror(errno));
		return (size_t)result;
	}
	return line_reader::fread(dst, bytes);
}

END_NAMESPACE_SK
