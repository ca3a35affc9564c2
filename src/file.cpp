/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "file.h"
#include "fk_assert.h"
#include "strutil.h"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <zlib.h>

BEGIN_NAMESPACE_FK

string base_name(std::string_view path)
{
	auto slash = path.find_last_of("/\\");
	if (slash != std::string_view::npos)
		path.remove_prefix(slash + 1);
	return string(path);
}

///////////////////////////////////////////////////////////

namespace {
constexpr size_t min_bufsize = (1 << 17);
constexpr size_t max_bufsize = (1 << 23); // 8MB lines is probably enough! Something's probably wrong if we blow this.
}  // namespace

void line_reader::open(const string& path)
{
	_path = path;
	_fh   = unique_file{ std::fopen(path.c_str(), "rb"), &std::fclose };
	FK_CHECK(_fh, file, "Could not open {} for reading ({}).", path, strerror(errno));
	advance();
}

bool line_reader::refill()
{
	if (_eof)
		return false;

	// Slide the unreturned fragment to the front, growing the buffer if the
	// fragment already fills it.
	const size_t fragment = _len - _pos;
	if (_pos > 0 && fragment > 0)
		std::memmove(_buf.data(), _buf.data() + _pos, fragment);
	_pos = 0;
	_len = fragment;
	if (_len == _buf.size()) {
		const size_t new_size = std::max(min_bufsize, _buf.size() * 2);
		FK_CHECK(new_size <= max_bufsize, value, "Extremely long line encountered in {}. Something wrong?", _path);
		_buf.resize(new_size);
	}

	const size_t nread = fread(_buf.data() + _len, _buf.size() - _len);
	if (nread == 0)
		_eof = true;
	_len += nread;
	return nread > 0;
}

void line_reader::advance()
{
	for (;;) {
		const char* start = _buf.data() + _pos;
		const char* stop  = _buf.data() + _len;
		const char* nl    = _pos < _len ? scast<const char*>(std::memchr(start, '\n', stop - start)) : nullptr;
		if (nl || (_eof && _pos < _len)) {
			const char* end = nl ? nl : stop;
			_pos += (end - start) + (nl ? 1 : 0);
			if (end > start && end[-1] == '\r')
				--end;
			_line = std::string_view(start, end - start);
			++_line_num;
			return;
		}
		if (!refill() && _pos >= _len) {
			_line = {};
			_done = true;
			return;
		}
	}
}

size_t line_reader::fread(char* dst, size_t bytes)
{
	size_t n = std::fread(dst, 1, bytes, _fh.get());
	FK_CHECK(n == bytes || !std::ferror(_fh.get()), file, "I/O error reading {} ({}).", _path, strerror(errno));
	return n;
}

///////////////////////////////////////////////////////////

void zline_reader::open(const string& path)
{
	if (endswith(path, ".gz")) {
		_path = path;
		_zfh = { gzopen(path.c_str(), "rb"), &gzclose };
		FK_CHECK(_zfh, file, "Could not open {} for reading ({}).", path, strerror(errno));
		advance();  // OK to call virtual because VMT for zline_reader will be loaded by now
	} else {
		line_reader::open(path);
	}
}

size_t zline_reader::fread(char* dst, size_t bytes)
{
	if (_zfh) {
		int result = gzread(_zfh.get(), dst, scast<unsigned>(bytes));
		FK_CHECK(result >= 0, file, "I/O error reading compressed file {} ({}).", _path, strerror(errno));
		return scast<size_t>(result);
	}
	return line_reader::fread(dst, bytes);
}

END_NAMESPACE_FK
