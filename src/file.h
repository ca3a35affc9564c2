/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __FEATURE_KIT_FILE_H__
#define __FEATURE_KIT_FILE_H__

#include "fk_assert.h"
#include <cstdio>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

struct gzFile_s;

BEGIN_NAMESPACE_FK
using std::string;

// Final path component, with any directories removed.
string base_name(std::string_view path);

/////////////////////////////////////////////////////////////////////

// Buffered line reader; much faster than std::getline.
// line() excludes the newline (and a preceding '\r') and stays valid until
// the reader is advanced.
class line_reader {
public:
	explicit line_reader(const string& path) { open(path); }
	virtual ~line_reader() = default;
	NOCOPY(line_reader)

	INLINE bool             done() const { return _done; }
	INLINE std::string_view line() const { return _line; }
	INLINE line_reader& operator++() { FK_DBASSERT(!done()); advance(); return *this; }
	INLINE long long        line_num() const { return _line_num; }
	INLINE const string&    path() const { return _path; }

protected:
	line_reader() = default;
	void open(const string& path);
	void advance();
	bool refill();
	virtual size_t fread(char* dst, size_t bytes);

	using unique_file = std::unique_ptr<std::FILE, int (*)(std::FILE*)>;

	std::vector<char> _buf;        // bytes read but not yet returned live in [_pos, _len)
	size_t            _pos{};
	size_t            _len{};
	bool              _eof{};      // underlying handle has no more bytes
	bool              _done{};     // every line has been returned
	std::string_view  _line;
	string            _path;
	unique_file       _fh{ nullptr, [](std::FILE*) { return 0; } };
	long long         _line_num{};
};

/////////////////////////////////////////////////////////////////////

// Reads through zlib when the path ends in ".gz", otherwise like line_reader.
class zline_reader: public line_reader {
public:
	explicit zline_reader(const string& path) { open(path); }

private:
	void open(const string& path); // not virtual
	size_t fread(char* dst, size_t bytes) override;

	std::unique_ptr<gzFile_s, int (*)(gzFile_s*)> _zfh // zlib file handle, used if file ends in .gz
		{ nullptr, [](gzFile_s*) { return 0; } };
};

END_NAMESPACE_FK

#endif // __FEATURE_KIT_FILE_H__
