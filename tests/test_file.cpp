/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include <gtest/gtest.h>

#include "file.h"
#include "test_util.h"

using namespace fk;
using namespace fk::test;

namespace {

std::vector<string> read_all(line_reader& lr)
{
	std::vector<string> lines;
	for (; !lr.done(); ++lr)
		lines.emplace_back(lr.line());
	return lines;
}

}  // namespace

TEST(LineReaderTest, StripsLineEndings)
{
	auto path = write_tmp("crlf.txt", "one\r\ntwo\n\nthree");
	zline_reader lr(path);
	auto lines = read_all(lr);
	ASSERT_EQ(lines.size(), 4u);
	EXPECT_EQ(lines[0], "one");
	EXPECT_EQ(lines[1], "two");
	EXPECT_EQ(lines[2], "");
	EXPECT_EQ(lines[3], "three");
}

TEST(LineReaderTest, CountsLines)
{
	auto path = write_tmp("count.txt", "a\nb\nc\n");
	zline_reader lr(path);
	++lr;
	++lr;
	EXPECT_EQ(lr.line(), "c");
	EXPECT_EQ(lr.line_num(), 3);
	++lr;
	EXPECT_TRUE(lr.done());
}

TEST(LineReaderTest, ReadsGzip)
{
	string text;
	for (int i = 0; i < 50000; ++i)
		text += "chr1\t" + std::to_string(i) + "\t" + std::to_string(i + 10) + "\n";
	auto path = write_tmp_gz("many.bed.gz", text);
	zline_reader lr(path);
	auto lines = read_all(lr);
	ASSERT_EQ(lines.size(), 50000u);
	EXPECT_EQ(lines.back(), "chr1\t49999\t50009");
}

TEST(LineReaderTest, EmptyFileIsDone)
{
	auto path = write_tmp("empty.txt", "");
	zline_reader lr(path);
	EXPECT_TRUE(lr.done());
}

TEST(LineReaderTest, MissingFileThrows)
{
	EXPECT_THROW(zline_reader(tmp_path("does_not_exist.txt")), file_error);
	EXPECT_THROW(zline_reader(tmp_path("does_not_exist.txt.gz")), file_error);
}

TEST(FileTest, BaseName)
{
	EXPECT_EQ(base_name("/data/genes.gtf.gz"), "genes.gtf.gz");
	EXPECT_EQ(base_name("genes.bed"), "genes.bed");
}
