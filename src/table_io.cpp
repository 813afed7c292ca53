/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "table_io.h"
#include "file.h"
#include "strutil.h"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fmt/format.h>
#include <memory>
#include <zlib.h>

BEGIN_NAMESPACE_SK

raw_table read_table(const string& path, const table_read_options& options)
{
	raw_table table;
	table.source = path;

	vector<string_view> cols;
	bool have_header = false;
	for (zline_reader lr(path); !lr.done(); ++lr) {
		auto line = lr.line();
		if (strip(line).empty() || (!options.comment.empty() && startswith(line, options.comment)))
			continue;
		split_view(line, options.delimiter, cols);
		if (!have_header) {
			for (auto c : cols)
				table.columns.emplace_back(strip(c));
			have_header = true;
			continue;
		}
		SK_CHECK(cols.size() == table.columns.size(), value, "{}:{}: expected {} columns but found {}.",
				 path, lr.line_num(), table.columns.size(), cols.size());
		auto& row = table.rows.emplace_back();
		row.reserve(cols.size());
		for (auto c : cols)
			row.emplace_back(c);
	}
	SK_CHECK(have_header, configuration, "{} has no header line.", path);
	return table;
}

/////////////////////////////////////////////////////////////////

// Output sink for write_table; plain stdio or zlib.
class text_writer {
public:
	explicit text_writer(const string& path)
	: _path(path)
	{
		if (endswith(path, ".gz")) {
			_zfh = { gzopen(path.c_str(), "wb"), &gzclose };
			SK_CHECK(_zfh, file, "Could not open {} for writing ({}).", path, strerror(errno));
		} else {
			_fh = { std::fopen(path.c_str(), "wb"), &std::fclose };
			SK_CHECK(_fh, file, "Could not open {} for writing ({}).", path, strerror(errno));
		}
	}

	void write(string_view s)
	{
		if (s.empty())
			return;
		if (_zfh) {
			int n = gzwrite(_zfh.get(), s.data(), (unsigned)s.size());
			SK_CHECK(n == (int)s.size(), file, "Failed writing to {}.", _path);
		} else {
			size_t n = std::fwrite(s.data(), 1, s.size(), _fh.get());
			SK_CHECK(n == s.size(), file, "Failed writing to {} ({}).", _path, strerror(errno));
		}
	}

	void close()
	{
		if (_zfh)
			SK_CHECK(gzclose(_zfh.release()) == Z_OK, file, "Failed closing {}.", _path);
		if (_fh)
			SK_CHECK(std::fclose(_fh.release()) == 0, file, "Failed closing {} ({}).", _path, strerror(errno));
	}

private:
	string _path;
	std::unique_ptr<std::FILE, int (*)(std::FILE*)> _fh { nullptr, [](std::FILE*) { return 0; } };
	std::unique_ptr<gzFile_s, int (*)(gzFile_s*)>   _zfh{ nullptr, [](gzFile_s*) { return 0; } };
};

static string cell_as_str(const column_t& column, size_t row)
{
	return std::visit([row](const auto& c) { return fmt::format("{}", c[row]); }, column);
}

void write_table(const string& path, const table_view& table)
{
	text_writer out(path);
	string line;
	for (size_t c = 0; c < table.num_cols(); ++c) {
		if (c > 0)
			line += '\t';
		line += table.names()[c];
	}
	line += '\n';
	out.write(line);

	for (size_t r = 0; r < table.num_rows(); ++r) {
		line.clear();
		for (size_t c = 0; c < table.num_cols(); ++c) {
			if (c > 0)
				line += '\t';
			line += cell_as_str(table.columns()[c], r);
		}
		line += '\n';
		out.write(line);
	}
	out.close();
}

END_NAMESPACE_SK
