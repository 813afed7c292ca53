/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __SYNTENY_KIT_ACCESSOR_H__
#define __SYNTENY_KIT_ACCESSOR_H__

#include "layout.h"
#include <variant>

BEGIN_NAMESPACE_SK

using int_column    = vector<int64_t>;
using double_column = vector<double>;
using string_column = vector<string>;
using column_t      = std::variant<int_column, double_column, string_column>;

// Column-oriented snapshot of a track joined with its layout coordinates.
// Later transforms do not affect a table_view that was already returned.
class table_view {
public:
	INLINE const vector<string>&   names()    const { return _names; }
	INLINE const vector<column_t>& columns()  const { return _columns; }
	INLINE size_t                  num_cols() const { return _names.size(); }
	INLINE size_t                  num_rows() const { return _num_rows; }

	bool            has(string_view name) const;
	const column_t& operator[](string_view name) const;  // key_error if absent

	template <class T>
	const vector<T>& get(string_view name) const
	{
		const auto* col = std::get_if<vector<T>>(&(*this)[name]);
		SK_CHECK(col, type, "Column \"{}\" has a different type.", name);
		return *col;
	}

	void add(string name, column_t column);

private:
	vector<string>   _names;
	vector<column_t> _columns;
	size_t           _num_rows{};
};

// seq_id, bin_id, source_id, length, start, end, strand, bin_index, seq_index,
// x_offset, x, xend, y, then passthrough columns.
table_view get_seqs(const layout& lay);

// bin_id, bin_index, y, num_rows, x, xend
table_view get_bins(const layout& lay);

// Original columns plus track_id, x, xend, y. First feat track if track_id is empty.
table_view get_feats(const layout& lay, string_view track_id = {});

// Original columns plus track_id, x, xend, y, x2, xend2, y2, orientation.
table_view get_links(const layout& lay, string_view track_id = {});

// track_id, type, num_rows, num_visible, num_unresolved, num_hidden, num_outside
table_view track_info(const layout& lay);

// Passthrough values become int or double columns when every value parses as one.
column_t infer_column(vector<string> values);

END_NAMESPACE_SK

#endif // __SYNTENY_KIT_ACCESSOR_H__
