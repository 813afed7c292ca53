/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __SYNTENY_KIT_RECORD_H__
#define __SYNTENY_KIT_RECORD_H__

#include "interval.h"
#include "strutil.h"
#include <optional>
#include <string>
#include <utility>
#include <vector>

BEGIN_NAMESPACE_SK

// Input columns that have no meaning to the layout engine (score, identity, name, ...).
// Carried through unchanged and reported back by the accessors. Insertion order is kept.
class attr_map {
public:
	using item_t = std::pair<string, string>;

	void set(string_view name, string value);
	const string* find(string_view name) const;
	const string& get(string_view name) const;
	INLINE bool contains(string_view name) const { return find(name) != nullptr; }

	INLINE size_t size()  const { return _items.size(); }
	INLINE bool   empty() const { return _items.empty(); }
	INLINE auto   begin() const { return _items.begin(); }
	INLINE auto   end()   const { return _items.end(); }

private:
	vector<item_t> _items;
};

/////////////////////////////////////////////////////////////////
// records
/////////////////////////////////////////////////////////////////

struct seq_rec {
	string   seq_id;
	string   bin_id;                 // defaults to seq_id
	string   source_id;              // underlying sequence that features refer to; defaults to seq_id
	pos_t    length{};
	strand_t strand{pos_strand};     // display orientation
	std::optional<window_t> window;  // displayed part of the sequence, [0, length) if absent
	pos_t    shift{};                // x offset of the whole bin; equal for all sequences of a bin
	attr_map attrs;
};

struct feat_rec {
	string   feat_id;                // generated from the track id if absent
	string   seq_id;
	string   bin_id;                 // optional; disambiguates a seq_id used in several bins
	span_t   span{};                 // 1-based, end inclusive
	strand_t strand{no_strand};
	string   parent_id;              // enclosing feature, for sub-features
	attr_map attrs;
};

struct link_rec {
	string   seq_id1;
	string   bin_id1;
	span_t   span1{};
	string   seq_id2;
	string   bin_id2;
	span_t   span2{};
	strand_t strand{pos_strand};     // orientation of side 2 relative to side 1
	attr_map attrs;
};

struct cluster_rec {
	string cluster_id;
	string feat_id;
};

/////////////////////////////////////////////////////////////////
// untyped tables
/////////////////////////////////////////////////////////////////

// Rows of string cells under a header, as produced by a parser or a binding layer.
struct raw_table {
	string                 source;   // file name or other origin, for error messages
	vector<string>         columns;
	vector<vector<string>> rows;

	int col(string_view name) const; // -1 if absent
	void require(std::initializer_list<const char*> names, const char* role) const;
};

// Validate a raw table against a schema and convert it to records.
// Unrecognized columns end up in attrs.
vector<seq_rec>     seqs_from_table(const raw_table& table);
vector<feat_rec>    feats_from_table(const raw_table& table);
vector<link_rec>    links_from_table(const raw_table& table);
vector<cluster_rec> clusters_from_table(const raw_table& table);

// Links given with start > end on a side are swapped and the link strand toggled.
void normalize_link(link_rec& link);

// Exchange query (side 1) and subject (side 2) of each link,
// including passthrough columns paired as <name>/<name>2.
vector<link_rec> swap_query(vector<link_rec> links);

END_NAMESPACE_SK

#endif // __SYNTENY_KIT_RECORD_H__
