/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __SYNTENY_KIT_SEQ_LAYOUT_H__
#define __SYNTENY_KIT_SEQ_LAYOUT_H__

#include "track_registry.h"
#include <memory>
#include <utility>

BEGIN_NAMESPACE_SK

// Where an inferred sequence starts: at the first observed coordinate, or at 0.
enum class infer_start_t : uint8_t { observed, zero };

// What to do with features and links that name an unknown sequence.
enum class resolve_policy_t : uint8_t { lenient, strict };

struct layout_options {
	pos_t            spacing{0};     // gap between consecutive sequences of a bin
	pos_t            wrap{0};        // max row width before a bin continues on a new row; 0 disables
	infer_start_t    infer_start{infer_start_t::observed};
	resolve_policy_t policy{resolve_policy_t::lenient};
	vector<string>   bin_order;      // listed bins first, the rest in order of appearance
	vector<string>   seq_order;      // same, for sequences within their bins
};

/////////////////////////////////////////////////////////////////

// A displayed sequence, or a focused locus of one.
struct seq_t {
	string   seq_id;
	string   bin_id;
	string   source_id;      // sequence that features and links refer to
	pos_t    length{};       // length of the source sequence
	window_t window{};       // displayed part of the source sequence
	strand_t strand{pos_strand};
	int      bin_index{};
	int      seq_index{};    // rank within the bin
	pos_t    x_offset{};
	int      y{};
	attr_map attrs;

	INLINE bool  is_flipped()  const { return strand == neg_strand; }
	INLINE bool  is_windowed() const { return window.start != 0 || window.end != length; }
	INLINE pos_t width()       const { return window.width(); }
	INLINE pos_t x()           const { return x_offset; }
	INLINE pos_t xend()        const { return x_offset + width(); }

	// Shared-axis extent [lo, hi] of a sequence-local span; mirrored when flipped.
	INLINE std::pair<pos_t, pos_t> project(const span_t& s) const
	{
		return is_flipped() ? std::pair{x_offset + window.end - s.end, x_offset + window.end - s.start}
							: std::pair{x_offset + s.start - window.start, x_offset + s.end - window.start};
	}

	// Inverse of project; x and xend may come in either order.
	INLINE span_t unproject(pos_t x, pos_t xend) const
	{
		pos_t lo = min(x, xend) - x_offset, hi = max(x, xend) - x_offset;
		return is_flipped() ? span_t{window.end - hi, window.end - lo}
							: span_t{lo + window.start, hi + window.start};
	}
};

struct bin_t {
	string bin_id;
	pos_t  shift{};     // added to every x_offset of the bin
	int    y{};         // row of the first sequence of the bin
	int    num_rows{1};
	int    first_seq{}; // index of the bin's first sequence
	int    num_seqs{};
};

// Sequences in display order: grouped by bin in bin order, then by seq_index.
class seq_layout {
public:
	seq_layout() = default;

	INLINE const vector<seq_t>& seqs() const { return _seqs; }
	INLINE const vector<bin_t>& bins() const { return _bins; }
	INLINE const seq_t& seq(int i)     const { return _seqs[i]; }
	INLINE int   num_seqs()            const { return (int)_seqs.size(); }
	INLINE int   num_bins()            const { return (int)_bins.size(); }
	INLINE pos_t spacing()             const { return _spacing; }
	INLINE pos_t wrap()                const { return _wrap; }

	// Index of a displayed sequence, or -1. An empty bin_id matches any bin, and a
	// seq_id displayed in more than one matching bin throws validation_error.
	int find_seq(string_view bin_id, string_view seq_id) const;
	// Same, for a seq_id or a "<bin_id>/<seq_id>" reference.
	int find_seq(string_view ref) const;
	int find_bin(string_view bin_id) const; // -1 if not displayed

	// Whether a source sequence exists at all, displayed or not.
	// An empty bin_id matches any bin.
	bool is_known_source(string_view bin_id, string_view source_id) const;

	// Build from sequences in any order; bins in first-appearance order.
	// shifts gives the initial x offset of bins by bin_id.
	static seq_layout from_seqs(vector<seq_t> seqs, pos_t spacing, pos_t wrap,
								const string_map<string, pos_t>& shifts = {});

	// Reorder or subset; the arguments are indices into bins() / seqs().
	void select_bins(const vector<int>& order);
	void select_seqs(const vector<int>& order);

	void flip_seq(int i);
	void flip_bin(int b);  // flips every sequence and reverses their order
	void shift_bin(int b, pos_t by);

	// New sequence set; bin shifts are kept for bins that remain.
	void replace_seqs(vector<seq_t> seqs);

private:
	void regroup(vector<seq_t> seqs, const string_map<string, pos_t>& shifts);
	void arrange();

	vector<seq_t> _seqs;
	vector<bin_t> _bins;
	pos_t         _spacing{};
	pos_t         _wrap{};
	std::shared_ptr<const string_map<string, vector<string>>> _sources; // source_id -> bin_ids
};

// Lay out the registry's sequence table, or sequences inferred from its
// first feature track (else first link track) when there is none.
seq_layout layout_sequences(const track_registry& registry, const layout_options& options);

END_NAMESPACE_SK

#endif // __SYNTENY_KIT_SEQ_LAYOUT_H__
