/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __SYNTENY_KIT_TRACK_REGISTRY_H__
#define __SYNTENY_KIT_TRACK_REGISTRY_H__

#include "record.h"
#include <memory>

BEGIN_NAMESPACE_SK

enum class track_type_t : uint8_t { seqs, feats, links };

const char* track_type_as_str(track_type_t type);

// Original rows are never modified once registered, so layout states share them.
template <class T>
using shared_rows = std::shared_ptr<const vector<T>>;

struct feat_track {
	string               id;
	shared_rows<feat_rec> rows;
};

struct link_track {
	string               id;
	shared_rows<link_rec> rows;
};

// Named feature and link tracks plus the optional sequence table.
// Track ids are unique across feats and links.
class track_registry {
public:
	void set_seqs(vector<seq_rec> seqs);
	void add_feats(string id, vector<feat_rec> rows);
	void add_links(string id, vector<link_rec> rows);

	// Swap the rows of an existing feat track for an annotated copy.
	void replace_feats(string_view id, vector<feat_rec> rows);

	INLINE bool has_seqs() const { return scast<bool>(_seqs); }
	INLINE const shared_rows<seq_rec>& seqs() const { return _seqs; }

	bool         has_track(string_view id) const;
	track_type_t track_type(string_view id) const;
	const feat_track& feats(string_view id) const;
	const link_track& links(string_view id) const;

	INLINE const vector<feat_track>& feat_tracks() const { return _feats; }
	INLINE const vector<link_track>& link_tracks() const { return _links; }

	// Id for a track passed without a name: "genes", "feats" or "links",
	// else the first free of "<base>_2", "<base>_3", ...
	string unnamed_track_id(track_type_t type, bool genes = false) const;

private:
	void check_new_id(string_view id) const;

	shared_rows<seq_rec> _seqs;
	vector<feat_track>   _feats;
	vector<link_track>   _links;
};

END_NAMESPACE_SK

#endif // __SYNTENY_KIT_TRACK_REGISTRY_H__
