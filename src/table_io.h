/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __SYNTENY_KIT_TABLE_IO_H__
#define __SYNTENY_KIT_TABLE_IO_H__

#include "accessor.h"
#include "record.h"

BEGIN_NAMESPACE_SK

struct table_read_options {
	char   delimiter{'\t'};
	string comment{"#"};    // lines starting with this are skipped; empty disables
};

// Reads a delimited text file with a header line. Files ending in .gz are decompressed.
raw_table read_table(const string& path, const table_read_options& options = {});

INLINE vector<seq_rec>     read_seqs_table(const string& path, const table_read_options& options = {})     { return seqs_from_table(read_table(path, options)); }
INLINE vector<feat_rec>    read_feats_table(const string& path, const table_read_options& options = {})    { return feats_from_table(read_table(path, options)); }
INLINE vector<link_rec>    read_links_table(const string& path, const table_read_options& options = {})    { return links_from_table(read_table(path, options)); }
INLINE vector<cluster_rec> read_clusters_table(const string& path, const table_read_options& options = {}) { return clusters_from_table(read_table(path, options)); }

// Writes a table as tab-separated text, gzip-compressed if path ends in .gz.
void write_table(const string& path, const table_view& table);

END_NAMESPACE_SK

#endif // __SYNTENY_KIT_TABLE_IO_H__
