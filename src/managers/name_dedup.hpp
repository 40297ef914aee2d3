#pragma once

#include <vector>
#include <core/types.hpp>

// Make every computed_name unique.
//
// Records sharing a computed name are renamed "{n}_{name}" in discovery
// order, with n restarting at 1 for each group. A candidate that is already
// taken by some other record is skipped (n keeps counting), so the result is
// always pairwise distinct. Records with a unique name are not touched.
//
// Returns the number of records renamed.
size_t deduplicate_names(std::vector<FileRecord>& records);
