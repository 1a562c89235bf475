#pragma once

#include <string>
#include <vector>

#include "rangekv/kv/batch.h"
#include "rangekv/kv/errors.h"
#include "rkv/v1alpha1/data.pb.h"

////////////////////////////////////////////////////////////////////////

namespace rkv::storage::addressing {

////////////////////////////////////////////////////////////////////////

using rkv::kv::Batch;
using rkv::kv::Error;
using rkv::v1alpha1::RangeDescriptor;

////////////////////////////////////////////////////////////////////////

// Maintenance of the two-level addressing index used to find the
// range that owns any key.
//
// Every range has a record keyed by its end key:
//
//   1. A range that starts or ends within the level-1 range is an
//      error, the level-1 range can never be split.
//
//   2. A range that ends with a level-2 key (i.e., a range of
//      level-2 records) is addressed by the level-1 record
//      'RangeMetaKey(end_key)'.
//
//   3. A range that ends with a user key is addressed by the level-2
//      record 'meta2(end_key)'.
//
//      3a. If such a range starts at 'kKeyMin' or with a level-2 key
//          it also holds the last level-2 records and thus is
//          addressed by the level-1 record 'meta1(kKeyMax)'.
//
// All functions append to 'batch' only when they succeed and append
// exactly the same mutations given the same descriptors, so a retried
// batch can be recomputed safely.

////////////////////////////////////////////////////////////////////////

// Returns the keys of the addressing records for 'desc'.
tl::expected<std::vector<std::string>, Error> AddressingKeys(
    const RangeDescriptor& desc);

// Adds the records for a newly created range, e.g., the very first
// range when bootstrapping.
tl::expected<void, Error> OnCreate(Batch& batch, const RangeDescriptor& desc);

// Adds the records for 'left' and 'right' which replace 'original'.
// Fails with a 'Meta1SplitError' if any of the boundaries lie within
// the level-1 range.
tl::expected<void, Error> OnSplit(
    Batch& batch,
    const RangeDescriptor& original,
    const RangeDescriptor& left,
    const RangeDescriptor& right);

// Removes the records describing the boundary between 'left' and
// 'right' and adds the records for 'merged' which replaces both.
tl::expected<void, Error> OnMerge(
    Batch& batch,
    const RangeDescriptor& left,
    const RangeDescriptor& right,
    const RangeDescriptor& merged);

////////////////////////////////////////////////////////////////////////

}  // namespace rkv::storage::addressing

////////////////////////////////////////////////////////////////////////
