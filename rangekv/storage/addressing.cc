#include "rangekv/storage/addressing.h"

#include <algorithm>

#include "fmt/format.h"
#include "rangekv/keys.h"

////////////////////////////////////////////////////////////////////////

using tl::make_unexpected;

////////////////////////////////////////////////////////////////////////

namespace rkv::storage::addressing {

////////////////////////////////////////////////////////////////////////

namespace {

std::string Describe(const RangeDescriptor& desc) {
  return fmt::format(
      "{} ['{}', '{}')",
      desc.range_id(),
      keys::PrettyPrint(desc.start_key()),
      keys::PrettyPrint(desc.end_key()));
}

}  // namespace

////////////////////////////////////////////////////////////////////////

tl::expected<std::vector<std::string>, Error> AddressingKeys(
    const RangeDescriptor& desc) {
  // 1. Ranges regarding level-1 records.
  if (keys::IsWithinMeta1Range(desc.start_key())
      || keys::IsWithinMeta1Range(desc.end_key())) {
    return make_unexpected(kv::MakeMeta1SplitError(desc));
  }

  // 2. Ranges of level-2 records are addressed by a level-1 record.
  if (keys::HasPrefix(desc.end_key(), keys::kMeta2Prefix)) {
    return std::vector<std::string>{keys::RangeMetaKey(desc.end_key())};
  }

  // 3. Ranges of user keys are addressed by a level-2 record.
  std::vector<std::string> addressing_keys = {
      keys::MakeMeta2Key(desc.end_key())};

  // 3a. The range holding the last level-2 records.
  if (desc.start_key() == keys::kKeyMin
      || keys::HasPrefix(desc.start_key(), keys::kMeta2Prefix)) {
    addressing_keys.push_back(keys::MakeMeta1Key(keys::kKeyMax));
  }

  return addressing_keys;
}

////////////////////////////////////////////////////////////////////////

tl::expected<void, Error> OnCreate(Batch& batch, const RangeDescriptor& desc) {
  tl::expected<std::vector<std::string>, Error> addressing_keys =
      AddressingKeys(desc);
  if (!addressing_keys.has_value()) {
    return make_unexpected(addressing_keys.error());
  }

  for (const std::string& key : *addressing_keys) {
    batch.Put(key, desc);
  }

  return {};
}

////////////////////////////////////////////////////////////////////////

tl::expected<void, Error> OnSplit(
    Batch& batch,
    const RangeDescriptor& original,
    const RangeDescriptor& left,
    const RangeDescriptor& right) {
  if (left.start_key() != original.start_key()
      || left.end_key() != right.start_key()
      || right.end_key() != original.end_key()
      || left.start_key() >= left.end_key()
      || right.start_key() >= right.end_key()) {
    return make_unexpected(
        kv::MakeError(
            fmt::format(
                "Ranges {} and {} are not a split of range {}",
                Describe(left),
                Describe(right),
                Describe(original))));
  }

  // Compute everything before touching 'batch' so that nothing gets
  // added if either of the ranges regards level-1 records.
  tl::expected<std::vector<std::string>, Error> left_keys =
      AddressingKeys(left);
  if (!left_keys.has_value()) {
    return make_unexpected(left_keys.error());
  }

  tl::expected<std::vector<std::string>, Error> right_keys =
      AddressingKeys(right);
  if (!right_keys.has_value()) {
    return make_unexpected(right_keys.error());
  }

  for (const std::string& key : *left_keys) {
    batch.Put(key, left);
  }

  for (const std::string& key : *right_keys) {
    batch.Put(key, right);
  }

  return {};
}

////////////////////////////////////////////////////////////////////////

tl::expected<void, Error> OnMerge(
    Batch& batch,
    const RangeDescriptor& left,
    const RangeDescriptor& right,
    const RangeDescriptor& merged) {
  if (left.end_key() != right.start_key()
      || merged.start_key() != left.start_key()
      || merged.end_key() != right.end_key()) {
    return make_unexpected(
        kv::MakeError(
            fmt::format(
                "Range {} is not a merge of ranges {} and {}",
                Describe(merged),
                Describe(left),
                Describe(right))));
  }

  tl::expected<std::vector<std::string>, Error> left_keys =
      AddressingKeys(left);
  if (!left_keys.has_value()) {
    return make_unexpected(left_keys.error());
  }

  tl::expected<std::vector<std::string>, Error> right_keys =
      AddressingKeys(right);
  if (!right_keys.has_value()) {
    return make_unexpected(right_keys.error());
  }

  tl::expected<std::vector<std::string>, Error> merged_keys =
      AddressingKeys(merged);
  if (!merged_keys.has_value()) {
    return make_unexpected(merged_keys.error());
  }

  // Records that 'merged' also has just get overwritten, deleting
  // them first would only add noise to the batch.
  auto DeleteObsolete = [&](const std::vector<std::string>& obsolete_keys) {
    for (const std::string& key : obsolete_keys) {
      if (std::find(merged_keys->begin(), merged_keys->end(), key)
          == merged_keys->end()) {
        batch.Delete(key);
      }
    }
  };

  DeleteObsolete(*left_keys);
  DeleteObsolete(*right_keys);

  for (const std::string& key : *merged_keys) {
    batch.Put(key, merged);
  }

  return {};
}

////////////////////////////////////////////////////////////////////////

}  // namespace rkv::storage::addressing

////////////////////////////////////////////////////////////////////////
