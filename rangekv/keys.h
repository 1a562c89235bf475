#pragma once

#include <string>
#include <string_view>

////////////////////////////////////////////////////////////////////////

namespace rkv::keys {

////////////////////////////////////////////////////////////////////////

// NOTE: the prefixes below contain NUL bytes so they are all
// constructed with an explicit length.

// Bounds of the key-space, i.e., [kKeyMin, kKeyMax).
inline const std::string kKeyMin;
inline const std::string kKeyMax("\xff\xff", 2);

// Node local bookkeeping, e.g., range descriptors. Sorts before the
// addressing records.
inline const std::string kLocalPrefix("\x00\x00\x00", 3);
inline const std::string kRangeDescriptorPrefix = kLocalPrefix + "rdsc";
inline const std::string kRangeIDGeneratorKey = kLocalPrefix + "range-idgen";

// Addressing records. Level-1 ("meta1") records sort before level-2
// ("meta2") records which sort before any user data.
inline const std::string kMetaPrefix("\x00\x00meta", 6);
inline const std::string kMeta1Prefix = kMetaPrefix + "1";
inline const std::string kMeta2Prefix = kMetaPrefix + "2";
inline const std::string kMetaMax = kMetaPrefix + "3";

////////////////////////////////////////////////////////////////////////

inline bool HasPrefix(std::string_view key, std::string_view prefix) {
  return key.substr(0, prefix.size()) == prefix;
}

// Concatenates 'prefix' and 'key'.
std::string MakeKey(std::string_view prefix, std::string_view key);

// Returns the smallest key that sorts after 'key'.
std::string Next(std::string_view key);

std::string MakeMeta1Key(std::string_view key);
std::string MakeMeta2Key(std::string_view key);

// Returns the key of the addressing record one level up from 'key':
//
//   * a user key (or any key at or past 'kMetaMax') maps to its
//     level-2 key,
//   * a level-2 key maps to the level-1 key with the same suffix,
//   * 'kKeyMin' and any other key map to 'kKeyMin'.
std::string RangeMetaKey(std::string_view key);

// Whether 'key' lies within the level-1 range, i.e., the range that
// starts at 'kKeyMin' and holds all the level-1 records. 'kKeyMin'
// itself is not considered to be "within" since every key-space
// starts there.
bool IsWithinMeta1Range(std::string_view key);

// Key under which the descriptor of the range starting at 'start_key'
// is stored.
std::string MakeRangeDescriptorKey(std::string_view start_key);

// Escapes 'key' so that it can be logged or used in error messages.
std::string PrettyPrint(std::string_view key);

////////////////////////////////////////////////////////////////////////

}  // namespace rkv::keys

////////////////////////////////////////////////////////////////////////
