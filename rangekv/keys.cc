#include "rangekv/keys.h"

#include "absl/strings/escaping.h"
#include "absl/strings/str_cat.h"

////////////////////////////////////////////////////////////////////////

namespace rkv::keys {

////////////////////////////////////////////////////////////////////////

std::string MakeKey(std::string_view prefix, std::string_view key) {
  return absl::StrCat(prefix, key);
}

////////////////////////////////////////////////////////////////////////

std::string Next(std::string_view key) {
  std::string next(key);
  next.push_back('\0');
  return next;
}

////////////////////////////////////////////////////////////////////////

std::string MakeMeta1Key(std::string_view key) {
  return MakeKey(kMeta1Prefix, key);
}

std::string MakeMeta2Key(std::string_view key) {
  return MakeKey(kMeta2Prefix, key);
}

////////////////////////////////////////////////////////////////////////

std::string RangeMetaKey(std::string_view key) {
  if (key.empty()) {
    return kKeyMin;
  }

  // Keys past the level-2 records, e.g., within "\x00\x00meta3", are
  // addressed just like user keys.
  if (!HasPrefix(key, kMetaPrefix) || key >= std::string_view(kMetaMax)) {
    return MakeMeta2Key(key);
  }

  if (HasPrefix(key, kMeta2Prefix)) {
    key.remove_prefix(kMeta2Prefix.size());
    return MakeMeta1Key(key);
  }

  return kKeyMin;
}

////////////////////////////////////////////////////////////////////////

bool IsWithinMeta1Range(std::string_view key) {
  return !key.empty() && key < std::string_view(kMeta2Prefix);
}

////////////////////////////////////////////////////////////////////////

std::string MakeRangeDescriptorKey(std::string_view start_key) {
  return MakeKey(kRangeDescriptorPrefix, start_key);
}

////////////////////////////////////////////////////////////////////////

std::string PrettyPrint(std::string_view key) {
  if (key == kKeyMax) {
    return "/Max";
  }
  return absl::CHexEscape(key);
}

////////////////////////////////////////////////////////////////////////

}  // namespace rkv::keys

////////////////////////////////////////////////////////////////////////
