// Repository: SkipTV
// Component: Minimal JSON field scanner
// Purpose: Extract typed fields from small, flat JSON documents (config file,
//          lounge status device lists, harness scripts) without a DOM.
// Copyright (c) 2026 SkipTV

#ifndef SKIPTV_UTIL_JSON_SCAN_HPP_
#define SKIPTV_UTIL_JSON_SCAN_HPP_

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace skiptv::util::json {

// All extractors search for the first occurrence of "key" that is followed by
// ':' and return false if the key is absent or the value has the wrong type.
// They do not track nesting depth; callers narrow the input first with
// ExtractObject/ExtractArray when a key can appear at several levels.

bool ExtractString(const std::string& json, const std::string& key, std::string* out);
bool ExtractDouble(const std::string& json, const std::string& key, double* out);
bool ExtractInt64(const std::string& json, const std::string& key, int64_t* out);
bool ExtractBool(const std::string& json, const std::string& key, bool* out);

// Raw text of a nested object ("{...}") or array ("[...]") value.
bool ExtractObject(const std::string& json, const std::string& key, std::string* out);
bool ExtractArray(const std::string& json, const std::string& key, std::string* out);

// Top-level elements of an array text. Objects are returned as raw "{...}"
// text; SplitStringArray returns decoded string elements and skips the rest.
std::vector<std::string> SplitObjectArray(const std::string& array_json);
std::vector<std::string> SplitStringArray(const std::string& array_json);

// Parses a single-level object whose values are strings, numbers or booleans.
// Non-string scalars are kept as their literal text. Nested values fail.
std::optional<std::map<std::string, std::string>> ParseFlatObject(const std::string& json);

}  // namespace skiptv::util::json

#endif  // SKIPTV_UTIL_JSON_SCAN_HPP_
