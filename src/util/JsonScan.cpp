// Repository: SkipTV
// Component: Minimal JSON field scanner
// Purpose: Extract typed fields from small, flat JSON documents.
// Copyright (c) 2026 SkipTV

#include "skiptv/util/JsonScan.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace skiptv::util::json {

namespace {

constexpr size_t kNpos = std::string::npos;

size_t SkipWs(const std::string& s, size_t pos) {
  while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) ++pos;
  return pos;
}

// Index of the first character of key's value, or npos.
size_t FindValue(const std::string& json, const std::string& key) {
  const std::string quoted = "\"" + key + "\"";
  size_t pos = json.find(quoted);
  while (pos != kNpos) {
    size_t after = SkipWs(json, pos + quoted.size());
    if (after < json.size() && json[after] == ':') {
      return SkipWs(json, after + 1);
    }
    pos = json.find(quoted, pos + 1);
  }
  return kNpos;
}

void AppendUtf8(std::string* out, unsigned int cp) {
  if (cp < 0x80) {
    *out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    *out += static_cast<char>(0xC0 | (cp >> 6));
    *out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    *out += static_cast<char>(0xE0 | (cp >> 12));
    *out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    *out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// Decodes the string literal at pos (must be '"'). Returns the index one past
// the closing quote, or npos if the literal is unterminated or malformed.
size_t ReadString(const std::string& s, size_t pos, std::string* out) {
  if (pos >= s.size() || s[pos] != '"') return kNpos;
  out->clear();
  for (size_t i = pos + 1; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '"') return i + 1;
    if (c != '\\') {
      *out += c;
      continue;
    }
    if (i + 1 >= s.size()) return kNpos;
    const char e = s[++i];
    switch (e) {
      case '"': *out += '"'; break;
      case '\\': *out += '\\'; break;
      case '/': *out += '/'; break;
      case 'n': *out += '\n'; break;
      case 't': *out += '\t'; break;
      case 'r': *out += '\r'; break;
      case 'b': *out += '\b'; break;
      case 'f': *out += '\f'; break;
      case 'u': {
        if (i + 4 >= s.size()) return kNpos;
        unsigned int cp = 0;
        for (size_t k = 1; k <= 4; ++k) {
          const int h = HexValue(s[i + k]);
          if (h < 0) return kNpos;
          cp = (cp << 4) | static_cast<unsigned int>(h);
        }
        i += 4;
        AppendUtf8(out, cp);
        break;
      }
      default:
        return kNpos;
    }
  }
  return kNpos;
}

// Index one past the end of the object/array starting at pos.
size_t SkipCompound(const std::string& s, size_t pos) {
  int depth = 0;
  bool in_string = false;
  for (size_t i = pos; i < s.size(); ++i) {
    const char c = s[i];
    if (in_string) {
      if (c == '\\') {
        ++i;
      } else if (c == '"') {
        in_string = false;
      }
      continue;
    }
    if (c == '"') {
      in_string = true;
    } else if (c == '{' || c == '[') {
      ++depth;
    } else if (c == '}' || c == ']') {
      --depth;
      if (depth == 0) return i + 1;
    }
  }
  return kNpos;
}

// Bare scalar (number, true, false, null) at pos.
size_t ReadLiteral(const std::string& s, size_t pos, std::string* out) {
  size_t end = pos;
  while (end < s.size() && s[end] != ',' && s[end] != '}' && s[end] != ']' &&
         !std::isspace(static_cast<unsigned char>(s[end]))) {
    ++end;
  }
  if (end == pos) return kNpos;
  *out = s.substr(pos, end - pos);
  return end;
}

size_t SkipValue(const std::string& s, size_t pos) {
  if (pos >= s.size()) return kNpos;
  std::string scratch;
  if (s[pos] == '"') return ReadString(s, pos, &scratch);
  if (s[pos] == '{' || s[pos] == '[') return SkipCompound(s, pos);
  return ReadLiteral(s, pos, &scratch);
}

bool ExtractLiteral(const std::string& json, const std::string& key, std::string* out) {
  const size_t pos = FindValue(json, key);
  if (pos == kNpos || pos >= json.size()) return false;
  if (json[pos] == '"' || json[pos] == '{' || json[pos] == '[') return false;
  return ReadLiteral(json, pos, out) != kNpos;
}

bool ExtractCompound(const std::string& json, const std::string& key, char open,
                     std::string* out) {
  const size_t pos = FindValue(json, key);
  if (pos == kNpos || pos >= json.size() || json[pos] != open) return false;
  const size_t end = SkipCompound(json, pos);
  if (end == kNpos) return false;
  *out = json.substr(pos, end - pos);
  return true;
}

// Walks the elements of an array text, invoking fn(start, end) per element.
template <typename Fn>
void ForEachElement(const std::string& array_json, Fn fn) {
  size_t pos = SkipWs(array_json, 0);
  if (pos >= array_json.size() || array_json[pos] != '[') return;
  ++pos;
  while (true) {
    pos = SkipWs(array_json, pos);
    if (pos >= array_json.size() || array_json[pos] == ']') return;
    const size_t end = SkipValue(array_json, pos);
    if (end == kNpos) return;
    fn(pos, end);
    pos = SkipWs(array_json, end);
    if (pos < array_json.size() && array_json[pos] == ',') {
      ++pos;
      continue;
    }
    return;
  }
}

}  // namespace

bool ExtractString(const std::string& json, const std::string& key, std::string* out) {
  const size_t pos = FindValue(json, key);
  if (pos == kNpos) return false;
  std::string value;
  if (ReadString(json, pos, &value) == kNpos) return false;
  *out = std::move(value);
  return true;
}

bool ExtractDouble(const std::string& json, const std::string& key, double* out) {
  std::string literal;
  if (!ExtractLiteral(json, key, &literal)) return false;
  errno = 0;
  char* end = nullptr;
  const double v = std::strtod(literal.c_str(), &end);
  if (errno != 0 || end == literal.c_str() || *end != '\0') return false;
  *out = v;
  return true;
}

bool ExtractInt64(const std::string& json, const std::string& key, int64_t* out) {
  std::string literal;
  if (!ExtractLiteral(json, key, &literal)) return false;
  errno = 0;
  char* end = nullptr;
  const long long v = std::strtoll(literal.c_str(), &end, 10);
  if (errno != 0 || end == literal.c_str() || *end != '\0') return false;
  *out = static_cast<int64_t>(v);
  return true;
}

bool ExtractBool(const std::string& json, const std::string& key, bool* out) {
  std::string literal;
  if (!ExtractLiteral(json, key, &literal)) return false;
  if (literal == "true") { *out = true; return true; }
  if (literal == "false") { *out = false; return true; }
  return false;
}

bool ExtractObject(const std::string& json, const std::string& key, std::string* out) {
  return ExtractCompound(json, key, '{', out);
}

bool ExtractArray(const std::string& json, const std::string& key, std::string* out) {
  return ExtractCompound(json, key, '[', out);
}

std::vector<std::string> SplitObjectArray(const std::string& array_json) {
  std::vector<std::string> objects;
  ForEachElement(array_json, [&](size_t start, size_t end) {
    if (array_json[start] == '{') {
      objects.push_back(array_json.substr(start, end - start));
    }
  });
  return objects;
}

std::vector<std::string> SplitStringArray(const std::string& array_json) {
  std::vector<std::string> strings;
  ForEachElement(array_json, [&](size_t start, size_t /*end*/) {
    std::string value;
    if (array_json[start] == '"' && ReadString(array_json, start, &value) != kNpos) {
      strings.push_back(std::move(value));
    }
  });
  return strings;
}

std::optional<std::map<std::string, std::string>> ParseFlatObject(const std::string& json) {
  size_t pos = SkipWs(json, 0);
  if (pos >= json.size() || json[pos] != '{') return std::nullopt;
  ++pos;

  std::map<std::string, std::string> fields;
  pos = SkipWs(json, pos);
  if (pos < json.size() && json[pos] == '}') {
    return fields;
  }

  while (true) {
    pos = SkipWs(json, pos);
    std::string key;
    pos = ReadString(json, pos, &key);
    if (pos == kNpos) return std::nullopt;
    pos = SkipWs(json, pos);
    if (pos >= json.size() || json[pos] != ':') return std::nullopt;
    pos = SkipWs(json, pos + 1);
    if (pos >= json.size()) return std::nullopt;

    std::string value;
    if (json[pos] == '"') {
      pos = ReadString(json, pos, &value);
    } else if (json[pos] == '{' || json[pos] == '[') {
      return std::nullopt;
    } else {
      pos = ReadLiteral(json, pos, &value);
    }
    if (pos == kNpos) return std::nullopt;
    fields[key] = std::move(value);

    pos = SkipWs(json, pos);
    if (pos >= json.size()) return std::nullopt;
    if (json[pos] == ',') {
      ++pos;
      continue;
    }
    if (json[pos] == '}') break;
    return std::nullopt;
  }
  return fields;
}

}  // namespace skiptv::util::json
