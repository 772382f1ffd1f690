#pragma once

// Minimal JSON helpers for the compact objects pactum emits and accepts
// (event log lines, stats, catalog dumps, C ABI configuration). Flat keys only.

#include <cstdio>
#include <regex>
#include <string>

namespace pactum::jsonlite {

// Appends code point `cp` as UTF-8.
inline void append_utf8(std::string& o, unsigned cp) {
  if (cp < 0x80) {
    o += static_cast<char>(cp);
  } else if (cp < 0x800) {
    o += static_cast<char>(0xC0 | (cp >> 6));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    o += static_cast<char>(0xE0 | (cp >> 12));
    o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

// Value of four hex digits at in[pos..pos+4), or -1 if malformed.
inline long hex4(const std::string& in, size_t pos) {
  if (pos + 4 > in.size()) return -1;
  long v = 0;
  for (size_t k = pos; k < pos + 4; ++k) {
    const char c = in[k];
    v <<= 4;
    if (c >= '0' && c <= '9') v |= c - '0';
    else if (c >= 'a' && c <= 'f') v |= c - 'a' + 10;
    else if (c >= 'A' && c <= 'F') v |= c - 'A' + 10;
    else return -1;
  }
  return v;
}

// Inverse of escape(). Four-digit unicode escapes decode to UTF-8; surrogate
// pairs are not combined.
inline std::string unescape(const std::string& in) {
  std::string o;
  for (size_t i=0;i<in.size();++i) {
    if (in[i]=='\\' && i+1<in.size()) {
      char n=in[++i];
      if (n=='n') o += '\n';
      else if (n=='t') o += '\t';
      else if (n=='r') o += '\r';
      else if (n=='u') {
        const long cp = hex4(in, i + 1);
        if (cp < 0) {
          o += n;
        } else {
          append_utf8(o, static_cast<unsigned>(cp));
          i += 4;
        }
      }
      else o += n;
    } else o += in[i];
  }
  return o;
}

inline std::string escape(const std::string& s) {
  std::string o;
  o.reserve(s.size());
  for (char c : s) {
    if (c == '"') o += "\\\"";
    else if (c == '\\') o += "\\\\";
    else if (c == '\n') o += "\\n";
    else if (c == '\t') o += "\\t";
    else if (c == '\r') o += "\\r";
    else if (static_cast<unsigned char>(c) < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
      o += buf;
    }
    else o += c;
  }
  return o;
}

inline std::string get_string(const std::string& s, const std::string& key, const std::string& def = "") {
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*\\\"((?:[^\\\"\\\\]|\\\\.)*)\\\"");
  std::smatch m;
  if (std::regex_search(s, m, re)) return unescape(m[1].str());
  return def;
}

inline bool has_key(const std::string& s, const std::string& key) {
  std::regex re("\\\"" + key + "\\\"\\s*:");
  return std::regex_search(s, re);
}

inline bool get_bool(const std::string& s, const std::string& key, bool def = false) {
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*(true|false)");
  std::smatch m;
  if (std::regex_search(s, m, re)) return m[1].str() == "true";
  return def;
}

}  // namespace pactum::jsonlite
