#pragma once
#include <cctype>
#include <string>

namespace tapotoggle {

// Canonical MAC text: separators ':' and '-' removed, lowercase.
// "AA:BB:CC:DD:EE:FF", "aa-bb-cc-dd-ee-ff" and "AABBCCDDEEFF" all become
// "aabbccddeeff". Also applied to whole reply payloads and table lines.
inline std::string normalize_mac(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (unsigned char c : text) {
    if (c == ':' || c == '-')
      continue;
    out.push_back(static_cast<char>(std::tolower(c)));
  }
  return out;
}

// True when the normalized MAC appears anywhere in the normalized text.
// An empty MAC never matches.
inline bool mac_in_text(const std::string &text, const std::string &mac) {
  const auto target = normalize_mac(mac);
  if (target.empty())
    return false;
  return normalize_mac(text).find(target) != std::string::npos;
}

} // namespace tapotoggle
