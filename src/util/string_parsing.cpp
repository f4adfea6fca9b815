#include "util/string_parsing.hpp"
#include <cctype>

namespace agentmesh {
namespace util {

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  try {
    // Reject empty or whitespace-leading strings
    if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
      return std::nullopt;
    }

    size_t pos = 0;
    long value = std::stol(str, &pos);

    if (pos != str.size()) {
      return std::nullopt;
    }

    if (value < min || value > max) {
      return std::nullopt;
    }

    return static_cast<int>(value);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::optional<uint16_t> SafeParsePort(const std::string& str) {
  auto value = SafeParseInt(str, 1, 65535);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max) {
  try {
    if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
      return std::nullopt;
    }

    size_t pos = 0;
    long long value = std::stoll(str, &pos);

    if (pos != str.size()) {
      return std::nullopt;
    }

    if (value < min || value > max) {
      return std::nullopt;
    }

    return static_cast<int64_t>(value);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::vector<std::string> SplitCommaList(const std::string& str) {
  std::vector<std::string> items;
  size_t pos = 0;
  while (pos <= str.size()) {
    size_t comma = str.find(',', pos);
    if (comma == std::string::npos) {
      comma = str.size();
    }
    if (comma > pos) {
      items.push_back(str.substr(pos, comma - pos));
    }
    pos = comma + 1;
  }
  return items;
}

bool IsBlank(const std::string& str) {
  for (char c : str) {
    if (!std::isspace(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

std::string TruncateUtf8(const std::string& str, size_t max_bytes) {
  if (str.size() <= max_bytes) {
    return str;
  }

  size_t cut = max_bytes;
  // Back off over continuation bytes (10xxxxxx) to a lead byte
  while (cut > 0 && (static_cast<unsigned char>(str[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  return str.substr(0, cut);
}

} // namespace util
} // namespace agentmesh
