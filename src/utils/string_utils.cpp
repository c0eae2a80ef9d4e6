/**
 * @file string_utils.cpp
 * @brief String helpers implementation
 */

#include "utils/string_utils.h"

#include <array>
#include <cctype>
#include <iomanip>
#include <sstream>

#include "utils/constants.h"

namespace sqlbackup::utils {

std::string QuoteIdentifier(std::string_view name) {
  std::string quoted;
  quoted.reserve(name.size() + 2);
  quoted.push_back('`');
  for (char chr : name) {
    if (chr == '`') {
      quoted.push_back('`');
    }
    quoted.push_back(chr);
  }
  quoted.push_back('`');
  return quoted;
}

std::string QuoteIdentifierList(const std::vector<std::string>& names) {
  std::string joined;
  for (size_t i = 0; i < names.size(); ++i) {
    if (i > 0) {
      joined += ", ";
    }
    joined += QuoteIdentifier(names[i]);
  }
  return joined;
}

std::string EscapeStringLiteral(std::string_view value) {
  std::string escaped;
  escaped.reserve(value.size() + value.size() / 8);
  for (char chr : value) {
    switch (chr) {
      case '\0':
        escaped += "\\0";
        break;
      case '\'':
        escaped += "\\'";
        break;
      case '"':
        escaped += "\\\"";
        break;
      case '\\':
        escaped += "\\\\";
        break;
      case '\b':
        escaped += "\\b";
        break;
      case '\n':
        escaped += "\\n";
        break;
      case '\r':
        escaped += "\\r";
        break;
      case '\t':
        escaped += "\\t";
        break;
      case '\x1a':  // Ctrl-Z, end-of-file marker on Windows
        escaped += "\\Z";
        break;
      default:
        escaped.push_back(chr);
    }
  }
  return escaped;
}

std::string HexEncode(std::string_view bytes) {
  constexpr std::array<char, 16> kHexDigits = {'0', '1', '2', '3', '4', '5', '6', '7',
                                               '8', '9', 'A', 'B', 'C', 'D', 'E', 'F'};
  constexpr unsigned int kNibbleBits = 4;
  constexpr unsigned int kNibbleMask = 0x0F;

  std::string hex;
  hex.reserve(bytes.size() * 2);
  for (char chr : bytes) {
    auto byte = static_cast<unsigned char>(chr);
    // NOLINTBEGIN(cppcoreguidelines-pro-bounds-constant-array-index)
    hex.push_back(kHexDigits[byte >> kNibbleBits]);
    hex.push_back(kHexDigits[byte & kNibbleMask]);
    // NOLINTEND(cppcoreguidelines-pro-bounds-constant-array-index)
  }
  return hex;
}

std::string_view Trim(std::string_view text) {
  size_t begin = 0;
  while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }
  size_t end = text.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
    --end;
  }
  return text.substr(begin, end - begin);
}

bool StartsWithIgnoreCase(std::string_view text, std::string_view prefix) {
  if (text.size() < prefix.size()) {
    return false;
  }
  for (size_t i = 0; i < prefix.size(); ++i) {
    if (std::toupper(static_cast<unsigned char>(text[i])) != std::toupper(static_cast<unsigned char>(prefix[i]))) {
      return false;
    }
  }
  return true;
}

std::string FormatBytes(size_t bytes) {
  constexpr std::array<const char*, 5> kUnits = {"B", "KB", "MB", "GB", "TB"};

  if (bytes == 0) {
    return "0B";
  }

  size_t unit_index = 0;
  auto size = static_cast<double>(bytes);

  while (size >= constants::kBytesPerKilobyteDouble && unit_index < kUnits.size() - 1) {
    size /= constants::kBytesPerKilobyteDouble;
    unit_index++;
  }

  std::ostringstream oss;
  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-constant-array-index,readability-magic-numbers)
  if (unit_index == 0) {
    oss << bytes << kUnits[unit_index];
  } else if (size >= 100.0) {
    oss << std::fixed << std::setprecision(0) << size << kUnits[unit_index];
  } else if (size >= 10.0) {
    oss << std::fixed << std::setprecision(1) << size << kUnits[unit_index];
  } else {
    oss << std::fixed << std::setprecision(2) << size << kUnits[unit_index];
  }
  // NOLINTEND(cppcoreguidelines-pro-bounds-constant-array-index,readability-magic-numbers)
  return oss.str();
}

}  // namespace sqlbackup::utils
