#ifndef STRING_UTILS_H
#define STRING_UTILS_H

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <string_view>

namespace StringUtils {

inline std::string toLower(std::string_view str) {
  std::string result{str};
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return result;
}

inline std::string toUpper(std::string_view str) {
  std::string result{str};
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return result;
}

inline std::string trim(std::string_view str) {
  const auto start = std::find_if_not(
      str.begin(), str.end(), [](unsigned char c) { return std::isspace(c); });

  const auto end =
      std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c) {
        return std::isspace(c);
      }).base();

  return (start < end) ? std::string(start, end) : std::string{};
}

inline bool startsWith(std::string_view str, std::string_view prefix) {
  return str.size() >= prefix.size() &&
         str.compare(0, prefix.size(), prefix) == 0;
}

inline bool isAllDigits(std::string_view str) {
  return !str.empty() &&
         std::all_of(str.begin(), str.end(),
                     [](unsigned char c) { return std::isdigit(c); });
}

// Keeps only the digits of str ("NL91 ABNA" -> "91").
inline std::string digitsOnly(std::string_view str) {
  std::string out;
  out.reserve(str.size());
  for (char c : str) {
    if (std::isdigit(static_cast<unsigned char>(c)))
      out += c;
  }
  return out;
}

// Doubles every occurrence of quote inside identifier and wraps it.
// Catalog names are quoted rather than validated since they come from the
// server and may legitimately contain spaces or dashes.
inline std::string quoteIdentifier(const std::string &identifier, char open,
                                   char close) {
  if (identifier.empty()) {
    throw std::invalid_argument("Identifier cannot be empty");
  }
  std::string escaped;
  escaped.reserve(identifier.size() + 2);
  escaped += open;
  for (char c : identifier) {
    escaped += c;
    if (c == close)
      escaped += close;
  }
  escaped += close;
  return escaped;
}

inline std::string escapeMySQLIdentifier(const std::string &identifier) {
  return quoteIdentifier(identifier, '`', '`');
}

inline std::string escapeMSSQLIdentifier(const std::string &identifier) {
  return quoteIdentifier(identifier, '[', ']');
}

inline std::string escapeSQLiteIdentifier(const std::string &identifier) {
  return quoteIdentifier(identifier, '"', '"');
}

} // namespace StringUtils

#endif
