#include "detectors/checksums.h"
#include "utils/string_utils.h"
#include <cctype>

namespace Checksums {

bool isValidBsn(const std::string &digits) {
  if (digits.size() != 9 || !StringUtils::isAllDigits(digits))
    return false;

  int checksum = 0;
  for (int i = 0; i < 8; ++i) {
    checksum += (digits[i] - '0') * (9 - i);
  }
  checksum -= digits[8] - '0';
  return checksum % 11 == 0;
}

bool isValidIban(const std::string &iban) {
  std::string compact;
  for (char c : iban) {
    if (c != ' ')
      compact += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  if (compact.size() < 15 || compact.size() > 34)
    return false;
  if (!std::isalpha(static_cast<unsigned char>(compact[0])) ||
      !std::isalpha(static_cast<unsigned char>(compact[1])) ||
      !std::isdigit(static_cast<unsigned char>(compact[2])) ||
      !std::isdigit(static_cast<unsigned char>(compact[3])))
    return false;

  std::string rearranged = compact.substr(4) + compact.substr(0, 4);
  int mod = 0;
  for (char c : rearranged) {
    if (std::isdigit(static_cast<unsigned char>(c))) {
      mod = (mod * 10 + (c - '0')) % 97;
    } else if (std::isalpha(static_cast<unsigned char>(c))) {
      int value = c - 'A' + 10;
      mod = (mod * 100 + value) % 97;
    } else {
      return false;
    }
  }
  return mod == 1;
}

bool luhnCheck(const std::string &value) {
  int sum = 0;
  int count = 0;
  bool alternate = false;
  for (auto it = value.rbegin(); it != value.rend(); ++it) {
    if (!std::isdigit(static_cast<unsigned char>(*it)))
      continue;
    int n = *it - '0';
    if (alternate) {
      n *= 2;
      if (n > 9)
        n -= 9;
    }
    sum += n;
    alternate = !alternate;
    ++count;
  }
  return count > 0 && sum % 10 == 0;
}

} // namespace Checksums
