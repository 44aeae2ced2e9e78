#ifndef CHECKSUMS_H
#define CHECKSUMS_H

#include <string>

namespace Checksums {
// Dutch BSN 11-proof. digits must be exactly nine ASCII digits d0..d8;
// valid when d0*9 + d1*8 + ... + d7*2 - d8 is a multiple of 11.
bool isValidBsn(const std::string &digits);

// ISO 13616 mod-97 check. Spaces are ignored; the length without them must
// be 15 to 34 characters.
bool isValidIban(const std::string &iban);

// Luhn check over the digits of value. Non-digit characters are skipped.
bool luhnCheck(const std::string &value);
} // namespace Checksums

#endif
