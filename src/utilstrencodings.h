// Copyright (c) 2026 The TeamBalance developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Utilities for converting data from/to strings.
 */
#ifndef TEAMBALANCE_UTILSTRENCODINGS_H
#define TEAMBALANCE_UTILSTRENCODINGS_H

#include <cstdint>
#include <string>
#include <vector>

/** Returns the value of a hex digit, or -1 for any other character */
signed char HexDigit(char c);

/** Returns true if the string is a non-empty, even-length sequence of hex digits */
bool IsHex(const std::string& str);

std::vector<unsigned char> ParseHex(const char* psz);
std::vector<unsigned char> ParseHex(const std::string& str);

template<typename T>
std::string HexStr(const T itbegin, const T itend)
{
    static const char hexmap[16] = { '0', '1', '2', '3', '4', '5', '6', '7',
                                     '8', '9', 'a', 'b', 'c', 'd', 'e', 'f' };
    std::string rv;
    rv.reserve((itend - itbegin) * 2);
    for (T it = itbegin; it < itend; ++it) {
        unsigned char val = (unsigned char)(*it);
        rv.push_back(hexmap[val >> 4]);
        rv.push_back(hexmap[val & 15]);
    }
    return rv;
}

/** Remove leading and trailing spaces and tabs */
std::string TrimString(const std::string& str);

/** Convert to lower case (ASCII only) */
std::string ToLower(const std::string& str);

/**
 * Convert string to unsigned 64-bit integer with strict parse error feedback.
 * @returns true if the entire string could be parsed as valid integer,
 *   false if not the entire string could be parsed or when overflow or underflow occurred.
 */
bool ParseUInt64(const std::string& str, uint64_t* out);

#endif // TEAMBALANCE_UTILSTRENCODINGS_H
