// Copyright (c) 2026 The TeamBalance developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <utilmoneystr.h>

#include <utilstrencodings.h>

#include <stdexcept>

/** Decimal digits of the largest 256-bit value */
static const size_t MAX_AMOUNT_DIGITS = 78;

std::string FormatUnits(const CAmount& amount, unsigned int decimals)
{
    std::string digits = amount.str();
    if (decimals == 0) {
        return digits;
    }
    if (digits.size() <= decimals) {
        digits.insert(0, decimals + 1 - digits.size(), '0');
    }
    std::string whole = digits.substr(0, digits.size() - decimals);
    std::string fraction = digits.substr(digits.size() - decimals);

    // Right-trim excess zeros after the decimal point
    std::string::size_type last = fraction.find_last_not_of('0');
    if (last == std::string::npos) {
        return whole;
    }
    return whole + "." + fraction.substr(0, last + 1);
}

bool ParseUnits(const std::string& str, CAmount& amountRet, unsigned int decimals)
{
    std::string s = TrimString(str);
    if (s.empty()) {
        return false;
    }

    std::string whole;
    std::string fraction;
    std::string::size_type dot = s.find('.');
    if (dot == std::string::npos) {
        whole = s;
    } else {
        whole = s.substr(0, dot);
        fraction = s.substr(dot + 1);
        if (fraction.empty() || fraction.size() > decimals) {
            return false;
        }
    }
    if (whole.empty()) {
        return false;
    }
    for (char c : whole + fraction) {
        if (c < '0' || c > '9') {
            return false;
        }
    }

    std::string digits = whole + fraction + std::string(decimals - fraction.size(), '0');
    std::string::size_type first = digits.find_first_not_of('0');
    if (first == std::string::npos) {
        amountRet = 0;
        return true;
    }
    digits = digits.substr(first);
    if (digits.size() > MAX_AMOUNT_DIGITS) {
        return false;
    }

    try {
        amountRet = CAmount(digits.c_str());
    } catch (const std::runtime_error&) {
        return false;
    }
    return true;
}
