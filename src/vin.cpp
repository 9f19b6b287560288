/**
 * vin.cpp:
 * Validation and extraction of Vehicle Identification Numbers (VINs).
 * Used by the vin_extractor command, the capture session and the scan_vin scanner.
 */

#include "config.h"

#include <cctype>
#include <iostream>

#include "vin.h"

int vin_debug = 0;

/**
 * A valid VIN has 17 characters:
 * - Letters I, O, or Q are not allowed (they are too easy to confuse with 1 and 0)
 * - Character 9 is a check digit, '0'-'9' or 'X'
 */

// Letters that never appear in a VIN
static const char *forbidden_vin_chars = "IOQ";

// Transliteration values for A..Z. I, O and Q have no value.
static const int letter_values[26] = {
    1, 2, 3, 4, 5, 6, 7, 8,             // A-H
    0,                                  // I
    1, 2, 3, 4, 5,                      // J-N
    0,                                  // O
    7,                                  // P
    0,                                  // Q
    9,                                  // R
    2, 3, 4, 5, 6, 7, 8, 9              // S-Z
};

// Weight factors for VIN check digit calculation. The check digit itself has weight 0.
static const int vin_weights[VIN_LENGTH] = {8, 7, 6, 5, 4, 3, 2, 10, 0, 9, 8, 7, 6, 5, 4, 3, 2};

int vin_transliterate(char ch)
{
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'A' && ch <= 'Z') return letter_values[ch - 'A'];
    return 0;
}

char vin_check_digit(std::string_view vin)
{
    int sum = 0;
    for (size_t i = 0; i < VIN_LENGTH && i < vin.size(); i++) {
        char ch = toupper(static_cast<unsigned char>(vin[i]));
        sum += vin_transliterate(ch) * vin_weights[i];
    }

    int rem = sum % 11;
    return (rem == 10) ? 'X' : static_cast<char>('0' + rem);
}

/**
 * Trim surrounding whitespace and uppercase.
 */
static std::string normalize_candidate(std::string_view candidate)
{
    size_t start = 0;
    size_t end = candidate.size();
    while (start < end && isspace(static_cast<unsigned char>(candidate[start]))) start++;
    while (end > start && isspace(static_cast<unsigned char>(candidate[end-1]))) end--;

    std::string vin;
    vin.reserve(end - start);
    for (size_t i = start; i < end; i++) {
        vin.push_back(toupper(static_cast<unsigned char>(candidate[i])));
    }
    return vin;
}

/* Return 0 if the VIN has no forbidden letter, -1 otherwise */
static int forbidden_char_test(const std::string &vin)
{
    return (vin.find_first_of(forbidden_vin_chars) == std::string::npos) ? 0 : -1;
}

/* Return 0 if the 9th character matches the computed check digit */
static int check_digit_test(const std::string &vin)
{
    return (vin[VIN_CHECK_POS] == vin_check_digit(vin)) ? 0 : -1;
}

#define RETURN(code, reason) {if (vin_debug & VIN_DEBUG_INFO) {std::cerr << "valid_vin: " << reason << "\n";} return code;}

bool valid_vin(std::string_view candidate)
{
    const std::string vin = normalize_candidate(candidate);

    if (vin.size() != VIN_LENGTH) RETURN(false, "VIN must be exactly 17 characters");
    if (forbidden_char_test(vin)) RETURN(false, "VIN contains I, O or Q");
    if (check_digit_test(vin))    RETURN(false, "Failed check digit test");
    return true;
}

bool valid_vin(const char *candidate)
{
    if (candidate == nullptr) RETURN(false, "no candidate");
    return valid_vin(std::string_view(candidate));
}

std::string vin_normalize(std::string_view text)
{
    std::string cleaned;
    cleaned.reserve(text.size());
    for (char ch : text) {
        /* isalnum() is locale dependent; a VIN is plain ASCII */
        if ((ch >= '0' && ch <= '9') || (ch >= 'A' && ch <= 'Z')) {
            cleaned.push_back(ch);
        } else if (ch >= 'a' && ch <= 'z') {
            cleaned.push_back(ch - 'a' + 'A');
        }
    }
    return cleaned;
}

std::optional<std::string> extract_vin(std::string_view text)
{
    const std::string cleaned = vin_normalize(text);
    if (cleaned.size() < VIN_LENGTH) return std::nullopt;

    for (size_t i = 0; i + VIN_LENGTH <= cleaned.size(); i++) {
        std::string candidate = cleaned.substr(i, VIN_LENGTH);
        if (vin_debug & VIN_DEBUG_WINDOWS) {
            std::cerr << "extract_vin: window " << i << " " << candidate << "\n";
        }
        if (valid_vin(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

void vin_explain(std::ostream &os, std::string_view candidate)
{
    const std::string vin = normalize_candidate(candidate);
    const bool length_ok = vin.size() == VIN_LENGTH;

    os << "Running VIN validation tests. 0 means passed, -1 means failed.\n";
    os << "normalized: " << vin << "\n";
    os << "length_test(" << vin.size() << ") = " << (length_ok ? 0 : -1) << "\n";
    if (!length_ok) {
        os << "valid_vin = false\n";
        return;
    }
    os << "forbidden_char_test = " << forbidden_char_test(vin) << "\n";
    os << "check_digit = " << vin_check_digit(vin) << " found = " << vin[VIN_CHECK_POS] << "\n";
    os << "check_digit_test = " << check_digit_test(vin) << "\n";
    os << "valid_vin = " << (valid_vin(vin) ? "true" : "false") << "\n";
}
