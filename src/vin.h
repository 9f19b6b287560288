/**
 * vin.h:
 * Vehicle Identification Number (VIN) check digit, validation and extraction.
 */

#ifndef VIN_H
#define VIN_H

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

/* Debug flags for vin_debug */
#define VIN_DEBUG_INFO    0x01          // print why a candidate was rejected
#define VIN_DEBUG_WINDOWS 0x02          // print every window extract_vin() tries

extern int vin_debug;

const size_t VIN_LENGTH = 17;
const size_t VIN_CHECK_POS = 8;   // 9th character is the check digit

/**
 * Numeric value of a single (uppercase) VIN character for the check digit.
 * Digits are their own value; letters come from the transliteration table.
 * Everything else, including I, O and Q, is 0.
 */
int vin_transliterate(char ch);

/**
 * Compute the check digit of a 17-character VIN.
 * @param vin the VIN; case does not matter. Only the first 17 characters are read.
 * @return '0'..'9', or 'X' for a remainder of 10
 */
char vin_check_digit(std::string_view vin);

/**
 * Main VIN validation function.
 * Surrounding whitespace is ignored and case does not matter.
 * @return true if the candidate is 17 characters, has no I, O or Q, and
 *         carries the correct check digit.
 */
bool valid_vin(std::string_view candidate);
bool valid_vin(const char *candidate);  // nullptr is not a VIN

/** Drop everything that is not an ASCII letter or digit and uppercase the rest */
std::string vin_normalize(std::string_view text);

/**
 * Find the leftmost valid VIN in noisy text (OCR output, barcode payloads).
 * @return the VIN in canonical (uppercase) form, or std::nullopt if there is none
 */
std::optional<std::string> extract_vin(std::string_view text);

/** Print every validation stage for a candidate and whether it passed */
void vin_explain(std::ostream &os, std::string_view candidate);

#endif // VIN_H
