/**
 * vin_capture.cpp:
 * Turns decoded barcode payloads and OCR text into VIN detections and status messages.
 */

#include "config.h"

#include <cctype>
#include <iostream>

#include "vin.h"
#include "vin_capture.h"

const char *capture_source_name(capture_source source)
{
    switch (source) {
    case capture_source::BARCODE: return "barcode";
    case capture_source::OCR:     return "ocr";
    }
    return "unknown";
}

static std::string_view trim(std::string_view text)
{
    while (!text.empty() && isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
    while (!text.empty() && isspace(static_cast<unsigned char>(text.back())))  text.remove_suffix(1);
    return text;
}

void vin_capture_session::record(const std::string &vin)
{
    history_.insert(history_.begin(), vin);
    if (detected_) {
        detected_(vin);
    }
}

std::optional<capture_result> vin_capture_session::submit_barcode(std::string_view text)
{
    if (!scanning_) return std::nullopt;
    attempts_++;

    capture_result res;
    res.source    = capture_source::BARCODE;
    res.candidate = vin_normalize(trim(text));
    res.vin       = extract_vin(res.candidate);

    if (vin_debug & VIN_DEBUG_INFO) {
        std::cerr << capture_source_name(res.source) << ": " << text << "\n";
    }

    if (res.vin) {
        scanning_   = false;     // one VIN per scan
        res.status  = capture_status::SUCCESS;
        res.message = "VIN detected: " + *res.vin;
        record(*res.vin);
        return res;
    }

    if (res.candidate.size() < BARCODE_PREVIEW_MIN) {
        return std::nullopt;
    }
    res.status  = capture_status::INFO;
    res.message = "Scanned: " + res.candidate.substr(0, BARCODE_PREVIEW_LEN) + "... (checking validity...)";
    return res;
}

capture_result vin_capture_session::submit_ocr(std::string_view text)
{
    attempts_++;

    capture_result res;
    res.source    = capture_source::OCR;
    res.candidate = vin_normalize(text);
    res.vin       = extract_vin(text);

    if (vin_debug & VIN_DEBUG_INFO) {
        std::cerr << capture_source_name(res.source) << ": " << text << "\n";
    }

    if (res.vin) {
        res.status  = capture_status::SUCCESS;
        res.message = "VIN (OCR): " + *res.vin;
        record(*res.vin);
    } else {
        res.status  = capture_status::ERROR;
        res.message = "OCR result: " + res.candidate.substr(0, OCR_PREVIEW_LEN) + "... (no valid VIN found)";
    }
    return res;
}
