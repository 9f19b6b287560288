/**
 * scan_vin:
 * Scanner that finds Vehicle Identification Numbers (VINs) in raw data.
 *
 * A VIN is only reported when it is a run of exactly 17 VIN characters inside
 * a run of ASCII letters and digits and carries the correct check digit.
 * Punctuation is not stripped the way extract_vin() does it for OCR text;
 * in binary data that would glue unrelated bytes into VINs.
 */

#include "config.h"

#include <cctype>
#include <iostream>

#include "be20_api/scanner_params.h"
#include "be20_api/scanner_set.h"
#include "be20_api/utils.h" // needs config.h

#include "scan_vin.h"
#include "vin.h"

namespace {
    inline bool vin_run_char(uint8_t ch) {
        return (ch >= '0' && ch <= '9') || (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z');
    }
}

/*
 * Scan one run of alphanumerics [start, start+len) for VINs.
 * Windows are tried left to right; after a hit the scan resumes past it.
 * A window that starts in the margin is left for the next page.
 */
static void scan_vin_run(feature_recorder &vin_recorder, const sbuf_t &sbuf, size_t start, size_t len)
{
    for (size_t i = 0; i + VIN_LENGTH <= len && start + i < sbuf.pagesize; ) {
        std::string candidate = sbuf.substr(start + i, VIN_LENGTH);
        if (valid_vin(candidate)) {
            vin_recorder.write_buf(sbuf, start + i, VIN_LENGTH);
            i += VIN_LENGTH;
            continue;
        }
        i++;
    }
}

void scan_vin_sbuf(scanner_params &sp, const sbuf_t &sbuf)
{
    feature_recorder &vin_recorder = sp.named_feature_recorder("vin");

    /* Runs that start in the page are ours, even if they run into the margin.
     * Runs that start in the margin belong to the next page.
     */
    size_t i = 0;
    while (i < sbuf.pagesize && i < sbuf.bufsize) {
        if (!vin_run_char(sbuf[i])) {
            i++;
            continue;
        }
        size_t start = i;
        while (i < sbuf.bufsize && vin_run_char(sbuf[i])) i++;
        size_t len = i - start;
        if (len >= VIN_LENGTH) {
            scan_vin_run(vin_recorder, sbuf, start, len);
        }
    }
}

extern "C"
void scan_vin(scanner_params &sp)
{
    sp.check_version();
    if (sp.phase==scanner_params::PHASE_INIT) {
        sp.info->set_name("vin");
        sp.info->author          = "vin_extractor";
        sp.info->description     = "Searches for Vehicle Identification Numbers with valid check digits";
        sp.info->scanner_version = PACKAGE_VERSION;
        sp.get_scanner_config("vin_debug", &vin_debug, "VIN debug level (1=rejections, 2=windows)");
        sp.info->feature_defs.push_back( feature_recorder_def("vin"));
        sp.info->histogram_defs.push_back( histogram_def("vin", "vin", "", "", "histogram", histogram_def::flags_t()));
        return;
    }
    if (sp.phase==scanner_params::PHASE_SCAN) {
        scan_vin_sbuf(sp, *sp.sbuf);
    }
}
