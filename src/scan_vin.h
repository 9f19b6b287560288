/**
 * scan_vin.h:
 * Header file for the VIN (Vehicle Identification Number) scanner
 */

#ifndef SCAN_VIN_H
#define SCAN_VIN_H

#include "be20_api/scanner_params.h"
#include "be20_api/sbuf.h"

/* Scan a single sbuf; exposed for testing */
void scan_vin_sbuf(scanner_params &sp, const sbuf_t &sbuf);

extern "C" void scan_vin(scanner_params &sp);

#endif // SCAN_VIN_H
