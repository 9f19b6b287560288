/*
 * vin_extractor.h:
 * The vin_extractor command, callable as a library so it can be tested.
 */

#ifndef _VIN_EXTRACTOR_H_
#define _VIN_EXTRACTOR_H_

#include <iosfwd>

#define VIN_EXIT_FOUND    0              // at least one VIN found, or --check / --explain succeeded
#define VIN_EXIT_ERROR    1
#define VIN_EXIT_NOTFOUND 2

int vin_extractor_main(std::istream &cin, std::ostream &cout, std::ostream &cerr, int argc, char * const *argv);

#endif
