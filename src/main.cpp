/*
 * main.cpp
 *
 * The main() for vin_extractor.
 */

#include "config.h"
#include "vin_extractor.h"

#include <iostream>

int main(int argc,char * const *argv)
{
    return vin_extractor_main(std::cin, std::cout, std::cerr, argc, argv);
}
