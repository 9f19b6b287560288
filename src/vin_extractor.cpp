/*
 * vin_extractor.cpp:
 * Command line front end: compute check digits, validate candidates,
 * and pull VINs out of scanner and OCR text.
 */

#include "config.h"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "cxxopts.hpp"

#include "vin.h"
#include "vin_capture.h"
#include "vin_extractor.h"

namespace {
    enum class run_mode { EXTRACT, VALIDATE, CAPTURE, EXPLAIN };

    struct run_config {
        run_mode mode {run_mode::EXTRACT};
        capture_source source {capture_source::BARCODE};
    };

    capture_source parse_source(const std::string &name) {
        if (name == "barcode") return capture_source::BARCODE;
        if (name == "ocr") return capture_source::OCR;
        throw std::invalid_argument("unknown capture source '" + name + "' (use barcode or ocr)");
    }

    /* Process every line of one input. Returns the number of VINs found. */
    size_t process_stream(std::istream &in, std::ostream &cout, const run_config &cfg, vin_capture_session &session) {
        size_t found = 0;
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back(); // remove a '\r' if present
            switch (cfg.mode) {
            case run_mode::EXTRACT: {
                auto vin = extract_vin(line);
                if (vin) {
                    cout << *vin << "\n";
                    found++;
                }
                break;
            }
            case run_mode::VALIDATE:
                if (valid_vin(line)) {
                    cout << line << "\tVALID\n";
                    found++;
                } else {
                    cout << line << "\tINVALID\n";
                }
                break;
            case run_mode::CAPTURE:
                if (cfg.source == capture_source::OCR) {
                    auto res = session.submit_ocr(line);
                    cout << res.message << "\n";
                    if (res.vin) found++;
                } else {
                    if (!session.scanning()) session.start(); // next label
                    auto res = session.submit_barcode(line);
                    if (res) {
                        cout << res->message << "\n";
                        if (res->vin) found++;
                    }
                }
                break;
            case run_mode::EXPLAIN:
                vin_explain(cout, line);
                break;
            }
        }
        return found;
    }
}

int vin_extractor_main(std::istream &cin, std::ostream &cout, std::ostream &cerr, int argc, char * const *argv)
{
    std::string vin_extractor_help( "vin_extractor version " PACKAGE_VERSION
                                    ": finds Vehicle Identification Numbers in scanner and OCR text." );

    cxxopts::Options options( "vin_extractor", vin_extractor_help.c_str());
    options.add_options()
        ("c,check",    "print the check digit of a 17-character VIN", cxxopts::value<std::string>())
        ("v,validate", "print VALID or INVALID for each input line")
        ("s,source",   "treat each input line as a capture from barcode or ocr", cxxopts::value<std::string>())
        ("x,explain",  "print every validation stage for each input line")
        ("d,debug",    "debug level (1=rejections, 2=windows)", cxxopts::value<int>()->default_value("0"))
        ("V,version",  "Display PACKAGE_VERSION (currently) " PACKAGE_VERSION)
        ("h,help",     "print help screen")
        ("files",      "input files (default stdin)", cxxopts::value<std::vector<std::string>>())
        ;
    options.positional_help( "[files...]" );
    options.parse_positional( "files" );

    try {
        auto result = options.parse( argc, argv);

        if ( result.count( "help" )) { cout << options.help() << std::endl; return VIN_EXIT_FOUND; }
        if ( result.count( "version" )) { cout << "vin_extractor " << PACKAGE_VERSION << std::endl; return VIN_EXIT_FOUND; }

        vin_debug = result["debug"].as<int>();

        if ( result.count( "check" )) {
            std::string vin = result["check"].as<std::string>();
            if ( vin.size() != VIN_LENGTH ) {
                throw std::invalid_argument("--check requires a 17-character VIN, got '" + vin + "'");
            }
            cout << vin_check_digit(vin) << std::endl;
            return VIN_EXIT_FOUND;
        }

        run_config cfg;
        if ( result.count( "validate" )) cfg.mode = run_mode::VALIDATE;
        if ( result.count( "explain" ))  cfg.mode = run_mode::EXPLAIN;
        if ( result.count( "source" )) {
            cfg.mode   = run_mode::CAPTURE;
            cfg.source = parse_source( result["source"].as<std::string>());
        }

        vin_capture_session session;
        size_t found = 0;
        if ( result.count( "files" )) {
            for ( const auto &fname : result["files"].as<std::vector<std::string>>() ) {
                std::ifstream in( fname );
                if ( !in.is_open()) {
                    throw std::runtime_error("cannot open: " + fname);
                }
                found += process_stream( in, cout, cfg, session);
            }
        } else {
            found += process_stream( cin, cout, cfg, session);
        }

        if ( cfg.mode == run_mode::CAPTURE ) {
            cout << "history:\n";
            for ( const auto &it : session.history()) {
                cout << it << "\n";
            }
        }
        if ( cfg.mode == run_mode::EXPLAIN ) return VIN_EXIT_FOUND;
        return found > 0 ? VIN_EXIT_FOUND : VIN_EXIT_NOTFOUND;
    } catch ( cxxopts::OptionException &e ) {
        cerr << "vin_extractor: " << e.what() << std::endl;
        cerr << options.help() << std::endl;
        return VIN_EXIT_ERROR;
    } catch ( std::exception &e ) {
        cerr << "vin_extractor: " << e.what() << std::endl;
        return VIN_EXIT_ERROR;
    }
}
