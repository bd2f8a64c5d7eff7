/*
 * Copyright (c) 2022, Shiv Nadar University, Delhi NCR, India. All Rights
 * Reserved. Permission to use, copy, modify and distribute this software for
 * educational, research, and not-for-profit purposes, without fee and without a
 * signed license agreement, is hereby granted, provided that this paragraph and
 * the following two paragraphs appear in all copies, modifications, and
 * distributions.
 *
 * IN NO EVENT SHALL SHIV NADAR UNIVERSITY BE LIABLE TO ANY PARTY FOR DIRECT,
 * INDIRECT, SPECIAL, INCIDENTAL, OR CONSEQUENTIAL DAMAGES, INCLUDING LOST
 * PROFITS, ARISING OUT OF THE USE OF THIS SOFTWARE.
 *
 * SHIV NADAR UNIVERSITY SPECIFICALLY DISCLAIMS ANY WARRANTIES, INCLUDING, BUT
 * NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE. THE SOFTWARE PROVIDED HEREUNDER IS PROVIDED "AS IS". SHIV
 * NADAR UNIVERSITY HAS NO OBLIGATION TO PROVIDE MAINTENANCE, SUPPORT, UPDATES,
 * ENHANCEMENTS, OR MODIFICATIONS.
 */

/**
 * @file main.cpp
 *
 * @brief Contains the implementation of the main function
 */

#include "main.hpp"

#include <getopt.h>

#include <iostream>

#include "RouterOptions.hpp"
#include "StationParser.hpp"

static void printHelp(const char *prog)
{
    std::cout << "Usage: " << prog << " [options] [station-file]\n";
    std::cout << "Options:\n";
    std::cout << "  --max-paths <int>         Simple paths drawn per "
                 "source/terminal pair (default 0 = all)\n";
    std::cout << "  --diag-file <file>        Diagnostics output file (default "
                 "routing.log)\n";
    std::cout << "  --diag-verbose            Write the routing trace\n";
    std::cout << "  --help                    Show this help message\n";
}

int main(int argc, char *argv[])
{
    RouterOptions options;

    static struct option long_options[] = {
        {"max-paths", required_argument, 0, 0},
        {"diag-file", required_argument, 0, 0},
        {"diag-verbose", no_argument, 0, 0},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}};

    int option_index = 0;
    int c;
    // Use getopt_long to iterate over options
    while ((c = getopt_long(argc, argv, "h", long_options, &option_index)) !=
           -1) {
        if (c == 'h') {
            printHelp(argv[0]);
            return 0;
        } else if (c == 0) {
            std::string name = long_options[option_index].name;
            try {
                if (name == "max-paths")
                    options.maxPathsPerPair = std::stoi(optarg);
                else if (name == "diag-file")
                    options.diagFile = std::string(optarg);
                else if (name == "diag-verbose")
                    options.diagVerbose = true;
            } catch (const std::exception &ex) {
                std::cerr << "Invalid value for --" << name << ": " << optarg
                          << std::endl;
                return 1;
            }
        } else {
            printHelp(argv[0]);
            return 1;
        }
    }

    // Remaining non-option args: [station-file]
    std::string filename = "station.txt";
    if (optind < argc) {
        filename = argv[optind];
    }

    // Validate options (throws on bad input)
    try {
        options.validate();
    } catch (const std::exception &ex) {
        std::cerr << "Invalid router option: " << ex.what() << std::endl;
        return 1;
    }

    return runStation(filename, options, std::cout);
}
