// Copyright (c) 2025 The Bitwire Core developers
// Distributed under the MIT software license

/**
 * Main test entry point for the Bitwire Test Suite
 *
 * This file initializes the Boost Unit Test Framework for all Bitwire tests.
 */

#define BOOST_TEST_MODULE Bitwire Test Suite
#include <boost/test/included/unit_test.hpp>

#include <util/logging.h>

#include <iostream>

/**
 * Global test suite setup
 */
struct BitwireTestSetup {
    BitwireTestSetup() {
        std::cout << "Bitwire Test Suite Starting..." << std::endl;
        std::cout << "Using Boost.Test version "
                  << BOOST_VERSION / 100000 << "."
                  << BOOST_VERSION / 100 % 1000 << "."
                  << BOOST_VERSION % 100 << std::endl;

        // Decode failures are logged at DEBUG; keep the console for Boost output
        CLoggingConfig::GetInstance().SetConsoleLogging(false);
    }

    ~BitwireTestSetup() {
        std::cout << "Bitwire Test Suite Complete" << std::endl;
    }
};

BOOST_GLOBAL_FIXTURE(BitwireTestSetup);
