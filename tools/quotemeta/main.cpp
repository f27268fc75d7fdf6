// Copyright 2022 Dietrich Epp.
// This file is part of Quotemeta. Quotemeta is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#include "lib/quotemeta/log.hpp"
#include "lib/quotemeta/quote.hpp"

#include <fmt/format.h>

#include <cstdio>
#include <system_error>

// Print "cat <name>" for each argument, quoted so that pasting the line into a
// shell passes the exact bytes of the argument to cat. Every argument is a
// name, including ones that start with "-". Always exits with status 0.
int main(int argc, char **argv) {
    try {
        for (int i = 1; i < argc; i++) {
            fmt::print("cat {}\n", quotemeta::QuoteMeta(argv[i]));
        }
        if (std::fflush(stdout) != 0) {
            quotemeta::Warn("could not write to standard output");
        }
    } catch (std::system_error &e) {
        quotemeta::Warn("could not write to standard output: {}", e.what());
    }
    return 0;
}
