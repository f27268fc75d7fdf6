// Copyright 2022 Dietrich Epp.
// This file is part of Quotemeta. Quotemeta is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace quotemeta {
namespace test {

// Run a program with the given arguments (not including argv[0]), writing
// input to its standard input and appending its standard output to out.
// Returns the exit status, or -1 if the program could not be run or did not
// exit normally. The input must fit in a pipe buffer.
int RunProgram(const std::string &program,
               const std::vector<std::string> &args, std::string_view input,
               std::string *out);

} // namespace test
} // namespace quotemeta
