// Copyright 2022 Dietrich Epp.
// This file is part of Quotemeta. Quotemeta is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace quotemeta {

// Generic subclass for fatal errors. This should only be used for runtime
// errors that terminate the program, and carry a descriptive, human-readable
// error message.
class Error : public std::runtime_error {
public:
    using runtime_error::runtime_error;
};

// Return the description of the given error code.
std::string StrError(int errorcode);

// Construct an I/O error. The file name is shell-quoted in the message.
Error IOError(std::string_view file, const char *op, int errorcode);

} // namespace quotemeta
