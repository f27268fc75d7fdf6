// Copyright 2022 Dietrich Epp.
// This file is part of Quotemeta. Quotemeta is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#include "lib/quotemeta/error.hpp"

#include "lib/quotemeta/quote.hpp"

#include <fmt/format.h>

#include <string.h>

namespace quotemeta {

namespace {

constexpr std::size_t kErrorBufSize = 1024;

} // namespace

#if _POSIX_C_SOURCE >= 200112L && !_GNU_SOURCE
std::string StrError(int errorcode) {
    char buf[kErrorBufSize];
    int r = strerror_r(errorcode, buf, sizeof(buf));
    if (r != 0) {
        return std::string();
    }
    return buf;
}
#else
std::string StrError(int errorcode) {
    char buf[kErrorBufSize];
    char *p = strerror_r(errorcode, buf, sizeof(buf));
    if (p == nullptr) {
        return std::string();
    }
    return p;
}
#endif

Error IOError(std::string_view file, const char *op, int errorcode) {
    return Error(
        fmt::format("{} {}: {}", op, QuoteMeta(file), StrError(errorcode)));
}

} // namespace quotemeta
