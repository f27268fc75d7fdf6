// Copyright 2022 Dietrich Epp.
// This file is part of Quotemeta. Quotemeta is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace quotemeta {

// How a single byte must be written in a shell word.
enum class ByteClass {
    // Needs no quoting or escaping.
    BareSafe,
    // 0-31 and 127-255. Written as \ooo inside $'...'.
    ControlOrHighBit,
    // Single quote and backslash. Written as \' or \\ inside $'...'.
    SpecialEscape,
    // Written literally, but only inside quotes.
    NeedsSingleQuote,
};

// The quoting applied to a whole string.
enum class QuotingStyle {
    None,
    Single,
    ANSIC,
};

// Return the class of a byte.
ByteClass Classify(unsigned char c);

// Flags accumulated over every byte of a string.
struct QuotingDecision {
    // Some byte needs a backslash escape, so $'...' is required.
    bool c_quoted;
    // Some byte needs to be quoted.
    bool single_quoted;

    // Return the style selected by the flags. ANSI-C quoting takes precedence
    // over single quotes, since single quotes cannot contain escapes.
    QuotingStyle Style() const;
};

// Classify every byte in a string, without producing any output.
QuotingDecision Decide(std::string_view bytes);

// Return a short name for the class, for diagnostics.
const char *ByteClassName(ByteClass cls);

// Return a short name for the style, for diagnostics.
const char *QuotingStyleName(QuotingStyle style);

// Append the shell-quoted form of the bytes to the output. The bytes do not
// need to be valid text in any encoding.
void AppendQuoteMeta(std::string *out, std::string_view bytes);

// Quote a string so that pasting it into a Bash command line reproduces the
// exact bytes. Strings with no special characters are returned as-is,
// printable strings without quotes or backslashes are single-quoted, and
// anything else is written with ANSI-C quoting, $'...'.
//
//     QuoteMeta("/bin/cat")      => /bin/cat
//     QuoteMeta("Hello, world!") => 'Hello, world!'
//     QuoteMeta("isn't")         => $'isn\'t'
std::string QuoteMeta(std::string_view bytes);

// Quote a NUL-terminated string, such as an argv entry.
std::string QuoteMeta(const char *str);

// Quote a string.
std::string QuoteMeta(const std::string &str);

// Quote the native representation of a path.
std::string QuoteMeta(const std::filesystem::path &path);

// Quote a buffer of raw bytes.
std::string QuoteMeta(const void *data, std::size_t size);

} // namespace quotemeta
