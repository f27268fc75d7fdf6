// Copyright 2022 Dietrich Epp.
// This file is part of Quotemeta. Quotemeta is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#include "lib/quotemeta/quote.hpp"

namespace quotemeta {

namespace {

const char OCT_DIGIT[8] = {'0', '1', '2', '3', '4', '5', '6', '7'};

} // namespace

ByteClass Classify(unsigned char c) {
    if (c < 32 || c >= 127) {
        return ByteClass::ControlOrHighBit;
    }
    if (('a' <= c && c <= 'z') || ('A' <= c && c <= 'Z') ||
        ('0' <= c && c <= '9')) {
        return ByteClass::BareSafe;
    }
    switch (c) {
    case '+':
    case ',':
    case '-':
    case '.':
    case '/':
    case ':':
    case '=':
    case '@':
    case '_':
        return ByteClass::BareSafe;
    // A backslash could be written literally inside single quotes, but then
    // it must not be escaped. Whether a later byte forces $'...' is not known
    // yet, so always escape it.
    case '\'':
    case '\\':
        return ByteClass::SpecialEscape;
    default:
        return ByteClass::NeedsSingleQuote;
    }
}

QuotingStyle QuotingDecision::Style() const {
    if (c_quoted) {
        return QuotingStyle::ANSIC;
    }
    if (single_quoted) {
        return QuotingStyle::Single;
    }
    return QuotingStyle::None;
}

QuotingDecision Decide(std::string_view bytes) {
    QuotingDecision decision{false, false};
    for (const char c : bytes) {
        switch (Classify(static_cast<unsigned char>(c))) {
        case ByteClass::BareSafe:
            break;
        case ByteClass::ControlOrHighBit:
        case ByteClass::SpecialEscape:
            decision.c_quoted = true;
            break;
        case ByteClass::NeedsSingleQuote:
            decision.single_quoted = true;
            break;
        }
    }
    return decision;
}

const char *ByteClassName(ByteClass cls) {
    switch (cls) {
    case ByteClass::BareSafe:
        return "bare-safe";
    case ByteClass::ControlOrHighBit:
        return "control-or-high-bit";
    case ByteClass::SpecialEscape:
        return "special-escape";
    case ByteClass::NeedsSingleQuote:
        return "needs-single-quote";
    }
    return "unknown";
}

const char *QuotingStyleName(QuotingStyle style) {
    switch (style) {
    case QuotingStyle::None:
        return "none";
    case QuotingStyle::Single:
        return "single";
    case QuotingStyle::ANSIC:
        return "ansi-c";
    }
    return "unknown";
}

void AppendQuoteMeta(std::string *out, std::string_view bytes) {
    std::string s;
    s.reserve(bytes.size());
    QuotingDecision decision{false, false};
    for (const char c : bytes) {
        const unsigned char u = static_cast<unsigned char>(c);
        switch (Classify(u)) {
        case ByteClass::BareSafe:
            s.push_back(c);
            break;
        case ByteClass::ControlOrHighBit:
            // Always three digits, so a following digit is not part of the
            // escape.
            decision.c_quoted = true;
            s.push_back('\\');
            s.push_back(OCT_DIGIT[u >> 6]);
            s.push_back(OCT_DIGIT[(u >> 3) & 7]);
            s.push_back(OCT_DIGIT[u & 7]);
            break;
        case ByteClass::SpecialEscape:
            decision.c_quoted = true;
            s.push_back('\\');
            s.push_back(c);
            break;
        case ByteClass::NeedsSingleQuote:
            decision.single_quoted = true;
            s.push_back(c);
            break;
        }
    }
    switch (decision.Style()) {
    case QuotingStyle::None:
        out->append(s);
        break;
    case QuotingStyle::Single:
        out->push_back('\'');
        out->append(s);
        out->push_back('\'');
        break;
    case QuotingStyle::ANSIC:
        out->append("$'");
        out->append(s);
        out->push_back('\'');
        break;
    }
}

std::string QuoteMeta(std::string_view bytes) {
    std::string out;
    AppendQuoteMeta(&out, bytes);
    return out;
}

std::string QuoteMeta(const char *str) {
    return QuoteMeta(std::string_view{str});
}

std::string QuoteMeta(const std::string &str) {
    return QuoteMeta(std::string_view{str});
}

std::string QuoteMeta(const std::filesystem::path &path) {
    return QuoteMeta(std::string_view{path.native()});
}

std::string QuoteMeta(const void *data, std::size_t size) {
    return QuoteMeta(
        std::string_view{static_cast<const char *>(data), size});
}

} // namespace quotemeta
