// Copyright 2022 Dietrich Epp.
// This file is part of Quotemeta. Quotemeta is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#include "lib/quotemeta/flag.hpp"

#include "lib/quotemeta/log.hpp"
#include "lib/quotemeta/quote.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cstdlib>

namespace flag {

[[noreturn]] void FailUsage(std::string_view msg) {
    quotemeta::Err("{}", msg);
    std::exit(2);
}

namespace {

// The argument is shell-quoted so the message shows exactly which bytes were
// rejected.
UsageError ArgumentError(std::string_view msg, std::string_view arg) {
    return UsageError(fmt::format("{}: {}", msg, quotemeta::QuoteMeta(arg)));
}

std::string FlagName(std::string_view name) {
    std::string s = "-";
    s.append(name);
    return s;
}

struct BoolName {
    const char *text;
    bool value;
};

const BoolName kBoolNames[] = {
    {"true", true}, {"false", false}, {"yes", true}, {"no", false},
    {"on", true},   {"off", false},   {"1", true},   {"0", false},
};

class Bool : public FlagBase {
    bool *m_ptr;

public:
    explicit Bool(bool *value) : m_ptr{value} {}

    FlagArgument Argument() const override { return FlagArgument::Optional; }
    void Parse(std::optional<std::string_view> arg) override {
        if (!arg.has_value()) {
            *m_ptr = true;
            return;
        }
        for (const BoolName &b : kBoolNames) {
            if (*arg == b.text) {
                *m_ptr = b.value;
                return;
            }
        }
        throw ArgumentError("invalid value for boolean flag", *arg);
    }
};

} // namespace

void String::Parse(std::optional<std::string_view> arg) {
    if (!arg.has_value()) {
        throw UsageError("missing string value");
    }
    m_ptr->assign(*arg);
}

void Parser::AddFlagImpl(std::unique_ptr<FlagBase> value, const char *name,
                         const char *help, const char *metavar) {
    Flag f;
    f.value = std::move(value);
    if (help != nullptr) {
        f.help = help;
    }
    if (metavar != nullptr) {
        f.metavar = metavar;
    }
    if (!m_flags.emplace(name, std::move(f)).second) {
        throw std::logic_error(fmt::format("duplicate flag: -{}", name));
    }
}

void Parser::AddBoolFlag(bool *value, const char *name, const char *help) {
    AddFlagImpl(std::make_unique<Bool>(value), name, help, nullptr);
    m_flags.find(name)->second.negatable = true;
    std::string neg = "no-";
    neg.append(name);
    AddFlagImpl(std::make_unique<SetValue<bool>>(value, false), neg.c_str(),
                nullptr, nullptr);
}

void Parser::OptionHelp(FILE *fp) const {
    std::vector<std::pair<std::string, const Flag *>> rows;
    std::size_t width = 0;
    for (const auto &[name, f] : m_flags) {
        if (f.help.empty()) {
            continue;
        }
        std::string usage = FlagName(name);
        if (f.value->Argument() == FlagArgument::Required) {
            usage.append(fmt::format("=<{}>", f.metavar));
        }
        width = std::max(width, usage.size());
        rows.emplace_back(std::move(usage), &f);
    }
    for (const auto &[usage, f] : rows) {
        fmt::print(fp, "  {:<{}}  {}\n", usage, width, f->help);
        if (f->negatable) {
            fmt::print(fp, "  -no-{}\n", usage.substr(1));
        }
    }
}

Parser::Flag &Parser::Lookup(std::string_view name) {
    auto it = m_flags.find(name);
    if (it == m_flags.end()) {
        throw ArgumentError("unknown flag", FlagName(name));
    }
    return it->second;
}

std::vector<std::string> Parser::ParseArgs(int argc, char **argv) {
    std::vector<std::string> positional;
    bool flags_done = false;
    for (int i = 0; i < argc; i++) {
        std::string_view arg{argv[i]};
        if (flags_done || arg.size() < 2 || arg[0] != '-') {
            positional.emplace_back(arg);
            continue;
        }
        if (arg == "--") {
            flags_done = true;
            continue;
        }

        // -name or --name, with an optional =value.
        std::string_view name = arg.substr(arg[1] == '-' ? 2 : 1);
        std::optional<std::string_view> param;
        std::size_t eq = name.find('=');
        if (eq != std::string_view::npos) {
            if (eq == 0) {
                throw ArgumentError("invalid flag", arg);
            }
            param = name.substr(eq + 1);
            name = name.substr(0, eq);
        }
        if (m_help != nullptr && (name == "h" || name == "help")) {
            m_help(stdout, *this);
            std::exit(0);
        }

        FlagBase &value = *Lookup(name).value;
        switch (value.Argument()) {
        case FlagArgument::None:
            if (param.has_value()) {
                throw ArgumentError("flag has unexpected parameter",
                                    FlagName(name));
            }
            break;
        case FlagArgument::Required:
            if (!param.has_value()) {
                if (i + 1 >= argc) {
                    throw ArgumentError("flag is missing required parameter",
                                        FlagName(name));
                }
                param = std::string_view{argv[++i]};
            }
            break;
        case FlagArgument::Optional:
            break;
        }
        value.Parse(param);
    }
    return positional;
}

std::vector<std::string> Parser::Parse(int argc, char **argv) {
    try {
        return ParseArgs(argc, argv);
    } catch (UsageError &ex) {
        FailUsage(ex.what());
    }
}

} // namespace flag
