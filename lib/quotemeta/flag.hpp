// Copyright 2022 Dietrich Epp.
// This file is part of Quotemeta. Quotemeta is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#pragma once
#include <cstdio>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace flag {

// Log a usage error and exit the program with status 2.
[[noreturn]] void FailUsage(std::string_view msg);

// Invalid command-line input.
class UsageError : public std::runtime_error {
public:
    using runtime_error::runtime_error;
};

// Whether a flag takes a parameter.
enum class FlagArgument {
    None,
    Optional,
    Required,
};

// A flag value, written to by the parser.
class FlagBase {
public:
    virtual ~FlagBase() = default;

    virtual FlagArgument Argument() const = 0;

    // Store the flag parameter. Throw UsageError if it is invalid.
    virtual void Parse(std::optional<std::string_view> arg) = 0;
};

// Flag with a string parameter.
class String : public FlagBase {
    std::string *m_ptr;

public:
    explicit String(std::string *value) : m_ptr{value} {}

    FlagArgument Argument() const override { return FlagArgument::Required; }
    void Parse(std::optional<std::string_view> arg) override;
};

// Flag with no parameter, which stores a fixed value when it appears.
template <typename T>
class SetValue : public FlagBase {
    T *m_ptr;
    T m_value;

public:
    SetValue(T *ptr, T value) : m_ptr{ptr}, m_value{value} {}

    FlagArgument Argument() const override { return FlagArgument::None; }
    void Parse(std::optional<std::string_view>) override { *m_ptr = m_value; }
};

// Command-line parser. Flags are written -name, -name=value, or -name value
// when the flag requires a parameter, with one or two leading dashes. Every
// other argument is collected as a positional argument. "-" is positional, and
// "--" makes every argument after it positional.
class Parser {
public:
    using HelpFunc = void (*)(FILE *fp, const Parser &fl);

    // With a help function, -h and -help print help to stdout and exit with
    // status 0.
    void SetHelp(HelpFunc help) { m_help = help; }

    template <typename F>
    void AddFlag(F &&flag, const char *name, const char *help,
                 const char *metavar = "value") {
        using T = std::decay_t<F>;
        static_assert(std::is_base_of<FlagBase, T>::value,
                      "flag must be derived from FlagBase");
        AddFlagImpl(std::make_unique<T>(std::forward<F>(flag)), name, help,
                    metavar);
    }

    // Add -name, -name=<bool> and -no-name. A bool is one of true/false,
    // yes/no, on/off or 1/0.
    void AddBoolFlag(bool *value, const char *name, const char *help);

    // Print one line per flag, sorted by name.
    void OptionHelp(FILE *fp) const;

    // Parse arguments, not including the program name, and return the
    // positional arguments. Throws UsageError.
    std::vector<std::string> ParseArgs(int argc, char **argv);

    // Same as ParseArgs, but a usage error exits the program with status 2.
    std::vector<std::string> Parse(int argc, char **argv);

private:
    struct Flag {
        std::unique_ptr<FlagBase> value;
        std::string help;
        std::string metavar;
        bool negatable = false;
    };

    void AddFlagImpl(std::unique_ptr<FlagBase> value, const char *name,
                     const char *help, const char *metavar);
    Flag &Lookup(std::string_view name);

    std::map<std::string, Flag, std::less<>> m_flags;
    HelpFunc m_help = nullptr;
};

} // namespace flag
