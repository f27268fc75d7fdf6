// Copyright 2022 Dietrich Epp.
// This file is part of Quotemeta. Quotemeta is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#include "lib/quotemeta/error.hpp"
#include "lib/quotemeta/file.hpp"
#include "lib/quotemeta/flag.hpp"
#include "lib/quotemeta/log.hpp"
#include "lib/quotemeta/quote.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

namespace quotemeta {
namespace {

struct Args {
    std::vector<std::string> inputs;
    std::string label = "cat";
    bool null_separated = false;
    bool verbose = false;
};

void Help(FILE *fp, const flag::Parser &fl) {
    std::fputs(
        "Usage: quotelist [<options>] [<file>...]\n"
        "\n"
        "Read names from each file, one per line, and print each name as a\n"
        "shell word which reproduces its exact bytes, after a label. With no\n"
        "file, or when file is \"-\", read standard input.\n"
        "\n"
        "Options:\n",
        fp);
    fl.OptionHelp(fp);
}

Args ParseArgs(int argc, char **argv) {
    Args args{};
    flag::Parser fl;
    fl.SetHelp(Help);
    fl.AddFlag(flag::String(&args.label), "label",
               "text printed before each quoted name, default \"cat\"",
               "text");
    fl.AddBoolFlag(&args.null_separated, "null",
                   "names are separated by NUL bytes instead of newlines");
    fl.AddFlag(flag::SetValue<bool>(&args.null_separated, true), "0",
               "same as -null");
    fl.AddBoolFlag(&args.verbose, "verbose", "log the quoting of each name");
    args.inputs = fl.Parse(argc - 1, argv + 1);
    if (args.inputs.empty()) {
        args.inputs.emplace_back("-");
    }
    return args;
}

void PrintName(const Args &args, std::string_view name) {
    std::string quoted = QuoteMeta(name);
    if (LogEnabled(LogLevel::Debug)) {
        Debug("{} byte(s), {} quoting: {}", name.size(),
              QuotingStyleName(Decide(name).Style()), quoted);
    }
    if (args.label.empty()) {
        fmt::print("{}\n", quoted);
    } else {
        fmt::print("{} {}\n", args.label, quoted);
    }
}

std::vector<std::string> ReadNames(const Args &args,
                                   const std::string &input) {
    InputFile file;
    file.Open(input);
    std::string data = file.ReadAll();
    file.Close();
    std::vector<std::string> names =
        SplitRecords(data, args.null_separated ? '\0' : '\n');
    Debug("read {} name(s) from {}", names.size(), QuoteMeta(input));
    return names;
}

int QuoteListMain(int argc, char **argv) {
    Args args = ParseArgs(argc, argv);
    if (args.verbose) {
        SetLogLevel(LogLevel::Debug);
    }
    for (const std::string &input : args.inputs) {
        for (const std::string &name : ReadNames(args, input)) {
            PrintName(args, name);
        }
    }
    if (std::fflush(stdout) != 0 || std::ferror(stdout)) {
        throw IOError("<stdout>", "write", errno);
    }
    return 0;
}

} // namespace
} // namespace quotemeta

int main(int argc, char **argv) {
    try {
        return quotemeta::QuoteListMain(argc, argv);
    } catch (quotemeta::Error &e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        std::exit(1);
    }
    return 0;
}
