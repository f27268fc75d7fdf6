// Copyright 2022 Dietrich Epp.
// This file is part of Quotemeta. Quotemeta is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#pragma once

#include <fmt/format.h>

namespace quotemeta {

// Logging severity levels, from least to most verbose.
enum class LogLevel {
    Error,
    Warning,
    Info,
    Debug,
};

// Set the most verbose level that is printed. The default is Info.
void SetLogLevel(LogLevel level);

// Return true if messages at the given level are printed.
bool LogEnabled(LogLevel level);

// Log a message to the console.
void LogV(LogLevel level, fmt::string_view format, fmt::format_args args);

// Log a message to the console.
template <typename... Args>
void Log(LogLevel level, fmt::string_view format, Args &&...args) {
    LogV(level, format, fmt::make_format_args(args...));
}

// Print an error message.
void ErrV(fmt::string_view format, fmt::format_args args);

// Print an error message.
template <typename... Args>
void Err(fmt::string_view format, Args &&...args) {
    ErrV(format, fmt::make_format_args(args...));
}

// Print a warning message.
void WarnV(fmt::string_view format, fmt::format_args args);

// Print a warning message.
template <typename... Args>
void Warn(fmt::string_view format, Args &&...args) {
    WarnV(format, fmt::make_format_args(args...));
}

void InfoV(fmt::string_view format, fmt::format_args args);

template <typename... Args>
void Info(fmt::string_view format, Args &&...args) {
    InfoV(format, fmt::make_format_args(args...));
}

void DebugV(fmt::string_view format, fmt::format_args args);

template <typename... Args>
void Debug(fmt::string_view format, Args &&...args) {
    DebugV(format, fmt::make_format_args(args...));
}

} // namespace quotemeta
