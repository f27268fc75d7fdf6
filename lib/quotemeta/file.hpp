// Copyright 2022 Dietrich Epp.
// This file is part of Quotemeta. Quotemeta is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#pragma once

#include <algorithm>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

namespace quotemeta {

// Wrapper for std::FILE.
class File {
public:
    File() : m_file{nullptr} {}
    File(const File &) = delete;
    File(File &&other) : m_file{other.m_file}, m_name{std::move(other.m_name)} {
        other.m_file = nullptr;
    }
    explicit File(std::FILE *file) : m_file{file} {}
    ~File() {
        if (m_file != nullptr) {
            std::fclose(m_file);
        }
    }
    File &operator=(const File &) = delete;
    File &operator=(File &&other) {
        using std::swap;
        swap(m_file, other.m_file);
        swap(m_name, other.m_name);
        return *this;
    }
    operator std::FILE *() { return m_file; }
    operator bool() { return m_file != nullptr; }
    bool operator!() { return m_file == nullptr; }

    // Set the file handle and its name.
    void Set(std::FILE *file, std::string_view name);

    // Close the file.
    void Close();

    // Return the name of the file, used to open it.
    std::string_view name() const { return m_name; }

    // Get the file handle.
    std::FILE *file() { return m_file; }

private:
    std::FILE *m_file;
    std::string m_name;
};

// A wrapper for input files.
class InputFile : private File {
public:
    // Open the named file. The name "-" opens standard input.
    void Open(const std::string &name);

    // Read the rest of the file, and throw an error on failure.
    std::string ReadAll();

    using File::Close;
    using File::name;
};

// Split data into records terminated or separated by the given byte. A final
// terminator does not produce an empty record. A carriage return before a
// newline terminator is not removed.
std::vector<std::string> SplitRecords(std::string_view data, char separator);

} // namespace quotemeta
