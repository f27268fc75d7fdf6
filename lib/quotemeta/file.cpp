// Copyright 2022 Dietrich Epp.
// This file is part of Quotemeta. Quotemeta is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#include "lib/quotemeta/file.hpp"

#include "lib/quotemeta/error.hpp"

#include <errno.h>
#include <unistd.h>

namespace quotemeta {

namespace {

constexpr std::size_t kReadBufSize = 16 * 1024;

constexpr std::string_view kStdinName = "<stdin>";

} // namespace

void File::Set(std::FILE *file, std::string_view name) {
    m_name = name;
    if (m_file) {
        std::fclose(m_file);
    }
    m_file = file;
}

void File::Close() {
    int r = fclose(m_file);
    m_file = nullptr;
    std::string name;
    std::swap(name, m_name);
    if (r != 0) {
        throw IOError(name, "close", errno);
    }
}

void InputFile::Open(const std::string &name) {
    if (name == "-") {
        // Duplicate the descriptor so that closing this file leaves standard
        // input open.
        int fd = dup(STDIN_FILENO);
        if (fd == -1) {
            throw IOError(kStdinName, "open", errno);
        }
        FILE *fp = fdopen(fd, "rb");
        if (fp == nullptr) {
            int err = errno;
            close(fd);
            throw IOError(kStdinName, "open", err);
        }
        Set(fp, kStdinName);
        return;
    }
    FILE *fp = fopen(name.c_str(), "rb");
    if (fp == nullptr) {
        throw IOError(name, "open", errno);
    }
    Set(fp, name);
}

std::string InputFile::ReadAll() {
    std::string data;
    char buf[kReadBufSize];
    while (true) {
        size_t r = std::fread(buf, 1, sizeof(buf), file());
        data.append(buf, r);
        if (r < sizeof(buf)) {
            if (std::ferror(file())) {
                throw IOError(name(), "read", errno);
            }
            break;
        }
    }
    return data;
}

std::vector<std::string> SplitRecords(std::string_view data, char separator) {
    std::vector<std::string> records;
    while (!data.empty()) {
        size_t i = data.find(separator);
        if (i == std::string_view::npos) {
            records.emplace_back(data);
            break;
        }
        records.emplace_back(data.substr(0, i));
        data = data.substr(i + 1);
    }
    return records;
}

} // namespace quotemeta
