// Copyright 2022 Dietrich Epp.
// This file is part of Quotemeta. Quotemeta is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#include "lib/quotemeta/error.hpp"
#include "lib/quotemeta/file.hpp"
#include "test/TempFile.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using quotemeta::SplitRecords;
using quotemeta::test::TempFile;

namespace {

using Records = std::vector<std::string>;

} // namespace

TEST(FileTest, SplitRecords) {
    EXPECT_EQ(SplitRecords("", '\n'), Records{});
    EXPECT_EQ(SplitRecords("a", '\n'), (Records{"a"}));
    EXPECT_EQ(SplitRecords("a\n", '\n'), (Records{"a"}));
    EXPECT_EQ(SplitRecords("a\nb", '\n'), (Records{"a", "b"}));
    EXPECT_EQ(SplitRecords("a\n\nb\n", '\n'), (Records{"a", "", "b"}));
    EXPECT_EQ(SplitRecords("\n", '\n'), (Records{""}));
    EXPECT_EQ(SplitRecords("a\r\n", '\n'), (Records{"a\r"}));
}

TEST(FileTest, SplitRecordsNull) {
    const std::string data("one\ntwo\0three\0", 14);
    EXPECT_EQ(SplitRecords(data, '\0'), (Records{"one\ntwo", "three"}));
}

TEST(FileTest, ReadAll) {
    std::string data;
    for (int i = 0; i < 40000; i++) {
        data.push_back(static_cast<char>(i * 7));
    }
    TempFile tmp{data};
    ASSERT_FALSE(tmp.path().empty());
    quotemeta::InputFile file;
    file.Open(tmp.path());
    EXPECT_EQ(file.name(), tmp.path());
    EXPECT_EQ(file.ReadAll(), data);
    file.Close();
}

TEST(FileTest, ReadEmpty) {
    TempFile tmp{""};
    ASSERT_FALSE(tmp.path().empty());
    quotemeta::InputFile file;
    file.Open(tmp.path());
    EXPECT_EQ(file.ReadAll(), "");
}

TEST(FileTest, OpenMissing) {
    quotemeta::InputFile file;
    try {
        file.Open("/nonexistent/quotemeta test");
        FAIL() << "expected Error";
    } catch (quotemeta::Error &ex) {
        EXPECT_EQ(std::string(ex.what()).rfind(
                      "open '/nonexistent/quotemeta test': ", 0),
                  0u)
            << ex.what();
    }
}
