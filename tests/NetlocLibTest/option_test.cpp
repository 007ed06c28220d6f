//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#include <gtest/gtest.h>

#include "Configuration/Option.h"

using namespace std::string_literals;

using namespace Netloc;

namespace Netloc::Test {

TEST(OptionTest, ToSwitch)
{
    EXPECT_EQ(ToSwitch(L"/list"), L"list"s);
    EXPECT_EQ(ToSwitch(L"-info=\\\\server\\share"), L"info=\\\\server\\share"s);
    EXPECT_FALSE(ToSwitch(L"list").has_value());
    EXPECT_FALSE(ToSwitch(L"/").has_value());
    EXPECT_FALSE(ToSwitch(L"").has_value());
}

TEST(OptionTest, ParseSwitch)
{
    std::optional<std::wstring> value;

    EXPECT_TRUE(ParseSwitch(L"LIST", L"list", value));
    EXPECT_FALSE(value.has_value());

    EXPECT_TRUE(ParseSwitch(L"label=Team data", L"label", value));
    EXPECT_EQ(value, L"Team data"s);

    EXPECT_TRUE(ParseSwitch(L"info=\\\\server\\share=x", L"info", value));
    EXPECT_EQ(value, L"\\\\server\\share=x"s);

    EXPECT_TRUE(ParseSwitch(L"rename=", L"rename", value));
    EXPECT_EQ(value, L""s);

    EXPECT_FALSE(ParseSwitch(L"information", L"info", value));
    EXPECT_FALSE(ParseSwitch(L"info", L"information", value));
    EXPECT_FALSE(ParseSwitch(L"labels=x", L"label", value));
}

TEST(OptionTest, ParseSubArguments)
{
    std::vector<Option> options;
    EXPECT_TRUE(ParseSubArguments(L"Log:File,Output=C:\\temp\\netloc.log,Level=debug", L"log", options));

    ASSERT_EQ(options.size(), 3u);
    EXPECT_EQ(options[0].key, L"file"s);
    EXPECT_FALSE(options[0].value.has_value());
    EXPECT_EQ(options[1].key, L"output"s);
    EXPECT_EQ(options[1].value, L"C:\\temp\\netloc.log"s);
    EXPECT_EQ(options[2].key, L"level"s);
    EXPECT_EQ(options[2].value, L"debug"s);
    EXPECT_FALSE(options[2].isParsed);

    options.clear();
    EXPECT_FALSE(ParseSubArguments(L"log", L"log", options));
    EXPECT_FALSE(ParseSubArguments(L"logfile:console", L"log", options));
    EXPECT_TRUE(options.empty());
}

TEST(OptionTest, ToOptionsSkipsEmptyItems)
{
    std::vector<Option> options;
    ToOptions(L",console,,level=info,", options);

    ASSERT_EQ(options.size(), 2u);
    EXPECT_EQ(options[0].key, L"console"s);
    EXPECT_EQ(options[1].key, L"level"s);
    EXPECT_EQ(options[1].value, L"info"s);
}

TEST(OptionTest, Join)
{
    std::vector<Option> options;
    options.emplace_back(L"console", std::nullopt);
    options.emplace_back(L"level", std::wstring_view(L"debug"));

    EXPECT_EQ(Join(options, L"", L"", L","), L"console,level=debug"s);
    EXPECT_EQ(Join(options, L"/", L"", L" "), L"/console /level=debug"s);
    EXPECT_EQ(Join({}, L"/", L"", L" "), L""s);
}

}  // namespace Netloc::Test
