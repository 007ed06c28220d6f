//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#include <algorithm>
#include <fstream>

#include <gtest/gtest.h>

#include "FileSystem.h"
#include "FolderShortcutResolver.h"
#include "NetworkLocationResolver.h"
#include "ShellLinkBuilder.h"
#include "UnitTestHelper.h"

using namespace std::string_literals;

using namespace Netloc;
using namespace Netloc::Test;

namespace fs = std::filesystem;

namespace {

constexpr auto kDesktopIni =
    "[.ShellClassInfo]\r\n"
    "CLSID2={0AFACED1-E828-11D1-9187-B532F1E9575D}\r\n"
    "Flags=2\r\n";

void WriteText(const fs::path& path, std::string_view content)
{
    std::ofstream file(path, std::ios::out | std::ios::binary);
    file.write(content.data(), content.size());
}

}  // namespace

namespace Netloc::Test {

class FolderShortcutResolverTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        container = helper.CreateTemporaryDirectory(L"netloc-shortcuts");
        shellLinkResolver = std::make_shared<FolderShortcutResolver>();
        resolver = NetworkLocationResolver::Create(std::make_shared<FileSystem>(), shellLinkResolver, container);
    }

    // Layout created by explorer's 'Add a network location' wizard
    fs::path AddFolderShortcut(const std::wstring& name, const std::string& target)
    {
        const auto folder = container / name;
        fs::create_directory(folder);
        WriteText(folder / L"desktop.ini", kDesktopIni);
        ShellLinkBuilder::WriteFile(folder / L"target.lnk", ShellLinkBuilder().WithNetName(target).Build());
        return folder;
    }

    UnitTestHelper helper;
    fs::path container;
    std::shared_ptr<FolderShortcutResolver> shellLinkResolver;
    NetworkLocationResolver::Ptr resolver;
};

TEST_F(FolderShortcutResolverTest, IsFolderShortcutDesktopIni)
{
    EXPECT_TRUE(FolderShortcutResolver::IsFolderShortcutDesktopIni(kDesktopIni));
    EXPECT_TRUE(FolderShortcutResolver::IsFolderShortcutDesktopIni(
        "[.ShellClassInfo]\nCLSID2={0aface d1}\nCLSID2={0afaced1-e828-11d1-9187-b532f1e9575d}\n"));

    EXPECT_FALSE(FolderShortcutResolver::IsFolderShortcutDesktopIni(""));
    EXPECT_FALSE(FolderShortcutResolver::IsFolderShortcutDesktopIni(
        "[.ShellClassInfo]\r\nIconResource=C:\\Windows\\system32\\imageres.dll,-3\r\n"));
    EXPECT_FALSE(FolderShortcutResolver::IsFolderShortcutDesktopIni("CLSID2={0AFACED1-E828-11D1-9187-B532F1E9575D"));
}

TEST_F(FolderShortcutResolverTest, Open)
{
    EXPECT_TRUE(shellLinkResolver->Open(container).has_value());

    const auto file = container / L"file.txt";
    WriteText(file, "text");

    auto rv = shellLinkResolver->Open(file);
    ASSERT_TRUE(rv.has_error());
    EXPECT_EQ(rv.error(), std::errc::not_a_directory);

    EXPECT_TRUE(shellLinkResolver->Open(container / L"missing").has_error());
}

TEST_F(FolderShortcutResolverTest, ResolveFolderShortcut)
{
    AddFolderShortcut(L"Data", "\\\\server\\data");

    auto target = shellLinkResolver->ResolveLinkTarget(container, L"Data");
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(*target, L"\\\\server\\data"s);
}

TEST_F(FolderShortcutResolverTest, ResolveUtf16DesktopIni)
{
    const auto folder = AddFolderShortcut(L"Data", "\\\\server\\data");

    std::string utf16 = "\xFF\xFE";
    for (const auto c : std::string_view(kDesktopIni))
    {
        utf16.push_back(c);
        utf16.push_back('\0');
    }

    WriteText(folder / L"desktop.ini", utf16);

    auto target = shellLinkResolver->ResolveLinkTarget(container, L"Data");
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(*target, L"\\\\server\\data"s);
}

TEST_F(FolderShortcutResolverTest, ResolveLinkFile)
{
    ShellLinkBuilder::WriteFile(container / L"Public.lnk", ShellLinkBuilder().WithNetworkItem("\\\\nas\\public").Build());

    auto target = shellLinkResolver->ResolveLinkTarget(container, L"Public.lnk");
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(*target, L"\\\\nas\\public"s);
}

TEST_F(FolderShortcutResolverTest, ResolveNotAShortcut)
{
    fs::create_directory(container / L"Plain");
    WriteText(container / L"notes.txt", "text");

    const auto folder = container / L"Customized";
    fs::create_directory(folder);
    WriteText(folder / L"desktop.ini", "[.ShellClassInfo]\r\nIconResource=imageres.dll,-3\r\n");
    ShellLinkBuilder::WriteFile(folder / L"target.lnk", ShellLinkBuilder().WithNetName("\\\\server\\data").Build());

    for (const auto name : {L"Plain", L"notes.txt", L"Customized", L"missing"})
    {
        auto target = shellLinkResolver->ResolveLinkTarget(container, name);
        ASSERT_TRUE(target.has_value());
        EXPECT_FALSE(target->has_value());
    }
}

TEST_F(FolderShortcutResolverTest, ResolveCorruptedLink)
{
    WriteText(container / L"Broken.lnk", "not a shell link");

    auto target = shellLinkResolver->ResolveLinkTarget(container, L"Broken.lnk");
    EXPECT_TRUE(target.has_error());
}

TEST_F(FolderShortcutResolverTest, EnumerateAll)
{
    AddFolderShortcut(L"Data", "\\\\server\\data");
    AddFolderShortcut(L"Local", "");
    ShellLinkBuilder::WriteFile(
        container / L"Public.lnk", ShellLinkBuilder().WithNetName("\\\\nas\\public", "docs").Build());
    ShellLinkBuilder::WriteFile(
        container / L"Documents.lnk", ShellLinkBuilder().WithLocalBasePath("C:\\Users\\foo\\Documents").Build());
    WriteText(container / L"Broken.lnk", "not a shell link");
    fs::create_directory(container / L"Plain");

    auto locations = resolver->EnumerateAll();
    std::sort(std::begin(locations), std::end(locations), [](const auto& lhs, const auto& rhs) {
        return lhs.Name() < rhs.Name();
    });

    ASSERT_EQ(locations.size(), 2u);
    EXPECT_EQ(locations[0].Name(), L"\\\\nas\\public"s);
    EXPECT_EQ(locations[0].ShortcutPath(), container / L"Public.lnk");
    EXPECT_EQ(locations[1].Name(), L"\\\\server\\data"s);
    EXPECT_EQ(locations[1].ShortcutPath(), container / L"Data");
    EXPECT_TRUE(locations[1].IsMapped());
}

TEST_F(FolderShortcutResolverTest, RenameFolderShortcut)
{
    AddFolderShortcut(L"Data", "\\\\server\\data");
    AddFolderShortcut(L"Other", "\\\\server\\other");

    auto location = resolver->FromUncPath(L"\\\\SERVER\\Data");
    ASSERT_TRUE(location.has_value());

    auto label = location->ShareLabel();
    ASSERT_TRUE(label.has_value());
    EXPECT_EQ(*label, L"Data"s);

    ASSERT_TRUE(location->SetShareLabel(L"Team data").has_value());
    EXPECT_TRUE(fs::exists(container / L"Team data" / L"target.lnk"));
    EXPECT_FALSE(fs::exists(container / L"Data"));
    EXPECT_EQ(*location->ShareLabel(), L"Team data"s);

    auto rv = location->SetShareLabel(L"Other");
    ASSERT_TRUE(rv.has_error());
    EXPECT_TRUE(fs::exists(container / L"Team data"));
    EXPECT_TRUE(fs::exists(container / L"Other" / L"target.lnk"));
}

TEST_F(FolderShortcutResolverTest, RenameLinkFile)
{
    ShellLinkBuilder::WriteFile(container / L"Public.lnk", ShellLinkBuilder().WithNetworkItem("\\\\nas\\public").Build());

    auto location = resolver->FromUncPath(L"\\\\nas\\public");
    ASSERT_TRUE(location.has_value());
    EXPECT_EQ(*location->ShareLabel(), L"Public"s);

    ASSERT_TRUE(location->SetShareLabel(L"Team").has_value());
    EXPECT_TRUE(fs::is_regular_file(container / L"Team.lnk"));
    EXPECT_FALSE(fs::exists(container / L"Team"));
    EXPECT_FALSE(fs::exists(container / L"Public.lnk"));
    EXPECT_EQ(*location->ShareLabel(), L"Team"s);

    const auto locations = resolver->EnumerateAll();
    ASSERT_EQ(locations.size(), 1u);
    EXPECT_EQ(locations[0].ShortcutPath(), container / L"Team.lnk");

    auto other = resolver->FromUncPath(L"\\\\nas\\public");
    ASSERT_TRUE(other.has_value());
    EXPECT_TRUE(other->IsMapped());
    EXPECT_EQ(*other->ShareLabel(), L"Team"s);
}

TEST_F(FolderShortcutResolverTest, FileSystemIsDirectory)
{
    FileSystem fileSystem;

    const auto file = container / L"notes.txt";
    WriteText(file, "text");

    EXPECT_TRUE(fileSystem.IsDirectory(container));
    EXPECT_FALSE(fileSystem.IsDirectory(file));
    EXPECT_FALSE(fileSystem.IsDirectory(container / L"missing"));
}

TEST_F(FolderShortcutResolverTest, RenameFailsWhenTargetCannotBeChecked)
{
    FileSystem fileSystem;

    const auto entry = container / L"Data";
    fs::create_directory(entry);

    // Longer than any file system allows for a single name
    const auto newPath = container / std::wstring(1024, L'x');

    auto rv = fileSystem.Rename(entry, newPath);
    EXPECT_TRUE(rv.has_error());
    EXPECT_TRUE(fs::is_directory(entry));
}

TEST_F(FolderShortcutResolverTest, RenameWithoutShortcut)
{
    auto location = resolver->FromUncPath(L"\\\\server\\data");
    ASSERT_TRUE(location.has_value());

    EXPECT_FALSE(location->IsMapped());
    EXPECT_EQ(location->ShortcutPath(), container / L"data (server)");
    EXPECT_TRUE(location->SetShareLabel(L"Team data").has_error());
    EXPECT_FALSE(fs::exists(container / L"Team data"));
}

}  // namespace Netloc::Test
