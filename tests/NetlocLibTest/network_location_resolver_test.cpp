//
// SPDX-License-Identifier: LGPL-2.1-or-later
//
// Copyright © 2021 ANSSI. All Rights Reserved.
//

#include <algorithm>

#include <gtest/gtest.h>

#include "FakeFileSystem.h"
#include "FakeShellLinkResolver.h"
#include "NetworkLocationError.h"
#include "NetworkLocationResolver.h"
#include "UnitTestHelper.h"

using namespace std::string_literals;

using namespace Netloc;
using namespace Netloc::Test;

namespace fs = std::filesystem;

namespace Netloc::Test {

class NetworkLocationResolverTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        fileSystem = std::make_shared<FakeFileSystem>();
        shellLinkResolver = std::make_shared<FakeShellLinkResolver>();
        fileSystem->AddContainer(container);
        fileSystem->OnRename([this](const fs::path& entry, const fs::path& newPath) {
            shellLinkResolver->MoveTarget(entry.filename().wstring(), newPath.filename().wstring());
        });
        resolver = NetworkLocationResolver::Create(fileSystem, shellLinkResolver, container);
    }

    void AddShortcut(const std::wstring& name, const std::wstring& target)
    {
        fileSystem->AddEntry(container / name);
        shellLinkResolver->SetTarget(name, target);
    }

    void AddShellLinkFile(const std::wstring& name, const std::wstring& target)
    {
        fileSystem->AddFile(container / name);
        shellLinkResolver->SetTarget(name, target);
    }

    UnitTestHelper helper;
    const fs::path container = fs::path(L"Network Shortcuts");
    std::shared_ptr<FakeFileSystem> fileSystem;
    std::shared_ptr<FakeShellLinkResolver> shellLinkResolver;
    NetworkLocationResolver::Ptr resolver;
};

TEST_F(NetworkLocationResolverTest, ShortcutSearchIsLazy)
{
    AddShortcut(L"Data", L"\\\\server\\data");

    auto location = resolver->FromUncPath(L"\\\\server\\data");
    ASSERT_TRUE(location.has_value());
    EXPECT_EQ(shellLinkResolver->ResolveCount(), 0u);

    EXPECT_EQ(location->ShortcutPath(), container / L"Data");
    EXPECT_EQ(shellLinkResolver->ResolveCount(), 1u);

    EXPECT_EQ(location->ShortcutPath(), container / L"Data");
    EXPECT_TRUE(location->IsMapped());
    EXPECT_EQ(*location->ShareLabel(), L"Data"s);
    EXPECT_EQ(shellLinkResolver->ResolveCount(), 1u);
}

TEST_F(NetworkLocationResolverTest, ShortcutSearchIgnoresCase)
{
    AddShortcut(L"Other", L"\\\\server\\other");
    AddShortcut(L"Data", L"\\\\SERVER\\DATA");

    auto location = resolver->FromUncPath(L"\\\\server\\data");
    ASSERT_TRUE(location.has_value());
    EXPECT_EQ(location->ShortcutPath(), container / L"Data");
}

TEST_F(NetworkLocationResolverTest, FirstMatchingShortcutWins)
{
    AddShortcut(L"First", L"\\\\server\\data");
    AddShortcut(L"Second", L"\\\\server\\data");

    auto location = resolver->FromUncPath(L"\\\\server\\data");
    ASSERT_TRUE(location.has_value());
    EXPECT_EQ(location->ShortcutPath(), container / L"First");
}

TEST_F(NetworkLocationResolverTest, PlaceholderWhenNoShortcutMatches)
{
    AddShortcut(L"Other", L"\\\\server\\other");

    auto location = resolver->FromUncPath(L"\\\\192.168.100.1\\data");
    ASSERT_TRUE(location.has_value());

    EXPECT_EQ(location->ShortcutPath(), container / L"data (192.168.100.1)");
    EXPECT_EQ(location->ShortcutPath(), resolver->PlaceholderEntry(L"192.168.100.1", L"data"));
    EXPECT_FALSE(location->IsMapped());
    EXPECT_FALSE(resolver->IsShortcutPresent(*location));
}

TEST_F(NetworkLocationResolverTest, PlaceholderWhenContainerIsUnavailable)
{
    shellLinkResolver->FailOpen(std::make_error_code(std::errc::permission_denied));

    auto location = resolver->FromUncPath(L"\\\\server\\data");
    ASSERT_TRUE(location.has_value());
    EXPECT_EQ(location->ShortcutPath(), container / L"data (server)");
    EXPECT_EQ(shellLinkResolver->ResolveCount(), 0u);
}

TEST_F(NetworkLocationResolverTest, FromUncPathFailures)
{
    const wchar_t* null = nullptr;
    EXPECT_EQ(resolver->FromUncPath(null).error(), NetworkLocationErrc::InvalidInput);
    EXPECT_EQ(resolver->FromUncPath(L"  ").error(), NetworkLocationErrc::InvalidInput);
    EXPECT_EQ(resolver->FromUncPath(L"\\\\onlyserver").error(), NetworkLocationErrc::MalformedUnc);
}

TEST_F(NetworkLocationResolverTest, EnumerateEmptyContainer)
{
    EXPECT_TRUE(resolver->EnumerateAll().empty());
}

TEST_F(NetworkLocationResolverTest, EnumerateUnavailableContainer)
{
    AddShortcut(L"Data", L"\\\\server\\data");
    shellLinkResolver->FailOpen(std::make_error_code(std::errc::permission_denied));

    EXPECT_TRUE(resolver->EnumerateAll().empty());
}

TEST_F(NetworkLocationResolverTest, EnumerateMissingContainer)
{
    auto other = NetworkLocationResolver::Create(fileSystem, shellLinkResolver, fs::path(L"missing"));
    EXPECT_TRUE(other->EnumerateAll().empty());
}

TEST_F(NetworkLocationResolverTest, EnumerateSkipsInvalidEntries)
{
    AddShortcut(L"Data", L"\\\\server\\data");
    AddShortcut(L"Local", L"C:\\Users\\foo\\Documents");
    AddShortcut(L"NoShare", L"\\\\onlyserver");
    AddShortcut(L"Blank", L"   ");
    AddShortcut(L"Public", L"\\\\nas\\public\\docs");

    fileSystem->AddEntry(container / L"NotALink");

    fileSystem->AddEntry(container / L"Broken");
    shellLinkResolver->SetError(L"Broken", std::make_error_code(std::errc::io_error));

    const auto locations = resolver->EnumerateAll();
    ASSERT_EQ(locations.size(), 2u);

    EXPECT_EQ(locations[0].Name(), L"\\\\server\\data"s);
    EXPECT_EQ(locations[1].Name(), L"\\\\nas\\public"s);
    EXPECT_EQ(locations[1].ShareName(), L"public"s);
}

TEST_F(NetworkLocationResolverTest, EnumeratedLocationsKnowTheirShortcut)
{
    AddShortcut(L"Data", L"\\\\server\\data");

    const auto locations = resolver->EnumerateAll();
    ASSERT_EQ(locations.size(), 1u);

    const auto resolveCount = shellLinkResolver->ResolveCount();
    EXPECT_EQ(locations[0].ShortcutPath(), container / L"Data");
    EXPECT_TRUE(locations[0].IsMapped());
    EXPECT_EQ(shellLinkResolver->ResolveCount(), resolveCount);
}

TEST_F(NetworkLocationResolverTest, SetLabelRoundTrip)
{
    AddShortcut(L"Data", L"\\\\server\\data");

    auto location = resolver->FromUncPath(L"\\\\server\\data");
    ASSERT_TRUE(location.has_value());

    auto rv = location->SetShareLabel(L"Team data");
    ASSERT_TRUE(rv.has_value());
    EXPECT_EQ(fileSystem->RenameCount(), 1u);

    auto label = location->ShareLabel();
    ASSERT_TRUE(label.has_value());
    EXPECT_EQ(*label, L"Team data"s);
    EXPECT_EQ(location->ShortcutPath(), container / L"Team data");
    EXPECT_TRUE(location->IsMapped());

    // A new search finds the renamed entry
    auto other = resolver->FromUncPath(L"\\\\server\\data");
    ASSERT_TRUE(other.has_value());
    EXPECT_EQ(other->ShortcutPath(), container / L"Team data");

    auto otherLabel = other->ShareLabel();
    ASSERT_TRUE(otherLabel.has_value());
    EXPECT_EQ(*otherLabel, L"Team data"s);
}

TEST_F(NetworkLocationResolverTest, SetLabelKeepsShellLinkExtension)
{
    AddShellLinkFile(L"Public.lnk", L"\\\\nas\\public");

    auto location = resolver->FromUncPath(L"\\\\nas\\public");
    ASSERT_TRUE(location.has_value());

    auto label = location->ShareLabel();
    ASSERT_TRUE(label.has_value());
    EXPECT_EQ(*label, L"Public"s);

    ASSERT_TRUE(location->SetShareLabel(L"Team").has_value());
    EXPECT_EQ(location->ShortcutPath(), container / L"Team.lnk");
    EXPECT_FALSE(fileSystem->Exists(container / L"Team"));

    auto other = resolver->FromUncPath(L"\\\\nas\\public");
    ASSERT_TRUE(other.has_value());
    EXPECT_TRUE(other->IsMapped());
    EXPECT_EQ(other->ShortcutPath(), container / L"Team.lnk");

    auto otherLabel = other->ShareLabel();
    ASSERT_TRUE(otherLabel.has_value());
    EXPECT_EQ(*otherLabel, L"Team"s);
}

TEST_F(NetworkLocationResolverTest, FolderShortcutLabelKeepsItsName)
{
    AddShortcut(L"Archive.lnk", L"\\\\nas\\archive");

    auto location = resolver->FromUncPath(L"\\\\nas\\archive");
    ASSERT_TRUE(location.has_value());
    EXPECT_EQ(*location->ShareLabel(), L"Archive.lnk"s);

    ASSERT_TRUE(location->SetShareLabel(L"Old archive").has_value());
    EXPECT_EQ(location->ShortcutPath(), container / L"Old archive");
}

TEST_F(NetworkLocationResolverTest, SetLabelWithoutShortcut)
{
    auto location = resolver->FromUncPath(L"\\\\server\\data");
    ASSERT_TRUE(location.has_value());

    auto rv = location->SetShareLabel(L"Team data");
    ASSERT_TRUE(rv.has_error());
    EXPECT_EQ(rv.error(), NetworkLocationErrc::NotFound);
    EXPECT_EQ(fileSystem->RenameCount(), 0u);
    EXPECT_EQ(location->ShortcutPath(), container / L"data (server)");

    auto label = location->ShareLabel();
    ASSERT_TRUE(label.has_error());
    EXPECT_EQ(label.error(), NetworkLocationErrc::NotFound);
}

TEST_F(NetworkLocationResolverTest, SetLabelInvalid)
{
    AddShortcut(L"Data", L"\\\\server\\data");

    auto location = resolver->FromUncPath(L"\\\\server\\data");
    ASSERT_TRUE(location.has_value());

    for (const auto label : {L"", L"   ", L"a\\b", L"a/b"})
    {
        auto rv = location->SetShareLabel(label);
        ASSERT_TRUE(rv.has_error());
        EXPECT_EQ(rv.error(), NetworkLocationErrc::InvalidInput);
    }

    EXPECT_EQ(fileSystem->RenameCount(), 0u);
    EXPECT_EQ(*location->ShareLabel(), L"Data"s);
}

TEST_F(NetworkLocationResolverTest, SetLabelRenameFailure)
{
    AddShortcut(L"Data", L"\\\\server\\data");
    fileSystem->FailRename(std::make_error_code(std::errc::permission_denied));

    auto location = resolver->FromUncPath(L"\\\\server\\data");
    ASSERT_TRUE(location.has_value());

    const auto errorCount = helper.logger().errorCount();

    auto rv = location->SetShareLabel(L"Team data");
    ASSERT_TRUE(rv.has_error());
    EXPECT_EQ(rv.error(), NetworkLocationErrc::IOFailure);
    EXPECT_EQ(helper.logger().errorCount(), errorCount + 1);

    EXPECT_EQ(location->ShortcutPath(), container / L"Data");
    EXPECT_EQ(*location->ShareLabel(), L"Data"s);
}

TEST_F(NetworkLocationResolverTest, SetLabelOnExistingName)
{
    AddShortcut(L"Data", L"\\\\server\\data");
    AddShortcut(L"Other", L"\\\\server\\other");

    auto location = resolver->FromUncPath(L"\\\\server\\data");
    ASSERT_TRUE(location.has_value());

    auto rv = location->SetShareLabel(L"Other");
    ASSERT_TRUE(rv.has_error());
    EXPECT_EQ(rv.error(), NetworkLocationErrc::IOFailure);
}

TEST_F(NetworkLocationResolverTest, FromRecord)
{
    NetworkLocationRecord record;
    record.shareName = L"data";
    record.serverName = L"server";
    record.rootDirectory = L"\\\\server\\data";
    record.shortcutFile = (container / L"Data").wstring();

    auto location = resolver->FromRecord(record);
    ASSERT_TRUE(location.has_value());

    EXPECT_EQ(location->Name(), L"\\\\server\\data"s);
    EXPECT_EQ(location->ShortcutPath(), container / L"Data");
    EXPECT_EQ(shellLinkResolver->ResolveCount(), 0u);
    EXPECT_EQ(location->ToRecord(), record);
}

TEST_F(NetworkLocationResolverTest, FromRecordDerivesMissingFields)
{
    AddShortcut(L"Data", L"\\\\server\\data");

    NetworkLocationRecord record;
    record.shareName = L"data";
    record.serverName = L"server";

    auto location = resolver->FromRecord(record);
    ASSERT_TRUE(location.has_value());

    EXPECT_EQ(location->Name(), L"\\\\server\\data"s);
    EXPECT_EQ(location->ShortcutPath(), container / L"Data");
}

TEST_F(NetworkLocationResolverTest, FromRecordRequiresNames)
{
    NetworkLocationRecord record;
    record.shareName = L"data";
    record.serverName = L" ";

    auto location = resolver->FromRecord(record);
    ASSERT_TRUE(location.has_error());
    EXPECT_EQ(location.error(), NetworkLocationErrc::InvalidInput);

    record.serverName = L"server";
    record.shareName.clear();

    location = resolver->FromRecord(record);
    ASSERT_TRUE(location.has_error());
    EXPECT_EQ(location.error(), NetworkLocationErrc::InvalidInput);
}

TEST_F(NetworkLocationResolverTest, LocationKeepsResolverAlive)
{
    AddShortcut(L"Data", L"\\\\server\\data");

    auto location = resolver->FromUncPath(L"\\\\server\\data");
    ASSERT_TRUE(location.has_value());

    resolver.reset();
    EXPECT_EQ(*location->ShareLabel(), L"Data"s);
}

}  // namespace Netloc::Test
