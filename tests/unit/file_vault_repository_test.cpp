#include "lockbox/storage/StorageErrors.hpp"
#include "lockbox/storage/file/FileVaultRepositoryFactory.hpp"
#include "test_utils/TestUtils.hpp"
#include <filesystem>
#include <gtest/gtest.h>
#include <vector>

TEST(FileVaultRepository, MissingFileReportsNotFound)
{
    const lockbox::test_utils::TempDirGuard dir{ lockbox::test_utils::makeSecureTempDir("file_repo_missing_") };
    ASSERT_FALSE(dir.path().empty());

    auto repo{ lockbox::storage::file::makeFileVaultRepository(dir.path() / "vault.lbx") };
    EXPECT_FALSE(repo->exists());
    EXPECT_THROW((void)repo->load(), lockbox::storage::VaultNotFound);
}

TEST(FileVaultRepository, StoreThenLoadRoundTrips)
{
    const lockbox::test_utils::TempDirGuard dir{ lockbox::test_utils::makeSecureTempDir("file_repo_roundtrip_") };
    ASSERT_FALSE(dir.path().empty());

    auto repo{ lockbox::storage::file::makeFileVaultRepository(dir.path() / "vault.lbx") };
    const std::vector<std::uint8_t> first{ 1U, 2U, 3U };
    const std::vector<std::uint8_t> second{ 9U, 8U };

    repo->store(first);
    EXPECT_TRUE(repo->exists());
    EXPECT_EQ(repo->load(), first);

    repo->store(second);
    EXPECT_EQ(repo->load(), second);
}

TEST(FileVaultRepository, StoreLeavesNoTempFilesBehind)
{
    const lockbox::test_utils::TempDirGuard dir{ lockbox::test_utils::makeSecureTempDir("file_repo_tmp_") };
    ASSERT_FALSE(dir.path().empty());

    auto repo{ lockbox::storage::file::makeFileVaultRepository(dir.path() / "vault.lbx") };
    repo->store(std::vector<std::uint8_t>{ 1U });
    repo->store(std::vector<std::uint8_t>{ 2U });

    std::size_t entries{};
    for ([[maybe_unused]] const auto& entry : std::filesystem::directory_iterator{ dir.path() })
    {
        ++entries;
    }
    EXPECT_EQ(entries, 1U);
}

TEST(FileVaultRepository, StoreIntoMissingDirectoryThrowsAndKeepsNothing)
{
    const lockbox::test_utils::TempDirGuard dir{ lockbox::test_utils::makeSecureTempDir("file_repo_nodir_") };
    ASSERT_FALSE(dir.path().empty());

    auto repo{ lockbox::storage::file::makeFileVaultRepository(dir.path() / "absent" / "vault.lbx") };
    EXPECT_THROW(repo->store(std::vector<std::uint8_t>{ 1U }), std::runtime_error);
    EXPECT_FALSE(repo->exists());
}
