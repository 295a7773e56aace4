#ifndef LOCKBOX_TESTS_TEST_UTILS_FAKEREPOSITORIES_HPP
#define LOCKBOX_TESTS_TEST_UTILS_FAKEREPOSITORIES_HPP

#include "lockbox/storage/IAuditRepository.hpp"
#include "lockbox/storage/IVaultRepository.hpp"
#include "lockbox/storage/StorageErrors.hpp"
#include <filesystem>
#include <gmock/gmock.h>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

namespace lockbox::test_utils
{

// Audit rows kept in a plain vector so tests can tamper with them directly.
class InMemoryAuditRepository final : public lockbox::storage::IAuditRepository
{
public:
    [[nodiscard]] std::optional<lockbox::storage::AuditRecord> last() const override
    {
        if (rows.empty())
        {
            return std::nullopt;
        }
        return rows.back();
    }

    void append(const lockbox::storage::AuditRecord& record) override
    {
        const std::uint64_t head{ rows.empty() ? 0U : rows.back().sequence };
        if (record.sequence != head + 1U)
        {
            throw lockbox::storage::AuditSequenceConflict("sequence conflict");
        }
        rows.push_back(record);
    }

    [[nodiscard]] std::vector<lockbox::storage::AuditRecord> readAll() const override
    {
        return rows;
    }

    [[nodiscard]] std::vector<lockbox::storage::AuditRecord> readLatest(std::size_t limit) const override
    {
        const std::size_t skip{ rows.size() > limit ? rows.size() - limit : 0U };
        return { rows.begin() + static_cast<std::ptrdiff_t>(skip), rows.end() };
    }

    std::vector<lockbox::storage::AuditRecord> rows;
};

class MockVaultRepository : public lockbox::storage::IVaultRepository
{
public:
    MOCK_METHOD(const std::filesystem::path&, location, (), (const, noexcept, override));
    MOCK_METHOD(bool, exists, (), (const, override));
    MOCK_METHOD(std::vector<std::uint8_t>, load, (), (const, override));
    MOCK_METHOD(void, store, (std::span<const std::uint8_t> bytes), (override));
};

class MockAuditRepository : public lockbox::storage::IAuditRepository
{
public:
    MOCK_METHOD(std::optional<lockbox::storage::AuditRecord>, last, (), (const, override));
    MOCK_METHOD(void, append, (const lockbox::storage::AuditRecord& record), (override));
    MOCK_METHOD(std::vector<lockbox::storage::AuditRecord>, readAll, (), (const, override));
    MOCK_METHOD(std::vector<lockbox::storage::AuditRecord>, readLatest, (std::size_t limit), (const, override));
};

// Vault bytes held in memory; `failStores` makes the next writes throw like a full disk.
class InMemoryVaultRepository final : public lockbox::storage::IVaultRepository
{
public:
    explicit InMemoryVaultRepository(std::filesystem::path location) : m_location{ std::move(location) }
    {
    }

    [[nodiscard]] const std::filesystem::path& location() const noexcept override
    {
        return m_location;
    }

    [[nodiscard]] bool exists() const override
    {
        return bytes.has_value();
    }

    [[nodiscard]] std::vector<std::uint8_t> load() const override
    {
        if (!bytes)
        {
            throw lockbox::storage::VaultNotFound("not found");
        }
        return *bytes;
    }

    void store(std::span<const std::uint8_t> data) override
    {
        if (failStores)
        {
            throw std::runtime_error("disk full");
        }
        bytes.emplace(data.begin(), data.end());
    }

    std::optional<std::vector<std::uint8_t>> bytes;
    bool failStores{ false };

private:
    std::filesystem::path m_location;
};

} // namespace lockbox::test_utils

#endif // LOCKBOX_TESTS_TEST_UTILS_FAKEREPOSITORIES_HPP
