#include "lockbox/core/VaultStore.hpp"
#include "lockbox/core/CipherCodec.hpp"
#include "lockbox/core/Logging.hpp"
#include "lockbox/core/RecordCodec.hpp"
#include "lockbox/security/SecureRandom.hpp"
#include "lockbox/storage/StorageErrors.hpp"
#include <algorithm>
#include <exception>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace lockbox::core
{
namespace
{

using lockbox::security::SecureBuffer;
using lockbox::security::SecureString;

constexpr int g_maxIdAttempts{ 4 };

[[nodiscard]] std::span<const std::byte> passphraseBytes(const SecureString& s) noexcept
{
    return std::as_bytes(std::span<const char>{ s });
}

[[nodiscard]] std::string identityFor(const std::filesystem::path& location)
{
    std::error_code ec{};
    auto absolute{ std::filesystem::absolute(location, ec) };
    if (ec)
    {
        absolute = location;
    }
    const auto canonical{ std::filesystem::weakly_canonical(absolute, ec) };
    if (ec)
    {
        return absolute.lexically_normal().string();
    }
    return canonical.string();
}

[[nodiscard]] std::vector<CredentialRecord>::iterator findIn(std::vector<CredentialRecord>& records,
                                                             std::string_view id) noexcept
{
    return std::find_if(records.begin(), records.end(), [id](const CredentialRecord& r) { return r.id == id; });
}

} // namespace

UnlockedVault::UnlockedVault(VaultHeader header, SecureBuffer key, std::int64_t createdAt,
                             std::vector<CredentialRecord> records, std::uintmax_t fileBytes) noexcept
    : m_header{ header }, m_key{ std::move(key) }, m_createdAt{ createdAt }, m_records{ std::move(records) },
      m_fileBytes{ fileBytes }
{
}

UnlockedVault::UnlockedVault(UnlockedVault&& other) noexcept
    : m_header{ other.m_header }, m_createdAt{ other.m_createdAt }, m_fileBytes{ other.m_fileBytes }
{
    m_key.swap(other.m_key);
    m_records.swap(other.m_records);
    other.wipe();
}

UnlockedVault& UnlockedVault::operator=(UnlockedVault&& other) noexcept
{
    if (this == &other)
    {
        return *this;
    }
    wipe();
    m_header = other.m_header;
    m_createdAt = other.m_createdAt;
    m_fileBytes = other.m_fileBytes;
    m_key.swap(other.m_key);
    m_records.swap(other.m_records);
    other.wipe();
    return *this;
}

UnlockedVault::~UnlockedVault() noexcept
{
    wipe();
}

void UnlockedVault::wipe() noexcept
{
    lockbox::security::secureRelease(m_key);
    m_records.clear();
    m_header = {};
    m_createdAt = 0;
    m_fileBytes = 0U;
}

const CredentialRecord* UnlockedVault::find(std::string_view id) const noexcept
{
    const auto it{ std::find_if(m_records.begin(), m_records.end(),
                                [id](const CredentialRecord& r) { return r.id == id; }) };
    return it == m_records.end() ? nullptr : &*it;
}

VaultStore::VaultStore(lockbox::crypto::ICryptoProvider& crypto, lockbox::storage::IVaultRepository& repository,
                       AuditLog& audit, EngineConfig config, NowProvider now)
    : m_crypto{ &crypto }, m_repository{ &repository }, m_audit{ &audit }, m_config{ config },
      m_now{ std::move(now) }, m_identity{ identityFor(repository.location()) }
{
    if (!m_config.isValid())
    {
        throw std::invalid_argument("VaultStore: invalid engine configuration");
    }
}

VaultResult<bool> VaultStore::exists() const noexcept
{
    try
    {
        return m_repository->exists();
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "vault_stat_failed", e.what());
        return VaultError::StorageError;
    }
}

VaultResult<VaultHeader> VaultStore::freshHeader(std::uint32_t iterations) noexcept
{
    VaultHeader header{};
    header.kdf.iterations = iterations;
    if (!m_crypto->randomBytes(header.kdf.salt))
    {
        return VaultError::RandomFailed;
    }
    return header;
}

VaultResult<SecureBuffer> VaultStore::deriveKey(const SecureString& passphrase,
                                                const VaultHeader& header) const noexcept
{
    try
    {
        return m_crypto->deriveKey(passphraseBytes(passphrase), header.kdf);
    }
    catch (const std::invalid_argument&)
    {
        return VaultError::InvalidArgument;
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "key_derivation_failed", e.what());
        return VaultError::CryptoError;
    }
}

VaultResult<std::vector<std::uint8_t>> VaultStore::seal(ContainerKind kind, const VaultHeader& header,
                                                        std::span<const std::uint8_t> key,
                                                        const VaultContents& contents) noexcept
{
    try
    {
        const SecureBuffer plain{ encodeContents(contents) };
        const auto aad{ containerAad(kind, header) };
        const auto sealed{ sealPayload(*m_crypto, key, std::as_bytes(lockbox::security::asSpan(plain)), aad) };
        return encodeContainer(header, sealed);
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "seal_failed", e.what());
        return VaultError::CryptoError;
    }
}

VaultResult<std::monostate> VaultStore::persist(std::span<const std::uint8_t> bytes) noexcept
{
    try
    {
        m_repository->store(bytes);
        return std::monostate{};
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "vault_write_failed", e.what());
        return VaultError::StorageError;
    }
}

VaultResult<std::monostate> VaultStore::commit(UnlockedVault& vault, std::vector<CredentialRecord> records) noexcept
{
    VaultContents contents{ .createdAt = vault.m_createdAt, .records = std::move(records) };
    auto bytes{ seal(ContainerKind::VaultFile, vault.m_header, vault.key(), contents) };
    if (auto* err = std::get_if<VaultError>(&bytes))
    {
        return *err;
    }
    const auto& sealed{ std::get<std::vector<std::uint8_t>>(bytes) };
    if (auto written{ persist(sealed) }; isError(written))
    {
        return written;
    }
    vault.m_records = std::move(contents.records);
    vault.m_fileBytes = sealed.size();
    return std::monostate{};
}

VaultResult<std::monostate> VaultStore::record(AuditEventKind kind, std::string_view subject) noexcept
{
    const auto entry{ m_audit->append(kind, subject) };
    if (const auto* err = std::get_if<VaultError>(&entry))
    {
        return *err;
    }
    return std::monostate{};
}

VaultResult<std::monostate> VaultStore::create(const SecureString& passphrase) noexcept
{
    if (passphrase.empty())
    {
        return VaultError::InvalidArgument;
    }

    const std::scoped_lock lock{ m_mutex };
    const auto present{ exists() };
    if (const auto* err = std::get_if<VaultError>(&present))
    {
        return *err;
    }
    if (std::get<bool>(present))
    {
        return VaultError::AlreadyExists;
    }

    auto header{ freshHeader(m_config.kdfIterations) };
    if (const auto* err = std::get_if<VaultError>(&header))
    {
        return *err;
    }
    auto key{ deriveKey(passphrase, std::get<VaultHeader>(header)) };
    if (const auto* err = std::get_if<VaultError>(&key))
    {
        return *err;
    }

    const VaultContents contents{ .createdAt = toUnixSeconds(m_now()), .records = {} };
    const auto bytes{ seal(ContainerKind::VaultFile, std::get<VaultHeader>(header),
                           lockbox::security::asSpan(std::get<SecureBuffer>(key)), contents) };
    if (const auto* err = std::get_if<VaultError>(&bytes))
    {
        return *err;
    }
    if (auto written{ persist(std::get<std::vector<std::uint8_t>>(bytes)) }; isError(written))
    {
        return written;
    }

    log(LogLevel::Info, "vault_created", m_identity);
    return record(AuditEventKind::VaultCreated, {});
}

VaultResult<UnlockedVault> VaultStore::open(const SecureString& passphrase) noexcept
{
    if (passphrase.empty())
    {
        return VaultError::AuthenticationFailed;
    }

    const std::scoped_lock lock{ m_mutex };
    std::vector<std::uint8_t> bytes;
    try
    {
        bytes = m_repository->load();
    }
    catch (const lockbox::storage::VaultNotFound&)
    {
        return VaultError::NotFound;
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "vault_read_failed", e.what());
        return VaultError::StorageError;
    }

    const auto container{ decodeContainer(bytes) };
    if (!container)
    {
        return VaultError::AuthenticationFailed;
    }

    auto key{ deriveKey(passphrase, container->header) };
    if (const auto* err = std::get_if<VaultError>(&key))
    {
        return *err == VaultError::InvalidArgument ? VaultError::AuthenticationFailed : *err;
    }
    auto& keyBytes{ std::get<SecureBuffer>(key) };

    try
    {
        const auto aad{ containerAad(ContainerKind::VaultFile, container->header) };
        const auto plain{ openPayload(*m_crypto, lockbox::security::asSpan(keyBytes), container->sealedPayload, aad) };
        if (!plain)
        {
            return VaultError::AuthenticationFailed;
        }
        auto contents{ decodeContents(lockbox::security::asSpan(*plain)) };
        if (!contents)
        {
            return VaultError::AuthenticationFailed;
        }
        return UnlockedVault{ container->header, std::move(keyBytes), contents->createdAt,
                              std::move(contents->records), bytes.size() };
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "vault_open_failed", e.what());
        return VaultError::CryptoError;
    }
}

VaultResult<VaultSummary> VaultStore::verifyIntegrity() const noexcept
{
    const std::scoped_lock lock{ m_mutex };
    std::vector<std::uint8_t> bytes;
    try
    {
        bytes = m_repository->load();
    }
    catch (const lockbox::storage::VaultNotFound&)
    {
        return VaultError::NotFound;
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "vault_read_failed", e.what());
        return VaultError::StorageError;
    }

    const auto container{ decodeContainer(bytes) };
    if (!container)
    {
        log(LogLevel::Error, "vault_integrity_failed", m_identity);
        return VaultError::IntegrityFailure;
    }
    return VaultSummary{ .formatVersion = container->header.formatVersion,
                         .kdfIterations = container->header.kdf.iterations,
                         .fileBytes = bytes.size() };
}

VaultResult<CredentialRecord> VaultStore::add(UnlockedVault& vault, CredentialFields fields) noexcept
{
    if (!vault.isOpen())
    {
        return VaultError::SessionExpired;
    }
    if (!isValid(fields))
    {
        return VaultError::InvalidArgument;
    }

    const std::scoped_lock lock{ m_mutex };
    try
    {
        std::optional<std::string> id;
        for (int attempt{}; attempt < g_maxIdAttempts && !id; ++attempt)
        {
            id = lockbox::security::secureRandomHex(g_recordIdBytes);
            if (!id)
            {
                return VaultError::RandomFailed;
            }
            if (vault.find(*id) != nullptr)
            {
                id.reset();
            }
        }
        if (!id)
        {
            return VaultError::RandomFailed;
        }

        auto records{ vault.m_records };
        records.push_back(makeRecord(*id, std::move(fields), toUnixSeconds(m_now())));
        if (auto committed{ commit(vault, std::move(records)) }; isError(committed))
        {
            return std::get<VaultError>(committed);
        }
        if (auto audited{ record(AuditEventKind::CredentialAdded, *id) }; isError(audited))
        {
            return std::get<VaultError>(audited);
        }
        return *vault.find(*id);
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "credential_add_failed", e.what());
        return VaultError::StorageError;
    }
}

VaultResult<CredentialRecord> VaultStore::update(UnlockedVault& vault, std::string_view id,
                                                 CredentialUpdate update) noexcept
{
    if (!vault.isOpen())
    {
        return VaultError::SessionExpired;
    }
    if (!isValid(update))
    {
        return VaultError::InvalidArgument;
    }

    const std::scoped_lock lock{ m_mutex };
    try
    {
        auto records{ vault.m_records };
        const auto it{ findIn(records, id) };
        if (it == records.end())
        {
            return VaultError::NotFound;
        }
        applyUpdate(*it, std::move(update), toUnixSeconds(m_now()));
        const std::string recordId{ it->id };

        if (auto committed{ commit(vault, std::move(records)) }; isError(committed))
        {
            return std::get<VaultError>(committed);
        }
        if (auto audited{ record(AuditEventKind::CredentialUpdated, recordId) }; isError(audited))
        {
            return std::get<VaultError>(audited);
        }
        return *vault.find(recordId);
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "credential_update_failed", e.what());
        return VaultError::StorageError;
    }
}

VaultResult<std::monostate> VaultStore::remove(UnlockedVault& vault, std::string_view id) noexcept
{
    if (!vault.isOpen())
    {
        return VaultError::SessionExpired;
    }

    const std::scoped_lock lock{ m_mutex };
    try
    {
        auto records{ vault.m_records };
        const auto it{ findIn(records, id) };
        if (it == records.end())
        {
            return VaultError::NotFound;
        }
        const std::string recordId{ it->id };
        records.erase(it);

        if (auto committed{ commit(vault, std::move(records)) }; isError(committed))
        {
            return committed;
        }
        return record(AuditEventKind::CredentialDeleted, recordId);
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "credential_delete_failed", e.what());
        return VaultError::StorageError;
    }
}

VaultResult<CredentialRecord> VaultStore::get(const UnlockedVault& vault, std::string_view id) noexcept
{
    const std::scoped_lock lock{ m_mutex };
    try
    {
        const auto* found{ vault.find(id) };
        if (found == nullptr)
        {
            return VaultError::NotFound;
        }
        if (auto audited{ record(AuditEventKind::CredentialRead, found->id) }; isError(audited))
        {
            return std::get<VaultError>(audited);
        }
        return *found;
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "credential_read_failed", e.what());
        return VaultError::StorageError;
    }
}

VaultResult<std::vector<CredentialRecord>> VaultStore::list(const UnlockedVault& vault) noexcept
{
    const std::scoped_lock lock{ m_mutex };
    try
    {
        if (auto audited{ record(AuditEventKind::CredentialsListed, {}) }; isError(audited))
        {
            return std::get<VaultError>(audited);
        }
        return vault.records();
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "credential_list_failed", e.what());
        return VaultError::StorageError;
    }
}

VaultResult<std::vector<CredentialRecord>> VaultStore::search(const UnlockedVault& vault, std::string_view query,
                                                              const std::optional<Tags>& anyOfTags) noexcept
{
    const std::scoped_lock lock{ m_mutex };
    try
    {
        std::vector<CredentialRecord> out;
        for (const auto& rec : vault.records())
        {
            if (matchesQuery(rec, query, anyOfTags))
            {
                out.push_back(rec);
            }
        }
        if (auto audited{ record(AuditEventKind::CredentialsSearched, {}) }; isError(audited))
        {
            return std::get<VaultError>(audited);
        }
        return out;
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "credential_search_failed", e.what());
        return VaultError::StorageError;
    }
}

VaultResult<std::monostate> VaultStore::changePassphrase(UnlockedVault& vault, const SecureString& oldPassphrase,
                                                         const SecureString& newPassphrase) noexcept
{
    if (!vault.isOpen())
    {
        return VaultError::SessionExpired;
    }
    if (newPassphrase.empty())
    {
        return VaultError::InvalidArgument;
    }

    const std::scoped_lock lock{ m_mutex };
    auto oldKey{ deriveKey(oldPassphrase, vault.m_header) };
    if (const auto* err = std::get_if<VaultError>(&oldKey); err != nullptr && *err != VaultError::InvalidArgument)
    {
        return *err;
    }
    const auto* oldBytes{ std::get_if<SecureBuffer>(&oldKey) };
    if (oldBytes == nullptr || !lockbox::security::secureEquals(lockbox::security::asSpan(*oldBytes), vault.key()))
    {
        if (auto audited{ record(AuditEventKind::AuthFailed, "change_passphrase") }; isError(audited))
        {
            return audited;
        }
        return VaultError::AuthenticationFailed;
    }

    auto header{ freshHeader(m_config.kdfIterations) };
    if (const auto* err = std::get_if<VaultError>(&header))
    {
        return *err;
    }
    auto newKey{ deriveKey(newPassphrase, std::get<VaultHeader>(header)) };
    if (const auto* err = std::get_if<VaultError>(&newKey))
    {
        return *err;
    }
    auto& newKeyBytes{ std::get<SecureBuffer>(newKey) };

    try
    {
        const VaultContents contents{ .createdAt = vault.m_createdAt, .records = vault.m_records };
        const auto bytes{ seal(ContainerKind::VaultFile, std::get<VaultHeader>(header),
                               lockbox::security::asSpan(newKeyBytes), contents) };
        if (const auto* err = std::get_if<VaultError>(&bytes))
        {
            return *err;
        }
        const auto& sealed{ std::get<std::vector<std::uint8_t>>(bytes) };
        if (auto written{ persist(sealed) }; isError(written))
        {
            return written;
        }

        vault.m_header = std::get<VaultHeader>(header);
        lockbox::security::secureRelease(vault.m_key);
        vault.m_key.swap(newKeyBytes);
        vault.m_fileBytes = sealed.size();
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "passphrase_change_failed", e.what());
        return VaultError::StorageError;
    }

    log(LogLevel::Info, "passphrase_changed", m_identity);
    return record(AuditEventKind::PassphraseChanged, {});
}

VaultResult<std::vector<std::uint8_t>> VaultStore::exportVault(const UnlockedVault& vault,
                                                               const SecureString& exportPassphrase) noexcept
{
    if (!vault.isOpen())
    {
        return VaultError::SessionExpired;
    }
    if (exportPassphrase.empty())
    {
        return VaultError::InvalidArgument;
    }

    const std::scoped_lock lock{ m_mutex };
    auto header{ freshHeader(m_config.kdfIterations) };
    if (const auto* err = std::get_if<VaultError>(&header))
    {
        return *err;
    }
    auto key{ deriveKey(exportPassphrase, std::get<VaultHeader>(header)) };
    if (const auto* err = std::get_if<VaultError>(&key))
    {
        return *err;
    }

    try
    {
        const VaultContents contents{ .createdAt = vault.m_createdAt, .records = vault.m_records };
        auto bundle{ seal(ContainerKind::ExportBundle, std::get<VaultHeader>(header),
                          lockbox::security::asSpan(std::get<SecureBuffer>(key)), contents) };
        if (isError(bundle))
        {
            return bundle;
        }
        if (auto audited{ record(AuditEventKind::VaultExported, {}) }; isError(audited))
        {
            return std::get<VaultError>(audited);
        }
        return bundle;
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "vault_export_failed", e.what());
        return VaultError::StorageError;
    }
}

VaultResult<std::size_t> VaultStore::importVault(UnlockedVault& vault, std::span<const std::uint8_t> bundle,
                                                 const SecureString& exportPassphrase) noexcept
{
    if (!vault.isOpen())
    {
        return VaultError::SessionExpired;
    }
    if (exportPassphrase.empty())
    {
        return VaultError::InvalidArgument;
    }

    const std::scoped_lock lock{ m_mutex };
    const auto container{ decodeContainer(bundle) };
    if (!container)
    {
        log(LogLevel::Warning, "import_rejected", "malformed bundle");
        return VaultError::IntegrityFailure;
    }
    auto key{ deriveKey(exportPassphrase, container->header) };
    if (const auto* err = std::get_if<VaultError>(&key))
    {
        return *err;
    }

    try
    {
        const auto aad{ containerAad(ContainerKind::ExportBundle, container->header) };
        const auto plain{ openPayload(*m_crypto, lockbox::security::asSpan(std::get<SecureBuffer>(key)),
                                      container->sealedPayload, aad) };
        if (!plain)
        {
            log(LogLevel::Warning, "import_rejected", "authentication failed");
            return VaultError::IntegrityFailure;
        }
        auto imported{ decodeContents(lockbox::security::asSpan(*plain)) };
        if (!imported)
        {
            log(LogLevel::Error, "import_rejected", "malformed contents");
            return VaultError::IntegrityFailure;
        }

        auto merged{ vault.m_records };
        for (auto& rec : imported->records)
        {
            if (auto it{ findIn(merged, rec.id) }; it != merged.end())
            {
                *it = std::move(rec);
            }
            else
            {
                merged.push_back(std::move(rec));
            }
        }
        const std::size_t count{ imported->records.size() };

        if (auto committed{ commit(vault, std::move(merged)) }; isError(committed))
        {
            return std::get<VaultError>(committed);
        }
        if (auto audited{ record(AuditEventKind::VaultImported, {}) }; isError(audited))
        {
            return std::get<VaultError>(audited);
        }
        return count;
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "vault_import_failed", e.what());
        return VaultError::StorageError;
    }
}

VaultResult<VaultStats> VaultStore::stats(const UnlockedVault& vault, TimePoint lastActivity) const noexcept
{
    if (!vault.isOpen())
    {
        return VaultError::SessionExpired;
    }
    const std::scoped_lock lock{ m_mutex };
    return VaultStats{ .recordCount = vault.records().size(),
                       .createdAt = vault.createdAt(),
                       .lastActivityAt = toUnixSeconds(lastActivity),
                       .fileBytes = vault.fileBytes(),
                       .formatVersion = vault.header().formatVersion,
                       .kdfIterations = vault.header().kdf.iterations };
}

} // namespace lockbox::core
