#ifndef INCLUDE_LOCKBOX_STORAGE_IAUDITREPOSITORY_HPP
#define INCLUDE_LOCKBOX_STORAGE_IAUDITREPOSITORY_HPP

#include "lockbox/crypto/ICryptoProvider.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lockbox::storage
{

struct AuditRecord final
{
    std::uint64_t sequence{};
    std::int64_t timestamp{};
    std::uint32_t kind{};
    std::string subject;
    lockbox::crypto::Digest priorHash{};
    lockbox::crypto::Digest entryHash{};
};

// Append-only store of hash-chained audit records. Failures throw std::runtime_error.
class IAuditRepository
{
public:
    IAuditRepository() = default;
    IAuditRepository(const IAuditRepository&) = delete;
    IAuditRepository& operator=(const IAuditRepository&) = delete;
    IAuditRepository(IAuditRepository&&) = delete;
    IAuditRepository& operator=(IAuditRepository&&) = delete;
    virtual ~IAuditRepository() = default;

    [[nodiscard]] virtual std::optional<AuditRecord> last() const = 0;

    // Atomic; throws AuditSequenceConflict unless record.sequence is exactly one past the stored head.
    virtual void append(const AuditRecord& record) = 0;

    [[nodiscard]] virtual std::vector<AuditRecord> readAll() const = 0;

    // Most recent `limit` records in ascending sequence order.
    [[nodiscard]] virtual std::vector<AuditRecord> readLatest(std::size_t limit) const = 0;
};

} // namespace lockbox::storage

#endif // INCLUDE_LOCKBOX_STORAGE_IAUDITREPOSITORY_HPP
