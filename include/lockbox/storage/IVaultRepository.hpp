#ifndef INCLUDE_LOCKBOX_STORAGE_IVAULTREPOSITORY_HPP
#define INCLUDE_LOCKBOX_STORAGE_IVAULTREPOSITORY_HPP

#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace lockbox::storage
{

// Byte-level persistence of a single vault file. Implementations throw VaultNotFound when the file is
// absent and std::runtime_error on any other I/O failure.
class IVaultRepository
{
public:
    IVaultRepository() = default;
    IVaultRepository(const IVaultRepository&) = delete;
    IVaultRepository& operator=(const IVaultRepository&) = delete;
    IVaultRepository(IVaultRepository&&) = delete;
    IVaultRepository& operator=(IVaultRepository&&) = delete;
    virtual ~IVaultRepository() = default;

    [[nodiscard]] virtual const std::filesystem::path& location() const noexcept = 0;
    [[nodiscard]] virtual bool exists() const = 0;
    [[nodiscard]] virtual std::vector<std::uint8_t> load() const = 0;

    // Replaces the file atomically: readers observe either the old or the new content, never a mix.
    virtual void store(std::span<const std::uint8_t> bytes) = 0;
};

} // namespace lockbox::storage

#endif // INCLUDE_LOCKBOX_STORAGE_IVAULTREPOSITORY_HPP
