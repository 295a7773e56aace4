#include "lockbox/storage/file/FileVaultRepositoryFactory.hpp"

#include "lockbox/security/SecureRandom.hpp"
#include "lockbox/storage/IVaultRepository.hpp"
#include "lockbox/storage/StorageErrors.hpp"
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace lockbox::storage::file
{
namespace
{

constexpr std::uintmax_t g_maxVaultFileBytes{ 256U * 1024U * 1024U };
constexpr std::size_t g_tempSuffixBytes{ 8U };

[[nodiscard]] std::filesystem::path tempPathFor(const std::filesystem::path& target)
{
    const auto suffix{ lockbox::security::secureRandomHex(g_tempSuffixBytes) };
    if (!suffix)
    {
        throw std::runtime_error("storage: CSPRNG failure");
    }
    std::filesystem::path out{ target };
    out += ".tmp-";
    out += *suffix;
    return out;
}

#if defined(_WIN32)

void writeDurably(const std::filesystem::path& path, std::span<const std::uint8_t> bytes)
{
    HANDLE h{ ::CreateFileW(path.c_str(), GENERIC_WRITE, 0, nullptr, CREATE_NEW, FILE_ATTRIBUTE_NORMAL, nullptr) };
    if (h == INVALID_HANDLE_VALUE)
    {
        throw std::runtime_error("storage: failed to create temp file");
    }
    std::size_t written{ 0U };
    bool ok{ true };
    while (ok && written < bytes.size())
    {
        DWORD chunk{};
        const auto remaining{ bytes.size() - written };
        const DWORD request{ static_cast<DWORD>(remaining > 0x40000000U ? 0x40000000U : remaining) };
        ok = ::WriteFile(h, bytes.data() + written, request, &chunk, nullptr) != 0;
        written += chunk;
    }
    ok = ok && ::FlushFileBuffers(h) != 0;
    ::CloseHandle(h);
    if (!ok)
    {
        throw std::runtime_error("storage: failed to write temp file");
    }
}

void replaceFile(const std::filesystem::path& from, const std::filesystem::path& to)
{
    if (::MoveFileExW(from.c_str(), to.c_str(), MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH) == 0)
    {
        throw std::runtime_error("storage: failed to replace vault file");
    }
}

#else

class FdGuard final
{
public:
    explicit FdGuard(int fd) noexcept : m_fd{ fd }
    {
    }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
    FdGuard(FdGuard&&) = delete;
    FdGuard& operator=(FdGuard&&) = delete;
    ~FdGuard()
    {
        if (m_fd >= 0)
        {
            (void)::close(m_fd);
        }
    }

    [[nodiscard]] int get() const noexcept
    {
        return m_fd;
    }

    // Reports close() failures, which on some filesystems are the first sign of a lost write.
    [[nodiscard]] bool close() noexcept
    {
        const int fd{ m_fd };
        m_fd = -1;
        return ::close(fd) == 0;
    }

private:
    int m_fd{ -1 };
};

void writeDurably(const std::filesystem::path& path, std::span<const std::uint8_t> bytes)
{
    FdGuard fd{ ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, S_IRUSR | S_IWUSR) };
    if (fd.get() < 0)
    {
        throw std::runtime_error("storage: failed to create temp file");
    }

    std::size_t written{ 0U };
    while (written < bytes.size())
    {
        const ssize_t n{ ::write(fd.get(), bytes.data() + written, bytes.size() - written) };
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            throw std::runtime_error("storage: failed to write temp file");
        }
        written += static_cast<std::size_t>(n);
    }
    if (::fsync(fd.get()) != 0)
    {
        throw std::runtime_error("storage: fsync failed");
    }
    if (!fd.close())
    {
        throw std::runtime_error("storage: close failed");
    }
}

void syncDirectory(const std::filesystem::path& dir)
{
    const auto target{ dir.empty() ? std::filesystem::path{ "." } : dir };
    FdGuard fd{ ::open(target.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC) };
    if (fd.get() < 0 || ::fsync(fd.get()) != 0)
    {
        throw std::runtime_error("storage: directory fsync failed");
    }
}

void replaceFile(const std::filesystem::path& from, const std::filesystem::path& to)
{
    if (::rename(from.c_str(), to.c_str()) != 0)
    {
        throw std::runtime_error("storage: failed to replace vault file");
    }
    syncDirectory(to.parent_path());
}

#endif

class FileVaultRepository final : public lockbox::storage::IVaultRepository
{
public:
    explicit FileVaultRepository(std::filesystem::path path) : m_path{ std::move(path) }
    {
    }

    [[nodiscard]] const std::filesystem::path& location() const noexcept override
    {
        return m_path;
    }

    [[nodiscard]] bool exists() const override
    {
        std::error_code ec{};
        const bool present{ std::filesystem::is_regular_file(m_path, ec) };
        if (ec && ec != std::errc::no_such_file_or_directory)
        {
            throw std::runtime_error("storage: failed to stat vault file");
        }
        return present;
    }

    [[nodiscard]] std::vector<std::uint8_t> load() const override
    {
        std::error_code ec{};
        const auto size{ std::filesystem::file_size(m_path, ec) };
        if (ec)
        {
            if (ec == std::errc::no_such_file_or_directory)
            {
                throw lockbox::storage::VaultNotFound("storage: vault file not found");
            }
            throw std::runtime_error("storage: failed to stat vault file");
        }
        if (size > g_maxVaultFileBytes)
        {
            throw std::runtime_error("storage: vault file too large");
        }

        std::ifstream in{ m_path, std::ios::binary };
        if (!in)
        {
            throw std::runtime_error("storage: failed to open vault file for reading");
        }
        std::vector<std::uint8_t> bytes(static_cast<std::size_t>(size));
        in.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (static_cast<std::size_t>(in.gcount()) != bytes.size())
        {
            throw std::runtime_error("storage: truncated read of vault file");
        }
        return bytes;
    }

    void store(std::span<const std::uint8_t> bytes) override
    {
        const auto tmp{ tempPathFor(m_path) };
        try
        {
            writeDurably(tmp, bytes);
            replaceFile(tmp, m_path);
        }
        catch (const std::exception&)
        {
            std::error_code ignored{};
            std::filesystem::remove(tmp, ignored);
            throw;
        }
    }

private:
    std::filesystem::path m_path;
};

} // namespace

std::unique_ptr<lockbox::storage::IVaultRepository> makeFileVaultRepository(const std::filesystem::path& vaultPath)
{
    return std::make_unique<FileVaultRepository>(vaultPath);
}

} // namespace lockbox::storage::file
