#ifndef INCLUDE_LOCKBOX_STORAGE_FILE_FILEVAULTREPOSITORYFACTORY_HPP
#define INCLUDE_LOCKBOX_STORAGE_FILE_FILEVAULTREPOSITORYFACTORY_HPP

#include "lockbox/storage/IVaultRepository.hpp"
#include <filesystem>
#include <memory>

namespace lockbox::storage::file
{

[[nodiscard]] std::unique_ptr<lockbox::storage::IVaultRepository>
makeFileVaultRepository(const std::filesystem::path& vaultPath);

} // namespace lockbox::storage::file

#endif // INCLUDE_LOCKBOX_STORAGE_FILE_FILEVAULTREPOSITORYFACTORY_HPP
