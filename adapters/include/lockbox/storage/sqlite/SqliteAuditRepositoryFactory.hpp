#ifndef INCLUDE_LOCKBOX_STORAGE_SQLITE_SQLITEAUDITREPOSITORYFACTORY_HPP
#define INCLUDE_LOCKBOX_STORAGE_SQLITE_SQLITEAUDITREPOSITORYFACTORY_HPP

#include "lockbox/storage/IAuditRepository.hpp"
#include <filesystem>
#include <memory>

namespace lockbox::storage::sqlite
{

// Opens (creating if needed) the audit database at `dbPath`.
[[nodiscard]] std::unique_ptr<lockbox::storage::IAuditRepository>
makeSqliteAuditRepository(const std::filesystem::path& dbPath);

} // namespace lockbox::storage::sqlite

#endif // INCLUDE_LOCKBOX_STORAGE_SQLITE_SQLITEAUDITREPOSITORYFACTORY_HPP
