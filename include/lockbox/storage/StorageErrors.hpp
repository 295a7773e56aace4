#ifndef INCLUDE_LOCKBOX_STORAGE_STORAGEERRORS_HPP
#define INCLUDE_LOCKBOX_STORAGE_STORAGEERRORS_HPP

#include <stdexcept>

namespace lockbox::storage
{

class VaultNotFound final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Thrown by the audit repository when an append does not extend the stored chain head.
class AuditSequenceConflict final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace lockbox::storage

#endif // INCLUDE_LOCKBOX_STORAGE_STORAGEERRORS_HPP
