#ifndef INCLUDE_LOCKBOX_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
#define INCLUDE_LOCKBOX_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP

#include "lockbox/crypto/ICryptoProvider.hpp"
#include <memory>

namespace lockbox::crypto::providers
{

[[nodiscard]] std::unique_ptr<lockbox::crypto::ICryptoProvider> makeNativeCryptoProvider();

} // namespace lockbox::crypto::providers

#endif // INCLUDE_LOCKBOX_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
