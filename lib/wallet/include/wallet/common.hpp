#pragma once

#include "crypto/common.hpp"

#include <array>
#include <cstdint>

namespace Tessera::Wallet {

using Crypto::Byte;
using Crypto::Bytes;
using Crypto::BytesSpan;

constexpr size_t ADDRESS_SIZE = 20;
constexpr size_t HASH_CHECK_CODE_SIZE = 8;

using Address = std::array<Byte, ADDRESS_SIZE>;
using Hash = Crypto::Hash256;
using HashCheckCode = std::array<Byte, HASH_CHECK_CODE_SIZE>;

// Block time in seconds.
using Timestamp = uint64_t;

} // namespace Tessera::Wallet
