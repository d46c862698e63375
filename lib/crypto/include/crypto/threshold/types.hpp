#pragma once

#include "crypto/types.hpp"

namespace Tessera::Crypto::Threshold {

/**
 * @struct MemberRecord
 * @brief Per-member setup data, immutable once the scheme is built.
 *
 * weight is bound to the whole member set, helper_point = weight * H(weight)
 * and id_point is the membership key issued by the group for this member.
 */
template <Placement Keys>
struct MemberRecord {
    using PublicKey = typename Keys::PublicKey;
    using Signature = typename Keys::Signature;

    size_t index {};
    PublicKey public_key {};
    ScalarBytes weight {};
    Signature helper_point {};
    Signature id_point {};
};

} // namespace Tessera::Crypto::Threshold
