#include "wallet/operation.hpp"

#include <algorithm>

namespace Tessera::Wallet {

namespace {

    constexpr std::string_view HASH_TAG = "TESSERA_OPERATION_V1";

    template <typename UInt>
    void append_be(Bytes& out, UInt v)
    {
        for (int shift = (sizeof(UInt) - 1) * 8; shift >= 0; shift -= 8)
            out.push_back(static_cast<Byte>(v >> shift));
    }

} // namespace

std::string_view to_string(OperationStatus status)
{
    switch (status) {
    case OperationStatus::None:
        return "NONE";
    case OperationStatus::Pending:
        return "PENDING";
    case OperationStatus::Approved:
        return "APPROVED";
    case OperationStatus::Rejected:
        return "REJECTED";
    case OperationStatus::Executing:
        return "EXECUTING";
    case OperationStatus::Executed:
        return "EXECUTED";
    case OperationStatus::Failed:
        return "FAILED";
    case OperationStatus::Expired:
        return "EXPIRED";
    }
    return "UNKNOWN";
}

Hash operation_hash(const Hash& ledger_id, const OperationRequest& request)
{
    Bytes buf;
    buf.reserve(HASH_TAG.size() + ledger_id.size() + ADDRESS_SIZE + 5 * 8 + 4 + request.payload.size());

    auto tag = Crypto::as_span(HASH_TAG);
    buf.insert(buf.end(), tag.begin(), tag.end());
    buf.insert(buf.end(), ledger_id.begin(), ledger_id.end());
    buf.insert(buf.end(), request.target.begin(), request.target.end());
    append_be(buf, request.value);
    append_be(buf, request.effective_time);
    append_be(buf, request.expiration_time);
    append_be(buf, request.gas_limit);
    append_be(buf, request.nonce);
    append_be(buf, static_cast<uint32_t>(request.payload.size()));
    buf.insert(buf.end(), request.payload.begin(), request.payload.end());

    return Crypto::Utils::sha256(buf);
}

HashCheckCode hash_check_code(const Hash& hash)
{
    HashCheckCode code {};
    std::copy(hash.end() - HASH_CHECK_CODE_SIZE, hash.end(), code.begin());
    return code;
}

} // namespace Tessera::Wallet
