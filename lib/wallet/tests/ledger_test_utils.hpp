#pragma once

#include "crypto/blst_backend.hpp"
#include "crypto/signature.hpp"
#include "crypto/threshold/scheme.hpp"
#include "group_test_utils.hpp"
#include "wallet/access.hpp"
#include "wallet/clock.hpp"
#include "wallet/config.hpp"
#include "wallet/dispatcher.hpp"
#include "wallet/ledger.hpp"
#include "wallet/operation.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <vector>

namespace Tessera::Wallet::Testing {

inline Address make_address(Byte tag)
{
    Address a {};
    a.fill(tag);
    return a;
}

struct ReceivedCall {
    Hash operation;
    Address target;
    uint64_t value;
    uint64_t gas_limit;
    Bytes payload;
};

/**
 * Threshold ledger over five members with keys on G1, threshold three.
 * One admin account holds every role; one target records the calls it gets.
 */
class LedgerFixture : public ::testing::Test {
protected:
    using Keys = Crypto::PublicKeyOnG1;

    static constexpr size_t N = 5;
    static constexpr size_t T = 3;
    static constexpr Timestamp START = 1'700'000'000;
    static constexpr uint64_t MIN_GAS = 30000;
    static constexpr size_t MAX_PAYLOAD = 1024;

    Crypto::BlstBackend backend;
    Crypto::Domain domain = Crypto::default_domain(Crypto::KeyPlacement::PublicKeyOnG1);
    Crypto::SignatureAggregator<Keys> signer { backend, domain.signature_dst };
    Crypto::Testing::Group<Keys> group;
    std::optional<Crypto::Threshold::ThresholdScheme<Keys>> scheme;

    RoleRegistry roles;
    TargetRegistry targets;
    ManualClock clock { START };

    Address admin = make_address(0xA1);
    Address target = make_address(0x77);
    std::vector<ReceivedCall> calls;

    std::unique_ptr<OperationLedger> ledger;

    void SetUp() override
    {
        group = Crypto::Testing::make_group<Keys>(signer, domain, N);
        auto created = Crypto::Threshold::ThresholdScheme<Keys>::create(
            signer, domain, group.public_keys, group.member_ids);
        ASSERT_TRUE(created.has_value()) << created.error().message();
        scheme.emplace(std::move(*created));

        roles.grant(Role::Proposer, admin);
        roles.grant(Role::Verifier, admin);
        roles.grant(Role::Executor, admin);

        ASSERT_FALSE(targets.register_target(target, [this](const CallRequest& req) {
            calls.push_back({ req.operation, req.target, req.value, req.gas_limit,
                Bytes(req.payload.begin(), req.payload.end()) });
            return std::error_code {};
        }));

        auto l = OperationLedger::create(config(), roles, targets, clock);
        ASSERT_TRUE(l.has_value()) << l.error().message();
        ledger = std::move(*l);
    }

    LedgerConfig config() const
    {
        LedgerConfig c;
        c.placement = Crypto::KeyPlacement::PublicKeyOnG1;
        c.mode = GovernanceMode::Threshold;
        for (const auto& pk : group.public_keys)
            c.public_keys.emplace_back(pk.begin(), pk.end());
        for (const auto& id : group.member_ids)
            c.member_ids.emplace_back(id.begin(), id.end());
        c.threshold = T;
        c.min_gas_limit = MIN_GAS;
        c.max_payload_size = MAX_PAYLOAD;
        c.ledger_id = Crypto::Utils::sha256(Crypto::as_span("tessera-test-ledger"));
        c.domain = domain;
        return c;
    }

    // A request that passes every submit check; callers tweak it and reseal.
    OperationRequest request(uint64_t nonce, std::string_view payload = "ping()")
    {
        OperationRequest r;
        r.target = target;
        r.value = 5;
        r.effective_time = clock.now() + 1;
        r.expiration_time = clock.now() + 100;
        r.gas_limit = 50000;
        r.nonce = nonce;
        r.payload = Crypto::Testing::to_bytes(payload);
        seal(r);
        return r;
    }

    void seal(OperationRequest& r) const
    {
        r.hash_check_code = hash_check_code(operation_hash(ledger->ledger_id(), r));
    }

    Hash hash_of(const OperationRequest& r) const { return operation_hash(ledger->ledger_id(), r); }

    Bytes sign(const Hash& hash, const std::vector<size_t>& who)
    {
        std::vector<Keys::Signature> shares;
        for (size_t i : who) {
            auto s = scheme->sign_share(group.secret_keys[i], group.member_ids[i], hash);
            EXPECT_TRUE(s.has_value());
            shares.push_back(*s);
        }
        auto agg = scheme->aggregate(shares);
        EXPECT_TRUE(agg.has_value());
        return { agg->begin(), agg->end() };
    }

    std::vector<Bytes> signer_keys(const std::vector<size_t>& who) const
    {
        std::vector<Bytes> out;
        for (size_t i : who)
            out.emplace_back(group.public_keys[i].begin(), group.public_keys[i].end());
        return out;
    }

    Hash submit_one(const OperationRequest& r)
    {
        std::vector<OperationRequest> batch { r };
        auto hashes = ledger->submit(admin, batch);
        EXPECT_TRUE(hashes.has_value()) << hashes.error().message();
        if (!hashes || hashes->empty())
            return Hash {};
        return hashes->front();
    }

    std::expected<std::vector<bool>, std::error_code> verify_one(
        const Hash& h, const Bytes& sig, const std::vector<Bytes>& signers)
    {
        std::vector<Hash> hashes { h };
        std::vector<Bytes> sigs { sig };
        std::vector<std::vector<Bytes>> sets { signers };
        return ledger->verify(admin, hashes, sigs, sets);
    }

    // Submits at the current nonce and approves with members 0, 1, 2.
    Hash approved(const OperationRequest& r)
    {
        Hash h = submit_one(r);
        auto res = verify_one(h, sign(h, { 0, 1, 2 }), signer_keys({ 0, 1, 2 }));
        EXPECT_TRUE(res.has_value());
        EXPECT_EQ(ledger->status(h), OperationStatus::Approved);
        return h;
    }
};

} // namespace Tessera::Wallet::Testing
