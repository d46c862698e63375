#include <gtest/gtest.h>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include "crypto/error.hpp"
#include "ledger_test_utils.hpp"
#include "wallet/error.hpp"

using namespace Tessera;
using namespace Tessera::Wallet;
using Tessera::Wallet::Testing::LedgerFixture;
using Tessera::Wallet::Testing::make_address;

class LedgerTest : public LedgerFixture { };

TEST_F(LedgerTest, ExposesConfiguration)
{
    EXPECT_EQ(ledger->placement(), Crypto::KeyPlacement::PublicKeyOnG1);
    EXPECT_EQ(ledger->governance(), GovernanceMode::Threshold);
    EXPECT_EQ(ledger->threshold(), T);
    EXPECT_EQ(ledger->nonce(), 0u);
    EXPECT_EQ(ledger->operation_count(), 0u);

    const auto& apk = scheme->aggregated_public_key();
    EXPECT_EQ(ledger->aggregated_public_key(), Bytes(apk.begin(), apk.end()));
}

TEST_F(LedgerTest, EndToEndThreeOfFive)
{
    auto req = request(0, "setFee(30)");
    Hash h = submit_one(req);
    EXPECT_EQ(ledger->status(h), OperationStatus::Pending);
    EXPECT_EQ(ledger->nonce(), 1u);

    auto res = verify_one(h, sign(h, { 0, 2, 4 }), signer_keys({ 0, 2, 4 }));
    ASSERT_TRUE(res.has_value()) << res.error().message();
    ASSERT_EQ(res->size(), 1u);
    EXPECT_TRUE((*res)[0]);
    EXPECT_EQ(ledger->status(h), OperationStatus::Approved);

    clock.advance(2);
    auto err = ledger->execute(admin, std::vector<Hash> { h });
    EXPECT_FALSE(err) << err.message();
    EXPECT_EQ(ledger->status(h), OperationStatus::Executed);

    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].operation, h);
    EXPECT_EQ(calls[0].target, target);
    EXPECT_EQ(calls[0].value, req.value);
    EXPECT_EQ(calls[0].gas_limit, req.gas_limit);
    EXPECT_EQ(calls[0].payload, Crypto::Testing::to_bytes("setFee(30)"));

    const Operation* op = ledger->operation(h);
    ASSERT_NE(op, nullptr);
    EXPECT_EQ(op->signer_set, signer_keys({ 0, 2, 4 }));
    EXPECT_EQ(op->nonce, 0u);
}

TEST_F(LedgerTest, SubmitValidatesEachField)
{
    struct Case {
        const char* name;
        std::function<void(OperationRequest&)> tweak;
        bool reseal;
        Wallet::Error expected;
    };

    const Timestamp now = clock.now();
    const std::vector<Case> cases {
        { "zero target", [](auto& r) { r.target = {}; }, true, Wallet::Error::ZeroTarget },
        { "empty window", [](auto& r) { r.expiration_time = r.effective_time; }, true, Wallet::Error::InvalidTimeWindow },
        { "already expired", [now](auto& r) { r.effective_time = now - 10; r.expiration_time = now; }, true,
            Wallet::Error::OperationExpired },
        { "gas", [](auto& r) { r.gas_limit = MIN_GAS - 1; }, true, Wallet::Error::GasLimitTooLow },
        { "nonce", [](auto& r) { r.nonce = 1; }, true, Wallet::Error::NonceMismatch },
        { "zero check code", [](auto& r) { r.hash_check_code = {}; }, false, Wallet::Error::ZeroHashCheckCode },
        { "wrong check code", [](auto& r) { r.hash_check_code[0] ^= 0x01; }, false,
            Wallet::Error::HashCheckCodeMismatch },
        { "payload", [](auto& r) { r.payload.assign(MAX_PAYLOAD + 1, 0xee); }, true, Wallet::Error::PayloadTooLarge },
    };

    for (const auto& c : cases) {
        auto r = request(0);
        c.tweak(r);
        if (c.reseal)
            seal(r);
        std::vector<OperationRequest> batch { r };
        auto res = ledger->submit(admin, batch);
        ASSERT_FALSE(res.has_value()) << c.name;
        EXPECT_EQ(res.error(), c.expected) << c.name << ": " << res.error().message();
    }

    EXPECT_EQ(ledger->nonce(), 0u);
    EXPECT_EQ(ledger->operation_count(), 0u);
}

TEST_F(LedgerTest, MinimumGasAndPayloadAreInclusive)
{
    auto r = request(0);
    r.gas_limit = MIN_GAS;
    r.payload.assign(MAX_PAYLOAD, 0x01);
    seal(r);
    Hash h = submit_one(r);
    EXPECT_EQ(ledger->status(h), OperationStatus::Pending);
}

TEST_F(LedgerTest, NonceAdvancesPerOperation)
{
    std::vector<OperationRequest> batch { request(0, "a()"), request(1, "b()"), request(2, "c()") };
    auto hashes = ledger->submit(admin, batch);
    ASSERT_TRUE(hashes.has_value()) << hashes.error().message();
    ASSERT_EQ(hashes->size(), 3u);
    EXPECT_EQ(ledger->nonce(), 3u);
    EXPECT_EQ(ledger->operation_count(), 3u);
    for (size_t i = 0; i < 3; ++i) {
        EXPECT_EQ((*hashes)[i], hash_of(batch[i]));
        EXPECT_EQ(ledger->operation((*hashes)[i])->nonce, i);
    }
}

TEST_F(LedgerTest, ResubmissionFailsWithOperationExists)
{
    auto r = request(0);
    submit_one(r);

    std::vector<OperationRequest> again { r };
    auto res = ledger->submit(admin, again);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), Wallet::Error::OperationExists);

    std::vector<OperationRequest> twice { request(1), request(1) };
    auto dup = ledger->submit(admin, twice);
    ASSERT_FALSE(dup.has_value());
    EXPECT_EQ(dup.error(), Wallet::Error::OperationExists);
    EXPECT_EQ(ledger->nonce(), 1u);
}

TEST_F(LedgerTest, FailedBatchLeavesLedgerUntouched)
{
    auto good = request(0, "first()");
    auto bad = request(5, "second()");
    std::vector<OperationRequest> batch { good, bad };

    auto res = ledger->submit(admin, batch);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), Wallet::Error::NonceMismatch);
    EXPECT_EQ(ledger->nonce(), 0u);
    EXPECT_EQ(ledger->operation_count(), 0u);
    EXPECT_EQ(ledger->status(hash_of(good)), OperationStatus::None);

    // The same good operation is still accepted afterwards.
    submit_one(good);
    EXPECT_EQ(ledger->status(hash_of(good)), OperationStatus::Pending);
}

TEST_F(LedgerTest, InlineSignatureApprovesOnSubmit)
{
    auto r = request(0);
    Hash h = hash_of(r);
    r.signature = sign(h, { 1, 2, 3 });
    r.signers = signer_keys({ 1, 2, 3 });
    submit_one(r);
    EXPECT_EQ(ledger->status(h), OperationStatus::Approved);

    auto weak = request(1);
    Hash wh = hash_of(weak);
    weak.signature = sign(wh, { 1, 2 });
    weak.signers = signer_keys({ 1, 2 });
    submit_one(weak);
    EXPECT_EQ(ledger->status(wh), OperationStatus::Pending);
    EXPECT_EQ(ledger->nonce(), 2u);
}

TEST_F(LedgerTest, InlineSignatureWithStrangerAbortsSubmit)
{
    auto r = request(0);
    r.signature = sign(hash_of(r), { 0, 1, 2 });
    r.signers = signer_keys({ 0, 1 });
    auto stranger = signer.public_key(Crypto::Testing::random_secret_key());
    ASSERT_TRUE(stranger.has_value());
    r.signers.emplace_back(stranger->begin(), stranger->end());

    std::vector<OperationRequest> batch { r };
    auto res = ledger->submit(admin, batch);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), Crypto::Error::UnrecognizedSigner);
    EXPECT_EQ(ledger->nonce(), 0u);
}

TEST_F(LedgerTest, TwoSignersAreRejected)
{
    Hash h = submit_one(request(0));
    auto res = verify_one(h, sign(h, { 3, 4 }), signer_keys({ 3, 4 }));
    ASSERT_TRUE(res.has_value());
    EXPECT_FALSE((*res)[0]);
    EXPECT_EQ(ledger->status(h), OperationStatus::Rejected);
}

TEST_F(LedgerTest, WrongSignatureIsRejected)
{
    Hash h = submit_one(request(0));
    Hash other = hash_of(request(7));
    auto res = verify_one(h, sign(other, { 0, 1, 2 }), signer_keys({ 0, 1, 2 }));
    ASSERT_TRUE(res.has_value());
    EXPECT_FALSE((*res)[0]);
    EXPECT_EQ(ledger->status(h), OperationStatus::Rejected);
}

TEST_F(LedgerTest, MalformedSignatureIsRejected)
{
    Hash h1 = submit_one(request(0, "x()"));
    Hash h2 = submit_one(request(1, "y()"));

    Bytes short_sig(10, 0x42);
    Bytes garbage = sign(h2, { 0, 1, 2 });
    garbage[0] = 0xff;

    std::vector<Hash> hashes { h1, h2 };
    std::vector<Bytes> sigs { short_sig, garbage };
    std::vector<std::vector<Bytes>> sets { signer_keys({ 0, 1, 2 }), signer_keys({ 0, 1, 2 }) };
    auto res = ledger->verify(admin, hashes, sigs, sets);
    ASSERT_TRUE(res.has_value()) << res.error().message();
    EXPECT_EQ(*res, (std::vector<bool> { false, false }));
    EXPECT_EQ(ledger->status(h1), OperationStatus::Rejected);
    EXPECT_EQ(ledger->status(h2), OperationStatus::Rejected);
}

TEST_F(LedgerTest, VerifyIsSingleShot)
{
    Hash h = approved(request(0));

    auto again = verify_one(h, sign(h, { 0, 1, 2 }), signer_keys({ 0, 1, 2 }));
    ASSERT_TRUE(again.has_value());
    EXPECT_FALSE((*again)[0]);
    EXPECT_EQ(ledger->status(h), OperationStatus::Approved);

    Hash r = submit_one(request(1));
    auto failed = verify_one(r, sign(r, { 0 }), signer_keys({ 0 }));
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(ledger->status(r), OperationStatus::Rejected);

    // A rejected operation cannot be revived with a good signature.
    auto retry = verify_one(r, sign(r, { 0, 1, 2 }), signer_keys({ 0, 1, 2 }));
    ASSERT_TRUE(retry.has_value());
    EXPECT_FALSE((*retry)[0]);
    EXPECT_EQ(ledger->status(r), OperationStatus::Rejected);

    auto unknown = verify_one(Hash {}, sign(r, { 0, 1, 2 }), signer_keys({ 0, 1, 2 }));
    ASSERT_TRUE(unknown.has_value());
    EXPECT_FALSE((*unknown)[0]);
}

TEST_F(LedgerTest, SignerErrorsAbortVerify)
{
    Hash h1 = submit_one(request(0, "x()"));
    Hash h2 = submit_one(request(1, "y()"));

    auto stranger = signer.public_key(Crypto::Testing::random_secret_key());
    ASSERT_TRUE(stranger.has_value());
    auto with_stranger = signer_keys({ 0, 1 });
    with_stranger.emplace_back(stranger->begin(), stranger->end());

    std::vector<Hash> hashes { h1, h2 };
    std::vector<Bytes> sigs { sign(h1, { 0, 1, 2 }), sign(h2, { 0, 1, 2 }) };
    std::vector<std::vector<Bytes>> sets { signer_keys({ 0, 1, 2 }), with_stranger };

    auto res = ledger->verify(admin, hashes, sigs, sets);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), Crypto::Error::UnrecognizedSigner);
    // The first item was valid but nothing is applied.
    EXPECT_EQ(ledger->status(h1), OperationStatus::Pending);
    EXPECT_EQ(ledger->status(h2), OperationStatus::Pending);

    sets[1] = signer_keys({ 0, 1, 1 });
    auto dup = ledger->verify(admin, hashes, sigs, sets);
    ASSERT_FALSE(dup.has_value());
    EXPECT_EQ(dup.error(), Crypto::Error::DuplicateSigner);
    EXPECT_EQ(ledger->status(h1), OperationStatus::Pending);
}

TEST_F(LedgerTest, VerifyRequiresMatchingLists)
{
    Hash h = submit_one(request(0));
    std::vector<Hash> hashes { h };
    std::vector<Bytes> sigs {};
    std::vector<std::vector<Bytes>> sets { signer_keys({ 0, 1, 2 }) };

    auto res = ledger->verify(admin, hashes, sigs, sets);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), Wallet::Error::LengthMismatch);
    EXPECT_EQ(ledger->status(h), OperationStatus::Pending);
}

TEST_F(LedgerTest, ExecuteRequiresApproval)
{
    Hash h = submit_one(request(0));
    clock.advance(5);
    auto err = ledger->execute(admin, std::vector<Hash> { h });
    EXPECT_EQ(err, Wallet::Error::ExecuteUnapprovedOperation);
    EXPECT_EQ(ledger->status(h), OperationStatus::Pending);

    auto unknown = ledger->execute(admin, std::vector<Hash> { Hash {} });
    EXPECT_EQ(unknown, Wallet::Error::ExecuteUnapprovedOperation);
    EXPECT_TRUE(calls.empty());
}

TEST_F(LedgerTest, ExecuteBeforeEffectiveTimeFails)
{
    Hash h = approved(request(0));
    auto err = ledger->execute(admin, std::vector<Hash> { h });
    EXPECT_EQ(err, Wallet::Error::ExecuteUneffectiveOperation);
    EXPECT_EQ(ledger->status(h), OperationStatus::Approved);
    EXPECT_TRUE(calls.empty());

    clock.advance(1);
    EXPECT_FALSE(ledger->execute(admin, std::vector<Hash> { h }));
    EXPECT_EQ(ledger->status(h), OperationStatus::Executed);
}

TEST_F(LedgerTest, ExecuteAfterExpirationMarksExpired)
{
    Hash late = approved(request(0, "late()"));
    auto fresh_req = request(1, "fresh()");
    fresh_req.expiration_time = clock.now() + 1000;
    seal(fresh_req);
    Hash fresh = approved(fresh_req);

    clock.advance(100);
    auto err = ledger->execute(admin, std::vector<Hash> { fresh, late });
    EXPECT_EQ(err, Wallet::Error::ExecuteExpiredOperation);
    EXPECT_EQ(ledger->status(late), OperationStatus::Expired);
    EXPECT_EQ(ledger->status(fresh), OperationStatus::Approved);
    EXPECT_TRUE(calls.empty());

    // The untouched operation executes on its own.
    EXPECT_FALSE(ledger->execute(admin, std::vector<Hash> { fresh }));
    EXPECT_EQ(ledger->status(fresh), OperationStatus::Executed);

    EXPECT_EQ(ledger->execute(admin, std::vector<Hash> { late }), Wallet::Error::ExecuteUnapprovedOperation);
}

TEST_F(LedgerTest, TargetFailureIsRecorded)
{
    const Address reverting = make_address(0x66);
    ASSERT_FALSE(targets.register_target(reverting, [](const CallRequest&) {
        return make_error_code(Wallet::Error::CallReverted);
    }));

    auto bad_req = request(0, "boom()");
    bad_req.target = reverting;
    seal(bad_req);
    Hash bad = approved(bad_req);

    auto orphan_req = request(1, "nobody()");
    orphan_req.target = make_address(0x55);
    seal(orphan_req);
    Hash orphan = approved(orphan_req);

    Hash good = approved(request(2, "fine()"));

    clock.advance(1);
    auto err = ledger->execute(admin, std::vector<Hash> { bad, orphan, good });
    EXPECT_FALSE(err) << err.message();
    EXPECT_EQ(ledger->status(bad), OperationStatus::Failed);
    EXPECT_EQ(ledger->status(orphan), OperationStatus::Failed);
    EXPECT_EQ(ledger->status(good), OperationStatus::Executed);
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].operation, good);
}

TEST_F(LedgerTest, ThrowingTargetFailsAndBatchContinues)
{
    const Address throwing = make_address(0x67);
    ASSERT_FALSE(targets.register_target(throwing, [](const CallRequest&) -> std::error_code {
        throw std::runtime_error("handler exploded");
    }));

    auto first_req = request(0, "explode()");
    first_req.target = throwing;
    seal(first_req);
    Hash first = approved(first_req);
    Hash second = approved(request(1, "after()"));

    clock.advance(1);
    auto err = ledger->execute(admin, std::vector<Hash> { first, second });
    EXPECT_FALSE(err) << err.message();
    EXPECT_EQ(ledger->status(first), OperationStatus::Failed);
    EXPECT_EQ(ledger->status(second), OperationStatus::Executed);
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].operation, second);

    // The guard was released on the way out.
    submit_one(request(2));
    EXPECT_EQ(ledger->nonce(), 3u);
}

TEST_F(LedgerTest, ThrowingDispatcherFailsOperation)
{
    struct FlakyDispatcher final : CallDispatcher {
        int calls = 0;
        std::error_code call(const CallRequest&) override
        {
            if (calls++ == 0)
                throw std::runtime_error("connection lost");
            return {};
        }
    } flaky;

    auto l = OperationLedger::create(config(), roles, flaky, clock);
    ASSERT_TRUE(l.has_value()) << l.error().message();
    ledger = std::move(*l);

    Hash first = approved(request(0, "first()"));
    Hash second = approved(request(1, "second()"));

    clock.advance(1);
    EXPECT_FALSE(ledger->execute(admin, std::vector<Hash> { first, second }));
    EXPECT_EQ(flaky.calls, 2);
    EXPECT_EQ(ledger->status(first), OperationStatus::Failed);
    EXPECT_EQ(ledger->status(second), OperationStatus::Executed);

    ledger.reset();
}

TEST_F(LedgerTest, ExecuteRejectsRepeatedHash)
{
    Hash h = approved(request(0));
    clock.advance(1);
    auto err = ledger->execute(admin, std::vector<Hash> { h, h });
    EXPECT_EQ(err, Wallet::Error::ExecuteUnapprovedOperation);
    EXPECT_EQ(ledger->status(h), OperationStatus::Approved);
    EXPECT_TRUE(calls.empty());
}

TEST_F(LedgerTest, ReentrantCallsAreRefused)
{
    const Address hook = make_address(0x99);
    std::error_code inner_execute;
    std::error_code inner_submit;
    OperationStatus seen_status = OperationStatus::None;
    Hash h {};

    ASSERT_FALSE(targets.register_target(hook, [&](const CallRequest& req) {
        seen_status = ledger->status(req.operation);
        inner_execute = ledger->execute(admin, std::vector<Hash> { req.operation });
        std::vector<OperationRequest> batch { request(ledger->nonce(), "inner()") };
        auto sub = ledger->submit(admin, batch);
        inner_submit = sub ? std::error_code {} : sub.error();
        return std::error_code {};
    }));

    auto r = request(0, "hook()");
    r.target = hook;
    seal(r);
    h = approved(r);

    clock.advance(1);
    EXPECT_FALSE(ledger->execute(admin, std::vector<Hash> { h }));
    EXPECT_EQ(seen_status, OperationStatus::Executing);
    EXPECT_EQ(inner_execute, Wallet::Error::ReentrantCall);
    EXPECT_EQ(inner_submit, Wallet::Error::ReentrantCall);
    EXPECT_EQ(ledger->status(h), OperationStatus::Executed);
    EXPECT_EQ(ledger->nonce(), 1u);

    // The guard is released afterwards.
    submit_one(request(1));
    EXPECT_EQ(ledger->nonce(), 2u);
}

TEST_F(LedgerTest, EntryPointsRequireRoles)
{
    const Address outsider = make_address(0x0F);
    std::vector<OperationRequest> batch { request(0) };
    auto sub = ledger->submit(outsider, batch);
    ASSERT_FALSE(sub.has_value());
    EXPECT_EQ(sub.error(), Wallet::Error::MissingRole);

    Hash h = submit_one(request(0));

    std::vector<Hash> hashes { h };
    std::vector<Bytes> sigs { sign(h, { 0, 1, 2 }) };
    std::vector<std::vector<Bytes>> sets { signer_keys({ 0, 1, 2 }) };
    auto ver = ledger->verify(outsider, hashes, sigs, sets);
    ASSERT_FALSE(ver.has_value());
    EXPECT_EQ(ver.error(), Wallet::Error::MissingRole);
    EXPECT_EQ(ledger->status(h), OperationStatus::Pending);

    roles.grant(Role::Verifier, outsider);
    auto ok = ledger->verify(outsider, hashes, sigs, sets);
    ASSERT_TRUE(ok.has_value());
    EXPECT_TRUE((*ok)[0]);

    clock.advance(1);
    EXPECT_EQ(ledger->execute(outsider, hashes), Wallet::Error::MissingRole);
    roles.revoke(Role::Executor, admin);
    EXPECT_EQ(ledger->execute(admin, hashes), Wallet::Error::MissingRole);
    EXPECT_EQ(ledger->status(h), OperationStatus::Approved);
}

/* ---------- construction ---------- */

TEST_F(LedgerTest, CreateRejectsBadConfigurations)
{
    auto expect_failure = [&](LedgerConfig c, std::error_code expected) {
        auto l = OperationLedger::create(c, roles, targets, clock);
        ASSERT_FALSE(l.has_value());
        EXPECT_EQ(l.error(), expected) << l.error().message();
    };

    auto c = config();
    c.threshold = 0;
    expect_failure(c, Wallet::Error::InvalidThreshold);

    c = config();
    c.threshold = N + 1;
    expect_failure(c, Wallet::Error::InvalidThreshold);

    c = config();
    c.public_keys.clear();
    expect_failure(c, Wallet::Error::EmptyMemberSet);

    c = config();
    c.public_keys[0].pop_back();
    expect_failure(c, Wallet::Error::InvalidConfig);

    c = config();
    c.member_ids.pop_back();
    expect_failure(c, Wallet::Error::InvalidConfig);

    c = config();
    std::swap(c.member_ids[0], c.member_ids[1]);
    expect_failure(c, Crypto::Error::InvalidSignature);

    c = config();
    c.public_keys[1] = c.public_keys[0];
    expect_failure(c, Crypto::Error::DuplicateMember);

    c = config();
    c.public_keys[2].assign(c.public_keys[2].size(), 0);
    expect_failure(c, Crypto::Error::InvalidPublicKey);

    c = config();
    c.domain->signature_dst.assign(256, 'D');
    expect_failure(c, Wallet::Error::InvalidConfig);
}

TEST_F(LedgerTest, OperationsAreBoundToTheLedger)
{
    auto r = request(0);
    auto c = config();
    c.ledger_id[0] ^= 0x01;
    EXPECT_NE(operation_hash(c.ledger_id, r), hash_of(r));

    auto other = OperationLedger::create(c, roles, targets, clock);
    ASSERT_TRUE(other.has_value());

    // The check code sealed for this ledger does not match the other one.
    std::vector<OperationRequest> batch { r };
    auto res = (*other)->submit(admin, batch);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), Wallet::Error::HashCheckCodeMismatch);
}
