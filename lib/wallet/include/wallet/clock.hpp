#pragma once

#include "wallet/common.hpp"

namespace Tessera::Wallet {

class Clock {
public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual Timestamp now() const = 0;
};

// Time only moves when told to.
class ManualClock final : public Clock {
public:
    explicit ManualClock(Timestamp start = 0)
        : now_(start)
    {
    }

    Timestamp now() const override { return now_; }

    void set(Timestamp t) { now_ = t; }
    void advance(Timestamp seconds) { now_ += seconds; }

private:
    Timestamp now_;
};

} // namespace Tessera::Wallet
