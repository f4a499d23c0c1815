#pragma once

#include "common.h"
#include "errors.h"
#include <mutex>
#include <string>
#include <unordered_map>

namespace voxgate {

/**
 * @brief Short-lived, single-use proof that the owner was just verified
 *
 * The id is the only field the authority trusts; owner and expiry are checked
 * against its own record, not against what the holder presents.
 */
struct VerificationToken {
    std::string id;
    std::string owner_id;
    TimePoint issued_at{};
    int64_t ttl_ms = 0;

    bool empty() const { return id.empty(); }
};

/**
 * @brief Issues and redeems verification tokens
 *
 * Thread-safe. Every redeem() consumes the token whether or not it succeeds.
 */
class TokenAuthority {
public:
    explicit TokenAuthority(int64_t ttl_ms, ClockFn clock = steady_clock_fn());

    /// Fresh random token for an owner that has just been verified
    Result<VerificationToken> issue(const std::string& owner_id);

    /**
     * @brief Consume a token
     * @return Unverified if the token is unknown, already used, expired, or
     *         was issued to someone other than expected_owner
     */
    VoidResult redeem(const VerificationToken& token, const std::string& expected_owner);

    /// Tokens issued and not yet redeemed or purged
    size_t outstanding() const;

    int64_t ttl_ms() const { return ttl_ms_; }

private:
    struct Record {
        std::string owner_id;
        TimePoint issued_at;
    };

    void purge_expired_locked(TimePoint now);

    int64_t ttl_ms_;
    ClockFn clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Record> outstanding_;
};

} // namespace voxgate
