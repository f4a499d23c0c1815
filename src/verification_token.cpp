#include "verification_token.h"
#include "utils.h"
#include <openssl/rand.h>

namespace voxgate {

namespace {
constexpr size_t kTokenBytes = 16;
}

TokenAuthority::TokenAuthority(int64_t ttl_ms, ClockFn clock)
    : ttl_ms_(ttl_ms), clock_(clock ? std::move(clock) : steady_clock_fn()) {}

Result<VerificationToken> TokenAuthority::issue(const std::string& owner_id) {
    unsigned char raw[kTokenBytes];
    if (RAND_bytes(raw, static_cast<int>(kTokenBytes)) != 1) {
        return make_error(ErrorType::Unknown, "RAND_bytes failed while issuing token");
    }

    VerificationToken token;
    token.id = utils::to_hex(raw, kTokenBytes);
    token.owner_id = owner_id;
    token.issued_at = clock_();
    token.ttl_ms = ttl_ms_;

    std::lock_guard<std::mutex> lock(mutex_);
    purge_expired_locked(token.issued_at);
    outstanding_[token.id] = Record{owner_id, token.issued_at};
    return token;
}

VoidResult TokenAuthority::redeem(const VerificationToken& token, const std::string& expected_owner) {
    if (token.empty()) {
        return make_unverified_error("no verification token presented");
    }

    Record record;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = outstanding_.find(token.id);
        if (it == outstanding_.end()) {
            return make_unverified_error("verification token is unknown or already used");
        }
        record = it->second;
        outstanding_.erase(it);
    }

    int64_t age_ms = ms_between(record.issued_at, clock_());
    if (age_ms > ttl_ms_) {
        return make_unverified_error("verification token expired " +
                                     std::to_string(age_ms - ttl_ms_) + " ms ago");
    }
    if (record.owner_id != expected_owner) {
        return make_unverified_error("verification token was issued to a different owner");
    }
    return {};
}

size_t TokenAuthority::outstanding() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outstanding_.size();
}

void TokenAuthority::purge_expired_locked(TimePoint now) {
    for (auto it = outstanding_.begin(); it != outstanding_.end();) {
        if (ms_between(it->second.issued_at, now) > ttl_ms_) {
            it = outstanding_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace voxgate
