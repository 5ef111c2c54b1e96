#pragma once

#include <rwa.lending/rwa.lending.types.hpp>

// Backstop deposits. Withdrawals go through a queue and unlock after
// BACKSTOP_WITHDRAWAL_QUEUE_SECONDS.
namespace rwalend { namespace backstop {

err deposit(pool_state& pool, backstop_deposit& dep, int128 amount, uint64_t now);

err queue_withdrawal(pool_state& pool, account_id owner, const backstop_deposit& dep, int128 amount, uint64_t now);

/// Pays out the matured request of `owner`, bounded by the deposit and by the backstop left.
result<int128> withdraw(pool_state& pool, account_id owner, backstop_deposit& dep, uint64_t now);

/// Pending request of `owner`, or nullptr.
const withdrawal_request* find_request(const pool_state& pool, account_id owner);

} } // namespace rwalend::backstop
