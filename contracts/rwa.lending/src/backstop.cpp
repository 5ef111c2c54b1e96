#include <rwa.lending/backstop.hpp>

#include <algorithm>

#include <safemath.hpp>

namespace rwalend { namespace backstop {

using namespace rwalend::safemath;

const withdrawal_request* find_request(const pool_state& pool, account_id owner) {
   auto itr = std::find_if(pool.withdrawal_queue.begin(), pool.withdrawal_queue.end(),
                           [&](const withdrawal_request& req) { return req.owner == owner; });
   return itr == pool.withdrawal_queue.end() ? nullptr : &(*itr);
}

err deposit(pool_state& pool, backstop_deposit& dep, int128 amount, uint64_t now) {
   if (amount <= 0) return err::NOT_POSITIVE;

   int128 total, dep_amount;
   RWA_TRY(total,      add(pool.backstop_total, amount))
   RWA_TRY(dep_amount, add(dep.amount, amount))

   pool.backstop_total  = total;
   dep.amount           = dep_amount;
   dep.deposited_at     = now;
   return err::NONE;
}

err queue_withdrawal(pool_state& pool, account_id owner, const backstop_deposit& dep, int128 amount, uint64_t now) {
   if (amount <= 0) return err::NOT_POSITIVE;
   if (find_request(pool, owner) != nullptr) return err::WITHDRAWAL_QUEUE_ACTIVE;
   if (amount > dep.amount) return err::INSUFFICIENT_BACKSTOP_DEPOSIT;

   pool.withdrawal_queue.push_back(withdrawal_request{ owner, amount, now });
   return err::NONE;
}

result<int128> withdraw(pool_state& pool, account_id owner, backstop_deposit& dep, uint64_t now) {
   auto itr = std::find_if(pool.withdrawal_queue.begin(), pool.withdrawal_queue.end(),
                           [&](const withdrawal_request& req) { return req.owner == owner; });
   if (itr == pool.withdrawal_queue.end()) return err::INSUFFICIENT_BACKSTOP_DEPOSIT;
   if (itr->queued_at + BACKSTOP_WITHDRAWAL_QUEUE_SECONDS > now) return err::WITHDRAWAL_QUEUE_NOT_EXPIRED;

   int128 amount = std::min(itr->amount, dep.amount);
   amount        = std::min(amount, pool.backstop_total);
   if (amount <= 0) return err::INSUFFICIENT_BACKSTOP_DEPOSIT;

   dep.amount          -= amount;
   pool.backstop_total -= amount;
   pool.withdrawal_queue.erase(itr);
   return amount;
}

} } // namespace rwalend::backstop
