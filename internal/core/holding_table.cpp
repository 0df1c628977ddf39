#include "holding_table.hpp"

#include <utility>

#include "internal/util/errors.hpp"

namespace treasury::core {

namespace {

void RequireHolder(const Address& holder, const char* role) {
  if (holder.empty()) {
    throw util::InvalidArgument(std::string(role) + " address must not be empty");
  }
}

} // namespace

HoldingTable::HoldingTable(std::string ledger_id) : ledger_id_(std::move(ledger_id)) {
}

HoldingTable::HoldingTable(std::string ledger_id, Balances balances) : ledger_id_(std::move(ledger_id)), balances_(std::move(balances)) {
}

uint64_t HoldingTable::BalanceOf(const Address& holder) const {
  const auto it = balances_.find(holder);
  return it == balances_.end() ? 0 : it->second;
}

util::Wide HoldingTable::Total() const {
  util::Wide total = 0;
  for (const auto& [_, balance] : balances_) {
    total += balance;
  }
  return total;
}

void HoldingTable::Transfer(const Address& from, const Address& to, uint64_t amount) {
  RequireHolder(from, "sender");
  RequireHolder(to, "recipient");

  const uint64_t from_balance = BalanceOf(from);
  if (from_balance < amount) {
    throw util::InsufficientBalance("holder '" + from + "' holds " + std::to_string(from_balance) + ", cannot move " + std::to_string(amount));
  }
  if (from == to || amount == 0) {
    return;
  }

  const util::Wide to_next = static_cast<util::Wide>(BalanceOf(to)) + amount;
  if (!util::FitsU64(to_next)) {
    throw util::ArithmeticOverflow("recipient balance would exceed 64 bits");
  }

  // Insert the recipient first; the sender slot already exists.
  balances_[to]   = static_cast<uint64_t>(to_next);
  balances_[from] = from_balance - amount;
}

void HoldingTable::swap(HoldingTable& other) noexcept {
  ledger_id_.swap(other.ledger_id_);
  balances_.swap(other.balances_);
}

void HoldingTable::Credit(const Address& holder, uint64_t amount) {
  RequireHolder(holder, "recipient");
  const util::Wide next = static_cast<util::Wide>(BalanceOf(holder)) + amount;
  if (!util::FitsU64(next)) {
    throw util::ArithmeticOverflow("holder balance would exceed 64 bits");
  }
  balances_[holder] = static_cast<uint64_t>(next);
}

void HoldingTable::Debit(const Address& holder, uint64_t amount) {
  RequireHolder(holder, "holder");
  const uint64_t balance = BalanceOf(holder);
  if (balance < amount) {
    throw util::InsufficientBalance("holder '" + holder + "' presented " + std::to_string(amount) + " but holds " + std::to_string(balance));
  }
  balances_[holder] = balance - amount;
}

} // namespace treasury::core
