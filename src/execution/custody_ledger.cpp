#include <stakeline/execution/custody_ledger.hpp>

using namespace stakeline::schema;

namespace stakeline::execution {

custody_ledger::custody_ledger(journal& journal) : journal_{journal} {}

void custody_ledger::reserve(const amount_t& amount) {
  add(&custody_totals_t::pending, amount);
}

error_code custody_ledger::release(const amount_t& amount) {
  return move(&custody_totals_t::pending, &custody_totals_t::committed, amount);
}

error_code custody_ledger::refund(const amount_t& amount) {
  return subtract(&custody_totals_t::pending, amount);
}

error_code custody_ledger::retire(const amount_t& amount) {
  return move(&custody_totals_t::committed, &custody_totals_t::exited, amount);
}

error_code custody_ledger::pay_out(const amount_t& amount) {
  return subtract(&custody_totals_t::exited, amount);
}

void custody_ledger::credit(const amount_t& amount) {
  add(&custody_totals_t::held, amount);
}

error_code custody_ledger::debit(const amount_t& amount) {
  return subtract(&custody_totals_t::held, amount);
}

bool custody_ledger::balanced() const {
  return totals_.pending + totals_.exited == totals_.held;
}

void custody_ledger::restore(const custody_totals_t& totals) {
  totals_ = totals;
}

void custody_ledger::add(const field_t field, const amount_t& amount) {
  journal_.assign(totals_.*field, amount_t{totals_.*field + amount});
}

error_code custody_ledger::subtract(const field_t field, const amount_t& amount) {
  if (totals_.*field < amount) {
    return error_code::custody_underflow;
  }
  journal_.assign(totals_.*field, amount_t{totals_.*field - amount});
  return error_code::ok;
}

error_code custody_ledger::move(const field_t from,
                                const field_t to,
                                const amount_t& amount) {
  auto code = subtract(from, amount);
  if (code != error_code::ok) {
    return code;
  }
  add(to, amount);
  return error_code::ok;
}

}  // namespace stakeline::execution
