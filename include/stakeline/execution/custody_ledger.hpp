#pragma once

#include <stakeline/execution/journal.hpp>
#include <stakeline/schema/custody_totals.hpp>
#include <stakeline/schema/error_code.hpp>

namespace stakeline::execution {

/// Aggregate stake per lifecycle phase plus the native balance in custody.
///
/// Subtractions that would underflow return `custody_underflow` and leave
/// the totals untouched. Every change is recorded in the journal.
class custody_ledger final {
 public:
  explicit custody_ledger(journal& journal);

  /// pending += amount.
  void reserve(const stakeline::schema::amount_t& amount);
  /// pending -> committed.
  stakeline::schema::error_code release(const stakeline::schema::amount_t& amount);
  /// pending -= amount.
  stakeline::schema::error_code refund(const stakeline::schema::amount_t& amount);
  /// committed -> exited.
  stakeline::schema::error_code retire(const stakeline::schema::amount_t& amount);
  /// exited -= amount.
  stakeline::schema::error_code pay_out(const stakeline::schema::amount_t& amount);

  /// held += amount.
  void credit(const stakeline::schema::amount_t& amount);
  /// held -= amount.
  stakeline::schema::error_code debit(const stakeline::schema::amount_t& amount);

  /// pending + exited == held.
  bool balanced() const;

  const stakeline::schema::custody_totals_t& totals() const { return totals_; }

  /// Replace the totals wholesale when loading persisted state.
  void restore(const stakeline::schema::custody_totals_t& totals);

 private:
  using field_t = stakeline::schema::amount_t stakeline::schema::custody_totals_t::*;

  void add(field_t field, const stakeline::schema::amount_t& amount);
  stakeline::schema::error_code subtract(field_t field,
                                         const stakeline::schema::amount_t& amount);
  stakeline::schema::error_code move(field_t from,
                                     field_t to,
                                     const stakeline::schema::amount_t& amount);

  journal& journal_;
  stakeline::schema::custody_totals_t totals_;
};

}  // namespace stakeline::execution
