#pragma once

#include <stakeline/execution/journal.hpp>
#include <stakeline/schema/error_code.hpp>
#include <stakeline/schema/primitives.hpp>

#include <set>
#include <vector>

namespace stakeline::execution {

/// Contract owner and the operator allow-list it administers. Operators
/// assign and finalize deposits and act as keepers for vault requests.
class authorization_policy final {
 public:
  authorization_policy(journal& journal,
                       const stakeline::schema::address_t& owner);

  const stakeline::schema::address_t& owner() const { return owner_; }
  bool is_owner(const stakeline::schema::address_t& caller) const;
  bool is_operator(const stakeline::schema::address_t& caller) const;
  std::vector<stakeline::schema::address_t> operators() const;

  /// Owner only. Returns `authorization_denied` for any other caller and
  /// `invalid_address` for the zero address.
  stakeline::schema::error_code set_operator(
      const stakeline::schema::address_t& caller,
      const stakeline::schema::address_t& address,
      bool enabled);

  void restore(const stakeline::schema::address_t& owner,
               const std::vector<stakeline::schema::address_t>& operators);

 private:
  journal& journal_;
  stakeline::schema::address_t owner_;
  std::set<stakeline::schema::address_t> operators_;
};

}  // namespace stakeline::execution
