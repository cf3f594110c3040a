#include <stakeline/execution/authorization_policy.hpp>

#include <iterator>

using namespace stakeline::schema;

namespace stakeline::execution {

authorization_policy::authorization_policy(journal& journal,
                                           const address_t& owner)
    : journal_{journal}, owner_{owner} {}

bool authorization_policy::is_owner(const address_t& caller) const {
  return caller == owner_;
}

bool authorization_policy::is_operator(const address_t& caller) const {
  return operators_.contains(caller);
}

std::vector<address_t> authorization_policy::operators() const {
  return {std::begin(operators_), std::end(operators_)};
}

error_code authorization_policy::set_operator(const address_t& caller,
                                              const address_t& address,
                                              const bool enabled) {
  if (!is_owner(caller)) {
    return error_code::authorization_denied;
  }
  if (is_zero(address)) {
    return error_code::invalid_address;
  }
  if (enabled) {
    journal_.insert(operators_, address);
  } else {
    journal_.remove(operators_, address);
  }
  return error_code::ok;
}

void authorization_policy::restore(const address_t& owner,
                                   const std::vector<address_t>& operators) {
  owner_ = owner;
  operators_ = {std::begin(operators), std::end(operators)};
}

}  // namespace stakeline::execution
