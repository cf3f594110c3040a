#include <stakeline/execution/handle_registry.hpp>

#include <utility>

using namespace stakeline::schema;

namespace stakeline::execution {

handle_registry::handle_registry(journal& journal) : journal_{journal} {}

void handle_registry::set_transfer_guard(transfer_guard_t guard) {
  guard_ = std::move(guard);
}

void handle_registry::issue(const record_id_t id, const address_t& owner) {
  journal_.put(owners_, id, owner);
}

void handle_registry::burn(const record_id_t id) {
  journal_.erase(owners_, id);
}

std::optional<address_t> handle_registry::owner_of(const record_id_t id) const {
  auto it = owners_.find(id);
  if (it == std::end(owners_)) {
    return std::nullopt;
  }
  return it->second;
}

bool handle_registry::is_owner(const record_id_t id,
                               const address_t& caller) const {
  auto owner = owner_of(id);
  return owner.has_value() && *owner == caller;
}

error_code handle_registry::transfer(const address_t& caller,
                                     const record_id_t id,
                                     const address_t& to) {
  if (!is_owner(id, caller)) {
    return error_code::authorization_denied;
  }
  if (guard_) {
    auto code = guard_(id);
    if (code != error_code::ok) {
      return code;
    }
  }
  if (is_zero(to)) {
    return error_code::invalid_address;
  }
  journal_.put(owners_, id, to);
  return error_code::ok;
}

void handle_registry::restore(std::map<record_id_t, address_t> owners) {
  owners_ = std::move(owners);
}

}  // namespace stakeline::execution
