#pragma once

#include <stakeline/execution/journal.hpp>
#include <stakeline/schema/error_code.hpp>
#include <stakeline/schema/primitives.hpp>

#include <functional>
#include <map>
#include <optional>

namespace stakeline::execution {

/// Ownership table for deposit handles, one per deposit record.
///
/// Transfers consult a guard installed by the owning registry; a guard
/// returning anything but `ok` blocks the transfer with that code.
class handle_registry final {
 public:
  using transfer_guard_t =
      std::function<stakeline::schema::error_code(stakeline::schema::record_id_t)>;

  explicit handle_registry(journal& journal);

  void set_transfer_guard(transfer_guard_t guard);

  void issue(stakeline::schema::record_id_t id,
             const stakeline::schema::address_t& owner);
  void burn(stakeline::schema::record_id_t id);

  std::optional<stakeline::schema::address_t> owner_of(
      stakeline::schema::record_id_t id) const;
  bool is_owner(stakeline::schema::record_id_t id,
                const stakeline::schema::address_t& caller) const;

  stakeline::schema::error_code transfer(
      const stakeline::schema::address_t& caller,
      stakeline::schema::record_id_t id,
      const stakeline::schema::address_t& to);

  const std::map<stakeline::schema::record_id_t, stakeline::schema::address_t>&
  owners() const {
    return owners_;
  }

  void restore(std::map<stakeline::schema::record_id_t,
                        stakeline::schema::address_t> owners);

 private:
  journal& journal_;
  transfer_guard_t guard_;
  std::map<stakeline::schema::record_id_t, stakeline::schema::address_t>
      owners_;
};

}  // namespace stakeline::execution
