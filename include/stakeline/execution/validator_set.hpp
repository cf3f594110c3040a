#pragma once

#include <stakeline/execution/journal.hpp>
#include <stakeline/schema/primitives.hpp>
#include <stakeline/schema/validator_record.hpp>

#include <map>
#include <set>

namespace stakeline::execution {

/// Validators funded through either flow, plus the pubkeys claimed by
/// deposits that have been assigned credentials.
class validator_set final {
 public:
  explicit validator_set(journal& journal);

  bool pubkey_in_use(const stakeline::schema::bls_pubkey_t& pubkey) const;
  void claim_pubkey(const stakeline::schema::bls_pubkey_t& pubkey);
  void release_pubkey(const stakeline::schema::bls_pubkey_t& pubkey);

  stakeline::schema::validator_id_t add(
      const stakeline::schema::bls_pubkey_t& pubkey,
      const stakeline::schema::hash32_t& withdrawal_credentials,
      const stakeline::schema::address_t& owner,
      stakeline::schema::validator_source_t source,
      uint64_t source_id);

  const stakeline::schema::validator_record_t* find(
      stakeline::schema::validator_id_t id) const;

  void set_owner(stakeline::schema::validator_id_t id,
                 const stakeline::schema::address_t& owner);
  void lock(stakeline::schema::validator_id_t id,
            stakeline::schema::request_id_t request_id);
  void unlock(stakeline::schema::validator_id_t id);
  void mark_exited(stakeline::schema::validator_id_t id,
                   stakeline::schema::epoch_t exit_epoch);

  std::size_t active_count() const;

  const std::map<stakeline::schema::validator_id_t,
                 stakeline::schema::validator_record_t>&
  validators() const {
    return validators_;
  }
  const std::set<stakeline::schema::bls_pubkey_t>& used_pubkeys() const {
    return used_pubkeys_;
  }
  stakeline::schema::validator_id_t next_id() const { return next_id_; }

  void restore(std::map<stakeline::schema::validator_id_t,
                        stakeline::schema::validator_record_t> validators,
               std::set<stakeline::schema::bls_pubkey_t> used_pubkeys,
               stakeline::schema::validator_id_t next_id);

 private:
  template <typename Fn>
  void update(stakeline::schema::validator_id_t id, Fn&& fn);

  journal& journal_;
  std::map<stakeline::schema::validator_id_t,
           stakeline::schema::validator_record_t>
      validators_;
  std::set<stakeline::schema::bls_pubkey_t> used_pubkeys_;
  stakeline::schema::validator_id_t next_id_{1};
};

}  // namespace stakeline::execution
