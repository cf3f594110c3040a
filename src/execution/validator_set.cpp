#include <stakeline/common/critical.hpp>
#include <stakeline/execution/validator_set.hpp>

#include <algorithm>
#include <utility>

using namespace stakeline::schema;

namespace stakeline::execution {

validator_set::validator_set(journal& journal) : journal_{journal} {}

bool validator_set::pubkey_in_use(const bls_pubkey_t& pubkey) const {
  return used_pubkeys_.contains(pubkey);
}

void validator_set::claim_pubkey(const bls_pubkey_t& pubkey) {
  journal_.insert(used_pubkeys_, pubkey);
}

void validator_set::release_pubkey(const bls_pubkey_t& pubkey) {
  journal_.remove(used_pubkeys_, pubkey);
}

validator_id_t validator_set::add(const bls_pubkey_t& pubkey,
                                  const hash32_t& withdrawal_credentials,
                                  const address_t& owner,
                                  const validator_source_t source,
                                  const uint64_t source_id) {
  auto record = validator_record_t{};
  record.id = next_id_;
  record.pubkey = pubkey;
  record.withdrawal_credentials = withdrawal_credentials;
  record.owner = owner;
  record.source = source;
  record.source_id = source_id;
  record.status = validator_status_t::active;
  journal_.assign(next_id_, next_id_ + 1);
  journal_.insert(used_pubkeys_, pubkey);
  journal_.put(validators_, record.id, record);
  return record.id;
}

const validator_record_t* validator_set::find(const validator_id_t id) const {
  auto it = validators_.find(id);
  if (it == std::end(validators_)) {
    return nullptr;
  }
  return &it->second;
}

template <typename Fn>
void validator_set::update(const validator_id_t id, Fn&& fn) {
  auto existing = find(id);
  if (existing == nullptr) {
    // Callers look the validator up first; a miss here is a logic fault.
    stakeline::common::critical("validator {} not found for update", id);
  }
  auto record = *existing;
  fn(record);
  journal_.put(validators_, id, std::move(record));
}

void validator_set::set_owner(const validator_id_t id, const address_t& owner) {
  update(id, [&](validator_record_t& record) { record.owner = owner; });
}

void validator_set::lock(const validator_id_t id, const request_id_t request_id) {
  update(id, [&](validator_record_t& record) { record.locked_by = request_id; });
}

void validator_set::unlock(const validator_id_t id) {
  update(id, [](validator_record_t& record) { record.locked_by = 0; });
}

void validator_set::mark_exited(const validator_id_t id,
                                const epoch_t exit_epoch) {
  update(id, [&](validator_record_t& record) {
    record.status = validator_status_t::exited;
    record.exit_epoch = exit_epoch;
  });
}

std::size_t validator_set::active_count() const {
  return static_cast<std::size_t>(
      std::count_if(std::begin(validators_), std::end(validators_),
                    [](const auto& entry) {
                      return entry.second.status == validator_status_t::active;
                    }));
}

void validator_set::restore(std::map<validator_id_t, validator_record_t> validators,
                            std::set<bls_pubkey_t> used_pubkeys,
                            const validator_id_t next_id) {
  validators_ = std::move(validators);
  used_pubkeys_ = std::move(used_pubkeys);
  next_id_ = next_id;
}

}  // namespace stakeline::execution
