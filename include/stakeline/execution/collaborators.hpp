#pragma once

#include <spdlog/spdlog.h>
#include <stakeline/schema/primitives.hpp>

#include <exception>
#include <functional>
#include <string_view>
#include <utility>

namespace stakeline::execution {

/// Arguments forwarded to the beacon deposit contract.
struct deposit_call final {
  stakeline::schema::bls_pubkey_t pubkey{};
  stakeline::schema::hash32_t withdrawal_credentials{};
  stakeline::schema::bls_signature_t signature{};
  stakeline::schema::hash32_t deposit_data_root{};
  stakeline::schema::amount_t amount{};
};

using deposit_call_t = deposit_call;

/// Forwards one stake unit to the deposit contract; false on failure.
using deposit_sink_t = std::function<bool(const deposit_call_t&)>;

/// Sends native value to an address; false on failure.
using value_transfer_t = std::function<bool(
    const stakeline::schema::address_t&, const stakeline::schema::amount_t&)>;

/// Unix seconds.
using clock_source_t = std::function<stakeline::schema::timestamp_seconds_t()>;

struct collaborators final {
  deposit_sink_t deposit_sink;
  value_transfer_t value_transfer;
  clock_source_t clock;
};

using collaborators_t = collaborators;

clock_source_t system_clock_source();

/// Invoke an external collaborator. A missing callback, a false return or a
/// thrown std::exception all count as failure.
template <typename Fn, typename... Args>
bool call_collaborator(const std::string_view name,
                       const Fn& fn,
                       Args&&... args) {
  if (!fn) {
    spdlog::warn("{} is not configured", name);
    return false;
  }
  try {
    return fn(std::forward<Args>(args)...);
  } catch (const std::exception& ex) {
    spdlog::warn("{} threw: {}", name, ex.what());
    return false;
  }
}

}  // namespace stakeline::execution
