#include <gtest/gtest.h>
#include <stakeline/execution/state_machine.hpp>
#include <stakeline/testing/engine_fixture.hpp>

#include <algorithm>
#include <string>
#include <vector>

using namespace stakeline::schema;
using stakeline::testing::engine_fixture;
using stakeline::testing::make_address;
using stakeline::testing::make_pubkey;
using stakeline::testing::make_signature;

namespace {

constexpr auto kWeek = duration_seconds_t{7 * 24 * 60 * 60};

error_code code_of(const operation_result_t& result) {
  return static_cast<error_code>(result.code);
}

const auto kDepositor = make_address(0x50);
const auto kWithdrawal = make_address(0xA0);
const auto kStranger = make_address(0x90);

}  // namespace

TEST(deposit_lifecycle, happy_path_forwards_stored_bytes_once) {
  auto fixture = engine_fixture{"stakeline_deposit_happy"};
  auto& engine = fixture.engine();

  auto created = engine.create(kDepositor, kWithdrawal, fixture.stake());
  ASSERT_TRUE(created.ok()) << created.info;
  auto id = fixture.decode_id(created);
  EXPECT_EQ(id, 1u);
  EXPECT_EQ(engine.deposit(id)->status, deposit_status_t::requested);
  EXPECT_EQ(engine.handle_owner(id), kDepositor);
  EXPECT_EQ(engine.custody().pending, fixture.stake());
  EXPECT_EQ(engine.custody().held, fixture.stake());

  auto pubkey = make_pubkey(0x10);
  auto signature = make_signature(0x40);
  auto assigned = engine.assign(fixture.keeper(), id, pubkey, signature);
  ASSERT_TRUE(assigned.ok()) << assigned.info;
  EXPECT_EQ(engine.deposit(id)->status, deposit_status_t::assigned);

  auto record = *engine.deposit(id);
  auto root = fixture.root_for(record.pubkey, record.withdrawal_credentials,
                               record.signature);
  auto confirmed = engine.confirm(kWithdrawal, id, root);
  ASSERT_TRUE(confirmed.ok()) << confirmed.info;
  EXPECT_EQ(engine.deposit(id)->status, deposit_status_t::confirmed);
  EXPECT_EQ(engine.deposit(id)->committed_root, root);

  auto pending_before = engine.custody().pending;
  auto finalized = engine.finalize(fixture.keeper(), id);
  ASSERT_TRUE(finalized.ok()) << finalized.info;
  EXPECT_EQ(engine.deposit(id)->status, deposit_status_t::finalized);
  EXPECT_EQ(pending_before - engine.custody().pending, fixture.stake());
  EXPECT_EQ(engine.custody().committed, fixture.stake());
  EXPECT_EQ(engine.custody().held, amount_t{});

  const auto& calls = fixture.fakes().deposits;
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0].pubkey, pubkey);
  EXPECT_EQ(calls[0].signature, signature);
  EXPECT_EQ(calls[0].withdrawal_credentials, record.withdrawal_credentials);
  EXPECT_EQ(calls[0].deposit_data_root, root);
  EXPECT_EQ(calls[0].amount, fixture.stake());

  auto validator = engine.validator(fixture.decode_id(finalized));
  ASSERT_TRUE(validator.has_value());
  EXPECT_EQ(validator->owner, kDepositor);
  EXPECT_EQ(validator->status, validator_status_t::active);
  EXPECT_EQ(validator->source, validator_source_t::deposit_record);
  EXPECT_EQ(validator->source_id, id);

  auto again = engine.finalize(fixture.keeper(), id);
  EXPECT_EQ(code_of(again), error_code::state_violation);
  EXPECT_EQ(fixture.fakes().deposits.size(), 1u);
}

TEST(deposit_lifecycle, immediate_cancel_refunds_and_deletes) {
  auto fixture = engine_fixture{"stakeline_deposit_cancel"};
  auto& engine = fixture.engine();
  auto id = fixture.decode_id(
      engine.create(kDepositor, kWithdrawal, fixture.stake()));

  auto cancelled = engine.cancel(kWithdrawal, id);
  ASSERT_TRUE(cancelled.ok()) << cancelled.info;
  EXPECT_FALSE(engine.deposit(id).has_value());
  EXPECT_FALSE(engine.handle_owner(id).has_value());
  ASSERT_EQ(fixture.fakes().transfers.size(), 1u);
  EXPECT_EQ(fixture.fakes().transfers[0].first, kDepositor);
  EXPECT_EQ(fixture.fakes().transfers[0].second, fixture.stake());
  EXPECT_EQ(engine.custody().pending, amount_t{});
  EXPECT_EQ(engine.custody().held, amount_t{});

  auto missing = engine.cancel(kWithdrawal, id);
  EXPECT_EQ(code_of(missing), error_code::state_violation);
  EXPECT_EQ(missing.info,
            "cancel requires requested|assigned|confirmed; actual none");
}

TEST(deposit_lifecycle, confirmed_cancel_waits_for_cooldown) {
  auto fixture = engine_fixture{"stakeline_deposit_cooldown"};
  auto& engine = fixture.engine();
  auto id = fixture.create_confirmed(kDepositor, kWithdrawal, 0x10);
  ASSERT_EQ(engine.deposit(id)->status, deposit_status_t::confirmed);

  fixture.advance(1);
  auto early = engine.cancel(kWithdrawal, id);
  EXPECT_EQ(code_of(early), error_code::cooldown_active);
  EXPECT_EQ(early.info, "remaining_seconds=604799");
  EXPECT_EQ(engine.cancellation_remaining(id), kWeek - 1);
  EXPECT_EQ(engine.deposit(id)->status, deposit_status_t::confirmed);
  EXPECT_TRUE(fixture.fakes().transfers.empty());

  fixture.advance(kWeek - 1);
  auto late = engine.cancel(kDepositor, id);
  ASSERT_TRUE(late.ok()) << late.info;
  EXPECT_FALSE(engine.deposit(id).has_value());
  EXPECT_EQ(fixture.fakes().transfers.size(), 1u);
}

TEST(deposit_lifecycle, wrong_root_keeps_record_assigned) {
  auto fixture = engine_fixture{"stakeline_deposit_wrong_root"};
  auto& engine = fixture.engine();
  auto id = fixture.create_assigned(kDepositor, kWithdrawal, 0x10);

  auto record = *engine.deposit(id);
  auto root = fixture.root_for(record.pubkey, record.withdrawal_credentials,
                               record.signature);
  root[31] ^= 0x01;
  auto result = engine.confirm(kWithdrawal, id, root);
  EXPECT_EQ(code_of(result), error_code::deposit_data_root_mismatch);
  EXPECT_EQ(category(code_of(result)), error_category_t::authenticity);
  EXPECT_EQ(engine.deposit(id)->status, deposit_status_t::assigned);
  EXPECT_EQ(engine.deposit(id)->committed_root, hash32_t{});
}

TEST(deposit_lifecycle, create_validates_payment_and_address) {
  auto fixture = engine_fixture{"stakeline_deposit_create_checks"};
  auto& engine = fixture.engine();

  EXPECT_EQ(code_of(engine.create(kDepositor, kWithdrawal,
                                  fixture.stake() - 1)),
            error_code::invalid_payment_amount);
  EXPECT_EQ(code_of(engine.create(kDepositor, address_t{}, fixture.stake())),
            error_code::invalid_address);
  EXPECT_TRUE(engine.deposits().empty());
  EXPECT_EQ(engine.custody().held, amount_t{});
}

TEST(deposit_lifecycle, guards_check_authorization_before_status) {
  auto fixture = engine_fixture{"stakeline_deposit_auth"};
  auto& engine = fixture.engine();
  auto id = fixture.decode_id(
      engine.create(kDepositor, kWithdrawal, fixture.stake()));
  auto pubkey = make_pubkey(0x10);
  auto signature = make_signature(0x40);

  EXPECT_EQ(code_of(engine.assign(kStranger, id, pubkey, signature)),
            error_code::authorization_denied);
  EXPECT_EQ(code_of(engine.finalize(kStranger, id)),
            error_code::authorization_denied);
  EXPECT_EQ(code_of(engine.finalize(fixture.keeper(), id)),
            error_code::state_violation);
  EXPECT_EQ(code_of(engine.cancel(kStranger, id)),
            error_code::authorization_denied);
  EXPECT_EQ(code_of(engine.confirm(kWithdrawal, id, hash32_t{})),
            error_code::state_violation);
  EXPECT_EQ(engine.deposit(id)->status, deposit_status_t::requested);
}

TEST(deposit_lifecycle, assign_rejects_bad_lengths) {
  auto fixture = engine_fixture{"stakeline_deposit_lengths"};
  auto& engine = fixture.engine();
  auto id = fixture.decode_id(
      engine.create(kDepositor, kWithdrawal, fixture.stake()));
  auto short_pubkey = bytes_t(47, 0x11);
  auto long_signature = bytes_t(97, 0x22);
  auto signature = make_signature(0x40);
  auto pubkey = make_pubkey(0x10);

  EXPECT_EQ(code_of(engine.assign(fixture.keeper(), id,
                                  make_bytes_view(short_pubkey), signature)),
            error_code::invalid_pubkey_length);
  EXPECT_EQ(code_of(engine.assign(fixture.keeper(), id, pubkey,
                                  make_bytes_view(long_signature))),
            error_code::invalid_signature_length);
  EXPECT_EQ(engine.deposit(id)->status, deposit_status_t::requested);
}

TEST(deposit_lifecycle, pubkey_is_unique_until_cancelled) {
  auto fixture = engine_fixture{"stakeline_deposit_pubkey"};
  auto& engine = fixture.engine();
  auto first = fixture.create_assigned(kDepositor, kWithdrawal, 0x10);
  auto second = fixture.decode_id(
      engine.create(kDepositor, kWithdrawal, fixture.stake()));

  auto pubkey = make_pubkey(0x10);
  auto signature = make_signature(0x10);
  EXPECT_EQ(code_of(engine.assign(fixture.keeper(), second, pubkey, signature)),
            error_code::pubkey_in_use);

  ASSERT_TRUE(engine.cancel(kWithdrawal, first).ok());
  EXPECT_TRUE(engine.assign(fixture.keeper(), second, pubkey, signature).ok());
}

TEST(deposit_lifecycle, handle_owner_acts_for_the_record) {
  auto fixture = engine_fixture{"stakeline_deposit_handle_owner"};
  auto& engine = fixture.engine();
  auto id = fixture.create_assigned(kDepositor, kWithdrawal, 0x10);
  auto record = *engine.deposit(id);
  auto root = fixture.root_for(record.pubkey, record.withdrawal_credentials,
                               record.signature);

  EXPECT_EQ(code_of(engine.confirm(kStranger, id, root)),
            error_code::authorization_denied);
  EXPECT_TRUE(engine.confirm(kDepositor, id, root).ok());
}

TEST(deposit_lifecycle, handle_transfers_only_after_finalize) {
  auto fixture = engine_fixture{"stakeline_deposit_handle_transfer"};
  auto& engine = fixture.engine();
  auto id = fixture.create_confirmed(kDepositor, kWithdrawal, 0x10);

  EXPECT_EQ(code_of(engine.transfer_handle(kDepositor, id, kStranger)),
            error_code::handle_transfer_locked);
  EXPECT_EQ(code_of(engine.transfer_handle(kDepositor, 99, kStranger)),
            error_code::state_violation);

  auto validator_id =
      fixture.decode_id(engine.finalize(fixture.keeper(), id));
  EXPECT_EQ(code_of(engine.transfer_handle(kStranger, id, kStranger)),
            error_code::authorization_denied);
  ASSERT_TRUE(engine.transfer_handle(kDepositor, id, kStranger).ok());
  EXPECT_EQ(engine.handle_owner(id), kStranger);
  EXPECT_EQ(engine.validator(validator_id)->owner, kStranger);
}

TEST(deposit_lifecycle, handle_stays_with_a_redeeming_or_exited_validator) {
  auto fixture = engine_fixture{"stakeline_deposit_handle_redeem"};
  auto& engine = fixture.engine();
  auto validator_id = fixture.create_finalized(kDepositor, kWithdrawal, 0x10);
  auto id = engine.validator(validator_id)->source_id;

  auto redeem_id = fixture.decode_id(
      engine.request_redeem(kDepositor, kDepositor, validator_id));
  EXPECT_EQ(code_of(engine.transfer_handle(kDepositor, id, kStranger)),
            error_code::handle_transfer_locked);
  EXPECT_EQ(engine.handle_owner(id), kDepositor);
  EXPECT_EQ(engine.validator(validator_id)->owner, kDepositor);

  ASSERT_TRUE(engine.cancel_redeem(kDepositor, redeem_id).ok());
  ASSERT_TRUE(engine.transfer_handle(kDepositor, id, kStranger).ok());
  EXPECT_EQ(engine.validator(validator_id)->owner, kStranger);

  redeem_id = fixture.decode_id(
      engine.request_redeem(kStranger, kStranger, validator_id));
  ASSERT_TRUE(engine.start_redeem(fixture.keeper(), redeem_id).ok());
  EXPECT_EQ(code_of(engine.transfer_handle(kStranger, id, kDepositor)),
            error_code::handle_transfer_locked);
  ASSERT_TRUE(engine.process_redeem(fixture.keeper(), redeem_id, 250'000).ok());
  ASSERT_TRUE(engine.claim_redeem(kStranger, redeem_id).ok());
  ASSERT_EQ(fixture.fakes().transfers.size(), 1u);
  EXPECT_EQ(fixture.fakes().transfers[0].first, kStranger);

  EXPECT_EQ(code_of(engine.transfer_handle(kStranger, id, kDepositor)),
            error_code::handle_transfer_locked);
  EXPECT_EQ(engine.handle_owner(id), kStranger);
}

TEST(deposit_lifecycle, sink_failure_rolls_back_finalize) {
  auto fixture = engine_fixture{"stakeline_deposit_sink_failure"};
  auto& engine = fixture.engine();
  auto id = fixture.create_confirmed(kDepositor, kWithdrawal, 0x10);
  auto custody_before = engine.custody();

  fixture.fakes().fail_deposits = true;
  auto result = engine.finalize(fixture.keeper(), id);
  EXPECT_EQ(code_of(result), error_code::deposit_sink_failed);
  EXPECT_EQ(engine.deposit(id)->status, deposit_status_t::confirmed);
  EXPECT_TRUE(engine.validators().empty());
  EXPECT_EQ(engine.custody().pending, custody_before.pending);
  EXPECT_EQ(engine.custody().held, custody_before.held);

  fixture.fakes().fail_deposits = false;
  EXPECT_TRUE(engine.finalize(fixture.keeper(), id).ok());
  EXPECT_EQ(fixture.fakes().deposits.size(), 1u);
}

TEST(deposit_lifecycle, refund_failure_rolls_back_cancel) {
  auto fixture = engine_fixture{"stakeline_deposit_refund_failure"};
  auto& engine = fixture.engine();
  auto id = fixture.create_assigned(kDepositor, kWithdrawal, 0x10);

  fixture.fakes().fail_transfers = true;
  EXPECT_EQ(code_of(engine.cancel(kWithdrawal, id)),
            error_code::value_transfer_failed);
  EXPECT_EQ(engine.deposit(id)->status, deposit_status_t::assigned);
  EXPECT_EQ(engine.handle_owner(id), kDepositor);
  EXPECT_EQ(engine.custody().pending, fixture.stake());

  auto other = fixture.decode_id(
      engine.create(kDepositor, kWithdrawal, fixture.stake()));
  EXPECT_EQ(code_of(engine.assign(fixture.keeper(), other, make_pubkey(0x10),
                                  make_signature(0x10))),
            error_code::pubkey_in_use);
}

TEST(deposit_lifecycle, reentrant_calls_from_sink_are_rejected) {
  auto fixture = engine_fixture{"stakeline_deposit_reentrant"};
  auto& engine = fixture.engine();
  auto id = fixture.create_confirmed(kDepositor, kWithdrawal, 0x10);

  auto nested = std::vector<error_code>{};
  fixture.fakes().on_deposit = [&]() {
    nested.push_back(code_of(engine.finalize(fixture.keeper(), id)));
    nested.push_back(code_of(engine.cancel(kWithdrawal, id)));
  };
  auto result = engine.finalize(fixture.keeper(), id);
  ASSERT_TRUE(result.ok()) << result.info;
  EXPECT_EQ(nested, (std::vector<error_code>{error_code::state_violation,
                                             error_code::state_violation}));
  EXPECT_EQ(fixture.fakes().deposits.size(), 1u);
  EXPECT_TRUE(fixture.fakes().transfers.empty());
  EXPECT_EQ(engine.custody().committed, fixture.stake());
}

TEST(deposit_lifecycle, committed_amount_never_changes) {
  auto fixture = engine_fixture{"stakeline_deposit_committed_amount"};
  auto& engine = fixture.engine();
  auto id = fixture.decode_id(
      engine.create(kDepositor, kWithdrawal, fixture.stake()));
  auto check = [&]() {
    EXPECT_EQ(engine.deposit(id)->committed_amount, fixture.stake());
  };
  check();
  engine.assign(fixture.keeper(), id, make_pubkey(0x10), make_signature(0x40));
  check();
  engine.confirm(kWithdrawal, id, hash32_t{});
  check();
  auto record = *engine.deposit(id);
  engine.confirm(kWithdrawal, id,
                 fixture.root_for(record.pubkey, record.withdrawal_credentials,
                                  record.signature));
  check();
  engine.finalize(fixture.keeper(), id);
  check();
}

TEST(deposit_lifecycle, owner_manages_operators) {
  auto fixture = engine_fixture{"stakeline_deposit_operators"};
  auto& engine = fixture.engine();
  auto keeper = make_address(0x70);

  EXPECT_EQ(code_of(engine.set_operator(kStranger, keeper, true)),
            error_code::authorization_denied);
  ASSERT_TRUE(engine.set_operator(fixture.owner(), keeper, true).ok());
  EXPECT_TRUE(engine.is_operator(keeper));

  auto id = fixture.decode_id(
      engine.create(kDepositor, kWithdrawal, fixture.stake()));
  EXPECT_TRUE(
      engine.assign(keeper, id, make_pubkey(0x10), make_signature(0x40)).ok());

  ASSERT_TRUE(engine.set_operator(fixture.owner(), keeper, false).ok());
  EXPECT_FALSE(engine.is_operator(keeper));
  EXPECT_EQ(code_of(engine.finalize(keeper, id)),
            error_code::authorization_denied);
}

namespace {

struct matrix_case final {
  deposit_status_t status;
  deposit_action_t action;
};

std::vector<matrix_case> all_matrix_cases() {
  auto cases = std::vector<matrix_case>{};
  for (const auto status :
       {deposit_status_t::none, deposit_status_t::requested,
        deposit_status_t::assigned, deposit_status_t::confirmed,
        deposit_status_t::finalized}) {
    for (const auto action :
         {deposit_action_t::assign, deposit_action_t::confirm,
          deposit_action_t::finalize, deposit_action_t::cancel}) {
      cases.push_back(matrix_case{status, action});
    }
  }
  return cases;
}

std::string matrix_case_name(
    const ::testing::TestParamInfo<matrix_case>& info) {
  return std::string{to_string(info.param.status)} + "_" +
         std::string{to_string(info.param.action)};
}

// Drive a fresh record into `status`. A cancelled record no longer exists,
// which is the none row of the matrix.
record_id_t record_in(engine_fixture& fixture, const deposit_status_t status) {
  auto& engine = fixture.engine();
  switch (status) {
    case deposit_status_t::requested:
      return fixture.decode_id(
          engine.create(kDepositor, kWithdrawal, fixture.stake()));
    case deposit_status_t::assigned:
      return fixture.create_assigned(kDepositor, kWithdrawal, 0x10);
    case deposit_status_t::confirmed:
      return fixture.create_confirmed(kDepositor, kWithdrawal, 0x10);
    case deposit_status_t::finalized: {
      auto id = fixture.create_confirmed(kDepositor, kWithdrawal, 0x10);
      engine.finalize(fixture.keeper(), id);
      return id;
    }
    default: {
      auto id = fixture.decode_id(
          engine.create(kDepositor, kWithdrawal, fixture.stake()));
      engine.cancel(kDepositor, id);
      return id;
    }
  }
}

// Perform `action` as an actor allowed to, with well-formed inputs.
operation_result_t act_on(engine_fixture& fixture,
                          const record_id_t id,
                          const deposit_action_t action) {
  auto& engine = fixture.engine();
  switch (action) {
    case deposit_action_t::assign:
      return engine.assign(fixture.keeper(), id, make_pubkey(0x20),
                           make_signature(0x60));
    case deposit_action_t::confirm: {
      auto record = engine.deposit(id);
      auto root = record ? fixture.root_for(record->pubkey,
                                            record->withdrawal_credentials,
                                            record->signature)
                         : hash32_t{};
      return engine.confirm(kWithdrawal, id, root);
    }
    case deposit_action_t::finalize:
      return engine.finalize(fixture.keeper(), id);
    default:
      return engine.cancel(kWithdrawal, id);
  }
}

class deposit_matrix : public ::testing::TestWithParam<matrix_case> {};

}  // namespace

TEST_P(deposit_matrix, only_declared_edges_move_a_record) {
  const auto [status, action] = GetParam();
  auto fixture = engine_fixture{"stakeline_deposit_matrix"};
  auto& engine = fixture.engine();
  auto id = record_in(fixture, status);
  ASSERT_EQ(engine.deposit(id).has_value(), status != deposit_status_t::none);
  if (engine.deposit(id)) {
    ASSERT_EQ(engine.deposit(id)->status, status);
  }
  fixture.advance(kWeek);

  auto custody_before = engine.custody();
  auto sink_calls = fixture.fakes().deposits.size();
  auto transfers = fixture.fakes().transfers.size();
  auto result = act_on(fixture, id, action);

  auto next = stakeline::execution::next_status(status, action);
  if (!next) {
    EXPECT_EQ(code_of(result), error_code::state_violation) << result.info;
    EXPECT_EQ(engine.deposit(id).has_value(),
              status != deposit_status_t::none);
    if (engine.deposit(id)) {
      EXPECT_EQ(engine.deposit(id)->status, status);
    }
    EXPECT_EQ(engine.custody().pending, custody_before.pending);
    EXPECT_EQ(engine.custody().committed, custody_before.committed);
    EXPECT_EQ(engine.custody().held, custody_before.held);
    EXPECT_EQ(fixture.fakes().deposits.size(), sink_calls);
    EXPECT_EQ(fixture.fakes().transfers.size(), transfers);
    return;
  }

  ASSERT_TRUE(result.ok()) << result.info;
  if (*next == deposit_status_t::cancelled) {
    EXPECT_FALSE(engine.deposit(id).has_value());
    EXPECT_EQ(fixture.fakes().transfers.size(), transfers + 1);
  } else {
    EXPECT_EQ(engine.deposit(id)->status, *next);
  }
}

INSTANTIATE_TEST_SUITE_P(deposit_lifecycle,
                         deposit_matrix,
                         ::testing::ValuesIn(all_matrix_cases()),
                         matrix_case_name);
