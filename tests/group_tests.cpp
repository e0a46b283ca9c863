#include "hemat_tester.hpp"

using namespace hemat_test;

BOOST_AUTO_TEST_SUITE(group_tests)

BOOST_FIXTURE_TEST_CASE(rotational_full_rotation, hemat_tester) try {
   const auto conf = group_conf("rotational"_n, "100.0000 USDT");
   BOOST_REQUIRE_EQUAL(success(), creategroup(ALICE, conf));

   auto group = get_group(1);
   BOOST_REQUIRE_EQUAL("created", group["status"].as_string());
   BOOST_REQUIRE(group["cap"].as_uint64() != 0);
   BOOST_REQUIRE(!get_escrow_balance(1).is_null());
   BOOST_REQUIRE(!get_pool(1).is_null());

   BOOST_REQUIRE_EQUAL(success(), join(ALICE, 1));
   BOOST_REQUIRE_EQUAL(success(), join(BOB, 1));
   BOOST_REQUIRE_EQUAL("created", get_group(1)["status"].as_string());
   BOOST_REQUIRE_EQUAL(success(), join(CAROL, 1));

   group = get_group(1);
   BOOST_REQUIRE_EQUAL("active", group["status"].as_string());
   BOOST_REQUIRE_EQUAL(1u, group["current_cycle"].as_uint64());
   BOOST_REQUIRE_EQUAL(false, group["guard"].as_bool());

   const vector<name> order = { ALICE, BOB, CAROL };
   const auto before = get_balance(ALICE).get_amount();

   for (uint32_t cycle = 1; cycle <= 3; cycle++) {
      for (const auto& m : order)
         BOOST_REQUIRE_EQUAL(success(), contribute(m, 1, "100.0000 USDT"));

      auto payout = get_payout(1, cycle);
      BOOST_REQUIRE_EQUAL(order[cycle - 1].to_string(), payout["recipient"].as_string());
      BOOST_REQUIRE_EQUAL("300.0000 USDT", payout["amount"].as_string());
      BOOST_REQUIRE_EQUAL(false, payout["executed"].as_bool());
      check_conservation(1, order);

      BOOST_REQUIRE_EQUAL(success(), claimpayout(order[cycle - 1], 1, cycle));
      BOOST_REQUIRE_EQUAL(true, get_payout(1, cycle)["executed"].as_bool());
      BOOST_REQUIRE(get_pending(1, order[cycle - 1]).is_null());
      check_conservation(1, order);
      produce_blocks();
   }

   group = get_group(1);
   BOOST_REQUIRE_EQUAL("completed", group["status"].as_string());
   BOOST_REQUIRE_EQUAL(false, group["guard"].as_bool());

   // 三期各缴 100，领取一次 300
   BOOST_REQUIRE_EQUAL(before, get_balance(ALICE).get_amount());
   for (const auto& m : order) {
      auto member = get_member(1, m);
      BOOST_REQUIRE_EQUAL("300.0000 USDT", member["total_contributed"].as_string());
      BOOST_REQUIRE_EQUAL("300.0000 USDT", member["total_received"].as_string());
      BOOST_REQUIRE_EQUAL(true, member["has_received_payout"].as_bool());
   }

   auto bal = get_escrow_balance(1);
   BOOST_REQUIRE_EQUAL("0.0000 USDT", bal["principal"].as_string());
   BOOST_REQUIRE_EQUAL("0.0000 USDT", bal["pending_payouts"].as_string());
   BOOST_REQUIRE_EQUAL("0.0000 USDT", get_escrow_global()["deployed"].as_string());

   BOOST_REQUIRE_EQUAL(wasm_assert_msg("[[9]] payout already claimed"), claimpayout(ALICE, 1, 1));
   BOOST_REQUIRE_EQUAL(wasm_assert_msg("[[31]] group not active"), contribute(ALICE, 1, "100.0000 USDT"));
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(platform_fee_goes_to_treasury, hemat_tester) try {
   auto conf = group_conf("rotational"_n, "100.0000 USDT");
   conf("platform_fee_bps", 100);
   open_group(1, conf);

   for (const auto& m : { ALICE, BOB, CAROL })
      BOOST_REQUIRE_EQUAL(success(), contribute(m, 1, "100.0000 USDT"));

   auto payout = get_payout(1, 1);
   BOOST_REQUIRE_EQUAL("300.0000 USDT", payout["gross"].as_string());
   BOOST_REQUIRE_EQUAL("3.0000 USDT", payout["fee"].as_string());
   BOOST_REQUIRE_EQUAL("297.0000 USDT", payout["amount"].as_string());
   BOOST_REQUIRE_EQUAL("3.0000 USDT", get_balance(TREASURY).to_string());
   BOOST_REQUIRE_EQUAL("3.0000 USDT", get_escrow_balance(1)["fees_collected"].as_string());
   check_conservation(1, { ALICE, BOB, CAROL });

   BOOST_REQUIRE_EQUAL(wasm_assert_msg("[[16]] not the payout recipient"), claimpayout(BOB, 1, 1));
   BOOST_REQUIRE_EQUAL(wasm_assert_msg("[[8]] payout not found for cycle 2"), claimpayout(BOB, 1, 2));
   BOOST_REQUIRE_EQUAL(success(), claimpayout(ALICE, 1, 1));
   check_conservation(1, { ALICE, BOB, CAROL });
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(creategroup_validation, hemat_tester) try {
   auto conf = group_conf("rotational"_n, "100.0000 USDT");
   conf("group_size", 2);
   BOOST_REQUIRE_EQUAL(wasm_assert_msg("[[33]] group size out of range"), creategroup(ALICE, conf));

   conf = group_conf("lottery"_n, "100.0000 USDT");
   BOOST_REQUIRE_EQUAL(wasm_assert_msg("[[33]] invalid group model: lottery"), creategroup(ALICE, conf));

   conf = group_conf("rotational"_n, "0.5000 USDT");
   BOOST_REQUIRE_EQUAL(wasm_assert_msg("[[33]] contribution out of range"), creategroup(ALICE, conf));

   conf = group_conf("fixedsavings"_n, "100.0000 USDT");
   conf("lock_duration", CYCLE - 1);
   BOOST_REQUIRE_EQUAL(wasm_assert_msg("[[33]] lock duration shorter than one cycle"), creategroup(ALICE, conf));

   conf = group_conf("rotational"_n, "100.0000 USDT");
   conf("insurance_bps", 500);
   BOOST_REQUIRE_EQUAL(wasm_assert_msg("[[33]] insurance premium set but insurance disabled"), creategroup(ALICE, conf));

   BOOST_REQUIRE_EQUAL(error("missing authority of alice"),
      push_action(GROUP, BOB, "creategroup"_n, mvo()
         ("creator", ALICE)
         ("conf", group_conf("rotational"_n, "100.0000 USDT"))));
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(creator_open_group_limit, hemat_tester) try {
   BOOST_REQUIRE_EQUAL(success(), push_action(GROUP, ADMIN, "setconfig"_n, mvo()
      ("min_group_size", 3)
      ("max_group_size", 10)
      ("min_contribution", "1.0000 USDT")
      ("max_contribution", "1000.0000 USDT")
      ("max_groups_per_creator", 1)));

   BOOST_REQUIRE_EQUAL(success(), creategroup(ALICE, group_conf("rotational"_n, "100.0000 USDT")));
   BOOST_REQUIRE_EQUAL(wasm_assert_msg("[[36]] too many open groups for creator"),
                       creategroup(ALICE, group_conf("rotational"_n, "200.0000 USDT")));
   BOOST_REQUIRE_EQUAL(success(), creategroup(BOB, group_conf("rotational"_n, "200.0000 USDT")));

   // 取消后名额释放
   BOOST_REQUIRE_EQUAL(success(), push_action(GROUP, ALICE, "cancel"_n, mvo()
      ("creator", ALICE)
      ("group_id", 1)));
   BOOST_REQUIRE_EQUAL(success(), creategroup(ALICE, group_conf("rotational"_n, "200.0000 USDT")));
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(join_and_leave, hemat_tester) try {
   BOOST_REQUIRE_EQUAL(success(), creategroup(ALICE, group_conf("rotational"_n, "100.0000 USDT")));
   BOOST_REQUIRE_EQUAL(success(), join(ALICE, 1));
   produce_blocks();
   BOOST_REQUIRE_EQUAL(wasm_assert_msg("[[9]] already a member: alice"), join(ALICE, 1));
   BOOST_REQUIRE_EQUAL(wasm_assert_msg("[[8]] group not found: 9"), join(BOB, 9));

   BOOST_REQUIRE_EQUAL(success(), join(BOB, 1));
   BOOST_REQUIRE_EQUAL(success(), push_action(GROUP, BOB, "leave"_n, mvo()
      ("member", BOB)
      ("group_id", 1)));
   BOOST_REQUIRE_EQUAL(false, get_member(1, BOB)["is_active"].as_bool());
   BOOST_REQUIRE_EQUAL(1u, get_group(1)["members"].get_array().size());

   produce_blocks();
   BOOST_REQUIRE_EQUAL(wasm_assert_msg("[[8]] not a member: bob"), push_action(GROUP, BOB, "leave"_n, mvo()
      ("member", BOB)
      ("group_id", 1)));

   produce_blocks();
   BOOST_REQUIRE_EQUAL(success(), join(BOB, 1));
   BOOST_REQUIRE_EQUAL(true, get_member(1, BOB)["is_active"].as_bool());
   BOOST_REQUIRE_EQUAL(success(), join(CAROL, 1));
   BOOST_REQUIRE_EQUAL("active", get_group(1)["status"].as_string());

   BOOST_REQUIRE_EQUAL(wasm_assert_msg("[[31]] group not open for joining"), join(DAVE, 1));
   BOOST_REQUIRE_EQUAL(wasm_assert_msg("[[31]] can only leave before activation"), push_action(GROUP, CAROL, "leave"_n, mvo()
      ("member", CAROL)
      ("group_id", 1)));
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(payout_order, hemat_tester) try {
   BOOST_REQUIRE_EQUAL(success(), creategroup(ALICE, group_conf("rotational"_n, "100.0000 USDT")));
   BOOST_REQUIRE_EQUAL(success(), join(ALICE, 1));
   BOOST_REQUIRE_EQUAL(success(), join(BOB, 1));

   BOOST_REQUIRE_EQUAL(wasm_assert_msg("[[16]] only creator can set payout order"), push_action(GROUP, BOB, "setorder"_n, mvo()
      ("creator", BOB)
      ("group_id", 1)
      ("order", vector<name>{ BOB })));
   BOOST_REQUIRE_EQUAL(wasm_assert_msg("[[8]] not a member: carol"), push_action(GROUP, ALICE, "setorder"_n, mvo()
      ("creator", ALICE)
      ("group_id", 1)
      ("order", vector<name>{ CAROL })));
   BOOST_REQUIRE_EQUAL(success(), push_action(GROUP, ALICE, "setorder"_n, mvo()
      ("creator", ALICE)
      ("group_id", 1)
      ("order", vector<name>{ BOB })));
   BOOST_REQUIRE_EQUAL(wasm_assert_msg("[[9]] payout order already set"), push_action(GROUP, ALICE, "setorder"_n, mvo()
      ("creator", ALICE)
      ("group_id", 1)
      ("order", vector<name>{ ALICE })));

   BOOST_REQUIRE_EQUAL(success(), join(CAROL, 1));
   auto members = get_group(1)["members"].get_array();
   BOOST_REQUIRE_EQUAL("bob", members[0].as_string());
   BOOST_REQUIRE_EQUAL("alice", members[1].as_string());
   BOOST_REQUIRE_EQUAL("carol", members[2].as_string());

   for (const auto& m : { ALICE, BOB, CAROL })
      BOOST_REQUIRE_EQUAL(success(), contribute(m, 1, "100.0000 USDT"));
   BOOST_REQUIRE_EQUAL("bob", get_payout(1, 1)["recipient"].as_string());
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(contribution_rules, hemat_tester) try {
   open_group(1, group_conf("rotational"_n, "100.0000 USDT"));

   BOOST_REQUIRE_EQUAL(wasm_assert_msg("[[33]] contribution must equal 100.0000 USDT"), contribute(ALICE, 1, "90.0000 USDT"));
   BOOST_REQUIRE_EQUAL(wasm_assert_msg("[[8]] member not found: dave"), contribute(DAVE, 1, "100.0000 USDT"));
   BOOST_REQUIRE_EQUAL(wasm_assert_msg("[[0]] unsupported memo action: donate"), transfer(ALICE, GROUP, "100.0000 USDT", "donate:1"));

   BOOST_REQUIRE_EQUAL(success(), contribute(ALICE, 1, "100.0000 USDT"));
   auto record = get_contribution(1, 0);
   BOOST_REQUIRE_EQUAL("alice", record["member"].as_string());
   BOOST_REQUIRE_EQUAL("paid", record["status"].as_string());
   BOOST_REQUIRE_EQUAL(1u, record["cycle"].as_uint64());

   produce_blocks();
   BOOST_REQUIRE_EQUAL(wasm_assert_msg("[[9]] already contributed this cycle"), contribute(ALICE, 1, "100.0000 USDT"));

   skip_time(CYCLE + GRACE + 1);
   BOOST_REQUIRE_EQUAL(wasm_assert_msg("[[6]] contribution window closed"), contribute(BOB, 1, "100.0000 USDT"));
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(pause_and_resume, hemat_tester) try {
   open_group(1, group_conf("rotational"_n, "100.0000 USDT"));

   BOOST_REQUIRE_EQUAL(wasm_assert_msg("[[16]] only admin or creator can pause"), push_action(GROUP, BOB, "pause"_n, mvo()
      ("actor", BOB)
      ("group_id", 1)));
   BOOST_REQUIRE_EQUAL(success(), push_action(GROUP, ADMIN, "pause"_n, mvo()
      ("actor", ADMIN)
      ("group_id", 1)));
   BOOST_REQUIRE_EQUAL("paused", get_group(1)["status"].as_string());
   BOOST_REQUIRE_EQUAL(wasm_assert_msg("[[31]] group not active"), contribute(ALICE, 1, "100.0000 USDT"));

   // 暂停期间跨过原缴款窗口，恢复后窗口重新计算
   skip_time(CYCLE + GRACE + 1);
   BOOST_REQUIRE_EQUAL(success(), push_action(GROUP, ALICE, "resume"_n, mvo()
      ("actor", ALICE)
      ("group_id", 1)));
   BOOST_REQUIRE_EQUAL("active", get_group(1)["status"].as_string());
   BOOST_REQUIRE_EQUAL(success(), contribute(ALICE, 1, "100.0000 USDT"));
   BOOST_REQUIRE_EQUAL(wasm_assert_msg("[[10]] contribution window still open"), enforce(ALICE, 1, BOB));
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(cancel_refunds_principal_and_stake, hemat_tester) try {
   BOOST_REQUIRE_EQUAL(success(), creategroup(ALICE, group_conf("rotational"_n, "100.0000 USDT", "50.0000 USDT")));
   for (const auto& m : { ALICE, BOB, CAROL })
      BOOST_REQUIRE_EQUAL(success(), join_staked(m, 1, "50.0000 USDT"));
   BOOST_REQUIRE_EQUAL("active", get_group(1)["status"].as_string());

   const auto alice_before = get_balance(ALICE).get_amount();
   const auto bob_before   = get_balance(BOB).get_amount();
   const auto carol_before = get_balance(CAROL).get_amount();

   BOOST_REQUIRE_EQUAL(success(), contribute(ALICE, 1, "100.0000 USDT"));
   BOOST_REQUIRE_EQUAL(success(), contribute(BOB, 1, "100.0000 USDT"));
   check_conservation(1, { ALICE, BOB, CAROL });

   BOOST_REQUIRE_EQUAL(wasm_assert_msg("[[16]] only creator can cancel"), push_action(GROUP, BOB, "cancel"_n, mvo()
      ("creator", BOB)
      ("group_id", 1)));
   BOOST_REQUIRE_EQUAL(success(), push_action(GROUP, ALICE, "cancel"_n, mvo()
      ("creator", ALICE)
      ("group_id", 1)));

   BOOST_REQUIRE_EQUAL("cancelled", get_group(1)["status"].as_string());
   BOOST_REQUIRE_EQUAL("0.0000 USDT", get_escrow_balance(1)["principal"].as_string());
   check_conservation(1, { ALICE, BOB, CAROL });

   // 缴款全额退回，质押全部释放
   BOOST_REQUIRE_EQUAL(alice_before + 500000, get_balance(ALICE).get_amount());
   BOOST_REQUIRE_EQUAL(bob_before + 500000, get_balance(BOB).get_amount());
   BOOST_REQUIRE_EQUAL(carol_before + 500000, get_balance(CAROL).get_amount());
   for (const auto& m : { ALICE, BOB, CAROL })
      BOOST_REQUIRE_EQUAL("0.0000 USDT", get_stake(1, m)["amount"].as_string());

   produce_blocks();
   BOOST_REQUIRE_EQUAL(wasm_assert_msg("[[31]] group already finalized"), push_action(GROUP, ALICE, "cancel"_n, mvo()
      ("creator", ALICE)
      ("group_id", 1)));
} FC_LOG_AND_RETHROW()

// 未领取的轮转出款计入已得，不再参与本金退还
BOOST_FIXTURE_TEST_CASE(cancel_with_unclaimed_payout, hemat_tester) try {
   open_group(1, group_conf("rotational"_n, "100.0000 USDT"));
   for (const auto& m : { ALICE, BOB, CAROL })
      BOOST_REQUIRE_EQUAL(success(), contribute(m, 1, "100.0000 USDT"));
   BOOST_REQUIRE_EQUAL("300.0000 USDT", get_pending(1, ALICE)["amount"].as_string());

   produce_blocks();
   BOOST_REQUIRE_EQUAL(success(), contribute(ALICE, 1, "100.0000 USDT"));
   BOOST_REQUIRE_EQUAL(success(), contribute(BOB, 1, "100.0000 USDT"));

   const auto alice_before = get_balance(ALICE).get_amount();
   const auto bob_before   = get_balance(BOB).get_amount();
   const auto carol_before = get_balance(CAROL).get_amount();

   BOOST_REQUIRE_EQUAL(success(), push_action(GROUP, ALICE, "cancel"_n, mvo()
      ("creator", ALICE)
      ("group_id", 1)));
   BOOST_REQUIRE_EQUAL("cancelled", get_group(1)["status"].as_string());

   // 剩余本金 200 按 Bob 200、Carol 100 分配
   BOOST_REQUIRE_EQUAL(alice_before, get_balance(ALICE).get_amount());
   BOOST_REQUIRE_EQUAL(bob_before + 1333333, get_balance(BOB).get_amount());
   BOOST_REQUIRE_EQUAL(carol_before + 666667, get_balance(CAROL).get_amount());
   BOOST_REQUIRE_EQUAL("0.0000 USDT", get_escrow_balance(1)["principal"].as_string());
   check_conservation(1, { ALICE, BOB, CAROL });

   // 取消后仍可领取待领出款
   BOOST_REQUIRE_EQUAL(success(), claimpayout(ALICE, 1, 1));
   BOOST_REQUIRE_EQUAL(alice_before + 3000000, get_balance(ALICE).get_amount());
   BOOST_REQUIRE_EQUAL("0.0000 USDT", get_escrow_balance(1)["pending_payouts"].as_string());
   check_conservation(1, { ALICE, BOB, CAROL });
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(cancel_distributes_yield_reserve, hemat_tester) try {
   open_group(1, group_conf("rotational"_n, "100.0000 USDT"));
   BOOST_REQUIRE_EQUAL(success(), contribute(ALICE, 1, "100.0000 USDT"));
   BOOST_REQUIRE_EQUAL(success(), contribute(BOB, 1, "100.0000 USDT"));
   BOOST_REQUIRE_EQUAL(success(), accrue("30.0000 USDT"));
   BOOST_REQUIRE_EQUAL(success(), harvest(DAVE, 1));
   BOOST_REQUIRE_EQUAL("24.0000 USDT", get_escrow_balance(1)["yield_reserve"].as_string());

   const auto alice_before = get_balance(ALICE).get_amount();
   const auto carol_before = get_balance(CAROL).get_amount();
   BOOST_REQUIRE_EQUAL(success(), push_action(GROUP, ALICE, "cancel"_n, mvo()
      ("creator", ALICE)
      ("group_id", 1)));

   // 本金原额退回，收益按缴款比例分配，未缴款者不参与
   BOOST_REQUIRE_EQUAL(alice_before + 1120000, get_balance(ALICE).get_amount());
   BOOST_REQUIRE_EQUAL(carol_before, get_balance(CAROL).get_amount());
   BOOST_REQUIRE_EQUAL("12.0000 USDT", get_member(1, ALICE)["yield_received"].as_string());
   BOOST_REQUIRE_EQUAL("12.0000 USDT", get_member(1, BOB)["yield_received"].as_string());
   BOOST_REQUIRE_EQUAL("0.0000 USDT", get_member(1, CAROL)["yield_received"].as_string());

   auto bal = get_escrow_balance(1);
   BOOST_REQUIRE_EQUAL("0.0000 USDT", bal["principal"].as_string());
   BOOST_REQUIRE_EQUAL("0.0000 USDT", bal["yield_reserve"].as_string());
   BOOST_REQUIRE_EQUAL("0.0000 USDT", get_escrow_global()["deployed"].as_string());

   produce_blocks();
   BOOST_REQUIRE_EQUAL(success(), accrue("10.0000 USDT"));
   BOOST_REQUIRE_EQUAL(wasm_assert_msg("[[31]] group closed: 1"), harvest(DAVE, 1));
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(reentrant_contribution_rejected, hemat_tester) try {
   open_group(1, group_conf("rotational"_n, "100.0000 USDT"));

   // 适配器收到存入后立即回调缴款
   BOOST_REQUIRE_EQUAL(success(), push_action(ADAPTER, ADAPTER, "setattack"_n, mvo()
      ("target", GROUP)
      ("group_id", 1)));

   const auto before = get_balance(ALICE);
   BOOST_REQUIRE_EQUAL(wasm_assert_msg("[[34]] reentrant call"), contribute(ALICE, 1, "100.0000 USDT"));

   // 整笔交易回滚
   BOOST_REQUIRE_EQUAL(before.to_string(), get_balance(ALICE).to_string());
   BOOST_REQUIRE(get_contribution(1, 0).is_null());
   BOOST_REQUIRE_EQUAL(false, get_group(1)["guard"].as_bool());
   BOOST_REQUIRE_EQUAL("0.0000 USDT", get_escrow_balance(1)["principal"].as_string());

   BOOST_REQUIRE_EQUAL(success(), push_action(ADAPTER, ADAPTER, "setattack"_n, mvo()
      ("target", name())
      ("group_id", 0)));
   produce_blocks();
   BOOST_REQUIRE_EQUAL(success(), contribute(ALICE, 1, "100.0000 USDT"));
   BOOST_REQUIRE_EQUAL("100.0000 USDT", get_escrow_balance(1)["principal"].as_string());
   check_conservation(1, { ALICE, BOB, CAROL });
} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_SUITE_END()
