#include <boost/test/unit_test.hpp>
#include <limits>
#include "fakes.hpp"
#include "engine/accrual_engine.hpp"
#include "ledger/user_ledger.hpp"

using namespace fakes;

namespace {

struct AccrualFixture {
  AccrualFixture() : engine(ledger, balances) {}

  void Register(const UserId& user, const Amount& balance, int percentage) {
    balances.balances[user] = balance;
    ledger.Deposit(user, Ether("0.01"), balance);
    ledger.ConfigureOrder(user, Amount(100), percentage);
  }

  UserLedger ledger;
  FakeBalanceSource balances;
  AccrualEngine engine;
};

}

BOOST_FIXTURE_TEST_SUITE(accrual_engine_tests, AccrualFixture)

BOOST_AUTO_TEST_CASE(portion_truncates) {
  BOOST_CHECK_EQUAL(AccrualEngine::AccruedPortion(Amount(999), 40), Amount(399));
  BOOST_CHECK_EQUAL(AccrualEngine::AccruedPortion(Amount(1), 99), Amount(0));
  BOOST_CHECK_EQUAL(AccrualEngine::AccruedPortion(Amount(1000), 100), Amount(1000));
  BOOST_CHECK_EQUAL(AccrualEngine::AccruedPortion(Amount(1000), 0), Amount(0));
}

BOOST_AUTO_TEST_CASE(portion_of_huge_delta_does_not_wrap) {
  const Amount max = std::numeric_limits<Amount>::max();
  BOOST_CHECK_EQUAL(AccrualEngine::AccruedPortion(max, 100), max);
  BOOST_CHECK_EQUAL(AccrualEngine::AccruedPortion(max, 50), max / 2);
  BOOST_CHECK_EQUAL(AccrualEngine::AccruedPortion(max, 1), max / 100);
  BOOST_CHECK(AccrualEngine::AccruedPortion(max, 99) < max);
}

BOOST_AUTO_TEST_CASE(no_growth_leaves_pending_unchanged) {
  Register(kAlice, Ether("10"), 40);
  auto report = engine.Run();
  BOOST_CHECK(report.NoOp());
  BOOST_CHECK_EQUAL(report.Count(AccrualStatus::NoGrowth), 1u);
  BOOST_CHECK_EQUAL(ledger.Find(kAlice)->pending_to_convert, Amount(0));
}

BOOST_AUTO_TEST_CASE(successive_passes_accrue_additively) {
  Register(kAlice, Amount(1000), 33);
  balances.Credit(kAlice, Amount(10));
  engine.Run();
  balances.Credit(kAlice, Amount(20));
  engine.Run();
  // floor(10*33/100) + floor(20*33/100), not floor(30*33/100)
  BOOST_CHECK_EQUAL(ledger.Find(kAlice)->pending_to_convert, Amount(3 + 6));
  BOOST_CHECK_EQUAL(ledger.Find(kAlice)->last_observed_balance, Amount(1030));
}

BOOST_AUTO_TEST_CASE(shrinking_balance_contributes_nothing_but_moves_snapshot) {
  Register(kAlice, Amount(1000), 50);
  balances.Debit(kAlice, Amount(200));
  auto report = engine.Run();
  BOOST_CHECK_EQUAL(report.Count(AccrualStatus::NoGrowth), 1u);
  BOOST_CHECK_EQUAL(ledger.Find(kAlice)->pending_to_convert, Amount(0));
  BOOST_CHECK_EQUAL(ledger.Find(kAlice)->last_observed_balance, Amount(800));
  // growth is measured from the new snapshot
  balances.Credit(kAlice, Amount(100));
  engine.Run();
  BOOST_CHECK_EQUAL(ledger.Find(kAlice)->pending_to_convert, Amount(50));
}

BOOST_AUTO_TEST_CASE(zero_percentage_advances_snapshot_only) {
  Register(kAlice, Amount(1000), 0);
  balances.Credit(kAlice, Amount(500));
  auto report = engine.Run();
  BOOST_CHECK(report.NoOp());
  BOOST_CHECK_EQUAL(ledger.Find(kAlice)->pending_to_convert, Amount(0));
  BOOST_CHECK_EQUAL(ledger.Find(kAlice)->last_observed_balance, Amount(1500));
}

BOOST_AUTO_TEST_CASE(failing_user_is_isolated) {
  Register(kAlice, Amount(1000), 40);
  Register(kBob, Amount(1000), 40);
  Register(kCarol, Amount(1000), 40);
  balances.Credit(kAlice, Amount(100));
  balances.Credit(kBob, Amount(100));
  balances.Credit(kCarol, Amount(100));
  balances.failing.insert(kBob);
  const UserAccount bob_before = *ledger.Find(kBob);

  auto report = engine.Run();
  BOOST_CHECK_EQUAL(report.Failures(), 1u);
  BOOST_CHECK_EQUAL(report.Count(AccrualStatus::Accrued), 2u);
  BOOST_CHECK_EQUAL(report.TotalAccrued(), Amount(80));
  BOOST_CHECK(*ledger.Find(kBob) == bob_before);
  BOOST_CHECK_EQUAL(ledger.Find(kCarol)->pending_to_convert, Amount(40));

  // recovered user catches up on the next pass
  balances.failing.clear();
  engine.Run();
  BOOST_CHECK_EQUAL(ledger.Find(kBob)->pending_to_convert, Amount(40));
}

BOOST_AUTO_TEST_CASE(one_ether_growth_at_forty_percent) {
  Register(kAlice, Ether("99.99"), 40);
  balances.Credit(kAlice, Ether("1"));
  engine.Run();
  BOOST_CHECK_EQUAL(ledger.Find(kAlice)->pending_to_convert, Ether("0.4"));
  balances.Credit(kAlice, Ether("1"));
  engine.Run();
  BOOST_CHECK_EQUAL(ledger.Find(kAlice)->pending_to_convert, Ether("0.8"));
}

BOOST_AUTO_TEST_SUITE_END()
