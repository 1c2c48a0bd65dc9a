/*
 * Copyright (c) 2013-2016 John Connor
 * Copyright (c) 2016-2017 The Vcash developers
 *
 * This file is part of vault.
 *
 * vault is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License with
 * additional permissions to the one published by the Free Software
 * Foundation, either version 3 of the License, or (at your option)
 * any later version. For more information see LICENSE.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <http://www.gnu.org/licenses/>.
 */

#include <ctime>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <boost/test/unit_test.hpp>

#include <vault/dispatcher.hpp>
#include <vault/error.hpp>
#include <vault/ledger.hpp>
#include <vault/reconciler.hpp>
#include <vault/request_registry.hpp>

#include "mock_oracle.hpp"

using namespace vault;

namespace {

    struct reconciler_fixture
    {
        reconciler_fixture()
            : m_oracle(std::make_shared<test::mock_oracle> ())
            , m_dispatcher(m_ledger, m_registry)
            , m_reconciler(m_ledger, m_registry)
            , m_payout_ok(true)
        {
            m_dispatcher.set_oracle(m_oracle);

            m_reconciler.set_on_event([this] (const event & e)
            {
                m_events.push_back(e);
            });

            m_reconciler.set_on_payout(
                [this] (const std::string & principal,
                const std::uint64_t & amount) -> bool
            {
                if (m_payout_ok)
                {
                    m_payouts.push_back(std::make_pair(principal, amount));
                }

                return m_payout_ok;
            });
        }

        const event & last_event() const
        {
            BOOST_REQUIRE(m_events.size() > 0);

            return m_events.back();
        }

        std::shared_ptr<test::mock_oracle> m_oracle;
        ledger m_ledger;
        request_registry m_registry;
        dispatcher m_dispatcher;
        reconciler m_reconciler;
        bool m_payout_ok;
        std::vector<event> m_events;
        std::vector< std::pair<std::string, std::uint64_t> > m_payouts;
    };

} // namespace

BOOST_FIXTURE_TEST_SUITE(reconciler_tests, reconciler_fixture)

BOOST_AUTO_TEST_CASE(approved_deposit_credits_once)
{
    auto id = m_dispatcher.request_deposit("alice", 1000);

    m_reconciler.on_outcome(id, test::approved(), test::none());

    BOOST_CHECK_EQUAL(m_ledger.balance_of("alice"), 1000u);
    BOOST_CHECK_EQUAL(m_ledger.escrowed(), 0u);
    BOOST_CHECK(last_event().type() == event::type_deposit_fulfilled);
    BOOST_CHECK_EQUAL(m_registry.size(), 0u);

    /**
     * A replay of the same callback is a no-op.
     */
    m_reconciler.on_outcome(id, test::approved(), test::none());

    BOOST_CHECK_EQUAL(m_ledger.balance_of("alice"), 1000u);
    BOOST_CHECK(last_event().type() == event::type_no_pending_request);
}

BOOST_AUTO_TEST_CASE(rejected_deposit_refunds_once)
{
    auto id = m_dispatcher.request_deposit("bob", 500);

    m_reconciler.on_outcome(id, test::rejected(), test::none());

    BOOST_CHECK_EQUAL(m_ledger.balance_of("bob"), 0u);
    BOOST_CHECK_EQUAL(m_ledger.escrowed(), 0u);
    BOOST_REQUIRE_EQUAL(m_payouts.size(), 1u);
    BOOST_CHECK_EQUAL(m_payouts[0].first, "bob");
    BOOST_CHECK_EQUAL(m_payouts[0].second, 500u);
    BOOST_CHECK(last_event().type() == event::type_deposit_cancelled);

    m_reconciler.on_outcome(id, test::rejected(), test::none());

    BOOST_CHECK_EQUAL(m_payouts.size(), 1u);
}

BOOST_AUTO_TEST_CASE(approved_withdrawal_debits_and_pays)
{
    m_ledger.credit("alice", 1000);

    auto id = m_dispatcher.request_withdrawal("alice", 1000);

    m_reconciler.on_outcome(id, test::approved(), test::none());

    BOOST_CHECK_EQUAL(m_ledger.balance_of("alice"), 0u);
    BOOST_REQUIRE_EQUAL(m_payouts.size(), 1u);
    BOOST_CHECK_EQUAL(m_payouts[0].second, 1000u);
    BOOST_CHECK(last_event().type() == event::type_withdrawal_fulfilled);
}

BOOST_AUTO_TEST_CASE(rejected_withdrawal_pays_nothing)
{
    m_ledger.credit("alice", 1000);

    auto id = m_dispatcher.request_withdrawal("alice", 300);

    m_reconciler.on_outcome(id, test::rejected(), test::none());

    BOOST_CHECK_EQUAL(m_ledger.balance_of("alice"), 1000u);
    BOOST_CHECK(m_payouts.empty());
    BOOST_CHECK(last_event().type() == event::type_withdrawal_cancelled);
}

BOOST_AUTO_TEST_CASE(error_on_deposit_strands_funds)
{
    auto id = m_dispatcher.request_deposit("carol", 50);

    m_reconciler.on_outcome(
        id, test::none(), utility::to_bytes("script timed out")
    );

    BOOST_CHECK_EQUAL(m_ledger.balance_of("carol"), 0u);
    BOOST_CHECK_EQUAL(m_ledger.escrowed(), 0u);
    BOOST_CHECK_EQUAL(m_ledger.stranded_of("carol"), 50u);
    BOOST_CHECK(m_payouts.empty());
    BOOST_CHECK(last_event().type() == event::type_request_failed);
    BOOST_CHECK_EQUAL(last_event().reason(), "script timed out");
    BOOST_CHECK_EQUAL(m_registry.size(), 0u);
}

BOOST_AUTO_TEST_CASE(error_on_withdrawal_moves_nothing)
{
    m_ledger.credit("carol", 80);

    auto id = m_dispatcher.request_withdrawal("carol", 80);

    m_reconciler.on_outcome(id, test::none(), utility::to_bytes("boom"));

    BOOST_CHECK_EQUAL(m_ledger.balance_of("carol"), 80u);
    BOOST_CHECK_EQUAL(m_ledger.stranded(), 0u);
    BOOST_CHECK(last_event().type() == event::type_request_failed);
}

BOOST_AUTO_TEST_CASE(error_payload_wins_over_response)
{
    auto id = m_dispatcher.request_deposit("alice", 10);

    m_reconciler.on_outcome(id, test::approved(), utility::to_bytes("late"));

    BOOST_CHECK_EQUAL(m_ledger.balance_of("alice"), 0u);
    BOOST_CHECK(last_event().type() == event::type_request_failed);
}

BOOST_AUTO_TEST_CASE(malformed_response_is_an_error)
{
    auto id = m_dispatcher.request_deposit("alice", 10);

    m_reconciler.on_outcome(
        id, std::vector<std::uint8_t> (1, 1), test::none()
    );

    BOOST_CHECK_EQUAL(m_ledger.balance_of("alice"), 0u);
    BOOST_CHECK_EQUAL(m_ledger.stranded_of("alice"), 10u);
    BOOST_CHECK(last_event().type() == event::type_request_failed);
    BOOST_CHECK_EQUAL(last_event().reason(), "malformed response");
}

BOOST_AUTO_TEST_CASE(non_one_values_reject)
{
    auto id = m_dispatcher.request_deposit("alice", 10);

    m_reconciler.on_outcome(id, utility::encode_uint256(2), test::none());

    BOOST_CHECK_EQUAL(m_ledger.balance_of("alice"), 0u);
    BOOST_CHECK(last_event().type() == event::type_deposit_cancelled);
}

BOOST_AUTO_TEST_CASE(unknown_id_is_a_noop)
{
    m_ledger.credit("alice", 5);

    auto buf = utility::encode_uint256(12345);

    m_reconciler.on_outcome(
        sha256(&buf[0], buf.size()), test::approved(), test::none()
    );

    BOOST_CHECK_EQUAL(m_ledger.balance_of("alice"), 5u);
    BOOST_CHECK_EQUAL(m_events.size(), 1u);
    BOOST_CHECK(last_event().type() == event::type_no_pending_request);
}

BOOST_AUTO_TEST_CASE(approval_revalidates_balance)
{
    m_ledger.credit("alice", 1000);

    auto first = m_dispatcher.request_withdrawal("alice", 700);
    auto second = m_dispatcher.request_withdrawal("alice", 700);

    m_reconciler.on_outcome(first, test::approved(), test::none());
    m_reconciler.on_outcome(second, test::approved(), test::none());

    BOOST_CHECK_EQUAL(m_ledger.balance_of("alice"), 300u);
    BOOST_CHECK_EQUAL(m_payouts.size(), 1u);
    BOOST_CHECK(last_event().type() == event::type_withdrawal_cancelled);
    BOOST_CHECK_EQUAL(last_event().reason(), "insufficient funds");
}

BOOST_AUTO_TEST_CASE(failed_payout_rolls_back_debit)
{
    m_ledger.credit("alice", 100);

    auto id = m_dispatcher.request_withdrawal("alice", 100);

    m_payout_ok = false;

    m_reconciler.on_outcome(id, test::approved(), test::none());

    BOOST_CHECK_EQUAL(m_ledger.balance_of("alice"), 100u);
    BOOST_CHECK(last_event().type() == event::type_request_failed);
    BOOST_CHECK_EQUAL(last_event().reason(), "payout failed");
}

BOOST_AUTO_TEST_CASE(failed_refund_strands_funds)
{
    auto id = m_dispatcher.request_deposit("bob", 60);

    m_payout_ok = false;

    m_reconciler.on_outcome(id, test::rejected(), test::none());

    BOOST_CHECK_EQUAL(m_ledger.escrowed(), 0u);
    BOOST_CHECK_EQUAL(m_ledger.stranded_of("bob"), 60u);
    BOOST_CHECK(last_event().type() == event::type_request_failed);
    BOOST_CHECK_EQUAL(last_event().reason(), "refund failed");
}

BOOST_AUTO_TEST_CASE(credit_overflow_strands_funds)
{
    m_ledger.credit("alice", std::numeric_limits<std::uint64_t>::max());

    auto id = m_dispatcher.request_deposit("alice", 1);

    m_reconciler.on_outcome(id, test::approved(), test::none());

    BOOST_CHECK_EQUAL(
        m_ledger.balance_of("alice"), std::numeric_limits<std::uint64_t>::max()
    );
    BOOST_CHECK_EQUAL(m_ledger.stranded_of("alice"), 1u);
    BOOST_CHECK_EQUAL(m_ledger.escrowed(), 0u);
    BOOST_CHECK(last_event().type() == event::type_request_failed);
}

BOOST_AUTO_TEST_CASE(out_of_order_outcomes)
{
    auto a = m_dispatcher.request_deposit("alice", 1);
    auto b = m_dispatcher.request_deposit("bob", 2);
    auto c = m_dispatcher.request_deposit("carol", 3);

    m_reconciler.on_outcome(c, test::approved(), test::none());
    m_reconciler.on_outcome(a, test::rejected(), test::none());
    m_reconciler.on_outcome(b, test::approved(), test::none());

    BOOST_CHECK_EQUAL(m_ledger.balance_of("alice"), 0u);
    BOOST_CHECK_EQUAL(m_ledger.balance_of("bob"), 2u);
    BOOST_CHECK_EQUAL(m_ledger.balance_of("carol"), 3u);
    BOOST_CHECK_EQUAL(m_ledger.escrowed(), 0u);
    BOOST_CHECK_EQUAL(m_registry.size(), 0u);
}

BOOST_AUTO_TEST_CASE(expire_fails_stale_requests)
{
    auto id = m_dispatcher.request_deposit("alice", 25);

    BOOST_CHECK_EQUAL(m_reconciler.expire(std::time(0), 3600), 0u);
    BOOST_CHECK_EQUAL(m_reconciler.expire(std::time(0) + 3601, 3600), 1u);

    BOOST_CHECK(m_registry.exists(id) == false);
    BOOST_CHECK_EQUAL(m_ledger.stranded_of("alice"), 25u);
    BOOST_CHECK(last_event().type() == event::type_request_failed);
    BOOST_CHECK_EQUAL(last_event().reason(), "request expired");
}

BOOST_AUTO_TEST_CASE(throwing_event_handler_is_contained)
{
    m_reconciler.set_on_event([] (const event &)
    {
        throw std::runtime_error("listener failed");
    });

    auto id = m_dispatcher.request_deposit("alice", 10);

    BOOST_CHECK_NO_THROW(
        m_reconciler.on_outcome(id, test::approved(), test::none())
    );
    BOOST_CHECK_EQUAL(m_ledger.balance_of("alice"), 10u);
}

BOOST_AUTO_TEST_CASE(failed_deposit_always_fits_stranded_record)
{
    auto max = std::numeric_limits<std::uint64_t>::max();

    m_ledger.strand("alice", max - 10);

    auto id = m_dispatcher.request_deposit("alice", 10);

    m_reconciler.on_outcome(id, test::none(), utility::to_bytes("boom"));

    BOOST_CHECK_EQUAL(m_ledger.stranded_of("alice"), max);
    BOOST_CHECK_EQUAL(m_ledger.escrowed(), 0u);
    BOOST_CHECK(last_event().type() == event::type_request_failed);
    BOOST_CHECK_EQUAL(last_event().reason(), "boom");

    BOOST_CHECK_THROW(m_dispatcher.request_deposit("alice", 1), error);
    BOOST_CHECK_EQUAL(m_registry.size(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()
