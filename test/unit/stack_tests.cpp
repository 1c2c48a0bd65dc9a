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

#include <cstdio>
#include <ctime>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/test/unit_test.hpp>

#include <vault/configuration.hpp>
#include <vault/error.hpp>
#include <vault/stack.hpp>

#include "mock_oracle.hpp"

using namespace vault;

namespace {

    /**
     * Records events and payouts.
     */
    class test_stack : public stack
    {
        public:

            test_stack()
                : m_payout_ok(true)
            {
                // ...
            }

            virtual void on_event(const event & val)
            {
                m_events.push_back(val);
            }

            virtual bool on_payout(
                const std::string & principal, const std::uint64_t & amount
                )
            {
                if (m_payout_ok)
                {
                    m_payouts.push_back(std::make_pair(principal, amount));
                }

                return m_payout_ok;
            }

            std::size_t count(const event::type_t & type) const
            {
                std::size_t ret = 0;

                for (auto & i : m_events)
                {
                    if (i.type() == type)
                    {
                        ++ret;
                    }
                }

                return ret;
            }

            bool m_payout_ok;
            std::vector<event> m_events;
            std::vector< std::pair<std::string, std::uint64_t> > m_payouts;
    };

    struct stack_fixture
    {
        stack_fixture()
            : m_path("vault_stack_test.json")
            , m_oracle(std::make_shared<test::mock_oracle> ())
        {
            std::remove(m_path.c_str());

            start(std::map<std::string, std::string> ());
        }

        ~stack_fixture()
        {
            m_stack.stop();

            std::remove(m_path.c_str());
        }

        void start(std::map<std::string, std::string> args)
        {
            args["config"] = m_path;
            args["owner"] = "admin";

            m_stack.start(args);
            m_stack.set_oracle("admin", m_oracle);
        }

        void restart(const std::map<std::string, std::string> & args)
        {
            m_stack.stop();

            start(args);
        }

        void fund(const std::string & principal, const std::uint64_t & amount)
        {
            auto id = m_stack.request_deposit(principal, amount);

            m_stack.on_outcome(id, test::approved(), test::none());
        }

        std::string m_path;
        std::shared_ptr<test::mock_oracle> m_oracle;
        test_stack m_stack;
    };

} // namespace

BOOST_FIXTURE_TEST_SUITE(stack_tests, stack_fixture)

BOOST_AUTO_TEST_CASE(deposit_approved)
{
    auto id = m_stack.request_deposit("u", 1000);

    BOOST_CHECK_EQUAL(m_stack.pending_requests(), 1u);
    BOOST_CHECK_EQUAL(m_stack.escrowed(), 1000u);

    m_stack.on_outcome(id, test::approved(), test::none());

    BOOST_CHECK_EQUAL(m_stack.balance_of("u"), 1000u);
    BOOST_CHECK_EQUAL(m_stack.escrowed(), 0u);
    BOOST_CHECK_EQUAL(m_stack.pending_requests(), 0u);
    BOOST_CHECK_EQUAL(m_stack.count(event::type_deposit_requested), 1u);
    BOOST_CHECK_EQUAL(m_stack.count(event::type_deposit_fulfilled), 1u);
}

BOOST_AUTO_TEST_CASE(deposit_rejected)
{
    auto id = m_stack.request_deposit("u", 1000);

    m_stack.on_outcome(id, test::rejected(), test::none());

    BOOST_CHECK_EQUAL(m_stack.balance_of("u"), 0u);
    BOOST_REQUIRE_EQUAL(m_stack.m_payouts.size(), 1u);
    BOOST_CHECK_EQUAL(m_stack.m_payouts[0].first, "u");
    BOOST_CHECK_EQUAL(m_stack.m_payouts[0].second, 1000u);
    BOOST_CHECK_EQUAL(m_stack.count(event::type_deposit_cancelled), 1u);
}

BOOST_AUTO_TEST_CASE(round_trip_withdrawal_approved)
{
    fund("u", 1000);

    auto id = m_stack.request_withdrawal("u", 1000);

    m_stack.on_outcome(id, test::approved(), test::none());

    BOOST_CHECK_EQUAL(m_stack.balance_of("u"), 0u);
    BOOST_REQUIRE_EQUAL(m_stack.m_payouts.size(), 1u);
    BOOST_CHECK_EQUAL(m_stack.m_payouts[0].second, 1000u);
    BOOST_CHECK_EQUAL(m_stack.count(event::type_withdrawal_fulfilled), 1u);
}

BOOST_AUTO_TEST_CASE(withdrawal_rejected)
{
    fund("u", 1000);

    auto id = m_stack.request_withdrawal("u", 1000);

    m_stack.on_outcome(id, test::rejected(), test::none());

    BOOST_CHECK_EQUAL(m_stack.balance_of("u"), 1000u);
    BOOST_CHECK(m_stack.m_payouts.empty());
    BOOST_CHECK_EQUAL(m_stack.count(event::type_withdrawal_cancelled), 1u);
}

BOOST_AUTO_TEST_CASE(unknown_request)
{
    fund("u", 1000);

    auto events = m_stack.m_events.size();

    auto buf = utility::encode_uint256(424242);

    m_stack.on_outcome(
        sha256(&buf[0], buf.size()), test::approved(), test::none()
    );

    BOOST_CHECK_EQUAL(m_stack.balance_of("u"), 1000u);
    BOOST_REQUIRE_EQUAL(m_stack.m_events.size(), events + 1);
    BOOST_CHECK(
        m_stack.m_events.back().type() == event::type_no_pending_request
    );
}

BOOST_AUTO_TEST_CASE(withdrawal_error)
{
    fund("u", 1000);

    auto id = m_stack.request_withdrawal("u", 1000);

    m_stack.on_outcome(id, test::none(), utility::to_bytes("unreachable"));

    BOOST_CHECK_EQUAL(m_stack.balance_of("u"), 1000u);
    BOOST_CHECK_EQUAL(m_stack.count(event::type_request_failed), 1u);
    BOOST_CHECK_EQUAL(m_stack.pending_requests(), 0u);
}

BOOST_AUTO_TEST_CASE(funds_are_conserved)
{
    fund("a", 300);

    auto d1 = m_stack.request_deposit("b", 200);
    auto d2 = m_stack.request_deposit("c", 100);
    auto w1 = m_stack.request_withdrawal("a", 50);

    BOOST_CHECK_EQUAL(m_stack.escrowed(), 300u);

    m_stack.on_outcome(d2, test::none(), utility::to_bytes("failed"));
    m_stack.on_outcome(w1, test::approved(), test::none());
    m_stack.on_outcome(d1, test::approved(), test::none());

    /**
     * In: 600 deposited. Out: 50 paid. The rest is in balances or on
     * record as stranded.
     */
    BOOST_CHECK_EQUAL(m_stack.total_balances(), 450u);
    BOOST_CHECK_EQUAL(m_stack.stranded(), 100u);
    BOOST_CHECK_EQUAL(m_stack.escrowed(), 0u);
}

BOOST_AUTO_TEST_CASE(administration_is_owner_only)
{
    BOOST_CHECK_EQUAL(m_stack.owner(), "admin");

    try
    {
        m_stack.set_gas_limit("mallory", 1);

        BOOST_FAIL("non-owner changed the gas limit");
    }
    catch (error & e)
    {
        BOOST_CHECK_EQUAL(e.code(), error::error_not_owner);
    }

    BOOST_CHECK_THROW(m_stack.set_source("mallory", "x"), error);
    BOOST_CHECK_THROW(
        m_stack.set_secrets("mallory", std::vector<std::uint8_t> ()), error
    );
    BOOST_CHECK_THROW(m_stack.set_subscription_id("mallory", 1), error);
    BOOST_CHECK_THROW(
        m_stack.set_oracle("mallory", std::shared_ptr<oracle> ()), error
    );
    BOOST_CHECK_THROW(m_stack.release_stranded("mallory", "u"), error);

    m_stack.set_source("admin", "return verdict");
    m_stack.set_secrets("admin", std::vector<std::uint8_t> (2, 0x11));
    m_stack.set_subscription_id("admin", 9);
    m_stack.set_gas_limit("admin", 200000);

    m_stack.request_deposit("u", 1);

    auto & request = m_oracle->requests().back();

    BOOST_CHECK_EQUAL(request.source(), "return verdict");
    BOOST_CHECK_EQUAL(request.secrets().size(), 2u);
    BOOST_CHECK_EQUAL(request.subscription_id(), 9u);
    BOOST_CHECK_EQUAL(request.gas_limit(), 200000u);
}

BOOST_AUTO_TEST_CASE(settings_survive_restart)
{
    m_stack.set_gas_limit("admin", 123000);
    m_stack.set_secrets("admin", std::vector<std::uint8_t> (4, 0xab));

    restart(std::map<std::string, std::string> ());

    m_stack.request_deposit("u", 1);

    auto & request = m_oracle->requests().back();

    BOOST_CHECK_EQUAL(request.gas_limit(), 123000u);
    BOOST_CHECK(request.secrets() == std::vector<std::uint8_t> (4, 0xab));
}

BOOST_AUTO_TEST_CASE(ownership_transfer_needs_acceptance)
{
    BOOST_CHECK_THROW(m_stack.transfer_ownership("bob", "bob"), error);

    m_stack.transfer_ownership("admin", "bob");

    BOOST_CHECK_EQUAL(m_stack.owner(), "admin");
    BOOST_CHECK_THROW(m_stack.accept_ownership("carol"), error);

    m_stack.accept_ownership("bob");

    BOOST_CHECK_EQUAL(m_stack.owner(), "bob");
    BOOST_CHECK_THROW(m_stack.set_gas_limit("admin", 1), error);
    BOOST_CHECK_NO_THROW(m_stack.set_gas_limit("bob", 1));
    BOOST_CHECK_THROW(m_stack.accept_ownership("bob"), error);
}

BOOST_AUTO_TEST_CASE(stranded_funds_are_released_by_owner)
{
    auto id = m_stack.request_deposit("u", 70);

    m_stack.on_outcome(id, test::none(), utility::to_bytes("boom"));

    BOOST_CHECK_EQUAL(m_stack.stranded_of("u"), 70u);

    m_stack.m_payout_ok = false;

    BOOST_CHECK_THROW(
        m_stack.release_stranded("admin", "u"), std::runtime_error
    );
    BOOST_CHECK_EQUAL(m_stack.stranded_of("u"), 70u);

    m_stack.m_payout_ok = true;

    BOOST_CHECK_EQUAL(m_stack.release_stranded("admin", "u"), 70u);
    BOOST_CHECK_EQUAL(m_stack.stranded_of("u"), 0u);
    BOOST_REQUIRE_EQUAL(m_stack.m_payouts.size(), 1u);
    BOOST_CHECK_EQUAL(m_stack.m_payouts[0].second, 70u);
    BOOST_CHECK_EQUAL(m_stack.release_stranded("admin", "u"), 0u);
}

BOOST_AUTO_TEST_CASE(expiry_is_disabled_by_default)
{
    m_stack.request_deposit("u", 5);

    BOOST_CHECK_EQUAL(m_stack.expire_requests(std::time(0) + 1000000), 0u);
    BOOST_CHECK_EQUAL(m_stack.pending_requests(), 1u);
}

BOOST_AUTO_TEST_CASE(expiry_fails_stale_requests)
{
    std::map<std::string, std::string> args;

    args["request.timeout"] = "60";

    restart(args);

    m_stack.request_deposit("u", 5);

    BOOST_CHECK_EQUAL(m_stack.expire_requests(std::time(0)), 0u);
    BOOST_CHECK_EQUAL(m_stack.expire_requests(std::time(0) + 61), 1u);
    BOOST_CHECK_EQUAL(m_stack.pending_requests(), 0u);
    BOOST_CHECK_EQUAL(m_stack.stranded_of("u"), 5u);
    BOOST_CHECK_EQUAL(m_stack.count(event::type_request_failed), 1u);
}

BOOST_AUTO_TEST_CASE(pending_audit)
{
    fund("u", 1000);

    m_stack.request_deposit("u", 300);
    m_stack.request_deposit("v", 200);
    m_stack.request_withdrawal("u", 400);

    BOOST_CHECK_EQUAL(
        m_stack.pending_total(types::request_kind_deposit), 500u
    );
    BOOST_CHECK_EQUAL(
        m_stack.pending_total(types::request_kind_deposit), m_stack.escrowed()
    );
    BOOST_CHECK_EQUAL(
        m_stack.pending_total(types::request_kind_withdrawal), 400u
    );
    BOOST_CHECK_EQUAL(m_stack.pending_requests_of("u").size(), 2u);
    BOOST_CHECK_EQUAL(m_stack.pending_requests_of("w").size(), 0u);
}

BOOST_AUTO_TEST_CASE(start_twice_throws)
{
    BOOST_CHECK_THROW(
        m_stack.start(std::map<std::string, std::string> ()),
        std::runtime_error
    );
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(stack_lifecycle_tests)

BOOST_AUTO_TEST_CASE(stopped_stack_refuses_calls)
{
    stack s;

    BOOST_CHECK_THROW(s.request_deposit("u", 1), std::runtime_error);
    BOOST_CHECK_THROW(s.on_outcome(sha256(), test::approved(), test::none()),
        std::runtime_error
    );
    BOOST_CHECK_THROW(s.stop(), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()
