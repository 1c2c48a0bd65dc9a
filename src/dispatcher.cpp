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

#include <vault/constants.hpp>
#include <vault/dispatcher.hpp>
#include <vault/error.hpp>
#include <vault/ledger.hpp>
#include <vault/logger.hpp>
#include <vault/oracle.hpp>
#include <vault/request_registry.hpp>

using namespace vault;

dispatcher::dispatcher(ledger & l, request_registry & r)
    : m_subscription_id(0)
    , m_gas_limit(constants::default_gas_limit)
    , ledger_(l)
    , request_registry_(r)
{
    // ...
}

sha256 dispatcher::request_deposit(
    const std::string & requester, const std::uint64_t & amount
    )
{
    if (amount == 0)
    {
        throw error(error::error_zero_amount, "Deposit amount is zero");
    }

    return dispatch(types::request_kind_deposit, requester, amount);
}

sha256 dispatcher::request_withdrawal(
    const std::string & requester, const std::uint64_t & amount
    )
{
    if (amount == 0)
    {
        throw error(error::error_zero_amount, "Withdrawal amount is zero");
    }

    /**
     * Eligibility is checked against the balance at dispatch time, the
     * reconciler checks it again when the approval arrives.
     */
    if (amount > ledger_.balance_of(requester))
    {
        throw error(
            error::error_insufficient_funds,
            "Withdrawal amount exceeds the balance of " + requester
        );
    }

    return dispatch(types::request_kind_withdrawal, requester, amount);
}

verification_request dispatcher::build_request(
    const types::request_kind_t & kind, const std::string & requester,
    const std::uint64_t & amount
    ) const
{
    std::vector<std::string> args;

    if (kind == types::request_kind_deposit)
    {
        args.push_back(constants::request_arg_deposit);
        args.push_back(requester);
    }
    else
    {
        args.push_back(constants::request_arg_withdrawal);
        args.push_back(requester);
        args.push_back(std::to_string(amount));
    }

    return verification_request(
        m_source, m_secrets, args, m_subscription_id, m_gas_limit
    );
}

sha256 dispatcher::dispatch(
    const types::request_kind_t & kind, const std::string & requester,
    const std::uint64_t & amount
    )
{
    if (requester.empty())
    {
        throw error(error::error_invalid_argument, "Requester is empty");
    }

    if (!m_oracle)
    {
        throw error(
            error::error_oracle_unavailable, "No oracle is configured"
        );
    }

    auto request = build_request(kind, requester, amount);

    /**
     * Any exception thrown by the oracle propagates before state changes.
     */
    auto request_id = m_oracle->send_request(request);

    pending_request entry(
        request_id, requester, amount, kind, std::time(0)
    );

    if (request_registry_.insert(entry) == false)
    {
        throw error(
            error::error_duplicate_request,
            "Oracle returned live request id " + request_id.to_string()
        );
    }

    if (kind == types::request_kind_deposit)
    {
        try
        {
            ledger_.hold(amount);
        }
        catch (error &)
        {
            pending_request ignored;

            request_registry_.take(request_id, ignored);

            throw;
        }
    }

    log_info("Dispatcher sent " << entry.to_string() << ".");

    /**
     * The request is committed, a failing listener must not lose its id.
     */
    if (m_on_event)
    {
        try
        {
            m_on_event(
                event(
                    kind == types::request_kind_deposit ?
                    event::type_deposit_requested :
                    event::type_withdrawal_requested,
                    request_id, requester, amount
                )
            );
        }
        catch (std::exception & e)
        {
            log_error(
                "Dispatcher event handler failed, what = " << e.what() << "."
            );
        }
    }

    return request_id;
}

void dispatcher::set_oracle(const std::shared_ptr<oracle> & val)
{
    m_oracle = val;
}

const std::shared_ptr<oracle> & dispatcher::get_oracle() const
{
    return m_oracle;
}

void dispatcher::set_source(const std::string & val)
{
    m_source = val;
}

const std::string & dispatcher::source() const
{
    return m_source;
}

void dispatcher::set_secrets(const std::vector<std::uint8_t> & val)
{
    m_secrets = val;
}

const std::vector<std::uint8_t> & dispatcher::secrets() const
{
    return m_secrets;
}

void dispatcher::set_subscription_id(const std::uint64_t & val)
{
    m_subscription_id = val;
}

const std::uint64_t & dispatcher::subscription_id() const
{
    return m_subscription_id;
}

void dispatcher::set_gas_limit(const std::uint32_t & val)
{
    m_gas_limit = val;
}

const std::uint32_t & dispatcher::gas_limit() const
{
    return m_gas_limit;
}

void dispatcher::set_on_event(const std::function<void (const event &)> & f)
{
    m_on_event = f;
}
