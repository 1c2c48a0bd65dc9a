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

#include <vault/constants.hpp>
#include <vault/error.hpp>
#include <vault/ledger.hpp>
#include <vault/logger.hpp>
#include <vault/reconciler.hpp>
#include <vault/request_registry.hpp>
#include <vault/utility.hpp>

using namespace vault;

reconciler::reconciler(ledger & l, request_registry & r)
    : ledger_(l)
    , request_registry_(r)
{
    // ...
}

void reconciler::on_outcome(
    const sha256 & request_id, const std::vector<std::uint8_t> & response,
    const std::vector<std::uint8_t> & err
    )
{
    pending_request entry;

    /**
     * The entry is retired here, whatever the outcome turns out to be.
     */
    if (request_registry_.take(request_id, entry) == false)
    {
        log_warn(
            "Reconciler got outcome for unknown request " <<
            request_id.to_string() << ", dropping."
        );

        emit(event(event::type_no_pending_request, request_id));

        return;
    }

    try
    {
        if (err.size() > 0)
        {
            fail(entry, utility::printable(err));
        }
        else if (response.size() != constants::response_length)
        {
            fail(entry, "malformed response");
        }
        else
        {
            auto approved = utility::uint256_is_one(response);

            log_info(
                "Reconciler got " << (approved ? "approval" : "rejection") <<
                " for " << entry.to_string() << "."
            );

            if (entry.kind() == types::request_kind_deposit)
            {
                reconcile_deposit(entry, approved);
            }
            else
            {
                reconcile_withdrawal(entry, approved);
            }
        }
    }
    catch (std::exception & e)
    {
        log_error(
            "Reconciler failed to apply outcome for " << entry.to_string() <<
            ", what = " << e.what() << "."
        );

        emit(
            event(
                event::type_request_failed, request_id, entry.requester(),
                entry.amount(), e.what()
            )
        );
    }
}

std::size_t reconciler::expire(
    const std::time_t & now, const std::time_t & timeout
    )
{
    auto request_ids = request_registry_.expired(now, timeout);

    for (auto & i : request_ids)
    {
        log_info(
            "Reconciler is expiring request " << i.to_string() << "."
        );

        on_outcome(
            i, std::vector<std::uint8_t> (),
            utility::to_bytes("request expired")
        );
    }

    return request_ids.size();
}

void reconciler::set_on_event(const std::function<void (const event &)> & f)
{
    m_on_event = f;
}

void reconciler::set_on_payout(
    const std::function<bool (const std::string &, const std::uint64_t &)> & f
    )
{
    m_on_payout = f;
}

void reconciler::fail(const pending_request & entry, const std::string & reason)
{
    log_error(
        "Reconciler got verification error for " << entry.to_string() <<
        ", reason = " << reason << "."
    );

    if (entry.kind() == types::request_kind_deposit)
    {
        /**
         * The deposit was never credited, keep the funds on record for the
         * administrator instead of dropping them.
         */
        ledger_.strand(entry.requester(), entry.amount());
        ledger_.release(entry.amount());
    }

    emit(
        event(
            event::type_request_failed, entry.request_id(), entry.requester(),
            entry.amount(), reason
        )
    );
}

void reconciler::reconcile_deposit(
    const pending_request & entry, const bool & approved
    )
{
    if (approved)
    {
        try
        {
            ledger_.credit(entry.requester(), entry.amount());
        }
        catch (error & e)
        {
            fail(entry, e.what());

            return;
        }

        ledger_.release(entry.amount());

        emit(
            event(
                event::type_deposit_fulfilled, entry.request_id(),
                entry.requester(), entry.amount()
            )
        );
    }
    else
    {
        if (pay(entry.requester(), entry.amount()) == false)
        {
            fail(entry, "refund failed");

            return;
        }

        ledger_.release(entry.amount());

        emit(
            event(
                event::type_deposit_cancelled, entry.request_id(),
                entry.requester(), entry.amount()
            )
        );
    }
}

void reconciler::reconcile_withdrawal(
    const pending_request & entry, const bool & approved
    )
{
    if (approved == false)
    {
        emit(
            event(
                event::type_withdrawal_cancelled, entry.request_id(),
                entry.requester(), entry.amount()
            )
        );

        return;
    }

    /**
     * The balance may have shrunk since dispatch (another withdrawal of the
     * same requester approved first).
     */
    if (entry.amount() > ledger_.balance_of(entry.requester()))
    {
        log_warn(
            "Reconciler cancelled approved " << entry.to_string() <<
            ", balance = " << ledger_.balance_of(entry.requester()) << "."
        );

        emit(
            event(
                event::type_withdrawal_cancelled, entry.request_id(),
                entry.requester(), entry.amount(),
                error::code_to_string(error::error_insufficient_funds)
            )
        );

        return;
    }

    auto amount = ledger_.debit(entry.requester(), entry.amount());

    if (pay(entry.requester(), amount) == false)
    {
        ledger_.credit(entry.requester(), amount);

        log_error(
            "Reconciler rolled back " << entry.to_string() <<
            ", payout failed."
        );

        emit(
            event(
                event::type_request_failed, entry.request_id(),
                entry.requester(), entry.amount(), "payout failed"
            )
        );

        return;
    }

    emit(
        event(
            event::type_withdrawal_fulfilled, entry.request_id(),
            entry.requester(), amount
        )
    );
}

bool reconciler::pay(const std::string & principal, const std::uint64_t & amount)
{
    if (m_on_payout)
    {
        try
        {
            return m_on_payout(principal, amount);
        }
        catch (std::exception & e)
        {
            log_error(
                "Reconciler payout of " << amount << " to " << principal <<
                " failed, what = " << e.what() << "."
            );

            return false;
        }
    }

    log_debug(
        "Reconciler has no payout handler, " << amount << " to " <<
        principal << " is settled externally."
    );

    return true;
}

void reconciler::emit(const event & val)
{
    log_info("Reconciler emitting " << val.to_string() << ".");

    if (m_on_event)
    {
        try
        {
            m_on_event(val);
        }
        catch (std::exception & e)
        {
            log_error(
                "Reconciler event handler failed, what = " << e.what() << "."
            );
        }
    }
}
