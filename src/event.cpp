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

#include <sstream>

#include <vault/event.hpp>

using namespace vault;

event::event(
    const type_t & type, const sha256 & request_id,
    const std::string & requester, const std::uint64_t & amount,
    const std::string & reason
    )
    : m_type(type)
    , m_request_id(request_id)
    , m_requester(requester)
    , m_amount(amount)
    , m_reason(reason)
{
    // ...
}

const event::type_t & event::type() const
{
    return m_type;
}

const sha256 & event::request_id() const
{
    return m_request_id;
}

const std::string & event::requester() const
{
    return m_requester;
}

const std::uint64_t & event::amount() const
{
    return m_amount;
}

const std::string & event::reason() const
{
    return m_reason;
}

std::map<std::string, std::string> event::to_pairs() const
{
    std::map<std::string, std::string> ret;

    ret["type"] = type_to_string(m_type);
    ret["id"] = m_request_id.to_string();

    if (m_type != type_no_pending_request)
    {
        ret["requester"] = m_requester;
        ret["amount"] = std::to_string(m_amount);
    }

    if (m_reason.size() > 0)
    {
        ret["reason"] = m_reason;
    }

    return ret;
}

std::string event::to_string() const
{
    std::stringstream ss;

    ss << type_to_string(m_type) << " " << m_request_id.to_string();

    if (m_type != type_no_pending_request)
    {
        ss << " requester = " << m_requester << ", amount = " << m_amount;
    }

    if (m_reason.size() > 0)
    {
        ss << ", reason = " << m_reason;
    }

    return ss.str();
}

std::string event::type_to_string(const type_t & val)
{
    switch (val)
    {
        case type_deposit_requested:
            return "DepositRequested";
        case type_withdrawal_requested:
            return "WithdrawalRequested";
        case type_deposit_fulfilled:
            return "DepositFulfilled";
        case type_deposit_cancelled:
            return "DepositCancelled";
        case type_withdrawal_fulfilled:
            return "WithdrawalFulfilled";
        case type_withdrawal_cancelled:
            return "WithdrawalCancelled";
        case type_request_failed:
            return "RequestFailed";
        case type_no_pending_request:
            return "NoPendingRequest";
    }

    return "Unknown";
}
