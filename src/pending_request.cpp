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

#include <vault/pending_request.hpp>

using namespace vault;

pending_request::pending_request()
    : m_amount(0)
    , m_kind(types::request_kind_deposit)
    , m_time_dispatched(0)
{
    // ...
}

pending_request::pending_request(
    const sha256 & request_id, const std::string & requester,
    const std::uint64_t & amount, const types::request_kind_t & kind,
    const std::time_t & time_dispatched
    )
    : m_request_id(request_id)
    , m_requester(requester)
    , m_amount(amount)
    , m_kind(kind)
    , m_time_dispatched(time_dispatched)
{
    // ...
}

const sha256 & pending_request::request_id() const
{
    return m_request_id;
}

const std::string & pending_request::requester() const
{
    return m_requester;
}

const std::uint64_t & pending_request::amount() const
{
    return m_amount;
}

const types::request_kind_t & pending_request::kind() const
{
    return m_kind;
}

const std::time_t & pending_request::time_dispatched() const
{
    return m_time_dispatched;
}

std::string pending_request::to_string() const
{
    std::stringstream ss;

    ss << types::request_kind_to_string(m_kind) << " " <<
        m_request_id.to_string().substr(0, 8) << " requester = " <<
        m_requester << ", amount = " << m_amount
    ;

    return ss.str();
}
