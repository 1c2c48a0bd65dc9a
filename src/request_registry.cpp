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

#include <vault/logger.hpp>
#include <vault/request_registry.hpp>

using namespace vault;

request_registry::request_registry()
{
    // ...
}

bool request_registry::insert(const pending_request & val)
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    if (m_pending_requests.count(val.request_id()) > 0)
    {
        log_error(
            "Request registry refused duplicate request " <<
            val.request_id().to_string() << "."
        );

        return false;
    }

    m_pending_requests[val.request_id()] = val;

    log_debug(
        "Request registry inserted " << val.to_string() << ", size = " <<
        m_pending_requests.size() << "."
    );

    return true;
}

bool request_registry::take(const sha256 & request_id, pending_request & val)
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    auto it = m_pending_requests.find(request_id);

    if (it == m_pending_requests.end())
    {
        return false;
    }

    val = it->second;

    m_pending_requests.erase(it);

    return true;
}

bool request_registry::exists(const sha256 & request_id) const
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    return m_pending_requests.count(request_id) > 0;
}

std::size_t request_registry::size() const
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    return m_pending_requests.size();
}

std::uint64_t request_registry::total(
    const types::request_kind_t & kind
    ) const
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    std::uint64_t ret = 0;

    for (auto & i : m_pending_requests)
    {
        if (i.second.kind() == kind)
        {
            ret += i.second.amount();
        }
    }

    return ret;
}

std::vector<pending_request> request_registry::pending_for(
    const std::string & requester
    ) const
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    std::vector<pending_request> ret;

    for (auto & i : m_pending_requests)
    {
        if (i.second.requester() == requester)
        {
            ret.push_back(i.second);
        }
    }

    return ret;
}

std::vector<sha256> request_registry::expired(
    const std::time_t & now, const std::time_t & timeout
    ) const
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    std::vector<sha256> ret;

    for (auto & i : m_pending_requests)
    {
        if (now - i.second.time_dispatched() > timeout)
        {
            ret.push_back(i.first);
        }
    }

    return ret;
}
