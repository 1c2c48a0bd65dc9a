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

#include <vault/error.hpp>
#include <vault/ledger.hpp>
#include <vault/logger.hpp>

using namespace vault;

ledger::ledger()
    : m_escrowed(0)
{
    // ...
}

void ledger::credit(
    const std::string & principal, const std::uint64_t & amount
    )
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    auto value = balance_of(principal);

    if (value + amount < value)
    {
        throw error(
            error::error_balance_overflow, "Balance overflow for " + principal
        );
    }

    m_balances[principal] = value + amount;

    log_debug(
        "Ledger credited " << amount << " to " << principal <<
        ", balance = " << value + amount << "."
    );
}

std::uint64_t ledger::debit(
    const std::string & principal, const std::uint64_t & amount
    )
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    auto value = balance_of(principal);

    if (amount > value)
    {
        throw error(
            error::error_insufficient_funds,
            "Insufficient balance for " + principal
        );
    }

    value -= amount;

    if (value == 0)
    {
        m_balances.erase(principal);
    }
    else
    {
        m_balances[principal] = value;
    }

    log_debug(
        "Ledger debited " << amount << " from " << principal <<
        ", balance = " << value << "."
    );

    return amount;
}

std::uint64_t ledger::balance_of(const std::string & principal) const
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    auto it = m_balances.find(principal);

    if (it == m_balances.end())
    {
        return 0;
    }

    return it->second;
}

std::uint64_t ledger::total_balances() const
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    std::uint64_t ret = 0;

    for (auto & i : m_balances)
    {
        ret += i.second;
    }

    return ret;
}

std::map<std::string, std::uint64_t> ledger::snapshot() const
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    return m_balances;
}

void ledger::hold(const std::uint64_t & amount)
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    /**
     * Escrow plus stranded funds must stay representable, a failed deposit
     * is always able to move its escrow to the stranded record.
     */
    auto custody = m_escrowed + stranded();

    if (custody < m_escrowed || custody + amount < custody)
    {
        throw error(error::error_balance_overflow, "Escrow overflow");
    }

    m_escrowed += amount;
}

void ledger::release(const std::uint64_t & amount)
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    if (amount > m_escrowed)
    {
        throw error(
            error::error_insufficient_funds, "Escrow release exceeds holdings"
        );
    }

    m_escrowed -= amount;
}

std::uint64_t ledger::escrowed() const
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    return m_escrowed;
}

void ledger::strand(
    const std::string & principal, const std::uint64_t & amount
    )
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    auto & value = m_stranded[principal];

    if (value + amount < value)
    {
        throw error(
            error::error_balance_overflow,
            "Stranded funds overflow for " + principal
        );
    }

    value += amount;

    log_warn(
        "Ledger stranded " << amount << " belonging to " << principal <<
        ", total stranded = " << value << "."
    );
}

std::uint64_t ledger::unstrand(const std::string & principal)
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    auto it = m_stranded.find(principal);

    if (it == m_stranded.end())
    {
        return 0;
    }

    auto ret = it->second;

    m_stranded.erase(it);

    return ret;
}

std::uint64_t ledger::stranded_of(const std::string & principal) const
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    auto it = m_stranded.find(principal);

    if (it == m_stranded.end())
    {
        return 0;
    }

    return it->second;
}

std::uint64_t ledger::stranded() const
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    std::uint64_t ret = 0;

    for (auto & i : m_stranded)
    {
        ret += i.second;
    }

    return ret;
}
