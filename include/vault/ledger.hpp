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

#ifndef VAULT_LEDGER_HPP
#define VAULT_LEDGER_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace vault {

    /**
     * Implements the ledger of principal balances and the funds the vault
     * holds outside of any balance (escrowed deposits and stranded funds).
     */
    class ledger
    {
        public:

            /**
             * Constructor
             */
            ledger();

            /**
             * Increases the balance of a principal.
             * @param principal The principal.
             * @param amount The amount.
             */
            void credit(
                const std::string & principal, const std::uint64_t & amount
            );

            /**
             * Decreases the balance of a principal.
             * @param principal The principal.
             * @param amount The amount.
             * @return The amount to pay out.
             */
            std::uint64_t debit(
                const std::string & principal, const std::uint64_t & amount
            );

            /**
             * The balance of a principal.
             * @param principal The principal.
             */
            std::uint64_t balance_of(const std::string & principal) const;

            /**
             * The sum of all balances.
             */
            std::uint64_t total_balances() const;

            /**
             * A copy of all non-zero balances.
             */
            std::map<std::string, std::uint64_t> snapshot() const;

            /**
             * Holds deposited funds in escrow. Fails with
             * error_balance_overflow when the escrowed and stranded funds
             * together would overflow.
             * @param amount The amount.
             */
            void hold(const std::uint64_t & amount);

            /**
             * Releases funds from escrow.
             * @param amount The amount.
             */
            void release(const std::uint64_t & amount);

            /**
             * The escrowed (held, not credited) funds.
             */
            std::uint64_t escrowed() const;

            /**
             * Records funds belonging to a principal that could neither be
             * credited nor returned.
             * @param principal The principal.
             * @param amount The amount.
             */
            void strand(
                const std::string & principal, const std::uint64_t & amount
            );

            /**
             * Clears the stranded funds of a principal.
             * @param principal The principal.
             * @return The amount that was stranded.
             */
            std::uint64_t unstrand(const std::string & principal);

            /**
             * The stranded funds of a principal.
             * @param principal The principal.
             */
            std::uint64_t stranded_of(const std::string & principal) const;

            /**
             * The sum of all stranded funds.
             */
            std::uint64_t stranded() const;

        private:

            /**
             * The balances.
             */
            std::map<std::string, std::uint64_t> m_balances;

            /**
             * The stranded funds.
             */
            std::map<std::string, std::uint64_t> m_stranded;

            /**
             * The escrowed funds.
             */
            std::uint64_t m_escrowed;

        protected:

            /**
             * The mutex.
             */
            mutable std::recursive_mutex mutex_;
    };

} // namespace vault

#endif // VAULT_LEDGER_HPP
