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

#ifndef VAULT_VERIFICATION_REQUEST_HPP
#define VAULT_VERIFICATION_REQUEST_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace vault {

    /**
     * Implements a verification request as handed to an oracle.
     * args[0] is "0" (deposit) or "1" (withdrawal), args[1] is the
     * requester and args[2] the decimal amount (withdrawals only).
     */
    class verification_request
    {
        public:

            /**
             * Constructor
             */
            verification_request()
                : m_subscription_id(0)
                , m_gas_limit(0)
            {
                // ...
            }

            /**
             * Constructor
             * @param source The script source.
             * @param secrets The encrypted secrets.
             * @param args The arguments.
             * @param subscription_id The billing subscription id.
             * @param gas_limit The callback gas limit.
             */
            verification_request(
                const std::string & source,
                const std::vector<std::uint8_t> & secrets,
                const std::vector<std::string> & args,
                const std::uint64_t & subscription_id,
                const std::uint32_t & gas_limit
                )
                : m_source(source)
                , m_secrets(secrets)
                , m_args(args)
                , m_subscription_id(subscription_id)
                , m_gas_limit(gas_limit)
            {
                // ...
            }

            /**
             * The script source.
             */
            const std::string & source() const
            {
                return m_source;
            }

            /**
             * The encrypted secrets.
             */
            const std::vector<std::uint8_t> & secrets() const
            {
                return m_secrets;
            }

            /**
             * The arguments.
             */
            const std::vector<std::string> & args() const
            {
                return m_args;
            }

            /**
             * The billing subscription id.
             */
            const std::uint64_t & subscription_id() const
            {
                return m_subscription_id;
            }

            /**
             * The callback gas limit.
             */
            const std::uint32_t & gas_limit() const
            {
                return m_gas_limit;
            }

        private:

            std::string m_source;
            std::vector<std::uint8_t> m_secrets;
            std::vector<std::string> m_args;
            std::uint64_t m_subscription_id;
            std::uint32_t m_gas_limit;

        protected:

            // ...
    };

} // namespace vault

#endif // VAULT_VERIFICATION_REQUEST_HPP
