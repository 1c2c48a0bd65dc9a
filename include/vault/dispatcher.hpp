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

#ifndef VAULT_DISPATCHER_HPP
#define VAULT_DISPATCHER_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <vault/event.hpp>
#include <vault/sha256.hpp>
#include <vault/types.hpp>
#include <vault/verification_request.hpp>

namespace vault {

    class ledger;
    class oracle;
    class request_registry;

    /**
     * Implements the dispatcher. Validates deposit and withdrawal
     * requests, sends them to the oracle and records them as pending.
     */
    class dispatcher
    {
        public:

            /**
             * Constructor
             * @param l The ledger.
             * @param r The request_registry.
             */
            dispatcher(ledger & l, request_registry & r);

            /**
             * Requests a deposit. The amount is held in escrow until the
             * outcome arrives.
             * @param requester The requester.
             * @param amount The amount.
             * @return The request id.
             */
            sha256 request_deposit(
                const std::string & requester, const std::uint64_t & amount
            );

            /**
             * Requests a withdrawal. No funds move until the outcome
             * arrives.
             * @param requester The requester.
             * @param amount The amount.
             * @return The request id.
             */
            sha256 request_withdrawal(
                const std::string & requester, const std::uint64_t & amount
            );

            /**
             * Builds the verification request for a kind.
             * @param kind The types::request_kind_t.
             * @param requester The requester.
             * @param amount The amount.
             */
            verification_request build_request(
                const types::request_kind_t & kind,
                const std::string & requester, const std::uint64_t & amount
            ) const;

            /**
             * Sets the oracle.
             * @param val The oracle.
             */
            void set_oracle(const std::shared_ptr<oracle> & val);

            /**
             * The oracle.
             */
            const std::shared_ptr<oracle> & get_oracle() const;

            /**
             * Sets the script source.
             * @param val The value.
             */
            void set_source(const std::string & val);

            /**
             * The script source.
             */
            const std::string & source() const;

            /**
             * Sets the encrypted secrets.
             * @param val The value.
             */
            void set_secrets(const std::vector<std::uint8_t> & val);

            /**
             * The encrypted secrets.
             */
            const std::vector<std::uint8_t> & secrets() const;

            /**
             * Sets the billing subscription id.
             * @param val The value.
             */
            void set_subscription_id(const std::uint64_t & val);

            /**
             * The billing subscription id.
             */
            const std::uint64_t & subscription_id() const;

            /**
             * Sets the callback gas limit.
             * @param val The value.
             */
            void set_gas_limit(const std::uint32_t & val);

            /**
             * The callback gas limit.
             */
            const std::uint32_t & gas_limit() const;

            /**
             * Sets the event handler.
             * @param f The std::function.
             */
            void set_on_event(const std::function<void (const event &)> & f);

        private:

            /**
             * Sends the request and records the pending entry.
             * @param kind The types::request_kind_t.
             * @param requester The requester.
             * @param amount The amount.
             */
            sha256 dispatch(
                const types::request_kind_t & kind,
                const std::string & requester, const std::uint64_t & amount
            );

            /**
             * The oracle.
             */
            std::shared_ptr<oracle> m_oracle;

            /**
             * The script source.
             */
            std::string m_source;

            /**
             * The encrypted secrets.
             */
            std::vector<std::uint8_t> m_secrets;

            /**
             * The billing subscription id.
             */
            std::uint64_t m_subscription_id;

            /**
             * The callback gas limit.
             */
            std::uint32_t m_gas_limit;

            /**
             * The event handler.
             */
            std::function<void (const event &)> m_on_event;

        protected:

            /**
             * The ledger.
             */
            ledger & ledger_;

            /**
             * The request_registry.
             */
            request_registry & request_registry_;
    };

} // namespace vault

#endif // VAULT_DISPATCHER_HPP
