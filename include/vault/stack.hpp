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

#ifndef VAULT_STACK_HPP
#define VAULT_STACK_HPP

#include <cstdint>
#include <ctime>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <vault/event.hpp>
#include <vault/pending_request.hpp>
#include <vault/sha256.hpp>
#include <vault/types.hpp>

namespace vault {

    class oracle;
    class stack_impl;

    /**
     * The stack.
     */
    class stack
    {
        public:

            /**
             * Constructor
             */
            stack();

            /**
             * Destructor
             */
            virtual ~stack();

            /**
             * Starts the stack.
             * @param args The arguments.
             */
            void start(
                const std::map<std::string, std::string> & args =
                std::map<std::string, std::string> ()
            );

            /**
             * Stops the stack.
             */
            void stop();

            /**
             * Requests a deposit of amount by requester.
             * @param requester The requester.
             * @param amount The amount.
             * @return The request id.
             */
            sha256 request_deposit(
                const std::string & requester, const std::uint64_t & amount
            );

            /**
             * Requests a withdrawal of amount by requester.
             * @param requester The requester.
             * @param amount The amount.
             * @return The request id.
             */
            sha256 request_withdrawal(
                const std::string & requester, const std::uint64_t & amount
            );

            /**
             * Delivers the outcome of a verification request, called by the
             * oracle.
             * @param request_id The request id.
             * @param response The response.
             * @param err The error.
             */
            void on_outcome(
                const sha256 & request_id,
                const std::vector<std::uint8_t> & response,
                const std::vector<std::uint8_t> & err
            );

            /**
             * Expires the requests older than the configured timeout.
             * @param now The time now.
             * @return The number of requests expired.
             */
            std::size_t expire_requests(const std::time_t & now);

            /**
             * The balance of a principal.
             * @param principal The principal.
             */
            std::uint64_t balance_of(const std::string & principal);

            /**
             * The stranded funds of a principal.
             * @param principal The principal.
             */
            std::uint64_t stranded_of(const std::string & principal);

            /**
             * The funds held in escrow.
             */
            std::uint64_t escrowed();

            /**
             * The sum of all stranded funds.
             */
            std::uint64_t stranded();

            /**
             * The sum of all balances.
             */
            std::uint64_t total_balances();

            /**
             * The number of pending requests.
             */
            std::size_t pending_requests();

            /**
             * The pending requests of a requester (audit).
             * @param requester The requester.
             */
            std::vector<pending_request> pending_requests_of(
                const std::string & requester
            );

            /**
             * The sum of the pending amounts of a kind (audit). For
             * deposits it equals escrowed().
             * @param kind The types::request_kind_t.
             */
            std::uint64_t pending_total(const types::request_kind_t & kind);

            /**
             * The owner.
             */
            std::string owner();

            /**
             * Sets the script source (owner only).
             * @param caller The caller.
             * @param val The value.
             */
            void set_source(const std::string & caller, const std::string & val);

            /**
             * Sets the encrypted secrets (owner only).
             * @param caller The caller.
             * @param val The value.
             */
            void set_secrets(
                const std::string & caller, const std::vector<std::uint8_t> & val
            );

            /**
             * Sets the billing subscription id (owner only).
             * @param caller The caller.
             * @param val The value.
             */
            void set_subscription_id(
                const std::string & caller, const std::uint64_t & val
            );

            /**
             * Sets the callback gas limit (owner only).
             * @param caller The caller.
             * @param val The value.
             */
            void set_gas_limit(
                const std::string & caller, const std::uint32_t & val
            );

            /**
             * Sets the oracle (owner only).
             * @param caller The caller.
             * @param val The oracle.
             */
            void set_oracle(
                const std::string & caller, const std::shared_ptr<oracle> & val
            );

            /**
             * Proposes a new owner (owner only).
             * @param caller The caller.
             * @param to The proposed owner.
             */
            void transfer_ownership(
                const std::string & caller, const std::string & to
            );

            /**
             * Accepts a proposed ownership transfer.
             * @param caller The caller (the proposed owner).
             */
            void accept_ownership(const std::string & caller);

            /**
             * Pays out the stranded funds of a principal (owner only).
             * @param caller The caller.
             * @param principal The principal.
             * @return The amount paid out.
             */
            std::uint64_t release_stranded(
                const std::string & caller, const std::string & principal
            );

            /**
             * Called when an event occurs.
             * @param val The event.
             */
            virtual void on_event(const event & val);

            /**
             * Called when funds must be paid out to a principal.
             * @param principal The principal.
             * @param amount The amount.
             * @return False if the funds could not be transferred.
             */
            virtual bool on_payout(
                const std::string & principal, const std::uint64_t & amount
            );

        private:

            // ...

        protected:

            /**
             * The stack implementation.
             */
            stack_impl * stack_impl_;
    };

} // namespace vault

#endif // VAULT_STACK_HPP
