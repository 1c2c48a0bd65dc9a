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

#ifndef VAULT_STACK_IMPL_HPP
#define VAULT_STACK_IMPL_HPP

#include <chrono>
#include <cstdint>
#include <ctime>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>

#include <vault/configuration.hpp>
#include <vault/dispatcher.hpp>
#include <vault/ledger.hpp>
#include <vault/reconciler.hpp>
#include <vault/request_registry.hpp>
#include <vault/sha256.hpp>

namespace vault {

    class oracle;
    class stack;

    /**
     * The stack implementation. Every mutating operation runs under a
     * single std::recursive_mutex.
     */
    class stack_impl
    {
        public:

            /**
             * Constructor
             * @param owner The stack.
             */
            stack_impl(vault::stack & owner);

            /**
             * Starts the stack.
             */
            void start();

            /**
             * Stops the stack.
             */
            void stop();

            /**
             * Requests a deposit.
             * @param requester The requester.
             * @param amount The amount.
             */
            sha256 request_deposit(
                const std::string & requester, const std::uint64_t & amount
            );

            /**
             * Requests a withdrawal.
             * @param requester The requester.
             * @param amount The amount.
             */
            sha256 request_withdrawal(
                const std::string & requester, const std::uint64_t & amount
            );

            /**
             * Delivers the outcome of a verification request.
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
             * The pending requests of a requester.
             * @param requester The requester.
             */
            std::vector<pending_request> pending_requests_of(
                const std::string & requester
            );

            /**
             * The sum of the pending amounts of a kind.
             * @param kind The types::request_kind_t.
             */
            std::uint64_t pending_total(const types::request_kind_t & kind);

            /**
             * The owner.
             */
            std::string owner();

            /**
             * Sets the script source.
             * @param caller The caller.
             * @param val The value.
             */
            void set_source(const std::string & caller, const std::string & val);

            /**
             * Sets the encrypted secrets.
             * @param caller The caller.
             * @param val The value.
             */
            void set_secrets(
                const std::string & caller, const std::vector<std::uint8_t> & val
            );

            /**
             * Sets the billing subscription id.
             * @param caller The caller.
             * @param val The value.
             */
            void set_subscription_id(
                const std::string & caller, const std::uint64_t & val
            );

            /**
             * Sets the callback gas limit.
             * @param caller The caller.
             * @param val The value.
             */
            void set_gas_limit(
                const std::string & caller, const std::uint32_t & val
            );

            /**
             * Sets the oracle.
             * @param caller The caller.
             * @param val The oracle.
             */
            void set_oracle(
                const std::string & caller, const std::shared_ptr<oracle> & val
            );

            /**
             * Proposes a new owner.
             * @param caller The caller.
             * @param to The proposed owner.
             */
            void transfer_ownership(
                const std::string & caller, const std::string & to
            );

            /**
             * Accepts a proposed ownership transfer.
             * @param caller The caller.
             */
            void accept_ownership(const std::string & caller);

            /**
             * Pays out the stranded funds of a principal.
             * @param caller The caller.
             * @param principal The principal.
             */
            std::uint64_t release_stranded(
                const std::string & caller, const std::string & principal
            );

            /**
             * The configuration.
             */
            configuration & get_configuration();

        private:

            /**
             * Throws error_not_owner unless caller is the owner.
             * @param caller The caller.
             */
            void check_owner(const std::string & caller);

            /**
             * Runs the boost::asio::io_service.
             */
            void loop();

            /**
             * The expiry timer handler.
             * @param interval The interval.
             */
            void do_tick(const std::uint32_t & interval);

            /**
             * The configuration.
             */
            configuration m_configuration;

            /**
             * The ledger.
             */
            ledger m_ledger;

            /**
             * The request_registry.
             */
            request_registry m_request_registry;

            /**
             * The dispatcher.
             */
            dispatcher m_dispatcher;

            /**
             * The reconciler.
             */
            reconciler m_reconciler;

            /**
             * The proposed owner.
             */
            std::string m_pending_owner;

        protected:

            /**
             * The stack.
             */
            vault::stack & stack_;

            /**
             * The boost::asio::io_service.
             */
            boost::asio::io_service io_service_;

            /**
             * The boost::asio::io_service::strand.
             */
            boost::asio::io_service::strand strand_;

            /**
             * The boost::asio::io_service::work.
             */
            std::shared_ptr<boost::asio::io_service::work> work_;

            /**
             * The thread.
             */
            std::shared_ptr<std::thread> thread_;

            /**
             * The expiry timer.
             */
            boost::asio::basic_waitable_timer<
                std::chrono::steady_clock
            > timer_expiry_;

            /**
             * The std::recursive_mutex.
             */
            std::recursive_mutex mutex_;
    };

} // namespace vault

#endif // VAULT_STACK_IMPL_HPP
