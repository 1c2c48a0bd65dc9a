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

#ifndef VAULT_RECONCILER_HPP
#define VAULT_RECONCILER_HPP

#include <cstdint>
#include <ctime>
#include <functional>
#include <string>
#include <vector>

#include <vault/event.hpp>
#include <vault/pending_request.hpp>
#include <vault/sha256.hpp>

namespace vault {

    class ledger;
    class request_registry;

    /**
     * Implements the reconciler. Consumes the outcome of a verification
     * request exactly once: the pending entry is retired before any effect
     * runs and no outcome ever throws.
     *
     * Outcomes:
     * - error payload: no balance change, deposit funds are stranded.
     * - deposit approved: escrow credited to the requester.
     * - deposit rejected: escrow refunded to the requester.
     * - withdrawal approved: debited and paid out (cancelled when the
     *   balance no longer covers it).
     * - withdrawal rejected: nothing moves.
     * - unknown id: nothing moves.
     */
    class reconciler
    {
        public:

            /**
             * Constructor
             * @param l The ledger.
             * @param r The request_registry.
             */
            reconciler(ledger & l, request_registry & r);

            /**
             * Handles the outcome of a request.
             * @param request_id The request id.
             * @param response The response (32 byte big-endian integer).
             * @param err The error.
             */
            void on_outcome(
                const sha256 & request_id,
                const std::vector<std::uint8_t> & response,
                const std::vector<std::uint8_t> & err
            );

            /**
             * Fails every request dispatched more than timeout seconds
             * before now.
             * @param now The time now.
             * @param timeout The timeout in seconds.
             * @return The number of requests expired.
             */
            std::size_t expire(
                const std::time_t & now, const std::time_t & timeout
            );

            /**
             * Sets the event handler.
             * @param f The std::function.
             */
            void set_on_event(const std::function<void (const event &)> & f);

            /**
             * Sets the payout handler, it returns false when the funds
             * could not be transferred.
             * @param f The std::function.
             */
            void set_on_payout(
                const std::function<
                bool (const std::string &, const std::uint64_t &)> & f
            );

        private:

            /**
             * Applies an error outcome.
             * @param entry The pending_request.
             * @param reason The reason.
             */
            void fail(const pending_request & entry, const std::string & reason);

            /**
             * Applies a deposit outcome.
             * @param entry The pending_request.
             * @param approved If true the deposit was approved.
             */
            void reconcile_deposit(
                const pending_request & entry, const bool & approved
            );

            /**
             * Applies a withdrawal outcome.
             * @param entry The pending_request.
             * @param approved If true the withdrawal was approved.
             */
            void reconcile_withdrawal(
                const pending_request & entry, const bool & approved
            );

            /**
             * Pays funds out to a principal.
             * @param principal The principal.
             * @param amount The amount.
             */
            bool pay(const std::string & principal, const std::uint64_t & amount);

            /**
             * Emits an event.
             * @param val The event.
             */
            void emit(const event & val);

            /**
             * The event handler.
             */
            std::function<void (const event &)> m_on_event;

            /**
             * The payout handler.
             */
            std::function<
                bool (const std::string &, const std::uint64_t &)
            > m_on_payout;

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

#endif // VAULT_RECONCILER_HPP
