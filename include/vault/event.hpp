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

#ifndef VAULT_EVENT_HPP
#define VAULT_EVENT_HPP

#include <cstdint>
#include <map>
#include <string>

#include <vault/sha256.hpp>

namespace vault {

    /**
     * Implements an observable event.
     */
    class event
    {
        public:

            /**
             * The event types.
             */
            typedef enum
            {
                type_deposit_requested,
                type_withdrawal_requested,
                type_deposit_fulfilled,
                type_deposit_cancelled,
                type_withdrawal_fulfilled,
                type_withdrawal_cancelled,
                type_request_failed,
                type_no_pending_request,
            } type_t;

            /**
             * Constructor
             * @param type The type_t.
             * @param request_id The request id.
             * @param requester The requester.
             * @param amount The amount.
             * @param reason The reason.
             */
            event(
                const type_t & type, const sha256 & request_id,
                const std::string & requester = std::string(),
                const std::uint64_t & amount = 0,
                const std::string & reason = std::string()
            );

            /**
             * The type_t.
             */
            const type_t & type() const;

            /**
             * The request id.
             */
            const sha256 & request_id() const;

            /**
             * The requester.
             */
            const std::string & requester() const;

            /**
             * The amount.
             */
            const std::uint64_t & amount() const;

            /**
             * The reason (failures and cancellations).
             */
            const std::string & reason() const;

            /**
             * The key/value pairs.
             */
            std::map<std::string, std::string> to_pairs() const;

            /**
             * The string representation.
             */
            std::string to_string() const;

            /**
             * The name of a type_t.
             * @param val The type_t.
             */
            static std::string type_to_string(const type_t & val);

        private:

            type_t m_type;
            sha256 m_request_id;
            std::string m_requester;
            std::uint64_t m_amount;
            std::string m_reason;

        protected:

            // ...
    };

} // namespace vault

#endif // VAULT_EVENT_HPP
