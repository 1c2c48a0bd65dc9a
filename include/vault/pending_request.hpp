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

#ifndef VAULT_PENDING_REQUEST_HPP
#define VAULT_PENDING_REQUEST_HPP

#include <cstdint>
#include <ctime>
#include <string>

#include <vault/sha256.hpp>
#include <vault/types.hpp>

namespace vault {

    /**
     * Implements a verification request awaiting its outcome.
     */
    class pending_request
    {
        public:

            /**
             * Constructor
             */
            pending_request();

            /**
             * Constructor
             * @param request_id The request id.
             * @param requester The requester.
             * @param amount The amount.
             * @param kind The types::request_kind_t.
             * @param time_dispatched The time dispatched.
             */
            pending_request(
                const sha256 & request_id, const std::string & requester,
                const std::uint64_t & amount,
                const types::request_kind_t & kind,
                const std::time_t & time_dispatched
            );

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
             * The types::request_kind_t.
             */
            const types::request_kind_t & kind() const;

            /**
             * The time the request was dispatched.
             */
            const std::time_t & time_dispatched() const;

            /**
             * The string representation.
             */
            std::string to_string() const;

        private:

            /**
             * The request id.
             */
            sha256 m_request_id;

            /**
             * The requester.
             */
            std::string m_requester;

            /**
             * The amount.
             */
            std::uint64_t m_amount;

            /**
             * The types::request_kind_t.
             */
            types::request_kind_t m_kind;

            /**
             * The time dispatched.
             */
            std::time_t m_time_dispatched;

        protected:

            // ...
    };

} // namespace vault

#endif // VAULT_PENDING_REQUEST_HPP
