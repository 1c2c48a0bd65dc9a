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

#ifndef VAULT_REQUEST_REGISTRY_HPP
#define VAULT_REQUEST_REGISTRY_HPP

#include <cstdint>
#include <ctime>
#include <map>
#include <mutex>
#include <vector>

#include <vault/pending_request.hpp>
#include <vault/sha256.hpp>

namespace vault {

    /**
     * Implements the registry of in-flight verification requests keyed by
     * request id. An entry lives from dispatch until the first outcome
     * naming its id takes it.
     */
    class request_registry
    {
        public:

            /**
             * Constructor
             */
            request_registry();

            /**
             * Inserts a pending request.
             * @param val The pending_request.
             * @return false if a request with the same id is live.
             */
            bool insert(const pending_request & val);

            /**
             * Removes a pending request.
             * @param request_id The request id.
             * @param val The pending_request (out).
             * @return false if no request with the id is live.
             */
            bool take(const sha256 & request_id, pending_request & val);

            /**
             * If true a request with the id is live.
             * @param request_id The request id.
             */
            bool exists(const sha256 & request_id) const;

            /**
             * The number of live requests.
             */
            std::size_t size() const;

            /**
             * The sum of the amounts of live requests of a kind.
             * @param kind The types::request_kind_t.
             */
            std::uint64_t total(const types::request_kind_t & kind) const;

            /**
             * The live requests of a requester.
             * @param requester The requester.
             */
            std::vector<pending_request> pending_for(
                const std::string & requester
            ) const;

            /**
             * The ids of requests dispatched more than timeout seconds
             * before now.
             * @param now The time now.
             * @param timeout The timeout in seconds.
             */
            std::vector<sha256> expired(
                const std::time_t & now, const std::time_t & timeout
            ) const;

        private:

            /**
             * The pending requests.
             */
            std::map<sha256, pending_request> m_pending_requests;

        protected:

            /**
             * The mutex.
             */
            mutable std::recursive_mutex mutex_;
    };

} // namespace vault

#endif // VAULT_REQUEST_REGISTRY_HPP
