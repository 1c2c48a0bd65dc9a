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

#ifndef VAULT_ORACLE_HPP
#define VAULT_ORACLE_HPP

#include <vault/sha256.hpp>
#include <vault/verification_request.hpp>

namespace vault {

    /**
     * The verification oracle. Implementations carry a request to the
     * decision service and later deliver exactly one outcome through
     * stack::on_outcome, never from inside send_request.
     */
    class oracle
    {
        public:

            /**
             * Destructor
             */
            virtual ~oracle()
            {
                // ...
            }

            /**
             * Sends a request.
             * @param request The verification_request.
             * @return The (globally unique) request id.
             */
            virtual sha256 send_request(
                const verification_request & request
            ) = 0;

        private:

            // ...

        protected:

            // ...
    };

} // namespace vault

#endif // VAULT_ORACLE_HPP
