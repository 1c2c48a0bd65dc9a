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

#ifndef VAULT_RANDOM_HPP
#define VAULT_RANDOM_HPP

#include <cstdint>
#include <stdexcept>
#include <vector>

#include <openssl/rand.h>

namespace vault {

    /**
     * Implements random byte generation.
     */
    class random
    {
        public:

            /**
             * Generates cryptographically strong random bytes.
             * @param len The length.
             */
            static std::vector<std::uint8_t> bytes(const std::size_t & len)
            {
                std::vector<std::uint8_t> ret(len);

                if (len > 0 && RAND_bytes(&ret[0], static_cast<int> (len)) != 1)
                {
                    throw std::runtime_error("RAND_bytes failed");
                }

                return ret;
            }

        private:

            // ...

        protected:

            // ...
    };

} // namespace vault

#endif // VAULT_RANDOM_HPP
