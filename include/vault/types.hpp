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

#ifndef VAULT_TYPES_HPP
#define VAULT_TYPES_HPP

#include <cstdint>
#include <string>

namespace vault {

    namespace types {

        /**
         * The verification request kinds.
         */
        typedef enum
        {
            request_kind_deposit,
            request_kind_withdrawal,
        } request_kind_t;

        /**
         * The string representation of a request_kind_t.
         * @param val The request_kind_t.
         */
        inline std::string request_kind_to_string(const request_kind_t & val)
        {
            return val == request_kind_deposit ? "deposit" : "withdrawal";
        }

    } // namespace types

} // namespace vault

#endif // VAULT_TYPES_HPP
