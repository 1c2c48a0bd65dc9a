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

#ifndef VAULT_CONSTANTS_HPP
#define VAULT_CONSTANTS_HPP

#include <string>

namespace vault {
namespace constants {

    /**
     * The version string.
     */
    static const std::string version_string = "0.1.0";

    /**
     * The name of the client (used for the data directory).
     */
    static const std::string client_name = "vault";

    /**
     * The request argument encoding a deposit.
     */
    static const std::string request_arg_deposit = "0";

    /**
     * The request argument encoding a withdrawal.
     */
    static const std::string request_arg_withdrawal = "1";

    /**
     * The length of an encoded verification response.
     */
    enum { response_length = 32 };

    /**
     * The decoded response value meaning approved. Every other value
     * means rejected.
     */
    enum { response_approved = 1 };

    /**
     * The default callback gas limit sent with each request.
     */
    enum { default_gas_limit = 300000 };

    /**
     * The default request timeout in seconds (zero disables expiry).
     */
    enum { default_request_timeout = 0 };

    /**
     * The default expiry sweep interval in seconds.
     */
    enum { default_expiry_interval = 60 };

} // namespace constants
} // namespace vault

#endif // VAULT_CONSTANTS_HPP
