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

#ifndef VAULT_ERROR_HPP
#define VAULT_ERROR_HPP

#include <stdexcept>
#include <string>

namespace vault {

    /**
     * Implements an error raised by the vault.
     */
    class error : public std::runtime_error
    {
        public:

            /**
             * The error codes.
             */
            typedef enum
            {
                error_none,
                error_zero_amount,
                error_insufficient_funds,
                error_verification_failed,
                error_unknown_request,
                error_balance_overflow,
                error_duplicate_request,
                error_oracle_unavailable,
                error_not_owner,
                error_invalid_argument,
            } code_t;

            /**
             * Constructor
             * @param code The code_t.
             * @param what The message.
             */
            error(const code_t & code, const std::string & what)
                : std::runtime_error(what)
                , m_code(code)
            {
                // ...
            }

            /**
             * The code_t.
             */
            const code_t & code() const
            {
                return m_code;
            }

            /**
             * The string representation of a code_t.
             * @param code The code_t.
             */
            static std::string code_to_string(const code_t & code)
            {
                switch (code)
                {
                    case error_none:
                        return "none";
                    case error_zero_amount:
                        return "zero amount";
                    case error_insufficient_funds:
                        return "insufficient funds";
                    case error_verification_failed:
                        return "verification failed";
                    case error_unknown_request:
                        return "unknown request";
                    case error_balance_overflow:
                        return "balance overflow";
                    case error_duplicate_request:
                        return "duplicate request";
                    case error_oracle_unavailable:
                        return "oracle unavailable";
                    case error_not_owner:
                        return "not owner";
                    case error_invalid_argument:
                        return "invalid argument";
                }

                return "unknown";
            }

        private:

            /**
             * The code_t.
             */
            code_t m_code;

        protected:

            // ...
    };

} // namespace vault

#endif // VAULT_ERROR_HPP
