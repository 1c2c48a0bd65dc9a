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

#ifndef VAULT_UTILITY_HPP
#define VAULT_UTILITY_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace vault {

    class utility
    {
        public:

            /**
             * Encodes a value as a 32 byte big-endian unsigned integer.
             * @param value The value.
             */
            static std::vector<std::uint8_t> encode_uint256(
                const std::uint64_t & value
            );

            /**
             * Decodes a 32 byte big-endian unsigned integer.
             * @param buf The buffer.
             * @param value The value (out).
             * @return false if the buffer is not 32 bytes or the value does
             * not fit in 64 bits.
             */
            static bool decode_uint256(
                const std::vector<std::uint8_t> & buf, std::uint64_t & value
            );

            /**
             * If true the 32 byte big-endian unsigned integer equals one.
             * @param buf The buffer.
             */
            static bool uint256_is_one(const std::vector<std::uint8_t> & buf);

            /**
             * Hex encodes bytes.
             * @param buf The buffer.
             */
            static std::string hex_string(
                const std::vector<std::uint8_t> & buf
            );

            /**
             * Hex decodes bytes (an optional 0x prefix is skipped).
             * @param hex The hex.
             * @param buf The buffer (out).
             */
            static bool from_hex(
                const std::string & hex, std::vector<std::uint8_t> & buf
            );

            /**
             * The bytes of a string.
             * @param val The value.
             */
            static std::vector<std::uint8_t> to_bytes(const std::string & val);

            /**
             * The string of bytes, non printable bytes are hex escaped.
             * @param buf The buffer.
             */
            static std::string printable(const std::vector<std::uint8_t> & buf);

            /**
             * Parses a non-negative decimal amount.
             * @param val The value.
             * @param amount The amount (out).
             */
            static bool parse_amount(
                const std::string & val, std::uint64_t & amount
            );

            /**
             * Splits on the given delimiters dropping empty tokens.
             * @param val The value.
             * @param delimiters The delimiters.
             */
            static std::vector<std::string> split(
                const std::string & val, const std::string & delimiters
            );

        private:

            // ...

        protected:

            // ...
    };

} // namespace vault

#endif // VAULT_UTILITY_HPP
