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

#ifndef VAULT_SHA256_HPP
#define VAULT_SHA256_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ostream>
#include <string>

extern "C"
{
    #include <openssl/sha.h>
}

namespace vault {

    /**
     * Implements sha256. A request identifier is a sha256.
     */
    class sha256
    {
        public:

            /**
             * The digest length.
             */
            enum { digest_length = 32 };

            /**
             * Constructor
             */
            sha256();

            /**
             * Constructor
             * @param hex The hex.
             */
            explicit sha256(const std::string & hex);

            /**
             * Constructor
             * @param buf The buffer.
             * @param len The length.
             */
            sha256(const std::uint8_t * buf, const std::size_t & len);

            /**
             * Creates a sha256 from a digest.
             * @param digest The digest.
             */
            static sha256 from_digest(const std::uint8_t * digest);

            /**
             * Performs a hash operation.
             * @param buf The buffer.
             * @param len The length.
             */
            static std::array<std::uint8_t, digest_length> hash(
                const std::uint8_t * buf, const std::size_t & len
            );

            /**
             * The string representation (hex, most significant byte first).
             */
            std::string to_string() const;

            /**
             * If true it is empty.
             */
            bool is_empty() const;

            /**
             * Clears
             */
            void clear();

            /**
             * The digest.
             */
            std::uint8_t * digest();

            /**
             * The digest.
             */
            const std::uint8_t * digest() const;

            /**
             * operator <
             */
            friend inline bool operator < (const sha256 & a, const sha256 & b)
            {
                return std::memcmp(a.m_digest, b.m_digest, digest_length) < 0;
            }

            /**
             * operator ==
             */
            friend inline bool operator == (const sha256 & a, const sha256 & b)
            {
                return std::memcmp(a.m_digest, b.m_digest, digest_length) == 0;
            }

            /**
             * operator !=
             */
            friend inline bool operator != (const sha256 & a, const sha256 & b)
            {
                return (!(a == b));
            }

            /**
             * operator <<
             */
            friend inline std::ostream & operator << (
                std::ostream & os, const sha256 & val
                )
            {
                return os << val.to_string();
            }

        private:

            /**
             * The digest.
             */
            std::uint8_t m_digest[digest_length];

        protected:

            // ...
    };

} // namespace vault

#endif // VAULT_SHA256_HPP
