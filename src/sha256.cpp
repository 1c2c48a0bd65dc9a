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

#include <cctype>
#include <cstdio>

#include <vault/sha256.hpp>

using namespace vault;

sha256::sha256()
{
    std::memset(m_digest, 0, sizeof(m_digest));
}

sha256::sha256(const std::string & hex)
{
    std::memset(m_digest, 0, sizeof(m_digest));

    auto psz = hex.c_str();

    while (isspace(*psz))
    {
        psz++;
    }

    if (psz[0] == '0' && tolower(psz[1]) == 'x')
    {
        psz += 2;
    }

    static const auto nibble = [](char c) -> int
    {
        if (c >= '0' && c <= '9')
        {
            return c - '0';
        }
        else if (c >= 'a' && c <= 'f')
        {
            return c - 'a' + 10;
        }
        else if (c >= 'A' && c <= 'F')
        {
            return c - 'A' + 10;
        }

        return -1;
    };

    /**
     * Read at most digest_length bytes, stopping at the first non hex pair.
     */
    for (auto i = 0; i < digest_length; i++)
    {
        auto hi = nibble(psz[i * 2]);

        if (hi < 0)
        {
            break;
        }

        auto lo = nibble(psz[i * 2 + 1]);

        if (lo < 0)
        {
            break;
        }

        m_digest[i] = static_cast<std::uint8_t> ((hi << 4) | lo);
    }
}

sha256::sha256(const std::uint8_t * buf, const std::size_t & len)
{
    SHA256(buf, len, m_digest);
}

sha256 sha256::from_digest(const std::uint8_t * digest)
{
    sha256 ret;

    std::memcpy(ret.digest(), digest, digest_length);

    return ret;
}

std::array<std::uint8_t, sha256::digest_length> sha256::hash(
    const std::uint8_t * buf, const std::size_t & len
    )
{
    std::array<std::uint8_t, digest_length> ret;

    SHA256(buf, len, &ret[0]);

    return ret;
}

std::string sha256::to_string() const
{
    char ret[sha256::digest_length * 2 + 1];

    for (auto i = 0; i < digest_length; i++)
    {
        std::sprintf(ret + i * 2, "%02x", m_digest[i]);
    }

    return std::string(ret, ret + sha256::digest_length * 2);
}

bool sha256::is_empty() const
{
    for (auto i = 0; i < digest_length; i++)
    {
        if (m_digest[i] != 0)
        {
            return false;
        }
    }

    return true;
}

void sha256::clear()
{
    std::memset(m_digest, 0, sizeof(m_digest));
}

std::uint8_t * sha256::digest()
{
    return m_digest;
}

const std::uint8_t * sha256::digest() const
{
    return m_digest;
}
