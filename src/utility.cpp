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
#include <limits>

#include <boost/algorithm/string.hpp>

#include <vault/constants.hpp>
#include <vault/utility.hpp>

using namespace vault;

std::vector<std::uint8_t> utility::encode_uint256(const std::uint64_t & value)
{
    std::vector<std::uint8_t> ret(constants::response_length, 0);

    for (auto i = 0; i < 8; i++)
    {
        ret[constants::response_length - 1 - i] =
            static_cast<std::uint8_t> (value >> (i * 8))
        ;
    }

    return ret;
}

bool utility::decode_uint256(
    const std::vector<std::uint8_t> & buf, std::uint64_t & value
    )
{
    if (buf.size() != constants::response_length)
    {
        return false;
    }

    /**
     * Anything above the low 64 bits must be zero.
     */
    for (auto i = 0; i < constants::response_length - 8; i++)
    {
        if (buf[i] != 0)
        {
            return false;
        }
    }

    value = 0;

    for (auto i = constants::response_length - 8;
        i < constants::response_length; i++
        )
    {
        value = (value << 8) | buf[i];
    }

    return true;
}

bool utility::uint256_is_one(const std::vector<std::uint8_t> & buf)
{
    std::uint64_t value = 0;

    if (decode_uint256(buf, value))
    {
        return value == constants::response_approved;
    }

    return false;
}

std::string utility::hex_string(const std::vector<std::uint8_t> & buf)
{
    static const char * digits = "0123456789abcdef";

    std::string ret;

    ret.reserve(buf.size() * 2);

    for (auto & i : buf)
    {
        ret += digits[i >> 4];
        ret += digits[i & 0x0f];
    }

    return ret;
}

bool utility::from_hex(const std::string & hex, std::vector<std::uint8_t> & buf)
{
    std::string val = boost::algorithm::trim_copy(hex);

    if (val.size() >= 2 && val[0] == '0' && (val[1] == 'x' || val[1] == 'X'))
    {
        val = val.substr(2);
    }

    if (val.size() % 2 != 0)
    {
        return false;
    }

    std::vector<std::uint8_t> ret;

    ret.reserve(val.size() / 2);

    for (std::size_t i = 0; i < val.size(); i += 2)
    {
        if (
            std::isxdigit(static_cast<unsigned char> (val[i])) == 0 ||
            std::isxdigit(static_cast<unsigned char> (val[i + 1])) == 0
            )
        {
            return false;
        }

        ret.push_back(
            static_cast<std::uint8_t> (std::stoul(val.substr(i, 2), 0, 16))
        );
    }

    buf.swap(ret);

    return true;
}

std::vector<std::uint8_t> utility::to_bytes(const std::string & val)
{
    return std::vector<std::uint8_t> (val.begin(), val.end());
}

std::string utility::printable(const std::vector<std::uint8_t> & buf)
{
    std::string ret;

    for (auto & i : buf)
    {
        if (std::isprint(i))
        {
            ret += static_cast<char> (i);
        }
        else
        {
            char tmp[5];

            std::snprintf(tmp, sizeof(tmp), "\\x%02x", i);

            ret += tmp;
        }
    }

    return ret;
}

bool utility::parse_amount(const std::string & val, std::uint64_t & amount)
{
    if (val.empty() || val.size() > 20)
    {
        return false;
    }

    std::uint64_t ret = 0;

    for (auto & i : val)
    {
        if (i < '0' || i > '9')
        {
            return false;
        }

        std::uint64_t digit = i - '0';

        if (ret > (std::numeric_limits<std::uint64_t>::max() - digit) / 10)
        {
            return false;
        }

        ret = ret * 10 + digit;
    }

    amount = ret;

    return true;
}

std::vector<std::string> utility::split(
    const std::string & val, const std::string & delimiters
    )
{
    std::vector<std::string> parts;

    boost::algorithm::split(
        parts, val, boost::algorithm::is_any_of(delimiters),
        boost::algorithm::token_compress_on
    );

    std::vector<std::string> ret;

    for (auto & i : parts)
    {
        auto part = boost::algorithm::trim_copy(i);

        if (part.size() > 0)
        {
            ret.push_back(part);
        }
    }

    return ret;
}
