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

#include <stdexcept>

#include <vault/constants.hpp>
#include <vault/error.hpp>
#include <vault/local_oracle.hpp>
#include <vault/logger.hpp>
#include <vault/random.hpp>
#include <vault/utility.hpp>

using namespace vault;

local_oracle::local_oracle(boost::asio::io_service & ios)
    : m_delay(0)
    , m_requests_sent(0)
    , m_nonce(random::bytes(16))
    , io_service_(ios)
    , strand_(ios)
{
    // ...
}

sha256 local_oracle::send_request(const verification_request & request)
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    if (!m_on_fulfill)
    {
        throw error(
            error::error_oracle_unavailable, "Oracle has no fulfill callback"
        );
    }

    /**
     * The request id is the hash of nonce || counter || args.
     */
    std::vector<std::uint8_t> buffer(m_nonce);

    for (auto i = 0; i < 8; i++)
    {
        buffer.push_back(
            static_cast<std::uint8_t> (m_requests_sent >> (56 - i * 8))
        );
    }

    for (auto & i : request.args())
    {
        buffer.insert(buffer.end(), i.begin(), i.end());
        buffer.push_back(0);
    }

    sha256 request_id(&buffer[0], buffer.size());

    ++m_requests_sent;

    log_debug(
        "Local oracle accepted request " << request_id.to_string() <<
        ", args = " << request.args().size() << "."
    );

    auto self(shared_from_this());

    auto timer = std::make_shared<
        boost::asio::basic_waitable_timer<std::chrono::steady_clock>
    > (io_service_);

    timer->expires_from_now(std::chrono::milliseconds(m_delay));
    timer->async_wait(strand_.wrap([this, self, timer, request_id, request]
        (boost::system::error_code ec)
    {
        if (ec)
        {
            log_debug(
                "Local oracle dropped request " << request_id.to_string() <<
                ", message = " << ec.message() << "."
            );
        }
        else
        {
            deliver(request_id, request);
        }
    }));

    return request_id;
}

void local_oracle::set_checker(const checker_t & f)
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    m_checker = f;
}

void local_oracle::set_on_fulfill(const fulfill_t & f)
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    m_on_fulfill = f;
}

void local_oracle::set_delay(const std::uint32_t & val)
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    m_delay = val;
}

std::uint64_t local_oracle::requests_sent() const
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    return m_requests_sent;
}

std::vector<std::uint8_t> local_oracle::response_for(const bool & approved)
{
    return utility::encode_uint256(approved ? constants::response_approved : 0);
}

void local_oracle::deliver(
    const sha256 & request_id, const verification_request & request
    )
{
    checker_t checker;
    fulfill_t on_fulfill;

    {
        std::lock_guard<std::recursive_mutex> l1(mutex_);

        checker = m_checker;
        on_fulfill = m_on_fulfill;
    }

    std::vector<std::uint8_t> response;
    std::vector<std::uint8_t> err;

    if (checker)
    {
        try
        {
            response = checker(request.args(), request.secrets());
        }
        catch (std::exception & e)
        {
            log_debug(
                "Local oracle checker failed for " << request_id.to_string() <<
                ", what = " << e.what() << "."
            );

            err = utility::to_bytes(e.what());

            response.clear();
        }
    }
    else
    {
        response = response_for(true);
    }

    if (!on_fulfill)
    {
        log_error(
            "Local oracle has no fulfill callback for " <<
            request_id.to_string() << "."
        );

        return;
    }

    try
    {
        on_fulfill(request_id, response, err);
    }
    catch (std::exception & e)
    {
        log_error(
            "Local oracle failed to deliver " << request_id.to_string() <<
            ", what = " << e.what() << "."
        );
    }
}
