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

#ifndef VAULT_LOCAL_ORACLE_HPP
#define VAULT_LOCAL_ORACLE_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio.hpp>

#include <vault/oracle.hpp>
#include <vault/sha256.hpp>

namespace vault {

    /**
     * Implements an in-process oracle. The outcome of every request is
     * computed by a checker and delivered on the boost::asio::io_service
     * after a delay, never from inside send_request. A checker that
     * throws produces an error payload (the exception text).
     * @note Must be owned by a std::shared_ptr.
     */
    class local_oracle
        : public oracle
        , public std::enable_shared_from_this<local_oracle>
    {
        public:

            /**
             * The checker, maps the request args and secrets to a 32 byte
             * response.
             */
            typedef std::function<
                std::vector<std::uint8_t> (
                const std::vector<std::string> &,
                const std::vector<std::uint8_t> &)
            > checker_t;

            /**
             * The fulfill callback (request id, response, error).
             */
            typedef std::function<
                void (const sha256 &, const std::vector<std::uint8_t> &,
                const std::vector<std::uint8_t> &)
            > fulfill_t;

            /**
             * Constructor
             * @param ios The boost::asio::io_service.
             */
            explicit local_oracle(boost::asio::io_service & ios);

            /**
             * Sends a request.
             * @param request The verification_request.
             */
            virtual sha256 send_request(const verification_request & request);

            /**
             * Sets the checker, without one every request is approved.
             * @param f The checker_t.
             */
            void set_checker(const checker_t & f);

            /**
             * Sets the fulfill callback.
             * @param f The fulfill_t.
             */
            void set_on_fulfill(const fulfill_t & f);

            /**
             * Sets the delivery delay.
             * @param val The delay in milliseconds.
             */
            void set_delay(const std::uint32_t & val);

            /**
             * The number of requests sent.
             */
            std::uint64_t requests_sent() const;

            /**
             * The response for a verdict.
             * @param approved If true the approved response is returned.
             */
            static std::vector<std::uint8_t> response_for(
                const bool & approved
            );

        private:

            /**
             * Computes and delivers the outcome of a request.
             * @param request_id The request id.
             * @param request The verification_request.
             */
            void deliver(
                const sha256 & request_id, const verification_request & request
            );

            /**
             * The checker.
             */
            checker_t m_checker;

            /**
             * The fulfill callback.
             */
            fulfill_t m_on_fulfill;

            /**
             * The delay in milliseconds.
             */
            std::uint32_t m_delay;

            /**
             * The number of requests sent.
             */
            std::uint64_t m_requests_sent;

            /**
             * The nonce mixed into request ids.
             */
            std::vector<std::uint8_t> m_nonce;

        protected:

            /**
             * The boost::asio::io_service.
             */
            boost::asio::io_service & io_service_;

            /**
             * The boost::asio::io_service::strand.
             */
            boost::asio::io_service::strand strand_;

            /**
             * The std::recursive_mutex.
             */
            mutable std::recursive_mutex mutex_;
    };

} // namespace vault

#endif // VAULT_LOCAL_ORACLE_HPP
