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

#ifndef VAULT_CONFIGURATION_HPP
#define VAULT_CONFIGURATION_HPP

#include <cstdint>
#include <ctime>
#include <map>
#include <mutex>
#include <string>

namespace vault {

    /**
     * The configuration.
     */
    class configuration
    {
        public:

            /**
             * The version.
             */
            enum { version = 1 };

            /**
             * Constructor
             */
            configuration();

            /**
             * Loads
             */
            bool load();

            /**
             * Saves
             */
            bool save();

            /**
             * Sets the arguments, they override values loaded from disk.
             * @param val The arguments.
             */
            void set_args(const std::map<std::string, std::string> & val);

            /**
             * The arguments.
             */
            std::map<std::string, std::string> & args();

            /**
             * Applies the arguments over the current values.
             */
            bool apply_args();

            /**
             * Sets the path of the configuration file.
             * @param val The value.
             */
            void set_path(const std::string & val);

            /**
             * The path of the configuration file.
             */
            const std::string & path() const;

            /**
             * Sets the owner.
             * @param val The value.
             */
            void set_owner(const std::string & val);

            /**
             * The owner (administrator principal).
             */
            const std::string & owner() const;

            /**
             * Sets the request script source.
             * @param val The value.
             */
            void set_request_source(const std::string & val);

            /**
             * The request script source.
             */
            const std::string & request_source() const;

            /**
             * Sets the request encrypted secrets (hex).
             * @param val The value.
             */
            void set_request_secrets(const std::string & val);

            /**
             * The request encrypted secrets (hex).
             */
            const std::string & request_secrets() const;

            /**
             * Sets the request billing subscription id.
             * @param val The value.
             */
            void set_request_subscription_id(const std::uint64_t & val);

            /**
             * The request billing subscription id.
             */
            const std::uint64_t & request_subscription_id() const;

            /**
             * Sets the request callback gas limit.
             * @param val The value.
             */
            void set_request_gas_limit(const std::uint32_t & val);

            /**
             * The request callback gas limit.
             */
            const std::uint32_t & request_gas_limit() const;

            /**
             * Sets the request timeout in seconds (zero disables expiry).
             * @param val The value.
             */
            void set_request_timeout(const std::time_t & val);

            /**
             * The request timeout in seconds.
             */
            const std::time_t & request_timeout() const;

            /**
             * Sets the request expiry sweep interval in seconds.
             * @param val The value.
             */
            void set_request_expiry_interval(const std::uint32_t & val);

            /**
             * The request expiry sweep interval in seconds.
             */
            const std::uint32_t & request_expiry_interval() const;

        private:

            /**
             * The arguments.
             */
            std::map<std::string, std::string> m_args;

            /**
             * The path.
             */
            std::string m_path;

            /**
             * The owner.
             */
            std::string m_owner;

            /**
             * The request script source.
             */
            std::string m_request_source;

            /**
             * The request encrypted secrets (hex).
             */
            std::string m_request_secrets;

            /**
             * The request billing subscription id.
             */
            std::uint64_t m_request_subscription_id;

            /**
             * The request callback gas limit.
             */
            std::uint32_t m_request_gas_limit;

            /**
             * The request timeout.
             */
            std::time_t m_request_timeout;

            /**
             * The request expiry sweep interval.
             */
            std::uint32_t m_request_expiry_interval;

        protected:

            /**
             * The mutex.
             */
            mutable std::recursive_mutex mutex_;
    };

} // namespace vault

#endif // VAULT_CONFIGURATION_HPP
