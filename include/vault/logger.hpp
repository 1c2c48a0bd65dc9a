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

#ifndef VAULT_LOGGER_HPP
#define VAULT_LOGGER_HPP

#include <iostream>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>

#include <vault/filesystem.hpp>

namespace vault {

    /**
     * Implements a logger.
     */
    class logger
    {
        public:

            typedef enum severity
            {
                severity_none,
                severity_debug,
                severity_error,
                severity_info,
                severity_warning,
                severity_test,
            } severity_t;

            /**
             * Singleton accessor.
             */
            static logger & instance()
            {
                static logger g_logger;

                return g_logger;
            }

            /**
             * operator <<
             */
            template <class T>
            logger & operator << (T const & val)
            {
                std::stringstream ss;

                ss << val;

                log(ss);

                ss.str(std::string());

                return logger::instance();
            }

            /**
             * Sets if we log to the debug.log file.
             * @param val The value.
             */
            void set_use_file(const bool & val)
            {
                std::lock_guard<std::recursive_mutex> l1(mutex_);

                m_use_file = val;

                if (m_use_file == false && ofstream_.is_open())
                {
                    ofstream_.close();
                }
            }

            /**
             * Sets if we log to std::cerr.
             * @param val The value.
             */
            void set_use_cout(const bool & val)
            {
                std::lock_guard<std::recursive_mutex> l1(mutex_);

                m_use_cout = val;
            }

            /**
             * Perform the actual logging.
             * @param val
             */
            void log(std::stringstream & val)
            {
                std::lock_guard<std::recursive_mutex> l1(mutex_);

                if (m_use_file)
                {
                    static std::string path =
                        filesystem::data_path() + "debug.log"
                    ;

                    if (ofstream_.is_open() == false)
                    {
                        ofstream_.open(
                            path, std::fstream::out | std::fstream::app
                        );
                    }

                    if (ofstream_.is_open() == true)
                    {
                        /**
                         * Limit size.
                         */
                        if (ofstream_.tellp() > 10 * 1000000)
                        {
                            ofstream_.close();

                            ofstream_.open(path, std::fstream::out);
                        }

                        ofstream_ << val.str() << std::endl;

                        ofstream_.flush();
                    }
                }

                if (m_use_cout)
                {
                    std::cerr << val.str() << std::endl;
                }
            }

        private:

            /**
             * Constructor
             */
            logger()
                : m_use_file(true)
                , m_use_cout(true)
            {
                // ...
            }

            /**
             * If true we log to the debug.log file.
             */
            bool m_use_file;

            /**
             * If true we log to std::cerr.
             */
            bool m_use_cout;

        protected:

            /**
             * The std::ofstream.
             */
            std::ofstream ofstream_;

            /**
             * The std::recursive_mutex.
             */
            std::recursive_mutex mutex_;
    };

    #define log_xx(severity, strm) \
    { \
        std::stringstream __ss; \
        switch (severity) \
        { \
            case vault::logger::severity_debug: \
                __ss << "[DEBUG] - "; \
            break; \
            case vault::logger::severity_error: \
                __ss << "[ERROR] - "; \
            break; \
            case vault::logger::severity_info: \
                __ss << "[INFO] - "; \
            break; \
            case vault::logger::severity_warning: \
                __ss << "[WARNING] - "; \
            break; \
            case vault::logger::severity_test: \
                __ss << "[TEST] - "; \
            break; \
            default: \
                __ss << "[UNKNOWN] - "; \
        } \
        __ss << __FUNCTION__ << ": "; \
        __ss << strm; \
        vault::logger::instance() << __ss.str(); \
        __ss.str(std::string()); \
    } \

#define log_none(strm) /** */
#if (defined NDEBUG)
#define log_debug(strm) log_none(strm)
#else
#define log_debug(strm) log_xx(vault::logger::severity_debug, strm)
#endif
#define log_error(strm) log_xx(vault::logger::severity_error, strm)
#define log_info(strm) log_xx(vault::logger::severity_info, strm)
#define log_warn(strm) log_xx(vault::logger::severity_warning, strm)
#define log_test(strm) log_xx(vault::logger::severity_test, strm)

} // namespace vault

#endif // VAULT_LOGGER_HPP
