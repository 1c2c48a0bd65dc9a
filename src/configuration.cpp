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

#include <fstream>
#include <sstream>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <vault/configuration.hpp>
#include <vault/constants.hpp>
#include <vault/filesystem.hpp>
#include <vault/logger.hpp>
#include <vault/utility.hpp>

using namespace vault;

configuration::configuration()
    : m_path(filesystem::data_path() + "config.dat")
    , m_request_subscription_id(0)
    , m_request_gas_limit(constants::default_gas_limit)
    , m_request_timeout(constants::default_request_timeout)
    , m_request_expiry_interval(constants::default_expiry_interval)
{
    // ...
}

bool configuration::load()
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    log_info("Configuration is loading from " << m_path << ".");

    boost::property_tree::ptree pt;

    try
    {
        /**
         * Read the json configuration from disk.
         */
        read_json(m_path, pt);

        /**
         * Get the version.
         */
        auto file_version = std::stoul(
            pt.get("version", std::to_string(version))
        );

        log_debug("Configuration read version = " << file_version << ".");

        if (file_version != version)
        {
            log_error(
                "Configuration version " << file_version <<
                " is not supported."
            );

            return false;
        }

        /**
         * Get the owner.
         */
        m_owner = pt.get("owner", m_owner);

        log_debug("Configuration read owner = " << m_owner << ".");

        /**
         * Get the request.source.
         */
        m_request_source = pt.get("request.source", m_request_source);

        log_debug(
            "Configuration read request.source (" <<
            m_request_source.size() << " bytes)."
        );

        /**
         * Get the request.secrets.
         */
        m_request_secrets = pt.get("request.secrets", m_request_secrets);

        /**
         * Get the request.subscription_id.
         */
        m_request_subscription_id = std::stoull(pt.get(
            "request.subscription_id",
            std::to_string(m_request_subscription_id))
        );

        log_debug(
            "Configuration read request.subscription_id = " <<
            m_request_subscription_id << "."
        );

        /**
         * Get the request.gas_limit.
         */
        m_request_gas_limit = static_cast<std::uint32_t> (std::stoul(pt.get(
            "request.gas_limit", std::to_string(m_request_gas_limit)))
        );

        log_debug(
            "Configuration read request.gas_limit = " <<
            m_request_gas_limit << "."
        );

        /**
         * Get the request.timeout.
         */
        m_request_timeout = static_cast<std::time_t> (std::stoll(pt.get(
            "request.timeout", std::to_string(m_request_timeout)))
        );

        log_debug(
            "Configuration read request.timeout = " <<
            m_request_timeout << "."
        );

        /**
         * Get the request.expiry_interval.
         */
        m_request_expiry_interval = static_cast<std::uint32_t> (
            std::stoul(pt.get("request.expiry_interval",
            std::to_string(m_request_expiry_interval)))
        );

        log_debug(
            "Configuration read request.expiry_interval = " <<
            m_request_expiry_interval << "."
        );

        /**
         * Enforce the minimum request.expiry_interval.
         */
        if (m_request_expiry_interval == 0)
        {
            m_request_expiry_interval = 1;
        }
    }
    catch (std::exception & e)
    {
        log_error("Configuration failed to load, what = " << e.what() << ".");

        return false;
    }

    return true;
}

bool configuration::save()
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    log_info("Configuration is saving to " << m_path << ".");

    try
    {
        boost::property_tree::ptree pt;

        /**
         * Put the version into property tree.
         */
        pt.put("version", std::to_string(version));

        /**
         * Put the owner into property tree.
         */
        pt.put("owner", m_owner);

        /**
         * Put the request.source into property tree.
         */
        pt.put("request.source", m_request_source);

        /**
         * Put the request.secrets into property tree.
         */
        pt.put("request.secrets", m_request_secrets);

        /**
         * Put the request.subscription_id into property tree.
         */
        pt.put(
            "request.subscription_id",
            std::to_string(m_request_subscription_id)
        );

        /**
         * Put the request.gas_limit into property tree.
         */
        pt.put("request.gas_limit", std::to_string(m_request_gas_limit));

        /**
         * Put the request.timeout into property tree.
         */
        pt.put("request.timeout", std::to_string(m_request_timeout));

        /**
         * Put the request.expiry_interval into property tree.
         */
        pt.put(
            "request.expiry_interval",
            std::to_string(m_request_expiry_interval)
        );

        /**
         * The std::stringstream.
         */
        std::stringstream ss;

        /**
         * Write property tree to json file.
         */
        write_json(ss, pt, false);

        /**
         * Open the output file stream.
         */
        std::ofstream ofs(m_path);

        if (ofs.is_open() == false)
        {
            log_error("Configuration failed to open " << m_path << ".");

            return false;
        }

        /**
         * Write the json.
         */
        ofs << ss.str();

        /**
         * Flush to disk.
         */
        ofs.flush();

        if (ofs.fail())
        {
            log_error("Configuration failed to write " << m_path << ".");

            return false;
        }
    }
    catch (std::exception & e)
    {
        log_error("Configuration failed to save, what = " << e.what() << ".");

        return false;
    }

    return true;
}

void configuration::set_args(const std::map<std::string, std::string> & val)
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    m_args = val;

    auto it = m_args.find("config");

    if (it != m_args.end() && it->second.size() > 0)
    {
        m_path = it->second;
    }
}

std::map<std::string, std::string> & configuration::args()
{
    return m_args;
}

bool configuration::apply_args()
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    try
    {
        for (auto & i : m_args)
        {
            const auto & key = i.first;
            const auto & value = i.second;

            if (key == "owner")
            {
                m_owner = value;
            }
            else if (key == "request.source")
            {
                m_request_source = value;
            }
            else if (key == "request.source_file")
            {
                if (filesystem::read_file(value, m_request_source) == false)
                {
                    log_error(
                        "Configuration failed to read source file " <<
                        value << "."
                    );

                    return false;
                }
            }
            else if (key == "request.secrets")
            {
                m_request_secrets = value;
            }
            else if (key == "request.subscription_id")
            {
                m_request_subscription_id = std::stoull(value);
            }
            else if (key == "request.gas_limit")
            {
                m_request_gas_limit =
                    static_cast<std::uint32_t> (std::stoul(value))
                ;
            }
            else if (key == "request.timeout")
            {
                m_request_timeout = static_cast<std::time_t> (std::stoll(value));
            }
            else if (key == "request.expiry_interval")
            {
                set_request_expiry_interval(
                    static_cast<std::uint32_t> (std::stoul(value))
                );
            }
            else
            {
                continue;
            }

            log_debug("Configuration argument " << key << " applied.");
        }
    }
    catch (std::exception & e)
    {
        log_error(
            "Configuration failed to apply arguments, what = " <<
            e.what() << "."
        );

        return false;
    }

    return true;
}

void configuration::set_path(const std::string & val)
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    m_path = val;
}

const std::string & configuration::path() const
{
    return m_path;
}

void configuration::set_owner(const std::string & val)
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    m_owner = val;
}

const std::string & configuration::owner() const
{
    return m_owner;
}

void configuration::set_request_source(const std::string & val)
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    m_request_source = val;
}

const std::string & configuration::request_source() const
{
    return m_request_source;
}

void configuration::set_request_secrets(const std::string & val)
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    m_request_secrets = val;
}

const std::string & configuration::request_secrets() const
{
    return m_request_secrets;
}

void configuration::set_request_subscription_id(const std::uint64_t & val)
{
    m_request_subscription_id = val;
}

const std::uint64_t & configuration::request_subscription_id() const
{
    return m_request_subscription_id;
}

void configuration::set_request_gas_limit(const std::uint32_t & val)
{
    m_request_gas_limit = val;
}

const std::uint32_t & configuration::request_gas_limit() const
{
    return m_request_gas_limit;
}

void configuration::set_request_timeout(const std::time_t & val)
{
    m_request_timeout = val;
}

const std::time_t & configuration::request_timeout() const
{
    return m_request_timeout;
}

void configuration::set_request_expiry_interval(const std::uint32_t & val)
{
    if (val == 0)
    {
        m_request_expiry_interval = 1;
    }
    else
    {
        m_request_expiry_interval = val;
    }
}

const std::uint32_t & configuration::request_expiry_interval() const
{
    return m_request_expiry_interval;
}
