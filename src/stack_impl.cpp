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
#include <vault/filesystem.hpp>
#include <vault/logger.hpp>
#include <vault/oracle.hpp>
#include <vault/stack.hpp>
#include <vault/stack_impl.hpp>
#include <vault/utility.hpp>

using namespace vault;

stack_impl::stack_impl(vault::stack & owner)
    : m_dispatcher(m_ledger, m_request_registry)
    , m_reconciler(m_ledger, m_request_registry)
    , stack_(owner)
    , strand_(io_service_)
    , timer_expiry_(io_service_)
{
    // ...
}

void stack_impl::start()
{
    try
    {
        filesystem::create_path(filesystem::data_path());
    }
    catch (std::exception & e)
    {
        log_error(
            "Stack failed to create directories, what = " << e.what() << "."
        );
    }

    /**
     * Load the configuration.
     */
    if (m_configuration.load() == false)
    {
        /**
         * If loading the configuration from disk failed then try to save it.
         */
        if (m_configuration.save() == false)
        {
            throw std::runtime_error(
                "Stack failed saving configuration to disk."
            );
        }
        else
        {
            log_info("Stack saved configuration to disk.");
        }
    }
    else
    {
        log_info("Stack loaded configuration from disk.");
    }

    /**
     * Arguments override the values on disk.
     */
    if (m_configuration.apply_args() == false)
    {
        throw std::runtime_error("Stack failed to apply arguments.");
    }

    if (m_configuration.owner().empty())
    {
        log_warn(
            "Stack has no owner configured, administration is disabled."
        );
    }

    /**
     * Hand the request settings to the dispatcher.
     */
    std::vector<std::uint8_t> secrets;

    if (
        utility::from_hex(m_configuration.request_secrets(), secrets) == false
        )
    {
        throw std::runtime_error("Stack got invalid request.secrets.");
    }

    m_dispatcher.set_source(m_configuration.request_source());
    m_dispatcher.set_secrets(secrets);
    m_dispatcher.set_subscription_id(
        m_configuration.request_subscription_id()
    );
    m_dispatcher.set_gas_limit(m_configuration.request_gas_limit());

    /**
     * Route events and payouts to the stack.
     */
    m_dispatcher.set_on_event([this] (const event & e)
    {
        stack_.on_event(e);
    });

    m_reconciler.set_on_event([this] (const event & e)
    {
        stack_.on_event(e);
    });

    m_reconciler.set_on_payout(
        [this] (const std::string & principal, const std::uint64_t & amount)
    {
        return stack_.on_payout(principal, amount);
    });

    /**
     * Reset the boost::asio::io_service.
     */
    io_service_.reset();

    /**
     * Allocate the boost::asio::io_service::work.
     */
    work_.reset(new boost::asio::io_service::work(io_service_));

    /**
     * Allocate the thread.
     */
    thread_ = std::make_shared<std::thread> (
        std::bind(&stack_impl::loop, this)
    );

    if (m_configuration.request_timeout() > 0)
    {
        log_info(
            "Stack is expiring requests after " <<
            m_configuration.request_timeout() << " seconds."
        );

        do_tick(m_configuration.request_expiry_interval());
    }

    log_info(
        "Stack " << constants::version_string << " started, owner = " <<
        m_configuration.owner() <<
        ", gas limit = " << m_configuration.request_gas_limit() << "."
    );
}

void stack_impl::stop()
{
    log_info("Stack is stopping.");

    boost::system::error_code ec;

    /**
     * Stop the expiry timer.
     */
    timer_expiry_.cancel(ec);

    /**
     * Reset the work.
     */
    work_.reset();

    /**
     * Stop the boost::asio::io_service.
     */
    io_service_.stop();

    /**
     * Join the thread.
     */
    if (thread_ && thread_->joinable())
    {
        thread_->join();
    }

    thread_.reset();

    log_info("Stack is stopped.");
}

sha256 stack_impl::request_deposit(
    const std::string & requester, const std::uint64_t & amount
    )
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    return m_dispatcher.request_deposit(requester, amount);
}

sha256 stack_impl::request_withdrawal(
    const std::string & requester, const std::uint64_t & amount
    )
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    return m_dispatcher.request_withdrawal(requester, amount);
}

void stack_impl::on_outcome(
    const sha256 & request_id, const std::vector<std::uint8_t> & response,
    const std::vector<std::uint8_t> & err
    )
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    m_reconciler.on_outcome(request_id, response, err);
}

std::size_t stack_impl::expire_requests(const std::time_t & now)
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    if (m_configuration.request_timeout() > 0)
    {
        return m_reconciler.expire(now, m_configuration.request_timeout());
    }

    return 0;
}

std::uint64_t stack_impl::balance_of(const std::string & principal)
{
    return m_ledger.balance_of(principal);
}

std::uint64_t stack_impl::stranded_of(const std::string & principal)
{
    return m_ledger.stranded_of(principal);
}

std::uint64_t stack_impl::escrowed()
{
    return m_ledger.escrowed();
}

std::uint64_t stack_impl::stranded()
{
    return m_ledger.stranded();
}

std::uint64_t stack_impl::total_balances()
{
    return m_ledger.total_balances();
}

std::size_t stack_impl::pending_requests()
{
    return m_request_registry.size();
}

std::vector<pending_request> stack_impl::pending_requests_of(
    const std::string & requester
    )
{
    return m_request_registry.pending_for(requester);
}

std::uint64_t stack_impl::pending_total(const types::request_kind_t & kind)
{
    return m_request_registry.total(kind);
}

std::string stack_impl::owner()
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    return m_configuration.owner();
}

void stack_impl::set_source(const std::string & caller, const std::string & val)
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    check_owner(caller);

    m_dispatcher.set_source(val);

    m_configuration.set_request_source(val);
    m_configuration.save();

    log_info("Stack set request source (" << val.size() << " bytes).");
}

void stack_impl::set_secrets(
    const std::string & caller, const std::vector<std::uint8_t> & val
    )
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    check_owner(caller);

    m_dispatcher.set_secrets(val);

    m_configuration.set_request_secrets(utility::hex_string(val));
    m_configuration.save();

    log_info("Stack set request secrets (" << val.size() << " bytes).");
}

void stack_impl::set_subscription_id(
    const std::string & caller, const std::uint64_t & val
    )
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    check_owner(caller);

    m_dispatcher.set_subscription_id(val);

    m_configuration.set_request_subscription_id(val);
    m_configuration.save();

    log_info("Stack set subscription id = " << val << ".");
}

void stack_impl::set_gas_limit(
    const std::string & caller, const std::uint32_t & val
    )
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    check_owner(caller);

    m_dispatcher.set_gas_limit(val);

    m_configuration.set_request_gas_limit(val);
    m_configuration.save();

    log_info("Stack set gas limit = " << val << ".");
}

void stack_impl::set_oracle(
    const std::string & caller, const std::shared_ptr<oracle> & val
    )
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    check_owner(caller);

    m_dispatcher.set_oracle(val);

    log_info("Stack " << (val ? "set" : "cleared") << " oracle.");
}

void stack_impl::transfer_ownership(
    const std::string & caller, const std::string & to
    )
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    check_owner(caller);

    if (to.empty())
    {
        throw error(error::error_invalid_argument, "Proposed owner is empty");
    }

    m_pending_owner = to;

    log_info("Stack proposed ownership transfer to " << to << ".");
}

void stack_impl::accept_ownership(const std::string & caller)
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    if (m_pending_owner.empty() || caller != m_pending_owner)
    {
        throw error(
            error::error_not_owner, caller + " is not the proposed owner"
        );
    }

    log_info(
        "Stack ownership transferred from " << m_configuration.owner() <<
        " to " << caller << "."
    );

    m_configuration.set_owner(caller);
    m_configuration.save();

    m_pending_owner.clear();
}

std::uint64_t stack_impl::release_stranded(
    const std::string & caller, const std::string & principal
    )
{
    std::lock_guard<std::recursive_mutex> l1(mutex_);

    check_owner(caller);

    auto amount = m_ledger.unstrand(principal);

    if (amount == 0)
    {
        log_info("Stack has no stranded funds for " << principal << ".");

        return 0;
    }

    auto success = false;

    try
    {
        success = stack_.on_payout(principal, amount);
    }
    catch (std::exception & e)
    {
        log_error(
            "Stack payout of " << amount << " to " << principal <<
            " failed, what = " << e.what() << "."
        );
    }

    if (success == false)
    {
        /**
         * Put the funds back on record.
         */
        m_ledger.strand(principal, amount);

        throw std::runtime_error(
            "Payout of stranded funds to " + principal + " failed"
        );
    }

    log_info(
        "Stack released " << amount << " stranded funds to " <<
        principal << "."
    );

    return amount;
}

configuration & stack_impl::get_configuration()
{
    return m_configuration;
}

void stack_impl::check_owner(const std::string & caller)
{
    if (m_configuration.owner().empty() || caller != m_configuration.owner())
    {
        log_warn("Stack denied administrative call by " << caller << ".");

        throw error(error::error_not_owner, caller + " is not the owner");
    }
}

void stack_impl::loop()
{
    for (;;)
    {
        try
        {
            io_service_.run();

            if (!work_)
            {
                break;
            }
        }
        catch (const boost::system::system_error & e)
        {
            log_error("Stack loop failed, what = " << e.what() << ".");
        }
    }
}

void stack_impl::do_tick(const std::uint32_t & interval)
{
    timer_expiry_.expires_from_now(std::chrono::seconds(interval));
    timer_expiry_.async_wait(strand_.wrap([this, interval]
        (boost::system::error_code ec)
    {
        if (ec)
        {
            // ...
        }
        else
        {
            auto count = expire_requests(std::time(0));

            if (count > 0)
            {
                log_info("Stack expired " << count << " requests.");
            }

            do_tick(interval);
        }
    }));
}
