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

#include <vault/configuration.hpp>
#include <vault/logger.hpp>
#include <vault/stack.hpp>
#include <vault/stack_impl.hpp>

using namespace vault;

stack::stack()
    : stack_impl_(0)
{
    // ...
}

stack::~stack()
{
    if (stack_impl_)
    {
        log_warn("Stack destroyed while running, stopping.");

        stack_impl_->stop();

        delete stack_impl_, stack_impl_ = 0;
    }
}

void stack::start(const std::map<std::string, std::string> & args)
{
    if (stack_impl_)
    {
        throw std::runtime_error("Stack is already allocated");
    }
    else
    {
        /**
         * Allocate the stack implementation.
         */
        stack_impl_ = new stack_impl(*this);

        /**
         * Set the arguments.
         */
        stack_impl_->get_configuration().set_args(args);

        try
        {
            /**
             * Start the stack implementation.
             */
            stack_impl_->start();
        }
        catch (std::exception & e)
        {
            log_error("Stack failed to start, what = " << e.what() << ".");

            delete stack_impl_, stack_impl_ = 0;

            throw;
        }
    }
}

void stack::stop()
{
    if (stack_impl_)
    {
        /**
         * Stop the stack implementation.
         */
        stack_impl_->stop();

        /**
         * Deallocate the stack implementation.
         */
        delete stack_impl_, stack_impl_ = 0;
    }
    else
    {
        throw std::runtime_error("Stack is not allocated");
    }
}

sha256 stack::request_deposit(
    const std::string & requester, const std::uint64_t & amount
    )
{
    if (stack_impl_)
    {
        return stack_impl_->request_deposit(requester, amount);
    }
    else
    {
        throw std::runtime_error("Stack is not allocated");
    }
}

sha256 stack::request_withdrawal(
    const std::string & requester, const std::uint64_t & amount
    )
{
    if (stack_impl_)
    {
        return stack_impl_->request_withdrawal(requester, amount);
    }
    else
    {
        throw std::runtime_error("Stack is not allocated");
    }
}

void stack::on_outcome(
    const sha256 & request_id, const std::vector<std::uint8_t> & response,
    const std::vector<std::uint8_t> & err
    )
{
    if (stack_impl_)
    {
        stack_impl_->on_outcome(request_id, response, err);
    }
    else
    {
        throw std::runtime_error("Stack is not allocated");
    }
}

std::size_t stack::expire_requests(const std::time_t & now)
{
    if (stack_impl_)
    {
        return stack_impl_->expire_requests(now);
    }
    else
    {
        throw std::runtime_error("Stack is not allocated");
    }
}

std::uint64_t stack::balance_of(const std::string & principal)
{
    if (stack_impl_)
    {
        return stack_impl_->balance_of(principal);
    }
    else
    {
        throw std::runtime_error("Stack is not allocated");
    }
}

std::uint64_t stack::stranded_of(const std::string & principal)
{
    if (stack_impl_)
    {
        return stack_impl_->stranded_of(principal);
    }
    else
    {
        throw std::runtime_error("Stack is not allocated");
    }
}

std::uint64_t stack::escrowed()
{
    if (stack_impl_)
    {
        return stack_impl_->escrowed();
    }
    else
    {
        throw std::runtime_error("Stack is not allocated");
    }
}

std::uint64_t stack::stranded()
{
    if (stack_impl_)
    {
        return stack_impl_->stranded();
    }
    else
    {
        throw std::runtime_error("Stack is not allocated");
    }
}

std::uint64_t stack::total_balances()
{
    if (stack_impl_)
    {
        return stack_impl_->total_balances();
    }
    else
    {
        throw std::runtime_error("Stack is not allocated");
    }
}

std::size_t stack::pending_requests()
{
    if (stack_impl_)
    {
        return stack_impl_->pending_requests();
    }
    else
    {
        throw std::runtime_error("Stack is not allocated");
    }
}

std::vector<pending_request> stack::pending_requests_of(
    const std::string & requester
    )
{
    if (stack_impl_)
    {
        return stack_impl_->pending_requests_of(requester);
    }
    else
    {
        throw std::runtime_error("Stack is not allocated");
    }
}

std::uint64_t stack::pending_total(const types::request_kind_t & kind)
{
    if (stack_impl_)
    {
        return stack_impl_->pending_total(kind);
    }
    else
    {
        throw std::runtime_error("Stack is not allocated");
    }
}

std::string stack::owner()
{
    if (stack_impl_)
    {
        return stack_impl_->owner();
    }
    else
    {
        throw std::runtime_error("Stack is not allocated");
    }
}

void stack::set_source(const std::string & caller, const std::string & val)
{
    if (stack_impl_)
    {
        stack_impl_->set_source(caller, val);
    }
    else
    {
        throw std::runtime_error("Stack is not allocated");
    }
}

void stack::set_secrets(
    const std::string & caller, const std::vector<std::uint8_t> & val
    )
{
    if (stack_impl_)
    {
        stack_impl_->set_secrets(caller, val);
    }
    else
    {
        throw std::runtime_error("Stack is not allocated");
    }
}

void stack::set_subscription_id(
    const std::string & caller, const std::uint64_t & val
    )
{
    if (stack_impl_)
    {
        stack_impl_->set_subscription_id(caller, val);
    }
    else
    {
        throw std::runtime_error("Stack is not allocated");
    }
}

void stack::set_gas_limit(const std::string & caller, const std::uint32_t & val)
{
    if (stack_impl_)
    {
        stack_impl_->set_gas_limit(caller, val);
    }
    else
    {
        throw std::runtime_error("Stack is not allocated");
    }
}

void stack::set_oracle(
    const std::string & caller, const std::shared_ptr<oracle> & val
    )
{
    if (stack_impl_)
    {
        stack_impl_->set_oracle(caller, val);
    }
    else
    {
        throw std::runtime_error("Stack is not allocated");
    }
}

void stack::transfer_ownership(
    const std::string & caller, const std::string & to
    )
{
    if (stack_impl_)
    {
        stack_impl_->transfer_ownership(caller, to);
    }
    else
    {
        throw std::runtime_error("Stack is not allocated");
    }
}

void stack::accept_ownership(const std::string & caller)
{
    if (stack_impl_)
    {
        stack_impl_->accept_ownership(caller);
    }
    else
    {
        throw std::runtime_error("Stack is not allocated");
    }
}

std::uint64_t stack::release_stranded(
    const std::string & caller, const std::string & principal
    )
{
    if (stack_impl_)
    {
        return stack_impl_->release_stranded(caller, principal);
    }
    else
    {
        throw std::runtime_error("Stack is not allocated");
    }
}

void stack::on_event(const event & val)
{
    log_debug("Stack got event " << val.to_string() << ".");
}

bool stack::on_payout(
    const std::string & principal, const std::uint64_t & amount
    )
{
    log_info(
        "Stack has no payout route, " << amount << " to " << principal <<
        " is settled externally."
    );

    return true;
}
