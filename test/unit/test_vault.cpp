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

#define BOOST_TEST_MODULE vault

#include <boost/test/unit_test.hpp>

#include <vault/logger.hpp>

/**
 * Keeps the logger off the data path and the console.
 */
struct logger_setup
{
    logger_setup()
    {
        vault::logger::instance().set_use_file(false);
        vault::logger::instance().set_use_cout(false);
    }
};

BOOST_GLOBAL_FIXTURE(logger_setup);
