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

#ifndef VAULT_FILESYSTEM_HPP
#define VAULT_FILESYSTEM_HPP

#include <string>

namespace vault {

    class filesystem
    {
        public:

            /**
             * File exists
             */
            static int error_already_exists;

            /**
             * Creates the last directory of the given path.
             * @param path The path.
             */
            static int create_path(const std::string & path);

            /**
             * Reads the whole file at path.
             * @param path The path.
             * @param contents The contents (out).
             */
            static bool read_file(
                const std::string & path, std::string & contents
            );

            /**
             * The user data directory.
             */
            static std::string data_path();

        private:

            /**
             * The user home directory.
             */
            static std::string home_path();

        protected:

            // ...
    };

} // vault

#endif // VAULT_FILESYSTEM_HPP
