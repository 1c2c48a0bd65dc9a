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

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

#include <sys/stat.h>

#include <boost/format.hpp>

#include <vault/constants.hpp>
#include <vault/filesystem.hpp>

using namespace vault;

#define ERRNO errno
#define ERROR_ALREADY_EXISTS EEXIST

static int _mkdir(const char * dir)
{
    char tmp[256];
    char * p = NULL;
    size_t len;

    snprintf(tmp, sizeof(tmp),"%s",dir);
    len = strlen(tmp);

    if (len == 0)
    {
        return -1;
    }

    if (tmp[len - 1] == '/')
    {
        tmp[len - 1] = 0;
    }

    for (p = tmp + 1; *p; p++)
    {
        if (*p == '/')
        {
            *p = 0;

            mkdir(tmp, S_IRWXU);

            *p = '/';
        }
    }

    return mkdir(tmp, S_IRWXU);
}
#define CREATE_DIRECTORY(P) _mkdir(P)

int filesystem::error_already_exists = ERROR_ALREADY_EXISTS;

int filesystem::create_path(const std::string & path)
{
    if (CREATE_DIRECTORY(path.c_str()) == 0)
    {
        return 0;
    }

    return ERRNO;
}

bool filesystem::read_file(const std::string & path, std::string & contents)
{
    std::ifstream ifs(path, std::ios::binary);

    if (ifs.is_open() == false)
    {
        return false;
    }

    std::stringstream ss;

    ss << ifs.rdbuf();

    contents = ss.str();

    return ifs.bad() == false;
}

std::string filesystem::data_path()
{
    std::string ret;
#if (defined __APPLE__)
    ret = home_path();
    ret += "Library/";
    ret += "Application Support/";
    ret += constants::client_name + "/";
#else
    ret = home_path();
    ret += "." + constants::client_name + "/data/";
#endif
    return ret;
}

std::string filesystem::home_path()
{
    std::string ret;

    if (std::getenv("HOME"))
    {
        ret = std::getenv("HOME");
    }
    else if (std::getenv("USERPROFILE"))
    {
        ret = std::getenv("USERPROFILE");
    }
    else if (std::getenv("HOMEDRIVE") && std::getenv("HOMEPATH"))
    {
        ret = (
            boost::format("%1%%2%") % std::getenv("HOMEDRIVE") %
            std::getenv("HOMEPATH")
        ).str();
    }
    else
    {
        ret = ".";
    }

    return ret + "/";
}
