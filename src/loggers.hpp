/*
	B2-uploader is a streaming uploader for B2-like object storages
	Copyright (C) 2013-2015 Yandex

	This program is free software; you can redistribute it and/or
	modify it under the terms of the GNU General Public License
	as published by the Free Software Foundation; either version 2
	of the License, or (at your option) any later version.

	This program is distributed in the hope that it will be useful,
	but WITHOUT ANY WARRANTY; without even the implied warranty of
	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
	GNU General Public License for more details.

	You should have received a copy of the GNU General Public License
	along with this program; if not, write to the Free Software
	Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.
*/

#ifndef B2_UPLOADER__SRC__LOGGERS__HPP
#define B2_UPLOADER__SRC__LOGGERS__HPP

#include <swarm/logger.hpp>

#include <string>

#define B2_LOG(verb, ...) BH_LOG(logger(), verb, __VA_ARGS__)
#define B2_LOG_ERROR(...) B2_LOG(SWARM_LOG_ERROR, __VA_ARGS__)
#define B2_LOG_WARNING(...) B2_LOG(SWARM_LOG_WARNING, __VA_ARGS__)
#define B2_LOG_INFO(...) B2_LOG(SWARM_LOG_INFO, __VA_ARGS__)
#define B2_LOG_NOTICE(...) B2_LOG(SWARM_LOG_NOTICE, __VA_ARGS__)
#define B2_LOG_DEBUG(...) B2_LOG(SWARM_LOG_DEBUG, __VA_ARGS__)

ioremap::swarm::logger
copy_logger(const ioremap::swarm::logger &logger);

ioremap::swarm::logger
component_logger(const ioremap::swarm::logger &logger, const std::string &component);

#endif /* B2_UPLOADER__SRC__LOGGERS__HPP */

