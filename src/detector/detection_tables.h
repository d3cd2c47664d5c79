/*
 * Copyright (C) Canonical, Ltd.
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; version 3.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#ifndef CLONEBOX_DETECTION_TABLES_H
#define CLONEBOX_DETECTION_TABLES_H

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace clonebox::detection
{
const std::set<std::string>& interesting_processes();
const std::set<std::string>& interesting_services();
const std::set<std::string>& vm_excluded_services();
const std::map<int, std::string>& well_known_ports();
const std::map<std::string, std::vector<std::string>>& app_data_dirs(); // relative to home
const std::vector<std::string>& project_markers();
const std::vector<std::string>& home_development_dirs(); // relative to home

std::optional<std::string> service_for_port(int port);
} // namespace clonebox::detection
#endif // CLONEBOX_DETECTION_TABLES_H
