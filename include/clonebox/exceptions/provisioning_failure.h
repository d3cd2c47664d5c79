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

#ifndef CLONEBOX_PROVISIONING_FAILURE_H
#define CLONEBOX_PROVISIONING_FAILURE_H

#include <fmt/format.h>

#include <stdexcept>
#include <string>

namespace clonebox
{
class ProvisioningFailure : public std::runtime_error
{
public:
    ProvisioningFailure(const std::string& instance_name, const std::string& step, const std::string& cause)
        : std::runtime_error{fmt::format("Failed to create \"{}\" while trying to {}: {}", instance_name, step, cause)},
          name{instance_name},
          failed_step{step}
    {
    }

    const std::string& instance_name() const
    {
        return name;
    }

    const std::string& step() const
    {
        return failed_step;
    }

private:
    std::string name;
    std::string failed_step;
};
} // namespace clonebox
#endif // CLONEBOX_PROVISIONING_FAILURE_H
