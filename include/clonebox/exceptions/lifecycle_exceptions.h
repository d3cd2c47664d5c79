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

#ifndef CLONEBOX_LIFECYCLE_EXCEPTIONS_H
#define CLONEBOX_LIFECYCLE_EXCEPTIONS_H

#include <clonebox/exceptions/formatted_exception_base.h>

#include <string>

namespace clonebox
{
class InstanceNotFound : public FormattedExceptionBase<>
{
public:
    explicit InstanceNotFound(const std::string& name) : FormattedExceptionBase{"Instance \"{}\" does not exist", name}
    {
    }
};

class InstanceAlreadyExists : public FormattedExceptionBase<>
{
public:
    explicit InstanceAlreadyExists(const std::string& name)
        : FormattedExceptionBase{"Instance \"{}\" already exists", name}
    {
    }
};

class VMStateInvalidException : public FormattedExceptionBase<>
{
public:
    using FormattedExceptionBase<>::FormattedExceptionBase;
};

class OperationCancelled : public FormattedExceptionBase<>
{
public:
    OperationCancelled(const std::string& name, const std::string& step)
        : FormattedExceptionBase{"Deadline expired for \"{}\" before trying to {}", name, step}
    {
    }
};
} // namespace clonebox
#endif // CLONEBOX_LIFECYCLE_EXCEPTIONS_H
