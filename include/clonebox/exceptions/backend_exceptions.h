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

#ifndef CLONEBOX_BACKEND_EXCEPTIONS_H
#define CLONEBOX_BACKEND_EXCEPTIONS_H

#include <clonebox/exceptions/formatted_exception_base.h>

namespace clonebox
{
// The virtualization backend cannot be reached at all. Never retried.
class BackendUnavailable : public FormattedExceptionBase<>
{
public:
    using FormattedExceptionBase<>::FormattedExceptionBase;
};

// A backend call failed because the domain changed underneath us. Callers reconcile and retry once.
class StaleStateConflict : public FormattedExceptionBase<>
{
public:
    using FormattedExceptionBase<>::FormattedExceptionBase;
};

// Any other backend call failure
class BackendError : public FormattedExceptionBase<>
{
public:
    using FormattedExceptionBase<>::FormattedExceptionBase;
};
} // namespace clonebox
#endif // CLONEBOX_BACKEND_EXCEPTIONS_H
