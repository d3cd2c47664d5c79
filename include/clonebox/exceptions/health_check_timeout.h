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

#ifndef CLONEBOX_HEALTH_CHECK_TIMEOUT_H
#define CLONEBOX_HEALTH_CHECK_TIMEOUT_H

#include <clonebox/exceptions/formatted_exception_base.h>

namespace clonebox
{
// Raised by probe transports that gave up waiting. Reported as a timed-out probe, never as a failed operation.
class HealthCheckTimeout : public FormattedExceptionBase<>
{
public:
    using FormattedExceptionBase<>::FormattedExceptionBase;
};
} // namespace clonebox
#endif // CLONEBOX_HEALTH_CHECK_TIMEOUT_H
