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

#ifndef CLONEBOX_SESSION_SCOPE_H
#define CLONEBOX_SESSION_SCOPE_H

#include <string>

namespace clonebox
{
// Isolation boundary of the virtualization backend: a per-user instance or the shared system-wide one
enum class SessionScope
{
    user,
    system
};

std::string to_string(SessionScope scope);
SessionScope session_scope_from(const std::string& name); // throws ValidationError on unknown names
} // namespace clonebox
#endif // CLONEBOX_SESSION_SCOPE_H
