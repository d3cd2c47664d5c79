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

#ifndef CLONEBOX_VM_RECORD_H
#define CLONEBOX_VM_RECORD_H

#include <clonebox/session_scope.h>

#include <QDateTime>

#include <string>

namespace clonebox
{
enum class VMState
{
    absent,
    provisioning,
    running,
    stopped,
    failed
};

// What the orchestrator last confirmed about an instance. Always re-derivable from the backend.
struct VMRecord
{
    std::string name;
    VMState state{VMState::absent};
    SessionScope scope{SessionScope::user};
    std::string address;
    QDateTime created_at;
};

std::string to_string(VMState state);
} // namespace clonebox
#endif // CLONEBOX_VM_RECORD_H
