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

#ifndef CLONEBOX_HOST_LAYOUT_H
#define CLONEBOX_HOST_LAYOUT_H

#include <QString>
#include <QStringList>

namespace clonebox
{
// Where the probes look. Defaults to the live host; tests point it at a fake tree.
struct HostLayout
{
    QString proc_root{"/proc"};
    QString home;
    QString working_directory;
    QStringList unit_wants_directories{"/etc/systemd/system/multi-user.target.wants",
                                       "/etc/systemd/system/default.target.wants",
                                       "/etc/systemd/system/graphical.target.wants"};
    QString guest_home{"/home/ubuntu"};

    static HostLayout current(); // fills home and working_directory from the running process
};
} // namespace clonebox
#endif // CLONEBOX_HOST_LAYOUT_H
