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

#ifndef CLONEBOX_MEMORY_SIZE_H
#define CLONEBOX_MEMORY_SIZE_H

#include <string>

namespace clonebox
{
class MemorySize
{
public:
    friend bool operator==(const MemorySize& a, const MemorySize& b) noexcept;
    friend bool operator!=(const MemorySize& a, const MemorySize& b) noexcept;
    friend bool operator<(const MemorySize& a, const MemorySize& b) noexcept;
    friend bool operator>(const MemorySize& a, const MemorySize& b) noexcept;
    friend bool operator<=(const MemorySize& a, const MemorySize& b) noexcept;
    friend bool operator>=(const MemorySize& a, const MemorySize& b) noexcept;

    MemorySize() noexcept;
    explicit MemorySize(const std::string& val);
    static MemorySize from_bytes(long long value) noexcept;
    static MemorySize from_megabytes(long long value) noexcept;
    static MemorySize from_gigabytes(long long value) noexcept;

    long long in_bytes() const noexcept;
    long long in_kilobytes() const noexcept;
    long long in_megabytes() const noexcept;
    long long in_gigabytes() const noexcept;

    std::string human_readable(unsigned int precision = 1, bool trim_zeros = false) const;

    // The largest unit that represents the size without loss, e.g. "4G", "1536M", "12345B". Parses back to *this.
    std::string exact_string() const;

private:
    explicit MemorySize(long long bytes) noexcept;
    long long bytes;
};

long long in_bytes(const std::string& mem_value);

bool operator==(const MemorySize& a, const MemorySize& b) noexcept;
bool operator!=(const MemorySize& a, const MemorySize& b) noexcept;
bool operator<(const MemorySize& a, const MemorySize& b) noexcept;
bool operator>(const MemorySize& a, const MemorySize& b) noexcept;
bool operator<=(const MemorySize& a, const MemorySize& b) noexcept;
bool operator>=(const MemorySize& a, const MemorySize& b) noexcept;

} // namespace clonebox

#endif // CLONEBOX_MEMORY_SIZE_H
