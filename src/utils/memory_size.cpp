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

#include <clonebox/exceptions/invalid_memory_size_exception.h>
#include <clonebox/format.h>
#include <clonebox/memory_size.h>
#include <clonebox/utils.h>

#include <cmath>

#include <QRegularExpression>

namespace cb = clonebox;
namespace cbu = clonebox::utils;

namespace
{
constexpr auto kibi = 1024LL;
constexpr auto mebi = kibi * kibi;
constexpr auto gibi = mebi * kibi;
} // namespace

long long cb::in_bytes(const std::string& mem_value)
{
    QRegularExpression regex{
        QRegularExpression::anchoredPattern("\\s*(\\d+)(?:\\.(\\d+)(?=[KMG]))?(?:([KMG])(?:i?B)?|B)?\\s*"),
        QRegularExpression::CaseInsensitiveOption};
    const auto matcher = regex.match(QString::fromStdString(mem_value));

    if (matcher.hasMatch())
    {
        auto val = matcher.captured(1).toLongLong(); // value is in the second capture (1st one is the whole match)
        auto mantissa = 0LL;
        const auto unit = matcher.captured(3); // unit in the fourth capture (idem)

        if (!matcher.captured(2).isEmpty())
            mantissa = matcher.captured(2).toLongLong(); // the lookahead guarantees a unit follows

        if (!unit.isEmpty())
        {
            switch (unit.at(0).toLower().toLatin1())
            {
            case 'g':
                val *= gibi;
                mantissa *= gibi;
                break;
            case 'm':
                val *= mebi;
                mantissa *= mebi;
                break;
            case 'k':
                val *= kibi;
                mantissa *= kibi;
                break;
            default:
                throw cb::InvalidMemorySizeException{mem_value};
            }
        }

        return val + (long long)(mantissa / pow(10, matcher.captured(2).size()));
    }

    throw cb::InvalidMemorySizeException{mem_value};
}

cb::MemorySize::MemorySize() noexcept : bytes{0LL}
{
}

cb::MemorySize::MemorySize(const std::string& val) : bytes{cb::in_bytes(val)}
{
}

cb::MemorySize::MemorySize(long long bytes) noexcept : bytes{bytes}
{
}

cb::MemorySize cb::MemorySize::from_bytes(long long value) noexcept
{
    return MemorySize{value};
}

cb::MemorySize cb::MemorySize::from_megabytes(long long value) noexcept
{
    return MemorySize{value * mebi};
}

cb::MemorySize cb::MemorySize::from_gigabytes(long long value) noexcept
{
    return MemorySize{value * gibi};
}

long long cb::MemorySize::in_bytes() const noexcept
{
    return bytes;
}

long long cb::MemorySize::in_kilobytes() const noexcept
{
    return bytes / kibi; // integer division to floor
}

long long cb::MemorySize::in_megabytes() const noexcept
{
    return bytes / mebi; // integer division to floor
}

long long cb::MemorySize::in_gigabytes() const noexcept
{
    return bytes / gibi; // integer division to floor
}

bool cb::operator==(const MemorySize& a, const MemorySize& b) noexcept
{
    return a.bytes == b.bytes;
}

bool cb::operator!=(const MemorySize& a, const MemorySize& b) noexcept
{
    return a.bytes != b.bytes;
}

bool cb::operator<(const MemorySize& a, const MemorySize& b) noexcept
{
    return a.bytes < b.bytes;
}

bool cb::operator>(const MemorySize& a, const MemorySize& b) noexcept
{
    return a.bytes > b.bytes;
}

bool cb::operator<=(const MemorySize& a, const MemorySize& b) noexcept
{
    return a.bytes <= b.bytes;
}

bool cb::operator>=(const MemorySize& a, const MemorySize& b) noexcept
{
    return a.bytes >= b.bytes;
}

std::string cb::MemorySize::human_readable(unsigned int precision, bool trim_zeros) const
{
    const auto giga = std::pair{gibi, "GiB"};
    const auto mega = std::pair{mebi, "MiB"};
    const auto kilo = std::pair{kibi, "KiB"};

    for (auto [unit, suffix] : {giga, mega, kilo})
        if (auto quotient = bytes / static_cast<float>(unit); quotient >= 1)
        {
            auto result = fmt::format("{:.{}f}", quotient, precision);
            if (!trim_zeros)
                return result + suffix;

            result = cbu::trim_end(result, [](const char c) { return c == '0'; });
            result = cbu::trim_end(result, [](const char c) { return c == '.'; });
            return result + suffix;
        }

    return fmt::format("{}B", bytes);
}

std::string cb::MemorySize::exact_string() const
{
    if (bytes == 0)
        return "0B";

    for (auto [unit, suffix] : {std::pair{gibi, 'G'}, std::pair{mebi, 'M'}, std::pair{kibi, 'K'}})
        if (bytes % unit == 0)
            return fmt::format("{}{}", bytes / unit, suffix);

    return fmt::format("{}B", bytes);
}
