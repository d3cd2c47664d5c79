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

#include "mock_logger.h"

#include <type_traits>

namespace cbl = clonebox::logging;
namespace cbt = clonebox::test;
using namespace testing;

static_assert(!std::is_copy_assignable_v<cbt::MockLogger>);
static_assert(!std::is_copy_constructible_v<cbt::MockLogger>);

cbt::MockLogger::MockLogger(const cbl::Level logging_level) : Logger{logging_level}
{
}

auto cbt::MockLogger::inject(const cbl::Level logging_level) -> Scope
{
    return Scope{logging_level};
}

cbt::MockLogger::Scope::Scope(const cbl::Level logging_level)
    : mock_logger{std::make_shared<testing::NiceMock<MockLogger>>(logging_level)}
{
    cbl::set_logger(mock_logger);
}

cbt::MockLogger::Scope::~Scope()
{
    if (cbl::get_logger() == mock_logger.get() && mock_logger.use_count() == 2)
        cbl::set_logger(nullptr); // only reset if we are the last scope with the registered logger
}

void cbt::MockLogger::expect_log(cbl::Level lvl, const std::string& substr, const Cardinality& times)
{
    EXPECT_CALL(*this, log(lvl, _, make_cstring_matcher(HasSubstr(substr)))).Times(times);
}

void cbt::MockLogger::screen_logs(cbl::Level lvl)
{
    for (auto i = 0; i <= cbl::enum_type(cbl::Level::trace); ++i)
    {
        auto times = i <= cbl::enum_type(lvl) ? Exactly(0) : AnyNumber();
        EXPECT_CALL(*this, log(cbl::level_from(i), _, _)).Times(times);
    }
}
