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

#ifndef CLONEBOX_YAML_NODE_UTILS_H
#define CLONEBOX_YAML_NODE_UTILS_H

#include <yaml-cpp/yaml.h>

#include <string>
#include <vector>

namespace clonebox
{
namespace utils
{
// yaml helpers
std::string emit_yaml(const YAML::Node& node);
std::string emit_cloud_config(const YAML::Node& node);
YAML::Node make_cloud_init_meta_config(const std::string& name);

// Reads node[key] as T, or returns fallback when the key is absent. Throws ValidationError on a type mismatch.
template <typename T>
T value_or(const YAML::Node& node, const std::string& key, const T& fallback);

// Reads a sequence of scalars, an absent key yields an empty vector
std::vector<std::string> string_list(const YAML::Node& node, const std::string& key);
} // namespace utils
} // namespace clonebox

#include <clonebox/exceptions/validation_error.h>

template <typename T>
T clonebox::utils::value_or(const YAML::Node& node, const std::string& key, const T& fallback)
{
    const auto value = node[key];
    if (!value || value.IsNull())
        return fallback;

    try
    {
        return value.as<T>();
    }
    catch (const YAML::Exception& e)
    {
        throw ValidationError{"Invalid value for \"{}\": {}", key, e.what()};
    }
}
#endif // CLONEBOX_YAML_NODE_UTILS_H
