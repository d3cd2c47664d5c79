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

#include <clonebox/format.h>
#include <clonebox/yaml_node_utils.h>

#include <algorithm>
#include <functional>

namespace cb = clonebox;

std::string cb::utils::emit_yaml(const YAML::Node& node)
{
    YAML::Emitter emitter;
    emitter.SetIndent(2);

    std::function<void(const YAML::Node&)> emit_node;
    emit_node = [&emitter, &emit_node](const YAML::Node& n) {
        switch (n.Type())
        {
        case YAML::NodeType::Map:
        {
            emitter << YAML::BeginMap;
            for (const auto& kv : n)
            {
                emitter << YAML::Key;
                emit_node(kv.first);
                emitter << YAML::Value;
                emit_node(kv.second);
            }
            emitter << YAML::EndMap;
            break;
        }
        case YAML::NodeType::Sequence:
        {
            emitter << YAML::BeginSeq;
            for (const auto& v : n)
                emit_node(v);
            emitter << YAML::EndSeq;
            break;
        }
        default:
        {
            if (n.IsScalar())
            {
                const std::string value = n.Scalar();
                // Strings with colons would otherwise read back as mappings or timestamps
                if (value.find(':') != std::string::npos)
                {
                    emitter << YAML::DoubleQuoted << value;
                    break;
                }
                // Strings that look like octal numbers must stay strings
                if (value.length() >= 2 && value[0] == '0' && std::all_of(value.begin() + 1, value.end(), ::isdigit))
                {
                    emitter << YAML::DoubleQuoted << value;
                    break;
                }
            }
            emitter << n;
        }
        }
    };

    emit_node(node);

    if (!emitter.good())
        throw std::runtime_error{fmt::format("Failed to emit YAML: {}", emitter.GetLastError())};

    emitter << YAML::Newline;
    return emitter.c_str();
}

std::string cb::utils::emit_cloud_config(const YAML::Node& node)
{
    return fmt::format("#cloud-config\n{}", emit_yaml(node));
}

YAML::Node cb::utils::make_cloud_init_meta_config(const std::string& name)
{
    YAML::Node meta_data;
    meta_data["instance-id"] = name;
    meta_data["local-hostname"] = name;
    meta_data["cloud-name"] = "clonebox";

    return meta_data;
}

std::vector<std::string> cb::utils::string_list(const YAML::Node& node, const std::string& key)
{
    const auto list = node[key];
    if (!list || list.IsNull())
        return {};

    if (!list.IsSequence())
        throw ValidationError{"\"{}\" must be a list", key};

    std::vector<std::string> values;
    for (const auto& item : list)
        values.push_back(item.as<std::string>());

    return values;
}
