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

#include "detection_tables.h"

#include <clonebox/package_hints.h>
#include <clonebox/utils.h>

namespace cb = clonebox;
namespace cbd = clonebox::detection;

const std::set<std::string>& cbd::interesting_processes()
{
    static const std::set<std::string> processes{
        "python",   "python3",   "node",     "npm",        "yarn",       "pnpm",           "java",
        "gradle",   "mvn",       "go",       "cargo",      "rustc",      "docker",         "dockerd",
        "docker-compose",        "podman",   "nginx",      "apache2",    "httpd",          "postgres",
        "mysqld",   "mongod",    "redis-server",           "code",       "code-server",    "cursor",
        "vim",      "nvim",      "emacs",    "firefox",    "chrome",     "chromium",       "jupyter",
        "jupyter-lab",           "gunicorn", "uvicorn",    "tmux",       "screen",         "pycharm",
        "idea",     "webstorm",  "goland",   "sublime_text",             "slack",          "discord",
        "telegram-desktop",      "spotify",  "vlc",        "gimp",       "inkscape",       "blender",
        "obs",      "postman",   "dbeaver",  "windsurf"};
    return processes;
}

const std::set<std::string>& cbd::interesting_services()
{
    static const std::set<std::string> services{
        "docker",        "containerd", "podman",   "nginx",          "apache2",       "httpd",
        "caddy",         "postgresql", "mysql",    "mariadb",        "mongod",        "redis-server",
        "redis",         "memcached",  "elasticsearch",              "kibana",        "grafana-server",
        "prometheus",    "jenkins",    "gitlab-runner",              "ssh",           "rsync",
        "rabbitmq-server",             "kafka",    "supervisor",     "cups"};
    return services;
}

const std::set<std::string>& cbd::vm_excluded_services()
{
    static const std::set<std::string> services{
        "libvirtd", "virtlogd",     "libvirt-guests", "qemu-guest-agent",  "bluetooth",       "bluez",
        "upower",   "thermald",     "tlp",            "power-profiles-daemon",                "gdm",
        "gdm3",     "sddm",         "lightdm",        "ModemManager",      "wpa_supplicant",  "accounts-daemon",
        "colord",   "switcheroo-control"};
    return services;
}

const std::map<int, std::string>& cbd::well_known_ports()
{
    static const std::map<int, std::string> ports{{22, "ssh"},
                                                  {80, "nginx"},
                                                  {3306, "mysql"},
                                                  {5432, "postgresql"},
                                                  {5672, "rabbitmq-server"},
                                                  {6379, "redis-server"},
                                                  {9090, "prometheus"},
                                                  {9200, "elasticsearch"},
                                                  {11211, "memcached"},
                                                  {27017, "mongod"}};
    return ports;
}

const std::map<std::string, std::vector<std::string>>& cbd::app_data_dirs()
{
    static const std::map<std::string, std::vector<std::string>> dirs{
        {"chrome", {".config/google-chrome", ".config/chromium"}},
        {"chromium", {".config/chromium"}},
        {"firefox", {"snap/firefox/common/.mozilla/firefox", ".mozilla/firefox"}},
        {"code", {".config/Code", ".vscode"}},
        {"cursor", {".config/Cursor", ".cursor"}},
        {"windsurf", {".config/Windsurf", ".windsurf"}},
        {"pycharm", {".config/JetBrains", ".local/share/JetBrains"}},
        {"idea", {".config/JetBrains", ".local/share/JetBrains"}},
        {"webstorm", {".config/JetBrains", ".local/share/JetBrains"}},
        {"goland", {".config/JetBrains", ".local/share/JetBrains"}},
        {"sublime_text", {".config/sublime-text"}},
        {"vim", {".vim"}},
        {"nvim", {".config/nvim", ".local/share/nvim"}},
        {"emacs", {".emacs.d"}},
        {"docker", {".docker"}},
        {"npm", {".npm"}},
        {"yarn", {".yarn"}},
        {"cargo", {".cargo", ".rustup"}},
        {"go", {"go"}},
        {"gradle", {".gradle"}},
        {"mvn", {".m2"}},
        {"python", {".pyenv", ".virtualenvs"}},
        {"python3", {".pyenv", ".virtualenvs"}},
        {"node", {".nvm", ".npm"}},
        {"jupyter", {".jupyter"}},
        {"jupyter-lab", {".jupyter"}}};
    return dirs;
}

const std::vector<std::string>& cbd::project_markers()
{
    static const std::vector<std::string> markers{".git",          "package.json",   "Cargo.toml",
                                                  "go.mod",        "pyproject.toml", "setup.py",
                                                  "CMakeLists.txt", "requirements.txt"};
    return markers;
}

const std::vector<std::string>& cbd::home_development_dirs()
{
    static const std::vector<std::string> dirs{"projects", "workspace", "code",   "dev",
                                               "work",     "repos",     "github", "gitlab"};
    return dirs;
}

std::optional<std::string> cbd::service_for_port(int port)
{
    const auto& ports = well_known_ports();
    if (auto it = ports.find(port); it != ports.end())
        return it->second;

    return std::nullopt;
}

std::optional<cb::PackageHint> cb::package_for(const std::string& application_or_service)
{
    using Source = PackageHint::Source;
    static const std::map<std::string, PackageHint> hints{
        {"python", {"python3", Source::apt}},
        {"python3", {"python3", Source::apt}},
        {"node", {"nodejs", Source::apt}},
        {"npm", {"npm", Source::apt}},
        {"yarn", {"yarnpkg", Source::apt}},
        {"docker", {"docker.io", Source::apt}},
        {"dockerd", {"docker.io", Source::apt}},
        {"containerd", {"containerd", Source::apt}},
        {"docker-compose", {"docker-compose", Source::apt}},
        {"podman", {"podman", Source::apt}},
        {"nginx", {"nginx", Source::apt}},
        {"apache2", {"apache2", Source::apt}},
        {"httpd", {"apache2", Source::apt}},
        {"caddy", {"caddy", Source::apt}},
        {"postgres", {"postgresql", Source::apt}},
        {"postgresql", {"postgresql", Source::apt}},
        {"mysql", {"mysql-server", Source::apt}},
        {"mysqld", {"mysql-server", Source::apt}},
        {"mariadb", {"mariadb-server", Source::apt}},
        {"mongod", {"mongodb", Source::apt}},
        {"redis", {"redis-server", Source::apt}},
        {"redis-server", {"redis-server", Source::apt}},
        {"memcached", {"memcached", Source::apt}},
        {"rabbitmq-server", {"rabbitmq-server", Source::apt}},
        {"prometheus", {"prometheus", Source::apt}},
        {"ssh", {"openssh-server", Source::apt}},
        {"rsync", {"rsync", Source::apt}},
        {"supervisor", {"supervisor", Source::apt}},
        {"cups", {"cups", Source::apt}},
        {"vim", {"vim", Source::apt}},
        {"nvim", {"neovim", Source::apt}},
        {"emacs", {"emacs", Source::apt}},
        {"firefox", {"firefox", Source::apt}},
        {"chromium", {"chromium", Source::snap}},
        {"chrome", {"chromium", Source::snap}},
        {"jupyter", {"jupyter-notebook", Source::apt}},
        {"jupyter-lab", {"jupyterlab", Source::apt}},
        {"gunicorn", {"gunicorn", Source::apt}},
        {"uvicorn", {"uvicorn", Source::apt}},
        {"tmux", {"tmux", Source::apt}},
        {"screen", {"screen", Source::apt}},
        {"go", {"golang", Source::apt}},
        {"cargo", {"cargo", Source::apt}},
        {"rustc", {"rustc", Source::apt}},
        {"java", {"default-jdk", Source::apt}},
        {"gradle", {"gradle", Source::apt}},
        {"mvn", {"maven", Source::apt}},
        {"code", {"code", Source::snap}},
        {"pycharm", {"pycharm-community", Source::snap}},
        {"idea", {"intellij-idea-community", Source::snap}},
        {"slack", {"slack", Source::snap}},
        {"discord", {"discord", Source::snap}},
        {"spotify", {"spotify", Source::snap}},
        {"telegram-desktop", {"telegram-desktop", Source::snap}},
        {"postman", {"postman", Source::snap}},
        {"dbeaver", {"dbeaver-ce", Source::snap}},
        {"sublime_text", {"sublime-text", Source::snap}},
        {"vlc", {"vlc", Source::apt}},
        {"gimp", {"gimp", Source::apt}},
        {"inkscape", {"inkscape", Source::apt}},
        {"blender", {"blender", Source::apt}},
        {"obs", {"obs-studio", Source::apt}}};

    if (auto it = hints.find(utils::casefold(application_or_service)); it != hints.end())
        return it->second;

    return std::nullopt;
}
