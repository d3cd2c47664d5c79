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

#include <clonebox/credential_generator.h>
#include <clonebox/format.h>
#include <clonebox/utils.h>

#include <libssh/libssh.h>

#include <memory>
#include <stdexcept>
#include <string_view>

namespace cb = clonebox;

namespace
{
constexpr std::string_view password_alphabet{"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789"};

struct KeyDeleter
{
    void operator()(ssh_key key)
    {
        ssh_key_free(key);
    }
};
using KeyUPtr = std::unique_ptr<ssh_key_struct, KeyDeleter>;

struct CharDeleter
{
    void operator()(char* data)
    {
        ssh_string_free_char(data);
    }
};
using SshCharUPtr = std::unique_ptr<char, CharDeleter>;
} // namespace

std::string cb::SecureCredentialGenerator::one_time_password(std::size_t length) const
{
    // Rejection sampling keeps every character equally likely
    const auto limit = 256 - 256 % password_alphabet.size();

    std::string password;
    password.reserve(length);
    while (password.size() < length)
        for (const auto byte : utils::random_bytes(length))
            if (byte < limit && password.size() < length)
                password.push_back(password_alphabet[byte % password_alphabet.size()]);

    return password;
}

cb::SshKeyPair cb::SecureCredentialGenerator::ssh_keypair() const
{
    ssh_key raw_key;
    if (ssh_pki_generate(SSH_KEYTYPE_ED25519, 0, &raw_key) != SSH_OK)
        throw std::runtime_error("unable to generate ssh key");
    KeyUPtr key{raw_key};

    char* raw_private{nullptr};
    if (ssh_pki_export_privkey_base64(key.get(), nullptr, nullptr, nullptr, &raw_private) != SSH_OK)
        throw std::runtime_error("unable to export ssh private key");
    SshCharUPtr private_key{raw_private};

    char* raw_public{nullptr};
    if (ssh_pki_export_pubkey_base64(key.get(), &raw_public) != SSH_OK)
        throw std::runtime_error("unable to export ssh public key as base64");
    SshCharUPtr public_key{raw_public};

    return {private_key.get(),
            fmt::format("{} {} clonebox", ssh_key_type_to_char(ssh_key_type(key.get())), public_key.get())};
}
