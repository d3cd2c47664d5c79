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

#ifndef CLONEBOX_CREDENTIAL_GENERATOR_H
#define CLONEBOX_CREDENTIAL_GENERATOR_H

#include <clonebox/disabled_copy_move.h>

#include <cstddef>
#include <memory>
#include <string>

namespace clonebox
{
struct SshKeyPair
{
    std::string private_key; // OpenSSH private key file contents
    std::string public_key;  // authorized_keys line, e.g. "ssh-ed25519 AAAA..."
};

class CredentialGenerator : private DisabledCopyMove
{
public:
    using UPtr = std::unique_ptr<CredentialGenerator>;

    virtual ~CredentialGenerator() = default;
    virtual std::string one_time_password(std::size_t length) const = 0;
    virtual SshKeyPair ssh_keypair() const = 0;

protected:
    CredentialGenerator() = default;
};

// OpenSSL's CSPRNG for passwords, libssh for ed25519 keys
class SecureCredentialGenerator : public CredentialGenerator
{
public:
    std::string one_time_password(std::size_t length) const override;
    SshKeyPair ssh_keypair() const override;
};
} // namespace clonebox
#endif // CLONEBOX_CREDENTIAL_GENERATOR_H
