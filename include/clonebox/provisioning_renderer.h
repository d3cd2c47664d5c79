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

#ifndef CLONEBOX_PROVISIONING_RENDERER_H
#define CLONEBOX_PROVISIONING_RENDERER_H

#include <clonebox/clone_spec.h>
#include <clonebox/credential_generator.h>
#include <clonebox/provisioning_bundle.h>

namespace clonebox
{
class ProvisioningRenderer
{
public:
    explicit ProvisioningRenderer(const CredentialGenerator& credentials);

    /**
     * Compiles a spec into the bundle the guest applies at first boot.
     *
     * Everything except generated credentials is a pure function of the spec. One-time passwords and ssh keys come
     * from the credential generator on every call.
     *
     * @throws ValidationError if a mounted host path is missing or unreadable.
     */
    ProvisioningBundle render(const CloneSpec& spec) const;

private:
    const CredentialGenerator& credentials;
};

inline constexpr std::size_t one_time_password_length = 16;
} // namespace clonebox
#endif // CLONEBOX_PROVISIONING_RENDERER_H
