/*
 * Author: Sven Gothel <sgothel@jausoft.com>
 * Copyright (c) 2022 Gothel Software e.K.
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject to
 * the following conditions:
 *
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE
 * LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION
 * OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION
 * WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#ifndef WEBBT_SERVICE_UUID_HPP_
#define WEBBT_SERVICE_UUID_HPP_

#include <cstdint>
#include <string>

#include <jau/uuid.hpp>

namespace webbt {

    /** \addtogroup WebBTUserAPI
     *
     *  @{
     */

    /**
     * Returns the canonical lower-case 128-bit UUID string of the given 16- or 32-bit alias,
     * i.e. the alias placed into the Bluetooth Base UUID `00000000-0000-1000-8000-00805f9b34fb`.
     */
    std::string getCanonicalUUID(const uint32_t alias) noexcept;

    /**
     * Returns the canonical lower-case 128-bit UUID string of the given service identifier.
     * <p>
     * Accepted forms:
     * - GATT assigned service name, e.g. `heart_rate`
     * - 16- or 32-bit alias in hexadecimal with or without `0x` prefix, e.g. `180d`, `0x180D`, `0000180d`
     * - 128-bit UUID string in any case, e.g. `0000180D-0000-1000-8000-00805F9B34FB`
     * </p>
     * @throws jau::IllegalArgumentException if the identifier matches none of the above
     */
    std::string getServiceUUID(const std::string& nameOrUUID);

    /**
     * Returns the canonical lower-case 128-bit UUID string of the given 16- or 32-bit service alias.
     */
    inline std::string getServiceUUID(const uint32_t alias) noexcept { return getCanonicalUUID(alias); }

    /**
     * Returns the canonical lower-case 128-bit UUID string of the given jau::uuid_t,
     * as reported by an adapter.
     */
    std::string getServiceUUID(const jau::uuid_t& uuid) noexcept;

    /**
     * Returns the GATT assigned service name of the given canonical 128-bit UUID string,
     * or an empty string if not assigned.
     */
    std::string getServiceName(const std::string& uuid128) noexcept;

    /**@}*/

} // namespace webbt

#endif /* WEBBT_SERVICE_UUID_HPP_ */
