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

#ifndef WEBBT_CONST_HPP_
#define WEBBT_CONST_HPP_

#include <cstddef>

#include <jau/int_types.hpp>
#include <jau/fraction_type.hpp>

namespace webbt {

    /**
     * Default duration of a device request scan in milliseconds, 10.24s.
     *
     * Equals 16 times the 640ms LE general discovery advertising interval.
     * May be overridden via the environment variable 'webbt.scan.time'.
     */
    inline constexpr const jau::nsize_t DEFAULT_SCAN_TIME_MS = 10240;

    /**
     * Minimum accepted scan duration in milliseconds for the environment override.
     */
    inline constexpr const jau::nsize_t MIN_SCAN_TIME_MS = 10;

    /**
     * Maximum time in milliseconds to wait for a thread shutdown.
     *
     * Used for the scan deadline timer and the VirtualScanAdapter worker.
     */
    inline constexpr const jau::nsize_t THREAD_SHUTDOWN_TIMEOUT_MS = 8000;

    /**
     * Maximum length of a device name or name prefix in octets (UTF-8).
     *
     * BT Core Spec v5.2: Vol 3, Part C, 3.2.2.3 Device name
     */
    inline constexpr const jau::nsize_t MAX_DEVICE_NAME_LENGTH = 248;

    /**
     * Returns the given duration in milliseconds as jau::fraction_i64.
     */
    inline jau::fraction_i64 fraction_ms(const jau::nsize_t ms) noexcept {
        return jau::fraction_i64( static_cast<int64_t>(ms), 1'000lu );
    }

} // namespace webbt

#endif /* WEBBT_CONST_HPP_ */
