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

#ifndef WEBBT_ENV_HPP_
#define WEBBT_ENV_HPP_

#include <cstdint>

#include <jau/environment.hpp>

namespace webbt {

    /** \addtogroup WebBTUserAPI
     *
     *  @{
     */

    /**
     * Web-BT singleton runtime environment properties
     * <p>
     * Root domain is 'webbt', i.e. 'webbt.debug' and 'webbt.verbose' enable
     * DBG_PRINT and WORDY_PRINT output.
     * </p>
     * <p>
     * Also see {@link jau::environment::getExplodingProperties(const std::string & prefixDomain)},
     * e.g. 'webbt.scan=time=5000'.
     * </p>
     */
    class WebBTEnv : public jau::root_environment {
        private:
            WebBTEnv() noexcept; // NOLINT(modernize-use-equals-delete)

        public:
            /** Global Debug flag, retrieved first to triggers environment initialization. */
            const bool DEBUG_GLOBAL;

        private:
            const bool exploding; // just to trigger exploding properties

        public:
            /**
             * Default scan duration of BTDiscovery::requestDevice() in milliseconds,
             * used if RequestDeviceOptions::getScanTime() is zero.
             * <p>
             * Defaults to webbt::DEFAULT_SCAN_TIME_MS, minimum webbt::MIN_SCAN_TIME_MS.
             * </p>
             * <p>
             * Environment variable is 'webbt.scan.time'.
             * </p>
             */
            const int32_t SCAN_TIME_MS;

            /**
             * Debug each evaluated scan candidate.
             * <p>
             * Environment variable is 'webbt.debug.scan.candidate'.
             * </p>
             */
            const bool DEBUG_SCAN_CANDIDATE;

        public:
            static WebBTEnv& get() noexcept {
                /**
                 * Thread safe starting with C++11 6.7:
                 *
                 * If control enters the declaration concurrently while the variable is being initialized,
                 * the concurrent execution shall wait for completion of the initialization.
                 *
                 * (Magic Statics)
                 *
                 * Avoiding non-working double checked locking.
                 */
                static WebBTEnv e;
                return e;
            }
    };

    /**@}*/

} // namespace webbt

#endif /* WEBBT_ENV_HPP_ */
