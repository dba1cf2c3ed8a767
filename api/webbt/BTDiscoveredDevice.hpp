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

#ifndef WEBBT_DISCOVERED_DEVICE_HPP_
#define WEBBT_DISCOVERED_DEVICE_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <jau/darray.hpp>

#include "ScanRecord.hpp"

namespace webbt {

    /** \addtogroup WebBTUserAPI
     *
     *  @{
     */

    class BTDiscovery; // forward

    /**
     * Remote device accepted by a BTDiscovery::requestDevice() request.
     * <p>
     * Holds a copy of the adapter's ScanRecord, the resolved set of services the caller is allowed to access
     * and a weak back-reference to the requesting BTDiscovery.
     * </p>
     * <p>
     * Instances are immutable and outlive the request session.
     * </p>
     */
    class BTDiscoveredDevice {
        private:
            const ScanRecord record;
            const jau::darray<std::string> allowedServices;
            const std::weak_ptr<BTDiscovery> wbr_discovery;
            const uint64_t ts_creation;

        public:
            /**
             * @param r the accepted candidate
             * @param allowed canonical service UUIDs of matched filters and optional services
             * @param discovery the requesting BTDiscovery, may be empty
             */
            BTDiscoveredDevice(const ScanRecord& r, const jau::darray<std::string>& allowed,
                               const std::weak_ptr<BTDiscovery>& discovery) noexcept;

            BTDiscoveredDevice(const BTDiscoveredDevice&) = delete;
            void operator=(const BTDiscoveredDevice&) = delete;

            /** Returns the unique id of this device, i.e. its adapter reported address. */
            const std::string& getId() const noexcept { return record.getAddress(); }

            const std::string& getName() const noexcept { return record.getName(); }
            const std::string& getAddress() const noexcept { return record.getAddress(); }
            uint64_t getHandle() const noexcept { return record.getHandle(); }
            int8_t getRSSI() const noexcept { return record.getRSSI(); }
            int8_t getTxPower() const noexcept { return record.getTxPower(); }

            /** Returns the monotonic timestamp in milliseconds when this instance has been created. */
            uint64_t getCreationTimestamp() const noexcept { return ts_creation; }

            /** Returns the ScanRecord this device has been created from. */
            const ScanRecord& getScanRecord() const noexcept { return record; }

            /** Returns the canonical service UUIDs advertised by the device. */
            const jau::darray<std::string>& getServices() const noexcept { return record.getServices(); }

            /** Returns the canonical service UUIDs the caller is allowed to access. */
            const jau::darray<std::string>& getAllowedServices() const noexcept { return allowedServices; }

            /**
             * Returns true if the given service name or UUID is allowed to be accessed.
             * An invalid service identifier is not allowed.
             */
            bool isServiceAllowed(const std::string& nameOrUUID) const noexcept;

            /**
             * Returns the requesting BTDiscovery, or nullptr if it has been destroyed already.
             */
            std::shared_ptr<BTDiscovery> getDiscovery() const noexcept { return wbr_discovery.lock(); }

            std::string toString() const noexcept;
    };

    typedef std::shared_ptr<BTDiscoveredDevice> BTDiscoveredDeviceRef;

    inline bool operator==(const BTDiscoveredDevice& lhs, const BTDiscoveredDevice& rhs) noexcept
    { return &lhs == &rhs || lhs.getAddress() == rhs.getAddress(); }

    inline bool operator!=(const BTDiscoveredDevice& lhs, const BTDiscoveredDevice& rhs) noexcept
    { return !(lhs == rhs); }

    /**@}*/

} // namespace webbt

#endif /* WEBBT_DISCOVERED_DEVICE_HPP_ */
