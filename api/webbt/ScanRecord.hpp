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

#ifndef WEBBT_SCAN_RECORD_HPP_
#define WEBBT_SCAN_RECORD_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <jau/darray.hpp>
#include <jau/uuid.hpp>

#include "WebBTTypes.hpp"

namespace webbt {

    /** \addtogroup WebBTUserAPI
     *
     *  @{
     */

    /**
     * Scan candidate as reported by a ScanAdapter, i.e. the collected advertising data of one remote device.
     * <p>
     * Advertised service UUIDs are stored in their canonical 128-bit lower-case form,
     * see getServiceUUID().
     * </p>
     * <p>
     * A ScanRecord is transient and owned by the ScanAdapter until accepted by BTDiscovery,
     * which copies its data into a BTDiscoveredDevice.
     * </p>
     */
    class ScanRecord {
        private:
            uint64_t handle = 0;
            uint64_t timestamp = 0;
            ScanDataType data_mask = ScanDataType::NONE;

            std::string address;
            std::string name;
            int8_t rssi = 127; // The core spec defines 127 as the "not available" value
            int8_t tx_power = 127; // The core spec defines 127 as the "not available" value
            jau::darray<std::string> services;

            void set(ScanDataType bit) noexcept { data_mask = data_mask | bit; }

        public:
            ScanRecord() noexcept = default;

            /**
             * @param handle_ opaque adapter specific handle of the remote device
             * @param address_ the remote device address string
             */
            ScanRecord(const uint64_t handle_, const std::string& address_) noexcept
            : handle(handle_), address(address_) { set(ScanDataType::ADDRESS); }

            ScanRecord(const ScanRecord&) = default;
            ScanRecord& operator=(const ScanRecord &o) = default;

            void setHandle(uint64_t h) noexcept { handle = h; }
            void setTimestamp(uint64_t ts) noexcept { timestamp = ts; }
            void setAddress(const std::string& a) noexcept { address = a; set(ScanDataType::ADDRESS); }
            void setName(const std::string& name_) noexcept { name = name_; set(ScanDataType::NAME); }
            void setRSSI(int8_t v) noexcept { rssi = v; set(ScanDataType::RSSI); }
            void setTxPower(int8_t v) noexcept { tx_power = v; set(ScanDataType::TX_POWER); }

            /**
             * Adds the given service identifier in its canonical form, if not yet contained.
             * @param uuid service name or UUID string, see getServiceUUID()
             * @return true if added, false if already contained
             * @throws jau::IllegalArgumentException if uuid is not a valid service identifier
             */
            bool addService(const std::string& uuid);

            /**
             * Adds the given UUID in its canonical form, if not yet contained.
             * @return true if added, false if already contained
             */
            bool addService(const jau::uuid_t& uuid) noexcept;

            ScanDataType getDataMask() const noexcept { return data_mask; }
            bool isSet(ScanDataType bit) const noexcept { return ScanDataType::NONE != (data_mask & bit); }

            uint64_t getHandle() const noexcept { return handle; }
            uint64_t getTimestamp() const noexcept { return timestamp; }
            const std::string& getAddress() const noexcept { return address; }

            /** Returns true if the candidate advertised a non-empty name. */
            bool hasName() const noexcept { return isSet(ScanDataType::NAME) && name.size() > 0; }
            const std::string& getName() const noexcept { return name; }
            int8_t getRSSI() const noexcept { return rssi; }
            int8_t getTxPower() const noexcept { return tx_power; }

            /** Returns the advertised canonical service UUIDs. */
            const jau::darray<std::string>& getServices() const noexcept { return services; }

            /** Returns true if the given canonical service UUID has been advertised. */
            bool hasService(const std::string& uuid128) const noexcept;

            std::string toString() const noexcept;
    };

    typedef std::shared_ptr<ScanRecord> ScanRecordRef;

    /**@}*/

} // namespace webbt

#endif /* WEBBT_SCAN_RECORD_HPP_ */
