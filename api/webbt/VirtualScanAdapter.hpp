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

#ifndef WEBBT_VIRTUAL_SCAN_ADAPTER_HPP_
#define WEBBT_VIRTUAL_SCAN_ADAPTER_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>
#include <mutex>

#include <jau/darray.hpp>
#include <jau/ordered_atomic.hpp>
#include <jau/service_runner.hpp>
#include <jau/fraction_type.hpp>

#include "ScanRecord.hpp"
#include "ScanAdapter.hpp"

namespace webbt {

    /** \addtogroup WebBTUserAPI
     *
     *  @{
     */

    /**
     * Software ScanAdapter replaying its configured ScanRecord list on a jau::service_runner thread.
     * <p>
     * Each scan delivers every record passing the allowlist once, in insertion order,
     * one per given interval. Thereafter the scan stays active without further candidates until stopped.
     * </p>
     * <p>
     * A record passes the allowlist if the allowlist is empty or the record advertises any of its services.
     * </p>
     * <p>
     * A second startScan() while scanning, or any startScan() while disabled, fails via its error callback.
     * Disabling the adapter while scanning reports an error to the active scan.
     * </p>
     */
    class VirtualScanAdapter : public ScanAdapter {
        private:
            const std::string name;
            const jau::fraction_i64 interval;
            jau::sc_atomic_bool enabled;

            mutable std::mutex mtx_scan;
            jau::darray<ScanRecord> records;
            bool scanning;
            jau::nsize_t scan_count;
            jau::nsize_t next_record;
            jau::darray<std::string> scan_allowlist;
            candidate_callback_t scan_onCandidate;
            error_callback_t scan_onError;

            jau::service_runner scan_service;

            static bool isAllowed(const jau::darray<std::string>& allowlist, const ScanRecord& r) noexcept;

            void scanWork(jau::service_runner& sr) noexcept;
            void scanEndLocked(jau::service_runner& sr) noexcept;

        public:
            /**
             * @param name_ adapter name
             * @param interval_ delay before each delivered record
             * @param enabled_ initial enabled state
             */
            VirtualScanAdapter(const std::string& name_, const jau::fraction_i64& interval_, const bool enabled_=true) noexcept;

            VirtualScanAdapter(const VirtualScanAdapter&) = delete;
            void operator=(const VirtualScanAdapter&) = delete;

            ~VirtualScanAdapter() noexcept override;

            const std::string& getName() const noexcept { return name; }

            /** Appends the given record, delivered by all subsequent scans. */
            void addRecord(const ScanRecord& r) noexcept;

            void clearRecords() noexcept;

            jau::nsize_t getRecordCount() const noexcept;

            /**
             * Sets the enabled state, notifying all AdapterEnabledListener on change.
             * <p>
             * Disabling while scanning reports `adapter disabled` to the active scan's error callback.
             * </p>
             */
            void setEnabled(const bool v) noexcept;

            bool isEnabled() const noexcept { return enabled; }

            bool isScanning() const noexcept;

            /** Returns the number of scans started so far. */
            jau::nsize_t getScanCount() const noexcept;

            void getEnabled(enabled_callback_t cb) override;

            void startScan(const jau::darray<std::string>& allowlist,
                           candidate_callback_t onCandidate,
                           started_callback_t onStarted,
                           error_callback_t onError) override;

            void stopScan() override;

            std::string toString() const noexcept override;
    };

    typedef std::shared_ptr<VirtualScanAdapter> VirtualScanAdapterRef;

    /**@}*/

} // namespace webbt

#endif /* WEBBT_VIRTUAL_SCAN_ADAPTER_HPP_ */
