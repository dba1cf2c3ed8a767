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

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>
#include <mutex>

#include <jau/debug.hpp>
#include <jau/basic_algos.hpp>

#include "WebBTConst.hpp"
#include "WebBTEnv.hpp"
#include "VirtualScanAdapter.hpp"

using namespace webbt;
using namespace jau::fractions_i64_literals;

VirtualScanAdapter::VirtualScanAdapter(const std::string& name_, const jau::fraction_i64& interval_, const bool enabled_) noexcept
: name(name_), interval(interval_), enabled(enabled_),
  scanning(false), scan_count(0), next_record(0),
  scan_service("VirtualScanAdapter::scan_"+name_, fraction_ms(THREAD_SHUTDOWN_TIMEOUT_MS),
               jau::bind_member(this, &VirtualScanAdapter::scanWork),
               jau::service_runner::Callback() /* init */,
               jau::bind_member(this, &VirtualScanAdapter::scanEndLocked))
{
    WebBTEnv::get(); // triggers environment initialization
}

VirtualScanAdapter::~VirtualScanAdapter() noexcept {
    DBG_PRINT("VirtualScanAdapter::dtor: %s", toString().c_str());
    stopScan();
}

bool VirtualScanAdapter::isAllowed(const jau::darray<std::string>& allowlist, const ScanRecord& r) noexcept {
    if( 0 == allowlist.size() ) {
        return true;
    }
    for(const std::string& s : allowlist) {
        if( r.hasService(s) ) {
            return true;
        }
    }
    return false;
}

void VirtualScanAdapter::addRecord(const ScanRecord& r) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_scan); // RAII-style acquire and relinquish via destructor
    records.push_back(r);
}

void VirtualScanAdapter::clearRecords() noexcept {
    const std::lock_guard<std::mutex> lock(mtx_scan); // RAII-style acquire and relinquish via destructor
    records.clear();
    next_record = 0;
}

jau::nsize_t VirtualScanAdapter::getRecordCount() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_scan); // RAII-style acquire and relinquish via destructor
    return records.size();
}

bool VirtualScanAdapter::isScanning() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_scan); // RAII-style acquire and relinquish via destructor
    return scanning;
}

jau::nsize_t VirtualScanAdapter::getScanCount() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_scan); // RAII-style acquire and relinquish via destructor
    return scan_count;
}

void VirtualScanAdapter::setEnabled(const bool v) noexcept {
    if( v == enabled.exchange(v) ) {
        return;
    }
    DBG_PRINT("VirtualScanAdapter::setEnabled: %d: %s", v, toString().c_str());
    if( !v ) {
        error_callback_t onError;
        {
            const std::lock_guard<std::mutex> lock(mtx_scan); // RAII-style acquire and relinquish via destructor
            if( scanning ) {
                onError = scan_onError;
            }
        }
        if( !onError.is_null() ) {
            onError("adapter disabled");
        }
    }
    sendEnabledChanged(v);
}

void VirtualScanAdapter::getEnabled(enabled_callback_t cb) {
    cb(enabled);
}

void VirtualScanAdapter::startScan(const jau::darray<std::string>& allowlist,
                                   candidate_callback_t onCandidate,
                                   started_callback_t onStarted,
                                   error_callback_t onError)
{
    if( !enabled ) {
        onError("adapter not enabled");
        return;
    }
    {
        const std::lock_guard<std::mutex> lock(mtx_scan); // RAII-style acquire and relinquish via destructor
        if( scanning ) {
            DBG_PRINT("VirtualScanAdapter::startScan: Denied, scanning: %s", toString().c_str());
            // unlocked below
        } else {
            scanning = true;
            scan_count++;
            next_record = 0;
            scan_allowlist = allowlist;
            scan_onCandidate = onCandidate;
            scan_onError = onError;
            onError = error_callback_t();
        }
    }
    if( !onError.is_null() ) {
        onError("scan already in progress");
        return;
    }
    DBG_PRINT("VirtualScanAdapter::startScan: allowlist %zu: %s", (size_t)allowlist.size(), toString().c_str());
    onStarted();
    {
        const std::lock_guard<std::mutex> lock(mtx_scan); // RAII-style acquire and relinquish via destructor
        if( !scanning ) {
            // stopped within onStarted
            return;
        }
    }
    scan_service.stop(); // a previous scan stopped from within its own worker may still wind down
    scan_service.start();
}

void VirtualScanAdapter::stopScan() {
    {
        const std::lock_guard<std::mutex> lock(mtx_scan); // RAII-style acquire and relinquish via destructor
        if( !scanning ) {
            return;
        }
        scanning = false;
        scan_onCandidate = candidate_callback_t();
        scan_onError = error_callback_t();
    }
    const bool r = scan_service.stop();
    DBG_PRINT("VirtualScanAdapter::stopScan: stopped %d: %s", r, toString().c_str());
}

void VirtualScanAdapter::scanWork(jau::service_runner& sr) noexcept {
    jau::sleep_for( interval );

    ScanRecord r;
    candidate_callback_t onCandidate;
    {
        const std::lock_guard<std::mutex> lock(mtx_scan); // RAII-style acquire and relinquish via destructor
        if( !scanning || sr.shall_stop() ) {
            sr.set_shall_stop();
            return;
        }
        while( next_record < records.size() && !isAllowed(scan_allowlist, records[next_record]) ) {
            ++next_record;
        }
        if( next_record >= records.size() ) {
            return; // idle until stopped
        }
        r = records[next_record++];
        onCandidate = scan_onCandidate;
    }
    r.setTimestamp( jau::getCurrentMilliseconds() );
    try {
        onCandidate(r);
    } catch (std::exception &e) {
        ERR_PRINT("VirtualScanAdapter::scanWork: %s: Caught exception %s", r.toString().c_str(), e.what());
    }
}

void VirtualScanAdapter::scanEndLocked(jau::service_runner& sr) noexcept {
    (void)sr;
    DBG_PRINT("VirtualScanAdapter::scanEnd: %s, delivered %zu/%zu", name.c_str(), (size_t)next_record, (size_t)records.size());
}

std::string VirtualScanAdapter::toString() const noexcept {
    return "VirtualScanAdapter['"+name+"', enabled "+std::to_string(enabled)+
           ", interval "+interval.to_string(true)+
           ", scanWorker[running "+std::to_string(scan_service.is_running())+
           ", shallStop "+std::to_string(scan_service.shall_stop())+"]]";
}
