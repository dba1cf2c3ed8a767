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
#include <cinttypes>
#include <mutex>
#include <future>

#include <jau/debug.hpp>
#include <jau/basic_algos.hpp>
#include <jau/basic_types.hpp>

#include "WebBTEnv.hpp"
#include "ServiceUUID.hpp"
#include "BTDiscovery.hpp"

using namespace webbt;
using namespace jau::fractions_i64_literals;

static const std::string REQUEST_ERROR_PREFIX = "requestDevice error: ";

bool DeviceSelection::select() noexcept {
    if( !consume() ) {
        DBG_PRINT("DeviceSelection::select: Consumed already: %s", toString().c_str());
        return false;
    }
    std::shared_ptr<BTDiscovery> discovery = wbr_discovery.lock();
    if( nullptr == discovery ) {
        WARN_PRINT("DeviceSelection::select: BTDiscovery destroyed: %s", toString().c_str());
        return false;
    }
    return discovery->selectDevice(session_id, device);
}

std::string DeviceSelection::toString() const noexcept {
    return "DeviceSelection[session "+std::to_string(session_id)+", consumed "+std::to_string(isConsumed())+
           ", "+( nullptr != device ? device->getId() : "null" )+"]";
}

std::string RequestDeviceOptions::toString() const noexcept {
    std::string out("RequestDeviceOptions[acceptAll "+std::to_string(accept_all_devices)+
                    ", deviceFound "+std::to_string(hasDeviceFound())+
                    ", scanTime "+std::to_string(scan_time_ms)+" ms, filters ");
    if( has_filters ) {
        out.append("[");
        bool comma = false;
        for(const ScanFilter& f : filters) {
            if( comma ) { out.append(", "); }
            out.append(f.toString());
            comma = true;
        }
        out.append("]");
    } else {
        out.append("none");
    }
    out.append(", optional [");
    bool comma = false;
    for(const std::string& s : optional_services) {
        if( comma ) { out.append(", "); }
        out.append(s);
        comma = true;
    }
    out.append("]]");
    return out;
}

std::string RequestResult::toString() const noexcept {
    std::string out("RequestResult["+to_string(status));
    if( message.size() > 0 ) {
        out.append(", '"+message+"'");
    }
    if( nullptr != device ) {
        out.append(", "+device->toString());
    }
    out.append("]");
    return out;
}

class BTDiscovery::EnabledForwarder : public AdapterEnabledListener {
    private:
        BTDiscovery& parent;

    public:
        EnabledForwarder(BTDiscovery& p) noexcept : parent(p) {}

        void enabledChanged(ScanAdapter& a, const bool enabled) override {
            (void)a;
            parent.sendAvailabilityChanged(enabled);
        }

        std::string toString() const noexcept override {
            return "BTDiscovery::EnabledForwarder["+jau::to_hexstring(&parent)+"]";
        }
};

BTDiscovery::availabilityListenerList_t::equal_comparator BTDiscovery::availabilityListenerRefEqComparator =
        [](const AvailabilityListenerRef &a, const AvailabilityListenerRef &b) -> bool { return *a == *b; };

BTDiscovery::BTDiscovery(const ScanAdapterRef& adapter_, const BTDiscoveredDeviceRef& referringDevice_) noexcept
: debug_candidate(WebBTEnv::get().DEBUG_SCAN_CANDIDATE),
  adapter(adapter_), referringDevice(referringDevice_),
  state(RequestState::IDLE), session(nullptr), next_session_id(1), timer_session_id(0),
  scan_timer("BTDiscovery::scanTimer", fraction_ms(THREAD_SHUTDOWN_TIMEOUT_MS)),
  enabledForwarder( std::make_shared<EnabledForwarder>(*this) )
{
    if( nullptr == adapter ) {
        ERR_PRINT("BTDiscovery::ctor: ScanAdapter is null");
        return;
    }
    adapter->addEnabledListener(enabledForwarder);
    DBG_PRINT("BTDiscovery::ctor: %s", toString().c_str());
}

BTDiscovery::~BTDiscovery() noexcept {
    DBG_PRINT("BTDiscovery::dtor: ... %s", toString().c_str());
    cancelRequest();

    // A start not yet confirmed by the adapter is aborted here, no callback must reach this instance afterwards
    std::promise<RequestResult> promise;
    bool resolve = false;
    {
        const std::lock_guard<std::mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
        if( nullptr != session && RequestState::STARTING == state ) {
            promise = std::move(session->promise);
            session = nullptr;
            state = RequestState::IDLE;
            resolve = true;
        }
    }
    if( resolve ) {
        try {
            adapter->stopScan();
        } catch (std::exception &e) {
            ERR_PRINT("BTDiscovery::dtor: stopScan: Caught exception %s", e.what());
        }
        promise.set_value( makeError(RequestStatus::CANCELLED, "request cancelled") );
    }
    scan_timer.stop();
    if( nullptr != adapter ) {
        adapter->removeEnabledListener(enabledForwarder);
    }
    availabilityListenerList.clear();
    DBG_PRINT("BTDiscovery::dtor: XXX");
}

RequestState BTDiscovery::getState() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
    return state;
}

bool BTDiscovery::isRequestPending() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
    return nullptr != session;
}

RequestResult BTDiscovery::makeError(const RequestStatus status, const std::string& msg) noexcept {
    return RequestResult(status, REQUEST_ERROR_PREFIX+msg);
}

RequestResult BTDiscovery::validate(const RequestDeviceOptions& options) noexcept {
    if( options.getAcceptAllDevices() || options.hasDeviceFound() ) {
        return RequestResult();
    }
    const jau::darray<ScanFilter>& filters = options.getFilters();
    if( !options.hasFilters() || 0 == filters.size() ) {
        return makeError(RequestStatus::INVALID_OPTIONS, "no filters specified");
    }
    for(const ScanFilter& f : filters) {
        if( f.isEmpty() ) {
            return makeError(RequestStatus::INVALID_OPTIONS, "empty filter specified");
        }
    }
    for(const ScanFilter& f : filters) {
        if( f.isSet(ScanFilterField::NAME_PREFIX) && 0 == f.getNamePrefix().size() ) {
            return makeError(RequestStatus::INVALID_OPTIONS, "empty namePrefix specified");
        }
    }
    for(const ScanFilter& f : filters) {
        if( f.getName().size() > MAX_DEVICE_NAME_LENGTH ) {
            return makeError(RequestStatus::INVALID_OPTIONS, "name exceeds "+std::to_string(MAX_DEVICE_NAME_LENGTH)+" octets");
        }
        if( f.getNamePrefix().size() > MAX_DEVICE_NAME_LENGTH ) {
            return makeError(RequestStatus::INVALID_OPTIONS, "namePrefix exceeds "+std::to_string(MAX_DEVICE_NAME_LENGTH)+" octets");
        }
    }
    return RequestResult();
}

std::future<bool> BTDiscovery::getAvailability() noexcept {
    std::shared_ptr<std::promise<bool>> promise = std::make_shared<std::promise<bool>>();
    std::shared_ptr<jau::sc_atomic_bool> answered = std::make_shared<jau::sc_atomic_bool>(false);
    std::future<bool> res = promise->get_future();
    if( nullptr == adapter ) {
        promise->set_value(false);
        return res;
    }
    try {
        adapter->getEnabled( [promise, answered](bool enabled) {
            if( !answered->exchange(true) ) {
                promise->set_value(enabled);
            }
        } );
    } catch (std::exception &e) {
        ERR_PRINT("BTDiscovery::getAvailability: Caught exception %s", e.what());
        if( !answered->exchange(true) ) {
            promise->set_value(false);
        }
    }
    return res;
}

std::future<RequestResult> BTDiscovery::requestDevice(const RequestDeviceOptions& options) noexcept {
    std::promise<RequestResult> early;
    std::future<RequestResult> res;
    jau::darray<std::string> allowlist;
    uint64_t id;
    {
        const std::lock_guard<std::mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
        if( nullptr != session ) {
            DBG_PRINT("BTDiscovery::requestDevice: Denied, %s", to_string(state).c_str());
            early.set_value( makeError(RequestStatus::REQUEST_IN_PROGRESS, "request in progress") );
            return early.get_future();
        }
        if( nullptr == adapter ) {
            early.set_value( makeError(RequestStatus::ADAPTER_ERROR, "no adapter") );
            return early.get_future();
        }
        RequestResult v = validate(options);
        if( !v.isSuccess() ) {
            DBG_PRINT("BTDiscovery::requestDevice: %s, %s", v.getMessage().c_str(), options.toString().c_str());
            early.set_value( v );
            return early.get_future();
        }
        std::unique_ptr<RequestSession> s = std::make_unique<RequestSession>();
        try {
            for(const ScanFilter& f : options.getFilters()) {
                ScanFilter nf = f.normalized();
                appendUnique(allowlist, nf.getServices());
                s->filters.push_back( nf );
            }
            for(const std::string& o : options.getOptionalServices()) {
                const std::string uuid128 = getServiceUUID(o);
                if( s->optional_services.cend() == jau::find_if(s->optional_services.cbegin(), s->optional_services.cend(),
                        [&](const std::string& e)->bool { return e == uuid128; }) )
                {
                    s->optional_services.push_back(uuid128);
                }
            }
        } catch (jau::IllegalArgumentException &e) {
            DBG_PRINT("BTDiscovery::requestDevice: %s", e.what());
            early.set_value( makeError(RequestStatus::INVALID_OPTIONS, "invalid service UUID") );
            return early.get_future();
        }
        id = next_session_id++;
        s->id = id;
        s->options = options;
        s->scan_time_ms = 0 < options.getScanTime() ? options.getScanTime() : static_cast<jau::nsize_t>( WebBTEnv::get().SCAN_TIME_MS );
        s->deadline = 0;
        s->matched = false;
        s->cancelled = false;
        res = s->promise.get_future();
        session = std::move(s);
        state = RequestState::STARTING;
        DBG_PRINT("BTDiscovery::requestDevice: Session %" PRIu64 " STARTING, allowlist %zu, %s",
                id, (size_t)allowlist.size(), options.toString().c_str());
    }
    try {
        adapter->startScan(allowlist,
                [this, id](const ScanRecord& r) { scanCandidate(id, r); },
                [this, id]() { scanStarted(id); },
                [this, id](const std::string& msg) { scanError(id, msg); } );
    } catch (std::exception &e) {
        ERR_PRINT("BTDiscovery::requestDevice: startScan: Caught exception %s", e.what());
        scanError(id, e.what());
    }
    return res;
}

void BTDiscovery::scanStarted(const uint64_t id) noexcept {
    bool cancelled;
    jau::nsize_t scan_time_ms;
    {
        const std::lock_guard<std::mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
        if( nullptr == session || session->id != id || RequestState::STARTING != state ) {
            DBG_PRINT("BTDiscovery::scanStarted: Session %" PRIu64 " superseded, %s", id, to_string(state).c_str());
            return;
        }
        state = RequestState::SCANNING;
        scan_time_ms = session->scan_time_ms;
        session->deadline = jau::getCurrentMilliseconds() + scan_time_ms;
        cancelled = session->cancelled;
        timer_session_id = id;
    }
    if( cancelled ) {
        DBG_PRINT("BTDiscovery::scanStarted: Session %" PRIu64 " cancelled while starting", id);
        completeSession(id, RequestStatus::CANCELLED, "request cancelled", nullptr, false);
        return;
    }
    DBG_PRINT("BTDiscovery::scanStarted: Session %" PRIu64 " SCANNING for %zu ms", id, (size_t)scan_time_ms);
    scan_timer.stop();
    if( !scan_timer.start(fraction_ms(scan_time_ms), jau::bind_member(this, &BTDiscovery::scanTimeout)) ) {
        ERR_PRINT("BTDiscovery::scanStarted: Session %" PRIu64 " scan timer not started", id);
        completeSession(id, RequestStatus::ADAPTER_ERROR, "scan timer failure", nullptr, false);
    }
}

void BTDiscovery::scanError(const uint64_t id, const std::string& msg) noexcept {
    std::promise<RequestResult> promise;
    bool start_failed = false;
    bool cancelled = false;
    {
        const std::lock_guard<std::mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
        if( nullptr == session || session->id != id ) {
            DBG_PRINT("BTDiscovery::scanError: Session %" PRIu64 " superseded: %s", id, msg.c_str());
            return;
        }
        if( RequestState::STARTING == state ) {
            // start failed, no scan to stop
            start_failed = true;
            cancelled = session->cancelled;
            promise = std::move(session->promise);
            session = nullptr;
            state = RequestState::IDLE;
        }
    }
    if( start_failed ) {
        WORDY_PRINT("BTDiscovery::scanError: Session %" PRIu64 " start failed, cancelled %d: %s", id, cancelled, msg.c_str());
        if( cancelled ) {
            promise.set_value( makeError(RequestStatus::CANCELLED, "request cancelled") );
        } else {
            promise.set_value( makeError(RequestStatus::ADAPTER_ERROR, msg) );
        }
        return;
    }
    WORDY_PRINT("BTDiscovery::scanError: Session %" PRIu64 ": %s", id, msg.c_str());
    completeSession(id, RequestStatus::ADAPTER_ERROR, msg, nullptr, false);
}

void BTDiscovery::scanCandidate(const uint64_t id, const ScanRecord& r) noexcept {
    jau::darray<std::string> allowed;
    RequestDeviceOptions::device_found_t device_found;
    {
        const std::lock_guard<std::mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
        if( nullptr == session || session->id != id || RequestState::SCANNING != state ) {
            if( debug_candidate ) {
                jau::PLAIN_PRINT(true, "BTDiscovery::scanCandidate: Session %" PRIu64 " %s, dropped: %s",
                        id, to_string(state).c_str(), r.toString().c_str());
            }
            return;
        }
        const FilterResult fr = session->options.hasFilters() ? evaluateFilters(session->filters, r) : FilterResult::acceptAll();
        if( debug_candidate ) {
            jau::PLAIN_PRINT(true, "BTDiscovery::scanCandidate: Session %" PRIu64 ": %s: %s",
                    id, fr.toString().c_str(), r.toString().c_str());
        }
        if( !fr.isMatch() ) {
            return;
        }
        session->matched = true;
        allowed = fr.getServices();
        appendUnique(allowed, session->optional_services);
        device_found = session->options.getDeviceFound();
    }
    BTDiscoveredDeviceRef device = std::make_shared<BTDiscoveredDevice>(r, allowed, weak_from_this());
    if( device_found.is_null() ) {
        selectDevice(id, device);
        return;
    }
    DeviceSelectionRef token = std::make_shared<DeviceSelection>(weak_from_this(), id, device);
    bool selected = false;
    try {
        selected = device_found(device, token);
    } catch (std::exception &e) {
        ERR_PRINT("BTDiscovery::scanCandidate: deviceFound %s: Caught exception %s", device->toString().c_str(), e.what());
    }
    if( selected && token->consume() ) {
        selectDevice(id, device);
    }
}

jau::fraction_i64 BTDiscovery::scanTimeout(jau::simple_timer& timer) noexcept {
    if( timer.shall_stop() ) {
        return 0_s;
    }
    uint64_t id;
    {
        const std::lock_guard<std::mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
        id = timer_session_id;
    }
    if( completeSession(id, RequestStatus::NO_DEVICES_FOUND, "no devices found", nullptr, true) ) {
        DBG_PRINT("BTDiscovery::scanTimeout: Session %" PRIu64 " timed out", id);
    }
    return 0_s;
}

bool BTDiscovery::selectDevice(const uint64_t id, const BTDiscoveredDeviceRef& device) noexcept {
    return completeSession(id, RequestStatus::SUCCESS, "", device, false);
}

bool BTDiscovery::completeSession(const uint64_t id, const RequestStatus status, const std::string& msg,
                                  const BTDiscoveredDeviceRef& device, const bool fromTimer) noexcept
{
    std::promise<RequestResult> promise;
    RequestResult result;
    {
        const std::lock_guard<std::mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
        if( nullptr == session || session->id != id || RequestState::SCANNING != state ) {
            DBG_PRINT("BTDiscovery::completeSession: Session %" PRIu64 " %s, %s ignored",
                    id, to_string(state).c_str(), to_string(status).c_str());
            return false;
        }
        state = RequestState::COMPLETING;
        promise = std::move(session->promise);
        if( RequestStatus::SUCCESS == status ) {
            result = RequestResult(status, "", device);
        } else if( RequestStatus::NO_DEVICES_FOUND == status && session->matched ) {
            result = makeError(status, "no device selected");
        } else {
            result = makeError(status, msg);
        }
    }
    if( !fromTimer ) {
        scan_timer.stop();
    }
    try {
        adapter->stopScan();
    } catch (std::exception &e) {
        ERR_PRINT("BTDiscovery::completeSession: Session %" PRIu64 " stopScan: Caught exception %s", id, e.what());
    }
    {
        const std::lock_guard<std::mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
        session = nullptr;
        state = RequestState::IDLE;
    }
    cv_session_idle.notify_all();
    WORDY_PRINT("BTDiscovery::completeSession: Session %" PRIu64 ": %s", id, result.toString().c_str());
    promise.set_value( result );
    return true;
}

bool BTDiscovery::cancelRequest() noexcept {
    uint64_t id;
    {
        std::unique_lock<std::mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
        if( nullptr == session ) {
            return false;
        }
        if( RequestState::COMPLETING == state ) {
            // wait for the completing thread's stopScan()
            const uint64_t cid = session->id;
            const jau::fraction_timespec timeout_time = jau::getMonotonicTime() + jau::fraction_timespec(fraction_ms(THREAD_SHUTDOWN_TIMEOUT_MS));
            while( nullptr != session && session->id == cid ) {
                std::cv_status s = jau::wait_until(cv_session_idle, lock, timeout_time);
                if( std::cv_status::timeout == s && nullptr != session && session->id == cid ) {
                    WARN_PRINT("BTDiscovery::cancelRequest: Session %" PRIu64 " still completing after %s",
                            cid, fraction_ms(THREAD_SHUTDOWN_TIMEOUT_MS).to_string(true).c_str());
                    return false;
                }
            }
            return false;
        }
        if( RequestState::STARTING == state ) {
            DBG_PRINT("BTDiscovery::cancelRequest: Session %" PRIu64 " marked cancelled while starting", session->id);
            session->cancelled = true;
            return false;
        }
        if( RequestState::SCANNING != state ) {
            return false;
        }
        id = session->id;
    }
    return completeSession(id, RequestStatus::CANCELLED, "request cancelled", nullptr, false);
}

bool BTDiscovery::addAvailabilityListener(const AvailabilityListenerRef& l) noexcept {
    if( nullptr == l ) {
        ERR_PRINT("AvailabilityListener ref is null");
        return false;
    }
    return availabilityListenerList.push_back_unique(l, availabilityListenerRefEqComparator);
}

bool BTDiscovery::removeAvailabilityListener(const AvailabilityListenerRef& l) noexcept {
    if( nullptr == l ) {
        ERR_PRINT("AvailabilityListener ref is null");
        return false;
    }
    const availabilityListenerList_t::size_type count = availabilityListenerList.erase_matching(l, false /* all_matching */, availabilityListenerRefEqComparator);
    return count > 0;
}

int BTDiscovery::removeAllAvailabilityListener() noexcept {
    int count = availabilityListenerList.size();
    availabilityListenerList.clear();
    return count;
}

void BTDiscovery::sendAvailabilityChanged(const bool available) noexcept {
    DBG_PRINT("BTDiscovery::sendAvailabilityChanged: %s: %d", EVENT_AVAILABILITY, available);
    int i=0;
    jau::for_each_fidelity(availabilityListenerList, [&](AvailabilityListenerRef &l) {
        try {
            l->availabilityChanged(available);
        } catch (std::exception &e) {
            ERR_PRINT("BTDiscovery::sendAvailabilityChanged-CBs %d/%zu: %s: Caught exception %s",
                    i+1, (size_t)availabilityListenerList.size(),
                    l->toString().c_str(), e.what());
        }
        i++;
    });
}

std::string BTDiscovery::toString() const noexcept {
    RequestState s;
    uint64_t id;
    {
        const std::lock_guard<std::mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
        s = state;
        id = nullptr != session ? session->id : 0;
    }
    return "BTDiscovery["+to_string(s)+", session "+std::to_string(id)+
           ", listener "+std::to_string(availabilityListenerList.size())+
           ", adapter "+( nullptr != adapter ? adapter->toString() : "null" )+"]";
}
