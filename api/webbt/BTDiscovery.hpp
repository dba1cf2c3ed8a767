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

#ifndef WEBBT_DISCOVERY_HPP_
#define WEBBT_DISCOVERY_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>
#include <mutex>
#include <condition_variable>
#include <future>

#include <jau/darray.hpp>
#include <jau/cow_darray.hpp>
#include <jau/functional.hpp>
#include <jau/ordered_atomic.hpp>
#include <jau/simple_timer.hpp>
#include <jau/basic_types.hpp>

#include "WebBTConst.hpp"
#include "WebBTTypes.hpp"
#include "ScanRecord.hpp"
#include "ScanFilter.hpp"
#include "ScanAdapter.hpp"
#include "BTDiscoveredDevice.hpp"

namespace webbt {

    /** \addtogroup WebBTUserAPI
     *
     *  @{
     */

    class BTDiscovery; // forward
    class DeviceSelection; // forward
    typedef std::shared_ptr<DeviceSelection> DeviceSelectionRef;

    /**
     * Deferred selection token of one matched BTDiscoveredDevice,
     * passed to the RequestDeviceOptions::device_found_t callback.
     * <p>
     * The token is consumed at most once, either by the callback returning `true`
     * or by a later select() call from any thread.
     * </p>
     */
    class DeviceSelection {
        friend class BTDiscovery;

        private:
            const std::weak_ptr<BTDiscovery> wbr_discovery;
            const uint64_t session_id;
            const BTDiscoveredDeviceRef device;
            jau::sc_atomic_bool consumed;

            /** Returns true if this call consumed the token. */
            bool consume() noexcept { return !consumed.exchange(true); }

        public:
            DeviceSelection(const std::weak_ptr<BTDiscovery>& discovery, const uint64_t sessionId, const BTDiscoveredDeviceRef& device_) noexcept
            : wbr_discovery(discovery), session_id(sessionId), device(device_), consumed(false) {}

            DeviceSelection(const DeviceSelection&) = delete;
            void operator=(const DeviceSelection&) = delete;

            /**
             * Selects the associated device, completing the pending request with RequestStatus::SUCCESS.
             * <p>
             * Requires the BTDiscovery instance to be managed by a std::shared_ptr.
             * </p>
             * @return true if this call completed the request, otherwise false,
             *         i.e. the token has been consumed already or the request is no more pending.
             */
            bool select() noexcept;

            bool isConsumed() const noexcept { return consumed; }

            const BTDiscoveredDeviceRef& getDevice() const noexcept { return device; }

            std::string toString() const noexcept;
    };

    /**
     * Options of BTDiscovery::requestDevice().
     * <p>
     * The filter list presence is tracked apart from its emptiness,
     * i.e. an empty filter list set via setFilters() differs from no filter list.
     * </p>
     */
    class RequestDeviceOptions {
        public:
            /**
             * Device selection callback, invoked for each matching candidate.
             * <p>
             * Returning `true` selects the given device,
             * otherwise the scan continues until the DeviceSelection is selected or the scan times out.
             * </p>
             */
            typedef jau::function<bool(const BTDiscoveredDeviceRef&, const DeviceSelectionRef&)> device_found_t;

        private:
            bool accept_all_devices = false;
            device_found_t device_found;
            bool has_filters = false;
            jau::darray<ScanFilter> filters;
            jau::darray<std::string> optional_services;
            jau::nsize_t scan_time_ms = 0;

        public:
            RequestDeviceOptions() noexcept = default;
            RequestDeviceOptions(const RequestDeviceOptions&) = default;
            RequestDeviceOptions& operator=(const RequestDeviceOptions &o) = default;

            RequestDeviceOptions& setAcceptAllDevices(const bool v) noexcept { accept_all_devices = v; return *this; }
            RequestDeviceOptions& setDeviceFound(device_found_t cb) noexcept { device_found = cb; return *this; }
            RequestDeviceOptions& setFilters(const jau::darray<ScanFilter>& f) noexcept { filters = f; has_filters = true; return *this; }
            RequestDeviceOptions& addFilter(const ScanFilter& f) noexcept { filters.push_back(f); has_filters = true; return *this; }
            RequestDeviceOptions& setOptionalServices(const jau::darray<std::string>& s) noexcept { optional_services = s; return *this; }
            RequestDeviceOptions& addOptionalService(const std::string& s) noexcept { optional_services.push_back(s); return *this; }

            /** Sets the scan duration in milliseconds, zero selects WebBTEnv::SCAN_TIME_MS. */
            RequestDeviceOptions& setScanTime(const jau::nsize_t ms) noexcept { scan_time_ms = ms; return *this; }

            bool getAcceptAllDevices() const noexcept { return accept_all_devices; }
            const device_found_t& getDeviceFound() const noexcept { return device_found; }
            bool hasDeviceFound() const noexcept { return !device_found.is_null(); }
            bool hasFilters() const noexcept { return has_filters; }
            const jau::darray<ScanFilter>& getFilters() const noexcept { return filters; }
            const jau::darray<std::string>& getOptionalServices() const noexcept { return optional_services; }
            jau::nsize_t getScanTime() const noexcept { return scan_time_ms; }

            std::string toString() const noexcept;
    };

    /**
     * Result of BTDiscovery::requestDevice(), delivered through its std::future.
     */
    class RequestResult {
        private:
            RequestStatus status;
            std::string message;
            BTDiscoveredDeviceRef device;

        public:
            RequestResult() noexcept
            : status(RequestStatus::SUCCESS), message(), device(nullptr) {}

            RequestResult(const RequestStatus s, const std::string& msg, const BTDiscoveredDeviceRef& d=nullptr) noexcept
            : status(s), message(msg), device(d) {}

            RequestStatus getStatus() const noexcept { return status; }
            bool isSuccess() const noexcept { return RequestStatus::SUCCESS == status; }

            /** Returns the cause of a failure, prefixed by `requestDevice error: `, or an empty string on success. */
            const std::string& getMessage() const noexcept { return message; }

            /** Returns the selected device, non-null only on RequestStatus::SUCCESS. */
            const BTDiscoveredDeviceRef& getDevice() const noexcept { return device; }

            std::error_code getErrorCode() const noexcept { return make_error_code(status); }

            std::string toString() const noexcept;
    };

    /**
     * BTDiscovery listener for the republished adapter enabled state,
     * see BTDiscovery::EVENT_AVAILABILITY.
     * <p>
     * The listener receiver maintains a unique set of listener instances without duplicates.
     * </p>
     */
    class AvailabilityListener {
        public:
            /**
             * The underlying ScanAdapter's enabled state has changed.
             * @param available the new state
             */
            virtual void availabilityChanged(const bool available) = 0;

            virtual ~AvailabilityListener() noexcept = default;

            virtual std::string toString() const noexcept { return "AvailabilityListener["+jau::to_hexstring(this)+"]"; }

            /**
             * Default comparison operator, merely testing for same memory reference.
             * <p>
             * Specializations may override.
             * </p>
             */
            virtual bool operator==(const AvailabilityListener& rhs) const noexcept
            { return this == &rhs; }

            bool operator!=(const AvailabilityListener& rhs) const noexcept
            { return !(*this == rhs); }
    };
    typedef std::shared_ptr<AvailabilityListener> AvailabilityListenerRef;

    /**
     * Single-in-flight device request controller over a ScanAdapter.
     * <p>
     * requestDevice() validates the RequestDeviceOptions, starts one scan on the ScanAdapter
     * with the union of all filter services as allowlist, evaluates each delivered candidate
     * and resolves its std::future exactly once, by
     * - the first accepted match, RequestStatus::SUCCESS
     * - the scan deadline, RequestStatus::NO_DEVICES_FOUND
     * - an adapter error, RequestStatus::ADAPTER_ERROR
     * - cancelRequest(), RequestStatus::CANCELLED
     * </p>
     * <p>
     * Every exit path after a confirmed scan start calls ScanAdapter::stopScan() exactly once.
     * </p>
     * <p>
     * Adapter events may arrive on any thread.
     * The session state is guarded by one mutex,
     * which is never held while calling the ScanAdapter or a user callback.
     * </p>
     * <p>
     * Deferred selection via DeviceSelection and the BTDiscoveredDevice back-reference
     * require instances to be managed by a std::shared_ptr.
     * </p>
     */
    class BTDiscovery : public std::enable_shared_from_this<BTDiscovery> {
        friend class DeviceSelection;

        public:
            /** Event topic of the republished adapter enabled state. */
            static constexpr const char* EVENT_AVAILABILITY = "availabilitychanged";

            typedef jau::cow_darray<AvailabilityListenerRef> availabilityListenerList_t;

        private:
            struct RequestSession {
                uint64_t id;
                RequestDeviceOptions options;
                /** Normalized copy of RequestDeviceOptions::getFilters() */
                jau::darray<ScanFilter> filters;
                /** Normalized copy of RequestDeviceOptions::getOptionalServices() */
                jau::darray<std::string> optional_services;
                jau::nsize_t scan_time_ms;
                uint64_t deadline;
                bool matched;
                bool cancelled;
                std::promise<RequestResult> promise;
            };

            class EnabledForwarder; // forward

            const bool debug_candidate;
            const ScanAdapterRef adapter;
            const BTDiscoveredDeviceRef referringDevice;

            mutable std::mutex mtx_session;
            std::condition_variable cv_session_idle;
            RequestState state;
            std::unique_ptr<RequestSession> session;
            uint64_t next_session_id;
            uint64_t timer_session_id;
            jau::simple_timer scan_timer;

            static availabilityListenerList_t::equal_comparator availabilityListenerRefEqComparator;
            availabilityListenerList_t availabilityListenerList;
            AdapterEnabledListenerRef enabledForwarder;

            static RequestResult makeError(const RequestStatus status, const std::string& msg) noexcept;

            /** Static validation, returns RequestStatus::SUCCESS if valid. */
            static RequestResult validate(const RequestDeviceOptions& options) noexcept;

            void scanStarted(const uint64_t id) noexcept;
            void scanError(const uint64_t id, const std::string& msg) noexcept;
            void scanCandidate(const uint64_t id, const ScanRecord& r) noexcept;
            jau::fraction_i64 scanTimeout(jau::simple_timer& timer) noexcept;

            bool selectDevice(const uint64_t id, const BTDiscoveredDeviceRef& device) noexcept;

            /**
             * Single completion entry point of a SCANNING session.
             * @return true if this call completed the session, false if it was no more SCANNING
             */
            bool completeSession(const uint64_t id, const RequestStatus status, const std::string& msg,
                                 const BTDiscoveredDeviceRef& device, const bool fromTimer) noexcept;

            void sendAvailabilityChanged(const bool available) noexcept;

        public:
            /**
             * @param adapter_ the ScanAdapter to use
             * @param referringDevice_ optional BTDiscoveredDevice this instance has been created for
             */
            BTDiscovery(const ScanAdapterRef& adapter_, const BTDiscoveredDeviceRef& referringDevice_=nullptr) noexcept;

            BTDiscovery(const BTDiscovery&) = delete;
            void operator=(const BTDiscovery&) = delete;

            /**
             * Cancels a pending request and removes the adapter subscription.
             */
            ~BTDiscovery() noexcept;

            const ScanAdapterRef& getAdapter() const noexcept { return adapter; }

            /** Returns the optional BTDiscoveredDevice this instance has been created for, may be nullptr. */
            const BTDiscoveredDeviceRef& getReferringDevice() const noexcept { return referringDevice; }

            RequestState getState() const noexcept;

            /** Returns true if a request is STARTING, SCANNING or COMPLETING. */
            bool isRequestPending() const noexcept;

            /**
             * Queries the ScanAdapter's enabled state, never touching a scan.
             */
            std::future<bool> getAvailability() noexcept;

            /**
             * Requests one device matching the given options.
             * <p>
             * Failures are never thrown but delivered as RequestResult,
             * the returned std::future is resolved exactly once.
             * </p>
             * <p>
             * Admission is denied with RequestStatus::REQUEST_IN_PROGRESS while another request is pending.
             * Invalid options resolve RequestStatus::INVALID_OPTIONS without any adapter interaction.
             * </p>
             */
            std::future<RequestResult> requestDevice(const RequestDeviceOptions& options) noexcept;

            /**
             * Cancels the pending request, resolving it with RequestStatus::CANCELLED.
             * <p>
             * If the scan start is not yet confirmed, the request is marked cancelled
             * and completes once the adapter answers. Idempotent otherwise.
             * </p>
             * <p>
             * If another thread is completing the request, this call waits until
             * its ScanAdapter::stopScan() returned, at most webbt::THREAD_SHUTDOWN_TIMEOUT_MS.
             * </p>
             * @return true if this call stopped the scan, otherwise false
             */
            bool cancelRequest() noexcept;

            /**
             * Add the given listener, if not yet contained.
             * @return true if the given listener is not element of the list and has been newly added, otherwise false.
             */
            bool addAvailabilityListener(const AvailabilityListenerRef& l) noexcept;

            /**
             * Remove the given listener.
             * @return true if the given listener is an element of the list and has been removed, otherwise false.
             */
            bool removeAvailabilityListener(const AvailabilityListenerRef& l) noexcept;

            /**
             * Remove all AvailabilityListener from the list.
             * @return number of removed listener.
             */
            int removeAllAvailabilityListener() noexcept;

            jau::nsize_t getAvailabilityListenerCount() const noexcept { return availabilityListenerList.size(); }

            std::string toString() const noexcept;
    };

    typedef std::shared_ptr<BTDiscovery> BTDiscoveryRef;

    /**@}*/

} // namespace webbt

#endif /* WEBBT_DISCOVERY_HPP_ */
