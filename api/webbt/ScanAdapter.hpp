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

#ifndef WEBBT_SCAN_ADAPTER_HPP_
#define WEBBT_SCAN_ADAPTER_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <jau/darray.hpp>
#include <jau/cow_darray.hpp>
#include <jau/functional.hpp>
#include <jau/basic_types.hpp>

#include "ScanRecord.hpp"

namespace webbt {

    /** \addtogroup WebBTUserAPI
     *
     *  @{
     */

    class ScanAdapter; // forward

    /**
     * ScanAdapter listener for the adapter's enabled state, i.e. powered and usable radio.
     * <p>
     * The listener receiver maintains a unique set of listener instances without duplicates.
     * </p>
     */
    class AdapterEnabledListener {
        public:
            /**
             * The adapter's enabled state has changed.
             * @param adapter the adapter which state has changed
             * @param enabled the new enabled state
             */
            virtual void enabledChanged(ScanAdapter& adapter, const bool enabled) = 0;

            virtual ~AdapterEnabledListener() noexcept = default;

            virtual std::string toString() const noexcept { return "AdapterEnabledListener["+jau::to_hexstring(this)+"]"; }

            /**
             * Default comparison operator, merely testing for same memory reference.
             * <p>
             * Specializations may override.
             * </p>
             */
            virtual bool operator==(const AdapterEnabledListener& rhs) const noexcept
            { return this == &rhs; }

            bool operator!=(const AdapterEnabledListener& rhs) const noexcept
            { return !(*this == rhs); }
    };
    typedef std::shared_ptr<AdapterEnabledListener> AdapterEnabledListenerRef;

    /**
     * Capability of a lower level scanning adapter as consumed by BTDiscovery.
     * <p>
     * The adapter owns the radio and delivers scan candidates and lifecycle events
     * via the callbacks given to startScan(), from any thread.
     * </p>
     * <p>
     * Only one scan may be active or starting at a time per adapter,
     * a startScan() while scanning or starting shall be answered via the error callback
     * before startScan() returns.
     * Hence a start still pending after startScan() returned belongs to its caller.
     * </p>
     */
    class ScanAdapter {
        public:
            typedef jau::cow_darray<AdapterEnabledListenerRef> enabledListenerList_t;

            typedef jau::function<void(bool)> enabled_callback_t;
            typedef jau::function<void(const ScanRecord&)> candidate_callback_t;
            typedef jau::function<void()> started_callback_t;
            typedef jau::function<void(const std::string&)> error_callback_t;

        private:
            static enabledListenerList_t::equal_comparator enabledListenerRefEqComparator;
            enabledListenerList_t enabledListenerList;

        protected:
            /**
             * Sends the enabled state change to all AdapterEnabledListener.
             * To be called by implementations.
             */
            void sendEnabledChanged(const bool enabled) noexcept;

        public:
            virtual ~ScanAdapter() noexcept = default;

            /**
             * Queries the current enabled state, answered once via the given callback.
             */
            virtual void getEnabled(enabled_callback_t cb) = 0;

            /**
             * Starts scanning for remote devices.
             * <p>
             * The given service UUID allowlist is a hint for the radio level scan,
             * an empty list scans for all devices.
             * </p>
             * <p>
             * Exactly one of `onStarted` or `onError` is called to conclude the start.
             * Thereafter `onCandidate` is called for each received candidate until stopScan() returned.
             * `onError` may be called once more while scanning, if the radio fails.
             * </p>
             * @param allowlist canonical service UUIDs
             * @param onCandidate candidate callback
             * @param onStarted scan started confirmation
             * @param onError error callback with adapter specific message
             */
            virtual void startScan(const jau::darray<std::string>& allowlist,
                                   candidate_callback_t onCandidate,
                                   started_callback_t onStarted,
                                   error_callback_t onError) = 0;

            /**
             * Stops scanning, returning after the radio has stopped.
             * <p>
             * A start not yet concluded is cancelled,
             * neither `onStarted` nor `onError` of it is called after return.
             * </p>
             * <p>
             * No callback of the stopped scan is issued after return.
             * </p>
             */
            virtual void stopScan() = 0;

            virtual std::string toString() const noexcept = 0;

            /**
             * Add the given listener, if not yet contained.
             * @return true if the given listener is not element of the list and has been newly added, otherwise false.
             */
            bool addEnabledListener(const AdapterEnabledListenerRef& l) noexcept;

            /**
             * Remove the given listener.
             * @return true if the given listener is an element of the list and has been removed, otherwise false.
             */
            bool removeEnabledListener(const AdapterEnabledListenerRef& l) noexcept;

            jau::nsize_t getEnabledListenerCount() const noexcept { return enabledListenerList.size(); }
    };

    typedef std::shared_ptr<ScanAdapter> ScanAdapterRef;

    /**@}*/

} // namespace webbt

#endif /* WEBBT_SCAN_ADAPTER_HPP_ */
