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

#ifndef WEBBT_SCAN_FILTER_HPP_
#define WEBBT_SCAN_FILTER_HPP_

#include <cstring>
#include <string>
#include <cstdint>

#include <jau/darray.hpp>

#include "WebBTTypes.hpp"
#include "ScanRecord.hpp"

namespace webbt {

    /** \addtogroup WebBTUserAPI
     *
     *  @{
     */

    /**
     * One scan filter criterion of a device request, a conjunction of its set fields:
     * - exact, case-sensitive name
     * - name prefix
     * - service UUIDs, all of them must be advertised
     *
     * A list of ScanFilter is a disjunction, i.e. any criterion may accept the device.
     * <p>
     * Each field is optional and tracked via ScanFilterField,
     * hence a set but empty service list differs from an unset one.
     * </p>
     */
    class ScanFilter {
        private:
            ScanFilterField field_mask = ScanFilterField::NONE;
            std::string name;
            std::string name_prefix;
            jau::darray<std::string> services;

        public:
            ScanFilter() noexcept = default;
            ScanFilter(const ScanFilter&) = default;
            ScanFilter& operator=(const ScanFilter &o) = default;

            ScanFilter& setName(const std::string& name_) noexcept {
                name = name_; webbt::set(field_mask, ScanFilterField::NAME); return *this;
            }
            ScanFilter& setNamePrefix(const std::string& prefix) noexcept {
                name_prefix = prefix; webbt::set(field_mask, ScanFilterField::NAME_PREFIX); return *this;
            }
            /** Sets the services field, possibly to an empty list. */
            ScanFilter& setServices(const jau::darray<std::string>& services_) noexcept {
                services = services_; webbt::set(field_mask, ScanFilterField::SERVICES); return *this;
            }
            /** Appends the given service name or UUID and sets the services field. */
            ScanFilter& addService(const std::string& uuid) noexcept {
                services.push_back(uuid); webbt::set(field_mask, ScanFilterField::SERVICES); return *this;
            }

            ScanFilterField getFieldMask() const noexcept { return field_mask; }
            bool isSet(const ScanFilterField bit) const noexcept { return is_set(field_mask, bit); }
            /** Returns true if no field is set at all. */
            bool isEmpty() const noexcept { return ScanFilterField::NONE == field_mask; }

            const std::string& getName() const noexcept { return name; }
            const std::string& getNamePrefix() const noexcept { return name_prefix; }
            const jau::darray<std::string>& getServices() const noexcept { return services; }

            /**
             * Returns a copy with all service identifiers in their canonical 128-bit form,
             * see getServiceUUID().
             * @throws jau::IllegalArgumentException on an invalid service identifier
             */
            ScanFilter normalized() const;

            /**
             * Returns true if all set fields of this criterion accept the given candidate.
             * <p>
             * An empty name or name prefix accepts any candidate, named or not.
             * </p>
             * <p>
             * Service identifiers are compared verbatim, hence this instance shall be normalized().
             * </p>
             */
            bool matches(const ScanRecord& r) const noexcept;

            std::string toString() const noexcept;
    };

    /**
     * Result of evaluateFilters().
     */
    class FilterResult {
        private:
            bool matched;
            jau::darray<std::string> services;

        public:
            FilterResult() noexcept : matched(false), services() {}

            /** Accepting result for the filter-less accept-all mode, without any matched services. */
            static FilterResult acceptAll() noexcept {
                FilterResult r;
                r.matched = true;
                return r;
            }

            bool isMatch() const noexcept { return matched; }

            /** Returns the union of the service UUIDs of all matching criteria, no duplicates, first occurrence order. */
            const jau::darray<std::string>& getServices() const noexcept { return services; }

            void setMatch() noexcept { matched = true; }
            /** Adds the given services not yet contained. */
            void addServices(const jau::darray<std::string>& s) noexcept;

            std::string toString() const noexcept;
    };

    /**
     * Evaluates the given normalized filter list against one candidate.
     * <p>
     * The list matches if any criterion matches, see ScanFilter::matches().
     * Every criterion is evaluated, the services of each matching criterion are accumulated.
     * An empty list never matches.
     * </p>
     * <p>
     * Pure function, the candidate is not modified.
     * </p>
     */
    FilterResult evaluateFilters(const jau::darray<ScanFilter>& filters, const ScanRecord& r) noexcept;

    /**
     * Appends all elements of `src` not yet contained in `dest`, preserving first occurrence order.
     */
    void appendUnique(jau::darray<std::string>& dest, const jau::darray<std::string>& src) noexcept;

    /**@}*/

} // namespace webbt

#endif /* WEBBT_SCAN_FILTER_HPP_ */
