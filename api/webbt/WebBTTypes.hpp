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

#ifndef WEBBT_TYPES_HPP_
#define WEBBT_TYPES_HPP_

#include <cstring>
#include <string>
#include <cstdint>
#include <system_error>

#include <jau/int_types.hpp>

namespace webbt {

    /** @defgroup WebBTUserAPI Web-BT General User Level API
     *  Types and functionality of a single in-flight device request.
     *
     *  @{
     */

    /**
     * Result status of a BTDiscovery::requestDevice() request.
     *
     * Each non SUCCESS value maps to a distinct failure class,
     * the detailed cause is carried by RequestResult::getMessage().
     */
    enum class RequestStatus : uint8_t {
        /** Device has been found and accepted. */
        SUCCESS             = 0x00,
        /** Admission denied, another request is pending. */
        REQUEST_IN_PROGRESS = 0x01,
        /** Static validation of the RequestDeviceOptions failed before any scan. */
        INVALID_OPTIONS     = 0x02,
        /** The ScanAdapter reported an error, e.g. radio unavailable. */
        ADAPTER_ERROR       = 0x03,
        /** Scan deadline reached without an accepted device. */
        NO_DEVICES_FOUND    = 0x04,
        /** Pending request has been cancelled via BTDiscovery::cancelRequest(). */
        CANCELLED           = 0x05
    };
    constexpr uint8_t number(const RequestStatus rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const RequestStatus v) noexcept;

    class RequestStatusCategory : public std::error_category {
        public:
            const char* name() const noexcept override { return "WebBT"; }
            std::string message(int condition) const override {
                return "WebBT::"+to_string( static_cast<RequestStatus>(condition) );
            }
            static RequestStatusCategory& get() {
                static RequestStatusCategory s;
                return s;
            }
    };
    inline std::error_code make_error_code( RequestStatus e ) noexcept {
      return std::error_code( number(e), RequestStatusCategory::get() );
    }

    /**
     * State of the single RequestSession of a BTDiscovery instance.
     *
     * <pre>
     * IDLE --admit--> STARTING --started--> SCANNING --match|timeout|error|cancel--> COMPLETING --stopped--> IDLE
     * STARTING --error--> IDLE
     * </pre>
     */
    enum class RequestState : uint8_t {
        /** No request pending. */
        IDLE       = 0,
        /** Request admitted, waiting for the ScanAdapter to confirm scan start. */
        STARTING   = 1,
        /** Scan active, candidates are evaluated until deadline. */
        SCANNING   = 2,
        /** Scan is being stopped, result pending. */
        COMPLETING = 3
    };
    constexpr uint8_t number(const RequestState rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const RequestState v) noexcept;

    /**
     * Bit mask of set ScanFilter fields.
     */
    enum class ScanFilterField : uint8_t {
        NONE         = 0,
        NAME         = (1 << 0),
        NAME_PREFIX  = (1 << 1),
        SERVICES     = (1 << 2)
    };
    constexpr uint8_t number(const ScanFilterField rhs) noexcept { return static_cast<uint8_t>(rhs); }

    constexpr ScanFilterField operator |(const ScanFilterField lhs, const ScanFilterField rhs) noexcept {
        return static_cast<ScanFilterField> ( number(lhs) | number(rhs) );
    }
    constexpr ScanFilterField operator &(const ScanFilterField lhs, const ScanFilterField rhs) noexcept {
        return static_cast<ScanFilterField> ( number(lhs) & number(rhs) );
    }
    constexpr bool operator ==(const ScanFilterField lhs, const ScanFilterField rhs) noexcept {
        return number(lhs) == number(rhs);
    }
    constexpr bool operator !=(const ScanFilterField lhs, const ScanFilterField rhs) noexcept {
        return !( lhs == rhs );
    }
    constexpr bool is_set(const ScanFilterField mask, const ScanFilterField bit) noexcept { return bit == ( mask & bit ); }
    constexpr void set(ScanFilterField &mask, const ScanFilterField bit) noexcept { mask = mask | bit; }
    std::string to_string(const ScanFilterField mask) noexcept;

    /**
     * Bit mask of set ScanRecord data fields.
     */
    enum class ScanDataType : uint16_t {
        NONE         = 0,
        ADDRESS      = (1 << 0),
        NAME         = (1 << 1),
        RSSI         = (1 << 2),
        TX_POWER     = (1 << 3),
        SERVICE_UUID = (1 << 4)
    };
    constexpr uint16_t number(const ScanDataType rhs) noexcept { return static_cast<uint16_t>(rhs); }

    constexpr ScanDataType operator |(const ScanDataType lhs, const ScanDataType rhs) noexcept {
        return static_cast<ScanDataType> ( number(lhs) | number(rhs) );
    }
    constexpr ScanDataType operator &(const ScanDataType lhs, const ScanDataType rhs) noexcept {
        return static_cast<ScanDataType> ( number(lhs) & number(rhs) );
    }
    constexpr bool operator ==(const ScanDataType lhs, const ScanDataType rhs) noexcept {
        return number(lhs) == number(rhs);
    }
    constexpr bool operator !=(const ScanDataType lhs, const ScanDataType rhs) noexcept {
        return !( lhs == rhs );
    }
    constexpr bool is_set(const ScanDataType mask, const ScanDataType bit) noexcept { return bit == ( mask & bit ); }
    constexpr void set(ScanDataType &mask, const ScanDataType bit) noexcept { mask = mask | bit; }
    std::string to_string(const ScanDataType mask) noexcept;

    /**@}*/

} // namespace webbt

namespace std
{
    /** \addtogroup WebBTUserAPI
     *
     *  @{
     */

    template <>
        struct is_error_code_enum<webbt::RequestStatus> : true_type {};

    /**@}*/
}

#endif /* WEBBT_TYPES_HPP_ */
