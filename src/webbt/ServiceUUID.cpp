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
#include <cstdint>
#include <cctype>

#include <algorithm>

#include <jau/basic_types.hpp>
#include <jau/uuid.hpp>

#include "ServiceUUID.hpp"

using namespace webbt;

namespace {

    struct ServiceNameAlias {
        const char* name;
        uint16_t alias;
    };

    /**
     * GATT Assigned Service names as used by Web Bluetooth.
     *
     * https://www.bluetooth.com/specifications/assigned-numbers/
     */
    const ServiceNameAlias serviceNames[] = {
        { "generic_access",                  0x1800 },
        { "generic_attribute",               0x1801 },
        { "immediate_alert",                 0x1802 },
        { "link_loss",                       0x1803 },
        { "tx_power",                        0x1804 },
        { "current_time",                    0x1805 },
        { "reference_time_update",           0x1806 },
        { "next_dst_change",                 0x1807 },
        { "glucose",                         0x1808 },
        { "health_thermometer",              0x1809 },
        { "device_information",              0x180a },
        { "heart_rate",                      0x180d },
        { "phone_alert_status",              0x180e },
        { "battery_service",                 0x180f },
        { "blood_pressure",                  0x1810 },
        { "alert_notification",              0x1811 },
        { "human_interface_device",          0x1812 },
        { "scan_parameters",                 0x1813 },
        { "running_speed_and_cadence",       0x1814 },
        { "automation_io",                   0x1815 },
        { "cycling_speed_and_cadence",       0x1816 },
        { "cycling_power",                   0x1818 },
        { "location_and_navigation",         0x1819 },
        { "environmental_sensing",           0x181a },
        { "body_composition",                0x181b },
        { "user_data",                       0x181c },
        { "weight_scale",                    0x181d },
        { "bond_management",                 0x181e },
        { "continuous_glucose_monitoring",   0x181f },
        { "internet_protocol_support",       0x1820 },
        { "indoor_positioning",              0x1821 },
        { "pulse_oximeter",                  0x1822 },
        { "http_proxy",                      0x1823 },
        { "transport_discovery",             0x1824 },
        { "object_transfer",                 0x1825 },
        { "fitness_machine",                 0x1826 },
        { "mesh_provisioning",               0x1827 },
        { "mesh_proxy",                      0x1828 },
        { "reconnection_configuration",      0x1829 }
    };

    /** Bluetooth Base UUID suffix of the canonical 128-bit form, following the 32-bit alias. */
    const std::string base_uuid_suffix("-0000-1000-8000-00805f9b34fb");

    std::string to_lower(std::string s) noexcept {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
        return s;
    }

    bool is_hex(const std::string& s, const std::string::size_type start, const std::string::size_type len) noexcept {
        if( start + len > s.size() ) {
            return false;
        }
        for(std::string::size_type i=start; i<start+len; ++i) {
            if( 0 == std::isxdigit( static_cast<unsigned char>(s[i]) ) ) {
                return false;
            }
        }
        return true;
    }

    /** Validates the 8-4-4-4-12 UUID string layout. */
    bool is_uuid128_string(const std::string& s) noexcept {
        return 36 == s.size() &&
               is_hex(s, 0, 8) && '-' == s[8] &&
               is_hex(s, 9, 4) && '-' == s[13] &&
               is_hex(s, 14, 4) && '-' == s[18] &&
               is_hex(s, 19, 4) && '-' == s[23] &&
               is_hex(s, 24, 12);
    }

    bool find_alias(const std::string& name, uint32_t& alias) noexcept {
        for(const ServiceNameAlias& e : serviceNames) {
            if( name == e.name ) {
                alias = e.alias;
                return true;
            }
        }
        return false;
    }

} // namespace

std::string webbt::getCanonicalUUID(const uint32_t alias) noexcept {
    if( alias <= 0xffff ) {
        return to_lower( jau::uuid16_t( static_cast<uint16_t>(alias) ).toUUID128String() );
    } else {
        return to_lower( jau::uuid32_t( alias ).toUUID128String() );
    }
}

std::string webbt::getServiceUUID(const std::string& nameOrUUID) {
    uint32_t alias = 0;
    if( find_alias(nameOrUUID, alias) ) {
        return getCanonicalUUID(alias);
    }
    std::string::size_type start = 0;
    if( nameOrUUID.size() > 2 && '0' == nameOrUUID[0] && ( 'x' == nameOrUUID[1] || 'X' == nameOrUUID[1] ) ) {
        start = 2;
    }
    const std::string::size_type len = nameOrUUID.size() - start;
    if( ( 4 == len || 8 == len || ( 0 < start && len < 8 ) ) && is_hex(nameOrUUID, start, len) ) {
        alias = static_cast<uint32_t>( std::stoul(nameOrUUID.substr(start, len), nullptr, 16) );
        return getCanonicalUUID(alias);
    }
    if( is_uuid128_string(nameOrUUID) ) {
        return to_lower(nameOrUUID);
    }
    throw jau::IllegalArgumentException("Invalid Service name or UUID '"+nameOrUUID+"'", E_FILE_LINE);
}

std::string webbt::getServiceUUID(const jau::uuid_t& uuid) noexcept {
    return to_lower( uuid.toUUID128String() );
}

std::string webbt::getServiceName(const std::string& uuid128) noexcept {
    if( !is_uuid128_string(uuid128) || to_lower( uuid128.substr(8) ) != base_uuid_suffix || "0000" != uuid128.substr(0, 4) ) {
        return std::string();
    }
    const uint16_t alias = static_cast<uint16_t>( std::stoul(uuid128.substr(4, 4), nullptr, 16) );
    for(const ServiceNameAlias& e : serviceNames) {
        if( alias == e.alias ) {
            return std::string(e.name);
        }
    }
    return std::string();
}
