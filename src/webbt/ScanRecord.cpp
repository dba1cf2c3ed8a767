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

#include <jau/basic_algos.hpp>

#include "ServiceUUID.hpp"
#include "ScanRecord.hpp"

using namespace webbt;

bool ScanRecord::addService(const std::string& uuid) {
    const std::string uuid128 = getServiceUUID(uuid);
    if( hasService(uuid128) ) {
        return false;
    }
    services.push_back(uuid128);
    set(ScanDataType::SERVICE_UUID);
    return true;
}

bool ScanRecord::addService(const jau::uuid_t& uuid) noexcept {
    const std::string uuid128 = getServiceUUID(uuid);
    if( hasService(uuid128) ) {
        return false;
    }
    services.push_back(uuid128);
    set(ScanDataType::SERVICE_UUID);
    return true;
}

bool ScanRecord::hasService(const std::string& uuid128) const noexcept {
    return services.cend() != jau::find_if(services.cbegin(), services.cend(), [&](const std::string& s)->bool {
        return s == uuid128;
    });
}

std::string ScanRecord::toString() const noexcept {
    std::string out("ScanRecord[handle "+std::to_string(handle)+
                    ", address "+address+
                    ", name '"+name+"'"+
                    ", rssi "+std::to_string(rssi)+
                    ", tx-power "+std::to_string(tx_power)+
                    ", ts "+std::to_string(timestamp)+
                    ", mask "+to_string(data_mask)+
                    ", services [");
    bool comma = false;
    for(const std::string& s : services) {
        if( comma ) { out.append(", "); }
        out.append(s);
        comma = true;
    }
    out.append("]]");
    return out;
}
