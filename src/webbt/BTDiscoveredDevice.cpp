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

#include <jau/debug.hpp>
#include <jau/basic_algos.hpp>
#include <jau/basic_types.hpp>

#include "ServiceUUID.hpp"
#include "BTDiscoveredDevice.hpp"

using namespace webbt;

BTDiscoveredDevice::BTDiscoveredDevice(const ScanRecord& r, const jau::darray<std::string>& allowed,
                                       const std::weak_ptr<BTDiscovery>& discovery) noexcept
: record(r), allowedServices(allowed), wbr_discovery(discovery),
  ts_creation( jau::getCurrentMilliseconds() )
{ }

bool BTDiscoveredDevice::isServiceAllowed(const std::string& nameOrUUID) const noexcept {
    std::string uuid128;
    try {
        uuid128 = getServiceUUID(nameOrUUID);
    } catch (jau::IllegalArgumentException &e) {
        DBG_PRINT("BTDiscoveredDevice::isServiceAllowed: %s", e.what());
        return false;
    }
    return allowedServices.cend() != jau::find_if(allowedServices.cbegin(), allowedServices.cend(), [&](const std::string& s)->bool {
        return s == uuid128;
    });
}

std::string BTDiscoveredDevice::toString() const noexcept {
    std::string out("Device[id "+getId()+", name '"+getName()+"', allowed [");
    bool comma = false;
    for(const std::string& s : allowedServices) {
        if( comma ) { out.append(", "); }
        const std::string sname = getServiceName(s);
        out.append( sname.size() > 0 ? sname : s );
        comma = true;
    }
    out.append("], "+record.toString()+"]");
    return out;
}
