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

#include "WebBTTypes.hpp"

using namespace webbt;

template<typename T>
static void append_bitstr(std::string& out, T mask, T bit, const std::string& bitstr, bool& comma) {
    if( bit == ( mask & bit ) ) {
        if( comma ) { out.append(", "); }
        out.append(bitstr); comma = true;
    }
}
#define APPEND_BITSTR(U,V,M) append_bitstr(out, M, U::V, #V, comma);

#define CASE2_TO_STRING(U,V) case U::V: return #V;

#define REQUEST_STATUS_ENUM(X) \
        X(RequestStatus,SUCCESS) \
        X(RequestStatus,REQUEST_IN_PROGRESS) \
        X(RequestStatus,INVALID_OPTIONS) \
        X(RequestStatus,ADAPTER_ERROR) \
        X(RequestStatus,NO_DEVICES_FOUND) \
        X(RequestStatus,CANCELLED)

std::string webbt::to_string(const RequestStatus v) noexcept {
    switch(v) {
    REQUEST_STATUS_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown RequestStatus";
}

#define REQUEST_STATE_ENUM(X) \
        X(RequestState,IDLE) \
        X(RequestState,STARTING) \
        X(RequestState,SCANNING) \
        X(RequestState,COMPLETING)

std::string webbt::to_string(const RequestState v) noexcept {
    switch(v) {
    REQUEST_STATE_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown RequestState";
}

#define SCANFILTERFIELD_ENUM(X,M) \
    X(ScanFilterField,NAME,M) \
    X(ScanFilterField,NAME_PREFIX,M) \
    X(ScanFilterField,SERVICES,M)

std::string webbt::to_string(const ScanFilterField mask) noexcept {
    std::string out("[");
    bool comma = false;
    SCANFILTERFIELD_ENUM(APPEND_BITSTR,mask)
    out.append("]");
    return out;
}

#define SCANDATATYPE_ENUM(X,M) \
    X(ScanDataType,ADDRESS,M) \
    X(ScanDataType,NAME,M) \
    X(ScanDataType,RSSI,M) \
    X(ScanDataType,TX_POWER,M) \
    X(ScanDataType,SERVICE_UUID,M)

std::string webbt::to_string(const ScanDataType mask) noexcept {
    std::string out("[");
    bool comma = false;
    SCANDATATYPE_ENUM(APPEND_BITSTR,mask)
    out.append("]");
    return out;
}
