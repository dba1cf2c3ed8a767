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

#include <jau/basic_algos.hpp>

#include "ServiceUUID.hpp"
#include "ScanFilter.hpp"

using namespace webbt;

static std::string services_to_string(const jau::darray<std::string>& services) noexcept {
    std::string out("[");
    bool comma = false;
    for(const std::string& s : services) {
        if( comma ) { out.append(", "); }
        out.append(s);
        comma = true;
    }
    out.append("]");
    return out;
}

void webbt::appendUnique(jau::darray<std::string>& dest, const jau::darray<std::string>& src) noexcept {
    for(const std::string& s : src) {
        if( dest.cend() == jau::find_if(dest.cbegin(), dest.cend(), [&](const std::string& d)->bool { return d == s; }) ) {
            dest.push_back(s);
        }
    }
}

ScanFilter ScanFilter::normalized() const {
    ScanFilter res(*this);
    res.services.clear();
    for(const std::string& s : services) {
        res.services.push_back( getServiceUUID(s) );
    }
    return res;
}

bool ScanFilter::matches(const ScanRecord& r) const noexcept {
    // an empty name or name prefix imposes no constraint
    if( isSet(ScanFilterField::NAME) && name.size() > 0 ) {
        if( !r.hasName() || name != r.getName() ) {
            return false;
        }
    }
    if( isSet(ScanFilterField::NAME_PREFIX) && name_prefix.size() > 0 ) {
        if( !r.hasName() || name_prefix.size() > r.getName().size() ) {
            return false;
        }
        if( 0 != r.getName().compare(0, name_prefix.size(), name_prefix) ) {
            return false;
        }
    }
    if( isSet(ScanFilterField::SERVICES) ) {
        for(const std::string& s : services) {
            if( !r.hasService(s) ) {
                return false;
            }
        }
    }
    return true;
}

std::string ScanFilter::toString() const noexcept {
    std::string out("ScanFilter[fields "+to_string(field_mask));
    if( isSet(ScanFilterField::NAME) ) {
        out.append(", name '"+name+"'");
    }
    if( isSet(ScanFilterField::NAME_PREFIX) ) {
        out.append(", prefix '"+name_prefix+"'");
    }
    if( isSet(ScanFilterField::SERVICES) ) {
        out.append(", services "+services_to_string(services));
    }
    out.append("]");
    return out;
}

void FilterResult::addServices(const jau::darray<std::string>& s) noexcept {
    appendUnique(services, s);
}

std::string FilterResult::toString() const noexcept {
    return "FilterResult[match "+std::to_string(matched)+", services "+services_to_string(services)+"]";
}

FilterResult webbt::evaluateFilters(const jau::darray<ScanFilter>& filters, const ScanRecord& r) noexcept {
    FilterResult res;
    for(const ScanFilter& f : filters) {
        if( f.matches(r) ) {
            res.setMatch();
            if( f.isSet(ScanFilterField::SERVICES) ) {
                res.addServices( f.getServices() );
            }
        }
    }
    return res;
}
