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

#include "ScanAdapter.hpp"

using namespace webbt;

ScanAdapter::enabledListenerList_t::equal_comparator ScanAdapter::enabledListenerRefEqComparator =
        [](const AdapterEnabledListenerRef &a, const AdapterEnabledListenerRef &b) -> bool { return *a == *b; };

bool ScanAdapter::addEnabledListener(const AdapterEnabledListenerRef& l) noexcept {
    if( nullptr == l ) {
        ERR_PRINT("AdapterEnabledListener ref is null");
        return false;
    }
    return enabledListenerList.push_back_unique(l, enabledListenerRefEqComparator);
}

bool ScanAdapter::removeEnabledListener(const AdapterEnabledListenerRef& l) noexcept {
    if( nullptr == l ) {
        ERR_PRINT("AdapterEnabledListener ref is null");
        return false;
    }
    const enabledListenerList_t::size_type count = enabledListenerList.erase_matching(l, false /* all_matching */, enabledListenerRefEqComparator);
    return count > 0;
}

void ScanAdapter::sendEnabledChanged(const bool enabled) noexcept {
    int i=0;
    jau::for_each_fidelity(enabledListenerList, [&](AdapterEnabledListenerRef &l) {
        try {
            l->enabledChanged(*this, enabled);
        } catch (std::exception &e) {
            ERR_PRINT("ScanAdapter::sendEnabledChanged-CBs %d/%zu: %s of %s: Caught exception %s",
                    i+1, (size_t)enabledListenerList.size(),
                    l->toString().c_str(), toString().c_str(), e.what());
        }
        i++;
    });
}
