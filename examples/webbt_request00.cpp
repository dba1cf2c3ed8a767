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
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <future>

#include <cinttypes>

#include <jau/basic_types.hpp>
#include <jau/darray.hpp>
#include <jau/debug.hpp>

#include <webbt/WebBTTypes.hpp>
#include <webbt/ServiceUUID.hpp>
#include <webbt/ScanRecord.hpp>
#include <webbt/ScanFilter.hpp>
#include <webbt/VirtualScanAdapter.hpp>
#include <webbt/BTDiscovery.hpp>

extern "C" {
    #include <unistd.h>
}

using namespace webbt;
using namespace jau::fractions_i64_literals;

/** \file
 * This _webbt_request00_ example runs one BTDiscovery::requestDevice() against a VirtualScanAdapter,
 * populated with the advertising records given on the command line.
 *
 * ### webbt_request00 Invocation Examples:
 * ~~~
 * webbt_request00 -rec C0:26:DA:01:DA:B1 'Polar H10' heart_rate,battery_service \
 *                 -rec 00:1A:7D:DA:71:13 Thermo health_thermometer \
 *                 -service heart_rate -optional battery_service
 *
 * webbt_request00 -rec C0:26:DA:01:DA:B1 'Polar H10' heart_rate -prefix Polar -select 1 -scantime 3000
 * ~~~
 */

static int SELECT_COUNT = 0;

class MyAvailabilityListener : public AvailabilityListener {
    public:
        void availabilityChanged(const bool available) override {
            jau::fprintf_td(stderr, "****** %s: %d\n", BTDiscovery::EVENT_AVAILABILITY, available);
        }

        std::string toString() const noexcept override {
            return "MyAvailabilityListener["+jau::to_hexstring(this)+"]";
        }
};

static jau::darray<std::string> split(const std::string& s, const char delim) {
    jau::darray<std::string> res;
    std::string::size_type start = 0;
    while( start <= s.size() ) {
        std::string::size_type end = s.find(delim, start);
        if( std::string::npos == end ) {
            end = s.size();
        }
        if( end > start ) {
            res.push_back( s.substr(start, end-start) );
        }
        start = end + 1;
    }
    return res;
}

static bool myDeviceFound(const BTDiscoveredDeviceRef& device, const DeviceSelectionRef& selection) {
    (void)selection;
    static int count = 0;
    ++count;
    jau::fprintf_td(stderr, "****** FOUND %d/%d: %s\n", count, SELECT_COUNT, device->toString().c_str());
    return count >= SELECT_COUNT;
}

int main(int argc, char *argv[])
{
    bool waitForEnter=false;
    bool acceptAll = false;
    bool adapterEnabled = true;
    jau::nsize_t scanTime = 0;
    uint64_t handle = 0;
    ScanFilter filter;
    RequestDeviceOptions options;
    jau::darray<ScanRecord> records;

    for(int i=1; i<argc; i++) {
        fprintf(stderr, "arg[%d/%d]: '%s'\n", i, argc, argv[i]);

        if( !strcmp("-webbt_debug", argv[i]) && argc > (i+1) ) {
            setenv("webbt.debug", argv[++i], 1 /* overwrite */);
        } else if( !strcmp("-webbt_verbose", argv[i]) && argc > (i+1) ) {
            setenv("webbt.verbose", argv[++i], 1 /* overwrite */);
        } else if( !strcmp("-webbt_scan", argv[i]) && argc > (i+1) ) {
            setenv("webbt.scan", argv[++i], 1 /* overwrite */);
        } else if( !strcmp("-wait", argv[i]) ) {
            waitForEnter = true;
        } else if( !strcmp("-rec", argv[i]) && argc > (i+3) ) {
            ScanRecord r(++handle, std::string(argv[++i]));
            const std::string name(argv[++i]);
            if( name.size() > 0 && "-" != name ) {
                r.setName(name);
            }
            for(const std::string& s : split(std::string(argv[++i]), ',')) {
                try {
                    r.addService(s);
                } catch (jau::IllegalArgumentException &e) {
                    jau::fprintf_td(stderr, "Ignored record service: %s\n", e.what());
                }
            }
            records.push_back(r);
        } else if( !strcmp("-name", argv[i]) && argc > (i+1) ) {
            filter.setName( std::string(argv[++i]) );
        } else if( !strcmp("-prefix", argv[i]) && argc > (i+1) ) {
            filter.setNamePrefix( std::string(argv[++i]) );
        } else if( !strcmp("-service", argv[i]) && argc > (i+1) ) {
            filter.addService( std::string(argv[++i]) );
        } else if( !strcmp("-optional", argv[i]) && argc > (i+1) ) {
            options.addOptionalService( std::string(argv[++i]) );
        } else if( !strcmp("-acceptAll", argv[i]) ) {
            acceptAll = true;
        } else if( !strcmp("-select", argv[i]) && argc > (i+1) ) {
            SELECT_COUNT = atoi(argv[++i]);
        } else if( !strcmp("-scantime", argv[i]) && argc > (i+1) ) {
            scanTime = static_cast<jau::nsize_t>( atoi(argv[++i]) );
        } else if( !strcmp("-disabled", argv[i]) ) {
            adapterEnabled = false;
        }
    }
    jau::fprintf_td(stderr, "pid %d\n", getpid());

    jau::fprintf_td(stderr, "Run with '(-rec <address> <name|-> <service[,service]*>)* "
                    "[-name <name>] [-prefix <name_prefix>] (-service <service>)* (-optional <service>)* "
                    "[-acceptAll] [-select <count>] [-scantime <ms>] [-disabled] "
                    "[-webbt_verbose true|false] "
                    "[-webbt_debug true|false|scan.candidate] "
                    "[-webbt_scan time=10240] "
                    "\n");

    VirtualScanAdapterRef adapter = std::make_shared<VirtualScanAdapter>("virt0", 100_ms);
    for(const ScanRecord& r : records) {
        adapter->addRecord(r);
    }
    if( !filter.isEmpty() ) {
        options.addFilter(filter);
    }
    options.setAcceptAllDevices(acceptAll).setScanTime(scanTime);
    if( 0 < SELECT_COUNT ) {
        options.setDeviceFound(myDeviceFound);
    }
    adapter->setEnabled(adapterEnabled);

    jau::fprintf_td(stderr, "adapter %s\n", adapter->toString().c_str());
    jau::fprintf_td(stderr, "records %zu\n", (size_t)adapter->getRecordCount());
    jau::fprintf_td(stderr, "options %s\n", options.toString().c_str());

    if( waitForEnter ) {
        jau::fprintf_td(stderr, "Press ENTER to continue\n");
        getchar();
    }

    BTDiscoveryRef discovery = std::make_shared<BTDiscovery>(adapter);
    discovery->addAvailabilityListener( std::make_shared<MyAvailabilityListener>() );

    jau::fprintf_td(stderr, "****** Availability %d\n", discovery->getAvailability().get());

    jau::fprintf_td(stderr, "****** REQUEST start\n");
    std::future<RequestResult> f = discovery->requestDevice(options);
    const RequestResult res = f.get();
    jau::fprintf_td(stderr, "****** REQUEST end: %s\n", res.toString().c_str());

    if( res.isSuccess() ) {
        const BTDiscoveredDeviceRef& device = res.getDevice();
        for(const std::string& s : device->getAllowedServices()) {
            const std::string name = getServiceName(s);
            jau::fprintf_td(stderr, "  allowed service %s %s\n", s.c_str(), name.c_str());
        }
    }
    discovery = nullptr;
    adapter = nullptr;
    return res.isSuccess() ? 0 : 1;
}
