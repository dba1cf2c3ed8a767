#include <iostream>
#include <cinttypes>
#include <cstring>
#include <chrono>
#include <future>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include <webbt/BTDiscovery.hpp>

#include "ScriptedScanAdapter.hpp"

using namespace webbt;

static RequestResult immediate(std::future<RequestResult>& f) {
    REQUIRE( std::future_status::ready == f.wait_for(std::chrono::milliseconds(0)) );
    return f.get();
}

TEST_CASE( "RequestDevice Validation Test 01", "[request][validation]" ) {
    ScriptedScanAdapterRef adapter = std::make_shared<ScriptedScanAdapter>();
    BTDiscoveryRef discovery = std::make_shared<BTDiscovery>(adapter);

    {
        std::future<RequestResult> f = discovery->requestDevice( RequestDeviceOptions() );
        const RequestResult r = immediate(f);
        REQUIRE( RequestStatus::INVALID_OPTIONS == r.getStatus() );
        REQUIRE( "requestDevice error: no filters specified" == r.getMessage() );
        REQUIRE( nullptr == r.getDevice() );
    }
    {
        std::future<RequestResult> f = discovery->requestDevice( RequestDeviceOptions().setFilters( jau::darray<ScanFilter>() ) );
        const RequestResult r = immediate(f);
        REQUIRE( RequestStatus::INVALID_OPTIONS == r.getStatus() );
        REQUIRE( "requestDevice error: no filters specified" == r.getMessage() );
    }
    {
        std::future<RequestResult> f = discovery->requestDevice(
                RequestDeviceOptions().addFilter( ScanFilter().setName("Thermo") ).addFilter( ScanFilter() ) );
        const RequestResult r = immediate(f);
        REQUIRE( RequestStatus::INVALID_OPTIONS == r.getStatus() );
        REQUIRE( "requestDevice error: empty filter specified" == r.getMessage() );
    }
    {
        std::future<RequestResult> f = discovery->requestDevice(
                RequestDeviceOptions().addFilter( ScanFilter().setNamePrefix("") ) );
        const RequestResult r = immediate(f);
        REQUIRE( RequestStatus::INVALID_OPTIONS == r.getStatus() );
        REQUIRE( "requestDevice error: empty namePrefix specified" == r.getMessage() );
    }
    {
        std::future<RequestResult> f = discovery->requestDevice(
                RequestDeviceOptions().addFilter( ScanFilter().setName( std::string(MAX_DEVICE_NAME_LENGTH+1, 'x') ) ) );
        const RequestResult r = immediate(f);
        REQUIRE( RequestStatus::INVALID_OPTIONS == r.getStatus() );
    }
    {
        std::future<RequestResult> f = discovery->requestDevice(
                RequestDeviceOptions().addFilter( ScanFilter().addService("no_such_service") ) );
        const RequestResult r = immediate(f);
        REQUIRE( RequestStatus::INVALID_OPTIONS == r.getStatus() );
    }
    {
        // service identifiers are validated in accept-all mode as well
        std::future<RequestResult> f = discovery->requestDevice(
                RequestDeviceOptions().setAcceptAllDevices(true).addOptionalService("0x18zz") );
        const RequestResult r = immediate(f);
        REQUIRE( RequestStatus::INVALID_OPTIONS == r.getStatus() );
    }
    // no adapter interaction on invalid options
    REQUIRE( 0 == adapter->startScanCount );
    REQUIRE( 0 == adapter->stopScanCount );
    REQUIRE( RequestState::IDLE == discovery->getState() );
    REQUIRE( false == discovery->isRequestPending() );
}

TEST_CASE( "RequestDevice Validation Modes Test 02", "[request][validation]" ) {
    ScriptedScanAdapterRef adapter = std::make_shared<ScriptedScanAdapter>();
    BTDiscoveryRef discovery = std::make_shared<BTDiscovery>(adapter);

    {
        // accept-all skips filter validation
        std::future<RequestResult> f = discovery->requestDevice( RequestDeviceOptions().setAcceptAllDevices(true) );
        REQUIRE( 1 == adapter->startScanCount );
        REQUIRE( RequestState::SCANNING == discovery->getState() );
        REQUIRE( 0 == adapter->getAllowlist().size() );
        REQUIRE( true == discovery->cancelRequest() );
        REQUIRE( RequestStatus::CANCELLED == immediate(f).getStatus() );
    }
    {
        // a selection callback skips filter validation
        std::future<RequestResult> f = discovery->requestDevice(
                RequestDeviceOptions().setDeviceFound( [](const BTDiscoveredDeviceRef&, const DeviceSelectionRef&) -> bool { return false; } ) );
        REQUIRE( 2 == adapter->startScanCount );
        REQUIRE( RequestState::SCANNING == discovery->getState() );
        REQUIRE( true == discovery->cancelRequest() );
        REQUIRE( RequestStatus::CANCELLED == immediate(f).getStatus() );
    }
    REQUIRE( 2 == adapter->stopScanCount );
}

TEST_CASE( "RequestDevice Allowlist Test 03", "[request][allowlist]" ) {
    ScriptedScanAdapterRef adapter = std::make_shared<ScriptedScanAdapter>();
    BTDiscoveryRef discovery = std::make_shared<BTDiscovery>(adapter);

    RequestDeviceOptions options;
    options.addFilter( ScanFilter().addService("heart_rate").addService("battery_service") );
    options.addFilter( ScanFilter().addService("0x180D").addService("device_information") );
    options.addFilter( ScanFilter().setNamePrefix("Th") );
    options.addOptionalService("glucose");

    std::future<RequestResult> f = discovery->requestDevice(options);
    REQUIRE( 1 == adapter->startScanCount );

    // normalized, de-duplicated, first occurrence order, optional services excluded
    const jau::darray<std::string> allowlist = adapter->getAllowlist();
    REQUIRE( 3 == allowlist.size() );
    REQUIRE( "0000180d-0000-1000-8000-00805f9b34fb" == allowlist[0] );
    REQUIRE( "0000180f-0000-1000-8000-00805f9b34fb" == allowlist[1] );
    REQUIRE( "0000180a-0000-1000-8000-00805f9b34fb" == allowlist[2] );

    REQUIRE( true == discovery->cancelRequest() );
    REQUIRE( RequestStatus::CANCELLED == immediate(f).getStatus() );
}

TEST_CASE( "RequestDevice Admission Test 04", "[request][admission]" ) {
    ScriptedScanAdapterRef adapter = std::make_shared<ScriptedScanAdapter>(false /* autoStart */);
    BTDiscoveryRef discovery = std::make_shared<BTDiscovery>(adapter);

    const RequestDeviceOptions options = RequestDeviceOptions().addFilter( ScanFilter().setName("Thermo") );

    std::future<RequestResult> f1 = discovery->requestDevice(options);
    REQUIRE( RequestState::STARTING == discovery->getState() );
    REQUIRE( true == discovery->isRequestPending() );
    {
        std::future<RequestResult> f2 = discovery->requestDevice(options);
        const RequestResult r = immediate(f2);
        REQUIRE( RequestStatus::REQUEST_IN_PROGRESS == r.getStatus() );
        REQUIRE( "requestDevice error: request in progress" == r.getMessage() );
    }
    adapter->confirmStart();
    REQUIRE( RequestState::SCANNING == discovery->getState() );
    {
        std::future<RequestResult> f2 = discovery->requestDevice( RequestDeviceOptions().setAcceptAllDevices(true) );
        REQUIRE( RequestStatus::REQUEST_IN_PROGRESS == immediate(f2).getStatus() );
    }
    REQUIRE( 1 == adapter->startScanCount );
    REQUIRE( std::future_status::timeout == f1.wait_for(std::chrono::milliseconds(0)) );

    REQUIRE( true == discovery->cancelRequest() );
    REQUIRE( RequestStatus::CANCELLED == immediate(f1).getStatus() );
    REQUIRE( RequestState::IDLE == discovery->getState() );

    // admitted again once idle
    std::future<RequestResult> f3 = discovery->requestDevice(options);
    REQUIRE( 2 == adapter->startScanCount );
    REQUIRE( RequestState::STARTING == discovery->getState() );
    adapter->failStart("radio off");
    REQUIRE( RequestStatus::ADAPTER_ERROR == immediate(f3).getStatus() );
}
