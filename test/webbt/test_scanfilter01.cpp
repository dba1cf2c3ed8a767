#include <iostream>
#include <cinttypes>
#include <cstring>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include <jau/basic_types.hpp>

#include <webbt/ServiceUUID.hpp>
#include <webbt/ScanFilter.hpp>

#include "ScriptedScanAdapter.hpp"

using namespace webbt;

static const std::string uuidA("0000180d-0000-1000-8000-00805f9b34fb"); // heart_rate
static const std::string uuidB("0000180f-0000-1000-8000-00805f9b34fb"); // battery_service
static const std::string uuidC("0000180a-0000-1000-8000-00805f9b34fb"); // device_information

static ScanFilter normalized(const ScanFilter& f) {
    return f.normalized();
}

TEST_CASE( "ScanFilter Services Subset Test 01", "[filter][services]" ) {
    const ScanRecord rAC = makeRecord("00:00:00:00:00:01", "Sensor", strings({ "heart_rate", "device_information" }));
    const ScanRecord rA  = makeRecord("00:00:00:00:00:02", "Sensor", strings({ "heart_rate" }));

    jau::darray<ScanFilter> filters;
    filters.push_back( normalized( ScanFilter().addService("heart_rate").addService("battery_service") ) );

    // all services of a criterion are required
    REQUIRE( false == evaluateFilters(filters, rAC).isMatch() );
    REQUIRE( false == evaluateFilters(filters, rA).isMatch() );

    filters.push_back( normalized( ScanFilter().addService("0x180d") ) );
    const FilterResult res = evaluateFilters(filters, rAC);
    REQUIRE( true == res.isMatch() );
    REQUIRE( 1 == res.getServices().size() );
    REQUIRE( uuidA == res.getServices()[0] );
}

TEST_CASE( "ScanFilter Name Test 02", "[filter][name]" ) {
    const ScanRecord rNamed   = makeRecord("00:00:00:00:00:01", "Polar H10 1234", strings({}));
    const ScanRecord rNoName  = makeRecord("00:00:00:00:00:02", "", strings({ "heart_rate" }));

    {
        jau::darray<ScanFilter> filters;
        filters.push_back( ScanFilter().setName("Polar H10 1234") );
        REQUIRE( true == evaluateFilters(filters, rNamed).isMatch() );
        REQUIRE( false == evaluateFilters(filters, rNoName).isMatch() );
    }
    {
        // case-sensitive
        jau::darray<ScanFilter> filters;
        filters.push_back( ScanFilter().setName("polar h10 1234") );
        REQUIRE( false == evaluateFilters(filters, rNamed).isMatch() );
    }
    {
        jau::darray<ScanFilter> filters;
        filters.push_back( ScanFilter().setNamePrefix("Polar") );
        REQUIRE( true == evaluateFilters(filters, rNamed).isMatch() );
        REQUIRE( false == evaluateFilters(filters, rNoName).isMatch() );
    }
    {
        // prefix longer than the name
        jau::darray<ScanFilter> filters;
        filters.push_back( ScanFilter().setNamePrefix("Polar H10 1234 5") );
        REQUIRE( false == evaluateFilters(filters, rNamed).isMatch() );
    }
    {
        // an empty exact name is no constraint
        jau::darray<ScanFilter> filters;
        filters.push_back( ScanFilter().setName("") );
        REQUIRE( false == filters[0].isEmpty() );
        REQUIRE( true == evaluateFilters(filters, rNamed).isMatch() );
        REQUIRE( true == evaluateFilters(filters, rNoName).isMatch() );
    }
    {
        // neither is an empty name prefix
        jau::darray<ScanFilter> filters;
        filters.push_back( ScanFilter().setNamePrefix("") );
        REQUIRE( true == evaluateFilters(filters, rNamed).isMatch() );
        REQUIRE( true == evaluateFilters(filters, rNoName).isMatch() );
    }
    {
        // all set fields are required
        jau::darray<ScanFilter> filters;
        filters.push_back( normalized( ScanFilter().setNamePrefix("Polar").addService("heart_rate") ) );
        REQUIRE( false == evaluateFilters(filters, rNamed).isMatch() );
        REQUIRE( false == evaluateFilters(filters, rNoName).isMatch() );
    }
}

TEST_CASE( "ScanFilter Accumulation Test 03", "[filter][accumulate]" ) {
    const ScanRecord r = makeRecord("00:00:00:00:00:01", "Thermo", strings({ "heart_rate", "battery_service", "device_information" }));

    jau::darray<ScanFilter> filters;
    filters.push_back( ScanFilter().setName("Thermo") );
    filters.push_back( normalized( ScanFilter().addService("battery_service").addService("heart_rate") ) );
    filters.push_back( normalized( ScanFilter().addService("heart_rate").addService("device_information") ) );
    filters.push_back( normalized( ScanFilter().addService("glucose") ) );

    const FilterResult res = evaluateFilters(filters, r);
    REQUIRE( true == res.isMatch() );
    // union in first occurrence order, no duplicates
    REQUIRE( 3 == res.getServices().size() );
    REQUIRE( uuidB == res.getServices()[0] );
    REQUIRE( uuidA == res.getServices()[1] );
    REQUIRE( uuidC == res.getServices()[2] );
}

TEST_CASE( "ScanFilter Empty Test 04", "[filter][empty]" ) {
    const ScanRecord r = makeRecord("00:00:00:00:00:01", "Thermo", strings({ "heart_rate" }));

    const jau::darray<ScanFilter> none;
    REQUIRE( false == evaluateFilters(none, r).isMatch() );

    const FilterResult all = FilterResult::acceptAll();
    REQUIRE( true == all.isMatch() );
    REQUIRE( 0 == all.getServices().size() );

    // present but empty services field matches any candidate
    jau::darray<ScanFilter> filters;
    filters.push_back( ScanFilter().setServices( jau::darray<std::string>() ) );
    REQUIRE( false == filters[0].isEmpty() );
    const FilterResult res = evaluateFilters(filters, r);
    REQUIRE( true == res.isMatch() );
    REQUIRE( 0 == res.getServices().size() );

    REQUIRE( true == ScanFilter().isEmpty() );
}

TEST_CASE( "ScanFilter Normalize Test 05", "[filter][normalize]" ) {
    const ScanFilter f = ScanFilter().setNamePrefix("X").addService("0x180D").addService("battery_service");
    const ScanFilter n = f.normalized();
    REQUIRE( n.isSet(ScanFilterField::NAME_PREFIX) );
    REQUIRE( n.isSet(ScanFilterField::SERVICES) );
    REQUIRE( false == n.isSet(ScanFilterField::NAME) );
    REQUIRE( 2 == n.getServices().size() );
    REQUIRE( uuidA == n.getServices()[0] );
    REQUIRE( uuidB == n.getServices()[1] );

    REQUIRE_THROWS_AS( ScanFilter().addService("no service").normalized(), jau::IllegalArgumentException );
}
