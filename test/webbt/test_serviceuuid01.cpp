#include <iostream>
#include <cinttypes>
#include <cstring>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include <jau/basic_types.hpp>
#include <jau/uuid.hpp>

#include <webbt/ServiceUUID.hpp>
#include <webbt/ScanRecord.hpp>

using namespace webbt;

static const std::string heart_rate_uuid128("0000180d-0000-1000-8000-00805f9b34fb");

TEST_CASE( "ServiceUUID Normalize Test 01", "[uuid][normalize]" ) {
    REQUIRE( heart_rate_uuid128 == getServiceUUID("heart_rate") );
    REQUIRE( heart_rate_uuid128 == getServiceUUID("180d") );
    REQUIRE( heart_rate_uuid128 == getServiceUUID("180D") );
    REQUIRE( heart_rate_uuid128 == getServiceUUID("0x180D") );
    REQUIRE( heart_rate_uuid128 == getServiceUUID("0000180d") );
    REQUIRE( heart_rate_uuid128 == getServiceUUID(0x180d) );
    REQUIRE( heart_rate_uuid128 == getServiceUUID("0000180D-0000-1000-8000-00805F9B34FB") );
    REQUIRE( heart_rate_uuid128 == getServiceUUID( jau::uuid16_t(0x180d) ) );

    REQUIRE( "0000180f-0000-1000-8000-00805f9b34fb" == getServiceUUID("battery_service") );
    REQUIRE( "00001800-0000-1000-8000-00805f9b34fb" == getServiceUUID("generic_access") );

    // 32-bit alias
    REQUIRE( "12345678-0000-1000-8000-00805f9b34fb" == getServiceUUID("12345678") );
    REQUIRE( "12345678-0000-1000-8000-00805f9b34fb" == getCanonicalUUID(0x12345678) );

    // vendor specific 128-bit UUID is only lower-cased
    REQUIRE( "6e400001-b5a3-f393-e0a9-e50e24dcca9e" == getServiceUUID("6E400001-B5A3-F393-E0A9-E50E24DCCA9E") );
}

TEST_CASE( "ServiceUUID Invalid Test 02", "[uuid][invalid]" ) {
    REQUIRE_THROWS_AS( getServiceUUID(""), jau::IllegalArgumentException );
    REQUIRE_THROWS_AS( getServiceUUID("heart-rate"), jau::IllegalArgumentException );
    REQUIRE_THROWS_AS( getServiceUUID("180g"), jau::IllegalArgumentException );
    REQUIRE_THROWS_AS( getServiceUUID("180d1"), jau::IllegalArgumentException );
    REQUIRE_THROWS_AS( getServiceUUID("0x"), jau::IllegalArgumentException );
    REQUIRE_THROWS_AS( getServiceUUID("0000180d-0000-1000-8000-00805f9b34f"), jau::IllegalArgumentException );
    REQUIRE_THROWS_AS( getServiceUUID("0000180d_0000_1000_8000_00805f9b34fb"), jau::IllegalArgumentException );
}

TEST_CASE( "ServiceUUID Name Test 03", "[uuid][name]" ) {
    REQUIRE( "heart_rate" == getServiceName(heart_rate_uuid128) );
    REQUIRE( "battery_service" == getServiceName( getServiceUUID(0x180f) ) );
    REQUIRE( getServiceName("6e400001-b5a3-f393-e0a9-e50e24dcca9e").empty() );
    REQUIRE( getServiceName("no uuid").empty() );
}

TEST_CASE( "ScanRecord Services Test 04", "[uuid][scanrecord]" ) {
    ScanRecord r(1, "C0:26:DA:01:DA:B1");
    REQUIRE( false == r.hasName() );
    REQUIRE( false == r.isSet(ScanDataType::NAME) );

    REQUIRE( true == r.addService("heart_rate") );
    REQUIRE( false == r.addService("0x180d") );
    REQUIRE( false == r.addService( jau::uuid16_t(0x180d) ) );
    REQUIRE( true == r.addService( jau::uuid16_t(0x180f) ) );
    REQUIRE( 2 == r.getServices().size() );
    REQUIRE( r.hasService(heart_rate_uuid128) );
    REQUIRE( r.isSet(ScanDataType::SERVICE_UUID) );
    REQUIRE_THROWS_AS( r.addService("no service"), jau::IllegalArgumentException );
    REQUIRE( 2 == r.getServices().size() );

    r.setName("");
    REQUIRE( r.isSet(ScanDataType::NAME) );
    REQUIRE( false == r.hasName() );
    r.setName("Polar H10");
    REQUIRE( r.hasName() );
}
