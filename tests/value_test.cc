#include <cstdint>
#include <optional>
#include <string>

#include <gtest/gtest.h>

#include "arbor/arbor.hh"
#include "test_types.hh"

using arbor::Value;
using arbor::ValueKind;
using arbor_test::array;
using arbor_test::object;

TEST( ValueTest, DefaultIsNull ) {
  Value v;
  EXPECT_EQ( v.kind(), ValueKind::Null );
  EXPECT_TRUE( v.is_null() );
  EXPECT_STREQ( v.kind_name(), "null" );
  EXPECT_TRUE( Value(nullptr).is_null() );
}

TEST( ValueTest, ScalarKinds ) {
  EXPECT_EQ( Value(true).kind(), ValueKind::Bool );
  EXPECT_EQ( Value(7).kind(), ValueKind::Int );
  EXPECT_EQ( Value(2.5).kind(), ValueKind::Double );
  EXPECT_EQ( Value(arbor::Decimal(3)).kind(), ValueKind::Decimal );
  EXPECT_EQ( Value("text").kind(), ValueKind::String );
  EXPECT_EQ( Value(std::string("text")).kind(), ValueKind::String );
}

TEST( ValueTest, AllIntegerWidthsCollapseToInt ) {
  EXPECT_EQ( Value(static_cast< std::int8_t >(-3)).as_int(), -3 );
  EXPECT_EQ( Value(static_cast< std::uint16_t >(65535)).as_int(), 65535 );
  EXPECT_EQ( Value(static_cast< std::int64_t >(1) << 40).as_int(),
    static_cast< std::int64_t >(1) << 40 );
}

TEST( ValueTest, WrongKindAccessorsAreEmpty ) {
  const Value i( 5 );
  EXPECT_EQ( i.as_int(), 5 );
  EXPECT_FALSE( i.as_double() );
  EXPECT_FALSE( i.as_bool() );
  EXPECT_EQ( i.as_string(), nullptr );
  EXPECT_EQ( i.as_decimal(), nullptr );
  EXPECT_EQ( i.as_array(), nullptr );
  EXPECT_EQ( i.as_object(), nullptr );

  const Value s( "abc" );
  ASSERT_NE( s.as_string(), nullptr );
  EXPECT_EQ( *s.as_string(), "abc" );
  EXPECT_FALSE( s.as_int() );
}

TEST( ValueTest, ContainersHoldAbsentElements ) {
  Value arr = array( { 1, std::nullopt, "x" } );
  ASSERT_NE( arr.as_array(), nullptr );
  ASSERT_EQ( arr.as_array()->size(), 3u );
  EXPECT_FALSE( (*arr.as_array())[1] );

  Value obj = object( { {"a", 1}, {"b", std::nullopt} } );
  ASSERT_NE( obj.as_object(), nullptr );
  EXPECT_EQ( obj.as_object()->size(), 2u );
  EXPECT_FALSE( obj.as_object()->at("b") );

  // Mutable view
  (*obj.as_object())[ "c" ] = Value( true );
  EXPECT_EQ( obj.as_object()->size(), 3u );
}

TEST( ValueTest, EqualityRespectsKind ) {
  EXPECT_EQ( Value(1), Value(1) );
  EXPECT_NE( Value(1), Value(1.0) );
  EXPECT_NE( Value(1), Value("1") );
  EXPECT_EQ( object({ {"k", array({ 1, 2 })} }),
    object({ {"k", array({ 1, 2 })} }) );
  EXPECT_NE( object({ {"k", 1} }), object({ {"k", std::nullopt} }) );
}

TEST( ValueTest, KindNames ) {
  EXPECT_STREQ( arbor::kind_name(ValueKind::Bool), "bool" );
  EXPECT_STREQ( arbor::kind_name(ValueKind::Int), "int" );
  EXPECT_STREQ( arbor::kind_name(ValueKind::Double), "double" );
  EXPECT_STREQ( arbor::kind_name(ValueKind::Decimal), "decimal" );
  EXPECT_STREQ( arbor::kind_name(ValueKind::String), "string" );
  EXPECT_STREQ( arbor::kind_name(ValueKind::Array), "array" );
  EXPECT_STREQ( arbor::kind_name(ValueKind::Object), "object" );
  EXPECT_STREQ( arbor::kind_name(std::optional< Value >()), "nil" );
  EXPECT_STREQ( arbor::kind_name(std::optional< Value >(Value(1))), "int" );
}
