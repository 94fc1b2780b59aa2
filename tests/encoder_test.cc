#include <any>
#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "arbor/arbor.hh"
#include "test_types.hh"

using arbor::CodingKey;
using arbor::Encoder;
using arbor::EncoderOptions;
using arbor::Timestamp;
using arbor::Value;
using arbor::ValueEncoder;
using arbor_test::array;
using arbor_test::object;
using arbor_test::Scripted;

namespace {

  // Holds a record that writes nothing
  struct Holder {
    arbor_test::Silent silent;

    void encode( Encoder& encoder ) const {
      arbor::KeyedEncodingContainer c = encoder.keyed_container();
      c.encode( silent, "silent" );
    }
  };

  // Records the coding path and a user info tag seen while encoding
  struct Probe {
    void encode( Encoder& encoder ) const {
      auto* sink = std::any_cast< std::string* >( encoder.user_info()
        .at("sink") );
      *sink = encoder.coding_path().to_string();
      arbor::SingleValueEncodingContainer c = encoder.single_value_container();
      c.encode( std::any_cast< std::string >(encoder.user_info().at("tag")) );
    }
  };

  std::optional< Value > encode_with( const Timestamp& t,
    arbor::TimestampEncodingStrategy strategy )
  {
    EncoderOptions options;
    options.timestamp_strategy = std::move( strategy );
    return ValueEncoder( options ).encode( t );
  }

}

TEST( EncoderTest, BaseCase ) {
  ValueEncoder encoder;
  const auto out = encoder.encode( arbor_test::Item{ 1, "a" } );
  ASSERT_TRUE( out );
  EXPECT_EQ( *out, object({ {"id", 1}, {"name", "a"} }) );
}

TEST( EncoderTest, TopLevelScalars ) {
  ValueEncoder encoder;
  EXPECT_EQ( encoder.encode(5), Value(5) );
  EXPECT_EQ( encoder.encode(true), Value(true) );
  EXPECT_EQ( encoder.encode(2.5f), Value(2.5) );
  EXPECT_EQ( encoder.encode(std::string("x")), Value("x") );
  EXPECT_EQ( encoder.encode(*arbor::Uri::parse("https://google.com")),
    Value("https://google.com") );
  EXPECT_EQ( encoder.encode(*arbor::Decimal::parse("0.1")),
    Value(*arbor::Decimal::parse("0.1")) );
}

TEST( EncoderTest, TopLevelNullIsNotAnError ) {
  ValueEncoder encoder;
  EXPECT_FALSE( encoder.encode(std::optional< int >()) );
}

TEST( EncoderTest, TopLevelThatWritesNothingThrows ) {
  ValueEncoder encoder;
  try {
    encoder.encode( arbor_test::Silent() );
    FAIL() << "expected EmptyTopLevel";
  }
  catch ( const arbor::EmptyTopLevel& err ) {
    EXPECT_EQ( err.kind(), arbor::ErrorKind::EmptyTopLevel );
    EXPECT_EQ( err.detail(), "Top-level record did not encode any values." );
  }
}

TEST( EncoderTest, NestedValueThatWritesNothingIsEmptyObject ) {
  ValueEncoder encoder;
  EXPECT_EQ( encoder.encode(Holder()),
    object({ {"silent", object({})} }) );
}

TEST( EncoderTest, AllKinds ) {
  ValueEncoder encoder;
  const auto out = encoder.encode( arbor_test::make_sample() );
  ASSERT_TRUE( out );

  const Value expected = object({
    {"flag", true},
    {"number", 42},
    {"small", -7},
    {"ratio", 3.25},
    {"scale", 1.5},
    {"amount", *arbor::Decimal::parse( "0.1" )},
    {"name", "sample"},
    {"list", array({ 1, 2, 3 })},
    {"inner", object({ {"label", "nested"}, {"count", 2} })},
    {"when", 991180800. - Timestamp::REFERENCE_DATE_OFFSET},
    {"payload", "abcdefg="},
    {"link", "https://google.com"},
    {"camelValue", "camel"}
  });
  EXPECT_EQ( *out, expected );
}

TEST( EncoderTest, NullVersusOmitted ) {
  const Scripted record{ []( Encoder& encoder ) {
    arbor::KeyedEncodingContainer c = encoder.keyed_container();
    c.encode_nil( "explicit" );
    c.encode( std::optional< int >(), "wrapped" );
    c.encode_if_present( std::optional< int >(), "omitted" );
    c.encode_if_present( std::optional< int >(3), "present" );
  } };

  EXPECT_EQ( ValueEncoder().encode(record), object({
    {"explicit", std::nullopt},
    {"wrapped", std::nullopt},
    {"present", 3}
  }) );
}

TEST( EncoderTest, LastWriteWins ) {
  const Scripted record{ []( Encoder& encoder ) {
    arbor::KeyedEncodingContainer c = encoder.keyed_container();
    c.encode( 1, "a" );
    c.encode( "two", "a" );
  } };
  EXPECT_EQ( ValueEncoder().encode(record), object({ {"a", "two"} }) );
}

TEST( EncoderTest, UnsignedOverflowIsInvalidValue ) {
  const std::map< std::string, std::uint64_t > big{
    { "big", std::numeric_limits< std::uint64_t >::max() } };
  try {
    ValueEncoder().encode( big );
    FAIL() << "expected InvalidValue";
  }
  catch ( const arbor::InvalidValue& err ) {
    EXPECT_EQ( err.path().to_string(), "root.big" );
  }

  const std::uint64_t fits = std::numeric_limits< std::int64_t >::max();
  EXPECT_EQ( ValueEncoder().encode(fits),
    Value(std::numeric_limits< std::int64_t >::max()) );
}

TEST( EncoderTest, Sequences ) {
  ValueEncoder encoder;
  EXPECT_EQ( encoder.encode(arbor_test::Pair{ 1, 2 }), array({ 1, 2 }) );
  EXPECT_EQ( encoder.encode(std::vector< std::optional< int > >{ 1,
    std::nullopt }), array({ 1, std::nullopt }) );
  EXPECT_EQ( encoder.encode(std::vector< arbor_test::Item >{ {1, "a"},
    {2, "b"} }), array({ object({ {"id", 1}, {"name", "a"} }),
    object({ {"id", 2}, {"name", "b"} }) }) );
  EXPECT_EQ( encoder.encode(std::vector< int >()), array({}) );
}

TEST( EncoderTest, StringMaps ) {
  const std::map< std::string, int > m{ {"x", 1}, {"y", 2} };
  EXPECT_EQ( ValueEncoder().encode(m), object({ {"x", 1}, {"y", 2} }) );
}

TEST( EncoderTest, SnakeCaseKeys ) {
  EncoderOptions options;
  options.key_strategy = arbor::KeyEncodingStrategy::convert_to_snake_case();

  const Scripted record{ []( Encoder& encoder ) {
    arbor::KeyedEncodingContainer c = encoder.keyed_container();
    c.encode( 1, "oneTwoThree" );
    c.encode( 2, "myURLProperty" );
    c.encode( 3, "_oneTwoThree_" );
  } };

  EXPECT_EQ( ValueEncoder(options).encode(record), object({
    {"one_two_three", 1},
    {"my_url_property", 2},
    {"_one_two_three_", 3}
  }) );
}

TEST( EncoderTest, CustomKeyStrategySeesFullPath ) {
  std::vector< std::string > seen;
  EncoderOptions options;
  options.key_strategy = arbor::KeyEncodingStrategy::custom(
    [&seen]( const arbor::KeyPath& path ) {
      seen.push_back( path.to_string() );
      return CodingKey( "k_" + path.back().string_value() );
    } );

  const Scripted record{ []( Encoder& encoder ) {
    arbor::KeyedEncodingContainer c = encoder.keyed_container();
    c.encode( arbor_test::Item{ 1, "a" }, "item" );
  } };

  EXPECT_EQ( ValueEncoder(options).encode(record), object({
    {"k_item", object({ {"k_id", 1}, {"k_name", "a"} })}
  }) );
  EXPECT_EQ( seen, (std::vector< std::string >{ "root.item",
    "root.k_item.id", "root.k_item.name" }) );
}

TEST( EncoderTest, TimestampStrategies ) {
  const Timestamp ten = Timestamp::from_seconds_since_1970( 10. );

  EXPECT_EQ( encode_with(ten,
    arbor::TimestampEncodingStrategy::seconds_since_1970()), Value(10.) );
  EXPECT_EQ( encode_with(ten,
    arbor::TimestampEncodingStrategy::milliseconds_since_1970()),
    Value(10000.) );
  EXPECT_EQ( encode_with(ten, arbor::TimestampEncodingStrategy::iso8601()),
    Value("1970-01-01T00:00:10Z") );
  EXPECT_EQ( encode_with(ten, arbor::TimestampEncodingStrategy::deferred()),
    Value(10. - Timestamp::REFERENCE_DATE_OFFSET) );
  EXPECT_EQ( encode_with(ten, arbor::TimestampEncodingStrategy::formatted(
    std::make_shared< arbor::PatternFormatter >("%Y/%m/%d"))),
    Value("1970/01/01") );
}

TEST( EncoderTest, TimestampWithoutCalendarFormIsInvalidValue ) {
  const Timestamp huge = Timestamp::from_seconds_since_1970( 1e300 );
  const Timestamp nan = Timestamp::from_seconds_since_1970(
    std::numeric_limits< double >::quiet_NaN() );

  for ( const Timestamp& t : { huge, nan } ) {
    EXPECT_THROW( encode_with(t, arbor::TimestampEncodingStrategy::iso8601()),
      arbor::InvalidValue );
    EXPECT_THROW( encode_with(t, arbor::TimestampEncodingStrategy::formatted(
      std::make_shared< arbor::PatternFormatter >("%Y"))), arbor::InvalidValue );
  }

  // Numeric strategies still carry the raw value
  EXPECT_EQ( encode_with(huge,
    arbor::TimestampEncodingStrategy::seconds_since_1970()), Value(1e300) );

  EncoderOptions options;
  options.timestamp_strategy = arbor::TimestampEncodingStrategy::iso8601();
  try {
    ValueEncoder( options ).encode( arbor_test::Event{ huge, arbor::Blob() } );
    FAIL() << "expected InvalidValue";
  }
  catch ( const arbor::InvalidValue& err ) {
    EXPECT_EQ( err.path().to_string(), "root.when" );
    EXPECT_EQ( err.detail(), "Timestamp <1e+300> has no calendar"
      " representation." );
  }
}

TEST( EncoderTest, CustomTimestampStrategy ) {
  const Timestamp ten = Timestamp::from_seconds_since_1970( 10. );

  std::string path_seen;
  const auto out = encode_with( ten, arbor::TimestampEncodingStrategy::custom(
    [&path_seen]( const Timestamp& t, Encoder& encoder ) {
      path_seen = encoder.coding_path().to_string();
      encoder.single_value_container().encode( t.seconds_since_1970() * 2 );
    } ) );
  EXPECT_EQ( out, Value(20.) );
  EXPECT_EQ( path_seen, "root" );

  // A callback that writes nothing produces an empty object
  EXPECT_EQ( encode_with(ten, arbor::TimestampEncodingStrategy::custom(
    []( const Timestamp&, Encoder& ) {} )), object({}) );
}

TEST( EncoderTest, CustomTimestampStrategyInsideRecord ) {
  EncoderOptions options;
  options.timestamp_strategy = arbor::TimestampEncodingStrategy::custom(
    []( const Timestamp& t, Encoder& encoder ) {
      arbor::KeyedEncodingContainer c = encoder.keyed_container();
      c.encode( t.seconds_since_1970(), "epoch" );
      c.encode( encoder.coding_path().to_string(), "at" );
    } );

  const arbor_test::Event event{ Timestamp::from_seconds_since_1970(5.),
    arbor::Blob{ 1 } };
  EXPECT_EQ( ValueEncoder(options).encode(event), object({
    {"when", object({ {"epoch", 5.}, {"at", "root.when"} })},
    {"data", "AQ=="}
  }) );
}

TEST( EncoderTest, CustomBlobStrategy ) {
  EncoderOptions options;
  options.blob_strategy = arbor::BlobEncodingStrategy::custom(
    []( const arbor::Blob& blob, Encoder& encoder ) {
      encoder.single_value_container().encode(
        static_cast< std::int64_t >(blob.size()) );
    } );
  EXPECT_EQ( ValueEncoder(options).encode(arbor::Blob{ 1, 2, 3 }), Value(3) );
}

TEST( EncoderTest, StrategyFactoriesRejectEmptyCallables ) {
  EXPECT_THROW( arbor::TimestampEncodingStrategy::custom(nullptr),
    std::invalid_argument );
  EXPECT_THROW( arbor::TimestampEncodingStrategy::formatted(nullptr),
    std::invalid_argument );
  EXPECT_THROW( arbor::BlobEncodingStrategy::custom(nullptr),
    std::invalid_argument );
  EXPECT_THROW( arbor::KeyEncodingStrategy::custom(nullptr),
    std::invalid_argument );
}

TEST( EncoderTest, SuperEncoderDelegation ) {
  const arbor_test::Derived derived{ arbor_test::Base{ "x" }, 1 };
  EXPECT_EQ( ValueEncoder().encode(derived), object({
    {"extra", 1},
    {"super", object({ {"id", "x"} })}
  }) );
}

TEST( EncoderTest, SuperKeyIsNotConverted ) {
  EncoderOptions options;
  options.key_strategy = arbor::KeyEncodingStrategy::custom(
    []( const arbor::KeyPath& path ) {
      return CodingKey( path.back().string_value() + "_" );
    } );

  const Scripted record{ []( Encoder& encoder ) {
    arbor::KeyedEncodingContainer c = encoder.keyed_container();
    Encoder plain = c.super_encoder();
    plain.single_value_container().encode( 1 );
    Encoder named = c.super_encoder( "parent" );
    named.single_value_container().encode( 2 );
  } };

  EXPECT_EQ( ValueEncoder(options).encode(record), object({
    {"super", 1},
    {"parent_", 2}
  }) );
}

TEST( EncoderTest, SuperEncoderThatWritesNothing ) {
  const Scripted record{ []( Encoder& encoder ) {
    arbor::KeyedEncodingContainer c = encoder.keyed_container();
    c.super_encoder();
  } };
  EXPECT_EQ( ValueEncoder().encode(record),
    object({ {"super", object({})} }) );
}

TEST( EncoderTest, UnkeyedSuperEncoder ) {
  const Scripted record{ []( Encoder& encoder ) {
    arbor::UnkeyedEncodingContainer c = encoder.unkeyed_container();
    c.encode( 1 );
    Encoder super = c.super_encoder();
    EXPECT_EQ( super.coding_path().to_string(), "root[1]" );
    super.single_value_container().encode( "s" );
    EXPECT_EQ( c.count(), 2u );
  } };
  EXPECT_EQ( ValueEncoder().encode(record), array({ 1, "s" }) );
}

TEST( EncoderTest, NestedContainersAreIdempotent ) {
  const Scripted record{ []( Encoder& encoder ) {
    arbor::KeyedEncodingContainer c = encoder.keyed_container();
    c.nested_keyed_container( "obj" ).encode( 1, "a" );
    c.nested_keyed_container( "obj" ).encode( 2, "b" );
    c.nested_unkeyed_container( "arr" ).encode( 1 );
    c.nested_unkeyed_container( "arr" ).encode( 2 );

    // Asking the session again returns the same container
    encoder.keyed_container().encode( true, "again" );
  } };

  EXPECT_EQ( ValueEncoder().encode(record), object({
    {"obj", object({ {"a", 1}, {"b", 2} })},
    {"arr", array({ 1, 2 })},
    {"again", true}
  }) );
}

TEST( EncoderTest, NestedContainersInsideUnkeyed ) {
  const Scripted record{ []( Encoder& encoder ) {
    arbor::UnkeyedEncodingContainer c = encoder.unkeyed_container();
    arbor::KeyedEncodingContainer inner = c.nested_keyed_container();
    EXPECT_EQ( inner.coding_path().to_string(), "root[0]" );
    inner.encode( "v", "k" );
    c.nested_unkeyed_container().encode_nil();
    c.encode_nil();
  } };

  EXPECT_EQ( ValueEncoder().encode(record), array({
    object({ {"k", "v"} }),
    array({ std::nullopt }),
    std::nullopt
  }) );
}

TEST( EncoderTest, SwitchingContainerKindIsContractViolation ) {
  const Scripted keyed_then_unkeyed{ []( Encoder& encoder ) {
    encoder.keyed_container();
    encoder.unkeyed_container();
  } };
  EXPECT_THROW( ValueEncoder().encode(keyed_then_unkeyed),
    arbor::ContractViolation );

  const Scripted single_then_keyed{ []( Encoder& encoder ) {
    encoder.single_value_container().encode( 1 );
    encoder.keyed_container();
  } };
  EXPECT_THROW( ValueEncoder().encode(single_then_keyed),
    arbor::ContractViolation );

  const Scripted unkeyed_then_single{ []( Encoder& encoder ) {
    encoder.unkeyed_container();
    encoder.single_value_container().encode( 1 );
  } };
  EXPECT_THROW( ValueEncoder().encode(unkeyed_then_single),
    arbor::ContractViolation );
}

TEST( EncoderTest, SecondSingleValueIsContractViolation ) {
  const Scripted twice{ []( Encoder& encoder ) {
    arbor::SingleValueEncodingContainer c = encoder.single_value_container();
    c.encode( 1 );
    c.encode( 2 );
  } };
  EXPECT_THROW( ValueEncoder().encode(twice), arbor::ContractViolation );

  const Scripted nil_then_value{ []( Encoder& encoder ) {
    encoder.single_value_container().encode_nil();
    encoder.single_value_container().encode( 2 );
  } };
  EXPECT_THROW( ValueEncoder().encode(nil_then_value),
    arbor::ContractViolation );
}

TEST( EncoderTest, ConflictingNestedKindIsContractViolation ) {
  const Scripted record{ []( Encoder& encoder ) {
    arbor::KeyedEncodingContainer c = encoder.keyed_container();
    c.nested_keyed_container( "a" );
    c.nested_unkeyed_container( "a" );
  } };
  try {
    ValueEncoder().encode( record );
    FAIL() << "expected ContractViolation";
  }
  catch ( const arbor::ContractViolation& err ) {
    EXPECT_EQ( std::string(err.what()), "root.a: For key \"a\" a keyed"
      " container has already been created." );
  }

  const Scripted super_twice{ []( Encoder& encoder ) {
    arbor::KeyedEncodingContainer c = encoder.keyed_container();
    c.super_encoder();
    c.super_encoder();
  } };
  EXPECT_THROW( ValueEncoder().encode(super_twice), arbor::ContractViolation );
}

TEST( EncoderTest, UserInfoAndCodingPathReachVisitors ) {
  std::string path_seen;
  EncoderOptions options;
  options.user_info[ "tag" ] = std::string( "hello" );
  options.user_info[ "sink" ] = &path_seen;

  const std::map< std::string, Probe > probes{ {"p", Probe()} };
  EXPECT_EQ( ValueEncoder(options).encode(probes),
    object({ {"p", "hello"} }) );
  EXPECT_EQ( path_seen, "root.p" );
}

TEST( EncoderTest, SingleValueContainerForwardsRecords ) {
  const Scripted wrapper{ []( Encoder& encoder ) {
    encoder.single_value_container().encode( arbor_test::Item{ 7, "w" } );
  } };
  EXPECT_EQ( ValueEncoder().encode(wrapper),
    object({ {"id", 7}, {"name", "w"} }) );
}

TEST( EncoderTest, GenericValuePassesThroughKeyStrategy ) {
  EncoderOptions options;
  options.key_strategy = arbor::KeyEncodingStrategy::convert_to_snake_case();

  const Value doc = object({
    {"topLevel", array({ object({ {"innerKey", 1} }), std::nullopt })},
    {"plain", Value()}
  });
  EXPECT_EQ( ValueEncoder(options).encode(doc), object({
    {"top_level", array({ object({ {"inner_key", 1} }), std::nullopt })},
    {"plain", std::nullopt}
  }) );
}
