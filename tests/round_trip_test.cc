#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "arbor/arbor.hh"
#include "test_types.hh"

using arbor::DecoderOptions;
using arbor::EncoderOptions;
using arbor::Value;
using arbor::ValueDecoder;
using arbor::ValueEncoder;
using arbor_test::make_sample;
using arbor_test::Sample;

namespace {

  template < typename T >
  T round_trip( const T& value, EncoderOptions enc = EncoderOptions(),
    DecoderOptions dec = DecoderOptions() )
  {
    const std::optional< Value > stored = ValueEncoder( std::move(enc) )
      .encode( value );
    return ValueDecoder( std::move(dec) ).decode< T >( stored );
  }

  Sample round_trip_sample( arbor::TimestampEncodingStrategy ts_enc,
    arbor::TimestampDecodingStrategy ts_dec,
    arbor::BlobEncodingStrategy blob_enc = arbor::BlobEncodingStrategy(),
    arbor::BlobDecodingStrategy blob_dec = arbor::BlobDecodingStrategy() )
  {
    EncoderOptions enc;
    enc.timestamp_strategy = std::move( ts_enc );
    enc.blob_strategy = std::move( blob_enc );
    DecoderOptions dec;
    dec.timestamp_strategy = std::move( ts_dec );
    dec.blob_strategy = std::move( blob_dec );
    return round_trip( make_sample(), std::move(enc), std::move(dec) );
  }

}

TEST( RoundTripTest, SampleWithDefaults ) {
  EXPECT_EQ( round_trip(make_sample()), make_sample() );
}

TEST( RoundTripTest, SampleWithOptionalMember ) {
  Sample sample = make_sample();
  sample.note = "remember";
  EXPECT_EQ( round_trip(sample), sample );
}

TEST( RoundTripTest, SampleUnderTimestampStrategies ) {
  EXPECT_EQ( round_trip_sample(
    arbor::TimestampEncodingStrategy::seconds_since_1970(),
    arbor::TimestampDecodingStrategy::seconds_since_1970()), make_sample() );
  EXPECT_EQ( round_trip_sample(
    arbor::TimestampEncodingStrategy::milliseconds_since_1970(),
    arbor::TimestampDecodingStrategy::milliseconds_since_1970()),
    make_sample() );
  EXPECT_EQ( round_trip_sample(
    arbor::TimestampEncodingStrategy::iso8601(),
    arbor::TimestampDecodingStrategy::iso8601()), make_sample() );

  auto formatter = std::make_shared< arbor::PatternFormatter >(
    "%Y-%m-%d %H:%M:%S" );
  EXPECT_EQ( round_trip_sample(
    arbor::TimestampEncodingStrategy::formatted(formatter),
    arbor::TimestampDecodingStrategy::formatted(formatter)), make_sample() );
}

TEST( RoundTripTest, SampleWithDeferredBlob ) {
  EXPECT_EQ( round_trip_sample(
    arbor::TimestampEncodingStrategy::deferred(),
    arbor::TimestampDecodingStrategy::deferred(),
    arbor::BlobEncodingStrategy::deferred(),
    arbor::BlobDecodingStrategy::deferred()), make_sample() );
}

TEST( RoundTripTest, SampleWithSnakeCaseKeys ) {
  EncoderOptions enc;
  enc.key_strategy = arbor::KeyEncodingStrategy::convert_to_snake_case();
  DecoderOptions dec;
  dec.key_strategy = arbor::KeyDecodingStrategy::convert_from_snake_case();

  const std::optional< Value > stored = ValueEncoder( enc ).encode(
    make_sample() );
  ASSERT_TRUE( stored );
  ASSERT_NE( stored->as_object(), nullptr );
  EXPECT_EQ( stored->as_object()->count("camel_value"), 1u );
  EXPECT_EQ( stored->as_object()->count("camelValue"), 0u );

  EXPECT_EQ( ValueDecoder(dec).decode< Sample >(stored), make_sample() );
}

TEST( RoundTripTest, MismatchedTimestampStrategiesFail ) {
  EncoderOptions enc;
  enc.timestamp_strategy = arbor::TimestampEncodingStrategy::iso8601();
  const std::optional< Value > stored = ValueEncoder( enc ).encode(
    make_sample() );

  try {
    ValueDecoder().decode< Sample >( stored );
    FAIL() << "expected TypeMismatch";
  }
  catch ( const arbor::TypeMismatch& err ) {
    EXPECT_EQ( err.path().to_string(), "root.when" );
    EXPECT_EQ( err.found(), "string" );
  }
}

TEST( RoundTripTest, SuperclassDelegation ) {
  const arbor_test::Derived derived{ arbor_test::Base{ "b" }, 7 };
  const arbor_test::Derived out = round_trip( derived );
  EXPECT_EQ( out.base.id, "b" );
  EXPECT_EQ( out.extra, 7 );
}

TEST( RoundTripTest, UnkeyedRecords ) {
  const std::vector< arbor_test::Pair > pairs{ {1, 2}, {3, 4} };
  const auto out = round_trip( pairs );
  ASSERT_EQ( out.size(), 2u );
  EXPECT_EQ( out[1].first, 3 );
  EXPECT_EQ( out[1].second, 4 );
}

TEST( RoundTripTest, Collections ) {
  const std::vector< std::vector< int > > nested{ {}, {1}, {2, 3} };
  EXPECT_EQ( round_trip(nested), nested );

  const std::map< std::string, arbor_test::Item > items{
    {"one", {1, "a"}}, {"two", {2, "b"}} };
  EXPECT_EQ( round_trip(items), items );

  const std::vector< std::optional< int > > holes{ 1, std::nullopt, 3 };
  EXPECT_EQ( round_trip(holes), holes );
}

TEST( RoundTripTest, Optionals ) {
  const std::optional< std::string > none;
  EXPECT_EQ( round_trip(none), none );

  const std::optional< std::vector< int > > some = std::vector< int >{ 4 };
  EXPECT_EQ( round_trip(some), some );
}

TEST( RoundTripTest, Events ) {
  EncoderOptions enc;
  enc.timestamp_strategy = arbor::TimestampEncodingStrategy::
    milliseconds_since_1970();
  enc.blob_strategy = arbor::BlobEncodingStrategy::deferred();
  DecoderOptions dec;
  dec.timestamp_strategy = arbor::TimestampDecodingStrategy::
    milliseconds_since_1970();
  dec.blob_strategy = arbor::BlobDecodingStrategy::deferred();

  const std::vector< arbor_test::Event > events{
    { arbor::Timestamp::from_seconds_since_1970(0.), arbor::Blob() },
    { arbor::Timestamp::from_seconds_since_1970(1.5), arbor::Blob{ 0, 255 } }
  };
  EXPECT_EQ( round_trip(events, enc, dec), events );
}

TEST( RoundTripTest, GenericValueTree ) {
  const Value tree = arbor_test::object({
    {"list", arbor_test::array({ 1, 2.5, "three", true, std::nullopt })},
    {"nested", arbor_test::object({ {"deep", arbor_test::object({}) } })},
    {"decimal", Value(*arbor::Decimal::parse("12.50"))}
  });
  EXPECT_EQ( round_trip(tree), tree );
}
