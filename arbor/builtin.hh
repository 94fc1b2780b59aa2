// ┏━┓┏━┓┏┓ ┏━┓┏━┓
// ┣━┫┣┳┛┣┻┓┃ ┃┣┳┛
// ╹ ╹╹┗╸┗━┛┗━┛╹┗╸
//  Typed records <-> generic value trees
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the arbor developers
#pragma once

// Standard library includes
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "arbor/coding.hh"
#include "arbor/decoder.hh"
#include "arbor/encoder.hh"

namespace arbor {

  // Optional values are written as a null when empty
  template < typename T >
  struct coding< std::optional< T > > {

    static void encode( const std::optional< T >& value, Encoder& encoder ) {
      SingleValueEncodingContainer c = encoder.single_value_container();
      if ( value ) c.encode( *value );
      else c.encode_nil();
    }

    static std::optional< T > decode( const Decoder& decoder ) {
      SingleValueDecodingContainer c = decoder.single_value_container();
      if ( c.decode_nil() ) return std::nullopt;
      return c.decode< T >();
    }
  };

  template < typename T >
  struct coding< std::vector< T > > {

    static void encode( const std::vector< T >& value, Encoder& encoder ) {
      UnkeyedEncodingContainer c = encoder.unkeyed_container();
      for ( const auto& element : value ) c.encode( element );
    }

    static std::vector< T > decode( const Decoder& decoder ) {
      UnkeyedDecodingContainer c = decoder.unkeyed_container();
      std::vector< T > out;
      out.reserve( c.count() );
      while ( !c.is_at_end() ) out.push_back( c.decode< T >() );
      return out;
    }
  };

  // String-keyed maps are objects. Their keys go through the key strategy
  // like any other field name.
  template < typename T >
  struct coding< std::map< std::string, T > > {

    static void encode( const std::map< std::string, T >& value,
      Encoder& encoder )
    {
      KeyedEncodingContainer c = encoder.keyed_container();
      for ( const auto& [key, element] : value ) {
        c.encode( element, CodingKey(key) );
      }
    }

    static std::map< std::string, T > decode( const Decoder& decoder ) {
      KeyedDecodingContainer c = decoder.keyed_container();
      std::map< std::string, T > out;
      for ( const auto& key : c.all_keys() ) {
        out.emplace( key.string_value(), c.decode< T >(key) );
      }
      return out;
    }
  };

} // namespace arbor

// A timestamp on its own is seconds since 2001-01-01T00:00:00Z
inline void arbor::coding< arbor::Timestamp >::encode( const Timestamp& t,
  Encoder& encoder )
{
  encoder.single_value_container().encode( t.seconds_since_reference() );
}

inline arbor::Timestamp arbor::coding< arbor::Timestamp >::decode(
  const Decoder& decoder )
{
  return Timestamp::from_seconds_since_reference(
    decoder.single_value_container().decode< double >() );
}

// A blob on its own is a sequence of byte values
inline void arbor::coding< arbor::Blob >::encode( const Blob& blob,
  Encoder& encoder )
{
  UnkeyedEncodingContainer c = encoder.unkeyed_container();
  for ( std::uint8_t byte : blob.bytes() ) c.encode( byte );
}

inline arbor::Blob arbor::coding< arbor::Blob >::decode(
  const Decoder& decoder )
{
  UnkeyedDecodingContainer c = decoder.unkeyed_container();
  std::vector< std::uint8_t > bytes;
  bytes.reserve( c.count() );
  while ( !c.is_at_end() ) bytes.push_back( c.decode< std::uint8_t >() );
  return Blob( std::move(bytes) );
}

// A generic value is copied through the containers, so its object keys are
// subject to the key strategy
inline void arbor::coding< arbor::Value >::encode( const Value& value,
  Encoder& encoder )
{
  switch ( value.kind() ) {
    case ValueKind::Null:
      encoder.single_value_container().encode_nil();
      return;
    case ValueKind::Bool:
      encoder.single_value_container().encode( *value.as_bool() );
      return;
    case ValueKind::Int:
      encoder.single_value_container().encode( *value.as_int() );
      return;
    case ValueKind::Double:
      encoder.single_value_container().encode( *value.as_double() );
      return;
    case ValueKind::Decimal:
      encoder.single_value_container().encode( *value.as_decimal() );
      return;
    case ValueKind::String:
      encoder.single_value_container().encode( *value.as_string() );
      return;
    case ValueKind::Array: {
      UnkeyedEncodingContainer c = encoder.unkeyed_container();
      for ( const auto& element : *value.as_array() ) {
        if ( element && !element->is_null() ) c.encode( *element );
        else c.encode_nil();
      }
      return;
    }
    case ValueKind::Object: {
      KeyedEncodingContainer c = encoder.keyed_container();
      for ( const auto& [key, element] : *value.as_object() ) {
        if ( element && !element->is_null() ) c.encode( *element, key );
        else c.encode_nil( key );
      }
      return;
    }
  }
}

inline arbor::Value arbor::coding< arbor::Value >::decode(
  const Decoder& decoder )
{
  const Value* v = decoder.value();
  if ( !v ) internal::throw_unwrap_error( "Value", decoder.coding_path(), v );

  if ( v->as_object() ) {
    KeyedDecodingContainer c = decoder.keyed_container();
    Value::object_type out;
    for ( const auto& key : c.all_keys() ) {
      if ( c.decode_nil(key) ) out.emplace( key.string_value(), std::nullopt );
      else out.emplace( key.string_value(), c.decode< Value >(key) );
    }
    return Value( std::move(out) );
  }

  if ( v->as_array() ) {
    UnkeyedDecodingContainer c = decoder.unkeyed_container();
    Value::array_type out;
    out.reserve( c.count() );
    while ( !c.is_at_end() ) {
      if ( c.decode_nil() ) out.emplace_back( std::nullopt );
      else out.emplace_back( c.decode< Value >() );
    }
    return Value( std::move(out) );
  }

  return *v;
}
