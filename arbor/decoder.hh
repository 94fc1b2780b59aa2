// ┏━┓┏━┓┏┓ ┏━┓┏━┓
// ┣━┫┣┳┛┣┻┓┃ ┃┣┳┛
// ╹ ╹╹┗╸┗━┛┗━┛╹┗╸
//  Typed records <-> generic value trees
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the arbor developers
#pragma once

// Standard library includes
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "arbor/coding.hh"
#include "arbor/errors.hh"
#include "arbor/key_path.hh"
#include "arbor/strategy.hh"
#include "arbor/value.hh"

namespace arbor {

  class KeyedDecodingContainer;
  class UnkeyedDecodingContainer;
  class SingleValueDecodingContainer;
  class ValueDecoder;

namespace internal {

  // The node stored at a position, or nullptr when the position is absent
  // or holds a null. Both count as "nil" while decoding.
  inline const Value* present( const std::optional< Value >* slot ) {
    if ( !slot || !*slot || (*slot)->is_null() ) return nullptr;
    return &**slot;
  }

  // Checked conversion of a stored node to a primitive C++ type. Integers
  // only come from the Int kind and floating point only from the Double
  // kind; narrowing that would lose the value is DataCorrupted.
  template < typename T >
  T unwrap_scalar( const Value* value, const KeyPath& path );

} // namespace arbor::internal

  // A decoder session: one position in the input tree, handed to
  // coding< T >::decode(). The tree must outlive every session made from it.
  class Decoder {
  public:

    Decoder( const std::optional< Value >* value, KeyPath path,
      const DecoderOptions& options ) : value_( value ),
      path_( std::move(path) ), options_( &options ) {}

    KeyedDecodingContainer keyed_container() const;
    UnkeyedDecodingContainer unkeyed_container() const;
    SingleValueDecodingContainer single_value_container() const;

    inline const KeyPath& coding_path() const { return path_; }
    inline const UserInfo& user_info() const { return options_->user_info; }

    // Node at this position, or nullptr if it is missing or null
    inline const Value* value() const { return internal::present( value_ ); }

  private:
    friend class KeyedDecodingContainer;
    friend class UnkeyedDecodingContainer;
    friend class SingleValueDecodingContainer;
    friend class ValueDecoder;

    // Decodes the value at this position as T. Special types go through
    // the strategy layer, records through coding< T >.
    template < typename T >
    T unwrap() const;

    Timestamp unwrap_timestamp() const;
    Blob unwrap_blob() const;
    Uri unwrap_uri() const;
    Decimal unwrap_decimal() const;

    const std::optional< Value >* value_;
    KeyPath path_;
    const DecoderOptions* options_;
  };

  // Reads named fields of a stored mapping. Stored keys are rewritten by
  // the key decoding strategy once, when the container is made; lookups
  // use the rewritten keys.
  class KeyedDecodingContainer {
  public:

    KeyedDecodingContainer( const Value::object_type& object, KeyPath path,
      const DecoderOptions& options );

    inline const KeyPath& coding_path() const { return path_; }

    // Every key present after conversion
    std::vector< CodingKey > all_keys() const;

    // True when key is present, even if its value is null
    inline bool contains( const CodingKey& key ) const {
      return this->lookup( key ) != nullptr;
    }

    // True when the value under key is null. KeyNotFound when key is
    // missing.
    bool decode_nil( const CodingKey& key ) const;

    template < typename T >
    T decode( const CodingKey& key ) const;

    // std::nullopt when key is missing or its value is null
    template < typename T >
    std::optional< T > decode_if_present( const CodingKey& key ) const;

    KeyedDecodingContainer nested_keyed_container( const CodingKey& key ) const;
    UnkeyedDecodingContainer nested_unkeyed_container(
      const CodingKey& key ) const;

    // Sessions for a supertype stored under "super" (or under key). These
    // never fail: a missing key yields a session over nothing.
    Decoder super_decoder() const;
    Decoder super_decoder( const CodingKey& key ) const;

  private:
    const std::optional< Value >* lookup( const CodingKey& key ) const;
    const std::optional< Value >* require( const CodingKey& key ) const;

    std::map< std::string, const std::optional< Value >* > entries_;
    KeyPath path_;
    const DecoderOptions* options_;
  };

  // Reads the elements of a stored sequence front to back. The cursor
  // only moves past an element once it has been decoded successfully.
  class UnkeyedDecodingContainer {
  public:

    UnkeyedDecodingContainer( const Value::array_type& array, KeyPath path,
      const DecoderOptions& options ) : array_( &array ),
      path_( std::move(path) ), options_( &options ) {}

    inline const KeyPath& coding_path() const { return path_; }
    inline std::size_t count() const { return array_->size(); }
    inline bool is_at_end() const { return index_ >= array_->size(); }
    inline std::size_t current_index() const { return index_; }

    // Consumes the current element only if it is null
    bool decode_nil();

    template < typename T >
    T decode();

    // std::nullopt at the end or for a null element (which is consumed)
    template < typename T >
    std::optional< T > decode_if_present();

    KeyedDecodingContainer nested_keyed_container();
    UnkeyedDecodingContainer nested_unkeyed_container();
    Decoder super_decoder();

  private:
    CodingKey current_key() const;
    Decoder current_decoder( const std::string& expected ) const;

    const Value::array_type* array_;
    KeyPath path_;
    const DecoderOptions* options_;
    std::size_t index_ = 0;
  };

  // Reads the single value of a session
  class SingleValueDecodingContainer {
  public:

    explicit SingleValueDecodingContainer( Decoder decoder )
      : decoder_( std::move(decoder) ) {}

    inline const KeyPath& coding_path() const { return decoder_.coding_path(); }
    inline bool decode_nil() const { return decoder_.value() == nullptr; }

    template < typename T >
    inline T decode() const { return decoder_.unwrap< T >(); }

  private:
    Decoder decoder_;
  };

  // Top-level entry point: generic value tree -> typed value
  class ValueDecoder {
  public:

    ValueDecoder() = default;
    explicit ValueDecoder( DecoderOptions options )
      : options_( std::move(options) ) {}

    inline DecoderOptions& options() { return options_; }
    inline const DecoderOptions& options() const { return options_; }

    template < typename T >
    T decode( const std::optional< Value >& value ) const;

  private:
    DecoderOptions options_;
  };

} // namespace arbor

template < typename T >
inline T arbor::internal::unwrap_scalar( const Value* value,
  const KeyPath& path )
{
  if constexpr ( std::is_same_v< T, bool > ) {
    if ( value ) {
      if ( auto b = value->as_bool() ) return *b;
    }
  }
  else if constexpr ( std::is_same_v< T, std::string >
    || std::is_same_v< T, std::string_view > )
  {
    if ( value ) {
      if ( const std::string* s = value->as_string() ) return T( *s );
    }
  }
  else if constexpr ( is_integer_v< T > ) {
    if ( value ) {
      if ( auto i = value->as_int() ) {
        bool fits = false;
        if constexpr ( std::is_signed_v< T > ) {
          fits = *i >= std::numeric_limits< T >::min()
            && *i <= std::numeric_limits< T >::max();
        }
        else {
          fits = *i >= 0 && static_cast< std::uint64_t >( *i )
            <= std::numeric_limits< T >::max();
        }
        if ( !fits ) {
          throw DataCorrupted( path, "Stored number <" + std::to_string(*i)
            + "> does not fit in " + type_name< T >() + "." );
        }
        return static_cast< T >( *i );
      }
    }
  }
  else {
    static_assert( std::is_floating_point_v< T >, "unhandled primitive" );
    if ( value ) {
      if ( auto d = value->as_double() ) {
        if constexpr ( sizeof(T) < sizeof(double) ) {
          // The narrowed value must convert back to the stored one. Infinity
          // survives that; NaN never compares equal and is rejected.
          const bool fits = std::isinf( *d ) || ( !std::isnan(*d)
            && std::fabs(*d) <= std::numeric_limits< T >::max()
            && static_cast< double >(static_cast< T >(*d)) == *d );
          if ( !fits ) {
            std::ostringstream oss;
            oss << "Stored number <" << *d << "> does not fit in "
              << type_name< T >() << '.';
            throw DataCorrupted( path, oss.str() );
          }
        }
        return static_cast< T >( *d );
      }
    }
  }
  internal::throw_unwrap_error( type_name< T >(), path, value );
}

// Decoder member function definitions
inline arbor::KeyedDecodingContainer arbor::Decoder::keyed_container() const
{
  const Value* v = this->value();
  const Value::object_type* object = v ? v->as_object() : nullptr;
  if ( !object ) internal::throw_unwrap_error( "object", path_, v );
  return KeyedDecodingContainer( *object, path_, *options_ );
}

inline arbor::UnkeyedDecodingContainer arbor::Decoder::unkeyed_container()
  const
{
  const Value* v = this->value();
  const Value::array_type* array = v ? v->as_array() : nullptr;
  if ( !array ) internal::throw_unwrap_error( "array", path_, v );
  return UnkeyedDecodingContainer( *array, path_, *options_ );
}

inline arbor::SingleValueDecodingContainer
  arbor::Decoder::single_value_container() const
{
  return SingleValueDecodingContainer( *this );
}

template < typename T >
inline T arbor::Decoder::unwrap() const {
  if constexpr ( internal::is_primitive_v< T > ) {
    return internal::unwrap_scalar< T >( this->value(), path_ );
  }
  else if constexpr ( std::is_same_v< T, Timestamp > ) {
    return this->unwrap_timestamp();
  }
  else if constexpr ( std::is_same_v< T, Blob > ) {
    return this->unwrap_blob();
  }
  else if constexpr ( std::is_same_v< T, Uri > ) {
    return this->unwrap_uri();
  }
  else if constexpr ( std::is_same_v< T, Decimal > ) {
    return this->unwrap_decimal();
  }
  else {
    return coding< T >::decode( *this );
  }
}

inline arbor::Timestamp arbor::Decoder::unwrap_timestamp() const {
  const TimestampDecodingStrategy& strategy = options_->timestamp_strategy;
  switch ( strategy.kind() ) {
    case TimestampDecodingStrategy::Kind::Deferred:
      return coding< Timestamp >::decode( *this );

    case TimestampDecodingStrategy::Kind::SecondsSince1970:
      return Timestamp::from_seconds_since_1970(
        internal::unwrap_scalar< double >(this->value(), path_) );

    case TimestampDecodingStrategy::Kind::MillisecondsSince1970:
      return Timestamp::from_seconds_since_1970(
        internal::unwrap_scalar< double >(this->value(), path_) / 1000. );

    case TimestampDecodingStrategy::Kind::Iso8601: {
      const std::string text = internal::unwrap_scalar< std::string >(
        this->value(), path_ );
      auto t = parse_iso8601( text );
      if ( !t ) {
        throw DataCorrupted( path_, "Expected date string to be"
          " ISO8601-formatted." );
      }
      return *t;
    }

    case TimestampDecodingStrategy::Kind::Formatted: {
      const std::string text = internal::unwrap_scalar< std::string >(
        this->value(), path_ );
      auto t = strategy.formatter().parse( text );
      if ( !t ) {
        throw DataCorrupted( path_, "Date string does not match format"
          " expected by formatter." );
      }
      return *t;
    }

    case TimestampDecodingStrategy::Kind::Custom:
      return strategy.callback()( *this );
  }
  return coding< Timestamp >::decode( *this );
}

inline arbor::Blob arbor::Decoder::unwrap_blob() const {
  const BlobDecodingStrategy& strategy = options_->blob_strategy;
  switch ( strategy.kind() ) {
    case BlobDecodingStrategy::Kind::Deferred:
      return coding< Blob >::decode( *this );

    case BlobDecodingStrategy::Kind::Base64: {
      const std::string text = internal::unwrap_scalar< std::string >(
        this->value(), path_ );
      auto blob = base64_decode( text );
      if ( !blob ) {
        throw DataCorrupted( path_, "Encountered Data is not valid Base64." );
      }
      return std::move( *blob );
    }

    case BlobDecodingStrategy::Kind::Custom:
      return strategy.callback()( *this );
  }
  return coding< Blob >::decode( *this );
}

inline arbor::Uri arbor::Decoder::unwrap_uri() const {
  const std::string text = internal::unwrap_scalar< std::string >(
    this->value(), path_ );
  auto uri = Uri::parse( text );
  if ( !uri ) throw DataCorrupted( path_, "Invalid URL string." );
  return *uri;
}

inline arbor::Decimal arbor::Decoder::unwrap_decimal() const {
  const Value* v = this->value();
  if ( v ) {
    if ( const Decimal* d = v->as_decimal() ) return *d;
  }
  internal::throw_unwrap_error( "Decimal", path_, v );
}

// KeyedDecodingContainer member function definitions
inline arbor::KeyedDecodingContainer::KeyedDecodingContainer(
  const Value::object_type& object, KeyPath path,
  const DecoderOptions& options ) : path_( std::move(path) ),
  options_( &options )
{
  // When two stored keys convert to the same key, the first one (in stored
  // key order) wins
  for ( const auto& [stored, slot] : object ) {
    entries_.emplace( options_->key_strategy.convert(path_, stored), &slot );
  }
}

inline std::vector< arbor::CodingKey >
  arbor::KeyedDecodingContainer::all_keys() const
{
  std::vector< CodingKey > keys;
  keys.reserve( entries_.size() );
  for ( const auto& entry : entries_ ) keys.emplace_back( entry.first );
  return keys;
}

inline const std::optional< arbor::Value >*
  arbor::KeyedDecodingContainer::lookup( const CodingKey& key ) const
{
  auto it = entries_.find( key.string_value() );
  if ( it == entries_.end() ) return nullptr;
  return it->second;
}

inline const std::optional< arbor::Value >*
  arbor::KeyedDecodingContainer::require( const CodingKey& key ) const
{
  const std::optional< Value >* slot = this->lookup( key );
  if ( !slot ) throw KeyNotFound( path_, key );
  return slot;
}

inline bool arbor::KeyedDecodingContainer::decode_nil( const CodingKey& key )
  const
{
  return internal::present( this->require(key) ) == nullptr;
}

template < typename T >
inline T arbor::KeyedDecodingContainer::decode( const CodingKey& key ) const
{
  const std::optional< Value >* slot = this->require( key );
  return Decoder( slot, path_.appending(key), *options_ ).unwrap< T >();
}

template < typename T >
inline std::optional< T > arbor::KeyedDecodingContainer::decode_if_present(
  const CodingKey& key ) const
{
  const std::optional< Value >* slot = this->lookup( key );
  if ( !internal::present(slot) ) return std::nullopt;
  return Decoder( slot, path_.appending(key), *options_ ).unwrap< T >();
}

inline arbor::KeyedDecodingContainer
  arbor::KeyedDecodingContainer::nested_keyed_container(
  const CodingKey& key ) const
{
  const std::optional< Value >* slot = this->require( key );
  return Decoder( slot, path_.appending(key), *options_ ).keyed_container();
}

inline arbor::UnkeyedDecodingContainer
  arbor::KeyedDecodingContainer::nested_unkeyed_container(
  const CodingKey& key ) const
{
  const std::optional< Value >* slot = this->require( key );
  return Decoder( slot, path_.appending(key), *options_ ).unkeyed_container();
}

inline arbor::Decoder arbor::KeyedDecodingContainer::super_decoder() const {
  const CodingKey key = CodingKey::super_key();
  return Decoder( this->lookup(key), path_.appending(key), *options_ );
}

inline arbor::Decoder arbor::KeyedDecodingContainer::super_decoder(
  const CodingKey& key ) const
{
  return Decoder( this->lookup(key), path_.appending(key), *options_ );
}

// UnkeyedDecodingContainer member function definitions
inline arbor::CodingKey arbor::UnkeyedDecodingContainer::current_key() const
{
  return CodingKey::index( static_cast< int >(index_) );
}

inline arbor::Decoder arbor::UnkeyedDecodingContainer::current_decoder(
  const std::string& expected ) const
{
  if ( this->is_at_end() ) {
    throw ValueNotFound( path_.appending(this->current_key()), expected,
      "Unkeyed container is at end." );
  }
  return Decoder( &(*array_)[ index_ ], path_.appending(this->current_key()),
    *options_ );
}

inline bool arbor::UnkeyedDecodingContainer::decode_nil() {
  const Decoder decoder = this->current_decoder( "nil" );
  if ( decoder.value() ) return false;
  ++index_;
  return true;
}

template < typename T >
inline T arbor::UnkeyedDecodingContainer::decode() {
  T out = this->current_decoder( type_name< T >() ).template unwrap< T >();
  ++index_;
  return out;
}

template < typename T >
inline std::optional< T > arbor::UnkeyedDecodingContainer::decode_if_present()
{
  if ( this->is_at_end() || this->decode_nil() ) return std::nullopt;
  return this->decode< T >();
}

inline arbor::KeyedDecodingContainer
  arbor::UnkeyedDecodingContainer::nested_keyed_container()
{
  KeyedDecodingContainer out = this->current_decoder( "object" )
    .keyed_container();
  ++index_;
  return out;
}

inline arbor::UnkeyedDecodingContainer
  arbor::UnkeyedDecodingContainer::nested_unkeyed_container()
{
  UnkeyedDecodingContainer out = this->current_decoder( "array" )
    .unkeyed_container();
  ++index_;
  return out;
}

inline arbor::Decoder arbor::UnkeyedDecodingContainer::super_decoder() {
  Decoder out = this->current_decoder( "super" );
  ++index_;
  return out;
}

// ValueDecoder member function definitions
template < typename T >
inline T arbor::ValueDecoder::decode( const std::optional< Value >& value )
  const
{
  return Decoder( &value, KeyPath(), options_ ).unwrap< T >();
}
