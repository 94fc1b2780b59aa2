// ┏━┓┏━┓┏┓ ┏━┓┏━┓
// ┣━┫┣┳┛┣┻┓┃ ┃┣┳┛
// ╹ ╹╹┗╸┗━┛┗━┛╹┗╸
//  Typed records <-> generic value trees
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the arbor developers
#pragma once

// Standard library includes
#include <cstddef>
#include <cstdint>
#include <deque>
#include <limits>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "arbor/coding.hh"
#include "arbor/errors.hh"
#include "arbor/key_path.hh"
#include "arbor/strategy.hh"
#include "arbor/value.hh"

namespace arbor {

  class Encoder;
  class KeyedEncodingContainer;
  class UnkeyedEncodingContainer;
  class SingleValueEncodingContainer;

namespace internal {

  // Stable indices into an EncodingArena
  using NodeHandle = std::size_t;
  using SessionHandle = std::size_t;

  struct ArrayRef { NodeHandle node; };
  struct ObjectRef { NodeHandle node; };
  struct SessionRef { SessionHandle session; };

  // A slot of a deferred container. It either holds a finished value (an
  // absent one is a null) or refers to something that will produce the
  // value at resolution time.
  using Slot = std::variant< std::optional< Value >, ArrayRef, ObjectRef,
    SessionRef >;

  struct DeferredArray {
    std::vector< Slot > slots;
  };

  struct DeferredObject {
    std::map< std::string, Slot > slots;
  };

  using DeferredNode = std::variant< DeferredArray, DeferredObject >;

  // Outcome of encoding one position. The outer optional is empty when
  // nothing was written at all; the inner one is empty for an explicit null.
  using WrittenValue = std::optional< std::optional< Value > >;

  inline WrittenValue written( std::optional< Value > v ) {
    return WrittenValue( std::in_place, std::move(v) );
  }

  // A position that wrote nothing is stored as an empty object
  inline std::optional< Value > or_empty_object( const WrittenValue& w ) {
    if ( !w ) return Value( Value::object_type() );
    return *w;
  }

  // State of one encoder session (one position in the output tree). At
  // most one of single/object/array is ever established.
  struct SessionState {
    KeyPath path;
    WrittenValue single;
    std::optional< NodeHandle > object;
    std::optional< NodeHandle > array;
  };

  // Owns every session and deferred container created during one top-level
  // encode call. Elements live in deques so references handed out stay
  // valid while the arena grows.
  class EncodingArena {
  public:

    explicit EncodingArena( const EncoderOptions& options )
      : options_( options ) {}

    EncodingArena( const EncodingArena& ) = delete;
    EncodingArena& operator=( const EncodingArena& ) = delete;

    inline const EncoderOptions& options() const { return options_; }

    SessionHandle open_session( KeyPath path );
    inline SessionState& session( SessionHandle h ) { return sessions_[ h ]; }
    inline const SessionState& session( SessionHandle h ) const {
      return sessions_[ h ];
    }

    NodeHandle make_array();
    NodeHandle make_object();

    inline DeferredArray& array( NodeHandle h ) {
      return std::get< DeferredArray >( nodes_[h] );
    }
    inline const DeferredArray& array( NodeHandle h ) const {
      return std::get< DeferredArray >( nodes_[h] );
    }
    inline DeferredObject& object( NodeHandle h ) {
      return std::get< DeferredObject >( nodes_[h] );
    }
    inline const DeferredObject& object( NodeHandle h ) const {
      return std::get< DeferredObject >( nodes_[h] );
    }

    // Slot management on deferred mappings. Asking for a nested container
    // returns the existing one for the key when it has the same kind; any
    // conflicting kind is a ContractViolation reported at `path`.
    NodeHandle array_for_key( NodeHandle object, const std::string& key,
      const KeyPath& path );
    NodeHandle object_for_key( NodeHandle object, const std::string& key,
      const KeyPath& path );
    void session_for_key( NodeHandle object, const std::string& key,
      SessionHandle s, const KeyPath& path );

    // Resolution: a pure fold over the current slot state
    WrittenValue session_value( SessionHandle h ) const;
    std::optional< Value > resolve( const Slot& slot ) const;
    Value resolve_array( NodeHandle h ) const;
    Value resolve_object( NodeHandle h ) const;

  private:
    const EncoderOptions& options_;
    std::deque< DeferredNode > nodes_;
    std::deque< SessionState > sessions_;
  };

  // Session that a nested value is written into: a fresh one one key below
  // `path`, or the current session when there is no additional key
  SessionHandle encoder_for( EncodingArena& arena, SessionHandle current,
    const KeyPath& path, const std::optional< CodingKey >& additional_key );

  template < typename T >
  Value encode_primitive( const T& value, const KeyPath& path );

  // InvalidValue unless t can be written as a calendar date
  void require_calendar_form( const Timestamp& t, const KeyPath& path,
    const std::optional< CodingKey >& additional_key );

  WrittenValue wrap_timestamp( EncodingArena& arena, SessionHandle current,
    const KeyPath& path, const std::optional< CodingKey >& additional_key,
    const Timestamp& t );

  WrittenValue wrap_blob( EncodingArena& arena, SessionHandle current,
    const KeyPath& path, const std::optional< CodingKey >& additional_key,
    const Blob& blob );

  // Encodes any value. Primitives and special scalars are converted
  // directly; everything else is visited through coding< T >.
  template < typename T >
  WrittenValue wrap_encodable( EncodingArena& arena, SessionHandle current,
    const KeyPath& path, const std::optional< CodingKey >& additional_key,
    const T& value );

} // namespace arbor::internal

  // An encoder session, handed to coding< T >::encode(). A session stands
  // for exactly one position in the output tree and may be committed to a
  // keyed container, an unkeyed container or a single value, but only one
  // of them. Sessions are only valid during the encode call that made them.
  class Encoder {
  public:

    Encoder( internal::EncodingArena& arena, internal::SessionHandle session )
      : arena_( &arena ), session_( session ) {}

    KeyedEncodingContainer keyed_container();
    UnkeyedEncodingContainer unkeyed_container();
    SingleValueEncodingContainer single_value_container();

    inline const KeyPath& coding_path() const {
      return arena_->session( session_ ).path;
    }
    inline const UserInfo& user_info() const {
      return arena_->options().user_info;
    }

  private:
    internal::EncodingArena* arena_;
    internal::SessionHandle session_;
  };

  // Writes named fields into a deferred mapping. Keys pass through the key
  // encoding strategy before they are stored.
  class KeyedEncodingContainer {
  public:

    KeyedEncodingContainer( internal::EncodingArena& arena,
      internal::SessionHandle session, internal::NodeHandle object,
      KeyPath path ) : arena_( &arena ), session_( session ),
      object_( object ), path_( std::move(path) ) {}

    inline const KeyPath& coding_path() const { return path_; }

    // Stores an explicit null under key
    void encode_nil( const CodingKey& key );

    // Writing the same key twice keeps the last value
    template < typename T >
    void encode( const T& value, const CodingKey& key );
    void encode( const char* value, const CodingKey& key );

    // Omits the key entirely when value is empty
    template < typename T >
    void encode_if_present( const std::optional< T >& value,
      const CodingKey& key );

    KeyedEncodingContainer nested_keyed_container( const CodingKey& key );
    UnkeyedEncodingContainer nested_unkeyed_container( const CodingKey& key );

    // Session for a supertype, stored under "super" (or under key)
    Encoder super_encoder();
    Encoder super_encoder( const CodingKey& key );

  private:
    CodingKey converted( const CodingKey& key ) const;
    void set( const std::string& key, std::optional< Value > value );

    internal::EncodingArena* arena_;
    internal::SessionHandle session_;
    internal::NodeHandle object_;
    KeyPath path_;
  };

  // Appends elements to a deferred sequence
  class UnkeyedEncodingContainer {
  public:

    UnkeyedEncodingContainer( internal::EncodingArena& arena,
      internal::SessionHandle session, internal::NodeHandle array,
      KeyPath path ) : arena_( &arena ), session_( session ), array_( array ),
      path_( std::move(path) ) {}

    inline const KeyPath& coding_path() const { return path_; }

    // Number of elements appended so far
    inline std::size_t count() const {
      return arena_->array( array_ ).slots.size();
    }

    void encode_nil();
    template < typename T >
    void encode( const T& value );
    void encode( const char* value );

    KeyedEncodingContainer nested_keyed_container();
    UnkeyedEncodingContainer nested_unkeyed_container();
    Encoder super_encoder();

  private:
    CodingKey next_key() const;
    void append( internal::Slot slot );

    internal::EncodingArena* arena_;
    internal::SessionHandle session_;
    internal::NodeHandle array_;
    KeyPath path_;
  };

  // Writes the one value of a session
  class SingleValueEncodingContainer {
  public:

    SingleValueEncodingContainer( internal::EncodingArena& arena,
      internal::SessionHandle session ) : arena_( &arena ),
      session_( session ) {}

    inline const KeyPath& coding_path() const {
      return arena_->session( session_ ).path;
    }

    void encode_nil();
    template < typename T >
    void encode( const T& value );
    void encode( const char* value );

  private:
    void require_unwritten() const;

    internal::EncodingArena* arena_;
    internal::SessionHandle session_;
  };

  // Top-level entry point: typed value -> generic value tree
  class ValueEncoder {
  public:

    ValueEncoder() = default;
    explicit ValueEncoder( EncoderOptions options )
      : options_( std::move(options) ) {}

    inline EncoderOptions& options() { return options_; }
    inline const EncoderOptions& options() const { return options_; }

    // Returns std::nullopt when value encodes as an explicit null. Throws
    // EmptyTopLevel when nothing at all was written, and the other Error
    // kinds as they arise.
    template < typename T >
    std::optional< Value > encode( const T& value ) const;

  private:
    EncoderOptions options_;
  };

} // namespace arbor

// EncodingArena member function definitions
inline arbor::internal::SessionHandle
  arbor::internal::EncodingArena::open_session( KeyPath path )
{
  SessionState state;
  state.path = std::move( path );
  sessions_.push_back( std::move(state) );
  return sessions_.size() - 1;
}

inline arbor::internal::NodeHandle
  arbor::internal::EncodingArena::make_array()
{
  nodes_.emplace_back( DeferredArray() );
  return nodes_.size() - 1;
}

inline arbor::internal::NodeHandle
  arbor::internal::EncodingArena::make_object()
{
  nodes_.emplace_back( DeferredObject() );
  return nodes_.size() - 1;
}

inline arbor::internal::NodeHandle
  arbor::internal::EncodingArena::array_for_key( NodeHandle object,
  const std::string& key, const KeyPath& path )
{
  auto& slots = this->object( object ).slots;
  auto it = slots.find( key );
  if ( it != slots.end() ) {
    if ( std::holds_alternative< SessionRef >(it->second) ) {
      throw ContractViolation( path, "For key \"" + key
        + "\" an encoder has already been created." );
    }
    if ( std::holds_alternative< ObjectRef >(it->second) ) {
      throw ContractViolation( path, "For key \"" + key
        + "\" a keyed container has already been created." );
    }
    if ( const ArrayRef* a = std::get_if< ArrayRef >(&it->second) ) {
      return a->node;
    }
  }
  const NodeHandle h = this->make_array();
  slots[ key ] = ArrayRef{ h };
  return h;
}

inline arbor::internal::NodeHandle
  arbor::internal::EncodingArena::object_for_key( NodeHandle object,
  const std::string& key, const KeyPath& path )
{
  auto& slots = this->object( object ).slots;
  auto it = slots.find( key );
  if ( it != slots.end() ) {
    if ( std::holds_alternative< SessionRef >(it->second) ) {
      throw ContractViolation( path, "For key \"" + key
        + "\" an encoder has already been created." );
    }
    if ( std::holds_alternative< ArrayRef >(it->second) ) {
      throw ContractViolation( path, "For key \"" + key
        + "\" an unkeyed container has already been created." );
    }
    if ( const ObjectRef* o = std::get_if< ObjectRef >(&it->second) ) {
      return o->node;
    }
  }
  const NodeHandle h = this->make_object();
  slots[ key ] = ObjectRef{ h };
  return h;
}

inline void arbor::internal::EncodingArena::session_for_key(
  NodeHandle object, const std::string& key, SessionHandle s,
  const KeyPath& path )
{
  auto& slots = this->object( object ).slots;
  auto it = slots.find( key );
  if ( it != slots.end() ) {
    if ( std::holds_alternative< SessionRef >(it->second) ) {
      throw ContractViolation( path, "For key \"" + key
        + "\" an encoder has already been created." );
    }
    if ( std::holds_alternative< ObjectRef >(it->second) ) {
      throw ContractViolation( path, "For key \"" + key
        + "\" a keyed container has already been created." );
    }
    if ( std::holds_alternative< ArrayRef >(it->second) ) {
      throw ContractViolation( path, "For key \"" + key
        + "\" an unkeyed container has already been created." );
    }
  }
  slots[ key ] = SessionRef{ s };
}

inline arbor::internal::WrittenValue
  arbor::internal::EncodingArena::session_value( SessionHandle h ) const
{
  const SessionState& state = this->session( h );
  if ( state.object ) return written( this->resolve_object(*state.object) );
  if ( state.array ) return written( this->resolve_array(*state.array) );
  return state.single;
}

inline std::optional< arbor::Value > arbor::internal::EncodingArena::resolve(
  const Slot& slot ) const
{
  if ( const auto* v = std::get_if< std::optional< Value > >(&slot) ) {
    return *v;
  }
  if ( const auto* a = std::get_if< ArrayRef >(&slot) ) {
    return this->resolve_array( a->node );
  }
  if ( const auto* o = std::get_if< ObjectRef >(&slot) ) {
    return this->resolve_object( o->node );
  }
  // A delegated session that never wrote anything becomes an empty object
  return or_empty_object( this->session_value(std::get< SessionRef >(slot)
    .session) );
}

inline arbor::Value arbor::internal::EncodingArena::resolve_array(
  NodeHandle h ) const
{
  const DeferredArray& deferred = this->array( h );
  Value::array_type out;
  out.reserve( deferred.slots.size() );
  for ( const auto& slot : deferred.slots ) {
    out.push_back( this->resolve(slot) );
  }
  return Value( std::move(out) );
}

inline arbor::Value arbor::internal::EncodingArena::resolve_object(
  NodeHandle h ) const
{
  const DeferredObject& deferred = this->object( h );
  Value::object_type out;
  for ( const auto& [key, slot] : deferred.slots ) {
    out.emplace( key, this->resolve(slot) );
  }
  return Value( std::move(out) );
}

// Special treatment helpers
inline arbor::internal::SessionHandle arbor::internal::encoder_for(
  EncodingArena& arena, SessionHandle current, const KeyPath& path,
  const std::optional< CodingKey >& additional_key )
{
  if ( additional_key ) {
    return arena.open_session( path.appending(*additional_key) );
  }
  return current;
}

template < typename T >
inline arbor::Value arbor::internal::encode_primitive( const T& value,
  const KeyPath& path )
{
  if constexpr ( std::is_same_v< T, bool > ) {
    return Value( value );
  }
  else if constexpr ( std::is_same_v< T, std::string > ) {
    return Value( value );
  }
  else if constexpr ( std::is_same_v< T, std::string_view > ) {
    return Value( std::string(value) );
  }
  else if constexpr ( is_integer_v< T > ) {
    if constexpr ( std::is_unsigned_v< T > && sizeof(T) >= sizeof(std::int64_t) )
    {
      if ( value > static_cast< T >(std::numeric_limits< std::int64_t >::max()) )
      {
        throw InvalidValue( path, "Unsigned number <" + std::to_string(value)
          + "> does not fit in int." );
      }
    }
    return Value( static_cast< std::int64_t >(value) );
  }
  else {
    static_assert( std::is_floating_point_v< T >, "unhandled primitive" );
    return Value( static_cast< double >(value) );
  }
}

inline void arbor::internal::require_calendar_form( const Timestamp& t,
  const KeyPath& path, const std::optional< CodingKey >& additional_key )
{
  if ( is_civil_representable(t) ) return;
  std::ostringstream oss;
  oss << "Timestamp <" << t.seconds_since_1970()
    << "> has no calendar representation.";
  throw InvalidValue( additional_key ? path.appending(*additional_key) : path,
    oss.str() );
}

inline arbor::internal::WrittenValue arbor::internal::wrap_timestamp(
  EncodingArena& arena, SessionHandle current, const KeyPath& path,
  const std::optional< CodingKey >& additional_key, const Timestamp& t )
{
  const TimestampEncodingStrategy& strategy
    = arena.options().timestamp_strategy;

  switch ( strategy.kind() ) {
    case TimestampEncodingStrategy::Kind::Deferred: {
      const SessionHandle s = encoder_for( arena, current, path,
        additional_key );
      Encoder encoder( arena, s );
      coding< Timestamp >::encode( t, encoder );
      // Nothing written counts as null here
      const WrittenValue w = arena.session_value( s );
      return written( w ? *w : std::optional< Value >() );
    }
    case TimestampEncodingStrategy::Kind::SecondsSince1970:
      return written( Value(t.seconds_since_1970()) );
    case TimestampEncodingStrategy::Kind::MillisecondsSince1970:
      return written( Value(t.seconds_since_1970() * 1000.) );
    case TimestampEncodingStrategy::Kind::Iso8601:
      internal::require_calendar_form( t, path, additional_key );
      return written( Value(format_iso8601(t)) );
    case TimestampEncodingStrategy::Kind::Formatted:
      internal::require_calendar_form( t, path, additional_key );
      return written( Value(strategy.formatter().format(t)) );
    case TimestampEncodingStrategy::Kind::Custom: {
      const SessionHandle s = encoder_for( arena, current, path,
        additional_key );
      Encoder encoder( arena, s );
      strategy.callback()( t, encoder );
      return written( or_empty_object(arena.session_value(s)) );
    }
  }
  return WrittenValue();
}

inline arbor::internal::WrittenValue arbor::internal::wrap_blob(
  EncodingArena& arena, SessionHandle current, const KeyPath& path,
  const std::optional< CodingKey >& additional_key, const Blob& blob )
{
  const BlobEncodingStrategy& strategy = arena.options().blob_strategy;

  switch ( strategy.kind() ) {
    case BlobEncodingStrategy::Kind::Deferred: {
      const SessionHandle s = encoder_for( arena, current, path,
        additional_key );
      Encoder encoder( arena, s );
      coding< Blob >::encode( blob, encoder );
      const WrittenValue w = arena.session_value( s );
      return written( w ? *w : std::optional< Value >() );
    }
    case BlobEncodingStrategy::Kind::Base64:
      return written( Value(base64_encode(blob)) );
    case BlobEncodingStrategy::Kind::Custom: {
      const SessionHandle s = encoder_for( arena, current, path,
        additional_key );
      Encoder encoder( arena, s );
      strategy.callback()( blob, encoder );
      return written( or_empty_object(arena.session_value(s)) );
    }
  }
  return WrittenValue();
}

template < typename T >
inline arbor::internal::WrittenValue arbor::internal::wrap_encodable(
  EncodingArena& arena, SessionHandle current, const KeyPath& path,
  const std::optional< CodingKey >& additional_key, const T& value )
{
  if constexpr ( is_primitive_v< T > ) {
    return written( encode_primitive(value,
      additional_key ? path.appending(*additional_key) : path) );
  }
  else if constexpr ( std::is_same_v< T, Timestamp > ) {
    return wrap_timestamp( arena, current, path, additional_key, value );
  }
  else if constexpr ( std::is_same_v< T, Blob > ) {
    return wrap_blob( arena, current, path, additional_key, value );
  }
  else if constexpr ( std::is_same_v< T, Uri > ) {
    return written( Value(value.absolute_string()) );
  }
  else if constexpr ( std::is_same_v< T, Decimal > ) {
    return written( Value(value) );
  }
  else {
    const SessionHandle s = encoder_for( arena, current, path,
      additional_key );
    Encoder encoder( arena, s );
    coding< T >::encode( value, encoder );
    return arena.session_value( s );
  }
}

// Encoder member function definitions
inline arbor::KeyedEncodingContainer arbor::Encoder::keyed_container() {
  internal::SessionState& state = arena_->session( session_ );
  if ( !state.object ) {
    if ( state.single || state.array ) {
      throw ContractViolation( state.path, "Cannot create a keyed container:"
        " this position is already committed to another kind of value." );
    }
    state.object = arena_->make_object();
  }
  return KeyedEncodingContainer( *arena_, session_, *state.object,
    state.path );
}

inline arbor::UnkeyedEncodingContainer arbor::Encoder::unkeyed_container() {
  internal::SessionState& state = arena_->session( session_ );
  if ( !state.array ) {
    if ( state.single || state.object ) {
      throw ContractViolation( state.path, "Cannot create an unkeyed"
        " container: this position is already committed to another kind of"
        " value." );
    }
    state.array = arena_->make_array();
  }
  return UnkeyedEncodingContainer( *arena_, session_, *state.array,
    state.path );
}

inline arbor::SingleValueEncodingContainer
  arbor::Encoder::single_value_container()
{
  return SingleValueEncodingContainer( *arena_, session_ );
}

// KeyedEncodingContainer member function definitions
inline arbor::CodingKey arbor::KeyedEncodingContainer::converted(
  const CodingKey& key ) const
{
  return arena_->options().key_strategy.convert( path_, key );
}

inline void arbor::KeyedEncodingContainer::set( const std::string& key,
  std::optional< Value > value )
{
  arena_->object( object_ ).slots[ key ] = internal::Slot(
    std::in_place_type< std::optional< Value > >, std::move(value) );
}

inline void arbor::KeyedEncodingContainer::encode_nil( const CodingKey& key )
{
  this->set( this->converted(key).string_value(), std::nullopt );
}

template < typename T >
inline void arbor::KeyedEncodingContainer::encode( const T& value,
  const CodingKey& key )
{
  const CodingKey k = this->converted( key );
  const internal::WrittenValue encoded = internal::wrap_encodable( *arena_,
    session_, path_, k, value );
  this->set( k.string_value(), internal::or_empty_object(encoded) );
}

inline void arbor::KeyedEncodingContainer::encode( const char* value,
  const CodingKey& key )
{
  this->encode( std::string(value), key );
}

template < typename T >
inline void arbor::KeyedEncodingContainer::encode_if_present(
  const std::optional< T >& value, const CodingKey& key )
{
  if ( value ) this->encode( *value, key );
}

inline arbor::KeyedEncodingContainer
  arbor::KeyedEncodingContainer::nested_keyed_container( const CodingKey& key )
{
  const CodingKey k = this->converted( key );
  KeyPath path = path_.appending( k );
  const internal::NodeHandle h = arena_->object_for_key( object_,
    k.string_value(), path );
  return KeyedEncodingContainer( *arena_, session_, h, std::move(path) );
}

inline arbor::UnkeyedEncodingContainer
  arbor::KeyedEncodingContainer::nested_unkeyed_container(
  const CodingKey& key )
{
  const CodingKey k = this->converted( key );
  KeyPath path = path_.appending( k );
  const internal::NodeHandle h = arena_->array_for_key( object_,
    k.string_value(), path );
  return UnkeyedEncodingContainer( *arena_, session_, h, std::move(path) );
}

inline arbor::Encoder arbor::KeyedEncodingContainer::super_encoder() {
  // The reserved key is not subject to the key strategy
  const CodingKey k = CodingKey::super_key();
  arena_->session_for_key( object_, k.string_value(),
    arena_->open_session(path_.appending(k)), path_.appending(k) );
  const auto& slot = arena_->object( object_ ).slots.at( k.string_value() );
  return Encoder( *arena_, std::get< internal::SessionRef >(slot).session );
}

inline arbor::Encoder arbor::KeyedEncodingContainer::super_encoder(
  const CodingKey& key )
{
  const CodingKey k = this->converted( key );
  arena_->session_for_key( object_, k.string_value(),
    arena_->open_session(path_.appending(k)), path_.appending(k) );
  const auto& slot = arena_->object( object_ ).slots.at( k.string_value() );
  return Encoder( *arena_, std::get< internal::SessionRef >(slot).session );
}

// UnkeyedEncodingContainer member function definitions
inline arbor::CodingKey arbor::UnkeyedEncodingContainer::next_key() const {
  return CodingKey::index( static_cast< int >(this->count()) );
}

inline void arbor::UnkeyedEncodingContainer::append( internal::Slot slot ) {
  arena_->array( array_ ).slots.push_back( std::move(slot) );
}

inline void arbor::UnkeyedEncodingContainer::encode_nil() {
  this->append( internal::Slot(std::in_place_type< std::optional< Value > >,
    std::nullopt) );
}

template < typename T >
inline void arbor::UnkeyedEncodingContainer::encode( const T& value ) {
  const internal::WrittenValue encoded = internal::wrap_encodable( *arena_,
    session_, path_, this->next_key(), value );
  this->append( internal::Slot(std::in_place_type< std::optional< Value > >,
    internal::or_empty_object(encoded)) );
}

inline void arbor::UnkeyedEncodingContainer::encode( const char* value ) {
  this->encode( std::string(value) );
}

inline arbor::KeyedEncodingContainer
  arbor::UnkeyedEncodingContainer::nested_keyed_container()
{
  KeyPath path = path_.appending( this->next_key() );
  const internal::NodeHandle h = arena_->make_object();
  this->append( internal::ObjectRef{ h } );
  return KeyedEncodingContainer( *arena_, session_, h, std::move(path) );
}

inline arbor::UnkeyedEncodingContainer
  arbor::UnkeyedEncodingContainer::nested_unkeyed_container()
{
  KeyPath path = path_.appending( this->next_key() );
  const internal::NodeHandle h = arena_->make_array();
  this->append( internal::ArrayRef{ h } );
  return UnkeyedEncodingContainer( *arena_, session_, h, std::move(path) );
}

inline arbor::Encoder arbor::UnkeyedEncodingContainer::super_encoder() {
  const internal::SessionHandle s = internal::encoder_for( *arena_, session_,
    path_, this->next_key() );
  this->append( internal::SessionRef{ s } );
  return Encoder( *arena_, s );
}

// SingleValueEncodingContainer member function definitions
inline void arbor::SingleValueEncodingContainer::require_unwritten() const {
  const internal::SessionState& state = arena_->session( session_ );
  if ( state.single ) {
    throw ContractViolation( state.path, "Attempt to encode value through"
      " single value container when previously value already encoded." );
  }
  if ( state.object || state.array ) {
    throw ContractViolation( state.path, "Cannot encode a single value: this"
      " position is already committed to a container." );
  }
}

inline void arbor::SingleValueEncodingContainer::encode_nil() {
  this->require_unwritten();
  arena_->session( session_ ).single = internal::written( std::nullopt );
}

template < typename T >
inline void arbor::SingleValueEncodingContainer::encode( const T& value ) {
  this->require_unwritten();
  const KeyPath path = this->coding_path();
  internal::WrittenValue w = internal::wrap_encodable( *arena_, session_,
    path, std::nullopt, value );

  // A record written through this container commits the session to its own
  // container; that container is then the session's value
  internal::SessionState& state = arena_->session( session_ );
  if ( !state.object && !state.array ) state.single = std::move( w );
}

inline void arbor::SingleValueEncodingContainer::encode( const char* value ) {
  this->encode( std::string(value) );
}

// ValueEncoder member function definitions
template < typename T >
inline std::optional< arbor::Value > arbor::ValueEncoder::encode(
  const T& value ) const
{
  internal::EncodingArena arena( options_ );
  const internal::SessionHandle root = arena.open_session( KeyPath() );
  internal::WrittenValue top = internal::wrap_encodable( arena, root,
    KeyPath(), std::nullopt, value );
  if ( !top ) throw EmptyTopLevel( type_name< T >() );
  return std::move( *top );
}
