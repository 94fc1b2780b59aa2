// ┏━┓┏━┓┏┓ ┏━┓┏━┓
// ┣━┫┣┳┛┣┻┓┃ ┃┣┳┛
// ╹ ╹╹┗╸┗━┛┗━┛╹┗╸
//  Typed records <-> generic value trees
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the arbor developers
#pragma once

// Standard library includes
#include <any>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "arbor/blob.hh"
#include "arbor/key_case.hh"
#include "arbor/key_path.hh"
#include "arbor/timestamp.hh"

namespace arbor {

  class Encoder;
  class Decoder;

  // Caller-supplied context handed through, unmodified, to field visitors
  // and custom callbacks
  using UserInfo = std::map< std::string, std::any >;

  // How a Timestamp is written to the value tree
  class TimestampEncodingStrategy {
  public:

    enum class Kind { Deferred, SecondsSince1970, MillisecondsSince1970,
      Iso8601, Formatted, Custom };

    // Writes the timestamp through the given encoder session. Writing
    // nothing produces an empty object.
    using Callback = std::function< void( const Timestamp&, Encoder& ) >;

    // Default: the timestamp's own coding (seconds since 2001-01-01 as a
    // double)
    TimestampEncodingStrategy() = default;

    static inline TimestampEncodingStrategy deferred() { return {}; }
    static inline TimestampEncodingStrategy seconds_since_1970() {
      return TimestampEncodingStrategy( Kind::SecondsSince1970 );
    }
    static inline TimestampEncodingStrategy milliseconds_since_1970() {
      return TimestampEncodingStrategy( Kind::MillisecondsSince1970 );
    }
    static inline TimestampEncodingStrategy iso8601() {
      return TimestampEncodingStrategy( Kind::Iso8601 );
    }
    static TimestampEncodingStrategy formatted(
      std::shared_ptr< const TimestampFormatter > formatter );
    static TimestampEncodingStrategy custom( Callback callback );

    inline Kind kind() const { return kind_; }
    inline const TimestampFormatter& formatter() const { return *formatter_; }
    inline const Callback& callback() const { return callback_; }

  private:
    explicit TimestampEncodingStrategy( Kind kind ) : kind_( kind ) {}

    Kind kind_ = Kind::Deferred;
    std::shared_ptr< const TimestampFormatter > formatter_;
    Callback callback_;
  };

  // How a Timestamp is read back from the value tree
  class TimestampDecodingStrategy {
  public:

    enum class Kind { Deferred, SecondsSince1970, MillisecondsSince1970,
      Iso8601, Formatted, Custom };

    using Callback = std::function< Timestamp( const Decoder& ) >;

    TimestampDecodingStrategy() = default;

    static inline TimestampDecodingStrategy deferred() { return {}; }
    static inline TimestampDecodingStrategy seconds_since_1970() {
      return TimestampDecodingStrategy( Kind::SecondsSince1970 );
    }
    static inline TimestampDecodingStrategy milliseconds_since_1970() {
      return TimestampDecodingStrategy( Kind::MillisecondsSince1970 );
    }
    static inline TimestampDecodingStrategy iso8601() {
      return TimestampDecodingStrategy( Kind::Iso8601 );
    }
    static TimestampDecodingStrategy formatted(
      std::shared_ptr< const TimestampFormatter > formatter );
    static TimestampDecodingStrategy custom( Callback callback );

    inline Kind kind() const { return kind_; }
    inline const TimestampFormatter& formatter() const { return *formatter_; }
    inline const Callback& callback() const { return callback_; }

  private:
    explicit TimestampDecodingStrategy( Kind kind ) : kind_( kind ) {}

    Kind kind_ = Kind::Deferred;
    std::shared_ptr< const TimestampFormatter > formatter_;
    Callback callback_;
  };

  // How a Blob is written to the value tree
  class BlobEncodingStrategy {
  public:

    enum class Kind { Deferred, Base64, Custom };

    using Callback = std::function< void( const Blob&, Encoder& ) >;

    // Default: base64 string
    BlobEncodingStrategy() = default;

    static inline BlobEncodingStrategy deferred() {
      return BlobEncodingStrategy( Kind::Deferred );
    }
    static inline BlobEncodingStrategy base64() { return {}; }
    static BlobEncodingStrategy custom( Callback callback );

    inline Kind kind() const { return kind_; }
    inline const Callback& callback() const { return callback_; }

  private:
    explicit BlobEncodingStrategy( Kind kind ) : kind_( kind ) {}

    Kind kind_ = Kind::Base64;
    Callback callback_;
  };

  // How a Blob is read back from the value tree
  class BlobDecodingStrategy {
  public:

    enum class Kind { Deferred, Base64, Custom };

    using Callback = std::function< Blob( const Decoder& ) >;

    BlobDecodingStrategy() = default;

    static inline BlobDecodingStrategy deferred() {
      return BlobDecodingStrategy( Kind::Deferred );
    }
    static inline BlobDecodingStrategy base64() { return {}; }
    static BlobDecodingStrategy custom( Callback callback );

    inline Kind kind() const { return kind_; }
    inline const Callback& callback() const { return callback_; }

  private:
    explicit BlobDecodingStrategy( Kind kind ) : kind_( kind ) {}

    Kind kind_ = Kind::Base64;
    Callback callback_;
  };

  // Rewrites the keys a type asks for before they are stored
  class KeyEncodingStrategy {
  public:

    enum class Kind { UseDefaultKeys, ConvertToSnakeCase, Custom };

    // Receives the full path, ending with the key being written, and
    // returns the key to store instead
    using Callback = std::function< CodingKey( const KeyPath& ) >;

    KeyEncodingStrategy() = default;

    static inline KeyEncodingStrategy use_default_keys() { return {}; }
    static inline KeyEncodingStrategy convert_to_snake_case() {
      return KeyEncodingStrategy( Kind::ConvertToSnakeCase );
    }
    static KeyEncodingStrategy custom( Callback callback );

    inline Kind kind() const { return kind_; }

    // Key to store for `key` written by a container at `path`
    CodingKey convert( const KeyPath& path, const CodingKey& key ) const;

  private:
    explicit KeyEncodingStrategy( Kind kind ) : kind_( kind ) {}

    Kind kind_ = Kind::UseDefaultKeys;
    Callback callback_;
  };

  // Rewrites stored keys before a type looks them up
  class KeyDecodingStrategy {
  public:

    enum class Kind { UseDefaultKeys, ConvertFromSnakeCase, Custom };

    // Receives the full path, ending with the stored key, and returns the
    // key the type will look up
    using Callback = std::function< CodingKey( const KeyPath& ) >;

    KeyDecodingStrategy() = default;

    static inline KeyDecodingStrategy use_default_keys() { return {}; }
    static inline KeyDecodingStrategy convert_from_snake_case() {
      return KeyDecodingStrategy( Kind::ConvertFromSnakeCase );
    }
    static KeyDecodingStrategy custom( Callback callback );

    inline Kind kind() const { return kind_; }

    // Lookup key for the stored key `stored` of an object at `path`
    std::string convert( const KeyPath& path, const std::string& stored ) const;

  private:
    explicit KeyDecodingStrategy( Kind kind ) : kind_( kind ) {}

    Kind kind_ = Kind::UseDefaultKeys;
    Callback callback_;
  };

  // Snapshot of everything an encode call consults. Treated as immutable
  // for the duration of the call.
  struct EncoderOptions {
    TimestampEncodingStrategy timestamp_strategy;
    BlobEncodingStrategy blob_strategy;
    KeyEncodingStrategy key_strategy;
    UserInfo user_info;
  };

  // Snapshot of everything a decode call consults
  struct DecoderOptions {
    TimestampDecodingStrategy timestamp_strategy;
    BlobDecodingStrategy blob_strategy;
    KeyDecodingStrategy key_strategy;
    UserInfo user_info;
  };

namespace internal {

  template < typename F >
  inline F require_callable( F f, const char* what ) {
    if ( !f ) {
      throw std::invalid_argument( std::string(what)
        + " requires a callable" );
    }
    return f;
  }

} // namespace arbor::internal

} // namespace arbor

inline arbor::TimestampEncodingStrategy
  arbor::TimestampEncodingStrategy::formatted(
  std::shared_ptr< const TimestampFormatter > formatter )
{
  if ( !formatter ) {
    throw std::invalid_argument( "formatted timestamp strategy requires a"
      " formatter" );
  }
  TimestampEncodingStrategy s( Kind::Formatted );
  s.formatter_ = std::move( formatter );
  return s;
}

inline arbor::TimestampEncodingStrategy
  arbor::TimestampEncodingStrategy::custom( Callback callback )
{
  TimestampEncodingStrategy s( Kind::Custom );
  s.callback_ = internal::require_callable( std::move(callback),
    "custom timestamp strategy" );
  return s;
}

inline arbor::TimestampDecodingStrategy
  arbor::TimestampDecodingStrategy::formatted(
  std::shared_ptr< const TimestampFormatter > formatter )
{
  if ( !formatter ) {
    throw std::invalid_argument( "formatted timestamp strategy requires a"
      " formatter" );
  }
  TimestampDecodingStrategy s( Kind::Formatted );
  s.formatter_ = std::move( formatter );
  return s;
}

inline arbor::TimestampDecodingStrategy
  arbor::TimestampDecodingStrategy::custom( Callback callback )
{
  TimestampDecodingStrategy s( Kind::Custom );
  s.callback_ = internal::require_callable( std::move(callback),
    "custom timestamp strategy" );
  return s;
}

inline arbor::BlobEncodingStrategy arbor::BlobEncodingStrategy::custom(
  Callback callback )
{
  BlobEncodingStrategy s( Kind::Custom );
  s.callback_ = internal::require_callable( std::move(callback),
    "custom blob strategy" );
  return s;
}

inline arbor::BlobDecodingStrategy arbor::BlobDecodingStrategy::custom(
  Callback callback )
{
  BlobDecodingStrategy s( Kind::Custom );
  s.callback_ = internal::require_callable( std::move(callback),
    "custom blob strategy" );
  return s;
}

inline arbor::KeyEncodingStrategy arbor::KeyEncodingStrategy::custom(
  Callback callback )
{
  KeyEncodingStrategy s( Kind::Custom );
  s.callback_ = internal::require_callable( std::move(callback),
    "custom key strategy" );
  return s;
}

inline arbor::KeyDecodingStrategy arbor::KeyDecodingStrategy::custom(
  Callback callback )
{
  KeyDecodingStrategy s( Kind::Custom );
  s.callback_ = internal::require_callable( std::move(callback),
    "custom key strategy" );
  return s;
}

inline arbor::CodingKey arbor::KeyEncodingStrategy::convert(
  const KeyPath& path, const CodingKey& key ) const
{
  switch ( kind_ ) {
    case Kind::UseDefaultKeys:
      return key;
    case Kind::ConvertToSnakeCase:
      return CodingKey( to_snake_case(key.string_value()), key.int_value() );
    case Kind::Custom:
      return callback_( path.appending(key) );
  }
  return key;
}

inline std::string arbor::KeyDecodingStrategy::convert( const KeyPath& path,
  const std::string& stored ) const
{
  switch ( kind_ ) {
    case Kind::UseDefaultKeys:
      return stored;
    case Kind::ConvertFromSnakeCase:
      return from_snake_case( stored );
    case Kind::Custom:
      return callback_( path.appending(CodingKey(stored)) ).string_value();
  }
  return stored;
}
