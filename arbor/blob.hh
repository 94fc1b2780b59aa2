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
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace arbor {

  // Opaque binary payload. Kept distinct from std::vector< std::uint8_t >
  // so the engine can route it through the blob strategy instead of
  // treating it as a sequence of small integers.
  class Blob {
  public:

    Blob() = default;
    explicit Blob( std::vector< std::uint8_t > bytes )
      : bytes_( std::move(bytes) ) {}
    Blob( std::initializer_list< std::uint8_t > bytes ) : bytes_( bytes ) {}

    inline const std::vector< std::uint8_t >& bytes() const { return bytes_; }
    inline std::size_t size() const { return bytes_.size(); }
    inline bool empty() const { return bytes_.empty(); }

    inline bool operator==( const Blob& other ) const {
      return bytes_ == other.bytes_;
    }
    inline bool operator!=( const Blob& other ) const {
      return !( *this == other );
    }

  private:
    std::vector< std::uint8_t > bytes_;
  };

  // Standard alphabet, padded
  std::string base64_encode( const Blob& blob );

  // Strict decode: length must be a multiple of four, padding only at the
  // end, no characters outside the alphabet. Returns std::nullopt on any
  // violation.
  std::optional< Blob > base64_decode( const std::string& text );

namespace internal {

  inline constexpr char BASE64_ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

  inline constexpr char BASE64_PAD = '=';

  // Value of a base64 digit, or -1
  inline int base64_digit( char c ) {
    if ( c >= 'A' && c <= 'Z' ) return c - 'A';
    if ( c >= 'a' && c <= 'z' ) return c - 'a' + 26;
    if ( c >= '0' && c <= '9' ) return c - '0' + 52;
    if ( c == '+' ) return 62;
    if ( c == '/' ) return 63;
    return -1;
  }

} // namespace arbor::internal

} // namespace arbor

inline std::string arbor::base64_encode( const Blob& blob ) {
  const auto& in = blob.bytes();
  std::string out;
  out.reserve( (in.size() + 2) / 3 * 4 );

  std::size_t i = 0;
  for ( ; i + 3 <= in.size(); i += 3 ) {
    const std::uint32_t n = ( in[i] << 16 ) | ( in[i + 1] << 8 ) | in[i + 2];
    out += internal::BASE64_ALPHABET[ (n >> 18) & 63 ];
    out += internal::BASE64_ALPHABET[ (n >> 12) & 63 ];
    out += internal::BASE64_ALPHABET[ (n >> 6) & 63 ];
    out += internal::BASE64_ALPHABET[ n & 63 ];
  }

  const std::size_t rest = in.size() - i;
  if ( rest == 1 ) {
    const std::uint32_t n = in[i] << 16;
    out += internal::BASE64_ALPHABET[ (n >> 18) & 63 ];
    out += internal::BASE64_ALPHABET[ (n >> 12) & 63 ];
    out += internal::BASE64_PAD;
    out += internal::BASE64_PAD;
  }
  else if ( rest == 2 ) {
    const std::uint32_t n = ( in[i] << 16 ) | ( in[i + 1] << 8 );
    out += internal::BASE64_ALPHABET[ (n >> 18) & 63 ];
    out += internal::BASE64_ALPHABET[ (n >> 12) & 63 ];
    out += internal::BASE64_ALPHABET[ (n >> 6) & 63 ];
    out += internal::BASE64_PAD;
  }
  return out;
}

inline std::optional< arbor::Blob > arbor::base64_decode(
  const std::string& text )
{
  if ( text.size() % 4 != 0 ) return std::nullopt;

  std::vector< std::uint8_t > out;
  out.reserve( text.size() / 4 * 3 );

  for ( std::size_t i = 0; i < text.size(); i += 4 ) {
    const bool last_quad = ( i + 4 == text.size() );
    int pad = 0;
    std::uint32_t n = 0;
    for ( std::size_t j = 0; j < 4; ++j ) {
      const char c = text[ i + j ];
      if ( c == internal::BASE64_PAD ) {
        // Padding may only fill the last one or two slots of the final quad
        if ( !last_quad || j < 2 ) return std::nullopt;
        ++pad;
        n <<= 6;
        continue;
      }
      // No data after padding
      if ( pad > 0 ) return std::nullopt;
      const int d = internal::base64_digit( c );
      if ( d < 0 ) return std::nullopt;
      n = ( n << 6 ) | static_cast< std::uint32_t >( d );
    }

    out.push_back( static_cast< std::uint8_t >((n >> 16) & 0xFF) );
    if ( pad < 2 ) out.push_back( static_cast< std::uint8_t >((n >> 8) & 0xFF) );
    if ( pad < 1 ) out.push_back( static_cast< std::uint8_t >(n & 0xFF) );
  }
  return Blob( std::move(out) );
}
