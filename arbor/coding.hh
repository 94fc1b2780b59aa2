// ┏━┓┏━┓┏┓ ┏━┓┏━┓
// ┣━┫┣┳┛┣┻┓┃ ┃┣┳┛
// ╹ ╹╹┗╸┗━┛┗━┛╹┗╸
//  Typed records <-> generic value trees
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the arbor developers
#pragma once

// Standard library includes
#include <climits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "arbor/blob.hh"
#include "arbor/decimal.hh"
#include "arbor/timestamp.hh"
#include "arbor/uri.hh"
#include "arbor/value.hh"

namespace arbor {

  class Encoder;
  class Decoder;

  // Field-visitor contract. A type takes part in encoding and decoding
  // either by providing the members
  //
  //   void encode( arbor::Encoder& encoder ) const;
  //   static T decode( const arbor::Decoder& decoder );
  //
  // or by specializing coding< T > with the same two static functions:
  //
  //   template <> struct arbor::coding< Point > {
  //     static void encode( const Point& p, arbor::Encoder& encoder );
  //     static Point decode( const arbor::Decoder& decoder );
  //   };
  template < typename T, typename = void >
  struct coding {
    static void encode( const T& value, Encoder& encoder ) {
      value.encode( encoder );
    }
    static T decode( const Decoder& decoder ) {
      return T::decode( decoder );
    }
  };

  // Own coding of the library types. The engine falls back to these under
  // the deferred strategies; definitions are in arbor/builtin.hh.
  template <>
  struct coding< Timestamp > {
    static void encode( const Timestamp& t, Encoder& encoder );
    static Timestamp decode( const Decoder& decoder );
  };

  template <>
  struct coding< Blob > {
    static void encode( const Blob& blob, Encoder& encoder );
    static Blob decode( const Decoder& decoder );
  };

  template <>
  struct coding< Value > {
    static void encode( const Value& value, Encoder& encoder );
    static Value decode( const Decoder& decoder );
  };

  // Records may name themselves for diagnostics with
  //   static constexpr const char* type_name = "Point";
  template < typename T, typename = void >
  struct record_name {
    static std::string get() { return "record"; }
  };

  template < typename T >
  struct record_name< T, std::void_t< decltype(T::type_name) > > {
    static std::string get() { return std::string( T::type_name ); }
  };

namespace internal {

  template < typename T > struct is_optional : std::false_type {};
  template < typename T >
  struct is_optional< std::optional< T > > : std::true_type {};

  template < typename T > struct is_vector : std::false_type {};
  template < typename T, typename A >
  struct is_vector< std::vector< T, A > > : std::true_type {};

  template < typename T > struct is_string_map : std::false_type {};
  template < typename T, typename C, typename A >
  struct is_string_map< std::map< std::string, T, C, A > >
    : std::true_type {};

  // Integer types other than bool; all of them collapse to the Int kind
  template < typename T >
  inline constexpr bool is_integer_v = std::is_integral_v< T >
    && !std::is_same_v< T, bool >;

  // Types written directly as a single node, without a sub-encoder
  template < typename T >
  inline constexpr bool is_primitive_v = std::is_arithmetic_v< T >
    || std::is_same_v< T, std::string > || std::is_same_v< T, std::string_view >;

  // Types that bypass their own coding and go through the strategy layer
  // (or straight to a dedicated kind)
  template < typename T >
  inline constexpr bool is_special_v = std::is_same_v< T, Timestamp >
    || std::is_same_v< T, Blob > || std::is_same_v< T, Uri >
    || std::is_same_v< T, Decimal >;

} // namespace arbor::internal

  // Readable type label for diagnostics ("int8", "optional<string>", ...)
  template < typename T >
  std::string type_name() {
    if constexpr ( std::is_same_v< T, bool > ) return "bool";
    else if constexpr ( std::is_same_v< T, std::string >
      || std::is_same_v< T, std::string_view > ) return "string";
    else if constexpr ( internal::is_integer_v< T > ) {
      return std::string( std::is_signed_v< T > ? "int" : "uint" )
        + std::to_string( sizeof(T) * CHAR_BIT );
    }
    else if constexpr ( std::is_same_v< T, float > ) return "float";
    else if constexpr ( std::is_same_v< T, double > ) return "double";
    else if constexpr ( std::is_same_v< T, long double > ) return "long double";
    else if constexpr ( std::is_same_v< T, Timestamp > ) return "Timestamp";
    else if constexpr ( std::is_same_v< T, Blob > ) return "Blob";
    else if constexpr ( std::is_same_v< T, Uri > ) return "Uri";
    else if constexpr ( std::is_same_v< T, Decimal > ) return "Decimal";
    else if constexpr ( std::is_same_v< T, Value > ) return "Value";
    else if constexpr ( internal::is_optional< T >::value ) {
      return "optional<" + type_name< typename T::value_type >() + ">";
    }
    else if constexpr ( internal::is_vector< T >::value ) {
      return "array<" + type_name< typename T::value_type >() + ">";
    }
    else if constexpr ( internal::is_string_map< T >::value ) {
      return "object<" + type_name< typename T::mapped_type >() + ">";
    }
    else return record_name< T >::get();
  }

} // namespace arbor
