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
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "arbor/decimal.hh"

namespace arbor {

  // The closed set of node kinds in a generic value tree. The order matches
  // the alternatives of Value::storage_type.
  enum class ValueKind { Null, Bool, Int, Double, Decimal, String, Array,
    Object };

  // Stable label used in diagnostics
  const char* kind_name( ValueKind kind );

  // One node of a generic value tree. Exactly one alternative is active.
  // The view accessors (as_bool(), as_array(), ...) never fail: asking for
  // the wrong kind simply yields an empty result.
  class Value {
  public:

    // Container elements may be absent, which is how a null produced by
    // the encoder is stored
    using array_type = std::vector< std::optional< Value > >;
    using object_type = std::map< std::string, std::optional< Value > >;

    using storage_type = std::variant< std::monostate, bool, std::int64_t,
      double, Decimal, std::string, array_type, object_type >;

    Value() = default;
    Value( std::nullptr_t ) {}
    Value( bool b ) : data_( b ) {}

    // All integer widths collapse to std::int64_t
    template < typename I, std::enable_if_t< std::is_integral_v< I >
      && !std::is_same_v< I, bool >, int > = 0 >
    Value( I i ) : data_( static_cast< std::int64_t >( i ) ) {}

    Value( double d ) : data_( d ) {}
    Value( Decimal d ) : data_( std::move(d) ) {}
    Value( std::string s ) : data_( std::move(s) ) {}
    Value( const char* s ) : data_( std::string(s) ) {}
    Value( array_type a ) : data_( std::move(a) ) {}
    Value( object_type o ) : data_( std::move(o) ) {}

    inline ValueKind kind() const {
      return static_cast< ValueKind >( data_.index() );
    }
    inline const char* kind_name() const { return arbor::kind_name( kind() ); }
    inline bool is_null() const { return kind() == ValueKind::Null; }

    std::optional< bool > as_bool() const;
    std::optional< std::int64_t > as_int() const;
    std::optional< double > as_double() const;
    const Decimal* as_decimal() const;
    const std::string* as_string() const;
    const array_type* as_array() const;
    const object_type* as_object() const;

    // Mutable views for building trees in place
    array_type* as_array();
    object_type* as_object();

    inline const storage_type& storage() const { return data_; }

    inline bool operator==( const Value& other ) const {
      return data_ == other.data_;
    }
    inline bool operator!=( const Value& other ) const {
      return !( *this == other );
    }

  private:
    storage_type data_;
  };

  // Label for a possibly absent node ("nil" when absent)
  inline const char* kind_name( const std::optional< Value >& value ) {
    return value ? value->kind_name() : "nil";
  }

} // namespace arbor

inline const char* arbor::kind_name( ValueKind kind ) {
  switch ( kind ) {
    case ValueKind::Null: return "null";
    case ValueKind::Bool: return "bool";
    case ValueKind::Int: return "int";
    case ValueKind::Double: return "double";
    case ValueKind::Decimal: return "decimal";
    case ValueKind::String: return "string";
    case ValueKind::Array: return "array";
    case ValueKind::Object: return "object";
  }
  return "unknown";
}

inline std::optional< bool > arbor::Value::as_bool() const {
  if ( const bool* b = std::get_if< bool >(&data_) ) return *b;
  return std::nullopt;
}

inline std::optional< std::int64_t > arbor::Value::as_int() const {
  if ( const std::int64_t* i = std::get_if< std::int64_t >(&data_) ) return *i;
  return std::nullopt;
}

inline std::optional< double > arbor::Value::as_double() const {
  if ( const double* d = std::get_if< double >(&data_) ) return *d;
  return std::nullopt;
}

inline const arbor::Decimal* arbor::Value::as_decimal() const {
  return std::get_if< Decimal >( &data_ );
}

inline const std::string* arbor::Value::as_string() const {
  return std::get_if< std::string >( &data_ );
}

inline const arbor::Value::array_type* arbor::Value::as_array() const {
  return std::get_if< array_type >( &data_ );
}

inline const arbor::Value::object_type* arbor::Value::as_object() const {
  return std::get_if< object_type >( &data_ );
}

inline arbor::Value::array_type* arbor::Value::as_array() {
  return std::get_if< array_type >( &data_ );
}

inline arbor::Value::object_type* arbor::Value::as_object() {
  return std::get_if< object_type >( &data_ );
}
