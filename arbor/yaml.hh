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
#include <istream>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

#include "arbor/errors.hh"
#include "arbor/key_path.hh"
#include "arbor/value.hh"

namespace arbor {

  // Specialized version of the fkYAML basic_node template. In particular,
  // the choice of fkyaml::ordered_map preserves the lexical order of the input
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

  // Value -> YAML node. Absent and null values become a YAML null, and a
  // Decimal is written as a string scalar.
  ordered_node to_yaml( const std::optional< Value >& value );

  // YAML node -> Value. A YAML null becomes std::nullopt. Mapping keys
  // must be strings; anything else is DataCorrupted at the mapping's path.
  std::optional< Value > from_yaml( const ordered_node& node );

  std::string dump_yaml( const std::optional< Value >& value );

  // Parse errors from fkYAML propagate unchanged
  std::optional< Value > parse_yaml( std::istream& in );
  std::optional< Value > parse_yaml( const std::string& text );

  std::ostream& operator<<( std::ostream& out, const Value& value );

namespace internal {

  // Helpers for conversions to/from the ordered_node type

  template < typename T >
  inline T to_native_checked( const ordered_node& n ) {
    T out;
    fkyaml::node_value_converter< T >::from_node( n, out );
    return out;
  }

  template < typename T >
  inline ordered_node make_node_from( const T& value ) {
    ordered_node n;
    fkyaml::node_value_converter< T >::to_node( n, value );
    return n;
  }

  std::optional< Value > from_yaml_at( const ordered_node& node,
    const KeyPath& path );

} // namespace arbor::internal

} // namespace arbor

inline arbor::ordered_node arbor::to_yaml( const std::optional< Value >& value )
{
  if ( !value ) return ordered_node();

  switch ( value->kind() ) {
    case ValueKind::Null:
      return ordered_node();
    case ValueKind::Bool:
      return internal::make_node_from( *value->as_bool() );
    case ValueKind::Int:
      return internal::make_node_from( *value->as_int() );
    case ValueKind::Double:
      return internal::make_node_from( *value->as_double() );
    case ValueKind::Decimal:
      return internal::make_node_from( value->as_decimal()->to_string() );
    case ValueKind::String:
      return internal::make_node_from( *value->as_string() );
    case ValueKind::Array: {
      std::vector< ordered_node > seq;
      for ( const auto& element : *value->as_array() ) {
        seq.push_back( to_yaml(element) );
      }
      return internal::make_node_from( seq );
    }
    case ValueKind::Object: {
      ordered_node map = ordered_node::mapping();
      for ( const auto& [key, element] : *value->as_object() ) {
        map[ key ] = to_yaml( element );
      }
      return map;
    }
  }
  return ordered_node();
}

inline std::optional< arbor::Value > arbor::internal::from_yaml_at(
  const ordered_node& node, const KeyPath& path )
{
  if ( node.is_null() ) return std::nullopt;
  if ( node.is_boolean() ) return Value( to_native_checked< bool >(node) );
  if ( node.is_integer() ) {
    return Value( to_native_checked< std::int64_t >(node) );
  }
  if ( node.is_float_number() ) {
    return Value( to_native_checked< double >(node) );
  }
  if ( node.is_string() ) {
    return Value( to_native_checked< std::string >(node) );
  }

  if ( node.is_sequence() ) {
    Value::array_type out;
    for ( size_t i = 0; i < node.size(); ++i ) {
      out.push_back( from_yaml_at(node.at(i),
        path.appending(CodingKey::index(static_cast< int >(i)))) );
    }
    return Value( std::move(out) );
  }

  if ( node.is_mapping() ) {
    Value::object_type out;
    for ( const auto& [mk, mv] : node.map_items() ) {
      if ( !mk.is_string() ) {
        throw DataCorrupted( path, "Mapping key is not a string." );
      }
      const std::string key = mk.get_value< std::string >();
      out.emplace( key, from_yaml_at(mv, path.appending(CodingKey(key))) );
    }
    return Value( std::move(out) );
  }

  throw DataCorrupted( path, "Unsupported YAML node." );
}

inline std::optional< arbor::Value > arbor::from_yaml(
  const ordered_node& node )
{
  return internal::from_yaml_at( node, KeyPath() );
}

inline std::string arbor::dump_yaml( const std::optional< Value >& value ) {
  return ordered_node::serialize( to_yaml(value) );
}

inline std::optional< arbor::Value > arbor::parse_yaml( std::istream& in ) {
  std::ostringstream ss;
  ss << in.rdbuf();
  return parse_yaml( ss.str() );
}

inline std::optional< arbor::Value > arbor::parse_yaml(
  const std::string& text )
{
  return from_yaml( ordered_node::deserialize(text) );
}

inline std::ostream& arbor::operator<<( std::ostream& out, const Value& value )
{
  return out << dump_yaml( value );
}
