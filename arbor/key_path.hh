// ┏━┓┏━┓┏┓ ┏━┓┏━┓
// ┣━┫┣┳┛┣┻┓┃ ┃┣┳┛
// ╹ ╹╹┗╸┗━┛┗━┛╹┗╸
//  Typed records <-> generic value trees
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the arbor developers
#pragma once

// Standard library includes
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace arbor {

namespace internal {

  // Constants used to name synthesized keys and to render key paths. This
  // block provides a single location for easy editing.
  inline constexpr char PATH_DELIMITER = '.';
  inline const std::string PATH_ROOT = "root";
  inline const std::string INDEX_PREFIX = "Index ";
  inline const std::string SUPER_KEY = "super";

} // namespace arbor::internal

  // One segment of a key path: a string name and, for positional keys, an
  // integer ordinal
  class CodingKey {
  public:

    CodingKey( std::string name ) : name_( std::move(name) ) {}
    CodingKey( const char* name ) : name_( name ) {}
    CodingKey( std::string name, std::optional< int > ordinal )
      : name_( std::move(name) ), ordinal_( ordinal ) {}

    // Positional key for element idx of a sequence ("Index 3")
    static inline CodingKey index( int idx ) {
      return CodingKey( internal::INDEX_PREFIX + std::to_string(idx), idx );
    }

    // Key whose name is the decimal form of an integer ("3")
    static inline CodingKey from_int( int value ) {
      return CodingKey( std::to_string(value), value );
    }

    // Reserved key used for supertype delegation
    static inline CodingKey super_key() {
      return CodingKey( internal::SUPER_KEY );
    }

    inline const std::string& string_value() const { return name_; }
    inline std::optional< int > int_value() const { return ordinal_; }

    // True for keys synthesized by index()
    inline bool is_index() const {
      return ordinal_ && name_ == internal::INDEX_PREFIX
        + std::to_string( *ordinal_ );
    }

    inline bool operator==( const CodingKey& other ) const {
      return name_ == other.name_ && ordinal_ == other.ordinal_;
    }
    inline bool operator!=( const CodingKey& other ) const {
      return !( *this == other );
    }

  private:
    std::string name_;
    std::optional< int > ordinal_;
  };

  // Ordered list of keys locating a position in a value tree. Paths are
  // never modified in place: descending produces an extended copy.
  class KeyPath {
  public:

    KeyPath() = default;
    explicit KeyPath( std::vector< CodingKey > keys )
      : keys_( std::move(keys) ) {}

    inline KeyPath appending( const CodingKey& key ) const {
      KeyPath out = *this;
      out.keys_.push_back( key );
      return out;
    }

    inline const std::vector< CodingKey >& keys() const { return keys_; }
    inline std::size_t size() const { return keys_.size(); }
    inline bool empty() const { return keys_.empty(); }
    inline const CodingKey& back() const { return keys_.back(); }

    inline auto begin() const { return keys_.begin(); }
    inline auto end() const { return keys_.end(); }

    // Renders e.g. "root.items[0].name"
    std::string to_string() const;

    inline bool operator==( const KeyPath& other ) const {
      return keys_ == other.keys_;
    }
    inline bool operator!=( const KeyPath& other ) const {
      return !( *this == other );
    }

  private:
    std::vector< CodingKey > keys_;
  };

} // namespace arbor

inline std::string arbor::KeyPath::to_string() const {
  std::string s = internal::PATH_ROOT;
  for ( const auto& key : keys_ ) {
    if ( key.is_index() ) {
      s += '[' + std::to_string( *key.int_value() ) + ']';
    }
    else {
      s += internal::PATH_DELIMITER;
      s += key.string_value();
    }
  }
  return s;
}
