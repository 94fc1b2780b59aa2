// ┏━┓┏━┓┏┓ ┏━┓┏━┓
// ┣━┫┣┳┛┣┻┓┃ ┃┣┳┛
// ╹ ╹╹┗╸┗━┛┗━┛╹┗╸
//  Typed records <-> generic value trees
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the arbor developers
#pragma once

// Standard library includes
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "arbor/key_path.hh"
#include "arbor/value.hh"

namespace arbor {

  // Recoverable failures reported by ValueEncoder and ValueDecoder
  enum class ErrorKind {
    TypeMismatch, // value present but of the wrong kind
    ValueNotFound, // value absent (or null) where one was required
    KeyNotFound, // object lacked the key entirely
    DataCorrupted, // right kind, but the content is unusable
    EmptyTopLevel, // top-level encode wrote nothing
    InvalidValue // encode-side value the generic model cannot hold
  };

  const char* to_string( ErrorKind kind );

namespace internal {

  // Compose "root.a.b[0].c: detail". Every error message in the library is
  // built here.
  inline std::string compose_message( const KeyPath& path,
    const std::string& detail )
  {
    std::ostringstream oss;
    oss << path.to_string() << ": " << detail;
    return oss.str();
  }

} // namespace arbor::internal

  // Base class of the recoverable error taxonomy
  class Error : public std::runtime_error {
  public:
    inline ErrorKind kind() const noexcept { return kind_; }
    inline const KeyPath& path() const noexcept { return path_; }
    inline const std::string& detail() const noexcept { return detail_; }

  protected:
    Error( ErrorKind kind, KeyPath path, std::string detail )
      : std::runtime_error( internal::compose_message(path, detail) ),
      kind_( kind ), path_( std::move(path) ), detail_( std::move(detail) ) {}

  private:
    ErrorKind kind_;
    KeyPath path_;
    std::string detail_;
  };

  class TypeMismatch : public Error {
  public:
    TypeMismatch( KeyPath path, std::string expected, std::string found )
      : TypeMismatch( std::move(path), expected, found, "Expected to decode "
        + expected + " but found " + found + " instead." ) {}

    TypeMismatch( KeyPath path, std::string expected, std::string found,
      std::string detail ) : Error( ErrorKind::TypeMismatch, std::move(path),
      std::move(detail) ), expected_( std::move(expected) ),
      found_( std::move(found) ) {}

    inline const std::string& expected() const noexcept { return expected_; }
    inline const std::string& found() const noexcept { return found_; }

  private:
    std::string expected_;
    std::string found_;
  };

  class ValueNotFound : public Error {
  public:
    ValueNotFound( KeyPath path, std::string expected )
      : ValueNotFound( std::move(path), expected, "Expected to decode "
        + expected + " but found nil value instead." ) {}

    ValueNotFound( KeyPath path, std::string expected, std::string detail )
      : Error( ErrorKind::ValueNotFound, std::move(path), std::move(detail) ),
      expected_( std::move(expected) ) {}

    inline const std::string& expected() const noexcept { return expected_; }

  private:
    std::string expected_;
  };

  class KeyNotFound : public Error {
  public:
    KeyNotFound( KeyPath path, CodingKey key )
      : Error( ErrorKind::KeyNotFound, std::move(path),
        "No value associated with key \"" + key.string_value() + "\"." ),
      key_( std::move(key) ) {}

    inline const CodingKey& key() const noexcept { return key_; }

  private:
    CodingKey key_;
  };

  class DataCorrupted : public Error {
  public:
    DataCorrupted( KeyPath path, std::string reason )
      : Error( ErrorKind::DataCorrupted, std::move(path), std::move(reason) ) {}
  };

  class EmptyTopLevel : public Error {
  public:
    explicit EmptyTopLevel( const std::string& type )
      : Error( ErrorKind::EmptyTopLevel, KeyPath(),
        "Top-level " + type + " did not encode any values." ) {}
  };

  class InvalidValue : public Error {
  public:
    InvalidValue( KeyPath path, std::string reason )
      : Error( ErrorKind::InvalidValue, std::move(path), std::move(reason) ) {}
  };

  // Thrown when a field visitor misuses the encoder (switching container
  // kind on a committed position, writing a single value twice). Never
  // caught inside the library.
  class ContractViolation : public std::logic_error {
  public:
    ContractViolation( const KeyPath& path, const std::string& msg )
      : std::logic_error( internal::compose_message(path, msg) ) {}
  };

namespace internal {

  // Shared failure for "expected X here": TypeMismatch when something of
  // the wrong kind is present, ValueNotFound when nothing (or null) is
  // stored at path
  [[noreturn]] inline void throw_unwrap_error( const std::string& expected,
    const KeyPath& path, const Value* value )
  {
    if ( value && !value->is_null() ) {
      throw TypeMismatch( path, expected, value->kind_name() );
    }
    throw ValueNotFound( path, expected );
  }

} // namespace arbor::internal

} // namespace arbor

inline const char* arbor::to_string( ErrorKind kind ) {
  switch ( kind ) {
    case ErrorKind::TypeMismatch: return "TypeMismatch";
    case ErrorKind::ValueNotFound: return "ValueNotFound";
    case ErrorKind::KeyNotFound: return "KeyNotFound";
    case ErrorKind::DataCorrupted: return "DataCorrupted";
    case ErrorKind::EmptyTopLevel: return "EmptyTopLevel";
    case ErrorKind::InvalidValue: return "InvalidValue";
  }
  return "Unknown";
}
