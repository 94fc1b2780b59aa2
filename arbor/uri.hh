// ┏━┓┏━┓┏┓ ┏━┓┏━┓
// ┣━┫┣┳┛┣┻┓┃ ┃┣┳┛
// ╹ ╹╹┗╸┗━┛┗━┛╹┗╸
//  Typed records <-> generic value trees
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the arbor developers
#pragma once

// Standard library includes
#include <cctype>
#include <optional>
#include <string>
#include <utility>

namespace arbor {

  // Absolute resource identifier ("https://example.org/a?b=c"). The text is
  // kept verbatim; parse() only checks that it is well formed: a scheme
  // followed by ':', printable ASCII without spaces or the characters
  // RFC 3986 excludes, and complete percent escapes.
  class Uri {
  public:

    static std::optional< Uri > parse( const std::string& text );

    inline const std::string& absolute_string() const { return text_; }

    // Text before the first ':'
    inline std::string scheme() const {
      return text_.substr( 0, text_.find(':') );
    }

    inline bool operator==( const Uri& other ) const {
      return text_ == other.text_;
    }
    inline bool operator!=( const Uri& other ) const {
      return !( *this == other );
    }

  private:
    explicit Uri( std::string text ) : text_( std::move(text) ) {}
    std::string text_;
  };

namespace internal {

  inline bool is_scheme_char( char ch ) {
    unsigned char c = static_cast< unsigned char >( ch );
    return std::isalnum( c ) || c == '+' || c == '-' || c == '.';
  }

  inline bool is_excluded_uri_char( char ch ) {
    unsigned char c = static_cast< unsigned char >( ch );
    if ( c <= 0x20 || c >= 0x7F ) return true;
    switch ( ch ) {
      case '"': case '<': case '>': case '\\': case '^': case '`':
      case '{': case '|': case '}':
        return true;
      default: return false;
    }
  }

} // namespace arbor::internal

} // namespace arbor

inline std::optional< arbor::Uri > arbor::Uri::parse( const std::string& text )
{
  const std::size_t colon = text.find( ':' );
  if ( colon == std::string::npos || colon == 0 ) return std::nullopt;
  if ( !std::isalpha(static_cast< unsigned char >(text[0])) ) {
    return std::nullopt;
  }
  for ( std::size_t i = 1; i < colon; ++i ) {
    if ( !internal::is_scheme_char(text[i]) ) return std::nullopt;
  }

  for ( std::size_t i = colon + 1; i < text.size(); ++i ) {
    const char c = text[ i ];
    if ( internal::is_excluded_uri_char(c) ) return std::nullopt;
    if ( c == '%' ) {
      if ( i + 2 >= text.size()
        || !std::isxdigit(static_cast< unsigned char >(text[i + 1]))
        || !std::isxdigit(static_cast< unsigned char >(text[i + 2])) )
      {
        return std::nullopt;
      }
      i += 2;
    }
  }
  return Uri( text );
}
