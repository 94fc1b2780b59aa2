// ┏━┓┏━┓┏┓ ┏━┓┏━┓
// ┣━┫┣┳┛┣┻┓┃ ┃┣┳┛
// ╹ ╹╹┗╸┗━┛┗━┛╹┗╸
//  Typed records <-> generic value trees
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the arbor developers
#pragma once

// Standard library includes
#include <cctype>
#include <string>
#include <utility>
#include <vector>

namespace arbor {

  // camelCase -> snake_case. Words split at each lower-to-upper transition
  // and at the end of a run of two or more capitals followed by a lowercase
  // letter, so "myURLProperty" becomes "my_url_property". Leading and
  // trailing underscores are kept.
  std::string to_snake_case( const std::string& key );

  // snake_case -> camelCase. "one_two_three" becomes "oneTwoThree" and
  // "_one_two_three_" becomes "_oneTwoThree_". A key without inner
  // underscores is returned unchanged.
  std::string from_snake_case( const std::string& key );

namespace internal {

  inline bool is_upper_ascii( char ch ) {
    return std::isupper( static_cast< unsigned char >(ch) ) != 0;
  }

  inline bool is_lower_ascii( char ch ) {
    return std::islower( static_cast< unsigned char >(ch) ) != 0;
  }

  inline std::string to_lower_ascii( std::string s ) {
    for ( char& c : s ) {
      c = static_cast< char >( std::tolower(static_cast< unsigned char >(c)) );
    }
    return s;
  }

} // namespace arbor::internal

} // namespace arbor

inline std::string arbor::to_snake_case( const std::string& key ) {
  if ( key.empty() ) return key;

  // Word boundaries as [begin, end) offsets into key
  std::vector< std::pair< std::size_t, std::size_t > > words;
  std::size_t word_start = 0;
  std::size_t search_from = 1;
  const std::size_t n = key.size();

  while ( true ) {
    // Next uppercase character
    std::size_t upper = search_from;
    while ( upper < n && !internal::is_upper_ascii(key[upper]) ) ++upper;
    if ( upper >= n ) break;

    words.emplace_back( word_start, upper );

    // Next lowercase character at or after the capital
    std::size_t lower = upper;
    while ( lower < n && !internal::is_lower_ascii(key[lower]) ) ++lower;
    if ( lower >= n ) {
      // Only capitals remain; they form the last word
      word_start = upper;
      break;
    }

    if ( lower == upper + 1 ) {
      // Single capital starting an ordinary word
      word_start = upper;
    }
    else {
      // A run of capitals is its own word, ending before the capital that
      // starts the next word
      words.emplace_back( upper, lower - 1 );
      word_start = lower - 1;
    }
    search_from = lower + 1;
  }
  words.emplace_back( word_start, n );

  std::string result;
  for ( std::size_t i = 0; i < words.size(); ++i ) {
    if ( i ) result += '_';
    const auto& [b, e] = words[ i ];
    result += internal::to_lower_ascii( key.substr(b, e - b) );
  }
  return result;
}

inline std::string arbor::from_snake_case( const std::string& key ) {
  if ( key.empty() ) return key;

  const std::size_t first = key.find_first_not_of( '_' );
  if ( first == std::string::npos ) return key; // nothing but underscores
  const std::size_t last = key.find_last_not_of( '_' );

  const std::string leading = key.substr( 0, first );
  const std::string trailing = key.substr( last + 1 );
  const std::string core = key.substr( first, last - first + 1 );

  // Split the core on '_', dropping empty pieces
  std::vector< std::string > components;
  std::size_t start = 0;
  while ( start <= core.size() ) {
    std::size_t pos = core.find( '_', start );
    if ( pos == std::string::npos ) pos = core.size();
    if ( pos > start ) components.push_back( core.substr(start, pos - start) );
    start = pos + 1;
  }

  std::string joined;
  if ( components.size() == 1 ) {
    // Possibly camel-cased already
    joined = core;
  }
  else {
    joined = internal::to_lower_ascii( components.front() );
    for ( std::size_t i = 1; i < components.size(); ++i ) {
      std::string word = components[ i ];
      word[ 0 ] = static_cast< char >(
        std::toupper(static_cast< unsigned char >(word[0])) );
      joined += word;
    }
  }
  return leading + joined + trailing;
}
