// ┏━┓┏━┓┏┓ ┏━┓┏━┓
// ┣━┫┣┳┛┣┻┓┃ ┃┣┳┛
// ╹ ╹╹┗╸┗━┛┗━┛╹┗╸
//  Typed records <-> generic value trees
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the arbor developers
#pragma once

// Standard library includes
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace arbor {

  // Arbitrary-precision decimal number. The value is
  //   ( negative ? -1 : 1 ) * digits * 10^exponent
  // where digits is a string of decimal digits. The representation is kept
  // normalized (no leading or trailing zeros in digits, zero is "0" with a
  // zero exponent and no sign) so that equal numbers compare equal.
  class Decimal {
  public:

    Decimal() = default;

    template < typename I, std::enable_if_t< std::is_integral_v< I >
      && !std::is_same_v< I, bool >, int > = 0 >
    Decimal( I value ) {
      std::uint64_t magnitude = 0;
      if constexpr ( std::is_signed_v< I > ) {
        negative_ = ( value < 0 );
        // Avoid overflow on the most negative value
        magnitude = negative_ ? ( ~static_cast< std::uint64_t >( value ) + 1 )
          : static_cast< std::uint64_t >( value );
      }
      else {
        magnitude = static_cast< std::uint64_t >( value );
      }
      digits_ = std::to_string( magnitude );
      this->normalize();
    }

    // Accepts [+-]digits[.digits][(e|E)[+-]digits]. Returns std::nullopt
    // for anything else, including an empty string.
    static std::optional< Decimal > parse( std::string_view text );

    // Plain notation for moderate exponents ("-12.5", "0.001", "1200"),
    // scientific notation ("1.5e+40") otherwise
    std::string to_string() const;

    inline bool is_zero() const { return digits_ == "0"; }
    inline bool is_negative() const { return negative_; }
    inline const std::string& digits() const { return digits_; }
    inline int exponent() const { return exponent_; }

    inline bool operator==( const Decimal& other ) const {
      return negative_ == other.negative_ && exponent_ == other.exponent_
        && digits_ == other.digits_;
    }
    inline bool operator!=( const Decimal& other ) const {
      return !( *this == other );
    }

  private:

    // Largest exponent magnitude accepted by parse()
    static constexpr int MAX_EXPONENT = 1000000;

    // Widest run of zeros to_string() writes before switching notation
    static constexpr int MAX_PLAIN_ZEROS = 32;

    void normalize();

    bool negative_ = false;
    std::string digits_ = "0";
    int exponent_ = 0;
  };

} // namespace arbor

inline void arbor::Decimal::normalize() {
  // Strip leading zeros
  std::size_t first = digits_.find_first_not_of( '0' );
  if ( first == std::string::npos ) {
    digits_ = "0";
    exponent_ = 0;
    negative_ = false;
    return;
  }
  digits_.erase( 0, first );

  // Move trailing zeros into the exponent
  std::size_t last = digits_.find_last_not_of( '0' );
  exponent_ += static_cast< int >( digits_.size() - last - 1 );
  digits_.erase( last + 1 );
}

inline std::optional< arbor::Decimal > arbor::Decimal::parse(
  std::string_view text )
{
  std::size_t i = 0;
  Decimal out;
  out.digits_.clear();

  if ( i < text.size() && (text[i] == '+' || text[i] == '-') ) {
    out.negative_ = ( text[i] == '-' );
    ++i;
  }

  // Integer part
  std::size_t n_digits = 0;
  while ( i < text.size() && std::isdigit(static_cast< unsigned char >(text[i])) ) {
    out.digits_ += text[ i++ ];
    ++n_digits;
  }

  // Fractional part
  int fraction_digits = 0;
  if ( i < text.size() && text[i] == '.' ) {
    ++i;
    while ( i < text.size()
      && std::isdigit(static_cast< unsigned char >(text[i])) )
    {
      out.digits_ += text[ i++ ];
      ++n_digits;
      ++fraction_digits;
    }
  }
  if ( n_digits == 0 ) return std::nullopt;

  // Exponent
  long long exp = 0;
  if ( i < text.size() && (text[i] == 'e' || text[i] == 'E') ) {
    ++i;
    bool exp_negative = false;
    if ( i < text.size() && (text[i] == '+' || text[i] == '-') ) {
      exp_negative = ( text[i] == '-' );
      ++i;
    }
    std::size_t exp_start = i;
    while ( i < text.size()
      && std::isdigit(static_cast< unsigned char >(text[i])) )
    {
      exp = exp * 10 + ( text[i] - '0' );
      if ( exp > MAX_EXPONENT ) return std::nullopt;
      ++i;
    }
    if ( i == exp_start ) return std::nullopt;
    if ( exp_negative ) exp = -exp;
  }
  if ( i != text.size() ) return std::nullopt;

  out.exponent_ = static_cast< int >( exp ) - fraction_digits;
  out.normalize();
  return out;
}

inline std::string arbor::Decimal::to_string() const {
  std::string out = negative_ ? "-" : "";
  const int n = static_cast< int >( digits_.size() );

  if ( exponent_ >= 0 ) {
    if ( exponent_ <= MAX_PLAIN_ZEROS ) {
      return out + digits_ + std::string( exponent_, '0' );
    }
  }
  else if ( -exponent_ < n ) {
    // Decimal point falls inside the digit string
    const int split = n + exponent_;
    return out + digits_.substr( 0, split ) + '.' + digits_.substr( split );
  }
  else if ( -exponent_ - n <= MAX_PLAIN_ZEROS ) {
    return out + "0." + std::string( -exponent_ - n, '0' ) + digits_;
  }

  // Scientific notation with one digit before the point
  const int sci_exp = exponent_ + n - 1;
  out += digits_.substr( 0, 1 );
  if ( n > 1 ) out += '.' + digits_.substr( 1 );
  out += ( sci_exp < 0 ? "e-" : "e+" );
  out += std::to_string( sci_exp < 0 ? -sci_exp : sci_exp );
  return out;
}
