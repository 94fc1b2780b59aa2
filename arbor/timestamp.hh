// ┏━┓┏━┓┏┓ ┏━┓┏━┓
// ┣━┫┣┳┛┣┻┓┃ ┃┣┳┛
// ╹ ╹╹┗╸┗━┛┗━┛╹┗╸
//  Typed records <-> generic value trees
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the arbor developers
#pragma once

// Standard library includes
#include <cctype>
#include <cmath>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace arbor {

  // A point in time, stored as seconds since 1970-01-01T00:00:00Z
  class Timestamp {
  public:

    // Seconds between the Unix epoch and the 2001-01-01T00:00:00Z reference
    // date used by the deferred encoding
    static constexpr double REFERENCE_DATE_OFFSET = 978307200.0;

    Timestamp() = default;

    static inline Timestamp from_seconds_since_1970( double s ) {
      Timestamp t;
      t.seconds_ = s;
      return t;
    }

    static inline Timestamp from_seconds_since_reference( double s ) {
      return from_seconds_since_1970( s + REFERENCE_DATE_OFFSET );
    }

    inline double seconds_since_1970() const { return seconds_; }
    inline double seconds_since_reference() const {
      return seconds_ - REFERENCE_DATE_OFFSET;
    }

    inline bool operator==( const Timestamp& other ) const {
      return seconds_ == other.seconds_;
    }
    inline bool operator!=( const Timestamp& other ) const {
      return !( *this == other );
    }
    inline bool operator<( const Timestamp& other ) const {
      return seconds_ < other.seconds_;
    }

  private:
    double seconds_ = 0.;
  };

  // Broken-down UTC time
  struct CivilTime {
    std::int64_t year = 1970;
    int month = 1; // 1-12
    int day = 1; // 1-31
    int hour = 0;
    int minute = 0;
    int second = 0;
  };

  // True when t is finite and its year fits std::tm. Only such timestamps
  // have a calendar form.
  bool is_civil_representable( const Timestamp& t );

  // Whole-second UTC conversions. Fractional seconds are truncated toward
  // negative infinity. to_civil throws std::out_of_range for a timestamp
  // without a calendar form.
  CivilTime to_civil( const Timestamp& t );
  Timestamp from_civil( const CivilTime& c );

  // "2001-05-29T15:00:00Z"
  std::string format_iso8601( const Timestamp& t );

  // Accepts "YYYY-MM-DDTHH:MM:SS" followed by "Z", "+HH:MM" or "+HHMM" (or
  // the '-' forms). Returns std::nullopt for anything else.
  std::optional< Timestamp > parse_iso8601( const std::string& text );

  // Abstract formatter object used by the "formatted" timestamp strategies
  class TimestampFormatter {
  public:
    virtual ~TimestampFormatter() = default;
    virtual std::string format( const Timestamp& t ) const = 0;
    virtual std::optional< Timestamp > parse( const std::string& text ) const
      = 0;
  };

  // Formatter driven by a std::put_time / std::get_time pattern, evaluated
  // in UTC, e.g. "%Y-%m-%d %H:%M:%S"
  class PatternFormatter : public TimestampFormatter {
  public:
    explicit PatternFormatter( std::string pattern )
      : pattern_( std::move(pattern) ) {}

    std::string format( const Timestamp& t ) const override;
    std::optional< Timestamp > parse( const std::string& text ) const override;

    inline const std::string& pattern() const { return pattern_; }

  private:
    std::string pattern_;
  };

namespace internal {

  inline constexpr std::int64_t SECONDS_PER_DAY = 86400;

  // About two billion years either side of the epoch
  inline constexpr double MAX_CIVIL_SECONDS = 6.7e16;

  // Days since 1970-01-01 for a proleptic Gregorian date
  // (H. Hinnant's days_from_civil)
  inline std::int64_t days_from_civil( std::int64_t y, int m, int d ) {
    y -= ( m <= 2 );
    const std::int64_t era = ( y >= 0 ? y : y - 399 ) / 400;
    const std::int64_t yoe = y - era * 400;
    const std::int64_t doy = ( 153 * (m + (m > 2 ? -3 : 9)) + 2 ) / 5 + d - 1;
    const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
  }

  // Inverse of days_from_civil
  inline void civil_from_days( std::int64_t z, std::int64_t& y, int& m,
    int& d )
  {
    z += 719468;
    const std::int64_t era = ( z >= 0 ? z : z - 146096 ) / 146097;
    const std::int64_t doe = z - era * 146097;
    const std::int64_t yoe = ( doe - doe / 1460 + doe / 36524
      - doe / 146096 ) / 365;
    const std::int64_t doy = doe - ( 365 * yoe + yoe / 4 - yoe / 100 );
    const std::int64_t mp = ( 5 * doy + 2 ) / 153;
    d = static_cast< int >( doy - (153 * mp + 2) / 5 + 1 );
    m = static_cast< int >( mp < 10 ? mp + 3 : mp - 9 );
    y = yoe + era * 400 + ( m <= 2 );
  }

  inline bool is_leap_year( std::int64_t y ) {
    return ( y % 4 == 0 && y % 100 != 0 ) || y % 400 == 0;
  }

  inline int days_in_month( std::int64_t y, int m ) {
    static constexpr int DAYS[] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31,
      30, 31 };
    return ( m == 2 && is_leap_year(y) ) ? 29 : DAYS[ m - 1 ];
  }

  inline bool valid_civil( const CivilTime& c ) {
    return c.month >= 1 && c.month <= 12 && c.day >= 1
      && c.day <= days_in_month( c.year, c.month ) && c.hour >= 0
      && c.hour < 24 && c.minute >= 0 && c.minute < 60 && c.second >= 0
      && c.second < 60;
  }

  // Reads exactly `width` digits starting at text[pos]
  inline std::optional< int > read_digits( const std::string& text,
    std::size_t pos, std::size_t width )
  {
    if ( pos + width > text.size() ) return std::nullopt;
    int v = 0;
    for ( std::size_t i = pos; i < pos + width; ++i ) {
      if ( !std::isdigit(static_cast< unsigned char >(text[i])) ) {
        return std::nullopt;
      }
      v = v * 10 + ( text[i] - '0' );
    }
    return v;
  }

  inline std::tm to_tm( const CivilTime& c ) {
    std::tm tm{};
    tm.tm_year = static_cast< int >( c.year - 1900 );
    tm.tm_mon = c.month - 1;
    tm.tm_mday = c.day;
    tm.tm_hour = c.hour;
    tm.tm_min = c.minute;
    tm.tm_sec = c.second;
    const std::int64_t days = days_from_civil( c.year, c.month, c.day );
    // 1970-01-01 was a Thursday
    tm.tm_wday = static_cast< int >( ((days % 7) + 11) % 7 );
    tm.tm_yday = static_cast< int >( days - days_from_civil(c.year, 1, 1) );
    return tm;
  }

} // namespace arbor::internal

} // namespace arbor

inline bool arbor::is_civil_representable( const Timestamp& t ) {
  const double s = t.seconds_since_1970();
  return std::isfinite( s ) && std::fabs( s ) <= internal::MAX_CIVIL_SECONDS;
}

inline arbor::CivilTime arbor::to_civil( const Timestamp& t ) {
  if ( !is_civil_representable(t) ) {
    throw std::out_of_range( "Timestamp has no calendar representation." );
  }
  const std::int64_t total = static_cast< std::int64_t >(
    std::floor(t.seconds_since_1970()) );

  std::int64_t days = total / internal::SECONDS_PER_DAY;
  std::int64_t rem = total % internal::SECONDS_PER_DAY;
  if ( rem < 0 ) {
    rem += internal::SECONDS_PER_DAY;
    --days;
  }

  CivilTime c;
  internal::civil_from_days( days, c.year, c.month, c.day );
  c.hour = static_cast< int >( rem / 3600 );
  c.minute = static_cast< int >( (rem % 3600) / 60 );
  c.second = static_cast< int >( rem % 60 );
  return c;
}

inline arbor::Timestamp arbor::from_civil( const CivilTime& c ) {
  const std::int64_t days = internal::days_from_civil( c.year, c.month,
    c.day );
  const std::int64_t secs = days * internal::SECONDS_PER_DAY
    + c.hour * 3600 + c.minute * 60 + c.second;
  return Timestamp::from_seconds_since_1970( static_cast< double >(secs) );
}

inline std::string arbor::format_iso8601( const Timestamp& t ) {
  const CivilTime c = to_civil( t );
  std::ostringstream oss;
  oss << std::setfill( '0' ) << std::setw( 4 ) << c.year << '-'
    << std::setw( 2 ) << c.month << '-' << std::setw( 2 ) << c.day << 'T'
    << std::setw( 2 ) << c.hour << ':' << std::setw( 2 ) << c.minute << ':'
    << std::setw( 2 ) << c.second << 'Z';
  return oss.str();
}

inline std::optional< arbor::Timestamp > arbor::parse_iso8601(
  const std::string& text )
{
  // Fixed layout: YYYY-MM-DDTHH:MM:SS
  if ( text.size() < 20 ) return std::nullopt;
  if ( text[4] != '-' || text[7] != '-' || text[10] != 'T'
    || text[13] != ':' || text[16] != ':' ) return std::nullopt;

  auto year = internal::read_digits( text, 0, 4 );
  auto month = internal::read_digits( text, 5, 2 );
  auto day = internal::read_digits( text, 8, 2 );
  auto hour = internal::read_digits( text, 11, 2 );
  auto minute = internal::read_digits( text, 14, 2 );
  auto second = internal::read_digits( text, 17, 2 );
  if ( !year || !month || !day || !hour || !minute || !second ) {
    return std::nullopt;
  }

  CivilTime c;
  c.year = *year;
  c.month = *month;
  c.day = *day;
  c.hour = *hour;
  c.minute = *minute;
  c.second = *second;
  if ( !internal::valid_civil(c) ) return std::nullopt;

  // Zone designator
  int offset_seconds = 0;
  const std::string zone = text.substr( 19 );
  if ( zone != "Z" ) {
    if ( zone.size() != 6 && zone.size() != 5 ) return std::nullopt;
    if ( zone[0] != '+' && zone[0] != '-' ) return std::nullopt;
    auto oh = internal::read_digits( zone, 1, 2 );
    std::optional< int > om;
    if ( zone.size() == 6 ) {
      if ( zone[3] != ':' ) return std::nullopt;
      om = internal::read_digits( zone, 4, 2 );
    }
    else {
      om = internal::read_digits( zone, 3, 2 );
    }
    if ( !oh || !om || *oh > 23 || *om > 59 ) return std::nullopt;
    offset_seconds = ( *oh * 3600 + *om * 60 ) * ( zone[0] == '-' ? -1 : 1 );
  }

  const Timestamp local = from_civil( c );
  return Timestamp::from_seconds_since_1970( local.seconds_since_1970()
    - offset_seconds );
}

inline std::string arbor::PatternFormatter::format( const Timestamp& t ) const
{
  const std::tm tm = internal::to_tm( to_civil(t) );
  std::ostringstream oss;
  oss << std::put_time( &tm, pattern_.c_str() );
  return oss.str();
}

inline std::optional< arbor::Timestamp > arbor::PatternFormatter::parse(
  const std::string& text ) const
{
  // Fields absent from the pattern default to 1970-01-01T00:00:00
  std::tm tm{};
  tm.tm_year = 70;
  tm.tm_mday = 1;

  std::istringstream in( text );
  in >> std::get_time( &tm, pattern_.c_str() );
  if ( in.fail() ) return std::nullopt;

  // The whole string must be consumed
  if ( in.peek() != std::char_traits< char >::eof() ) return std::nullopt;

  CivilTime c;
  c.year = static_cast< std::int64_t >( tm.tm_year ) + 1900;
  c.month = tm.tm_mon + 1;
  c.day = tm.tm_mday;
  c.hour = tm.tm_hour;
  c.minute = tm.tm_min;
  c.second = tm.tm_sec;
  if ( !internal::valid_civil(c) ) return std::nullopt;
  return from_civil( c );
}
