#include <cstring>
#include <iostream>
#include <optional>

#include "arbor/arbor.hh"
#include "arbor/yaml.hh"

namespace {

  enum class Mode { RoundTrip, ToSnake, ToCamel };

  void print_usage( std::ostream& os ) {
    os << "usage: arbor [--to-snake | --to-camel] < input.yaml\n";
  }

  std::optional< arbor::Value > rekey( const std::optional< arbor::Value >& doc,
    Mode mode )
  {
    if ( mode == Mode::ToCamel ) {
      arbor::DecoderOptions options;
      options.key_strategy = arbor::KeyDecodingStrategy::convert_from_snake_case();
      arbor::ValueDecoder decoder( options );
      return decoder.decode< std::optional< arbor::Value > >( doc );
    }

    arbor::EncoderOptions options;
    if ( mode == Mode::ToSnake ) {
      options.key_strategy = arbor::KeyEncodingStrategy::convert_to_snake_case();
    }
    arbor::ValueEncoder encoder( options );
    return encoder.encode( doc );
  }

}

int main( int argc, char** argv ) {
  Mode mode = Mode::RoundTrip;
  if ( argc > 2 ) {
    print_usage( std::cerr );
    return 2;
  }
  if ( argc == 2 ) {
    if ( std::strcmp(argv[1], "--to-snake") == 0 ) mode = Mode::ToSnake;
    else if ( std::strcmp(argv[1], "--to-camel") == 0 ) mode = Mode::ToCamel;
    else if ( std::strcmp(argv[1], "--help") == 0 ) {
      print_usage( std::cout );
      return 0;
    }
    else {
      print_usage( std::cerr );
      return 2;
    }
  }

  try {
    const std::optional< arbor::Value > doc = arbor::parse_yaml( std::cin );
    std::cout << arbor::dump_yaml( rekey(doc, mode) );
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "[arbor] error: " << ex.what() << "\n";
    return 1;
  }
}
