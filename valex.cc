#include "valex.hh"

#include <string>
#include <vector>

namespace {

  void print_usage() {
    std::cerr << "usage: valex <command> [args] < document\n"
      << "  pretty              print the document\n"
      << "  get PATH            print the value at PATH\n"
      << "  contains PATH       print whether PATH resolves\n"
      << "  take PATH           replace the value at PATH with null\n"
      << "  remove PATH         delete the value at PATH\n"
      << "  insert PATH VALUE   write VALUE at PATH\n"
      << "  merge VALUE         shallow-merge the VALUE object\n"
      << "  keys                list property names breadth-first\n"
      << "PATH is a top-level name, or a /-delimited pointer.\n";
  }

  // Expected argument count (after the command) for each command
  int arity( const std::string& command ) {
    if ( command == "pretty" || command == "keys" ) return 0;
    if ( command == "get" || command == "contains" || command == "take"
      || command == "remove" || command == "merge" ) return 1;
    if ( command == "insert" ) return 2;
    return -1;
  }

} // namespace

int main( int argc, char** argv ) {
  const std::vector< std::string > args( argv + 1, argv + argc );
  if ( args.empty() || arity(args[0]) != static_cast< int >(args.size()) - 1 ) {
    print_usage();
    return 2;
  }
  const std::string& command = args[ 0 ];

  try {
    valex::ordered_node doc = valex::parse( std::cin );

    if ( command == "get" ) {
      std::cout << valex::pretty( valex::locate(doc, args[1]) );
    }
    else if ( command == "contains" ) {
      const bool found = valex::contains( doc, args[1] );
      std::cout << ( found ? "true" : "false" ) << "\n";
      return found ? 0 : 1;
    }
    else if ( command == "keys" ) {
      valex::walk( doc, []( valex::ordered_node&, const std::string& key ) {
        std::cout << key << "\n";
        return true;
      } );
    }
    else {
      if ( command == "take" ) valex::detach( doc, args[1] );
      else if ( command == "remove" ) valex::erase( doc, args[1] );
      else if ( command == "insert" ) {
        valex::insert( doc, args[1], valex::parse(args[2]) );
      }
      else if ( command == "merge" ) valex::merge( doc, valex::parse(args[1]) );
      std::cout << valex::pretty( doc );
    }
    return 0;
  } catch ( const std::exception& ex ) {
    std::cerr << "[valex] error: " << ex.what() << "\n";
    return 1;
  }
}
