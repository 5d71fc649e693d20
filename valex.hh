//  valex: typed path access, removal, merging and traversal
//  for ordered value trees
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

namespace valex {

  // Specialized version of the fkYAML basic_node template. In particular,
  // the choice of fkyaml::ordered_map preserves the insertion order of
  // object keys
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

  // Borrowed view of an array node's elements
  using node_array = ordered_node::sequence_type;
  using node_array_ref = std::reference_wrapper< const node_array >;

  enum class ErrorKind {
    Custom, // Structural failure, e.g., a path through a scalar
    PropertyNotFound, // The path did not resolve
    PropertyValueNotOfType, // Resolved, but the value has the wrong shape
    ValueNotOfType, // Bare coercion mismatch (no path context)
    Codec // Failure reported by the fkYAML conversion/text layer
  };

  // Single exception type thrown by every operation in this header
  class Error : public std::runtime_error {
  public:
    static Error custom( const std::string& msg );
    static Error property_not_found( const std::string& path );
    static Error property_value_not_of_type( const std::string& path,
      const std::string& expected );
    static Error value_not_of_type( const std::string& expected );
    static Error codec( const std::string& detail );

    ErrorKind kind() const { return kind_; }

    // Path text as given by the caller (empty when not path-attributed)
    const std::string& path() const { return path_; }

    // Name of the requested kind for the two type-mismatch errors
    const std::string& expected() const { return expected_; }

  private:
    Error( ErrorKind kind, const std::string& what, std::string path = {},
      std::string expected = {} );

    ErrorKind kind_;
    std::string path_;
    std::string expected_;
  };

  // A parsed address into a tree. Text starting with POINTER_DELIMITER is a
  // pointer whose segments are walked one level at a time (object key or
  // array index). Anything else is a direct name matching exactly one key
  // of the root object, even if it contains the delimiter further on.
  // There is always at least one segment.
  class Path {
  public:
    // Not explicit: operations take a Path, callers pass strings
    Path( const std::string& text );
    Path( const char* text ) : Path( std::string(text) ) {}

    bool is_pointer() const { return pointer_; }
    const std::string& text() const { return text_; }
    const std::vector< std::string >& segments() const { return segments_; }

  private:
    std::string text_;
    bool pointer_;
    std::vector< std::string > segments_;
  };

namespace internal {

  inline constexpr char POINTER_DELIMITER = '/';

  // Divide a pointer by POINTER_DELIMITER instances, dropping the empty
  // segment in front of the leading delimiter. Empty segments further on
  // are kept and address the "" key.
  inline std::vector< std::string > split_segments( const std::string& ptr ) {
    std::vector< std::string > segs;
    size_t start = 1;
    while ( true ) {
      size_t pos = ptr.find( POINTER_DELIMITER, start );
      if ( pos == std::string::npos ) {
        segs.push_back( ptr.substr(start) );
        break;
      }
      segs.push_back( ptr.substr(start, pos - start) );
      start = pos + 1;
    }
    return segs;
  }

  // Base-10 array index. No sign, no leading zeros (except "0" itself).
  inline std::optional< std::size_t > parse_index( const std::string& seg ) {
    if ( seg.empty() ) return std::nullopt;
    if ( seg.size() > 1 && seg.front() == '0' ) return std::nullopt;

    std::size_t idx = 0;
    const char* first = seg.data();
    const char* last = first + seg.size();
    auto [ ptr, ec ] = std::from_chars( first, last, idx );
    if ( ec != std::errc() || ptr != last ) return std::nullopt;
    return idx;
  }

  // One step down the tree. Direct names only match object keys, pointer
  // segments may also index into arrays.
  inline const ordered_node* child_of( const ordered_node& n,
    const std::string& seg, bool allow_index )
  {
    if ( n.is_mapping() ) {
      if ( !n.contains(seg) ) return nullptr;
      return &n.at( seg );
    }
    if ( allow_index && n.is_sequence() ) {
      auto idx = parse_index( seg );
      if ( !idx || *idx >= n.size() ) return nullptr;
      return &n.at( *idx );
    }
    return nullptr;
  }

  inline ordered_node* child_of( ordered_node& n, const std::string& seg,
    bool allow_index )
  {
    if ( n.is_mapping() ) {
      if ( !n.contains(seg) ) return nullptr;
      return &n.at( seg );
    }
    if ( allow_index && n.is_sequence() ) {
      auto idx = parse_index( seg );
      if ( !idx || *idx >= n.size() ) return nullptr;
      return &n.at( *idx );
    }
    return nullptr;
  }

  // Like child_of, but tells a missing property apart from a path that
  // cannot be followed at all (used by erase)
  inline ordered_node& child_or_throw( ordered_node& n, const std::string& seg,
    const Path& path )
  {
    if ( n.is_mapping() ) {
      if ( !n.contains(seg) ) throw Error::property_not_found( path.text() );
      return n.at( seg );
    }
    if ( n.is_sequence() && path.is_pointer() ) {
      auto idx = parse_index( seg );
      if ( !idx ) {
        std::ostringstream oss;
        oss << "Path '" << path.text() << "': segment '" << seg
          << "' is not a valid array index";
        throw Error::custom( oss.str() );
      }
      if ( *idx >= n.size() ) throw Error::property_not_found( path.text() );
      return n.at( *idx );
    }
    if ( !path.is_pointer() ) {
      throw Error::custom( "Value is not an Object, cannot address '"
        + path.text() + "'" );
    }
    throw Error::custom( "Path '" + path.text()
      + "' does not point to an Object or Array" );
  }

  // String keys of a mapping, in iteration order
  inline std::vector< std::string > key_snapshot( const ordered_node& map ) {
    std::vector< std::string > keys;
    keys.reserve( map.size() );
    for ( const auto& [mk, mv] : map.map_items() ) {
      if ( mk.is_string() ) keys.push_back( mk.get_value< std::string >() );
    }
    return keys;
  }

  // Remove one key from a mapping, keeping the order of the others, and
  // hand back its value. The mapping is rebuilt since ordered_map entries
  // hold const keys and cannot be shifted in place.
  inline ordered_node erase_key( ordered_node& map, const std::string& key ) {
    ordered_node removed;
    ordered_node kept = ordered_node::mapping();
    for ( auto& entry : map.as_map() ) {
      if ( entry.first.is_string() && entry.first.as_str() == key ) {
        removed = std::move( entry.second );
        continue;
      }
      kept.as_map().emplace_back( entry.first, std::move(entry.second) );
    }
    map = std::move( kept );
    return removed;
  }

  // Overwrite (or append) a mapping entry whose key may be any node
  inline void set_entry( ordered_node& map, const ordered_node& key,
    const ordered_node& value )
  {
    for ( auto& entry : map.as_map() ) {
      if ( entry.first == key ) {
        entry.second = value;
        return;
      }
    }
    map.as_map().emplace_back( key, value );
  }

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

  template < typename T >
  struct is_vector : std::false_type {};

  template < typename E, typename A >
  struct is_vector< std::vector< E, A > > : std::true_type {};

  // Name of the kind an owned extraction asked for. Uses the same names as
  // the coercion targets below.
  template < typename T >
  inline std::string expected_kind() {
    if constexpr ( std::is_same_v< T, bool > ) return "bool";
    else if constexpr ( std::is_same_v< T, std::int64_t > ) return "int64";
    else if constexpr ( std::is_same_v< T, std::int32_t > ) return "int32";
    else if constexpr ( std::is_same_v< T, std::uint32_t > ) return "uint32";
    else if constexpr ( std::is_integral_v< T > ) return "integer";
    else if constexpr ( std::is_same_v< T, double > ) return "double";
    else if constexpr ( std::is_floating_point_v< T > ) return "float";
    else if constexpr ( std::is_same_v< T, std::string > ) return "string";
    else if constexpr ( is_vector< T >::value ) {
      if constexpr ( std::is_same_v< typename T::value_type, std::string > ) {
        return "array of strings";
      }
      else return "array";
    }
    else return "structured value";
  }

  // fkYAML converts freely between scalar kinds (null to 0, 1.5 to 1,
  // 42 to true). Owned extraction only accepts the node kind holding a T;
  // integers still widen to floating point.
  template < typename T >
  inline bool shape_matches( const ordered_node& n ) {
    if constexpr ( std::is_same_v< T, bool > ) return n.is_boolean();
    else if constexpr ( std::is_integral_v< T > ) return n.is_integer();
    else if constexpr ( std::is_floating_point_v< T > ) {
      return n.is_integer() || n.is_float_number();
    }
    else if constexpr ( std::is_same_v< T, std::string > ) return n.is_string();
    else if constexpr ( is_vector< T >::value ) {
      if ( !n.is_sequence() ) return false;
      for ( const auto& el : n.as_seq() ) {
        if ( !shape_matches< typename T::value_type >(el) ) return false;
      }
      return true;
    }
    else return true;
  }

  // Owned extraction of a T from a node. fkYAML type errors are reported
  // against the caller's path, anything else it throws is a codec failure.
  template < typename T >
  inline T convert( const ordered_node& n, const Path& path ) {
    if constexpr ( std::is_same_v< T, ordered_node > ) {
      return n;
    }
    else {
      if ( !shape_matches< T >(n) ) {
        throw Error::property_value_not_of_type( path.text(),
          expected_kind< T >() );
      }
      try {
        return to_native_checked< T >( n );
      }
      catch ( const fkyaml::type_error& ) {
        throw Error::property_value_not_of_type( path.text(),
          expected_kind< T >() );
      }
      catch ( const fkyaml::exception& ex ) {
        throw Error::codec( ex.what() );
      }
    }
  }

  template < typename T >
  inline T convert( ordered_node&& n, const Path& path ) {
    if constexpr ( std::is_same_v< T, ordered_node > ) {
      return std::move( n );
    }
    else {
      return convert< T >( static_cast< const ordered_node& >(n), path );
    }
  }

  // Build a node from an arbitrary input for insertion
  template < typename T >
  inline ordered_node to_node( T&& value ) {
    using U = std::decay_t< T >;
    if constexpr ( std::is_same_v< U, ordered_node > ) {
      return std::forward< T >( value );
    }
    else if constexpr ( std::is_convertible_v< const U&, std::string_view > ) {
      // String literals, const char* and friends
      return make_node_from( std::string(std::string_view(value)) );
    }
    else {
      try {
        return make_node_from< U >( value );
      }
      catch ( const fkyaml::exception& ex ) {
        throw Error::codec( ex.what() );
      }
    }
  }

  // Range-checked narrowing of an integer node. Floats never qualify.
  template < typename Int >
  inline std::optional< Int > narrow_integer( const ordered_node& n ) {
    if ( !n.is_integer() ) return std::nullopt;
    const std::int64_t v = n.get_value< std::int64_t >();
    if constexpr ( std::is_signed_v< Int > ) {
      if ( v < static_cast< std::int64_t >(std::numeric_limits< Int >::min())
        || v > static_cast< std::int64_t >(std::numeric_limits< Int >::max()) )
      {
        return std::nullopt;
      }
    }
    else {
      if ( v < 0 || static_cast< std::uint64_t >(v)
        > static_cast< std::uint64_t >(std::numeric_limits< Int >::max()) )
      {
        return std::nullopt;
      }
    }
    return static_cast< Int >( v );
  }

  // Coercion targets. Each specialization names the kind it produces and
  // tries to produce it from a node without copying strings or arrays.
  // There is no primary definition: asking for any other T does not compile.
  template < typename T >
  struct coercion;

  template <>
  struct coercion< std::string_view > {
    static constexpr const char* kind = "string";
    static std::optional< std::string_view > try_from( const ordered_node& n ) {
      if ( !n.is_string() ) return std::nullopt;
      return std::string_view( n.as_str() );
    }
  };

  template <>
  struct coercion< double > {
    static constexpr const char* kind = "double";
    static std::optional< double > try_from( const ordered_node& n ) {
      if ( n.is_float_number() ) return n.get_value< double >();
      if ( n.is_integer() ) {
        return static_cast< double >( n.get_value< std::int64_t >() );
      }
      return std::nullopt;
    }
  };

  template <>
  struct coercion< std::int64_t > {
    static constexpr const char* kind = "int64";
    static std::optional< std::int64_t > try_from( const ordered_node& n ) {
      if ( !n.is_integer() ) return std::nullopt;
      return n.get_value< std::int64_t >();
    }
  };

  template <>
  struct coercion< std::int32_t > {
    static constexpr const char* kind = "int32";
    static std::optional< std::int32_t > try_from( const ordered_node& n ) {
      return narrow_integer< std::int32_t >( n );
    }
  };

  template <>
  struct coercion< std::uint32_t > {
    static constexpr const char* kind = "uint32";
    static std::optional< std::uint32_t > try_from( const ordered_node& n ) {
      return narrow_integer< std::uint32_t >( n );
    }
  };

  template <>
  struct coercion< bool > {
    static constexpr const char* kind = "bool";
    static std::optional< bool > try_from( const ordered_node& n ) {
      if ( !n.is_boolean() ) return std::nullopt;
      return n.get_value< bool >();
    }
  };

  template <>
  struct coercion< node_array_ref > {
    static constexpr const char* kind = "array";
    static std::optional< node_array_ref > try_from( const ordered_node& n ) {
      if ( !n.is_sequence() ) return std::nullopt;
      return std::cref( n.as_seq() );
    }
  };

  // All-or-nothing: the first non-string element fails the whole array
  template <>
  struct coercion< std::vector< std::string_view > > {
    static constexpr const char* kind = "array of strings";
    static std::optional< std::vector< std::string_view > > try_from(
      const ordered_node& n )
    {
      if ( !n.is_sequence() ) return std::nullopt;
      std::vector< std::string_view > out;
      out.reserve( n.size() );
      for ( const auto& el : n.as_seq() ) {
        if ( !el.is_string() ) return std::nullopt;
        out.emplace_back( el.as_str() );
      }
      return out;
    }
  };

  // Optional targets always succeed. A node of the wrong kind comes back
  // as an empty optional, so "absent" and "mismatched" look the same here.
  template < typename T >
  struct coercion< std::optional< T > > {
    static constexpr const char* kind = coercion< T >::kind;
    static std::optional< std::optional< T > > try_from( const ordered_node& n ) {
      return std::optional< std::optional< T > >( std::in_place,
        coercion< T >::try_from(n) );
    }
  };

} // namespace valex::internal

  // PathResolver

  // Read-only lookup; nullptr when the path does not resolve
  inline const ordered_node* find( const ordered_node& root, const Path& path ) {
    const ordered_node* current = &root;
    for ( const auto& seg : path.segments() ) {
      current = internal::child_of( *current, seg, path.is_pointer() );
      if ( !current ) return nullptr;
    }
    return current;
  }

  inline ordered_node* find( ordered_node& root, const Path& path ) {
    ordered_node* current = &root;
    for ( const auto& seg : path.segments() ) {
      current = internal::child_of( *current, seg, path.is_pointer() );
      if ( !current ) return nullptr;
    }
    return current;
  }

  inline const ordered_node& locate( const ordered_node& root,
    const Path& path )
  {
    const ordered_node* n = find( root, path );
    if ( !n ) throw Error::property_not_found( path.text() );
    return *n;
  }

  inline ordered_node& locate( ordered_node& root, const Path& path ) {
    ordered_node* n = find( root, path );
    if ( !n ) throw Error::property_not_found( path.text() );
    return *n;
  }

  // Swap a null into the addressed slot and return what was there
  inline ordered_node detach( ordered_node& root, const Path& path ) {
    ordered_node& slot = locate( root, path );
    ordered_node out = std::move( slot );
    slot = ordered_node();
    return out;
  }

  // Delete the addressed object key or array element (later elements
  // shift left) and return its value
  inline ordered_node erase( ordered_node& root, const Path& path );

  // Write a value at the path, creating missing intermediate objects.
  // Whatever was at the final segment is overwritten. Objects created
  // before a failing segment are left in place.
  inline void assign( ordered_node& root, const Path& path,
    ordered_node value );

  // TypeCoercion

  template < typename T >
  inline T as( const ordered_node& n ) {
    auto out = internal::coercion< T >::try_from( n );
    if ( !out ) throw Error::value_not_of_type( internal::coercion< T >::kind );
    return std::move( *out );
  }

  // TreeWalker

  // Breadth-first walk over every object reachable from root. For each
  // object the callback is called as callback( object, key ) once per key
  // present when the object is dequeued (later edits do not change that
  // list). The callback may edit the object it is handed and nothing
  // else in the tree. Returning false stops the whole walk at once.
  // The children enqueued afterward are the object's values as they stand
  // once all its keys have been visited.
  //
  // Returns true if the walk ran to completion, false if it was stopped.
  template < typename Callback >
  inline bool walk( ordered_node& root, Callback&& callback );

  // ValueOps

  inline ordered_node new_object() {
    return ordered_node::mapping();
  }

  // Owned copy of the value at path, converted with fkYAML
  template < typename T >
  inline T get( const ordered_node& root, const Path& path ) {
    return internal::convert< T >( locate(root, path), path );
  }

  // Borrowed or primitive view of the value at path. String and array
  // results point into root and live as long as that node is unchanged.
  template < typename T >
  inline T get_as( const ordered_node& root, const Path& path ) {
    auto out = internal::coercion< T >::try_from( locate(root, path) );
    if ( !out ) {
      throw Error::property_value_not_of_type( path.text(),
        internal::coercion< T >::kind );
    }
    return std::move( *out );
  }

  // Take the value out, leaving null behind
  template < typename T >
  inline T take( ordered_node& root, const Path& path ) {
    return internal::convert< T >( detach(root, path), path );
  }

  // Take the value out and delete its slot
  template < typename T >
  inline T remove( ordered_node& root, const Path& path ) {
    return internal::convert< T >( erase(root, path), path );
  }

  template < typename T >
  inline void insert( ordered_node& root, const Path& path, T&& value ) {
    assign( root, path, internal::to_node(std::forward< T >(value)) );
  }

  // Shallow merge: keys of patch overwrite same-named keys of target, nested
  // objects are replaced rather than merged. A null patch does nothing.
  inline void merge( ordered_node& target, const ordered_node& patch );

  inline bool contains( const ordered_node& root, const Path& path ) {
    return find( root, path ) != nullptr;
  }

  // Indented text of the tree as written by the fkYAML serializer, i.e.
  // YAML block style rather than JSON
  inline std::string pretty( const ordered_node& n );

  inline ordered_node parse( const std::string& text );
  inline ordered_node parse( std::istream& in );

} // namespace valex

// Error member function definitions

inline valex::Error::Error( ErrorKind kind, const std::string& what,
  std::string path, std::string expected )
  : std::runtime_error( what ), kind_( kind ), path_( std::move(path) ),
    expected_( std::move(expected) ) {}

inline valex::Error valex::Error::custom( const std::string& msg ) {
  return Error( ErrorKind::Custom, msg );
}

inline valex::Error valex::Error::property_not_found(
  const std::string& path )
{
  return Error( ErrorKind::PropertyNotFound,
    "Property not found: '" + path + "'", path );
}

inline valex::Error valex::Error::property_value_not_of_type(
  const std::string& path, const std::string& expected )
{
  std::ostringstream oss;
  oss << "Property '" << path << "' is not of type '" << expected << "'";
  return Error( ErrorKind::PropertyValueNotOfType, oss.str(), path, expected );
}

inline valex::Error valex::Error::value_not_of_type(
  const std::string& expected )
{
  return Error( ErrorKind::ValueNotOfType,
    "Value is not of type '" + expected + "'", std::string(), expected );
}

inline valex::Error valex::Error::codec( const std::string& detail ) {
  return Error( ErrorKind::Codec, "Node conversion failed: " + detail );
}

// Path member function definitions

inline valex::Path::Path( const std::string& text )
  : text_( text ),
    pointer_( !text.empty() && text.front() == internal::POINTER_DELIMITER ),
    segments_( pointer_ ? internal::split_segments( text )
      : std::vector< std::string >{ text } ) {}

// PathResolver definitions

inline valex::ordered_node valex::erase( ordered_node& root,
  const Path& path )
{
  const std::vector< std::string >& segs = path.segments();

  // Parent of the final segment; every step must exist
  ordered_node* parent = &root;
  for ( size_t i = 0; i + 1 < segs.size(); ++i ) {
    parent = &internal::child_or_throw( *parent, segs[i], path );
  }

  const std::string& last = segs.back();
  if ( parent->is_mapping() ) {
    if ( !parent->contains(last) ) throw Error::property_not_found( path.text() );
    return internal::erase_key( *parent, last );
  }

  // Throws unless parent is an array and last a valid index into it
  ordered_node& victim = internal::child_or_throw( *parent, last, path );
  const std::size_t idx = *internal::parse_index( last );

  ordered_node out = std::move( victim );
  node_array& seq = parent->as_seq();
  seq.erase( seq.begin() + static_cast< std::ptrdiff_t >(idx) );
  return out;
}

inline void valex::assign( ordered_node& root, const Path& path,
  ordered_node value )
{
  const std::vector< std::string >& segs = path.segments();

  // Add the missing parents. Arrays are never extended.
  ordered_node* current = &root;
  for ( size_t i = 0; i + 1 < segs.size(); ++i ) {
    if ( !current->is_mapping() ) {
      throw Error::custom( "Path '" + path.text()
        + "' does not point to an Object" );
    }
    if ( !current->contains(segs[i]) ) {
      ( *current )[ segs[i] ] = ordered_node::mapping();
    }
    current = &current->at( segs[i] );
  }

  if ( !current->is_mapping() ) {
    if ( path.is_pointer() ) {
      throw Error::custom( "Path '" + path.text()
        + "' does not point to an Object" );
    }
    throw Error::custom( "Value is not an Object, cannot insert '"
      + path.text() + "'" );
  }
  ( *current )[ segs.back() ] = std::move( value );
}

// TreeWalker definition

template < typename Callback >
inline bool valex::walk( ordered_node& root, Callback&& callback ) {
  // Pointers stay valid: a callback only edits the object being visited,
  // and that object's children are queued after its last callback
  std::deque< ordered_node* > queue;
  queue.push_back( &root );

  while ( !queue.empty() ) {
    ordered_node* current = queue.front();
    queue.pop_front();

    if ( current->is_mapping() ) {
      const std::vector< std::string > keys = internal::key_snapshot( *current );
      for ( const auto& key : keys ) {
        if ( !callback(*current, key) ) return false;
      }

      // The callback may have replaced the object outright
      if ( !current->is_mapping() ) continue;
      for ( auto& entry : current->as_map() ) {
        if ( entry.second.is_mapping() || entry.second.is_sequence() ) {
          queue.push_back( &entry.second );
        }
      }
    }
    else if ( current->is_sequence() ) {
      for ( auto& el : current->as_seq() ) {
        if ( el.is_mapping() || el.is_sequence() ) queue.push_back( &el );
      }
    }
  }
  return true;
}

// ValueOps definitions

inline void valex::merge( ordered_node& target, const ordered_node& patch ) {
  if ( !target.is_mapping() ) {
    throw Error::custom( "Value is not an Object, cannot merge into it" );
  }
  if ( patch.is_null() ) return;
  if ( !patch.is_mapping() ) {
    throw Error::custom( "Merge argument is not an Object" );
  }

  // Overlay wins on conflicts; no recursion into nested objects
  for ( const auto& [mk, mv] : patch.map_items() ) {
    internal::set_entry( target, mk, mv );
  }
}

inline std::string valex::pretty( const ordered_node& n ) {
  try {
    return ordered_node::serialize( n );
  }
  catch ( const fkyaml::exception& ex ) {
    throw Error::codec( ex.what() );
  }
}

inline valex::ordered_node valex::parse( const std::string& text ) {
  try {
    return ordered_node::deserialize( text );
  }
  catch ( const fkyaml::exception& ex ) {
    throw Error::codec( ex.what() );
  }
}

// Read from an input stream until end-of-file, then parse the result
inline valex::ordered_node valex::parse( std::istream& in ) {
  std::ostringstream ss;
  ss << in.rdbuf();
  return parse( ss.str() );
}
