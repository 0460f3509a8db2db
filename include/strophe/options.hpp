#pragma once


/*
    ---------------------------------
    Strophe parsing and codec options
    ---------------------------------
    This header defines the configuration structures of the text layer and
    of the tagged codec. All of them are plain aggregates suitable for
    brace-initialization; there are no global switches

    ----------------------------------------
    Parsing Options - Strophe::ParseOptions
    ----------------------------------------
    `ParseOptions` tunes how `Strophe::parse(...)` behaves:

    - `size_t max_depth`:
        * Optional limit on nesting depth of arrays/objects
        * If exceeded, the parser fails with `depth_limit_exceeded`
        * A value of 0 is treated as no explicit limit

    ----------------------------------------
    Codec Options - Strophe::TaggedOptions
    ----------------------------------------
    `TaggedOptions` configures one `Strophe::TaggedCodec<T>`:

    - `TagResolver resolver`:
        * Naming strategy producing each variant's tag
        * Required; an empty resolver makes the registry build fail
    - `TagPlacement placement`:
        * `wrapping` (default): the codec writes the tag in front of the
          variant's own fields
        * `existing_property`: the tag is a real property the variant
          writes itself; the codec keeps it consistent with the registry
        * One placement per codec; the two are never mixed
    - `std::string tag_property`:
        * Name of the record property carrying the tag, `"tag"` by default
    - `std::string type_name`:
        * Name of the Tagged Type in diagnostics and logs
        * Empty means the demangled C++ type name
    - `ParseOptions parse`:
        * Used by `TaggedCodec::read` and `read_sequence`

    -----
    Usage
    -----
        Strophe::TaggedOptions opts{ .resolver = Strophe::tag_resolvers::simple_name() };
        Strophe::TaggedCodec<Shape> codec{ opts };
*/


#include <cstddef>
#include <cstdint>
#include <string>

#include "strophe/config.hpp"
#include "strophe/tag_resolver.hpp"

/// @defgroup StropheOptions Parsing and Codec Options
/// @ingroup Strophe
/// @brief Configuration objects controlling parsing and the tagged codec

namespace Strophe {

    /// @ingroup StropheOptions
    /// @brief Configuration controlling JSON parsing behavior
    ///
    /// @details
    /// The parser is always strict RFC 8259.
    ///
    /// `max_depth`
    ///   - Maximum allowed nesting depth of arrays/objects.
    ///   - A value of `0` means "no explicit depth limit"
    ///   - If the nesting depth exceeds this limit during parsing, a
    ///     `ParseError` with code `depth_limit_exceeded` is returned.
    struct ParseOptions {
        std::size_t max_depth = 0; ///< Maximum allowed nesting depth (0 = unlimited)
    };

    /// @ingroup StropheOptions
    /// @brief Where a record carries its variant's tag
    enum class TagPlacement : std::uint8_t {
        wrapping,          ///< Injected by the codec before the variant's fields
        existing_property, ///< A genuine property written by the variant itself
    };

    /// @ingroup StropheOptions
    /// @brief Configuration of one `TaggedCodec`
    struct TaggedOptions {
        TagResolver resolver{};                                ///< Naming strategy (required)
        TagPlacement placement = TagPlacement::wrapping;       ///< Tag placement for every variant
        std::string tag_property = STROPHE_DEFAULT_TAG_PROPERTY; ///< Record property holding the tag
        std::string type_name{};                               ///< Diagnostic name of the Tagged Type
        ParseOptions parse{};                                  ///< Options for `read` / `read_sequence`
    };

} // namespace Strophe
