#pragma once


/*
    ---------------------------------------------
    Strophe JSON text layer - parse(...) / dump(...)
    ---------------------------------------------
    The text side of the structural codec. Records built by the tagged
    codec are turned into JSON text here and parsed back from it.

    - Parsing:
        * `std::expected<value, ParseError> parse(std::string_view, const ParseOptions& = {})`
        * `std::expected<value, ParseError> parse(std::istream&, const ParseOptions& = {})`
        * Strict RFC 8259: no comments, no trailing commas, UTF-8 validated
        * Numbers without fraction or exponent that fit `std::int64_t`
          become integers; everything else becomes a double
        * Duplicate object keys: the last one wins, in the first one's position
    - Writing:
        * `std::string dump(const value&)`
        * `void dump(const value&, std::ostream&)`
        * Always compact; object members in insertion order
        * Doubles use the shortest representation that round-trips;
          NaN and infinities are written as `null`
*/

/// @defgroup StropheJson Parsing and Writing
/// @ingroup Strophe
/// @brief Free functions converting between JSON text and `Strophe::value`

#include <expected>
#include <iosfwd>
#include <string>
#include <string_view>

#include "strophe/value.hpp"
#include "strophe/error.hpp"
#include "strophe/options.hpp"

namespace Strophe {

    /// @ingroup StropheJson
    /// @brief Result of every `parse(...)` overload
    using ParseResult = std::expected<value, ParseError>;

    /// @ingroup StropheJson
    /// @brief Parses a JSON document from a string view
    ///
    /// Example:
    /// @code
    /// auto res = Strophe::parse(R"({"tag":"A","name":"Class A"})");
    /// if (!res) std::println("{}", res.error().msg);
    /// @endcode
    [[nodiscard]] STROPHE_API ParseResult parse(std::string_view input, const ParseOptions& opts = {});

    /// @ingroup StropheJson
    /// @brief Reads the whole stream and parses it as one JSON document
    [[nodiscard]] STROPHE_API ParseResult parse(std::istream& is, const ParseOptions& opts = {});

    /// @ingroup StropheJson
    /// @brief Serializes a value to compact JSON text
    [[nodiscard]] STROPHE_API std::string dump(const value& v);

    /// @ingroup StropheJson
    /// @brief Serializes a value to compact JSON text on @p os
    STROPHE_API void dump(const value& v, std::ostream& os);

} // namespace Strophe
