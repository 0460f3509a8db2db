#pragma once


/*
    -------------------------------------------------
    Strophe errors - parse, conversion and codec failures
    -------------------------------------------------
    Three failure channels exist, one per layer:

    - `Strophe::ParseError`
        * Produced by `Strophe::parse(...)` when text is not valid JSON
        * Carries a code plus byte offset, line and column of the failure
    - `Strophe::convert_error`
        * Thrown by the builtin `from_json` conversions when a JSON value
          has the wrong kind or does not fit the target type
        * User-defined `from_json` functions may throw it as well
    - `Strophe::CodecError`
        * Returned by the tagged codec and the variant registry inside
          `std::expected<T, CodecError>`
        * Names the Tagged Type and, where one is involved, the tag, so a
          failure can be diagnosed from the error alone

    -------------------
    CodecError taxonomy
    -------------------
    - `duplicate_tag`        two variants of one Tagged Type share a tag (build time)
    - `not_a_sum_type`       the type's variant set cannot be enumerated (build time)
    - `unknown_variant`      a record names a tag the registry does not know (decode)
    - `unresolvable_variant` a value or variant has no tag (encode, programmer error)
    - `missing_singleton`    a singleton variant has no canonical instance (decode)
    - `malformed_record`     the record or its fields do not have the expected shape
    - `reserved_property`    a wrapped variant writes a field named like the tag property
    - `malformed_input`      the JSON text itself failed to parse

    None of these are retried; every operation is deterministic
*/

#include <cstddef>
#include <cstdint>
#include <expected>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "strophe/config.hpp"


/// @defgroup StropheError Errors
/// @ingroup Strophe
/// @brief Error codes and structures produced by parsing and the tagged codec
namespace Strophe {

    /// @ingroup StropheError
    /// @brief Structured error information produced during JSON parsing.
    ///
    /// @details
    /// Each error contains:
    ///
    /// - **errc** — a classification of the error (syntax/format issue)
    /// - **offset** — byte offset from the start of input where the error occurred
    /// - **line** — 1-based line number of the error position
    /// - **column** — 1-based column number (UTF-8 byte offset within the line)
    /// - **msg** — human-readable explanation of the error
    struct ParseError {
        /// @ingroup StropheError
        /// @brief Enumeration of possible error categories detected by the parser.
        enum class code : std::uint8_t {
            unexpected_character,   ///< Invalid or unexpected character.
            invalid_number,         ///< Malformed numeric literal.
            invalid_string,         ///< Malformed string literal or invalid UTF-8.
            invalid_escape,         ///< Invalid escape sequence.
            invalid_unicode_escape, ///< Invalid or malformed Unicode escape.
            unexpected_end_of_input,///< Input ended prematurely.
            trailing_characters,    ///< Extra characters after valid JSON.
            depth_limit_exceeded,   ///< Maximum depth limit exceeded.
        };

        code errc{};          ///< The classification of the parsing error.
        std::size_t offset{}; ///< Byte offset from the beginning of the input.
        std::size_t line{};   ///< Line number where the error occurred (1-based).
        std::size_t column{}; ///< Column number where the error occurred (1-based).
        std::string msg{};    ///< Human-readable diagnostic message.

        /// @brief Constructs a fully-populated `ParseError` instance.
        [[nodiscard]] STROPHE_API static ParseError make(code c, std::size_t o, std::size_t l, std::size_t col, std::string_view m);
    };

    /// @ingroup StropheError
    /// @brief Thrown by `from_json` conversions on a kind or range mismatch
    class convert_error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /// @ingroup StropheError
    /// @brief Failure reported by the variant registry and the tagged codec
    struct CodecError {
        enum class code : std::uint8_t {
            duplicate_tag,
            not_a_sum_type,
            unknown_variant,
            unresolvable_variant,
            missing_singleton,
            malformed_record,
            reserved_property,
            malformed_input,
        };

        code errc{};              ///< Failure category
        std::string tagged_type{}; ///< Name of the Tagged Type involved
        std::string tag{};         ///< Tag involved, empty when none applies
        std::string msg{};         ///< Human-readable diagnostic message

        [[nodiscard]] STROPHE_API static CodecError make(code c, std::string_view tagged_type, std::string_view tag, std::string_view m);
    };

    /// @ingroup StropheError
    /// @brief Result type of every fallible codec and registry operation
    template<class T>
    using CodecResult = std::expected<T, CodecError>;

    namespace detail {
        /// @brief Runs a field conversion, turning its exceptions into `malformed_record`
        template<class F>
        std::expected<void, CodecError> capture_field_errors(F&& f, std::string_view tagged_type, std::string_view tag) {
            using enum CodecError::code;
            try {
                std::forward<F>(f)();
                return {};
            } catch (const convert_error& e) {
                return std::unexpected{ CodecError::make(malformed_record, tagged_type, tag, e.what()) };
            } catch (const std::out_of_range& e) {
                return std::unexpected{ CodecError::make(malformed_record, tagged_type, tag, e.what()) };
            } catch (const std::bad_variant_access& e) {
                return std::unexpected{ CodecError::make(malformed_record, tagged_type, tag, e.what()) };
            }
        }
    } // namespace detail

    /// @ingroup StropheError
    /// @brief Stable identifier of a codec error code, e.g. `"unknown_variant"`
    [[nodiscard]] STROPHE_API std::string_view to_string(CodecError::code c) noexcept;

    /// @ingroup StropheError
    /// @brief Stable identifier of a parse error code, e.g. `"invalid_number"`
    [[nodiscard]] STROPHE_API std::string_view to_string(ParseError::code c) noexcept;

    /// @ingroup StropheError
    /// @brief One-line diagnostic: code, Tagged Type, tag and message
    [[nodiscard]] STROPHE_API std::string describe(const CodecError& e);

} // namespace Strophe
