#include "strophe/error.hpp"

#include <format>

namespace Strophe {

    ParseError ParseError::make(code c, std::size_t o, std::size_t l, std::size_t col, std::string_view m) {
        ParseError e;
        e.errc = c;
        e.offset = o;
        e.line = l;
        e.column = col;
        e.msg.assign(m.begin(), m.end());
        return e;
    }

    CodecError CodecError::make(code c, std::string_view tagged_type, std::string_view tag, std::string_view m) {
        CodecError e;
        e.errc = c;
        e.tagged_type.assign(tagged_type.begin(), tagged_type.end());
        e.tag.assign(tag.begin(), tag.end());
        e.msg.assign(m.begin(), m.end());
        return e;
    }

    std::string_view to_string(CodecError::code c) noexcept {
        switch (c) {
        case CodecError::code::duplicate_tag: return "duplicate_tag";
        case CodecError::code::not_a_sum_type: return "not_a_sum_type";
        case CodecError::code::unknown_variant: return "unknown_variant";
        case CodecError::code::unresolvable_variant: return "unresolvable_variant";
        case CodecError::code::missing_singleton: return "missing_singleton";
        case CodecError::code::malformed_record: return "malformed_record";
        case CodecError::code::reserved_property: return "reserved_property";
        case CodecError::code::malformed_input: return "malformed_input";
        }
        return "unknown";
    }

    std::string_view to_string(ParseError::code c) noexcept {
        switch (c) {
        case ParseError::code::unexpected_character: return "unexpected_character";
        case ParseError::code::invalid_number: return "invalid_number";
        case ParseError::code::invalid_string: return "invalid_string";
        case ParseError::code::invalid_escape: return "invalid_escape";
        case ParseError::code::invalid_unicode_escape: return "invalid_unicode_escape";
        case ParseError::code::unexpected_end_of_input: return "unexpected_end_of_input";
        case ParseError::code::trailing_characters: return "trailing_characters";
        case ParseError::code::depth_limit_exceeded: return "depth_limit_exceeded";
        }
        return "unknown";
    }

    std::string describe(const CodecError& e) {
        if (e.tag.empty()) return std::format("{} in {}: {}", to_string(e.errc), e.tagged_type, e.msg);
        return std::format("{} in {} (tag '{}'): {}", to_string(e.errc), e.tagged_type, e.tag, e.msg);
    }

} // namespace Strophe
