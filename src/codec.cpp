#include "strophe/codec.hpp"

#include <format>
#include <utility>

namespace Strophe::detail {

    CodecResult<value> attach_tag(value fields, std::string_view tag, const TaggedOptions& opts, std::string_view tagged_type) {
        using enum CodecError::code;
        auto* res = fields.resource();

        if (fields.is_null()) fields = value{ object{ res }, res };
        if (!fields.is_object()) {
            return std::unexpected{ CodecError::make(malformed_record, tagged_type, tag, "variant fields did not encode as a record") };
        }
        object& own = fields.as_object();

        if (opts.placement == TagPlacement::wrapping) {
            if (own.contains(opts.tag_property)) {
                return std::unexpected{ CodecError::make(reserved_property, tagged_type, tag,
                    std::format("variant writes a field named '{}', which is reserved for the tag", opts.tag_property)) };
            }
            object rec{ res };
            rec.insert_or_assign(opts.tag_property, value{ tag, res });
            for (auto& [k, v] : own) rec.insert_or_assign(k, std::move(v));
            return value{ std::move(rec), res };
        }

        if (value* existing = own.find(opts.tag_property)) {
            if (!existing->is_string() || existing->as_string() != tag) {
                logger()->warn("{}: tag property '{}' holds {}, registry resolves '{}'; writing the registry's tag",
                    tagged_type, opts.tag_property, dump(*existing), tag);
                *existing = value{ tag, res };
            }
        } else {
            own.insert_or_assign(opts.tag_property, value{ tag, res });
        }
        return fields;
    }

    CodecResult<std::string_view> read_tag(const value& record, const TaggedOptions& opts, std::string_view tagged_type) {
        using enum CodecError::code;
        if (!record.is_object()) {
            return std::unexpected{ CodecError::make(malformed_record, tagged_type, {}, "expected a record") };
        }
        const value* tag = record.find(opts.tag_property);
        if (tag == nullptr) {
            return std::unexpected{ CodecError::make(malformed_record, tagged_type, {}, std::format("record has no '{}' property", opts.tag_property)) };
        }
        if (!tag->is_string()) {
            return std::unexpected{ CodecError::make(malformed_record, tagged_type, {}, std::format("'{}' property is not a string", opts.tag_property)) };
        }
        return std::string_view{ tag->as_string() };
    }

    value strip_tag(const value& record, std::string_view tag_property) {
        auto* res = record.resource();
        object fields{ res };
        for (const auto& [k, v] : record.as_object()) {
            if (k == tag_property) continue;
            fields.insert_or_assign(k, v);
        }
        return value{ std::move(fields), res };
    }

    CodecError input_error(const ParseError& e, std::string_view tagged_type) {
        return CodecError::make(CodecError::code::malformed_input, tagged_type, {},
            std::format("{}: {} at line {}, column {}", to_string(e.errc), e.msg, e.line, e.column));
    }

} // namespace Strophe::detail
