#pragma once


/*
    ------------------------------------------
    Strophe::TaggedCodec - tagged sum-type codec
    ------------------------------------------
    Encodes values of a Tagged Type `T` into tagged records and decodes them
    back, using a `VariantRegistry` built from the codec's `TaggedOptions`.

    ------------
    Record shape
    ------------
    - `TagPlacement::wrapping`:
        {"tag":"B","name":3.14,"age":23}
      The codec writes the tag in front of the variant's own fields. A
      variant writing a field named like the tag property is rejected with
      `reserved_property`
    - `TagPlacement::existing_property`:
      The variant writes the tag itself, wherever its `to_json` puts it. The
      codec never writes it twice; a value disagreeing with the registry is
      replaced by the registry's tag (logged at warn), a missing one is
      appended

    ---------
    Lifecycle
    ---------
    - The registry is built on first use, under a lock, and published to
      every later caller. A failed build is reported to the caller and
      retried on the next call; it is never cached
    - Encoding and decoding are otherwise lock-free and read-only, except
      for the documented write into a singleton's canonical instance

    ---------
    Sequences
    ---------
    - `encode_sequence` / `decode_sequence` tag every element because the
      element type `T` is known
    - `Strophe::serialize(std::vector<T>)` goes through the untagged
      structural path instead and writes no wrapping tags

    ----------------
    Conceptual Usage
    ----------------
        using Shape = std::variant<A, B, Strophe::singleton_ref<C>>;

        Strophe::TaggedCodec<Shape> codec{ { .resolver = Strophe::tag_resolvers::simple_name() } };
        auto text = codec.write(Shape{ A{ "Class A" } });   // {"tag":"A","name":"Class A"}
        auto back = codec.read(*text);
*/

#include <cstddef>
#include <expected>
#include <format>
#include <memory>
#include <memory_resource>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

#include "strophe/config.hpp"
#include "strophe/convert.hpp"
#include "strophe/error.hpp"
#include "strophe/json.hpp"
#include "strophe/log.hpp"
#include "strophe/options.hpp"
#include "strophe/registry.hpp"
#include "strophe/singleton.hpp"
#include "strophe/sum_type.hpp"
#include "strophe/value.hpp"

/// @defgroup StropheCodec Tagged Codec
/// @ingroup Strophe
/// @brief Encoding and decoding closed sum types as tagged records

namespace Strophe {

    namespace detail {
        /// @brief Adds @p tag to the variant fields @p fields according to @p opts
        [[nodiscard]] STROPHE_API CodecResult<value> attach_tag(value fields, std::string_view tag, const TaggedOptions& opts, std::string_view tagged_type);

        /// @brief The tag carried by @p record; the view points into @p record
        [[nodiscard]] STROPHE_API CodecResult<std::string_view> read_tag(const value& record, const TaggedOptions& opts, std::string_view tagged_type);

        /// @brief Copy of the record @p record without the tag property
        [[nodiscard]] STROPHE_API value strip_tag(const value& record, std::string_view tag_property);

        /// @brief Turns a parse failure into `malformed_input`
        [[nodiscard]] STROPHE_API CodecError input_error(const ParseError& e, std::string_view tagged_type);
    } // namespace detail

    /// @ingroup StropheCodec
    /// @brief Codec for the Tagged Type @p T
    ///
    /// @tparam T A `std::variant` of record-shaped alternatives, or a single
    ///           record-shaped class decoded as a one-variant set
    template<class T>
    class TaggedCodec {
    public:
        using tagged_type = T;
        using registry_ptr = std::shared_ptr<const VariantRegistry>;

        explicit TaggedCodec(TaggedOptions opts)
            : m_Options{ std::move(opts) } {
            if (m_Options.type_name.empty()) m_Options.type_name = demangle(typeid(T));
        }

        TaggedCodec(const TaggedCodec&) = delete;
        TaggedCodec& operator=(const TaggedCodec&) = delete;

        [[nodiscard]] const TaggedOptions& options() const noexcept { return m_Options; }

        /// @brief The registry of `T`, built on first use
        [[nodiscard]] CodecResult<registry_ptr> registry() const {
            std::scoped_lock lock{ m_Mutex };
            if (m_Registry) return m_Registry;

            auto built = VariantRegistry::build(describe<T>(m_Options.type_name), m_Options.resolver);
            if (!built) return std::unexpected{ std::move(built.error()) };
            m_Registry = std::make_shared<VariantRegistry>(std::move(*built));
            return m_Registry;
        }

        /// @brief Encodes @p v as a tagged record allocated from @p res
        [[nodiscard]] CodecResult<value> encode(const T& v, std::pmr::memory_resource* res = std::pmr::get_default_resource()) const {
            auto reg = registry();
            if (!reg) return std::unexpected{ std::move(reg.error()) };
            const VariantRegistry& r = **reg;

            value fields{ res };
            std::size_t index = 0;
            if constexpr (detail::tagged_traits<T>::is_sum) {
                if (v.valueless_by_exception()) {
                    return std::unexpected{ CodecError::make(CodecError::code::unresolvable_variant, r.name(), {}, "value holds no alternative") };
                }
                index = v.index();
                std::visit([&fields](const auto& alt) { to_json(fields, alt); }, v);
            } else {
                to_json(fields, v);
            }

            auto tag = r.resolve_variant(index);
            if (!tag) return std::unexpected{ std::move(tag.error()) };
            return detail::attach_tag(std::move(fields), *tag, m_Options, r.name());
        }

        /// @brief Decodes the tagged record @p record
        [[nodiscard]] CodecResult<T> decode(const value& record) const {
            auto reg = registry();
            if (!reg) return std::unexpected{ std::move(reg.error()) };

            auto result = decode_with(**reg, record);
            if (!result) logger()->debug("{}: decode failed: {}", m_Options.type_name, Strophe::describe(result.error()));
            return result;
        }

        /// @brief Encodes every element of @p xs with its own tag
        [[nodiscard]] CodecResult<value> encode_sequence(std::span<const T> xs, std::pmr::memory_resource* res = std::pmr::get_default_resource()) const {
            value out{ array( allocator_type{ res } ), res };
            auto& arr = out.as_array();
            arr.reserve(xs.size());
            for (const T& x : xs) {
                auto rec = encode(x, res);
                if (!rec) return std::unexpected{ std::move(rec.error()) };
                arr.push_back(std::move(*rec));
            }
            return out;
        }

        /// @brief Decodes an array of tagged records
        [[nodiscard]] CodecResult<std::vector<T>> decode_sequence(const value& records) const {
            if (!records.is_array()) {
                return std::unexpected{ CodecError::make(CodecError::code::malformed_record, m_Options.type_name, {}, "expected an array of records") };
            }
            std::vector<T> out;
            out.reserve(records.size());
            for (const value& rec : records.as_array()) {
                auto v = decode(rec);
                if (!v) return std::unexpected{ std::move(v.error()) };
                out.push_back(std::move(*v));
            }
            return out;
        }

        [[nodiscard]] CodecResult<std::string> write(const T& v) const {
            return encode(v).transform([](const value& rec) { return dump(rec); });
        }

        [[nodiscard]] CodecResult<T> read(std::string_view text) const {
            auto doc = parse(text, m_Options.parse);
            if (!doc) return std::unexpected{ detail::input_error(doc.error(), m_Options.type_name) };
            return decode(*doc);
        }

        [[nodiscard]] CodecResult<std::string> write_sequence(std::span<const T> xs) const {
            return encode_sequence(xs).transform([](const value& recs) { return dump(recs); });
        }

        [[nodiscard]] CodecResult<std::vector<T>> read_sequence(std::string_view text) const {
            auto doc = parse(text, m_Options.parse);
            if (!doc) return std::unexpected{ detail::input_error(doc.error(), m_Options.type_name) };
            return decode_sequence(*doc);
        }

    private:
        CodecResult<T> decode_with(const VariantRegistry& r, const value& record) const {
            auto tag = detail::read_tag(record, m_Options, r.name());
            if (!tag) return std::unexpected{ std::move(tag.error()) };
            auto variant = r.resolve_tag(*tag);
            if (!variant) return std::unexpected{ std::move(variant.error()) };

            value stripped;
            const value* fields = &record;
            if (m_Options.placement == TagPlacement::wrapping) {
                stripped = detail::strip_tag(record, m_Options.tag_property);
                fields = &stripped;
            }

            if constexpr (detail::tagged_traits<T>::is_sum) {
                return dispatch(*fields, **variant, *tag, std::make_index_sequence<std::variant_size_v<T>>{});
            } else {
                return decode_alternative<T>(*fields, **variant, *tag);
            }
        }

        template<std::size_t... Is>
        CodecResult<T> dispatch(const value& fields, const VariantDescriptor& d, std::string_view tag, std::index_sequence<Is...>) const {
            CodecResult<T> out = std::unexpected{ CodecError::make(CodecError::code::unknown_variant, m_Options.type_name, tag, "tag resolved to no alternative") };
            auto try_one = [&]<std::size_t I>(std::integral_constant<std::size_t, I>) {
                if (d.index != I) return false;
                out = decode_alternative<std::variant_alternative_t<I, T>>(fields, d, tag)
                          .transform([](auto&& alt) { return T{ std::in_place_index<I>, std::forward<decltype(alt)>(alt) }; });
                return true;
            };
            (try_one(std::integral_constant<std::size_t, Is>{}) || ...);
            return out;
        }

        template<class A>
        CodecResult<A> decode_alternative(const value& fields, const VariantDescriptor& d, std::string_view tag) const {
            if constexpr (detail::is_singleton_ref_v<A>) {
                return SingletonGuard::restore<typename detail::singleton_of<A>::type>(fields, d, m_Options.type_name, tag);
            } else if constexpr (JsonDeserializable<A> && std::is_default_constructible_v<A>) {
                A alt{};
                auto ok = detail::capture_field_errors([&] { from_json(fields, alt); }, m_Options.type_name, tag);
                if (!ok) return std::unexpected{ std::move(ok.error()) };
                return alt;
            } else {
                return std::unexpected{ CodecError::make(CodecError::code::malformed_record, m_Options.type_name, tag,
                    std::format("variant '{}' has no from_json", d.qualified_name)) };
            }
        }

        TaggedOptions m_Options;
        mutable std::mutex m_Mutex;
        mutable registry_ptr m_Registry;
    };

} // namespace Strophe
