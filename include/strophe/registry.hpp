#pragma once


/*
    ----------------------------------------
    Strophe::VariantRegistry - Tag <-> Variant
    ----------------------------------------
    A bijective mapping between the tags of one Tagged Type and its
    variants, built once from a `TaggedTypeDescriptor` and a `TagResolver`.

    - Built with `VariantRegistry::build(...)`, which checks everything up
      front: enumerability, non-empty tags, tag uniqueness
    - Immutable afterwards; concurrent lookups need no synchronization
    - Tags are scoped to the Tagged Type. Two unrelated Tagged Types may
      use the same tag
*/

#include <cstddef>
#include <expected>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <typeindex>
#include <vector>

#include "strophe/config.hpp"
#include "strophe/error.hpp"
#include "strophe/sum_type.hpp"
#include "strophe/tag_resolver.hpp"

/// @defgroup StropheRegistry Variant Registry
/// @ingroup Strophe
/// @brief Build-time checked mapping between tags and variants

namespace Strophe {

    /// @ingroup StropheRegistry
    class VariantRegistry {
    public:
        /// @brief Builds the registry of @p type using @p resolver
        ///
        /// @return The registry, or
        ///   - `not_a_sum_type` if @p type is not enumerable, has no variants,
        ///     or has a variant that does not encode as a record
        ///   - `unresolvable_variant` if @p resolver is empty or yields an empty tag
        ///   - `duplicate_tag` if two variants resolve to the same tag
        [[nodiscard]] STROPHE_API static std::expected<VariantRegistry, CodecError> build(TaggedTypeDescriptor type, const TagResolver& resolver);

        /// @brief Variant registered under @p tag, or `unknown_variant`
        [[nodiscard]] STROPHE_API std::expected<const VariantDescriptor*, CodecError> resolve_tag(std::string_view tag) const;

        /// @brief Tag of the alternative at @p index, or `unresolvable_variant`
        [[nodiscard]] STROPHE_API std::expected<std::string_view, CodecError> resolve_variant(std::size_t index) const;

        /// @brief Tag of the variant of type @p type, or `unresolvable_variant`
        [[nodiscard]] STROPHE_API std::expected<std::string_view, CodecError> resolve_variant(std::type_index type) const;

        [[nodiscard]] STROPHE_API const std::string& name() const noexcept;
        [[nodiscard]] STROPHE_API std::size_t size() const noexcept;
        [[nodiscard]] STROPHE_API const std::vector<VariantDescriptor>& variants() const noexcept;
        /// @brief Tags in alternative order
        [[nodiscard]] STROPHE_API const std::vector<std::string>& tags() const noexcept;

    private:
        VariantRegistry() = default;

        std::string m_Name;
        std::vector<VariantDescriptor> m_Variants;
        std::vector<std::string> m_Tags; // parallel to m_Variants
        std::map<std::string, std::size_t, std::less<>> m_ByTag;
        std::map<std::type_index, std::size_t> m_ByType;
    };

} // namespace Strophe
