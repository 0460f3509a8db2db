#pragma once


/*
    ---------------------------------------------
    Strophe::SingletonGuard - canonical singletons
    ---------------------------------------------
    Decoding a singleton variant never creates a second instance. The guard
    moves each decode through two states:

    - Unwrapped: the record's fields are read with the singleton's own
      `from_json`. A copyable singleton reads them into a staging copy of
      the canonical instance; any other singleton reads them straight into
      the canonical instance
    - Canonicalized: on success the staging copy is assigned back into the
      canonical instance, and a handle to the canonical instance is returned

    Decoding therefore *restores shared state*: the canonical instance's
    fields are reset to the values in the record. For a copyable singleton
    a failed decode leaves them untouched.

    The guard takes no lock around the shared instance. Callers that
    encode and decode the same singleton from several threads synchronize
    those calls themselves.
*/

#include <expected>
#include <memory>
#include <string_view>
#include <type_traits>
#include <utility>

#include "strophe/config.hpp"
#include "strophe/convert.hpp"
#include "strophe/error.hpp"
#include "strophe/log.hpp"
#include "strophe/sum_type.hpp"
#include "strophe/value.hpp"

/// @defgroup StropheSingleton Singleton Guard
/// @ingroup Strophe
/// @brief Returning the canonical instance when decoding singleton variants

namespace Strophe {

    /// @ingroup StropheSingleton
    class SingletonGuard {
    public:
        /// @brief Canonical instance recorded in @p variant
        /// @return The instance, or `missing_singleton` when @p variant is
        ///         not a singleton or carries no canonical instance
        [[nodiscard]] STROPHE_API static std::expected<void*, CodecError> locate(const VariantDescriptor& variant, std::string_view tagged_type, std::string_view tag);

        /// @brief Applies @p fields to the canonical `S` and returns a handle to it
        template<SingletonVariant S>
        [[nodiscard]] static std::expected<singleton_ref<S>, CodecError> restore(const value& fields, const VariantDescriptor& variant, std::string_view tagged_type, std::string_view tag) {
            auto located = locate(variant, tagged_type, tag);
            if (!located) return std::unexpected{ std::move(located.error()) };

            S* canonical = static_cast<S*>(*located);
            if (canonical != std::addressof(S::instance())) {
                return std::unexpected{ CodecError::make(CodecError::code::missing_singleton, tagged_type, tag, "registered instance is not the canonical one") };
            }

            if constexpr (JsonDeserializable<S>) {
                auto applied = detail::capture_field_errors([&] {
                    if constexpr (std::is_copy_constructible_v<S> && std::is_copy_assignable_v<S>) {
                        S staged{ *canonical };
                        from_json(fields, staged);
                        *canonical = std::move(staged);
                    } else {
                        from_json(fields, *canonical);
                    }
                }, tagged_type, tag);
                if (!applied) return std::unexpected{ std::move(applied.error()) };
                logger()->debug("{}: restored singleton '{}'", tagged_type, tag);
            }
            return singleton_ref<S>{ *canonical };
        }
    };

} // namespace Strophe
