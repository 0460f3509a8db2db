#pragma once


/*
    ---------------------------------------
    Strophe tag resolvers - naming strategies
    ---------------------------------------
    A tag resolver maps a `VariantDescriptor` to the tag written on the wire.
    It must be deterministic and injective over one Tagged Type's variants;
    the registry rejects a resolver that is not.

    The codec has no built-in default. `Strophe::tag_resolvers` offers:

    - `simple_name()`      `shapes::A` -> `"A"`
    - `qualified_name()`   `shapes::A` -> `"shapes::A"`
    - `explicit_tags(...)` a fixed table keyed by variant type
    - `index()`            the alternative's position, `"0"`, `"1"`, ...
                           Only stable while the alternatives keep their order
*/

#include <functional>
#include <map>
#include <string>
#include <typeindex>
#include <typeinfo>

#include "strophe/config.hpp"
#include "strophe/sum_type.hpp"

/// @defgroup StropheTagResolver Tag Resolvers
/// @ingroup Strophe
/// @brief Pluggable strategies naming each variant of a Tagged Type

namespace Strophe {

    /// @ingroup StropheTagResolver
    /// @brief Pure function from a variant's description to its tag
    using TagResolver = std::function<std::string(const VariantDescriptor&)>;

    namespace tag_resolvers {

        /// @ingroup StropheTagResolver
        /// @brief The variant's local name, without enclosing namespaces or classes
        [[nodiscard]] STROPHE_API TagResolver simple_name();

        /// @ingroup StropheTagResolver
        /// @brief The variant's fully qualified demangled name
        [[nodiscard]] STROPHE_API TagResolver qualified_name();

        /// @ingroup StropheTagResolver
        /// @brief Looks the variant up in a fixed table
        ///
        /// @details
        /// A variant missing from @p tags resolves to an empty tag, which
        /// makes the registry build fail with `unresolvable_variant`.
        /// For a `singleton_ref<S>` alternative the key is `typeid(S)`.
        [[nodiscard]] STROPHE_API TagResolver explicit_tags(std::map<std::type_index, std::string> tags);

        /// @ingroup StropheTagResolver
        /// @brief The alternative's zero-based position, in decimal
        [[nodiscard]] STROPHE_API TagResolver index();

    } // namespace tag_resolvers

    /// @ingroup StropheTagResolver
    /// @brief Gives a variant a `tag()` property matching `tag_resolvers::simple_name()`
    ///
    /// @details
    /// For Tagged Types encoded with `TagPlacement::existing_property`:
    /// @code
    /// struct A : Strophe::SimpleNameTagged<A> { std::string name; };
    ///
    /// void to_json(Strophe::value& v, const A& a) {
    ///     v["tag"] = a.tag();
    ///     v["name"] = a.name;
    /// }
    /// @endcode
    template<class Derived>
    struct SimpleNameTagged {
        [[nodiscard]] std::string tag() const {
            return std::string{ Strophe::simple_name(demangle(typeid(Derived))) };
        }
    };

} // namespace Strophe
