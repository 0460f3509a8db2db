#pragma once


/*
    ------------------------------------------------
    Strophe sum-type reflection - closed variant sets
    ------------------------------------------------
    A Tagged Type is a `std::variant<Ts...>`. Its alternatives are the
    Variants, enumerated by the compiler. A lone class type is accepted as a
    one-variant set so a caller can decode straight into a specific variant.

    ------------------
    Singleton variants
    ------------------
    A singleton variant is a class with exactly one logical instance:

        struct C {
            static C& instance() { static C c; return c; }
            int content = 0;
        };

    Inside a Tagged Type it is held through `singleton_ref<C>`, a handle to
    the canonical instance that compares by identity:

        using Shape = std::variant<A, B, Strophe::singleton_ref<C>>;

    A singleton held by value (`std::variant<A, B, C>`) is an ordinary
    structured variant; decoding it yields a copy.

    -----------
    Descriptors
    -----------
    `describe<T>()` produces a `TaggedTypeDescriptor` listing one
    `VariantDescriptor` per alternative. The registry and the tag resolvers
    only ever see descriptors, never the C++ types themselves.
*/

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

#include "strophe/config.hpp"
#include "strophe/convert.hpp"
#include "strophe/value.hpp"

/// @defgroup StropheSumType Sum-type Reflection
/// @ingroup Strophe
/// @brief Describing closed variant sets and their singleton cases

namespace Strophe {

    /// @ingroup StropheSumType
    /// @brief A class with one process-wide canonical instance
    template<class S>
    concept SingletonVariant = std::is_class_v<S> && requires { { S::instance() } -> std::same_as<S&>; };

    /// @ingroup StropheSumType
    /// @brief Handle to the canonical instance of a singleton variant
    ///
    /// @details
    /// Default construction binds to `S::instance()`. Two handles are equal
    /// only when they refer to the same object.
    template<SingletonVariant S>
    class singleton_ref {
    public:
        using element_type = S;

        singleton_ref() noexcept : m_Ptr{ std::addressof(S::instance()) } {}
        explicit singleton_ref(S& s) noexcept : m_Ptr{ std::addressof(s) } {}

        [[nodiscard]] S& get() const noexcept { return *m_Ptr; }
        S* operator->() const noexcept { return m_Ptr; }
        S& operator*() const noexcept { return *m_Ptr; }

        /// @brief True when this handle refers to `S::instance()`
        [[nodiscard]] bool is_canonical() const noexcept { return m_Ptr == std::addressof(S::instance()); }

        friend bool operator==(const singleton_ref& lhs, const singleton_ref& rhs) noexcept { return lhs.m_Ptr == rhs.m_Ptr; }

    private:
        S* m_Ptr;
    };

    /// @ingroup StropheSumType
    /// @brief Writes the singleton's fields, or an empty record when it has none
    template<SingletonVariant S>
    void to_json(value& out, const singleton_ref<S>& ref) {
        if constexpr (JsonSerializable<S>) {
            to_json(out, ref.get());
        } else {
            out = value{ object{ out.resource() }, out.resource() };
        }
    }

    /// @ingroup StropheSumType
    enum class variant_kind : std::uint8_t {
        structured, ///< Carries its own field state
        singleton,  ///< Exactly one canonical instance
    };

    /// @ingroup StropheSumType
    /// @brief Structural description of one alternative of a Tagged Type
    struct VariantDescriptor {
        std::string qualified_name{};              ///< Demangled C++ name, e.g. `shapes::A`
        std::size_t index{};                       ///< Position among the alternatives
        std::type_index type{ typeid(void) };      ///< Type of the variant (the singleton class for `singleton_ref<S>`)
        variant_kind kind{ variant_kind::structured };
        void* canonical{ nullptr };                ///< Canonical instance; null for structured variants
        bool record_shaped{ true };                ///< Encodes as a JSON object
    };

    /// @ingroup StropheSumType
    /// @brief Description of a whole Tagged Type
    struct TaggedTypeDescriptor {
        std::string name{};
        bool enumerable{ false };
        std::vector<VariantDescriptor> variants{};
    };

    /// @ingroup StropheSumType
    /// @brief Demangled name of @p ti, or the raw name when demangling fails
    [[nodiscard]] STROPHE_API std::string demangle(const std::type_info& ti);
    [[nodiscard]] STROPHE_API std::string demangle(std::type_index ti);

    /// @ingroup StropheSumType
    /// @brief Strips enclosing scopes from a qualified C++ name
    ///
    /// @details
    /// Only `::` outside template argument lists counts, so
    /// `ns::Box<ns::T>` becomes `Box<ns::T>`.
    [[nodiscard]] STROPHE_API std::string_view simple_name(std::string_view qualified) noexcept;

    namespace detail {
        template<class T, template<class...> class Tmpl>
        struct is_specialization_of : std::false_type {};
        template<template<class...> class Tmpl, class... Args>
        struct is_specialization_of<Tmpl<Args...>, Tmpl> : std::true_type {};

        template<class T, template<class...> class Tmpl>
        inline constexpr bool is_specialization_of_v = is_specialization_of<T, Tmpl>::value;

        template<class T>
        struct singleton_of { using type = void; };
        template<SingletonVariant S>
        struct singleton_of<singleton_ref<S>> { using type = S; };

        template<class T>
        inline constexpr bool is_singleton_ref_v = !std::is_void_v<typename singleton_of<T>::type>;

        // Class types other than the structural codec's own scalar and container types
        template<class T>
        inline constexpr bool is_record_shaped_v =
            std::is_class_v<T>
            && !is_specialization_of_v<T, std::basic_string>
            && !is_specialization_of_v<T, std::basic_string_view>
            && !is_specialization_of_v<T, std::vector>
            && !is_specialization_of_v<T, std::optional>
            && !is_specialization_of_v<T, std::variant>
            && !std::is_same_v<T, value>
            && !std::is_same_v<T, object>;

        template<class A>
        VariantDescriptor describe_alternative(std::size_t index) {
            VariantDescriptor d;
            d.index = index;
            d.record_shaped = is_record_shaped_v<A>;
            if constexpr (is_singleton_ref_v<A>) {
                using S = typename singleton_of<A>::type;
                d.qualified_name = demangle(typeid(S));
                d.type = std::type_index{ typeid(S) };
                d.kind = variant_kind::singleton;
                d.canonical = static_cast<void*>(std::addressof(S::instance()));
            } else {
                d.qualified_name = demangle(typeid(A));
                d.type = std::type_index{ typeid(A) };
            }
            return d;
        }

        template<class... Ts, std::size_t... Is>
        std::vector<VariantDescriptor> describe_alternatives(std::index_sequence<Is...>) {
            std::vector<VariantDescriptor> out;
            out.reserve(sizeof...(Ts));
            (out.push_back(describe_alternative<Ts>(Is)), ...);
            return out;
        }

        template<class T>
        struct tagged_traits {
            static constexpr bool is_sum = false;
            static constexpr std::size_t size = 1;

            static TaggedTypeDescriptor describe(std::string name) {
                TaggedTypeDescriptor t;
                t.name = std::move(name);
                t.enumerable = is_record_shaped_v<T>;
                if (t.enumerable) t.variants.push_back(describe_alternative<T>(0));
                return t;
            }
        };

        template<class... Ts>
        struct tagged_traits<std::variant<Ts...>> {
            static constexpr bool is_sum = true;
            static constexpr std::size_t size = sizeof...(Ts);

            static TaggedTypeDescriptor describe(std::string name) {
                TaggedTypeDescriptor t;
                t.name = std::move(name);
                t.enumerable = sizeof...(Ts) > 0;
                t.variants = describe_alternatives<Ts...>(std::index_sequence_for<Ts...>{});
                return t;
            }
        };
    } // namespace detail

    /// @ingroup StropheSumType
    /// @brief Describes @p T as a Tagged Type
    ///
    /// @param name Name used in diagnostics; defaults to the demangled type name
    template<class T>
    [[nodiscard]] TaggedTypeDescriptor describe(std::string name = {}) {
        if (name.empty()) name = demangle(typeid(T));
        return detail::tagged_traits<T>::describe(std::move(name));
    }

} // namespace Strophe
