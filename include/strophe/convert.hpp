#pragma once


/*
    -----------------------------------------------------
    Strophe type conversion utilities - to_json/from_json
    -----------------------------------------------------
    This header defines the customization points of the structural codec.
    A variant type plugs its fields into Strophe by providing:

        // Write the variant's own fields into out (as an object)
        void to_json(Strophe::value& out, const T& src);

        // Read the variant's own fields from a record
        void from_json(const Strophe::value& src, T& out);

    in the namespace of `T` (found by ADL) or in `Strophe`.

    -------------------
    Builtin Conversions
    -------------------
    - `bool`, every integral type, `float`/`double`/`long double`
    - `std::string`, `Strophe::string`, `std::string_view` and C strings (to_json only for views)
    - `std::vector<T>` and `std::optional<T>` of convertible `T`
    - `std::variant<Ts...>` (to_json only): writes the active alternative
      with no tag. This is the plain structural path; it has no notion of a
      Tagged Type, so a sequence serialized through it loses its tags. Use
      `TaggedCodec` whenever tags matter

    --------------
    Error Handling
    --------------
    - The builtin `from_json` overloads throw `Strophe::convert_error` on a
      kind mismatch or when a number does not fit the target type
    - `value::at` throws `std::out_of_range` for a missing field
    - `TaggedCodec` translates these exceptions into `CodecError` values

    ----------------
    Conceptual Usage
    ----------------
        struct A { std::string name; };

        void to_json(Strophe::value& v, const A& a) {
            v["name"] = a.name;
        }

        void from_json(const Strophe::value& v, A& a) {
            a.name = Strophe::field<std::string>(v, "name");
        }
*/


#include <cmath>
#include <concepts>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include "strophe/value.hpp"
#include "strophe/error.hpp"
#include "strophe/config.hpp"

/// @defgroup StropheConvert Type Conversion
/// @ingroup Strophe
/// @brief Converting between C++ types and JSON values

namespace Strophe {

    // ------------------------------------------------------------
    // Builtin conversions (declared up front so they can find each other)
    // ------------------------------------------------------------

    STROPHE_API void to_json(value& out, bool b);
    template<std::integral I> requires (!std::same_as<I, bool>)
    void to_json(value& out, I i);
    template<std::floating_point F>
    void to_json(value& out, F f);
    STROPHE_API void to_json(value& out, const char* s);
    STROPHE_API void to_json(value& out, std::string_view s);
    STROPHE_API void to_json(value& out, const std::string& s);
    STROPHE_API void to_json(value& out, const string& s);
    template<class T>
    void to_json(value& out, const std::vector<T>& xs);
    template<class T>
    void to_json(value& out, const std::optional<T>& x);
    template<class... Ts>
    void to_json(value& out, const std::variant<Ts...>& x);

    STROPHE_API void from_json(const value& in, bool& b);
    template<std::integral I> requires (!std::same_as<I, bool>)
    void from_json(const value& in, I& i);
    template<std::floating_point F>
    void from_json(const value& in, F& f);
    STROPHE_API void from_json(const value& in, std::string& s);
    STROPHE_API void from_json(const value& in, string& s);
    template<class T>
    void from_json(const value& in, std::vector<T>& xs);
    template<class T>
    void from_json(const value& in, std::optional<T>& x);

    /// @ingroup StropheConvert
    /// @brief Types that can be written into a JSON value
    ///
    /// @details
    /// Satisfied when `void to_json(Strophe::value&, const T&)` is callable,
    /// via ADL or from the `Strophe` namespace. The function may overwrite
    /// `out` freely; it must not assume any initial kind.
    template<typename T>
    concept JsonSerializable = requires(const T& t, value& v) { { to_json(v, t) } -> std::same_as<void>; };

    /// @ingroup StropheConvert
    /// @brief Types that can be read from a JSON value
    ///
    /// @details
    /// Satisfied when `void from_json(const Strophe::value&, T&)` is callable.
    template<typename T>
    concept JsonDeserializable = requires(const value& v, T& t) { { from_json(v, t) } -> std::same_as<void>; };

    /// @ingroup StropheConvert
    /// @brief Serializes @p t into a fresh value allocated from @p res
    template<JsonSerializable T>
    [[nodiscard]] inline value serialize(const T& t, std::pmr::memory_resource* res = std::pmr::get_default_resource()) {
        value v{ res };
        to_json(v, t);
        return v;
    }

    /// @ingroup StropheConvert
    /// @brief Deserializes a value-initialized `T` from @p v
    /// @throws convert_error, std::out_of_range or std::bad_variant_access from `from_json`
    template<JsonDeserializable T>
    [[nodiscard]] inline T deserialize(const value& v) {
        T t{};
        from_json(v, t);
        return t;
    }

    /// @ingroup StropheConvert
    /// @brief Reads member @p key of the record @p record as a `T`
    ///
    /// @throws std::out_of_range If the member is missing
    template<JsonDeserializable T>
    [[nodiscard]] inline T field(const value& record, std::string_view key) {
        return deserialize<T>(record.at(key));
    }

    // ------------------------------------------------------------
    // Builtin template definitions
    // ------------------------------------------------------------

    template<std::integral I> requires (!std::same_as<I, bool>)
    void to_json(value& out, I i) {
        out = value{ i, out.resource() };
    }

    template<std::floating_point F>
    void to_json(value& out, F f) {
        out = value{ static_cast<double>(f), out.resource() };
    }

    template<class T>
    void to_json(value& out, const std::vector<T>& xs) {
        auto& arr = out.as_array();
        arr.clear();
        arr.reserve(xs.size());
        for (const auto& x : xs) {
            value elem{ out.resource() };
            to_json(elem, x);
            arr.emplace_back(std::move(elem));
        }
    }

    template<class T>
    void to_json(value& out, const std::optional<T>& x) {
        if (!x) {
            out = value{ nullptr, out.resource() };
            return;
        }
        to_json(out, *x);
    }

    template<class... Ts>
    void to_json(value& out, const std::variant<Ts...>& x) {
        if (x.valueless_by_exception()) {
            out = value{ nullptr, out.resource() };
            return;
        }
        std::visit([&out](const auto& alt) { to_json(out, alt); }, x);
    }

    template<std::integral I> requires (!std::same_as<I, bool>)
    void from_json(const value& in, I& i) {
        using limits = std::numeric_limits<I>;
        if (in.is_double()) {
            double d = in.as_double();
            if (!(d >= static_cast<double>(limits::min()) && d < static_cast<double>(limits::max()) + 1.0)) throw convert_error{ "number out of range for integer field" };
            if (d != std::trunc(d)) throw convert_error{ "expected an integer, got a fractional number" };
            i = static_cast<I>(d);
            return;
        }
        if (!in.is_integer()) throw convert_error{ "expected an integer" };
        std::int64_t raw = in.as_integer();
        if constexpr (std::is_unsigned_v<I>) {
            if (raw < 0 || static_cast<std::uint64_t>(raw) > static_cast<std::uint64_t>(limits::max())) throw convert_error{ "number out of range for integer field" };
        } else {
            if (raw < static_cast<std::int64_t>(limits::min()) || raw > static_cast<std::int64_t>(limits::max())) throw convert_error{ "number out of range for integer field" };
        }
        i = static_cast<I>(raw);
    }

    template<std::floating_point F>
    void from_json(const value& in, F& f) {
        if (!in.is_number()) throw convert_error{ "expected a number" };
        f = static_cast<F>(in.as_number());
    }

    template<class T>
    void from_json(const value& in, std::vector<T>& xs) {
        if (!in.is_array()) throw convert_error{ "expected an array" };
        xs.clear();
        xs.reserve(in.size());
        for (const auto& elem : in.as_array()) {
            T x{};
            from_json(elem, x);
            xs.push_back(std::move(x));
        }
    }

    template<class T>
    void from_json(const value& in, std::optional<T>& x) {
        if (in.is_null()) {
            x.reset();
            return;
        }
        T inner{};
        from_json(in, inner);
        x = std::move(inner);
    }

} // namespace Strophe
