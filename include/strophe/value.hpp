#pragma once


/*
    ----------------------------------------
    Strophe::value - Dynamic JSON record node
    ----------------------------------------
    The `Strophe::value` type represents any JSON value:
        - null
        - boolean
        - integer (as std::int64_t)
        - number (as double)
        - string
        - array
        - object (an insertion-ordered record)
    It is the structural layer every tagged record is built from

    -----------------
    Memory Management
    -----------------
    - `value` is allocator-aware and uses `std::pmr::memory_resource` for all
      internal allocations (strings, arrays, objects)
    - Copy construction/assignment:
        * The destination `value` adopts the allocator of the source and
          performs a deep copy of the underlying tree into that allocator
    - Move construction/assignment:
        * The destination `value` steals the allocator and storage of the source

    -------------
    Record Order
    -------------
    - `object` keeps its members in insertion order. Field order on the wire
      is the order in which `to_json` wrote them, so a codec can place a tag
      in front of a variant's own fields
    - Lookups are linear; records built from variant fields are small
    - Equality between objects ignores member order

    -------
    Numbers
    -------
    - Integers and doubles are distinct kinds so `23` survives a round-trip
      as `23` rather than `23.0`
    - `is_number()` is true for both; equality compares numerically across
      the two kinds

    -------------
    Thread-Safety
    -------------
    - Concurrent access to the same `value` instance must be externally synchronized
*/

/// @defgroup Strophe Strophe tagged variant codec
/// @brief Core types and functions for Strophe

/// @defgroup StropheValue DOM Value
/// @ingroup Strophe

#include <variant>
#include <string>
#include <string_view>
#include <vector>
#include <memory_resource>
#include <cstddef>
#include <cstdint>
#include <concepts>
#include <limits>
#include <utility>
#include "strophe/config.hpp"

namespace Strophe {
    /// @brief Enumerates the possible JSON value kinds held by Strophe::value
    enum class kind : std::uint8_t {
        null,    ///< JSON null value
        boolean, ///< JSON boolean value (`true` or `false`)
        integer, ///< JSON number without fraction or exponent
        number,  ///< JSON number stored as `double`
        string,  ///< JSON string value
        array,   ///< JSON array value
        object,  ///< JSON object value
    };

    template<class T>
    using pmr_vector = std::pmr::vector<T>;

    /// @ingroup StropheValue
    /// @brief String type used by Strophe::value (allocator-aware)
    using string = std::pmr::string;

    struct value;
    using allocator_type = std::pmr::polymorphic_allocator<value>;

    /// @ingroup StropheValue
    /// @brief Array type used by Strophe::value (JSON arrays)
    using array = pmr_vector<value>;

    /// @ingroup StropheValue
    /// @brief Insertion-ordered JSON object
    ///
    /// @details
    /// Members are stored in the order they were first inserted. Assigning
    /// to an existing key keeps its position. All member functions that
    /// touch elements are defined once `value` is complete.
    class object {
    public:
        using member = std::pair<string, value>;
        using container_type = pmr_vector<member>;
        using iterator = container_type::iterator;
        using const_iterator = container_type::const_iterator;

        STROPHE_API explicit object(std::pmr::memory_resource* res = std::pmr::get_default_resource());
        STROPHE_API object(const object& other);
        STROPHE_API object(object&& other) noexcept;
        STROPHE_API object& operator=(const object& other);
        STROPHE_API object& operator=(object&& other) noexcept;
        STROPHE_API ~object();

        [[nodiscard]] STROPHE_API iterator begin() noexcept;
        [[nodiscard]] STROPHE_API iterator end() noexcept;
        [[nodiscard]] STROPHE_API const_iterator begin() const noexcept;
        [[nodiscard]] STROPHE_API const_iterator end() const noexcept;
        [[nodiscard]] STROPHE_API std::size_t size() const noexcept;
        [[nodiscard]] STROPHE_API bool empty() const noexcept;

        /// @brief Returns a pointer to the member value for @p key, or nullptr
        [[nodiscard]] STROPHE_API value* find(std::string_view key) noexcept;
        [[nodiscard]] STROPHE_API const value* find(std::string_view key) const noexcept;
        [[nodiscard]] STROPHE_API bool contains(std::string_view key) const noexcept;

        /// @throws std::out_of_range If @p key is not a member
        [[nodiscard]] STROPHE_API value& at(std::string_view key);
        /// @throws std::out_of_range If @p key is not a member
        [[nodiscard]] STROPHE_API const value& at(std::string_view key) const;

        /// @brief Accesses a member, appending a null member when @p key is missing
        STROPHE_API value& operator[](std::string_view key);

        /// @brief Sets @p key to @p v
        /// @details An existing member keeps its position; a new member is appended
        STROPHE_API value& insert_or_assign(std::string_view key, value v);

        /// @brief Removes @p key, preserving the order of the remaining members
        /// @return true if a member was removed
        STROPHE_API bool erase(std::string_view key);

        [[nodiscard]] STROPHE_API std::pmr::memory_resource* resource() const noexcept;

        /// @brief Order-insensitive member-wise equality
        STROPHE_API friend bool operator==(const object& lhs, const object& rhs);

    private:
        container_type m_Members;
    };

    /// @ingroup StropheValue
    /// @brief Variant storage used internally by Strophe::value
    using storage_t = std::variant<
        std::monostate,
        bool,
        std::int64_t,
        double,
        string,
        array,
        object
    >;


    /// @ingroup StropheValue
    /// @brief Dynamic JSON DOM type
    ///
    /// @details
    /// All nested allocations (strings, arrays, objects) are performed using
    /// the `std::pmr::memory_resource` associated with each `value` instance.
    /// Container-like operations (e.g. `as_array`, `as_object`, `operator[]`)
    /// use this allocator
    struct value {
        // ------------------------------------------------------------
        // Constructors / assignment / destructor
        // ------------------------------------------------------------

        /// @ingroup StropheValue
        /// @brief Constructs a null value using the given memory resource
        STROPHE_API explicit value(std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @ingroup StropheValue
        /// @brief Constructs an explicit null value
        STROPHE_API value(std::nullptr_t, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @ingroup StropheValue
        /// @brief Constructs a boolean value
        STROPHE_API value(bool b, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @ingroup StropheValue
        /// @brief Constructs a floating point number
        STROPHE_API value(double d, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @ingroup StropheValue
        /// @brief Constructs an integer value from any integral type
        ///
        /// @details
        /// Unsigned values above the `std::int64_t` range are stored as doubles
        ///
        /// @tparam I Integral type other than `bool`
        template<std::integral I>
            requires (!std::same_as<I, bool>)
        value(I i, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept
            : m_MemRes{ res }, m_Storage{ std::monostate{} } {
            if constexpr (std::is_unsigned_v<I> && sizeof(I) >= sizeof(std::int64_t)) {
                if (i > static_cast<I>(std::numeric_limits<std::int64_t>::max())) {
                    m_Storage = static_cast<double>(i);
                    return;
                }
            }
            m_Storage = static_cast<std::int64_t>(i);
        }

        /// @ingroup StropheValue
        /// @brief Constructs a string value from a C string
        STROPHE_API value(const char* s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup StropheValue
        /// @brief Constructs a string value from a string_view
        STROPHE_API value(std::string_view sv, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup StropheValue
        /// @brief Constructs a string value from a std::string
        STROPHE_API value(const std::string& s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup StropheValue
        /// @brief Constructs a string value from an existing Strophe::string
        STROPHE_API value(string s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup StropheValue
        /// @brief Constructs an array value
        STROPHE_API value(array a, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup StropheValue
        /// @brief Constructs an object value
        STROPHE_API value(object o, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup StropheValue
        /// @brief Deep copy into the allocator of @p other
        STROPHE_API value(const value& other);

        /// @ingroup StropheValue
        /// @brief Steals allocator and storage; @p other is left valid but unspecified
        STROPHE_API value(value&& other) noexcept;

        STROPHE_API value& operator=(const value& other);
        STROPHE_API value& operator=(value&& other) noexcept;

        // ------------------------------------------------------------
        // Introspection
        // ------------------------------------------------------------

        /// @ingroup StropheValue
        /// @brief Returns the kind of value currently stored
        [[nodiscard]] STROPHE_API kind type() const noexcept;

        [[nodiscard]] bool is_null()    const noexcept { return type() == kind::null;    }
        [[nodiscard]] bool is_bool()    const noexcept { return type() == kind::boolean; }
        [[nodiscard]] bool is_integer() const noexcept { return type() == kind::integer; }
        [[nodiscard]] bool is_double()  const noexcept { return type() == kind::number;  }
        [[nodiscard]] bool is_string()  const noexcept { return type() == kind::string;  }
        [[nodiscard]] bool is_array()   const noexcept { return type() == kind::array;   }
        [[nodiscard]] bool is_object()  const noexcept { return type() == kind::object;  }

        /// @ingroup StropheValue
        /// @brief True for both integers and doubles
        [[nodiscard]] bool is_number()  const noexcept { return is_integer() || is_double(); }

        // ------------------------------------------------------------
        // Scalar accessors
        // ------------------------------------------------------------

        /// @ingroup StropheValue
        /// @pre `is_bool()`; otherwise throws `std::bad_variant_access`
        [[nodiscard]] STROPHE_API bool&       as_bool();
        [[nodiscard]] STROPHE_API const bool& as_bool() const;

        /// @ingroup StropheValue
        /// @pre `is_integer()`; otherwise throws `std::bad_variant_access`
        [[nodiscard]] STROPHE_API std::int64_t&       as_integer();
        [[nodiscard]] STROPHE_API const std::int64_t& as_integer() const;

        /// @ingroup StropheValue
        /// @pre `is_double()`; otherwise throws `std::bad_variant_access`
        [[nodiscard]] STROPHE_API double&       as_double();
        [[nodiscard]] STROPHE_API const double& as_double() const;

        /// @ingroup StropheValue
        /// @brief Numeric value as double, whichever number kind is stored
        /// @pre `is_number()`; otherwise throws `std::bad_variant_access`
        [[nodiscard]] STROPHE_API double as_number() const;

        /// @ingroup StropheValue
        /// @pre `is_string()`; otherwise throws `std::bad_variant_access`
        [[nodiscard]] STROPHE_API string&       as_string();
        [[nodiscard]] STROPHE_API const string& as_string() const;

        // ------------------------------------------------------------
        // Container accessors
        // ------------------------------------------------------------

        /// @ingroup StropheValue
        /// @brief Returns the stored array, replacing any other kind with an empty array
        [[nodiscard]] STROPHE_API array&       as_array();

        /// @ingroup StropheValue
        /// @pre `is_array()`; otherwise throws `std::bad_variant_access`
        [[nodiscard]] STROPHE_API const array& as_array() const;

        /// @ingroup StropheValue
        /// @brief Returns the stored object, replacing any other kind with an empty object
        [[nodiscard]] STROPHE_API object&       as_object();

        /// @ingroup StropheValue
        /// @pre `is_object()`; otherwise throws `std::bad_variant_access`
        [[nodiscard]] STROPHE_API const object& as_object() const;

        /// @ingroup StropheValue
        /// @brief Element count for arrays, member count for objects, 0 otherwise
        [[nodiscard]] STROPHE_API std::size_t size() const noexcept;

        // ------------------------------------------------------------
        // Indexing
        // ------------------------------------------------------------

        /// @ingroup StropheValue
        /// @brief Accesses an array element, converting to an array and growing as needed
        STROPHE_API value& operator[](std::size_t idx);

        /// @ingroup StropheValue
        /// @brief Accesses an array element; returns a shared null for non-arrays
        ///        and out-of-range indices
        STROPHE_API const value& operator[](std::size_t idx) const;

        /// @ingroup StropheValue
        /// @brief Accesses or creates an object member, converting to an object as needed
        STROPHE_API value& operator[](std::string_view key);

        /// @ingroup StropheValue
        /// @brief Finds a member; nullptr when absent or when this is not an object
        [[nodiscard]] STROPHE_API const value* find(std::string_view key) const;

        /// @ingroup StropheValue
        /// @throws std::out_of_range If the key does not exist or the value is not an object
        [[nodiscard]] STROPHE_API const value& at(std::string_view key) const;

        /// @ingroup StropheValue
        /// @brief Structural equality
        ///
        /// @details
        /// Integers and doubles compare by numeric value. Objects compare
        /// member-wise regardless of order; arrays element-wise
        STROPHE_API friend bool operator==(const value& lhs, const value& rhs);

        /// @ingroup StropheValue
        /// @brief Returns the memory resource associated with this value
        [[nodiscard]] std::pmr::memory_resource* resource() const noexcept { return m_MemRes; }

        /// @ingroup StropheValue
        /// @brief Direct access to the underlying variant storage
        [[nodiscard]] const storage_t& storage() const noexcept { return m_Storage; }
        [[nodiscard]] storage_t& storage() noexcept { return m_Storage; }

    private:
        std::pmr::memory_resource* m_MemRes{};
        storage_t m_Storage{};

        static storage_t clone_storage(const storage_t& s, std::pmr::memory_resource* res);
    };

} // namespace Strophe
