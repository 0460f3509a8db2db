#include "strophe/value.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>


namespace Strophe {

#pragma region object

    object::object(std::pmr::memory_resource* res)
        : m_Members{ allocator_type(res) } {}

    object::object(const object& other)
        : m_Members{ allocator_type(other.resource()) } {
        m_Members.reserve(other.m_Members.size());
        for (const auto& [k, v] : other.m_Members) m_Members.emplace_back(string{ k, other.resource() }, v);
    }

    object::object(object&& other) noexcept = default;

    object& object::operator=(const object& other) {
        if (this == &other) return *this;
        object copy{ other };
        m_Members = std::move(copy.m_Members);
        return *this;
    }

    object& object::operator=(object&& other) noexcept = default;

    object::~object() = default;

    object::iterator object::begin() noexcept { return m_Members.begin(); }
    object::iterator object::end() noexcept { return m_Members.end(); }
    object::const_iterator object::begin() const noexcept { return m_Members.begin(); }
    object::const_iterator object::end() const noexcept { return m_Members.end(); }
    std::size_t object::size() const noexcept { return m_Members.size(); }
    bool object::empty() const noexcept { return m_Members.empty(); }

    value* object::find(std::string_view key) noexcept {
        auto it = std::find_if(m_Members.begin(), m_Members.end(), [key](const member& m) { return m.first == key; });
        if (it == m_Members.end()) return nullptr;
        return std::addressof(it->second);
    }

    const value* object::find(std::string_view key) const noexcept {
        auto it = std::find_if(m_Members.begin(), m_Members.end(), [key](const member& m) { return m.first == key; });
        if (it == m_Members.end()) return nullptr;
        return std::addressof(it->second);
    }

    bool object::contains(std::string_view key) const noexcept { return find(key) != nullptr; }

    value& object::at(std::string_view key) {
        if (auto* v = find(key)) return *v;
        throw std::out_of_range{ "Strophe::object::at: key not found: " + std::string{ key } };
    }

    const value& object::at(std::string_view key) const {
        if (auto* v = find(key)) return *v;
        throw std::out_of_range{ "Strophe::object::at: key not found: " + std::string{ key } };
    }

    value& object::operator[](std::string_view key) {
        if (auto* v = find(key)) return *v;
        auto* res = resource();
        m_Members.emplace_back(string{ key.begin(), key.end(), res }, value{ res });
        return m_Members.back().second;
    }

    value& object::insert_or_assign(std::string_view key, value v) {
        value& slot = (*this)[key];
        slot = std::move(v);
        return slot;
    }

    bool object::erase(std::string_view key) {
        auto it = std::find_if(m_Members.begin(), m_Members.end(), [key](const member& m) { return m.first == key; });
        if (it == m_Members.end()) return false;
        m_Members.erase(it);
        return true;
    }

    std::pmr::memory_resource* object::resource() const noexcept {
        return m_Members.get_allocator().resource();
    }

    bool operator==(const object& lhs, const object& rhs) {
        if (lhs.size() != rhs.size()) return false;
        for (const auto& [k, v] : lhs) {
            const value* other = rhs.find(k);
            if (other == nullptr || !(*other == v)) return false;
        }
        return true;
    }

#pragma endregion
#pragma region value

    value::value(std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::monostate{} } {}

    value::value(std::nullptr_t, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::monostate{} } {}

    value::value(bool b, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ b } {}

    value::value(double d, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ d } {}

    value::value(const char* s, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ string{ s, res } } {}

    value::value(std::string_view sv, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ string{ sv.begin(), sv.end(), res } } {}

    value::value(const std::string& s, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ string{ s.begin(), s.end(), res } } {}

    value::value(string s, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::move(s) } {}

    value::value(array a, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::move(a) } {}

    value::value(object o, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::move(o) } {}

    value::value(const value& other)
        : m_MemRes{ other.m_MemRes }, m_Storage{ clone_storage(other.m_Storage, other.m_MemRes) } {}

    value::value(value&& other) noexcept
        : m_MemRes{ other.m_MemRes }, m_Storage{ std::move(other.m_Storage) } {}

    value& value::operator=(const value& other) {
        if (this == &other) return *this;
        // other may live inside this tree, clone before replacing
        storage_t copy = clone_storage(other.m_Storage, other.m_MemRes);
        m_MemRes = other.m_MemRes;
        m_Storage = std::move(copy);
        return *this;
    }

    value& value::operator=(value&& other) noexcept {
        if (this == &other) return *this;
        m_MemRes = other.m_MemRes;
        m_Storage = std::move(other.m_Storage);
        return *this;
    }

    kind value::type() const noexcept {
        switch (m_Storage.index()) {
        case 0: return kind::null;
        case 1: return kind::boolean;
        case 2: return kind::integer;
        case 3: return kind::number;
        case 4: return kind::string;
        case 5: return kind::array;
        case 6: return kind::object;
        }
        return kind::null;
    }

    bool& value::as_bool() { return std::get<bool>(m_Storage); }
    const bool& value::as_bool() const { return std::get<bool>(m_Storage); }
    std::int64_t& value::as_integer() { return std::get<std::int64_t>(m_Storage); }
    const std::int64_t& value::as_integer() const { return std::get<std::int64_t>(m_Storage); }
    double& value::as_double() { return std::get<double>(m_Storage); }
    const double& value::as_double() const { return std::get<double>(m_Storage); }
    string& value::as_string() { return std::get<string>(m_Storage); }
    const string& value::as_string() const { return std::get<string>(m_Storage); }
    array& value::as_array() { if (!is_array()) m_Storage = array{ allocator_type(m_MemRes) }; return std::get<array>(m_Storage); }
    const array& value::as_array() const { return std::get<array>(m_Storage); }
    object& value::as_object() { if (!is_object()) m_Storage = object{ m_MemRes }; return std::get<object>(m_Storage); }
    const object& value::as_object() const { return std::get<object>(m_Storage); }

    double value::as_number() const {
        if (is_integer()) return static_cast<double>(as_integer());
        return as_double();
    }

    std::size_t value::size() const noexcept {
        if (is_array()) return std::get<array>(m_Storage).size();
        if (is_object()) return std::get<object>(m_Storage).size();
        return 0;
    }

    value& value::operator[](std::size_t idx) {
        auto& arr = as_array();
        if (idx >= arr.size()) {
            arr.resize(idx + 1, value{ m_MemRes });
        }
        return arr[idx];
    }

    const value& value::operator[](std::size_t idx) const {
        static const value null_sentinel{};
        if (!is_array()) return null_sentinel;
        const auto& arr = as_array();
        if (idx >= arr.size()) return null_sentinel;
        return arr[idx];
    }

    value& value::operator[](std::string_view key) {
        return as_object()[key];
    }

    const value* value::find(std::string_view key) const {
        if (!is_object()) return nullptr;
        return as_object().find(key);
    }

    const value& value::at(std::string_view key) const {
        if (auto* v = find(key)) return *v;
        throw std::out_of_range{ "Strophe::value::at: key not found: " + std::string{ key } };
    }

    bool operator==(const value& lhs, const value& rhs) {
        if (lhs.is_number() && rhs.is_number()) {
            if (lhs.is_integer() && rhs.is_integer()) return lhs.as_integer() == rhs.as_integer();
            return lhs.as_number() == rhs.as_number();
        }
        return lhs.m_Storage == rhs.m_Storage;
    }

    storage_t value::clone_storage(const storage_t& s, std::pmr::memory_resource* res) {
        switch (s.index()) {
        case 0: return std::monostate{};
        case 1: return std::get<bool>(s);
        case 2: return std::get<std::int64_t>(s);
        case 3: return std::get<double>(s);
        case 4: return string{ std::get<string>(s), res };
        case 5: {
            const auto& arr = std::get<array>(s);
            array copy(allocator_type{ res });
            copy.reserve(arr.size());
            for (const auto& v : arr) copy.emplace_back(v);
            return copy;
        }
        case 6: {
            const auto& obj = std::get<object>(s);
            object copy{ res };
            for (const auto& [k, v] : obj) copy.insert_or_assign(k, v);
            return copy;
        }
        }
        return std::monostate{};
    }

#pragma endregion

} // namespace Strophe
