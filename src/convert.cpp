#include "strophe/convert.hpp"

namespace Strophe {

    void to_json(value& out, bool b) { out = value{ b, out.resource() }; }
    void to_json(value& out, const char* s) { out = value{ s, out.resource() }; }
    void to_json(value& out, std::string_view s) { out = value{ s, out.resource() }; }
    void to_json(value& out, const std::string& s) { out = value{ s, out.resource() }; }
    void to_json(value& out, const string& s) { out = value{ std::string_view{ s }, out.resource() }; }

    void from_json(const value& in, bool& b) {
        if (!in.is_bool()) throw convert_error{ "expected a boolean" };
        b = in.as_bool();
    }

    void from_json(const value& in, std::string& s) {
        if (!in.is_string()) throw convert_error{ "expected a string" };
        s.assign(in.as_string().begin(), in.as_string().end());
    }

    void from_json(const value& in, string& s) {
        if (!in.is_string()) throw convert_error{ "expected a string" };
        s.assign(in.as_string().begin(), in.as_string().end());
    }

} // namespace Strophe
