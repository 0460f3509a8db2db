#include "strophe/json.hpp"

#include <sstream>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <ostream>


namespace Strophe {

    namespace detail {
        ParseResult parse_impl(std::string_view text, const ParseOptions& opts);
        void dump_impl(const value& v, std::ostream& os);
    } // namespace detail

    ParseResult parse(std::string_view input, const ParseOptions& opts) {
        return detail::parse_impl(input, opts);
    }

    ParseResult parse(std::istream& is, const ParseOptions& opts) {
        std::ostringstream oss;
        oss << is.rdbuf();
        return detail::parse_impl(oss.str(), opts);
    }

    std::string dump(const value& v) {
        std::ostringstream oss;
        detail::dump_impl(v, oss);
        return oss.str();
    }

    void dump(const value& v, std::ostream& os) {
        detail::dump_impl(v, os);
    }


#pragma region Parser
    // ================================
    // Internal parser implementation
    // ================================

    namespace detail {
        using expected_void = std::expected<void, ParseError>;
        template<typename T>
        using expected_t = std::expected<T, ParseError>;

        using enum ParseError::code;

        [[nodiscard]] constexpr bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }
        [[nodiscard]] constexpr bool is_ws(char c) noexcept { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

        // Returns the length of the well-formed UTF-8 sequence starting at data[i], 0 if ill-formed
        std::size_t utf8_sequence_length(const unsigned char* data, std::size_t i, std::size_t n) {
            unsigned char c = data[i];
            if (c <= 0x7F) return 1;

            std::size_t len = 0;
            unsigned char lo = 0x80, hi = 0xBF;
            if (c >= 0xC2 && c <= 0xDF) len = 2;
            else if (c == 0xE0) { len = 3; lo = 0xA0; }
            else if (c == 0xED) { len = 3; hi = 0x9F; }
            else if (c >= 0xE1 && c <= 0xEF) len = 3;
            else if (c == 0xF0) { len = 4; lo = 0x90; }
            else if (c == 0xF4) { len = 4; hi = 0x8F; }
            else if (c >= 0xF1 && c <= 0xF3) len = 4;
            else return 0;

            if (i + len > n) return 0;
            if (data[i + 1] < lo || data[i + 1] > hi) return 0;
            for (std::size_t k = 2; k < len; k++) {
                if ((data[i + k] & 0xC0) != 0x80) return 0;
            }
            return len;
        }

        [[nodiscard]] bool is_valid_utf8(std::string_view s) {
            const auto* data = reinterpret_cast<const unsigned char*>(s.data());
            std::size_t i = 0;
            while (i < s.size()) {
                std::size_t len = utf8_sequence_length(data, i, s.size());
                if (len == 0) return false;
                i += len;
            }
            return true;
        }

        void append_utf8(std::uint32_t cp, string& out) {
            if (cp <= 0x7F) {
                out.push_back(static_cast<char>(cp));
            } else if (cp <= 0x7FF) {
                out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp <= 0xFFFF) {
                out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        class Reader {
        public:
            Reader(std::string_view t, const ParseOptions& o, std::pmr::memory_resource* r)
                : m_Text{ t }, m_MaxDepth{ o.max_depth }, m_MemRes{ r } {}

            expected_t<value> document() {
                auto v = parse_value();
                if (!v) return v;
                skip_ws();
                if (!eof()) return fail(trailing_characters, "Trailing characters after top-level JSON value");
                return v;
            }

        private:
            std::string_view m_Text;
            std::size_t m_Idx = 0;
            std::size_t m_Line = 1;
            std::size_t m_Column = 1;
            std::size_t m_Depth = 0;
            std::size_t m_MaxDepth = 0;
            std::pmr::memory_resource* m_MemRes;

            // Scoped nesting level; reports whether the limit still holds
            struct Nesting {
                Reader& r;
                explicit Nesting(Reader& reader) : r{ reader } { r.m_Depth++; }
                ~Nesting() { r.m_Depth--; }
                [[nodiscard]] bool within_limit() const noexcept { return r.m_MaxDepth == 0 || r.m_Depth <= r.m_MaxDepth; }
            };

            [[nodiscard]] bool eof() const noexcept { return m_Idx >= m_Text.size(); }
            [[nodiscard]] char peek() const noexcept { return eof() ? '\0' : m_Text[m_Idx]; }

            char get() {
                if (eof()) return '\0';
                char c = m_Text[m_Idx++];
                if (c == '\n') {
                    m_Line++;
                    m_Column = 1;
                } else m_Column++;
                return c;
            }

            bool consume(char c) {
                if (peek() != c || eof()) return false;
                get();
                return true;
            }

            void skip_ws() {
                while (!eof() && is_ws(peek())) get();
            }

            [[nodiscard]] std::unexpected<ParseError> fail(ParseError::code c, std::string_view msg) const {
                return std::unexpected(ParseError::make(c, m_Idx, m_Line, m_Column, msg));
            }

            expected_void literal(std::string_view word) {
                for (char expected : word) {
                    if (eof()) return fail(unexpected_end_of_input, "Truncated literal");
                    if (get() != expected) return fail(unexpected_character, "Invalid literal");
                }
                return {};
            }

            expected_t<std::uint16_t> hex4() {
                std::uint16_t val = 0;
                for (int i = 0; i < 4; i++) {
                    if (eof()) return fail(invalid_unicode_escape, "Unexpected end in unicode escape");
                    char h = get();
                    unsigned digit = 0;
                    if (h >= '0' && h <= '9') digit = static_cast<unsigned>(h - '0');
                    else if (h >= 'A' && h <= 'F') digit = 10u + static_cast<unsigned>(h - 'A');
                    else if (h >= 'a' && h <= 'f') digit = 10u + static_cast<unsigned>(h - 'a');
                    else return fail(invalid_unicode_escape, "Invalid hex digit in unicode escape");
                    val = static_cast<std::uint16_t>((val << 4) | digit);
                }
                return val;
            }

            expected_void unicode_escape(string& out) {
                auto first = hex4();
                if (!first) return std::unexpected(first.error());

                std::uint32_t cp = *first;
                if (cp >= 0xD800 && cp <= 0xDBFF) {
                    if (!(consume('\\') && consume('u'))) return fail(invalid_unicode_escape, "Expected low surrogate after high surrogate");
                    auto second = hex4();
                    if (!second) return std::unexpected(second.error());
                    if (*second < 0xDC00 || *second > 0xDFFF) return fail(invalid_unicode_escape, "Invalid low surrogate");
                    cp = 0x10000u + (((cp - 0xD800u) << 10) | (static_cast<std::uint32_t>(*second) - 0xDC00u));
                } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                    return fail(invalid_unicode_escape, "Unpaired low surrogate");
                }
                append_utf8(cp, out);
                return {};
            }

            expected_t<string> parse_string() {
                if (!consume('"')) return fail(invalid_string, "Expected '\"' to start a string");

                string out{ allocator_type(m_MemRes) };
                while (!eof()) {
                    char c = get();
                    if (c == '"') {
                        if (!is_valid_utf8(out)) return fail(invalid_string, "Invalid UTF-8 sequence in string");
                        return out;
                    }
                    if (static_cast<unsigned char>(c) < 0x20) return fail(invalid_string, "Control character in string");
                    if (c != '\\') {
                        out.push_back(c);
                        continue;
                    }
                    if (eof()) return fail(invalid_escape, "Unfinished escape sequence");
                    switch (get()) {
                    case '"': out.push_back('"'); break;
                    case '\\': out.push_back('\\'); break;
                    case '/': out.push_back('/'); break;
                    case 'b': out.push_back('\b'); break;
                    case 'f': out.push_back('\f'); break;
                    case 'n': out.push_back('\n'); break;
                    case 'r': out.push_back('\r'); break;
                    case 't': out.push_back('\t'); break;
                    case 'u':
                        if (auto r = unicode_escape(out); !r) return std::unexpected(r.error());
                        break;
                    default: return fail(invalid_escape, "Invalid escape sequence");
                    }
                }
                return fail(unexpected_end_of_input, "Nonterminated string");
            }

            expected_t<value> parse_number() {
                std::size_t start = m_Idx;
                bool integral = true;

                if (consume('-') && !is_digit(peek())) return fail(unexpected_character, "Expected digit after '-'");

                char first_digit = get();
                if (!is_digit(first_digit)) return fail(invalid_number, "Expected digit");
                if (first_digit == '0' && is_digit(peek())) return fail(invalid_number, "Leading zeros disallowed");
                while (is_digit(peek())) get();

                if (consume('.')) {
                    integral = false;
                    if (!is_digit(peek())) return fail(invalid_number, "Expected digit after '.'");
                    while (is_digit(peek())) get();
                }

                if (peek() == 'e' || peek() == 'E') {
                    integral = false;
                    get();
                    if (peek() == '+' || peek() == '-') get();
                    if (!is_digit(peek())) return fail(invalid_number, "Expected digit in exponent");
                    while (is_digit(peek())) get();
                }

                char next = peek();
                if (!(eof() || next == ',' || next == ']' || next == '}' || is_ws(next))) return fail(invalid_number, "Invalid character after number");

                auto digits = m_Text.substr(start, m_Idx - start);
                const char* first = digits.data();
                const char* last = digits.data() + digits.size();

                if (integral) {
                    std::int64_t i = 0;
                    auto [ptr, ec] = std::from_chars(first, last, i);
                    if (ec == std::errc{} && ptr == last) return value{ i, m_MemRes };
                    // out of int64 range, fall through to double
                }

                double d = 0.0;
                auto [ptr, ec] = std::from_chars(first, last, d);
                if (ec != std::errc{} || ptr != last) return fail(invalid_number, "Failed to parse number");
                return value{ d, m_MemRes };
            }

            expected_t<value> parse_array() {
                Nesting nesting{ *this };
                if (!nesting.within_limit()) return fail(depth_limit_exceeded, "Maximum nesting depth exceeded");
                get(); // '['

                array arr{ allocator_type(m_MemRes) };
                skip_ws();
                if (consume(']')) return value{ std::move(arr), m_MemRes };

                while (true) {
                    auto elem = parse_value();
                    if (!elem) return elem;
                    arr.emplace_back(std::move(*elem));

                    skip_ws();
                    if (consume(',')) {
                        skip_ws();
                        if (peek() == ']') return fail(unexpected_character, "Trailing commas not allowed");
                        continue;
                    }
                    if (consume(']')) break;
                    if (eof()) return fail(unexpected_end_of_input, "Unterminated array, expected ',' or ']'");
                    return fail(unexpected_character, "Expected ',' or ']' in array");
                }
                return value{ std::move(arr), m_MemRes };
            }

            expected_t<value> parse_object() {
                Nesting nesting{ *this };
                if (!nesting.within_limit()) return fail(depth_limit_exceeded, "Maximum nesting depth exceeded");
                get(); // '{'

                object obj{ m_MemRes };
                skip_ws();
                if (consume('}')) return value{ std::move(obj), m_MemRes };

                while (true) {
                    if (eof()) return fail(unexpected_end_of_input, "Unterminated object, expected string key");
                    if (peek() != '"') return fail(unexpected_character, "Expected '\"' to start object key");
                    auto key = parse_string();
                    if (!key) return std::unexpected(key.error());

                    skip_ws();
                    if (eof()) return fail(unexpected_end_of_input, "Unterminated object, expected ':' after key");
                    if (!consume(':')) return fail(unexpected_character, "Expected ':' after object key");

                    auto val = parse_value();
                    if (!val) return val;
                    obj.insert_or_assign(*key, std::move(*val));

                    skip_ws();
                    if (consume(',')) {
                        skip_ws();
                        continue;
                    }
                    if (consume('}')) break;
                    if (eof()) return fail(unexpected_end_of_input, "Unterminated object, expected ',' or '}'");
                    return fail(unexpected_character, "Expected ',' or '}' in object");
                }
                return value{ std::move(obj), m_MemRes };
            }

            expected_t<value> parse_value() {
                skip_ws();
                if (eof()) return fail(unexpected_end_of_input, "Expected JSON value");
                char c = peek();
                switch (c) {
                case 'n':
                    if (auto r = literal("null"); !r) return std::unexpected(r.error());
                    return value{ nullptr, m_MemRes };
                case 't':
                    if (auto r = literal("true"); !r) return std::unexpected(r.error());
                    return value{ true, m_MemRes };
                case 'f':
                    if (auto r = literal("false"); !r) return std::unexpected(r.error());
                    return value{ false, m_MemRes };
                case '"': {
                    auto str = parse_string();
                    if (!str) return std::unexpected(str.error());
                    return value{ std::move(*str), m_MemRes };
                }
                case '[': return parse_array();
                case '{': return parse_object();
                default:
                    if (c == '-' || is_digit(c)) return parse_number();
                    if (c == '.') return fail(invalid_number, "Fractional values must start with a 0");
                    return fail(unexpected_character, "Unexpected character while parsing value");
                }
            }
        };

        ParseResult parse_impl(std::string_view text, const ParseOptions& opts) {
            Reader reader{ text, opts, std::pmr::get_default_resource() };
            return reader.document();
        }
#pragma endregion
#pragma region Serializer

        // ================================
        // Internal serializer implementation
        // ================================

        void dump_string(std::string_view s, std::ostream& os) {
            os.put('"');
            for (unsigned char c : s) {
                switch (c) {
                case '"': os << "\\\""; break;
                case '\\': os << "\\\\"; break;
                case '\b': os << "\\b"; break;
                case '\f': os << "\\f"; break;
                case '\n': os << "\\n"; break;
                case '\r': os << "\\r"; break;
                case '\t': os << "\\t"; break;
                default:
                    if (c < 0x20) {
                        static constexpr char hex[] = "0123456789ABCDEF";
                        os << "\\u00" << hex[(c >> 4) & 0xF] << hex[c & 0xF];
                    } else {
                        os.put(static_cast<char>(c));
                    }
                    break;
                }
            }
            os.put('"');
        }

        void dump_impl(const value& v, std::ostream& os) {
            switch (v.type()) {
            case kind::null: os << "null"; return;
            case kind::boolean: os << (v.as_bool() ? "true" : "false"); return;
            case kind::integer: {
                char buf[32];
                auto res = std::to_chars(buf, buf + sizeof(buf), v.as_integer());
                os.write(buf, res.ptr - buf);
                return;
            }
            case kind::number: {
                double d = v.as_double();
                if (!std::isfinite(d)) {
                    os << "null";
                    return;
                }
                char buf[64];
                auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
                if (ec != std::errc{}) os << "0";
                else os.write(buf, ptr - buf);
                return;
            }
            case kind::string: dump_string(v.as_string(), os); return;
            case kind::array: {
                os.put('[');
                bool first = true;
                for (const auto& elem : v.as_array()) {
                    if (!first) os.put(',');
                    first = false;
                    dump_impl(elem, os);
                }
                os.put(']');
                return;
            }
            case kind::object: {
                os.put('{');
                bool first = true;
                for (const auto& [k, member] : v.as_object()) {
                    if (!first) os.put(',');
                    first = false;
                    dump_string(k, os);
                    os.put(':');
                    dump_impl(member, os);
                }
                os.put('}');
                return;
            }
            }
            os << "null";
        }

#pragma endregion

    } // namespace detail

} // namespace Strophe
