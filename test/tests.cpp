#include <catch2/catch_all.hpp>

#include "strophe/strophe.hpp"

#include <random>
#include <limits>
#include <cmath>
#include <cstdint>
#include <sstream>
#include <optional>
#include <print>
#include <vector>

using namespace Catch;

namespace {
  
    struct rng {
        std::mt19937_64 eng;
        
        rng() : eng(std::random_device{}()) {}
        
        size_t uniform_size(size_t min, size_t max) {
            std::uniform_int_distribution<size_t> dist(min, max);
            return dist(eng);
        }
        
        bool coin(double p = 0.5) {
            std::bernoulli_distribution dist(p);
            return dist(eng);
        }
        
        double uniform_double() {
            std::uniform_real_distribution dist(-1e6, 1e6);
            return dist(eng);
        }

        std::int64_t uniform_integer() {
            std::uniform_int_distribution<std::int64_t> dist(std::numeric_limits<std::int64_t>::min(), std::numeric_limits<std::int64_t>::max());
            return dist(eng);
        }
        
        char ascii_char() {
            std::uniform_int_distribution<int> dist(32, 126);
            return static_cast<char>(dist(eng));
        }
        
        std::string random_string(size_t max_len = 16) {
            size_t len = uniform_size(0, max_len);
            std::string s;
            s.reserve(len);
            for (size_t i = 0; i < len; i++) 
            s.push_back(ascii_char());
            return s;
        }
    };
    
    Strophe::value random_json_value(rng& r, int depth = 0, int max_depth = 4);
    
    Strophe::value random_primitive(rng& r) {
        switch (r.uniform_size(0, 5)) {
            case 0: return Strophe::value{ nullptr };
            case 1: return Strophe::value{ r.coin() };
            case 2: return Strophe::value{ r.uniform_double() };
            case 3: return Strophe::value{ r.uniform_integer() };
            case 4: {
                auto s = r.random_string();
                return Strophe::value{ s.c_str() };
            }
        }
        return Strophe::value{ nullptr };
    }
    
    Strophe::value random_array(rng& r, int depth, int max_depth) {
        auto res = Strophe::value{};
        auto& arr = res.as_array();
        size_t n = r.uniform_size(0, 8);
        for (size_t i = 0; i < n; i++) 
        arr.emplace_back(random_json_value(r, depth + 1, max_depth));
        return res;
    }
    
    Strophe::value random_object(rng& r, int depth, int max_depth) {
        auto res = Strophe::value{};
        auto& obj = res.as_object();
        size_t n = r.uniform_size(0, 8);
        for (size_t i = 0; i < n; i++) {
            auto key = r.random_string();
            obj.insert_or_assign(key, random_json_value(r, depth + 1, max_depth));
        }
        return res;
    }
    
    Strophe::value random_json_value(rng& r, int depth, int max_depth) {
        if (depth >= max_depth) return random_primitive(r);
        
        size_t choice = r.uniform_size(0, 5);
        switch (choice) {
            case 0:
            case 1:
            return random_primitive(r);
            case 2:
            case 3:
            return random_array(r, depth, max_depth);
            case 4:
            case 5:
            return random_object(r, depth, max_depth);
        }
        return random_primitive(r);
    }

    Strophe::ParseResult parse_str(std::string_view s, const Strophe::ParseOptions& opts = {}) {
        return Strophe::parse(s, opts);
    }

    void expect_ok(std::string_view s, const Strophe::ParseOptions& opts = {}) {
        auto r = parse_str(s, opts);
        REQUIRE(r);
    }

    void expect_fail(std::string_view s, Strophe::ParseError::code code, const Strophe::ParseOptions& opts = {}) {
        auto r = parse_str(s, opts);
        REQUIRE_FALSE(r);
        REQUIRE(r.error().errc == code);
    }
}


TEST_CASE("DOM Dump/parse Round-Trip") {
    rng r;
    
    for (int i = 0; i < 100; i++) {
        Strophe::value original = random_json_value(r);
        
        std::string s = Strophe::dump(original);
        
        auto parsed = Strophe::parse(s);
        REQUIRE(parsed.has_value());

        const Strophe::value& reparsed = parsed.value();

        if (reparsed != original) {
            std::println("Reparsed and Original do not match!");
            std::println("Reparsed: {}", Strophe::dump(reparsed));
            std::println("Original: {}", Strophe::dump(original));
        }
        
        REQUIRE(reparsed == original);
    }
}

TEST_CASE("Parse Primitives") {
    using Strophe::parse;

    auto n = parse("null");
    REQUIRE(n);
    REQUIRE(n->is_null());

    auto t = parse("true");
    REQUIRE(t);
    REQUIRE(t->is_bool());
    REQUIRE(t->as_bool() == true);

    auto num = parse("123.5e-1");
    REQUIRE(num);
    REQUIRE(num->is_double());
    REQUIRE(num->as_number() == Approx(12.35));
}

TEST_CASE("Integers Keep Their Kind") {
    auto r = Strophe::parse("23");
    REQUIRE(r);
    REQUIRE(r->is_integer());
    REQUIRE(r->as_integer() == 23);
    REQUIRE(Strophe::dump(*r) == "23");

    auto big = Strophe::parse("9223372036854775808");
    REQUIRE(big);
    REQUIRE(big->is_double());

    auto frac = Strophe::parse("23.0");
    REQUIRE(frac);
    REQUIRE(frac->is_double());
    REQUIRE(*frac == *r);
}

TEST_CASE("Doubles Dump in Shortest Form") {
    REQUIRE(Strophe::dump(Strophe::value{ 3.14 }) == "3.14");
    REQUIRE(Strophe::dump(Strophe::value{ 0.1 }) == "0.1");
    REQUIRE(Strophe::dump(Strophe::value{ -2.5 }) == "-2.5");
}

TEST_CASE("Parse String Escapes") {
    using Strophe::parse;

    auto r = parse(R"("line\nbreak")");
    REQUIRE(r);
    REQUIRE(r->as_string() == "line\nbreak");

    auto unicode = parse(R"("\u20AC")");
    REQUIRE(unicode);
    REQUIRE(unicode->as_string() == "\xE2\x82\xAC");
}

TEST_CASE("Reject Leading Zeros") {
    using Strophe::parse;
    
    auto r = parse("01");
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().errc == Strophe::ParseError::code::invalid_number);
}

TEST_CASE("Empty Array and Object Round-Trip") {
    Strophe::value arr;
    (void)arr.as_array();

    Strophe::value obj;
    (void)obj.as_object();

    auto r1 = Strophe::parse(Strophe::dump(arr));
    auto r2 = Strophe::parse(Strophe::dump(obj));

    REQUIRE(r1);
    REQUIRE(r1->is_array());
    REQUIRE(r1->as_array().empty());

    REQUIRE(r2);
    REQUIRE(r2->is_object());
    REQUIRE(r2->as_object().empty());
}

TEST_CASE("Object Operator[] Inserts Keys") {
    Strophe::value v;
    v["x"] = 1.0;

    REQUIRE(v.is_object());
    REQUIRE(v["x"].as_number() == Approx(1.0));
}

TEST_CASE("Object Keeps Insertion Order") {
    Strophe::value v;
    v["tag"] = "B";
    v["name"] = 3.14;
    v["age"] = 23;

    REQUIRE(Strophe::dump(v) == R"({"tag":"B","name":3.14,"age":23})");

    v["tag"] = "C";
    REQUIRE(Strophe::dump(v) == R"({"tag":"C","name":3.14,"age":23})");

    REQUIRE(v.as_object().erase("name"));
    REQUIRE_FALSE(v.as_object().erase("name"));
    REQUIRE(Strophe::dump(v) == R"({"tag":"C","age":23})");
}

TEST_CASE("Object Equality Ignores Order") {
    auto a = Strophe::parse(R"({"x":1,"y":[true]})");
    auto b = Strophe::parse(R"({"y":[true],"x":1.0})");
    REQUIRE(a);
    REQUIRE(b);
    REQUIRE(*a == *b);
}

TEST_CASE("Object at Throws on Missing Key") {
    Strophe::value v;
    v["present"] = true;
    REQUIRE_THROWS_AS(v.at("absent"), std::out_of_range);
    REQUIRE(v.find("absent") == nullptr);
    REQUIRE(v.at("present").as_bool());
}

TEST_CASE("Comments Are Rejected") {
    std::string s = "{ // comment\n \"x\": 1 }";

    auto r = Strophe::parse(s);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().errc == Strophe::ParseError::code::unexpected_character);
}

TEST_CASE("Valid Surrogate Pair Parses") {
    auto r = Strophe::parse(R"("\uD83D\uDE00")");
    REQUIRE(r);
    REQUIRE(r->as_string() == "\xF0\x9F\x98\x80");
}

TEST_CASE("Unpaired Surrogate Rejected") {
    auto r = Strophe::parse(R"("\uD83D")");
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == Strophe::ParseError::code::invalid_unicode_escape);
}

TEST_CASE("NaN and Inf Serialize as Null") {
    Strophe::value v_nan{ std::numeric_limits<double>::quiet_NaN() };
    Strophe::value v_inf{ std::numeric_limits<double>::infinity() };

    REQUIRE(Strophe::dump(v_nan) == "null");
    REQUIRE(Strophe::dump(v_inf) == "null");
}

TEST_CASE("Error Position in Range") {
    std::string s = "{\n  \"x\": 1,\n  oops\n}";
    auto r = Strophe::parse(s);
    REQUIRE_FALSE(r);

    const auto& e = r.error();
    REQUIRE(e.offset <= s.size());
    REQUIRE(e.line == 3);
    REQUIRE(e.column >= 1);
    REQUIRE_FALSE(e.msg.empty());
}

TEST_CASE("Value Equality is Structural") {
    Strophe::value a;
    a["x"] = 1.0;
    a["y"].as_array().emplace_back(true);
    
    Strophe::value b;
    b["x"] = 1.0;
    b["y"].as_array().emplace_back(true);
    
    REQUIRE(a == b);
}

TEST_CASE("Parse From Stream") {
    std::istringstream is{ R"({"tag":"A","name":"Class A"})" };
    auto r = Strophe::parse(is);
    REQUIRE(r);
    REQUIRE(r->at("name").as_string() == "Class A");

    std::ostringstream os;
    Strophe::dump(*r, os);
    REQUIRE(os.str() == R"({"tag":"A","name":"Class A"})");
}

struct CountingResource : std::pmr::memory_resource {
    size_t allocs = 0;
    size_t deallocs = 0;

    void* do_allocate(size_t bytes, size_t alignment) override {
        allocs++;
        return std::pmr::get_default_resource()->allocate(bytes, alignment);
    }

    void do_deallocate(void* p, size_t bytes, size_t alignment) override {
        deallocs++;
        return std::pmr::get_default_resource()->deallocate(p, bytes, alignment);
    }

    bool do_is_equal(const std::pmr::memory_resource& other) const noexcept override {
        return this == &other;
    }
};

TEST_CASE("Value Uses Provided memory_resource") {
    CountingResource res;
    Strophe::value v{ &res };

    v["key"] = "a string long enough to defeat the small string buffer";
    v["arr"].as_array().emplace_back(123.0);

    REQUIRE(res.allocs > 0);

    Strophe::value copy{ v };
    REQUIRE(copy.resource() == &res);
}

TEST_CASE("operator[] Index Grows and Fills With Null") {
    Strophe::value v;
    v[3] = 42.0;
    auto& arr = v.as_array();
    REQUIRE(arr.size() == 4);
    REQUIRE(arr[0].is_null());
    REQUIRE(arr[3].as_number() == Approx(42.0));
}

TEST_CASE("RFC8259 - Top-Level Single Value with Whitespace") {
    expect_ok(" 42 ");
    expect_ok("\n\n {\"a\":1}  \t");
    expect_ok("[1, 2, 3]");
    expect_ok("null");
    expect_ok("\"string\"");
}

TEST_CASE("RFC8259 - Trailing Characters are Rejected") {
    expect_fail("null true", Strophe::ParseError::code::trailing_characters);
    expect_fail("{\"a\":1} 0", Strophe::ParseError::code::trailing_characters);
    expect_fail("[] [ ]", Strophe::ParseError::code::trailing_characters);
}

TEST_CASE("RFC8259 - non-JSON Whitespace is Rejected") {
    std::string s = "\xC2\xA0\x01";
    auto r = parse_str(s);
    REQUIRE_FALSE(r);
}

TEST_CASE("RFC8259 - Valid Numbers") {
    for (auto s : {
        "0",
        "123",
        "-0",
        "-123",
        "0.0",
        "-0.1",
        "10.5",
        "1e10",
        "1E10",
        "1e+10",
        "1e-10",
        "-1E-10"
    }) {
        INFO("parsing: " << s);
        auto r = parse_str(s);
        REQUIRE(r);
        REQUIRE(r->is_number());
    }
}

TEST_CASE("RFC8259 - Invalid Numbers are Rejected") {
    // Leading zeros
    expect_fail("01",     Strophe::ParseError::code::invalid_number);
    expect_fail("-01",    Strophe::ParseError::code::invalid_number);

    // Trailing decimal point / no digits
    expect_fail("1.",     Strophe::ParseError::code::invalid_number);
    expect_fail("1.e10",  Strophe::ParseError::code::invalid_number);
    expect_fail(".5",     Strophe::ParseError::code::invalid_number);

    // Malformed exponent
    expect_fail("1e",     Strophe::ParseError::code::invalid_number);
    expect_fail("1e+",    Strophe::ParseError::code::invalid_number);
    expect_fail("1e-",    Strophe::ParseError::code::invalid_number);
    expect_fail("1e1.2",  Strophe::ParseError::code::invalid_number);

    // Leading plus not allowed
    expect_fail("+1",     Strophe::ParseError::code::unexpected_character);
}

TEST_CASE("RFC8259 - Valid String Escapes") {
    expect_ok("\"simple\"");
    expect_ok("\"quote: \\\"\"");
    expect_ok("\"backslash: \\\\\"");
    expect_ok("\"controls: \\b\\f\\n\\r\\t\"");
    expect_ok("\"solidus: \\/\"");
}

TEST_CASE("RFC8259 - Control Characters Must be Escaped") {
    std::string s = "\"Hello\nWorld\""; // raw LF inside
    expect_fail(s, Strophe::ParseError::code::invalid_string);

    std::string s2 = "\"\x01\""; // raw control char
    expect_fail(s2, Strophe::ParseError::code::invalid_string);
}

TEST_CASE("RFC8259 - Invalid Unicode Escapes") {
    // Not enough hex digits
    expect_fail("\"\\u12\"", Strophe::ParseError::code::invalid_unicode_escape);

    // Non-hex chars
    expect_fail("\"\\uZZZZ\"", Strophe::ParseError::code::invalid_unicode_escape);

    // Lone high surrogate
    expect_fail("\"\\uD800\"", Strophe::ParseError::code::invalid_unicode_escape);

    // High surrogate not followed by low surrogate
    expect_fail("\"\\uD800abc\"", Strophe::ParseError::code::invalid_unicode_escape);
}

TEST_CASE("RFC8259 - Invalid Arrays") {
    expect_fail("[", Strophe::ParseError::code::unexpected_end_of_input);
    expect_fail("[1", Strophe::ParseError::code::unexpected_end_of_input);
    expect_fail("[1,", Strophe::ParseError::code::unexpected_end_of_input);
    expect_fail("[1 2]", Strophe::ParseError::code::unexpected_character);
    expect_fail("[,1]", Strophe::ParseError::code::unexpected_character);
}

TEST_CASE("RFC8259 - Trailing Commas are Rejected") {
    expect_fail("[1,]", Strophe::ParseError::code::unexpected_character);
    expect_fail("{\"a\":1,}", Strophe::ParseError::code::unexpected_character);
}

TEST_CASE("RFC8259 - Invalid Objects") {
    expect_fail("{", Strophe::ParseError::code::unexpected_end_of_input);
    expect_fail("{\"a\":1", Strophe::ParseError::code::unexpected_end_of_input);
    expect_fail("{\"a\":1,", Strophe::ParseError::code::unexpected_end_of_input);
    expect_fail("{a:1}", Strophe::ParseError::code::unexpected_character); // key must be string
    expect_fail("{\"a\" 1}", Strophe::ParseError::code::unexpected_character); // missing colon
    expect_fail("{,\"a\":1}", Strophe::ParseError::code::unexpected_character);
}

TEST_CASE("RFC8259 - Object Duplicate Names Last-Wins Semantics") {
    auto r = parse_str("{\"a\":1,\"b\":0,\"a\":2}");
    REQUIRE(r);
    auto& obj = r->as_object();
    REQUIRE(obj.size() == 2);
    REQUIRE(obj.at("a").as_number() == Approx(2.0));
    REQUIRE(obj.begin()->first == "a");
}

TEST_CASE("RFC8259 - Invalid UTF-8 is Rejected") {
    // Overlong encoding of '/'
    std::string s = "\"\xC0\xAF\"";
    expect_fail(s, Strophe::ParseError::code::invalid_string);
}

TEST_CASE("RFC8259 - NaN and Infinity tokens are rejected") {
    expect_fail("NaN",      Strophe::ParseError::code::unexpected_character);
    expect_fail("Infinity", Strophe::ParseError::code::unexpected_character);
    expect_fail("-Infinity", Strophe::ParseError::code::unexpected_character);
}

TEST_CASE("Empty Input is Rejected") {
    expect_fail("", Strophe::ParseError::code::unexpected_end_of_input);
    expect_fail("   \n\t  ", Strophe::ParseError::code::unexpected_end_of_input);
}

TEST_CASE("Max depth is enforced") {
    Strophe::ParseOptions opts{};
    opts.max_depth = 3;

    expect_ok("[[[]]]", opts);
    expect_fail("[[[[]]]]", Strophe::ParseError::code::depth_limit_exceeded, opts);
    expect_ok("{ \"1\": { \"2\": {}}}", opts);
    expect_fail("{ \"1\": { \"2\": { \"3\": {}}}}", Strophe::ParseError::code::depth_limit_exceeded, opts);
}

TEST_CASE("Builtin Conversions") {
    Strophe::value v;
    v["n"] = 23;
    v["d"] = 2.5;
    v["s"] = "text";
    v["xs"] = Strophe::serialize(std::vector<int>{ 1, 2, 3 });
    v["none"] = nullptr;

    REQUIRE(Strophe::field<int>(v, "n") == 23);
    REQUIRE(Strophe::field<double>(v, "n") == Approx(23.0));
    REQUIRE(Strophe::field<double>(v, "d") == Approx(2.5));
    REQUIRE(Strophe::field<std::string>(v, "s") == "text");
    const std::vector<int> xs{ 1, 2, 3 };
    REQUIRE(Strophe::field<std::vector<int>>(v, "xs") == xs);
    REQUIRE_FALSE(Strophe::field<std::optional<int>>(v, "none").has_value());

    REQUIRE_THROWS_AS(Strophe::field<int>(v, "d"), Strophe::convert_error);
    REQUIRE_THROWS_AS(Strophe::field<std::uint8_t>(Strophe::parse(R"({"n":300})").value(), "n"), Strophe::convert_error);
    REQUIRE_THROWS_AS(Strophe::field<std::string>(v, "n"), Strophe::convert_error);
    REQUIRE_THROWS_AS(Strophe::field<int>(v, "missing"), std::out_of_range);
}
