#include <catch2/catch_all.hpp>

#include "shapes.hpp"

#include <string>
#include <variant>

using namespace Catch;

namespace counters {

    // Singleton with state that a decode restores
    struct Counter {
        int content = 1;

        static Counter& instance() {
            static Counter c;
            return c;
        }
    };

    void to_json(Strophe::value& v, const Counter& c) { v["content"] = c.content; }
    void from_json(const Strophe::value& v, Counter& c) { c.content = Strophe::field<int>(v, "content"); }

    // Singleton that cannot be copied, so decoding writes straight into it
    class Session {
    public:
        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;

        static Session& instance() {
            static Session s;
            return s;
        }

        std::string user;

    private:
        Session() = default;
    };

    void to_json(Strophe::value& v, const Session& s) { v["user"] = s.user; }
    void from_json(const Strophe::value& v, Session& s) { s.user = Strophe::field<std::string>(v, "user"); }

    struct Idle {
        friend bool operator==(const Idle&, const Idle&) = default;
    };

    void to_json(Strophe::value& v, const Idle&) { v = Strophe::value{ Strophe::object{} }; }
    void from_json(const Strophe::value&, Idle&) {}

    using State = std::variant<Idle, Strophe::singleton_ref<Counter>, Strophe::singleton_ref<Session>>;

    Strophe::TaggedOptions options() {
        return Strophe::TaggedOptions{ .resolver = Strophe::tag_resolvers::simple_name(), .type_name = "State" };
    }

} // namespace counters

TEST_CASE("Singleton Handles Compare by Identity") {
    Strophe::singleton_ref<counters::Counter> a;
    Strophe::singleton_ref<counters::Counter> b{ counters::Counter::instance() };
    REQUIRE(a == b);
    REQUIRE(a.is_canonical());
    REQUIRE(&a.get() == &counters::Counter::instance());

    counters::Counter other;
    Strophe::singleton_ref<counters::Counter> c{ other };
    REQUIRE_FALSE(c == a);
    REQUIRE_FALSE(c.is_canonical());
}

TEST_CASE("Decoding a Singleton Returns the Canonical Instance") {
    Strophe::TaggedCodec<counters::State> codec{ counters::options() };
    auto& canonical = counters::Counter::instance();
    canonical.content = 1;

    auto text = codec.write(counters::State{ Strophe::singleton_ref<counters::Counter>{} });
    REQUIRE(text);
    REQUIRE(*text == R"({"tag":"Counter","content":1})");

    canonical.content = 2;
    auto back = codec.read(*text);
    REQUIRE(back);

    auto& ref = std::get<Strophe::singleton_ref<counters::Counter>>(*back);
    REQUIRE(ref.is_canonical());
    REQUIRE(&ref.get() == &canonical);

    // The record's fields were written back into the shared instance
    REQUIRE(canonical.content == 1);

    ref->content = 5;
    REQUIRE(counters::Counter::instance().content == 5);
    canonical.content = 1;
}

TEST_CASE("Failed Singleton Decode Leaves State Unchanged") {
    Strophe::TaggedCodec<counters::State> codec{ counters::options() };
    auto& canonical = counters::Counter::instance();
    canonical.content = 3;

    auto bad = codec.read(R"({"tag":"Counter","content":"three"})");
    REQUIRE_FALSE(bad);
    REQUIRE(bad.error().errc == Strophe::CodecError::code::malformed_record);
    REQUIRE(bad.error().tag == "Counter");
    REQUIRE(canonical.content == 3);

    auto missing = codec.read(R"({"tag":"Counter"})");
    REQUIRE_FALSE(missing);
    REQUIRE(canonical.content == 3);

    canonical.content = 1;
}

TEST_CASE("Non-Copyable Singleton Decodes In Place") {
    Strophe::TaggedCodec<counters::State> codec{ counters::options() };
    auto& session = counters::Session::instance();
    session.user = "before";

    auto back = codec.read(R"({"tag":"Session","user":"after"})");
    REQUIRE(back);
    REQUIRE(std::get<Strophe::singleton_ref<counters::Session>>(*back).is_canonical());
    REQUIRE(session.user == "after");

    auto text = codec.write(*back);
    REQUIRE(text);
    REQUIRE(*text == R"({"tag":"Session","user":"after"})");
}

TEST_CASE("Fieldless Singleton Inside a Sum Type") {
    Strophe::TaggedCodec<shapes::Shape> codec{ shapes::simple_names() };

    auto back = codec.read(R"({"tag":"C"})");
    REQUIRE(back);
    REQUIRE(*back == shapes::Shape{ Strophe::singleton_ref<shapes::C>{} });

    // Extra fields on a fieldless singleton are ignored
    auto extra = codec.read(R"({"tag":"C","note":"ignored"})");
    REQUIRE(extra);
    REQUIRE(std::get<Strophe::singleton_ref<shapes::C>>(*extra).is_canonical());
}

TEST_CASE("Structured Variants Decode Independently") {
    Strophe::TaggedCodec<counters::State> codec{ counters::options() };

    auto idle = codec.read(R"({"tag":"Idle"})");
    REQUIRE(idle);
    REQUIRE(std::holds_alternative<counters::Idle>(*idle));
}

TEST_CASE("Guard Rejects Variants Without a Canonical Instance") {
    auto d = Strophe::describe<counters::State>("State");
    REQUIRE(d.variants[1].kind == Strophe::variant_kind::singleton);

    auto structured = Strophe::SingletonGuard::locate(d.variants[0], "State", "Idle");
    REQUIRE_FALSE(structured);
    REQUIRE(structured.error().errc == Strophe::CodecError::code::missing_singleton);
    REQUIRE_THAT(structured.error().msg, Matchers::ContainsSubstring("Idle"));

    Strophe::VariantDescriptor orphan = d.variants[1];
    orphan.canonical = nullptr;
    auto located = Strophe::SingletonGuard::locate(orphan, "State", "Counter");
    REQUIRE_FALSE(located);
    REQUIRE(located.error().errc == Strophe::CodecError::code::missing_singleton);

    Strophe::value fields{ Strophe::object{} };
    fields["content"] = 9;
    auto restored = Strophe::SingletonGuard::restore<counters::Counter>(fields, orphan, "State", "Counter");
    REQUIRE_FALSE(restored);
    REQUIRE(restored.error().errc == Strophe::CodecError::code::missing_singleton);
    REQUIRE(counters::Counter::instance().content != 9);
}

TEST_CASE("Guard Rejects a Non-Canonical Instance") {
    auto d = Strophe::describe<counters::State>("State");
    counters::Counter impostor;

    Strophe::VariantDescriptor wrong = d.variants[1];
    wrong.canonical = &impostor;

    Strophe::value fields{ Strophe::object{} };
    fields["content"] = 9;
    auto restored = Strophe::SingletonGuard::restore<counters::Counter>(fields, wrong, "State", "Counter");
    REQUIRE_FALSE(restored);
    REQUIRE(restored.error().errc == Strophe::CodecError::code::missing_singleton);
    REQUIRE(impostor.content == 1);
}

TEST_CASE("Singleton Held by Value Is a Structured Variant") {
    using ByValue = std::variant<counters::Idle, counters::Counter>;
    auto d = Strophe::describe<ByValue>();
    REQUIRE(d.variants[1].kind == Strophe::variant_kind::structured);

    Strophe::TaggedCodec<ByValue> codec{ shapes::simple_names() };
    counters::Counter::instance().content = 1;

    auto back = codec.read(R"({"tag":"Counter","content":4})");
    REQUIRE(back);
    REQUIRE(std::get<counters::Counter>(*back).content == 4);
    REQUIRE(counters::Counter::instance().content == 1);
}
