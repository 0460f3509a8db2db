#include <print>
#include <string>
#include <variant>
#include <vector>

#include "strophe/strophe.hpp"

namespace shapes {
    struct A { std::string name; };
    struct B { double name{}; int age{}; };
    struct C {
        static C& instance() { static C c; return c; }
    };

    void to_json(Strophe::value& v, const A& a) { v["name"] = a.name; }
    void from_json(const Strophe::value& v, A& a) { a.name = Strophe::field<std::string>(v, "name"); }

    void to_json(Strophe::value& v, const B& b) {
        v["name"] = b.name;
        v["age"] = b.age;
    }
    void from_json(const Strophe::value& v, B& b) {
        b.name = Strophe::field<double>(v, "name");
        b.age = Strophe::field<int>(v, "age");
    }

    using Shape = std::variant<A, B, Strophe::singleton_ref<C>>;
}

int main() {
    Strophe::set_log_level(spdlog::level::debug);

    Strophe::TaggedCodec<shapes::Shape> codec{ { .resolver = Strophe::tag_resolvers::simple_name(), .type_name = "Shape" } };

    std::vector<shapes::Shape> all{ shapes::A{ "Class A" }, shapes::B{ 3.14, 23 }, Strophe::singleton_ref<shapes::C>{} };
    auto text = codec.write_sequence(all);
    if (!text) {
        std::println("Encode error! -> {}", Strophe::describe(text.error()));
        return 1;
    }
    std::println("{}", *text);

    auto back = codec.read_sequence(*text);
    if (!back) {
        std::println("Decode error! -> {}", Strophe::describe(back.error()));
        return 1;
    }
    std::println("decoded {} shapes, C is canonical: {}", back->size(),
        std::get<Strophe::singleton_ref<shapes::C>>(back->back()).is_canonical());

    // Without the element type the variants are written untagged
    std::println("{}", Strophe::dump(Strophe::serialize(all)));

    auto bad = codec.read(R"({"tag":"Z","name":"Class Z"})");
    if (!bad) std::println("{}", Strophe::describe(bad.error()));

    return 0;
}
