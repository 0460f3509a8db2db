#pragma once


/*
    ----------------------------------------------------------------
    Strophe - Tagged sum-type codec for C++ (variants <-> JSON records)
    ----------------------------------------------------------------

    This is the main public header for Strophe

    It brings together:
        - The dynamic JSON DOM type:    `Strophe::value`, `Strophe::object`
        - Parsing and writing:          `Strophe::parse(...)`, `Strophe::dump(...)`
        - Conversion utilities:         `to_json` / `from_json` support
        - Sum-type reflection:          `Strophe::describe<T>()`, `Strophe::singleton_ref<S>`
        - Naming strategies:            `Strophe::tag_resolvers::*`
        - The variant registry:         `Strophe::VariantRegistry`
        - The codec:                    `Strophe::TaggedCodec<T>`
        - Error reporting types:        `Strophe::ParseError`, `Strophe::CodecError`
        - Configuration options:        `Strophe::ParseOptions`, `Strophe::TaggedOptions`
        - Diagnostics:                  `Strophe::logger()`

    -------------------
    High-Level Overview
    -------------------
    - Tagged Types:
        * A closed sum type is a `std::variant` of record-shaped classes
        * Singleton cases are held through `singleton_ref<S>` and always
          decode to `S::instance()`
    - Registry:
        * Built once per codec from the variant set and a tag resolver
        * Duplicate tags, unnamed variants and non-enumerable types are
          rejected when the registry is built, not on first lookup
    - Codec:
        * `CodecResult<value> encode(const T&)` / `CodecResult<T> decode(const value&)`
        * `write` / `read` for JSON text, `*_sequence` for arrays
        * Tags are either wrapped around the variant's fields or kept as
          the variant's own property, one model per codec
    - Conversion:
        * Variants plug their fields in through `to_json` and `from_json`
          customization points defined in `convert.hpp`

    ------------
    Design Goals
    ------------
    - Modern C++:
        * Uses C++20/23 features (`std::expected`, concepts) and `std::pmr`
          for allocator-aware records
    - Correctness:
        * Tags are bijective within a Tagged Type; `decode(encode(v)) == v`
    - Composability:
        * No global configuration; domain types carry no serialization
          annotations, the codec's options hold them

    -----
    Usage
    -----
        #include <strophe/strophe.hpp>

        struct A { std::string name; };
        void to_json(Strophe::value& v, const A& a) { v["name"] = a.name; }
        void from_json(const Strophe::value& v, A& a) { a.name = Strophe::field<std::string>(v, "name"); }

        int main() {
            Strophe::TaggedCodec<std::variant<A>> codec{ { .resolver = Strophe::tag_resolvers::simple_name() } };
            auto text = codec.write(A{ "Class A" });
            if (!text) {
                std::println("Encode Error: {}", Strophe::describe(text.error()));
                return 1;
            }
            std::println("{}", *text); // {"tag":"A","name":"Class A"}
        }

    Include this header if you want the full Strophe API. For finer-grained
    control or faster build times, you can include individual headers such
    as `value.hpp`, `json.hpp`, `convert.hpp` and `codec.hpp` directly
*/

#include "strophe/config.hpp"
#include "strophe/value.hpp"
#include "strophe/error.hpp"
#include "strophe/options.hpp"
#include "strophe/json.hpp"
#include "strophe/convert.hpp"
#include "strophe/log.hpp"
#include "strophe/sum_type.hpp"
#include "strophe/tag_resolver.hpp"
#include "strophe/registry.hpp"
#include "strophe/singleton.hpp"
#include "strophe/codec.hpp"
