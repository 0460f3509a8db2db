#include "strophe/sum_type.hpp"

#include <cstdlib>
#include <memory>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace Strophe {

    namespace {
        std::string demangle_raw(const char* name) {
#if defined(__GNUG__)
            int status = 0;
            std::unique_ptr<char, void (*)(void*)> buf{ abi::__cxa_demangle(name, nullptr, nullptr, &status), std::free };
            if (status == 0 && buf) return std::string{ buf.get() };
            return std::string{ name };
#else
            // MSVC names are already readable, minus the class/struct keyword
            std::string_view raw{ name };
            for (std::string_view prefix : { std::string_view{ "class " }, std::string_view{ "struct " } }) {
                if (raw.starts_with(prefix)) {
                    raw.remove_prefix(prefix.size());
                    break;
                }
            }
            return std::string{ raw };
#endif
        }
    } // namespace

    std::string demangle(const std::type_info& ti) { return demangle_raw(ti.name()); }
    std::string demangle(std::type_index ti) { return demangle_raw(ti.name()); }

    std::string_view simple_name(std::string_view qualified) noexcept {
        std::size_t depth = 0;
        std::size_t start = 0;
        for (std::size_t i = 0; i < qualified.size(); ++i) {
            char c = qualified[i];
            if (c == '<' || c == '(') ++depth;
            else if ((c == '>' || c == ')') && depth > 0) --depth;
            else if (depth == 0 && c == ':' && i + 1 < qualified.size() && qualified[i + 1] == ':') {
                start = i + 2;
                ++i;
            }
        }
        return qualified.substr(start);
    }

} // namespace Strophe
