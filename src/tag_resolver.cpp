#include "strophe/tag_resolver.hpp"

#include <utility>

namespace Strophe::tag_resolvers {

    TagResolver simple_name() {
        return [](const VariantDescriptor& d) {
            return std::string{ Strophe::simple_name(d.qualified_name) };
        };
    }

    TagResolver qualified_name() {
        return [](const VariantDescriptor& d) { return d.qualified_name; };
    }

    TagResolver explicit_tags(std::map<std::type_index, std::string> tags) {
        return [tags = std::move(tags)](const VariantDescriptor& d) {
            auto it = tags.find(d.type);
            if (it == tags.end()) return std::string{};
            return it->second;
        };
    }

    TagResolver index() {
        return [](const VariantDescriptor& d) { return std::to_string(d.index); };
    }

} // namespace Strophe::tag_resolvers
