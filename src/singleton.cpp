#include "strophe/singleton.hpp"

#include <format>

namespace Strophe {

    std::expected<void*, CodecError> SingletonGuard::locate(const VariantDescriptor& variant, std::string_view tagged_type, std::string_view tag) {
        if (variant.kind != variant_kind::singleton) {
            return std::unexpected{ CodecError::make(CodecError::code::missing_singleton, tagged_type, tag, std::format("variant '{}' is not a singleton", variant.qualified_name)) };
        }
        if (variant.canonical == nullptr) {
            return std::unexpected{ CodecError::make(CodecError::code::missing_singleton, tagged_type, tag, std::format("no canonical instance for '{}'", variant.qualified_name)) };
        }
        return variant.canonical;
    }

} // namespace Strophe
