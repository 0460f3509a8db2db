#include "strophe/registry.hpp"
#include "strophe/log.hpp"

#include <format>
#include <utility>

namespace Strophe {

    namespace {
        std::unexpected<CodecError> build_failure(CodecError::code c, std::string_view type, std::string_view tag, std::string_view msg) {
            CodecError e = CodecError::make(c, type, tag, msg);
            logger()->error("registry build failed: {}", describe(e));
            return std::unexpected{ std::move(e) };
        }
    } // namespace

    std::expected<VariantRegistry, CodecError> VariantRegistry::build(TaggedTypeDescriptor type, const TagResolver& resolver) {
        using enum CodecError::code;

        if (!type.enumerable || type.variants.empty()) {
            return build_failure(not_a_sum_type, type.name, {}, "variant set is not closed and enumerable");
        }
        for (const auto& v : type.variants) {
            if (!v.record_shaped) {
                return build_failure(not_a_sum_type, type.name, {}, std::format("variant '{}' does not encode as a record", v.qualified_name));
            }
        }
        if (!resolver) {
            return build_failure(unresolvable_variant, type.name, {}, "no tag resolver configured");
        }

        VariantRegistry reg;
        reg.m_Name = std::move(type.name);
        reg.m_Tags.reserve(type.variants.size());

        for (std::size_t i = 0; i < type.variants.size(); ++i) {
            const VariantDescriptor& v = type.variants[i];
            std::string tag = resolver(v);
            if (tag.empty()) {
                return build_failure(unresolvable_variant, reg.m_Name, {}, std::format("tag resolver produced no tag for variant '{}'", v.qualified_name));
            }
            auto [it, inserted] = reg.m_ByTag.try_emplace(tag, i);
            if (!inserted) {
                const auto& first = type.variants[it->second].qualified_name;
                return build_failure(duplicate_tag, reg.m_Name, tag, std::format("variants '{}' and '{}' both resolve to this tag", first, v.qualified_name));
            }
            reg.m_ByType.try_emplace(v.type, i);
            logger()->debug("{}: registered tag '{}' for variant '{}'", reg.m_Name, tag, v.qualified_name);
            reg.m_Tags.push_back(std::move(tag));
        }

        reg.m_Variants = std::move(type.variants);
        return reg;
    }

    std::expected<const VariantDescriptor*, CodecError> VariantRegistry::resolve_tag(std::string_view tag) const {
        auto it = m_ByTag.find(tag);
        if (it == m_ByTag.end()) {
            return std::unexpected{ CodecError::make(CodecError::code::unknown_variant, m_Name, tag, "no variant is registered under this tag") };
        }
        return &m_Variants[it->second];
    }

    std::expected<std::string_view, CodecError> VariantRegistry::resolve_variant(std::size_t index) const {
        if (index >= m_Tags.size()) {
            return std::unexpected{ CodecError::make(CodecError::code::unresolvable_variant, m_Name, {}, std::format("alternative {} is not registered", index)) };
        }
        return std::string_view{ m_Tags[index] };
    }

    std::expected<std::string_view, CodecError> VariantRegistry::resolve_variant(std::type_index type) const {
        auto it = m_ByType.find(type);
        if (it == m_ByType.end()) {
            return std::unexpected{ CodecError::make(CodecError::code::unresolvable_variant, m_Name, {}, std::format("type '{}' is not a variant of this type", demangle(type))) };
        }
        return std::string_view{ m_Tags[it->second] };
    }

    const std::string& VariantRegistry::name() const noexcept { return m_Name; }
    std::size_t VariantRegistry::size() const noexcept { return m_Variants.size(); }
    const std::vector<VariantDescriptor>& VariantRegistry::variants() const noexcept { return m_Variants; }
    const std::vector<std::string>& VariantRegistry::tags() const noexcept { return m_Tags; }

} // namespace Strophe
