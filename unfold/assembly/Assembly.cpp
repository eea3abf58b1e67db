#include "assembly/Assembly.hpp"
#include "core/Logger.hpp"

namespace Unfold {

std::expected<Assembly, LayoutError> Assembly::Create(std::vector<PartDescriptor> parts,
                                                      std::vector<FlushContact> contacts) {
    Assembly assembly;
    assembly.m_index.reserve(parts.size());

    for (std::size_t i = 0; i < parts.size(); ++i) {
        const PartDescriptor& part = parts[i];

        if (auto valid = ValidatePart(part); !valid) {
            return std::unexpected(valid.error());
        }

        if (!assembly.m_index.emplace(part.id, i).second) {
            return std::unexpected(LayoutError{LayoutErrorCode::DuplicateId,
                "part id '" + part.id + "' is used more than once"});
        }

        if (!part.window.ReachesEnd()) {
            UNFOLD_LOG_WARN("Part '{}' window ends at {:.3f}; it will not reach its assembled position",
                            part.id, part.window.End());
        }
    }

    for (const auto& contact : contacts) {
        for (const std::string* id : {&contact.lower, &contact.upper}) {
            if (!assembly.m_index.contains(*id)) {
                return std::unexpected(LayoutError{LayoutErrorCode::UnknownContactPart,
                    "contact references unknown part '" + *id + "'"});
            }
        }
    }

    assembly.m_parts = std::move(parts);
    assembly.m_contacts = std::move(contacts);
    return assembly;
}

const PartDescriptor* Assembly::Find(std::string_view id) const {
    auto it = m_index.find(std::string(id));
    return it != m_index.end() ? &m_parts[it->second] : nullptr;
}

std::vector<const PartDescriptor*> Assembly::GetTier(ConstructionTier tier) const {
    std::vector<const PartDescriptor*> result;
    for (const auto& part : m_parts) {
        if (part.tier == tier) {
            result.push_back(&part);
        }
    }
    return result;
}

AABB Assembly::GetAssembledBounds() const {
    AABB bounds;
    for (const auto& part : m_parts) {
        bounds.Expand(part.GetAssembledBounds());
    }
    return bounds;
}

nlohmann::json Assembly::ToJson() const {
    nlohmann::json parts = nlohmann::json::array();
    for (const auto& part : m_parts) {
        parts.push_back(part.ToJson());
    }
    return {{"parts", parts}};
}

} // namespace Unfold
