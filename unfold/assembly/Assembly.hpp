#pragma once

#include "assembly/FlushFit.hpp"
#include "assembly/PartDescriptor.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace Unfold {

/**
 * @brief Immutable, validated list of parts plus their designed contacts
 *
 * Built once at assembly-definition time and then only read, so it can be
 * shared between any number of readers without locking. Part order is the
 * generation order and carries no meaning beyond iteration.
 */
class Assembly {
public:
    /**
     * @brief Validate the parts and take ownership of them
     *
     * Rejects empty or duplicate ids, non-positive dimensions, windows with
     * start offset outside [0,1) or non-positive span, and contacts naming
     * unknown parts. Windows ending after progress 1 are accepted but logged.
     */
    [[nodiscard]] static std::expected<Assembly, LayoutError> Create(
        std::vector<PartDescriptor> parts,
        std::vector<FlushContact> contacts = {});

    [[nodiscard]] const std::vector<PartDescriptor>& GetParts() const { return m_parts; }
    [[nodiscard]] const std::vector<FlushContact>& GetContacts() const { return m_contacts; }
    [[nodiscard]] std::size_t GetPartCount() const { return m_parts.size(); }

    /**
     * @brief Find a part by id
     * @return nullptr if no such part
     */
    [[nodiscard]] const PartDescriptor* Find(std::string_view id) const;

    /**
     * @brief Parts belonging to a tier, in generation order
     */
    [[nodiscard]] std::vector<const PartDescriptor*> GetTier(ConstructionTier tier) const;

    /**
     * @brief Union of all assembled boxes
     */
    [[nodiscard]] AABB GetAssembledBounds() const;

    /**
     * @brief Scene description for an external renderer
     */
    [[nodiscard]] nlohmann::json ToJson() const;

private:
    Assembly() = default;

    std::vector<PartDescriptor> m_parts;
    std::vector<FlushContact> m_contacts;
    std::unordered_map<std::string, std::size_t> m_index;
};

} // namespace Unfold
