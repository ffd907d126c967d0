#ifndef POSTERHEAT_CATEGORYREGISTRY_H
#define POSTERHEAT_CATEGORYREGISTRY_H

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "../config.hpp"

namespace posterheat {

/* Информация о категории, расширяемая без перекомпиляции */
struct CategoryInfo
{
    uint16_t                 id;      // порядковый номер (1..N), задаёт порядок вывода
    std::string              name;    // "Host/organization"
    std::string              tag;     // "host_organization"
    std::vector<std::string> labels;  // принимаемые метки в нижнем регистре

    /** Key of the serialized heat line, e.g. "title_heat". */
    std::string heatKey() const { return tag + "_heat"; }
};

/**
 * @brief Closed, ordered set of categories active for one pipeline run.
 *
 * Raw annotation labels are matched case-insensitively and exactly against
 * every category's name and aliases.
 */
class CategoryRegistry
{
public:
    /** Build a registry from a built-in preset: layout, image_deco, image_deco_merged. */
    static CategoryRegistry fromPreset(const std::string& preset);

    /** Build from the configuration: explicit categories win over the preset. */
    static CategoryRegistry fromConfig(const DatasetConfig& config);

    /** Default system prompt of a preset. */
    static std::string defaultSystemPrompt(const std::string& preset);

    /** Lower-case, '/' and whitespace replaced by '_'. */
    static std::string makeTag(const std::string& name);

    /** Append one category; its id is the next position. */
    const CategoryInfo& add(const std::string& name,
                            const std::string& tag = "",
                            const std::vector<std::string>& aliases = {});

    /** Category of a raw label, or nullptr when the label is not in the set. */
    const CategoryInfo* canonicalize(const std::string& rawLabel) const;

    /** Category by its tag (as used in serialized rows), or nullptr. */
    const CategoryInfo* byTag(const std::string& tag) const;

    /** Categories in declaration order. */
    std::vector<const CategoryInfo*> categories() const;

    std::size_t size() const { return ordered_.size(); }
    bool empty() const { return ordered_.empty(); }

private:
    std::vector<std::shared_ptr<const CategoryInfo>>      ordered_;
    std::unordered_map<std::string, const CategoryInfo*>  by_label_;
    std::unordered_map<std::string, const CategoryInfo*>  by_tag_;
};

} // namespace posterheat

#endif // POSTERHEAT_CATEGORYREGISTRY_H
