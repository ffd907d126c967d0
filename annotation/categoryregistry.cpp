#include "categoryregistry.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace posterheat {

namespace {

std::string toLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

std::string CategoryRegistry::makeTag(const std::string& name)
{
    std::string tag = toLower(name);
    for (auto& c : tag)
    {
        if (c == '/' || std::isspace(static_cast<unsigned char>(c)))
            c = '_';
    }
    return tag;
}

const CategoryInfo& CategoryRegistry::add(const std::string& name,
                                          const std::string& tag,
                                          const std::vector<std::string>& aliases)
{
    if (name.empty())
        throw std::invalid_argument("CategoryRegistry::add(): empty category name");

    /* 1. заполняем все поля до регистрации */
    auto ci  = std::make_shared<CategoryInfo>();
    ci->id   = static_cast<uint16_t>(ordered_.size() + 1);
    ci->name = name;
    ci->tag  = tag.empty() ? makeTag(name) : makeTag(tag);
    ci->labels.push_back(toLower(name));
    for (const auto& a : aliases)
        ci->labels.push_back(toLower(a));

    if (by_tag_.count(ci->tag))
        throw std::runtime_error("CategoryRegistry: duplicate tag '" + ci->tag + "'");
    for (const auto& l : ci->labels)
    {
        auto it = by_label_.find(l);
        if (it != by_label_.end() && it->second->name != name)
            throw std::runtime_error("CategoryRegistry: label '" + l + "' claimed by '" +
                                     it->second->name + "' and '" + name + "'");
    }

    /* 2. индексы по меткам и тегу */
    const CategoryInfo* raw = ci.get();
    for (const auto& l : ci->labels)
        by_label_[l] = raw;
    by_tag_[ci->tag] = raw;
    ordered_.push_back(std::move(ci));
    return *raw;
}

const CategoryInfo* CategoryRegistry::canonicalize(const std::string& rawLabel) const
{
    auto it = by_label_.find(toLower(rawLabel));
    return it == by_label_.end() ? nullptr : it->second;
}

const CategoryInfo* CategoryRegistry::byTag(const std::string& tag) const
{
    auto it = by_tag_.find(toLower(tag));
    return it == by_tag_.end() ? nullptr : it->second;
}

std::vector<const CategoryInfo*> CategoryRegistry::categories() const
{
    std::vector<const CategoryInfo*> out;
    out.reserve(ordered_.size());
    for (const auto& c : ordered_)
        out.push_back(c.get());
    return out;
}

CategoryRegistry CategoryRegistry::fromPreset(const std::string& preset)
{
    CategoryRegistry reg;
    if (preset == "layout")
    {
        reg.add("Title");
        reg.add("Location");
        reg.add("Time");
        reg.add("Host/organization");
        reg.add("Call-To-Action/Purpose");
        reg.add("Text descriptions/details");
    }
    else if (preset == "image_deco")
    {
        reg.add("Image");
        reg.add("Decoration");
    }
    else if (preset == "image_deco_merged")
    {
        reg.add("Image/Deco", "image_deco", {"image", "decoration"});
    }
    else
    {
        throw std::runtime_error("Unknown category preset '" + preset + "'");
    }
    return reg;
}

CategoryRegistry CategoryRegistry::fromConfig(const DatasetConfig& config)
{
    if (config.categories.empty())
        return fromPreset(config.preset);

    CategoryRegistry reg;
    for (const auto& c : config.categories)
        reg.add(c.name, c.tag, c.labels);
    return reg;
}

std::string CategoryRegistry::defaultSystemPrompt(const std::string& preset)
{
    if (preset == "image_deco")
        return "<IMAGE_HEAT> Predict image & decoration layout.";
    if (preset == "image_deco_merged")
        return "<IMAGE_HEAT> Predict layout of images/decoration.";
    return "<LAYOUT_HEAT> Predict bounding boxes.";
}

} // namespace posterheat
