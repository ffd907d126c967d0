#include "schemareader.hpp"
#include <cmath>
#include <iostream>
#include <limits>

namespace posterheat {

namespace {

bool hasArray(const nlohmann::json& obj, const char* key)
{
    return obj.is_object() && obj.contains(key) && obj[key].is_array();
}

} // namespace

const nlohmann::json& SchemaReader::resultList(const nlohmann::json& task)
{
    // (a) bulk flat export
    if (hasArray(task, "result"))
        return task["result"];

    // (b) per-file export
    if (task.is_object() && task.contains("annotation") && hasArray(task["annotation"], "result"))
        return task["annotation"]["result"];

    // (c) bulk nested export, first annotation wins
    if (hasArray(task, "annotations"))
    {
        const auto& anns = task["annotations"];
        if (!anns.empty() && hasArray(anns.front(), "result"))
            return anns.front()["result"];
    }

    throw SchemaError("Could not find 'result' list in task JSON.");
}

bool SchemaReader::readLabel(const nlohmann::json& value, const char* key, std::string& label)
{
    if (!value.contains(key))
        return false;
    const auto& arr = value[key];
    if (!arr.is_array() || arr.empty() || !arr.front().is_string())
        return false;
    label = arr.front().get<std::string>();
    return true;
}

double SchemaReader::requireNumber(const nlohmann::json& value, const char* key, const std::string& docId)
{
    if (!value.contains(key) || !value[key].is_number())
        throw SchemaError("task '" + docId + "': field '" + key + "' missing or not a number");
    return value[key].get<double>();
}

Box SchemaReader::readBox(const nlohmann::json& value, const std::string& docId)
{
    Box b;
    b.x      = requireNumber(value, "x", docId);
    b.y      = requireNumber(value, "y", docId);
    b.width  = requireNumber(value, "width", docId);
    b.height = requireNumber(value, "height", docId);
    return b;
}

Polygon SchemaReader::readPolygon(const nlohmann::json& value, const std::string& docId)
{
    if (!hasArray(value, "points"))
        throw SchemaError("task '" + docId + "': polygon without 'points' array");

    Polygon poly;
    for (const auto& p : value["points"])
    {
        if (!p.is_array() || p.size() < 2 || !p[0].is_number() || !p[1].is_number())
            throw SchemaError("task '" + docId + "': malformed polygon point " + p.dump());
        poly.points.emplace_back(p[0].get<double>(), p[1].get<double>());
    }
    return poly;
}

std::optional<cv::Size> SchemaReader::readFrame(const nlohmann::json& record)
{
    if (!record.contains("original_width") || !record.contains("original_height"))
        return std::nullopt;
    const auto& w = record["original_width"];
    const auto& h = record["original_height"];
    if (!w.is_number() || !h.is_number())
        return std::nullopt;

    // вне (0, INT_MAX] приведение к int не определено
    constexpr double kMaxSide = std::numeric_limits<int>::max();
    const double wd = w.get<double>();
    const double hd = h.get<double>();
    if (!(wd > 0.0 && wd <= kMaxSide) || !(hd > 0.0 && hd <= kMaxSide))
        return std::nullopt;

    const int wi = static_cast<int>(std::lround(wd));
    const int hi = static_cast<int>(std::lround(hd));
    if (wi <= 0 || hi <= 0)
        return std::nullopt;
    return cv::Size(wi, hi);
}

Document SchemaReader::readDocument(const nlohmann::json& task,
                                    const std::string& id,
                                    const LabelFilter& accept)
{
    Document doc;
    doc.id = id;
    if (doc.id.empty() && task.is_object() && task.contains("id"))
        doc.id = task["id"].is_string() ? task["id"].get<std::string>() : task["id"].dump();

    const nlohmann::json& results = resultList(task);

    for (const auto& r : results)
    {
        if (!r.is_object() || !r.contains("value") || !r["value"].is_object())
            continue;
        const auto& value = r["value"];

        const std::optional<cv::Size> frame = readFrame(r);
        if (frame && !doc.frame)
            doc.frame = frame;

        std::string label;
        if (readLabel(value, "rectanglelabels", label))
        {
            if (accept && !accept(label))
                continue;                           // чужая метка: геометрию не читаем
            doc.shapes.push_back({label, readBox(value, doc.id)});
        }
        else if (readLabel(value, "polygonlabels", label))
        {
            if (accept && !accept(label))
                continue;
            Polygon poly = readPolygon(value, doc.id);
            if (poly.points.size() < 3)
            {
                std::cerr << "[SchemaReader] task '" << doc.id << "': polygon '" << label
                          << "' has " << poly.points.size() << " vertices, dropped\n";
                continue;
            }
            poly.frame = frame;
            doc.shapes.push_back({label, std::move(poly)});
        }
        // прочие типы результатов (textarea, choices, ...) не несут геометрии
    }

    return doc;
}

} // namespace posterheat
