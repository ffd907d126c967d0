#ifndef POSTERHEAT_SCHEMAREADER_H
#define POSTERHEAT_SCHEMAREADER_H

#include <functional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "shape.hpp"

namespace posterheat {

/** Raised when a task does not expose a usable result list. */
class SchemaError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/** Decides whether a raw label is worth reading; empty = accept everything. */
using LabelFilter = std::function<bool(const std::string&)>;

/**
 * @brief Normalises the Label Studio export flavours into Document objects.
 *
 * Three layouts are recognised, checked in this order:
 *   1. bulk flat export     { "result": [...] }
 *   2. per-task file export { "annotation": { "result": [...] } }
 *   3. bulk nested export   { "annotations": [ { "result": [...] }, ... ] }
 */
class SchemaReader {
public:
    /**
     * Locate the list of result records of one task.
     * @throws SchemaError when none of the three layouts is present.
     */
    static const nlohmann::json& resultList(const nlohmann::json& task);

    /**
     * Convert a task into labelled shapes.
     *
     * Records without rectangle/polygon labels are ignored, and so are records
     * whose label the filter rejects (their geometry is never looked at). An
     * accepted record with missing or non-numeric geometry throws SchemaError.
     *
     * @param task    decoded task object
     * @param id      identifier used in diagnostics; when empty the task "id"
     *                field is used if present
     * @param accept  label filter, e.g. membership in the active category set
     */
    static Document readDocument(const nlohmann::json& task,
                                 const std::string& id = "",
                                 const LabelFilter& accept = {});

private:
    static bool readLabel(const nlohmann::json& value, const char* key, std::string& label);
    static double requireNumber(const nlohmann::json& value, const char* key, const std::string& docId);
    static Box readBox(const nlohmann::json& value, const std::string& docId);
    static Polygon readPolygon(const nlohmann::json& value, const std::string& docId);
    static std::optional<cv::Size> readFrame(const nlohmann::json& record);
};

} // namespace posterheat

#endif // POSTERHEAT_SCHEMAREADER_H
