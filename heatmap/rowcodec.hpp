#ifndef POSTERHEAT_ROWCODEC_H
#define POSTERHEAT_ROWCODEC_H

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "heatrow.hpp"

namespace posterheat {

/**
 * @brief Text wire format of heat rows and the three-turn training record.
 *
 * User block layout:
 *   FRAME_PCT 100 100
 *   <key> v0 v1 ... v(H*W-1)      one line per category, row-major, "%.1f"
 */
class RowCodec {
public:
    static constexpr const char* kFrameLine = "FRAME_PCT 100 100";

    /** One heat line, "<key> v0 v1 ...". */
    static std::string formatLine(const HeatLine& line);

    /** FRAME_PCT line followed by every heat line, '\n'-separated, no trailing newline. */
    static std::string formatUserBlock(const HeatmapRow& row);

    /** {"messages":[system, user, assistant=""]} with role before content. */
    static nlohmann::ordered_json makeRecord(const std::string& systemPrompt,
                                             const std::string& userBlock);

    /**
     * One JSONL line of a record: ", " between items and ": " after keys,
     * UTF-8 kept as is. Byte-compatible with datasets already in use.
     */
    static std::string dumpRecord(const nlohmann::ordered_json& record);

    /** Content of the "user" turn of a record, if any. */
    static std::optional<std::string> userContent(const nlohmann::json& record);

    /**
     * Parse heat lines back out of a user block (or a prompt file).
     *
     * Blank lines, the FRAME_PCT line, single-token lines, lines with a value
     * count different from gridSize.area() and lines with unparsable numbers
     * are skipped. Keys are lower-cased; a repeated key replaces the earlier
     * one in place.
     */
    static HeatmapRow parseUserBlock(const std::string& text, cv::Size gridSize);
};

} // namespace posterheat

#endif // POSTERHEAT_ROWCODEC_H
