#include "rowcodec.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <locale>
#include <sstream>

namespace posterheat {

namespace {

std::string toLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parseValues(std::istringstream& iss, std::vector<double>& values)
{
    std::string token;
    while (iss >> token)
    {
        std::istringstream num(token);
        num.imbue(std::locale::classic());
        double v = 0.0;
        if (!(num >> v) || !num.eof())
            return false;
        values.push_back(v);
    }
    return true;
}

void dumpSpaced(const nlohmann::ordered_json& j, std::string& out)
{
    if (j.is_object())
    {
        out += '{';
        bool first = true;
        for (auto it = j.begin(); it != j.end(); ++it)
        {
            if (!first)
                out += ", ";
            first = false;
            out += nlohmann::ordered_json(it.key()).dump();
            out += ": ";
            dumpSpaced(it.value(), out);
        }
        out += '}';
    }
    else if (j.is_array())
    {
        out += '[';
        bool first = true;
        for (const auto& item : j)
        {
            if (!first)
                out += ", ";
            first = false;
            dumpSpaced(item, out);
        }
        out += ']';
    }
    else
    {
        out += j.dump();        // скаляры: экранирование nlohmann
    }
}

} // namespace

std::string RowCodec::formatLine(const HeatLine& line)
{
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << line.key << std::fixed << std::setprecision(1);

    // построчно: верхняя строка первой, слева направо
    for (int y = 0; y < line.grid.rows; ++y)
        for (int x = 0; x < line.grid.cols; ++x)
            oss << ' ' << (line.grid(y, x) + 0.0);
    return oss.str();
}

std::string RowCodec::formatUserBlock(const HeatmapRow& row)
{
    std::string out = kFrameLine;
    for (const auto& line : row)
    {
        out += '\n';
        out += formatLine(line);
    }
    return out;
}

nlohmann::ordered_json RowCodec::makeRecord(const std::string& systemPrompt,
                                            const std::string& userBlock)
{
    auto turn = [](const char* role, const std::string& content) {
        nlohmann::ordered_json t;
        t["role"] = role;
        t["content"] = content;
        return t;
    };

    nlohmann::ordered_json record;
    record["messages"] = nlohmann::ordered_json::array({
        turn("system", systemPrompt),
        turn("user", userBlock),
        turn("assistant", "")        // пустая цель для обучения
    });
    return record;
}

std::string RowCodec::dumpRecord(const nlohmann::ordered_json& record)
{
    std::string out;
    dumpSpaced(record, out);
    return out;
}

std::optional<std::string> RowCodec::userContent(const nlohmann::json& record)
{
    if (!record.is_object() || !record.contains("messages") || !record["messages"].is_array())
        return std::nullopt;

    for (const auto& m : record["messages"])
    {
        if (!m.is_object())
            continue;
        if (m.value("role", std::string()) == "user" && m.contains("content") && m["content"].is_string())
            return m["content"].get<std::string>();
    }
    return std::nullopt;
}

HeatmapRow RowCodec::parseUserBlock(const std::string& text, cv::Size gridSize)
{
    HeatmapRow row;
    const std::size_t expected = static_cast<std::size_t>(gridSize.area());

    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line))
    {
        std::istringstream iss(line);
        std::string key;
        if (!(iss >> key))
            continue;
        key = toLower(key);
        if (key == "frame_pct")
            continue;

        std::vector<double> values;
        if (!parseValues(iss, values) || values.empty() || values.size() != expected)
            continue;                               // битая строка

        cv::Mat1d grid(gridSize);
        std::copy(values.begin(), values.end(), grid.begin());

        auto it = std::find_if(row.begin(), row.end(),
                               [&](const HeatLine& l){ return l.key == key; });
        if (it != row.end())
            it->grid = grid;
        else
            row.push_back({key, grid});
    }
    return row;
}

} // namespace posterheat
