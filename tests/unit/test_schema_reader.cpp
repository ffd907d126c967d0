/**
 * @file test_schema_reader.cpp
 * @brief Unit tests for Label Studio export normalisation
 */

#include "annotation/schemareader.hpp"

#include <gtest/gtest.h>

using namespace posterheat;
using nlohmann::json;

namespace {

const char* kBoxRecord = R"({
    "type": "rectanglelabels",
    "original_width": 600, "original_height": 900,
    "value": {"x": 10, "y": 10, "width": 20, "height": 10, "rotation": 0,
              "rectanglelabels": ["Title"]}
})";

const char* kPolygonRecord = R"({
    "type": "polygonlabels",
    "original_width": 600, "original_height": 900,
    "value": {"points": [[0, 0], [50, 0], [50, 50], [0, 50]],
              "polygonlabels": ["Image"]}
})";

json results(std::initializer_list<const char*> records)
{
    json arr = json::array();
    for (const char* r : records)
        arr.push_back(json::parse(r));
    return arr;
}

} // anonymous namespace

// =============================================================================
// resultList
// =============================================================================

TEST(SchemaResultListTest, FlatLayout) {
    json task = {{"result", results({kBoxRecord})}};
    EXPECT_EQ(SchemaReader::resultList(task).size(), 1u);
}

TEST(SchemaResultListTest, PerFileLayout) {
    json task = {{"annotation", {{"result", results({kBoxRecord, kPolygonRecord})}}}};
    EXPECT_EQ(SchemaReader::resultList(task).size(), 2u);
}

TEST(SchemaResultListTest, NestedLayoutUsesFirstAnnotation) {
    json task = {{"annotations", json::array({
        {{"result", results({kPolygonRecord})}},
        {{"result", results({kBoxRecord, kBoxRecord})}}
    })}};
    const json& list = SchemaReader::resultList(task);
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0]["type"], "polygonlabels");
}

TEST(SchemaResultListTest, FlatResultWinsOverAnnotation) {
    json task = {
        {"annotation", {{"result", results({kBoxRecord, kBoxRecord})}}},
        {"result", results({kPolygonRecord})}
    };
    const json& list = SchemaReader::resultList(task);
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0]["type"], "polygonlabels");
}

TEST(SchemaResultListTest, AnnotationWinsOverAnnotations) {
    json task = {
        {"annotations", json::array({{{"result", results({kBoxRecord, kBoxRecord})}}})},
        {"annotation", {{"result", results({kPolygonRecord})}}}
    };
    EXPECT_EQ(SchemaReader::resultList(task).size(), 1u);
}

TEST(SchemaResultListTest, NonArrayResultFallsThrough) {
    json task = {
        {"result", "not a list"},
        {"annotation", {{"result", results({kBoxRecord})}}}
    };
    EXPECT_EQ(SchemaReader::resultList(task).size(), 1u);
}

TEST(SchemaResultListTest, EmptyResultListIsValid) {
    json task = {{"result", json::array()}};
    EXPECT_TRUE(SchemaReader::resultList(task).empty());
}

TEST(SchemaResultListTest, MissingResultThrows) {
    EXPECT_THROW(SchemaReader::resultList(json::object()), SchemaError);
    EXPECT_THROW(SchemaReader::resultList(json{{"annotations", json::array()}}), SchemaError);
    EXPECT_THROW(SchemaReader::resultList(json{{"annotation", {{"id", 3}}}}), SchemaError);
    EXPECT_THROW(SchemaReader::resultList(json::array()), SchemaError);
}

TEST(SchemaResultListTest, ErrorMessageNamesResultList) {
    try {
        SchemaReader::resultList(json{{"data", {{"image", "x.png"}}}});
        FAIL() << "SchemaError expected";
    } catch (const SchemaError& e) {
        EXPECT_STREQ(e.what(), "Could not find 'result' list in task JSON.");
    }
}

// =============================================================================
// readDocument
// =============================================================================

TEST(SchemaReadDocumentTest, ReadsBoxesAndPolygons) {
    json task = {{"result", results({kBoxRecord, kPolygonRecord})}};
    const Document doc = SchemaReader::readDocument(task, "poster_1");

    EXPECT_EQ(doc.id, "poster_1");
    ASSERT_EQ(doc.shapes.size(), 2u);
    ASSERT_TRUE(doc.frame.has_value());
    EXPECT_EQ(*doc.frame, cv::Size(600, 900));

    EXPECT_EQ(doc.shapes[0].label, "Title");
    const Box* box = std::get_if<Box>(&doc.shapes[0].shape);
    ASSERT_NE(box, nullptr);
    EXPECT_DOUBLE_EQ(box->x, 10.0);
    EXPECT_DOUBLE_EQ(box->right(), 30.0);
    EXPECT_DOUBLE_EQ(box->bottom(), 20.0);

    EXPECT_EQ(doc.shapes[1].label, "Image");
    const Polygon* poly = std::get_if<Polygon>(&doc.shapes[1].shape);
    ASSERT_NE(poly, nullptr);
    ASSERT_EQ(poly->points.size(), 4u);
    EXPECT_EQ(poly->points[2], cv::Point2d(50, 50));
    ASSERT_TRUE(poly->frame.has_value());
    EXPECT_EQ(*poly->frame, cv::Size(600, 900));
}

TEST(SchemaReadDocumentTest, IdFallsBackToTaskId) {
    json task = {{"id", 17}, {"result", json::array()}};
    EXPECT_EQ(SchemaReader::readDocument(task).id, "17");
}

TEST(SchemaReadDocumentTest, IgnoresRecordsWithoutGeometryLabels) {
    json task = {{"result", json::array({
        {{"type", "textarea"}, {"value", {{"text", json::array({"hello"})}}}},
        {{"type", "choices"}, {"value", {{"choices", json::array({"poster"})}}}},
        {{"type", "rectanglelabels"}, {"value", {{"x", 1}, {"y", 1}, {"width", 1}, {"height", 1},
                                                 {"rectanglelabels", json::array()}}}},
        "garbage",
        {{"type", "rectanglelabels"}}
    })}};
    EXPECT_TRUE(SchemaReader::readDocument(task).shapes.empty());
}

TEST(SchemaReadDocumentTest, MissingBoxFieldThrows) {
    json task = {{"result", json::array({
        {{"value", {{"x", 1}, {"y", 1}, {"width", 1}, {"rectanglelabels", json::array({"Title"})}}}}
    })}};
    EXPECT_THROW(SchemaReader::readDocument(task), SchemaError);
}

TEST(SchemaReadDocumentTest, NonNumericBoxFieldThrows) {
    json task = {{"result", json::array({
        {{"value", {{"x", "10"}, {"y", 1}, {"width", 1}, {"height", 1},
                    {"rectanglelabels", json::array({"Title"})}}}}
    })}};
    EXPECT_THROW(SchemaReader::readDocument(task), SchemaError);
}

TEST(SchemaReadDocumentTest, MalformedPolygonPointThrows) {
    json task = {{"result", json::array({
        {{"value", {{"points", json::array({json::array({0, 0}), json::array({1}), json::array({2, 2})})},
                    {"polygonlabels", json::array({"Image"})}}}}
    })}};
    EXPECT_THROW(SchemaReader::readDocument(task), SchemaError);
}

TEST(SchemaReadDocumentTest, DegeneratePolygonIsDropped) {
    json task = {{"result", json::array({
        {{"value", {{"points", json::array({json::array({0, 0}), json::array({10, 10})})},
                    {"polygonlabels", json::array({"Image"})}}}}
    })}};
    EXPECT_TRUE(SchemaReader::readDocument(task).shapes.empty());
}

TEST(SchemaReadDocumentTest, PolygonWithoutFrameKeepsNoFrame) {
    json task = {{"result", json::array({
        {{"value", {{"points", json::array({json::array({0, 0}), json::array({10, 0}), json::array({0, 10})})},
                    {"polygonlabels", json::array({"Image"})}}}}
    })}};
    const Document doc = SchemaReader::readDocument(task);
    ASSERT_EQ(doc.shapes.size(), 1u);
    EXPECT_FALSE(std::get<Polygon>(doc.shapes[0].shape).frame.has_value());
    EXPECT_FALSE(doc.frame.has_value());
}

TEST(SchemaReadDocumentTest, MissingResultThrowsSchemaError) {
    EXPECT_THROW(SchemaReader::readDocument(json{{"data", json::object()}}, "t"), SchemaError);
}

TEST(SchemaReadDocumentTest, RejectedLabelsAreNotValidated) {
    json task = {{"result", json::array({
        json::parse(kBoxRecord),
        {{"value", {{"x", 5}, {"y", 5}, {"rectanglelabels", json::array({"Logo"})}}}},
        {{"value", {{"points", "broken"}, {"polygonlabels", json::array({"Logo"})}}}}
    })}};
    const LabelFilter onlyTitle = [](const std::string& label) { return label == "Title"; };

    const Document doc = SchemaReader::readDocument(task, "p", onlyTitle);
    ASSERT_EQ(doc.shapes.size(), 1u);
    EXPECT_EQ(doc.shapes[0].label, "Title");

    // без фильтра битая геометрия по-прежнему ошибка
    EXPECT_THROW(SchemaReader::readDocument(task, "p"), SchemaError);
}

TEST(SchemaReadDocumentTest, OversizedFrameIsIgnored) {
    json record = json::parse(kPolygonRecord);
    record["original_width"] = 1e12;
    json task = {{"result", json::array({record})}};

    const Document doc = SchemaReader::readDocument(task);
    ASSERT_EQ(doc.shapes.size(), 1u);
    EXPECT_FALSE(std::get<Polygon>(doc.shapes[0].shape).frame.has_value());
    EXPECT_FALSE(doc.frame.has_value());
}

TEST(SchemaReadDocumentTest, SubPixelFrameIsIgnored) {
    json record = json::parse(kPolygonRecord);
    record["original_height"] = 0.3;
    json task = {{"result", json::array({record})}};

    EXPECT_FALSE(SchemaReader::readDocument(task).frame.has_value());
}
