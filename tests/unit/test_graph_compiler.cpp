#include <gtest/gtest.h>
#include "graph/graph_compiler.hpp"
#include "record/record_store.hpp"
#include "record/type_registry.hpp"

using namespace lodbook;
using json = nlohmann::json;

class GraphCompilerTest : public ::testing::Test {
protected:
    InMemoryRecordStore store;
    TypeRegistry types;
    AdvisoryLog advisories;
    std::unique_ptr<BuildContext> context;
    std::unique_ptr<GraphCompiler> compiler;

    void SetUp() override {
        store = InMemoryRecordStore::from_json(json::array({
            {
                {"name", "James Minahan"},
                {"type", "person"},
                {"birthPlace", {{"name", "Ballina"}}},
                {"occupation", json::array({"labourer", "miner", "carter"})},
                {"knows", json::array({{{"name", "Mary Minahan"}}})}
            },
            {{"name", "Mary Minahan"}, {"type", "person"}, {"id", "https://other.org/mary"}},
            {{"name", "Ballina"}, {"type", "place"}},
            {{"name", "Hall Photo"}, {"type", "image"}, {"image", "hall.jpg"}},
            {{"name", "Hall Opening"}, {"type", "event"}, {"image", {{"name", "Hall Photo"}}}},
            {{"name", "The Vessel"}, {"type", "ship"}}
        }));

        types = TypeRegistry::from_json({
            {"person", {{"type", "Person"}, {"collection", "people"}}},
            {"place", {{"type", "Place"}, {"collection", "places"}}},
            {"image", {{"type", "ImageObject"}, {"collection", "images"}}},
            {"event", {{"type", "Event"}, {"collection", "events"}}}
        });

        context = std::make_unique<BuildContext>(store, types, advisories,
                                                 "https://example.org", "/book");
        compiler = std::make_unique<GraphCompiler>(*context);
    }

    GraphNode hydrate_json(const json& j) {
        return compiler->hydrate(Record::from_json(j));
    }
};

// ==========================================
// Identity and type
// ==========================================

TEST_F(GraphCompilerTest, NodeIdentity) {
    GraphNode node = compiler->hydrate(*store.find("James Minahan"));
    EXPECT_EQ(node.id, "https://example.org/book/people/james-minahan/");
    EXPECT_EQ(node.type, "Person");
    EXPECT_EQ(node.name, "James Minahan");
    EXPECT_FALSE(node.has_property("type"));
}

TEST_F(GraphCompilerTest, ExplicitIdIsKept) {
    GraphNode node = compiler->hydrate(*store.find("Mary Minahan"));
    EXPECT_EQ(node.id, "https://other.org/mary");
}

TEST_F(GraphCompilerTest, UnconfiguredTypePassesThrough) {
    GraphNode node = compiler->hydrate(*store.find("The Vessel"));
    EXPECT_EQ(node.type, "ship");
    EXPECT_EQ(node.id, "https://example.org/book/ship/the-vessel/");
    EXPECT_EQ(advisories.count(AdvisoryKind::UNCONFIGURED_TYPE), 1);
}

TEST_F(GraphCompilerTest, CompileEntityAddsPageLink) {
    GraphNode node = compiler->compile_entity(*store.find("James Minahan"));
    EXPECT_EQ(node.properties["mainEntityOfPage"],
              "https://example.org/book/people/james-minahan/index.html");
}

TEST_F(GraphCompilerTest, Determinism) {
    GraphNode first = compiler->hydrate(*store.find("James Minahan"));
    GraphNode second = compiler->hydrate(*store.find("James Minahan"));
    EXPECT_EQ(first.id, second.id);
    EXPECT_EQ(first.to_json().dump(), second.to_json().dump());
}

// ==========================================
// References
// ==========================================

TEST_F(GraphCompilerTest, NestedReferenceIsHydrated) {
    GraphNode node = compiler->hydrate(*store.find("James Minahan"));
    json expected = {
        {"name", "Ballina"},
        {"@id", "https://example.org/book/places/ballina/"},
        {"@type", "Place"}
    };
    EXPECT_EQ(node.properties["birthPlace"], expected);
}

TEST_F(GraphCompilerTest, EnclosingIdIsNotOverwritten) {
    GraphNode node = hydrate_json({
        {"name", "Someone"},
        {"type", "person"},
        {"birthPlace", {{"name", "Ballina"}, {"id", "urn:place:ballina"}}}
    });
    EXPECT_EQ(node.properties["birthPlace"]["@id"], "urn:place:ballina");
    EXPECT_EQ(node.properties["birthPlace"]["@type"], "Place");
    EXPECT_FALSE(node.properties["birthPlace"].contains("id"));
}

TEST_F(GraphCompilerTest, RecordIdDoesNotReachNestedLinks) {
    GraphNode node = hydrate_json({
        {"name", "Someone"},
        {"id", "urn:person:someone"},
        {"type", "person"},
        {"birthPlace", {{"name", "Ballina"}}}
    });
    EXPECT_EQ(node.id, "urn:person:someone");
    EXPECT_EQ(node.properties["birthPlace"]["@id"], "https://example.org/book/places/ballina/");
    EXPECT_FALSE(node.has_property("@id"));
    EXPECT_FALSE(node.has_property("name"));
}

TEST_F(GraphCompilerTest, EnclosingTypeIsNotOverwritten) {
    GraphNode node = hydrate_json({
        {"name", "Someone"},
        {"birthPlace", {{"name", "Ballina"}, {"type", "town"}}}
    });
    EXPECT_EQ(node.properties["birthPlace"]["@type"], "town");
    EXPECT_EQ(node.properties["birthPlace"]["@id"], "https://example.org/book/places/ballina/");
}

TEST_F(GraphCompilerTest, UnresolvedReferenceDegradesToName) {
    GraphNode node = hydrate_json({
        {"name", "Someone"},
        {"birthPlace", {{"name", "Atlantis"}}}
    });
    json expected = {{"name", "Atlantis"}};
    EXPECT_EQ(node.properties["birthPlace"], expected);
    EXPECT_EQ(advisories.count(AdvisoryKind::UNRESOLVED_REFERENCE), 1);
}

TEST_F(GraphCompilerTest, ImageLinkCarriesImage) {
    GraphNode node = compiler->hydrate(*store.find("Hall Opening"));
    const json& image = node.properties["image"];
    EXPECT_EQ(image["@type"], "ImageObject");
    EXPECT_EQ(image["@id"], "https://example.org/book/images/hall-photo/");
    EXPECT_EQ(image["image"], "hall.jpg");
}

TEST_F(GraphCompilerTest, NonImageLinkHasNoImage) {
    GraphNode node = compiler->hydrate(*store.find("James Minahan"));
    EXPECT_FALSE(node.properties["birthPlace"].contains("image"));
}

TEST_F(GraphCompilerTest, NestedIdAndTypeAreRenamed) {
    GraphNode node = hydrate_json({
        {"name", "Someone"},
        {"address", {{"id", "urn:addr:1"}, {"type", "place"}, {"street", "Main St"}}}
    });
    json expected = {{"@id", "urn:addr:1"}, {"@type", "Place"}, {"street", "Main St"}};
    EXPECT_EQ(node.properties["address"], expected);
}

TEST_F(GraphCompilerTest, HydrateByName) {
    auto node = compiler->hydrate(std::string("Ballina"));
    ASSERT_TRUE(node.has_value());
    EXPECT_EQ(node->type, "Place");

    EXPECT_FALSE(compiler->hydrate(std::string("Atlantis")).has_value());
    EXPECT_EQ(advisories.count(AdvisoryKind::UNRESOLVED_REFERENCE), 1);
}

TEST_F(GraphCompilerTest, HydrateLink) {
    json link = compiler->hydrate_link("Mary Minahan");
    EXPECT_EQ(link["name"], "Mary Minahan");
    EXPECT_EQ(link["@id"], "https://other.org/mary");
    EXPECT_EQ(link["@type"], "Person");
}

// ==========================================
// Lists
// ==========================================

TEST_F(GraphCompilerTest, ListOfScalarsIsUnchanged) {
    GraphNode node = compiler->hydrate(*store.find("James Minahan"));
    EXPECT_EQ(node.properties["occupation"], json::array({"labourer", "miner", "carter"}));
}

TEST_F(GraphCompilerTest, ListOfReferencesCollapsesToLinks) {
    GraphNode node = compiler->hydrate(*store.find("James Minahan"));
    const json& knows = node.properties["knows"];
    ASSERT_TRUE(knows.is_array());
    ASSERT_EQ(knows.size(), 1);
    EXPECT_EQ(knows[0]["name"], "Mary Minahan");
    EXPECT_EQ(knows[0]["@id"], "https://other.org/mary");
}

TEST_F(GraphCompilerTest, ListOfNamesBecomesValueLists) {
    // Each element hydrates to name, @id and @type; the element keys are
    // dropped, leaving one list of values per element
    GraphNode node = hydrate_json({
        {"name", "Someone"},
        {"visited", {{"name", json::array({"Ballina", "Atlantis"})}}}
    });

    const json& names = node.properties["visited"]["name"];
    ASSERT_EQ(names.size(), 2);
    EXPECT_EQ(names[0], json::array({"Ballina", "https://example.org/book/places/ballina/", "Place"}));
    EXPECT_EQ(names[1], "Atlantis");
}

TEST_F(GraphCompilerTest, EmptyList) {
    GraphNode node = hydrate_json({{"name", "Someone"}, {"tags", json::array()}});
    EXPECT_EQ(node.properties["tags"], json::array());
}
