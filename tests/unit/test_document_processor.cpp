#include <gtest/gtest.h>
#include "linking/document_processor.hpp"
#include "linking/graph_assembler.hpp"
#include "graph/graph_compiler.hpp"
#include "record/record_store.hpp"
#include "record/type_registry.hpp"

using namespace lodbook;
using json = nlohmann::json;

class DocumentProcessorTest : public ::testing::Test {
protected:
    InMemoryRecordStore store;
    TypeRegistry types;
    AdvisoryLog advisories;
    std::unique_ptr<BuildContext> context;
    JsonLdCodec codec;

    void SetUp() override {
        store = InMemoryRecordStore::from_json(json::array({
            {{"name", "James Minahan"}, {"type", "person"}, {"birthPlace", {{"name", "Ballina"}}}},
            {{"name", "Ballina"}, {"type", "place"}}
        }));
        types = TypeRegistry::from_json({
            {"person", {{"type", "Person"}, {"collection", "people"}}},
            {"place", {{"type", "Place"}, {"collection", "places"}}}
        });
        context = std::make_unique<BuildContext>(store, types, advisories, "https://example.org");
    }

    static DocumentInfo arrival() {
        DocumentInfo info;
        info.title = "Arrival";
        info.chapter = "1";
        info.url = "/chapters/arrival/";
        return info;
    }

    static std::string chapter_source() {
        return "<div id=\"text\">"
               "<p>{% lod %}James Minahan{% endlod %} arrived in {% lod %}Ballina{% endlod %}.</p>"
               "<p>James Minahan stayed.</p>"
               "<blockquote><p>A quotation.</p></blockquote>"
               "</div>";
    }
};

// ==========================================
// Loading
// ==========================================

TEST_F(DocumentProcessorTest, LoadRendersMarkers) {
    DocumentProcessor processor(*context, codec);
    NarrativeDocument doc = processor.load(arrival(), chapter_source());

    auto blocks = doc.text_blocks();
    ASSERT_EQ(blocks.size(), 3);
    EXPECT_EQ(inner_html(*blocks[0]),
              "<a class=\"lod-link\" data-name=\"James Minahan\" data-collection=\"people\" "
              "property=\"name\" href=\"/people/james-minahan/\">James Minahan</a> arrived in "
              "<a class=\"lod-link\" data-name=\"Ballina\" data-collection=\"places\" "
              "property=\"name\" href=\"/places/ballina/\">Ballina</a>.");
    EXPECT_EQ(inner_html(*blocks[1]), "James Minahan stayed.");
    EXPECT_TRUE(advisories.empty());
}

// ==========================================
// Processing
// ==========================================

TEST_F(DocumentProcessorTest, ProcessReport) {
    DocumentProcessor processor(*context, codec);
    NarrativeDocument doc = processor.load(arrival(), chapter_source());
    DocumentReport report = processor.process(doc);

    EXPECT_EQ(report.url, "/chapters/arrival/");
    EXPECT_EQ(report.references, 2);
    EXPECT_EQ(report.links_added, 1);
    EXPECT_EQ(report.entities, 2);
}

TEST_F(DocumentProcessorTest, BlocksAreNumbered) {
    DocumentProcessor processor(*context, codec);
    NarrativeDocument doc = processor.load(arrival(), chapter_source());
    processor.process(doc);

    EXPECT_NE(doc.html().find_by_id("para-0"), nullptr);
    EXPECT_NE(doc.html().find_by_id("para-1"), nullptr);
    ASSERT_NE(doc.html().find_by_id("para-2"), nullptr);
    EXPECT_EQ(doc.html().find_by_id("para-2")->text_content(), "A quotation.");
    ASSERT_NE(doc.html().find_by_id("quote-0"), nullptr);
    EXPECT_TRUE(doc.html().find_by_id("quote-0")->is_element("blockquote"));
}

TEST_F(DocumentProcessorTest, SecondOccurrenceIsLinked) {
    DocumentProcessor processor(*context, codec);
    NarrativeDocument doc = processor.load(arrival(), chapter_source());
    processor.process(doc);

    const HtmlNode* second = doc.html().find_by_id("para-1");
    ASSERT_NE(second, nullptr);
    ASSERT_FALSE(second->children.empty());
    EXPECT_TRUE(second->children[0]->is_element("a"));
    EXPECT_EQ(second->children[0]->attribute("data-name"), "James Minahan");
}

TEST_F(DocumentProcessorTest, DocumentGraph) {
    DocumentProcessor processor(*context, codec);
    NarrativeDocument doc = processor.load(arrival(), chapter_source());
    processor.process(doc);

    ASSERT_TRUE(doc.has_graph());
    const GraphNode& graph = doc.graph();
    EXPECT_EQ(graph.id, "https://example.org/chapters/arrival/");
    EXPECT_EQ(graph.type, "WebPage");
    EXPECT_EQ(graph.name, "Chapter 1: Arrival");

    const json& mentions = graph.properties.at("mentions");
    ASSERT_EQ(mentions.size(), 2);

    bool found_james = false;
    for (const auto& mention : mentions) {
        if (mention["name"] == "James Minahan") {
            found_james = true;
            EXPECT_EQ(mention["@id"], "https://example.org/people/james-minahan/");
            EXPECT_EQ(mention["@type"], "Person");
            EXPECT_EQ(mention["birthPlace"]["@id"], "https://example.org/places/ballina/");
        }
    }
    EXPECT_TRUE(found_james);
}

TEST_F(DocumentProcessorTest, UnresolvedMarkerLeavesNoMention) {
    DocumentProcessor processor(*context, codec);
    NarrativeDocument doc = processor.load(arrival(),
        "<div id=\"text\"><p>{% lod %}Nobody{% endlod %} was here.</p></div>");
    DocumentReport report = processor.process(doc);

    EXPECT_EQ(report.references, 0);
    EXPECT_TRUE(doc.graph().properties.at("mentions").empty());
    EXPECT_EQ(inner_html(*doc.text_blocks()[0]), "Nobody was here.");
    EXPECT_EQ(advisories.count(AdvisoryKind::UNRESOLVED_REFERENCE), 1);
}

TEST_F(DocumentProcessorTest, MarkedOccurrenceLinksTheRest) {
    DocumentProcessor processor(*context, codec);
    std::vector<NarrativeDocument> documents;
    documents.push_back(processor.load(arrival(),
        "<div id=\"text\"><p>{% lod %}James Minahan{% endlod %} arrived in 1891. "
        "Later, James Minahan left.</p></div>"));
    DocumentReport report = processor.process(documents[0]);
    EXPECT_EQ(report.links_added, 1);

    auto links = find_elements(documents[0].html().root(), "a");
    ASSERT_EQ(links.size(), 2);
    EXPECT_EQ(links[1]->attribute("href"), links[0]->attribute("href"));
    EXPECT_EQ(links[1]->text_content(), "James Minahan");

    MentionExtractor extractor;
    auto mentions = extractor.extract(documents[0], "James Minahan");
    ASSERT_EQ(mentions.size(), 2);
    EXPECT_EQ(mentions[0].context, "<em>James Minahan</em> arrived in 1891. Later, James");
    EXPECT_EQ(mentions[1].context, "Minahan arrived in 1891. Later, <em>James Minahan</em> left.");

    GraphCompiler compiler(*context);
    EntityPage page;
    page.title = "James Minahan";
    page.graph = compiler.compile_entity(*store.find("James Minahan"));

    GraphAssembler assembler;
    const GraphNode& graph = assembler.enrich(page, documents);
    ASSERT_EQ(graph.properties.at("mentionedBy").size(), 1);
    EXPECT_EQ(graph.properties.at("mentionedBy")[0]["id"], documents[0].graph().id);
    EXPECT_EQ(page.contexts.size(), 2);
}

// ==========================================
// Embedding
// ==========================================

TEST_F(DocumentProcessorTest, PageDataIsEmbedded) {
    DocumentProcessor processor(*context, codec);
    NarrativeDocument doc = processor.load(arrival(), chapter_source());
    processor.process(doc);

    const HtmlNode* script = doc.html().find_by_id("page-data");
    ASSERT_NE(script, nullptr);
    EXPECT_TRUE(script->is_element("script"));
    EXPECT_EQ(script->attribute("type"), "application/ld+json");
    ASSERT_NE(script->parent, nullptr);
    EXPECT_TRUE(script->parent->is_element("body"));

    json data = json::parse(script->text_content());
    EXPECT_EQ(data, codec.encode(doc.graph()));
    EXPECT_EQ(data["@context"], "http://schema.org/");
    EXPECT_EQ(data["@graph"]["name"], "Chapter 1: Arrival");
}

TEST_F(DocumentProcessorTest, StylesAreAddedToHead) {
    std::vector<CollectionStyle> styles = {{"people", "#aa0000"}};
    DocumentProcessor processor(*context, codec, styles);

    EXPECT_EQ(processor.styles_css(),
              ".people { background-color: #aa0000; border-color: #aa0000}\n"
              ".people.inverse { background-color: #ffffff; color: #aa0000}\n");

    NarrativeDocument doc = processor.load(arrival(), chapter_source());
    processor.process(doc);

    HtmlNode* style = doc.html().find_first("style");
    ASSERT_NE(style, nullptr);
    EXPECT_TRUE(style->parent->is_element("head"));
    EXPECT_EQ(style->text_content(), processor.styles_css());
}

TEST_F(DocumentProcessorTest, NoStylesWithoutCollections) {
    DocumentProcessor processor(*context, codec);
    NarrativeDocument doc = processor.load(arrival(), chapter_source());
    processor.process(doc);
    EXPECT_EQ(doc.html().find_first("style"), nullptr);
}

// ==========================================
// JsonLdCodec
// ==========================================

TEST(JsonLdCodecTest, EncodeWrapsGraph) {
    GraphNode node;
    node.id = "https://example.org/people/a/";
    node.type = "Person";
    node.name = "A";

    JsonLdCodec codec(json::object({{"@vocab", "http://schema.org/"}}));
    json encoded = codec.encode(node);
    EXPECT_EQ(encoded["@context"]["@vocab"], "http://schema.org/");
    EXPECT_EQ(encoded["@graph"]["@id"], "https://example.org/people/a/");
    EXPECT_EQ(codec.media_type(), "application/ld+json");
}

TEST(JsonLdCodecTest, EmptyContextFallsBack) {
    EXPECT_EQ(JsonLdCodec(nullptr).context(), "http://schema.org/");
    EXPECT_EQ(JsonLdCodec("").context(), "http://schema.org/");
    EXPECT_EQ(JsonLdCodec(json::object()).context(), "http://schema.org/");
}

TEST(JsonLdCodecTest, ScriptSafeSerialization) {
    GraphNode node;
    node.id = "urn:x";
    node.type = "WebPage";
    node.name = "</script><b>";

    JsonLdCodec codec;
    std::string text = codec.serialize_for_script(node);
    EXPECT_EQ(text.find("</"), std::string::npos);
    EXPECT_NE(text.find("<\\/script>"), std::string::npos);
    EXPECT_EQ(json::parse(text)["@graph"]["name"], "</script><b>");
}
