#include <gtest/gtest.h>
#include "record/record.hpp"
#include "record/record_store.hpp"
#include "record/type_registry.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace lodbook;

// ==========================================
// PropertyValue Tests
// ==========================================

TEST(PropertyValueTest, Classification) {
    EXPECT_TRUE(PropertyValue::from_json("text").is_scalar());
    EXPECT_TRUE(PropertyValue::from_json(1891).is_scalar());
    EXPECT_TRUE(PropertyValue::from_json({{"name", "Hall"}}).is_reference());
    EXPECT_EQ(PropertyValue::from_json({{"street", "Main"}}).kind(), PropertyValue::Kind::OBJECT);
    EXPECT_TRUE(PropertyValue::from_json(nlohmann::json::array({"a", "b"})).is_list());
}

TEST(PropertyValueTest, ScalarText) {
    EXPECT_EQ(PropertyValue::from_json("1891-02-01").scalar_text(), "1891-02-01");
    EXPECT_EQ(PropertyValue::from_json(42).scalar_text(), "42");
}

TEST(PropertyValueTest, WrongKindAccessThrows) {
    PropertyValue value = PropertyValue::from_json("text");
    EXPECT_THROW(value.entries(), std::logic_error);
    EXPECT_THROW(value.items(), std::logic_error);
    EXPECT_EQ(value.get("name"), nullptr);
}

// ==========================================
// Record Tests
// ==========================================

TEST(RecordTest, FromJson) {
    Record record = Record::from_json({
        {"name", "James Minahan"},
        {"type", "person"},
        {"birthPlace", {{"name", "Ballina"}}},
        {"description", "Labourer"}
    });

    EXPECT_EQ(record.name, "James Minahan");
    EXPECT_EQ(record.type, "person");
    EXPECT_FALSE(record.has_explicit_id());
    EXPECT_EQ(record.properties.size(), 2);
    ASSERT_NE(record.property("birthPlace"), nullptr);
    EXPECT_TRUE(record.property("birthPlace")->is_reference());
    EXPECT_EQ(record.property("type"), nullptr);
}

TEST(RecordTest, JsonLdKeys) {
    Record record = Record::from_json({
        {"name", "Photo"},
        {"@type", "image"},
        {"@id", "https://example.org/photo"}
    });
    EXPECT_EQ(record.type, "image");
    EXPECT_EQ(record.id, "https://example.org/photo");
    EXPECT_TRUE(record.properties.empty());
}

TEST(RecordTest, MissingNameThrows) {
    EXPECT_THROW(Record::from_json({{"type", "person"}}), std::invalid_argument);
    EXPECT_THROW(Record::from_json({{"name", 7}}), std::invalid_argument);
}

// ==========================================
// InMemoryRecordStore Tests
// ==========================================

TEST(RecordStoreTest, FromArray) {
    auto store = InMemoryRecordStore::from_json(nlohmann::json::array({
        {{"name", "A"}, {"type", "person"}},
        {{"name", "B"}, {"type", "place"}}
    }));
    EXPECT_EQ(store.size(), 2);
    ASSERT_NE(store.find("B"), nullptr);
    EXPECT_EQ(store.find("B")->type, "place");
    EXPECT_EQ(store.find("b"), nullptr);
    EXPECT_TRUE(store.declared_context().is_null());
}

TEST(RecordStoreTest, FromGraphKeepsContext) {
    auto store = InMemoryRecordStore::from_json({
        {"@context", "http://schema.org/"},
        {"@graph", nlohmann::json::array({{{"name", "A"}}})}
    });
    EXPECT_EQ(store.size(), 1);
    EXPECT_EQ(store.declared_context(), "http://schema.org/");
}

TEST(RecordStoreTest, DuplicateKeepsFirst) {
    auto store = InMemoryRecordStore::from_json(nlohmann::json::array({
        {{"name", "A"}, {"type", "person"}},
        {{"name", "A"}, {"type", "place"}},
        {{"type", "nameless"}}
    }));
    EXPECT_EQ(store.size(), 1);
    EXPECT_EQ(store.find("A")->type, "person");
}

TEST(RecordStoreTest, RejectsNonArray) {
    EXPECT_THROW(InMemoryRecordStore::from_json({{"name", "A"}}), std::runtime_error);
}

TEST(RecordStoreTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "lodbook_records_test.json";
    {
        std::ofstream out(path);
        out << R"([{"name": "A", "type": "person"}])";
    }
    auto store = InMemoryRecordStore::load_from_json(path.string());
    EXPECT_EQ(store.size(), 1);
    std::filesystem::remove(path);

    EXPECT_THROW(InMemoryRecordStore::load_from_json(path.string()), std::runtime_error);
}

// ==========================================
// TypeRegistry Tests
// ==========================================

TEST(TypeRegistryTest, FromJson) {
    auto types = TypeRegistry::from_json({
        {"person", {{"type", "Person"}, {"collection", "people"}, {"template", "person"}}},
        {"place", {{"type", "Place"}}}
    });

    EXPECT_EQ(types.size(), 2);
    EXPECT_EQ(types.graph_type("person"), "Person");
    EXPECT_EQ(types.collection("person"), "people");
    EXPECT_EQ(types.get("person")->template_name, "person");
    EXPECT_EQ(types.collection("place"), "place");
}

TEST(TypeRegistryTest, UnconfiguredPassesThrough) {
    TypeRegistry types;
    EXPECT_FALSE(types.has("ship"));
    EXPECT_EQ(types.graph_type("ship"), "ship");
    EXPECT_EQ(types.collection("ship"), "ship");
    EXPECT_FALSE(types.get("ship").has_value());
}

TEST(TypeRegistryTest, MalformedEntryThrows) {
    EXPECT_THROW(TypeRegistry::from_json({{"person", "Person"}}), std::invalid_argument);
    EXPECT_THROW(TypeRegistry::from_json(nlohmann::json::array()), std::invalid_argument);
}
