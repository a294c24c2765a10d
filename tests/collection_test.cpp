#include "collection.hpp"
#include "errors.hpp"
#include "test_utils.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

using namespace ocdb;
using namespace ocdb::test_utils;

namespace {

Material
material_with(const std::string &symbol, const std::string &name) {
    Material material = make_test_material(false);
    material.symbol = symbol;
    material.name = name;
    return material;
}

} // namespace

// Test fixture for Collection tests
class CollectionTest : public ::testing::Test {
  protected:
    void SetUp() override {
        collection_.name = "elements";
        collection_.add_item(material_with("Co", "Cobalt"));
        collection_.add_item(material_with("Ni", "Nickel"));
        collection_.add_item(material_with("Fe", "Iron"));
    }

    Collection collection_;
};

TEST(CollectionConstructionTest, NewCollectionIsEmpty) {
    Collection const collection;
    EXPECT_TRUE(collection.empty());
    EXPECT_EQ(collection.size(), 0u);
    EXPECT_EQ(collection.begin(), collection.end());
    EXPECT_EQ(collection.duplicate_policy(), DuplicatePolicy::Reject);
    EXPECT_FALSE(collection.contains("Co"));
}

TEST_F(CollectionTest, IteratesInInsertionOrder) {
    std::vector<std::string> names;
    for (const auto &material : collection_) { names.push_back(material.name); }
    EXPECT_EQ(names, (std::vector<std::string>{ "Cobalt", "Nickel", "Iron" }));
    EXPECT_EQ(collection_.symbols(), (std::vector<std::string>{ "Co", "Ni", "Fe" }));
    EXPECT_EQ(collection_.size(), 3u);
}

TEST_F(CollectionTest, LookupBySymbol) {
    EXPECT_TRUE(collection_.contains("Ni"));
    EXPECT_EQ(collection_.at("Ni").name, "Nickel");

    const Material *iron = collection_.find("Fe");
    ASSERT_NE(iron, nullptr);
    EXPECT_EQ(iron->name, "Iron");
}

TEST_F(CollectionTest, UnknownSymbol) {
    EXPECT_FALSE(collection_.contains("Cu"));
    EXPECT_EQ(collection_.find("Cu"), nullptr);
    EXPECT_THROW(collection_.at("Cu"), std::out_of_range);
}

TEST_F(CollectionTest, SymbolsAreCaseSensitive) {
    EXPECT_FALSE(collection_.contains("co"));
    EXPECT_FALSE(collection_.contains("CO"));
    EXPECT_NO_THROW(collection_.add_item(material_with("CO", "Carbon monoxide")));
    EXPECT_EQ(collection_.size(), 4u);
    EXPECT_EQ(collection_.at("Co").name, "Cobalt");
}

TEST_F(CollectionTest, DuplicateSymbolIsRejected) {
    try {
        collection_.add_item(material_with("Co", "Another cobalt"));
        FAIL() << "Expected DuplicateSymbol";
    } catch (const DuplicateSymbol &e) {
        EXPECT_EQ(e.symbol(), "Co");
    }
    EXPECT_EQ(collection_.size(), 3u);
    EXPECT_EQ(collection_.at("Co").name, "Cobalt");
}

TEST(CollectionReplaceTest, DuplicateReplacesInPlace) {
    Collection collection(DuplicatePolicy::Replace);
    collection.add_item(material_with("Co", "Cobalt"));
    collection.add_item(material_with("Ni", "Nickel"));

    Material replacement = material_with("Co", "Cobalt (2024)");
    replacement.n_data.data[0] = 0.5;
    collection.add_item(replacement);

    EXPECT_EQ(collection.size(), 2u);
    EXPECT_EQ(collection.symbols(), (std::vector<std::string>{ "Co", "Ni" }));
    EXPECT_EQ(collection.at("Co").name, "Cobalt (2024)");
    EXPECT_DOUBLE_EQ(collection.at("Co").n_data.data[0], 0.5);
}

TEST(CollectionSymbolTest, EmptySymbolIsMissingInput) {
    Collection collection;
    try {
        collection.add_item(Material());
        FAIL() << "Expected MissingInput";
    } catch (const MissingInput &e) {
        EXPECT_EQ(e.input(), "symbol");
    }
    EXPECT_TRUE(collection.empty());
}

TEST(CollectionSymbolTest, InvalidSymbolIsRejected) {
    Collection collection;
    EXPECT_THROW(collection.add_item(material_with("1abc", "Leading digit")), std::invalid_argument);
    EXPECT_THROW(collection.add_item(material_with("Co Ni", "Space")), std::invalid_argument);
    EXPECT_THROW(collection.add_item(material_with("Co-Ni", "Dash")), std::invalid_argument);
    EXPECT_TRUE(collection.empty());
}

TEST(CollectionSymbolTest, IdentifierLikeSymbols) {
    EXPECT_TRUE(is_valid_symbol("Co"));
    EXPECT_TRUE(is_valid_symbol("SiO2"));
    EXPECT_TRUE(is_valid_symbol("_private"));
    EXPECT_TRUE(is_valid_symbol("Al2O3_amorphous"));
    EXPECT_FALSE(is_valid_symbol(""));
    EXPECT_FALSE(is_valid_symbol("2Co"));
    EXPECT_FALSE(is_valid_symbol("Co.1"));
}

TEST_F(CollectionTest, StoredMaterialsCanBeRead) {
    EXPECT_NEAR(collection_.at("Ni").n_at(15.0), 0.95, 1e-12);
}
