// File: tests/storage/basket_reader_test.cpp
#include "storage/basket_reader.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <chrono>
#include <unistd.h>

namespace arminer {
namespace {

using Transactions = std::vector<std::vector<std::string>>;

class BasketReaderTest : public ::testing::Test {
protected:
    std::string temp_path_ = "/tmp/arminer_basket_reader_test_" + std::to_string(getpid()) + "_" +
        std::to_string(std::chrono::system_clock::now().time_since_epoch().count()) + ".txt";

    void TearDown() override {
        std::filesystem::remove(temp_path_);
    }

    void WriteFile(const std::string& content) {
        std::ofstream file(temp_path_);
        file << content;
    }
};

// ============================================================================
// Basket layout
// ============================================================================

TEST_F(BasketReaderTest, ReadsOneTransactionPerLine) {
    std::istringstream in("milk,bread\nbutter\nmilk,bread,butter\n");
    BasketReader reader;

    Transactions expected = {{"milk", "bread"}, {"butter"}, {"milk", "bread", "butter"}};
    EXPECT_EQ(expected, reader.Read(in));
}

TEST_F(BasketReaderTest, TrimsItemsAndSkipsBlankAndCommentLines) {
    std::istringstream in("# groceries\n  milk ,  bread  \n\n   \nbeer,,chips\n");
    BasketReader reader;

    Transactions expected = {{"milk", "bread"}, {"beer", "chips"}};
    EXPECT_EQ(expected, reader.Read(in));
}

TEST_F(BasketReaderTest, CustomSeparator) {
    BasketReader::Config config;
    config.separator = ';';
    BasketReader reader(config);

    std::istringstream in("whole milk;rolls/buns\n");
    Transactions expected = {{"whole milk", "rolls/buns"}};
    EXPECT_EQ(expected, reader.Read(in));
}

TEST_F(BasketReaderTest, HeaderLineSkipped) {
    BasketReader::Config config;
    config.has_header = true;
    BasketReader reader(config);

    std::istringstream in("items\nmilk,bread\n");
    Transactions expected = {{"milk", "bread"}};
    EXPECT_EQ(expected, reader.Read(in));
}

// ============================================================================
// Single layout
// ============================================================================

TEST_F(BasketReaderTest, SingleLayoutGroupsByTransactionId) {
    BasketReader::Config config;
    config.format = DatasetFormat::SINGLE;
    BasketReader reader(config);

    std::istringstream in("t2,bread\nt1,milk\nt2,butter\nt1,bread\n");
    Transactions expected = {{"bread", "butter"}, {"milk", "bread"}};
    EXPECT_EQ(expected, reader.Read(in));
}

TEST_F(BasketReaderTest, SingleLayoutWithHeader) {
    BasketReader::Config config;
    config.format = DatasetFormat::SINGLE;
    config.has_header = true;
    BasketReader reader(config);

    std::istringstream in("transaction,item\n1,milk\n1,bread\n");
    Transactions expected = {{"milk", "bread"}};
    EXPECT_EQ(expected, reader.Read(in));
}

TEST_F(BasketReaderTest, SingleLayoutMalformedLineThrows) {
    BasketReader::Config config;
    config.format = DatasetFormat::SINGLE;
    BasketReader reader(config);

    std::istringstream in("1,milk\nno separator here\n");
    EXPECT_THROW(reader.Read(in), std::runtime_error);
}

// ============================================================================
// Files
// ============================================================================

TEST_F(BasketReaderTest, LoadFileBuildsStore) {
    WriteFile("milk,bread\nmilk\nbread,butter\n");
    BasketReader reader;

    TransactionStore store = reader.LoadFile(temp_path_);
    EXPECT_EQ(3u, store.TransactionCount());
    EXPECT_EQ(3u, store.ItemCount());
}

TEST_F(BasketReaderTest, MissingFileThrows) {
    BasketReader reader;
    EXPECT_THROW(reader.ReadFile("/tmp/arminer_no_such_file.txt"), std::runtime_error);
}

TEST_F(BasketReaderTest, FileWithOnlyCommentsIsEmptyDataset) {
    WriteFile("# nothing here\n\n");
    BasketReader reader;
    EXPECT_THROW(reader.LoadFile(temp_path_), EmptyDatasetError);
}

// ============================================================================
// Format names
// ============================================================================

TEST(DatasetFormatTest, ParseAndToString) {
    EXPECT_EQ(DatasetFormat::BASKET, ParseDatasetFormat("basket"));
    EXPECT_EQ(DatasetFormat::SINGLE, ParseDatasetFormat("single"));
    EXPECT_STREQ("single", ToString(DatasetFormat::SINGLE));
    EXPECT_THROW(ParseDatasetFormat("arff"), InvalidParameterError);
}

} // namespace
} // namespace arminer
