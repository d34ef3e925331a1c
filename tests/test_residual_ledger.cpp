/**
 * @file test_residual_ledger.cpp
 * @brief Tests for the SQLite residual ledger (built only when SQLite3 is available)
 */

#include <gtest/gtest.h>
#include <libruparan/ruparan_core.h>

#ifdef HAVE_SQLITE3

#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <sqlite3.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

class ResidualLedgerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const std::string name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
        const std::string tag = name + "_" + std::to_string(::getpid());
        dbPath_ = fs::temp_directory_path() / ("ruparan_ledger_" + tag + ".db");
        textPath_ = fs::temp_directory_path() / ("ruparan_ledger_" + tag + ".txt");
        fs::remove(dbPath_);
        ledger_ = std::make_unique<ResidualLedger>(dbPath_.string());
        converter_ = std::make_unique<LegacyFontConverter>(
            MappingTable(MappingTable::MultiUnit, {}),
            MappingTable(MappingTable::SingleUnit, {{"d", "क"}}));
    }

    void TearDown() override {
        ledger_.reset();
        fs::remove(dbPath_);
        fs::remove(textPath_);
    }

    fs::path dbPath_;
    fs::path textPath_;
    std::unique_ptr<ResidualLedger> ledger_;
    std::unique_ptr<LegacyFontConverter> converter_;
};

} // namespace

TEST_F(ResidualLedgerTest, StartsEmpty) {
    EXPECT_TRUE(ledger_->getAll().empty());
    EXPECT_EQ(ledger_->getFrequency(0x20AC), -1);

    auto info = ledger_->getDatabaseInfo();
    EXPECT_EQ(info["entry_count"], "0");
    EXPECT_EQ(info["total_occurrences"], "0");
    EXPECT_EQ(info["Db"], "ruparan");
    EXPECT_FALSE(info["db_path"].empty());
}

TEST_F(ResidualLedgerTest, DatabaseInfoSkipsMetaRowsWithoutKey) {
    ledger_.reset();
    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(dbPath_.c_str(), &db), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(db, "INSERT INTO meta (key, value) VALUES (NULL, 'orphan');", nullptr, nullptr, nullptr),
              SQLITE_OK);
    sqlite3_close(db);

    ledger_ = std::make_unique<ResidualLedger>(dbPath_.string());
    auto info = ledger_->getDatabaseInfo();
    EXPECT_EQ(info["Db"], "ruparan");
    EXPECT_EQ(info["entry_count"], "0");
}

TEST_F(ResidualLedgerTest, RecordAccumulatesFrequencyAndKeepsFirstSource) {
    ledger_->record(converter_->convert("d€€"), "first");
    ledger_->record(converter_->convert("€É"), "second");

    EXPECT_EQ(ledger_->getFrequency(0x20AC), 3);
    EXPECT_EQ(ledger_->getFrequency(0x00C9), 1);

    auto entries = ledger_->getAll();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].codepoint, char32_t(0x20AC)); // most frequent first
    EXPECT_EQ(entries[0].frequency, 3);
    EXPECT_EQ(entries[0].firstSource, "first");
    EXPECT_EQ(entries[1].codepoint, char32_t(0x00C9));
    EXPECT_EQ(entries[1].firstSource, "second");
}

TEST_F(ResidualLedgerTest, CleanResultsRecordNothing) {
    ledger_->record(converter_->convert("ddd"), "clean");
    EXPECT_TRUE(ledger_->getAll().empty());
}

TEST_F(ResidualLedgerTest, SortingAndPagination) {
    ledger_->record(converter_->convert("€€€ÉÉ¼"), "mixed");

    auto byCodepoint = ledger_->getAll(-1, 0, ResidualLedger::ByCodepoint, true);
    ASSERT_EQ(byCodepoint.size(), 3u);
    EXPECT_EQ(byCodepoint[0].codepoint, char32_t(0x00BC));
    EXPECT_EQ(byCodepoint[1].codepoint, char32_t(0x00C9));
    EXPECT_EQ(byCodepoint[2].codepoint, char32_t(0x20AC));

    auto page = ledger_->getAll(1, 1, ResidualLedger::ByFrequency, false);
    ASSERT_EQ(page.size(), 1u);
    EXPECT_EQ(page[0].codepoint, char32_t(0x00C9));

    auto rest = ledger_->getAll(-1, 2, ResidualLedger::ByFrequency, false);
    ASSERT_EQ(rest.size(), 1u);
    EXPECT_EQ(rest[0].codepoint, char32_t(0x00BC));
}

TEST_F(ResidualLedgerTest, ResetClearsEntries) {
    ledger_->record(converter_->convert("€"), "x");
    ledger_->reset();
    EXPECT_TRUE(ledger_->getAll().empty());
    EXPECT_EQ(ledger_->getFrequency(0x20AC), -1);
}

TEST_F(ResidualLedgerTest, RecordFromFileCountsLinesWithResiduals) {
    {
        std::ofstream out(textPath_);
        out << "df\n" << "dd\n" << "d€€\n";
    }

    long lines = ledger_->recordFromFile(textPath_.string(), *converter_);
    EXPECT_EQ(lines, 2);
    EXPECT_EQ(ledger_->getFrequency(U'f'), 1);
    EXPECT_EQ(ledger_->getFrequency(0x20AC), 2);

    auto entries = ledger_->getAll(-1, 0, ResidualLedger::ByCodepoint, true);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].firstSource, textPath_.string() + ":1");
    EXPECT_EQ(entries[1].firstSource, textPath_.string() + ":3");
}

TEST_F(ResidualLedgerTest, RecordFromMissingFileThrows) {
    EXPECT_THROW(ledger_->recordFromFile("/nonexistent/input.txt", *converter_), std::runtime_error);
}

TEST_F(ResidualLedgerTest, SurvivesReopening) {
    ledger_->record(converter_->convert("€"), "x");
    ledger_.reset();
    ledger_ = std::make_unique<ResidualLedger>(dbPath_.string());
    EXPECT_EQ(ledger_->getFrequency(0x20AC), 1);
}

#endif // HAVE_SQLITE3
