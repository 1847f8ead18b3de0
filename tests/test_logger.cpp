// EN: Unit tests for the NDJSON Logger
// FR: Tests unitaires pour le Logger NDJSON

#include <gtest/gtest.h>
#include "infrastructure/logging/logger.hpp"

#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

using namespace CIP;

// EN: Test fixture redirecting the logger to a temporary file
// FR: Fixture de test redirigeant le logger vers un fichier temporaire
class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "cip_logger_test";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
        log_file_ = (test_dir_ / "test.log").string();

        logger_ = &Logger::getInstance();
        logger_->setLogLevel(LogLevel::DEBUG);
        logger_->setCorrelationId("");
        logger_->clearGlobalMetadata();
        logger_->setOutputFile(log_file_);
    }

    void TearDown() override {
        logger_->resetOutput();
        logger_->setCorrelationId("");
        logger_->clearGlobalMetadata();
        logger_->setLogLevel(LogLevel::INFO);
        std::filesystem::remove_all(test_dir_);
    }

    // EN: Parse every line written so far
    // FR: Analyse chaque ligne écrite jusqu'ici
    std::vector<nlohmann::json> readEntries() {
        logger_->flush();
        std::vector<nlohmann::json> entries;
        std::ifstream in(log_file_);
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty()) {
                entries.push_back(nlohmann::json::parse(line));
            }
        }
        return entries;
    }

    Logger* logger_ = nullptr;
    std::filesystem::path test_dir_;
    std::string log_file_;
};

TEST_F(LoggerTest, SingletonPattern) {
    EXPECT_EQ(&Logger::getInstance(), &Logger::getInstance());
}

// EN: Each entry is one JSON object with the fixed fields
// FR: Chaque entrée est un objet JSON avec les champs fixes
TEST_F(LoggerTest, WritesNdjsonEntries) {
    LOG_INFO("stage_driver", "Step succeeded");
    LOG_ERROR("pipeline_engine", "Run failed");

    auto entries = readEntries();
    ASSERT_EQ(entries.size(), 2u);

    EXPECT_EQ(entries[0]["level"], "INFO");
    EXPECT_EQ(entries[0]["module"], "stage_driver");
    EXPECT_EQ(entries[0]["message"], "Step succeeded");
    EXPECT_TRUE(entries[0].contains("timestamp"));
    EXPECT_TRUE(entries[0].contains("thread_id"));
    EXPECT_FALSE(entries[0].contains("correlation_id"));

    EXPECT_EQ(entries[1]["level"], "ERROR");
}

TEST_F(LoggerTest, FiltersBelowMinimumLevel) {
    logger_->setLogLevel(LogLevel::WARN);

    LOG_DEBUG("filter", "hidden");
    LOG_INFO("filter", "hidden");
    LOG_WARN("filter", "shown");
    LOG_ERROR("filter", "shown");

    auto entries = readEntries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0]["level"], "WARN");
    EXPECT_EQ(entries[1]["level"], "ERROR");
    EXPECT_EQ(logger_->getLogLevel(), LogLevel::WARN);
}

// EN: The run id travels as the correlation id
// FR: L'id d'exécution voyage comme id de corrélation
TEST_F(LoggerTest, CorrelationIdIsAttached) {
    std::string run_id = logger_->generateCorrelationId();
    logger_->setCorrelationId(run_id);

    LOG_INFO("pipeline_engine", "Run started");

    auto entries = readEntries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0]["correlation_id"], run_id);
}

TEST_F(LoggerTest, GeneratedCorrelationIdsAreUuidShaped) {
    std::set<std::string> ids;
    for (int i = 0; i < 50; ++i) {
        std::string id = logger_->generateCorrelationId();
        ASSERT_EQ(id.size(), 36u);
        EXPECT_EQ(id[8], '-');
        EXPECT_EQ(id[13], '-');
        EXPECT_EQ(id[18], '-');
        EXPECT_EQ(id[23], '-');
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 50u);
}

// EN: Entry metadata wins over global metadata with the same key
// FR: Les métadonnées de l'entrée l'emportent sur les globales de même clé
TEST_F(LoggerTest, MetadataMerging) {
    logger_->addGlobalMetadata("workflow", "linux");
    logger_->addGlobalMetadata("stage", "global");

    std::unordered_map<std::string, std::string> metadata = {{"stage", "build"}, {"step", "tidy"}};
    LOG_INFO_META("stage_driver", "Running step", metadata);

    auto entries = readEntries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0]["workflow"], "linux");
    EXPECT_EQ(entries[0]["stage"], "build");
    EXPECT_EQ(entries[0]["step"], "tidy");
}

// EN: Metadata cannot overwrite the fixed fields
// FR: Les métadonnées ne peuvent pas écraser les champs fixes
TEST_F(LoggerTest, MetadataDoesNotOverrideFixedFields) {
    std::unordered_map<std::string, std::string> metadata = {{"level", "bogus"}, {"message", "bogus"}};
    LOG_WARN_META("artifacts", "real message", metadata);

    auto entries = readEntries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0]["level"], "WARN");
    EXPECT_EQ(entries[0]["message"], "real message");
}

TEST_F(LoggerTest, EscapesSpecialCharacters) {
    LOG_INFO("process", "quote \" backslash \\ newline \n tab \t");

    auto entries = readEntries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0]["message"], "quote \" backslash \\ newline \n tab \t");
}

TEST_F(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parseLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parseLevel("INFO"), LogLevel::INFO);
    EXPECT_EQ(Logger::parseLevel("warning"), LogLevel::WARN);
    EXPECT_EQ(Logger::parseLevel("Error"), LogLevel::ERROR);
    EXPECT_FALSE(Logger::parseLevel("verbose").has_value());
    EXPECT_FALSE(Logger::parseLevel("").has_value());
}

// EN: Concurrent writers never interleave inside a line
// FR: Les écrivains concurrents ne s'entrelacent jamais dans une ligne
TEST_F(LoggerTest, ConcurrentLogging) {
    const int threads = 8;
    const int per_thread = 50;

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([t, per_thread]() {
            for (int i = 0; i < per_thread; ++i) {
                LOG_INFO("stage-" + std::to_string(t), "message " + std::to_string(i));
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    auto entries = readEntries();
    EXPECT_EQ(entries.size(), static_cast<size_t>(threads * per_thread));
}
