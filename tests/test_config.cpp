#include <catch2/catch_test_macros.hpp>
#include "chunkpack/config.hpp"
#include <filesystem>
#include <fstream>

using namespace chunkpack;

TEST_CASE("Config defaults", "[config]") {
    Config config;

    REQUIRE(config.chunk.max_data_bytes == 16 * MB);
    REQUIRE(config.storage.path == "./chunkpack-data");
    REQUIRE_FALSE(config.storage.sync_writes);
    REQUIRE_FALSE(config.logging.verbose);
    REQUIRE(config.validate().ok());
}

TEST_CASE("Config from JSON", "[config]") {
    SECTION("All sections") {
        auto config = Config::load_json(R"({
            "chunk": { "max_data_bytes": 4096 },
            "storage": { "path": "/tmp/chunks", "sync_writes": true },
            "logging": { "verbose": true }
        })");

        REQUIRE(config.chunk.max_data_bytes == 4096);
        REQUIRE(config.storage.path == "/tmp/chunks");
        REQUIRE(config.storage.sync_writes);
        REQUIRE(config.logging.verbose);
    }

    SECTION("Missing keys keep defaults") {
        auto config = Config::load_json(R"({ "storage": { "sync_writes": true } })");

        REQUIRE(config.chunk.max_data_bytes == DEFAULT_CHUNK_MAX_SIZE);
        REQUIRE(config.storage.path == "./chunkpack-data");
        REQUIRE(config.storage.sync_writes);
    }

    SECTION("Keys are scoped to their section") {
        auto config = Config::load_json(R"({ "logging": { "sync_writes": true } })");
        REQUIRE_FALSE(config.storage.sync_writes);
    }

    SECTION("to_json output loads back") {
        Config original;
        original.chunk.max_data_bytes = 1234;
        original.storage.path = "/var/lib/chunkpack";
        original.logging.verbose = true;

        auto restored = Config::load_json(original.to_json());
        REQUIRE(restored.chunk.max_data_bytes == 1234);
        REQUIRE(restored.storage.path == "/var/lib/chunkpack");
        REQUIRE(restored.logging.verbose);
        REQUIRE_FALSE(restored.storage.sync_writes);
    }
}

TEST_CASE("Config paths with special characters", "[config]") {
    Config original;

    SECTION("Quotes and backslashes") {
        original.storage.path = R"(/data/"quoted"\share)";
    }

    SECTION("Braces") {
        original.storage.path = "/data/{run}";
    }

    auto restored = Config::load_json(original.to_json());
    REQUIRE(restored.storage.path == original.storage.path);
    REQUIRE(restored.chunk.max_data_bytes == original.chunk.max_data_bytes);
}

TEST_CASE("Config files", "[config]") {
    auto path = std::filesystem::temp_directory_path() / "chunkpack_test_config.json";

    SECTION("Save and load") {
        Config config;
        config.chunk.max_data_bytes = 64 * KB;
        config.save(path);

        auto loaded = Config::load(path);
        REQUIRE(loaded.chunk.max_data_bytes == 64 * KB);
        std::filesystem::remove(path);
    }

    SECTION("Missing file throws") {
        std::filesystem::remove(path);
        REQUIRE_THROWS(Config::load(path));
    }
}

TEST_CASE("Config validation", "[config]") {
    Config config;

    SECTION("Capacity below two bytes") {
        config.chunk.max_data_bytes = 1;
        auto status = config.validate();
        REQUIRE(status.code() == ErrorCode::InvalidArgument);
    }

    SECTION("Empty storage path") {
        config.storage.path.clear();
        REQUIRE_FALSE(config.validate().ok());
    }

    SECTION("Smallest capacity is valid") {
        config.chunk.max_data_bytes = MIN_CHUNK_MAX_SIZE;
        REQUIRE(config.validate().ok());
    }
}
