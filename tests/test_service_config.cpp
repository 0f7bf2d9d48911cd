// VirtGate Unit Tests - service configuration
// Tests: defaults, JSON overrides, type errors, validation

#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include "Core/config/ServiceConfig.hpp"

// ============================================================
// Parsing
// ============================================================

TEST(ServiceConfigTest, EmptyObjectKeepsDefaults) {
    auto cfg = ServiceConfig::fromJson("{}");
    EXPECT_EQ(cfg.hypervisorUri, "qemu:///system");
    EXPECT_EQ(cfg.listenAddress, "0.0.0.0");
    EXPECT_EQ(cfg.port, 8080);
    EXPECT_EQ(cfg.ioThreads, 1u);
    EXPECT_EQ(cfg.workerThreads, 4u);
    EXPECT_TRUE(cfg.logging.enable_console);
    EXPECT_TRUE(cfg.validate());
}

TEST(ServiceConfigTest, OverridesFromJson) {
    auto cfg = ServiceConfig::fromJson(R"({
        "hypervisor_uri": "qemu+ssh://admin@host/system",
        "listen_address": "127.0.0.1",
        "port": 9090,
        "io_threads": 2,
        "worker_threads": 8,
        "log": {
            "name": "gate",
            "file": "/tmp/gate.log",
            "console_level": "warning",
            "file_level": "debug",
            "rotation_size": 1024,
            "max_files": 3,
            "console": false,
            "file_enabled": false
        }
    })");
    EXPECT_EQ(cfg.hypervisorUri, "qemu+ssh://admin@host/system");
    EXPECT_EQ(cfg.listenAddress, "127.0.0.1");
    EXPECT_EQ(cfg.port, 9090);
    EXPECT_EQ(cfg.ioThreads, 2u);
    EXPECT_EQ(cfg.workerThreads, 8u);
    EXPECT_EQ(cfg.logging.name, "gate");
    EXPECT_EQ(cfg.logging.file_path, "/tmp/gate.log");
    EXPECT_EQ(cfg.logging.console_level, BoostLogger::Level::Warning);
    EXPECT_EQ(cfg.logging.file_level, BoostLogger::Level::Debug);
    EXPECT_EQ(cfg.logging.rotation_size, 1024u);
    EXPECT_EQ(cfg.logging.max_files, 3);
    EXPECT_FALSE(cfg.logging.enable_console);
    EXPECT_FALSE(cfg.logging.enable_file);
}

TEST(ServiceConfigTest, RejectsMalformedDocuments) {
    EXPECT_THROW(ServiceConfig::fromJson("{"), std::runtime_error);
    EXPECT_THROW(ServiceConfig::fromJson("[1, 2]"), std::runtime_error);
    EXPECT_THROW(ServiceConfig::fromJson(R"({"port": "8080"})"), std::runtime_error);
    EXPECT_THROW(ServiceConfig::fromJson(R"({"port": -1})"), std::runtime_error);
    EXPECT_THROW(ServiceConfig::fromJson(R"({"port": 70000})"), std::runtime_error);
    EXPECT_THROW(ServiceConfig::fromJson(R"({"log": "verbose"})"), std::runtime_error);
    EXPECT_THROW(ServiceConfig::fromJson(R"({"log": {"console": "yes"}})"), std::runtime_error);
}

TEST(ServiceConfigTest, UnknownLevelFallsBackToInfo) {
    auto cfg = ServiceConfig::fromJson(R"({"log": {"console_level": "chatty"}})");
    EXPECT_EQ(cfg.logging.console_level, BoostLogger::Level::Info);
}

// ============================================================
// Files
// ============================================================

TEST(ServiceConfigTest, LoadsFromFile) {
    const std::string path = ::testing::TempDir() + "virtgate-config-test.json";
    {
        std::ofstream out(path);
        out << R"({"hypervisor_uri": "test:///default", "port": 18080})";
    }
    auto cfg = ServiceConfig::fromFile(path);
    EXPECT_EQ(cfg.hypervisorUri, "test:///default");
    EXPECT_EQ(cfg.port, 18080);
    std::remove(path.c_str());
}

TEST(ServiceConfigTest, MissingFileThrows) {
    EXPECT_THROW(ServiceConfig::fromFile("/nonexistent/virtgate.json"), std::runtime_error);
}

// ============================================================
// Validation
// ============================================================

TEST(ServiceConfigTest, ValidateRejectsUnusableSettings) {
    ServiceConfig cfg;
    EXPECT_TRUE(cfg.validate());

    auto noUri = cfg;
    noUri.hypervisorUri.clear();
    EXPECT_FALSE(noUri.validate());

    auto noPort = cfg;
    noPort.port = 0;
    EXPECT_FALSE(noPort.validate());

    auto noWorkers = cfg;
    noWorkers.workerThreads = 0;
    EXPECT_FALSE(noWorkers.validate());

    auto noListener = cfg;
    noListener.listenAddress.clear();
    EXPECT_FALSE(noListener.validate());
}
