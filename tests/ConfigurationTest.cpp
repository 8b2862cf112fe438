#include <gtest/gtest.h>
#include "gltf2mesh/EnvironmentHandler.hpp"
#include "gltf2mesh/LoaderOptions.hpp"
#include "gltf2mesh/Logger.hpp"
#include <cstdlib>
#include <stdexcept>

using namespace gltf2mesh;

namespace {

    // Ripulisce le variabili GLTF2MESH_* e il livello di log dopo ogni test
    class ConfigurationTest : public ::testing::Test {
    protected:
        void TearDown() override {
            for (const char* name : {"GLTF2MESH_PORT", "GLTF2MESH_WORKERS", "GLTF2MESH_INDEX_POLICY",
                                     "GLTF2MESH_GENERATE_TANGENTS", "GLTF2MESH_HTTP_TIMEOUT_S",
                                     "GLTF2MESH_LOG_LEVEL", "GLTF2MESH_ASSET_ROOT"}) {
                unsetenv(name);
            }
            setenv("GLTF2MESH_INDEX_POLICY", "shrink16", 1);
            setenv("GLTF2MESH_GENERATE_TANGENTS", "0", 1);
            setenv("GLTF2MESH_LOG_LEVEL", "info", 1);
            EnvironmentHandler::instance().init();
            unsetenv("GLTF2MESH_INDEX_POLICY");
            unsetenv("GLTF2MESH_GENERATE_TANGENTS");
            unsetenv("GLTF2MESH_LOG_LEVEL");
        }
    };

    TEST_F(ConfigurationTest, ReadsEnvironment) {
        setenv("GLTF2MESH_PORT", "9090", 1);
        setenv("GLTF2MESH_WORKERS", "3", 1);
        setenv("GLTF2MESH_INDEX_POLICY", "widen32", 1);
        setenv("GLTF2MESH_GENERATE_TANGENTS", "1", 1);
        setenv("GLTF2MESH_HTTP_TIMEOUT_S", "5", 1);
        setenv("GLTF2MESH_LOG_LEVEL", "warn", 1);

        auto& env = EnvironmentHandler::instance();
        env.init();

        EXPECT_EQ(env.getPort(), 9090);
        EXPECT_EQ(env.getWorkerCount(), 3u);
        EXPECT_EQ(env.getLogLevel(), LogLevel::Warn);
        EXPECT_EQ(Logger::level(), LogLevel::Warn);

        LoaderOptions options = LoaderOptions::fromEnvironment();
        EXPECT_EQ(options.indexPolicy, IndexPolicy::Widen32);
        EXPECT_TRUE(options.generateTangents);
        EXPECT_EQ(options.workerCount, 3u);
        EXPECT_EQ(options.httpTimeoutSeconds, 5u);
        EXPECT_TRUE(options.rootPath.empty());
    }

    TEST_F(ConfigurationTest, RejectsInvalidValues) {
        auto& env = EnvironmentHandler::instance();

        setenv("GLTF2MESH_PORT", "http", 1);
        EXPECT_THROW(env.init(), std::runtime_error);
        setenv("GLTF2MESH_PORT", "70000", 1);
        EXPECT_THROW(env.init(), std::runtime_error);
        unsetenv("GLTF2MESH_PORT");

        setenv("GLTF2MESH_WORKERS", "0", 1);
        EXPECT_THROW(env.init(), std::runtime_error);
        unsetenv("GLTF2MESH_WORKERS");

        setenv("GLTF2MESH_INDEX_POLICY", "narrow8", 1);
        EXPECT_THROW(env.init(), std::runtime_error);
        unsetenv("GLTF2MESH_INDEX_POLICY");

        setenv("GLTF2MESH_GENERATE_TANGENTS", "yes", 1);
        EXPECT_THROW(env.init(), std::runtime_error);
        unsetenv("GLTF2MESH_GENERATE_TANGENTS");

        setenv("GLTF2MESH_LOG_LEVEL", "verbose", 1);
        EXPECT_THROW(env.init(), std::runtime_error);
    }

    TEST_F(ConfigurationTest, AssetRootMustBeDirectory) {
        auto& env = EnvironmentHandler::instance();

        env.init();
        EXPECT_TRUE(env.getAssetRoot().empty());

        setenv("GLTF2MESH_ASSET_ROOT", ::testing::TempDir().c_str(), 1);
        env.init();
        EXPECT_EQ(env.getAssetRoot(), ::testing::TempDir());

        setenv("GLTF2MESH_ASSET_ROOT", "/gltf2mesh/no/such/dir", 1);
        EXPECT_THROW(env.init(), std::runtime_error);
    }

    TEST_F(ConfigurationTest, ParsesIndexPolicyNames) {
        EXPECT_EQ(parseIndexPolicy("shrink16"), IndexPolicy::Shrink16);
        EXPECT_EQ(parseIndexPolicy("widen32"), IndexPolicy::Widen32);
        EXPECT_STREQ(toString(IndexPolicy::Widen32), "widen32");
        EXPECT_THROW(parseIndexPolicy("auto"), std::runtime_error);
    }

    TEST_F(ConfigurationTest, ParsesLogLevels) {
        EXPECT_EQ(Logger::parseLevel("debug"), LogLevel::Debug);
        EXPECT_EQ(Logger::parseLevel("error"), LogLevel::Error);
        EXPECT_THROW(Logger::parseLevel("trace"), std::runtime_error);
    }

} // namespace
