#include <gtest/gtest.h>
#include "gltf2mesh/ResourceFetcher.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace gltf2mesh;
namespace fs = std::filesystem;

namespace {

    // assets/ con un file dentro e secret.txt accanto, fuori dalla radice
    class ConfinedFetcherTest : public ::testing::Test {
    protected:
        void SetUp() override {
            base = fs::path(::testing::TempDir()) / "gltf2mesh_confined_fetcher";
            fs::remove_all(base);
            fs::create_directories(base / "assets" / "models");
            write(base / "assets" / "models" / "a.bin", "inside");
            write(base / "secret.txt", "outside");
            root = (base / "assets").string();
        }

        void TearDown() override {
            fs::remove_all(base);
        }

        static void write(const fs::path& path, const std::string& content) {
            std::ofstream out(path, std::ios::binary);
            out << content;
        }

        static std::string text(const FetchResult& result) {
            return std::string(result.body.begin(), result.body.end());
        }

        fs::path base;
        std::string root;
    };

    TEST_F(ConfinedFetcherTest, ReadsFilesUnderRoot) {
        ConfinedFetcher fetcher(root);

        EXPECT_EQ(text(fetcher.fetch("models/a.bin")), "inside");
        EXPECT_EQ(text(fetcher.fetch("./models/../models/a.bin")), "inside");
    }

    TEST_F(ConfinedFetcherTest, AbsolutePathsAreRootRelative) {
        ConfinedFetcher fetcher(root);

        EXPECT_EQ(text(fetcher.fetch("/models/a.bin")), "inside");
        EXPECT_EQ(text(fetcher.fetch("file:///models/a.bin")), "inside");
        EXPECT_THROW(fetcher.fetch("/etc/passwd"), std::runtime_error);
    }

    TEST_F(ConfinedFetcherTest, RejectsEscapesFromRoot) {
        ConfinedFetcher fetcher(root);

        EXPECT_THROW(fetcher.fetch("../secret.txt"), std::runtime_error);
        EXPECT_THROW(fetcher.fetch("models/../../secret.txt"), std::runtime_error);
        // radice con lo stesso prefisso testuale
        fs::create_directories(base / "assets2");
        write(base / "assets2" / "b.bin", "sibling");
        EXPECT_THROW(fetcher.fetch("../assets2/b.bin"), std::runtime_error);
    }

    TEST_F(ConfinedFetcherTest, RejectsSymlinksLeavingRoot) {
        std::error_code ec;
        fs::create_symlink(base / "secret.txt", base / "assets" / "link.txt", ec);
        if (ec) {
            GTEST_SKIP() << "symlinks not available: " << ec.message();
        }
        ConfinedFetcher fetcher(root);

        EXPECT_THROW(fetcher.fetch("link.txt"), std::runtime_error);
    }

    TEST_F(ConfinedFetcherTest, EmptyRootDisablesLocalFiles) {
        ConfinedFetcher fetcher("");

        try {
            fetcher.fetch((base / "secret.txt").string());
            FAIL() << "Expected std::runtime_error";
        } catch (const std::runtime_error& e) {
            EXPECT_NE(std::string(e.what()).find("disabled"), std::string::npos);
        }
    }

    TEST(FileFetcherTest, ContentTypeFromExtension) {
        EXPECT_EQ(FileFetcher::contentTypeFor("a/scene.GLTF"), "model/gltf+json");
        EXPECT_EQ(FileFetcher::contentTypeFor("scene.glb"), "model/gltf-binary");
        EXPECT_EQ(FileFetcher::contentTypeFor("mesh.bin"), "application/octet-stream");
    }

    TEST(HttpFetcherTest, RecognisesHttpUrls) {
        EXPECT_TRUE(HttpFetcher::isHttpUrl("http://host/a.gltf"));
        EXPECT_TRUE(HttpFetcher::isHttpUrl("https://host/a.gltf"));
        EXPECT_FALSE(HttpFetcher::isHttpUrl("file:///a.gltf"));
        EXPECT_FALSE(HttpFetcher::isHttpUrl("models/http://a.gltf"));
    }

} // namespace
