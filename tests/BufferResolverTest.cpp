#include <gtest/gtest.h>
#include "gltf2mesh/BufferResolver.hpp"
#include "gltf2mesh/Errors.hpp"
#include "TestAssets.hpp"

using namespace gltf2mesh;
using gltf2mesh::testing::FakeFetcher;

namespace {

    Buffer makeBuffer(std::optional<std::string> uri, size_t byteLength) {
        Buffer buffer;
        buffer.uri = std::move(uri);
        buffer.byteLength = byteLength;
        return buffer;
    }

    TEST(BufferResolverTest, DecodesDataUriWithoutFetching) {
        FakeFetcher fetcher;
        BufferResolver resolver(fetcher, "models");

        std::vector<uint8_t> bytes = resolver.resolve(makeBuffer("data:application/octet-stream;base64,QQ==", 1),
                                                      nullptr);

        EXPECT_EQ(bytes, std::vector<uint8_t>{65});
        EXPECT_TRUE(fetcher.requests().empty());
    }

    TEST(BufferResolverTest, FetchesRelativeUriFromBasePath) {
        FakeFetcher fetcher;
        fetcher.add("http://host/models/mesh.bin", std::vector<uint8_t>{1, 2, 3, 4});
        BufferResolver resolver(fetcher, "http://host/models");

        std::vector<uint8_t> bytes = resolver.resolve(makeBuffer("mesh.bin", 4), nullptr);

        EXPECT_EQ(bytes.size(), 4u);
        ASSERT_EQ(fetcher.requests().size(), 1u);
        EXPECT_EQ(fetcher.requests()[0], "http://host/models/mesh.bin");
    }

    TEST(BufferResolverTest, AbsoluteUrlsAreNotRebased) {
        FakeFetcher fetcher;
        BufferResolver resolver(fetcher, "models");

        EXPECT_EQ(resolver.resolvePath("https://cdn/mesh.bin"), "https://cdn/mesh.bin");
        EXPECT_EQ(resolver.resolvePath("../mesh.bin"), "mesh.bin");
    }

    TEST(BufferResolverTest, UsesEmbeddedBinForBufferWithoutUri) {
        FakeFetcher fetcher;
        BufferResolver resolver(fetcher, "");
        std::vector<uint8_t> bin = {9, 8, 7, 6};

        EXPECT_EQ(resolver.resolve(makeBuffer(std::nullopt, 3), &bin), bin);
        EXPECT_THROW(resolver.resolve(makeBuffer(std::nullopt, 3), nullptr), BufferLoadError);
    }

    TEST(BufferResolverTest, FetchFailureReportsUri) {
        FakeFetcher fetcher;
        BufferResolver resolver(fetcher, "models");

        try {
            resolver.resolve(makeBuffer("missing.bin", 4), nullptr);
            FAIL() << "Expected BufferLoadError";
        } catch (const BufferLoadError& e) {
            EXPECT_EQ(e.uri(), "missing.bin");
            EXPECT_NE(e.cause().find("404"), std::string::npos);
            EXPECT_STREQ(e.kind(), "buffer");
        }
    }

    TEST(BufferResolverTest, InvalidDataUriIsBufferLoadError) {
        FakeFetcher fetcher;
        BufferResolver resolver(fetcher, "");

        EXPECT_THROW(resolver.resolve(makeBuffer("data:application/octet-stream;base64,Q$==", 1), nullptr),
                     BufferLoadError);
    }

    TEST(BufferResolverTest, ShortBufferIsIncomplete) {
        FakeFetcher fetcher;
        fetcher.add("models/mesh.bin", std::vector<uint8_t>{1, 2});
        BufferResolver resolver(fetcher, "models");

        EXPECT_THROW(resolver.resolve(makeBuffer("mesh.bin", 4), nullptr), BufferCompletenessError);
    }

} // namespace
