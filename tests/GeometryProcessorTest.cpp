#include <gtest/gtest.h>
#include "gltf2mesh/GeometryProcessor.hpp"
#include <cmath>

using namespace gltf2mesh;

namespace {

    VertexAttribute floatAttribute(std::vector<float> values, int componentCount) {
        VertexAttribute attribute;
        attribute.data = std::move(values);
        attribute.componentCount = componentCount;
        return attribute;
    }

    // Quad nel piano XY: due triangoli con uv che seguono gli assi
    Geometry quad() {
        Geometry geometry;
        geometry.attributes[AttributeSlot::Position] = floatAttribute({
                0, 0, 0,
                1, 0, 0,
                1, 1, 0,
                0, 1, 0
        }, 3);
        geometry.attributes[AttributeSlot::Uv] = floatAttribute({0, 0, 1, 0, 1, 1, 0, 1}, 2);
        geometry.indices = IndexBuffer{std::vector<uint16_t>{0, 1, 2, 0, 2, 3}};
        return geometry;
    }

    TEST(GeometryProcessorTest, TriangleNormalPointsAlongZ) {
        Geometry geometry;
        geometry.attributes[AttributeSlot::Position] = floatAttribute({0, 0, 0, 1, 0, 0, 0, 1, 0}, 3);

        ASSERT_TRUE(GeometryProcessor::generateNormals(geometry));

        const auto& normals = *geometry.find(AttributeSlot::Normal)->floats();
        ASSERT_EQ(normals.size(), 9u);
        for (size_t v = 0; v < 3; ++v) {
            EXPECT_FLOAT_EQ(normals[v * 3], 0.0f);
            EXPECT_FLOAT_EQ(normals[v * 3 + 1], 0.0f);
            EXPECT_FLOAT_EQ(normals[v * 3 + 2], 1.0f);
        }
    }

    TEST(GeometryProcessorTest, SharedVerticesGetUnitNormals) {
        // Due facce ortogonali che condividono lo spigolo 0-1
        Geometry geometry;
        geometry.attributes[AttributeSlot::Position] = floatAttribute({
                0, 0, 0,
                1, 0, 0,
                0, 1, 0,
                0, 0, 1
        }, 3);
        geometry.indices = IndexBuffer{std::vector<uint16_t>{0, 1, 2, 1, 0, 3}};

        ASSERT_TRUE(GeometryProcessor::generateNormals(geometry));

        const auto& normals = *geometry.find(AttributeSlot::Normal)->floats();
        for (size_t v = 0; v < 4; ++v) {
            float length = std::sqrt(normals[v * 3] * normals[v * 3] +
                                     normals[v * 3 + 1] * normals[v * 3 + 1] +
                                     normals[v * 3 + 2] * normals[v * 3 + 2]);
            EXPECT_NEAR(length, 1.0f, 1e-5f);
        }
        // Spigolo condiviso: media delle due facce
        EXPECT_NEAR(normals[1], std::sqrt(0.5f), 1e-5f);
        EXPECT_NEAR(normals[2], std::sqrt(0.5f), 1e-5f);
    }

    TEST(GeometryProcessorTest, UnreferencedVertexKeepsZeroNormal) {
        Geometry geometry;
        geometry.attributes[AttributeSlot::Position] = floatAttribute({0, 0, 0, 1, 0, 0, 0, 1, 0, 5, 5, 5}, 3);
        geometry.indices = IndexBuffer{std::vector<uint16_t>{0, 1, 2}};

        ASSERT_TRUE(GeometryProcessor::generateNormals(geometry));

        const auto& normals = *geometry.find(AttributeSlot::Normal)->floats();
        EXPECT_EQ(normals[9], 0.0f);
        EXPECT_EQ(normals[10], 0.0f);
        EXPECT_EQ(normals[11], 0.0f);
    }

    TEST(GeometryProcessorTest, DegenerateTriangleKeepsZeroNormal) {
        Geometry geometry;
        geometry.attributes[AttributeSlot::Position] = floatAttribute({0, 0, 0, 1, 1, 1, 2, 2, 2}, 3);

        ASSERT_TRUE(GeometryProcessor::generateNormals(geometry));

        for (float value : *geometry.find(AttributeSlot::Normal)->floats()) {
            EXPECT_EQ(value, 0.0f);
        }
    }

    TEST(GeometryProcessorTest, NormalsNeedTriangles) {
        Geometry geometry;
        geometry.attributes[AttributeSlot::Position] = floatAttribute({0, 0, 0, 1, 0, 0}, 3);
        geometry.mode = PrimitiveMode::Lines;

        EXPECT_FALSE(GeometryProcessor::generateNormals(geometry));
        EXPECT_FALSE(geometry.has(AttributeSlot::Normal));

        Geometry empty;
        EXPECT_FALSE(GeometryProcessor::generateNormals(empty));
    }

    TEST(GeometryProcessorTest, NormalizedIntegerPositions) {
        Geometry geometry;
        VertexAttribute position;
        position.data = std::vector<int16_t>{0, 0, 0, 32767, 0, 0, 0, 32767, 0};
        position.componentCount = 3;
        position.normalized = true;
        geometry.attributes[AttributeSlot::Position] = position;

        ASSERT_TRUE(GeometryProcessor::generateNormals(geometry));

        EXPECT_FLOAT_EQ(geometry.find(AttributeSlot::Normal)->floats()->at(2), 1.0f);
    }

    TEST(GeometryProcessorTest, ExpandsStripsAndFans) {
        Geometry strip;
        strip.attributes[AttributeSlot::Position] = floatAttribute(std::vector<float>(12, 0.0f), 3);
        strip.mode = PrimitiveMode::TriangleStrip;

        auto faces = GeometryProcessor::triangles(strip);
        ASSERT_EQ(faces.size(), 2u);
        EXPECT_EQ(faces[0], (std::array<uint32_t, 3>{0, 1, 2}));
        EXPECT_EQ(faces[1], (std::array<uint32_t, 3>{2, 1, 3}));

        Geometry fan = strip;
        fan.mode = PrimitiveMode::TriangleFan;
        faces = GeometryProcessor::triangles(fan);
        ASSERT_EQ(faces.size(), 2u);
        EXPECT_EQ(faces[1], (std::array<uint32_t, 3>{0, 2, 3}));
    }

    TEST(GeometryProcessorTest, QuadTangentsAreOrthogonalToNormals) {
        Geometry geometry = quad();
        ASSERT_TRUE(GeometryProcessor::generateNormals(geometry));
        ASSERT_TRUE(GeometryProcessor::generateTangents(geometry));

        const VertexAttribute* tangent = geometry.find(AttributeSlot::Tangent);
        ASSERT_NE(tangent, nullptr);
        EXPECT_EQ(tangent->componentCount, 4);

        const auto& tangents = *tangent->floats();
        const auto& normals = *geometry.find(AttributeSlot::Normal)->floats();
        for (size_t v = 0; v < 4; ++v) {
            const float* t = &tangents[v * 4];
            const float* n = &normals[v * 3];
            EXPECT_NEAR(t[0] * n[0] + t[1] * n[1] + t[2] * n[2], 0.0f, 1e-5f);
            EXPECT_NEAR(t[0], 1.0f, 1e-5f);
            EXPECT_TRUE(t[3] == 1.0f || t[3] == -1.0f);
        }
    }

    TEST(GeometryProcessorTest, MirroredUvsFlipHandedness) {
        Geometry geometry = quad();
        // v invertita: la base tangente diventa sinistrorsa
        geometry.attributes[AttributeSlot::Uv] = floatAttribute({0, 1, 1, 1, 1, 0, 0, 0}, 2);
        ASSERT_TRUE(GeometryProcessor::generateNormals(geometry));
        ASSERT_TRUE(GeometryProcessor::generateTangents(geometry));

        const auto& tangents = *geometry.find(AttributeSlot::Tangent)->floats();
        for (size_t v = 0; v < 4; ++v) {
            EXPECT_EQ(tangents[v * 4 + 3], -1.0f);
        }
    }

    TEST(GeometryProcessorTest, TangentsNeedUvAndNormals) {
        Geometry geometry = quad();
        EXPECT_FALSE(GeometryProcessor::generateTangents(geometry));

        geometry.attributes.erase(AttributeSlot::Uv);
        ASSERT_TRUE(GeometryProcessor::generateNormals(geometry));
        EXPECT_FALSE(GeometryProcessor::generateTangents(geometry));
        EXPECT_FALSE(geometry.has(AttributeSlot::Tangent));
    }

} // namespace
