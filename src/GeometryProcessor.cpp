#include "gltf2mesh/GeometryProcessor.hpp"
#include "gltf2mesh/Logger.hpp"
#include <cmath>
#include <algorithm>
#include <type_traits>

namespace gltf2mesh {

    namespace {
        // Converte qualsiasi attributo in float, applicando la normalizzazione glTF se richiesta
        std::vector<float> toFloats(const VertexAttribute& attribute) {
            return std::visit([&](const auto& values) {
                using T = typename std::decay_t<decltype(values)>::value_type;
                std::vector<float> out(values.size());
                for (size_t i = 0; i < values.size(); ++i) {
                    float v = static_cast<float>(values[i]);
                    if (attribute.normalized) {
                        if constexpr (std::is_same_v<T, int8_t>) v = std::max(v / 127.0f, -1.0f);
                        else if constexpr (std::is_same_v<T, uint8_t>) v = v / 255.0f;
                        else if constexpr (std::is_same_v<T, int16_t>) v = std::max(v / 32767.0f, -1.0f);
                        else if constexpr (std::is_same_v<T, uint16_t>) v = v / 65535.0f;
                    }
                    out[i] = v;
                }
                return out;
            }, attribute.data);
        }

        void cross(const float a[3], const float b[3], float out[3]) {
            out[0] = a[1] * b[2] - a[2] * b[1];
            out[1] = a[2] * b[0] - a[0] * b[2];
            out[2] = a[0] * b[1] - a[1] * b[0];
        }

        float dot(const float a[3], const float b[3]) {
            return a[0] * b[0] + a[1] * b[1] + a[2] * b[2];
        }

        void normalizeInPlace(float* v) {
            float len = std::sqrt(v[0] * v[0] + v[1] * v[1] + v[2] * v[2]);
            if (len > 0.0f) {
                v[0] /= len;
                v[1] /= len;
                v[2] /= len;
            }
        }
    }

    std::vector<std::array<uint32_t, 3>> GeometryProcessor::triangles(const Geometry& geometry) {
        const size_t n = geometry.indices ? geometry.indices->size() : geometry.vertexCount();
        auto vertex = [&](size_t i) -> uint32_t {
            return geometry.indices ? geometry.indices->at(i) : static_cast<uint32_t>(i);
        };

        std::vector<std::array<uint32_t, 3>> faces;
        switch (geometry.mode) {
            case PrimitiveMode::Triangles:
                faces.reserve(n / 3);
                for (size_t i = 0; i + 2 < n; i += 3) {
                    faces.push_back({vertex(i), vertex(i + 1), vertex(i + 2)});
                }
                break;
            case PrimitiveMode::TriangleStrip:
                for (size_t i = 0; i + 2 < n; ++i) {
                    // Nei triangoli dispari l'ordine dei primi due vertici si inverte
                    if (i % 2 == 0) {
                        faces.push_back({vertex(i), vertex(i + 1), vertex(i + 2)});
                    } else {
                        faces.push_back({vertex(i + 1), vertex(i), vertex(i + 2)});
                    }
                }
                break;
            case PrimitiveMode::TriangleFan:
                for (size_t i = 1; i + 1 < n; ++i) {
                    faces.push_back({vertex(0), vertex(i), vertex(i + 1)});
                }
                break;
            default:
                break;
        }
        return faces;
    }

    bool GeometryProcessor::generateNormals(Geometry& geometry) {
        const VertexAttribute* position = geometry.find(AttributeSlot::Position);
        if (!position || position->componentCount < 3 || geometry.vertexCount() == 0) {
            Logger::warn("Cannot generate normals: geometry has no positions");
            return false;
        }
        if (geometry.mode != PrimitiveMode::Triangles &&
            geometry.mode != PrimitiveMode::TriangleStrip &&
            geometry.mode != PrimitiveMode::TriangleFan) {
            Logger::warn(std::string("Cannot generate normals for primitive mode ") + toString(geometry.mode));
            return false;
        }

        const size_t vertexCount = geometry.vertexCount();
        const size_t stride = static_cast<size_t>(position->componentCount);
        const std::vector<float> positions = toFloats(*position);

        std::vector<float> normals(vertexCount * 3, 0.0f);

        for (const auto& face : triangles(geometry)) {
            if (face[0] >= vertexCount || face[1] >= vertexCount || face[2] >= vertexCount) {
                continue;
            }
            const float* p1 = &positions[face[0] * stride];
            const float* p2 = &positions[face[1] * stride];
            const float* p3 = &positions[face[2] * stride];

            float v21[3] = {p1[0] - p2[0], p1[1] - p2[1], p1[2] - p2[2]};
            float v32[3] = {p2[0] - p3[0], p2[1] - p3[1], p2[2] - p3[2]};

            // Modulo proporzionale all'area: i triangoli grandi pesano di piu'
            float n[3];
            cross(v21, v32, n);

            for (uint32_t idx : face) {
                normals[idx * 3] += n[0];
                normals[idx * 3 + 1] += n[1];
                normals[idx * 3 + 2] += n[2];
            }
        }

        for (size_t i = 0; i < vertexCount; ++i) {
            normalizeInPlace(&normals[i * 3]);
        }

        VertexAttribute attribute;
        attribute.data = std::move(normals);
        attribute.componentCount = 3;
        geometry.attributes[AttributeSlot::Normal] = std::move(attribute);
        return true;
    }

    bool GeometryProcessor::generateTangents(Geometry& geometry) {
        const VertexAttribute* uvAttribute = geometry.find(AttributeSlot::Uv);
        const VertexAttribute* normalAttribute = geometry.find(AttributeSlot::Normal);
        const VertexAttribute* positionAttribute = geometry.find(AttributeSlot::Position);

        if (!uvAttribute || uvAttribute->length() == 0) {
            Logger::error("Cannot generate tangents: geometry has no texcoords");
            return false;
        }
        if (!normalAttribute || !positionAttribute) {
            Logger::error("Cannot generate tangents: geometry needs position and normal attributes");
            return false;
        }

        const size_t vertexCount = geometry.vertexCount();
        const size_t pStride = static_cast<size_t>(positionAttribute->componentCount);
        const size_t uvStride = static_cast<size_t>(uvAttribute->componentCount);
        const size_t nStride = static_cast<size_t>(normalAttribute->componentCount);
        const std::vector<float> positions = toFloats(*positionAttribute);
        const std::vector<float> uvs = toFloats(*uvAttribute);
        const std::vector<float> normals = toFloats(*normalAttribute);

        if (uvAttribute->vertexCount() < vertexCount || normalAttribute->vertexCount() < vertexCount ||
            pStride < 3 || uvStride < 2 || nStride < 3) {
            Logger::error("Cannot generate tangents: attribute sizes do not match vertex count");
            return false;
        }

        std::vector<float> tan1(vertexCount * 3, 0.0f);
        std::vector<float> tan2(vertexCount * 3, 0.0f);

        for (const auto& face : triangles(geometry)) {
            if (face[0] >= vertexCount || face[1] >= vertexCount || face[2] >= vertexCount) {
                continue;
            }
            const float* v1 = &positions[face[0] * pStride];
            const float* v2 = &positions[face[1] * pStride];
            const float* v3 = &positions[face[2] * pStride];
            const float* w1 = &uvs[face[0] * uvStride];
            const float* w2 = &uvs[face[1] * uvStride];
            const float* w3 = &uvs[face[2] * uvStride];

            float x1 = v2[0] - v1[0], x2 = v3[0] - v1[0];
            float y1 = v2[1] - v1[1], y2 = v3[1] - v1[1];
            float z1 = v2[2] - v1[2], z2 = v3[2] - v1[2];

            float s1 = w2[0] - w1[0], s2 = w3[0] - w1[0];
            float t1 = w2[1] - w1[1], t2 = w3[1] - w1[1];

            // Determinante UV nullo -> inf/NaN, propagato senza controlli
            float r = 1.0f / (s1 * t2 - s2 * t1);

            float sdir[3] = {
                    (t2 * x1 - t1 * x2) * r,
                    (t2 * y1 - t1 * y2) * r,
                    (t2 * z1 - t1 * z2) * r
            };
            float tdir[3] = {
                    (s1 * x2 - s2 * x1) * r,
                    (s1 * y2 - s2 * y1) * r,
                    (s1 * z2 - s2 * z1) * r
            };

            for (uint32_t idx : face) {
                tan1[idx * 3] += sdir[0];
                tan1[idx * 3 + 1] += sdir[1];
                tan1[idx * 3 + 2] += sdir[2];

                tan2[idx * 3] += tdir[0];
                tan2[idx * 3 + 1] += tdir[1];
                tan2[idx * 3 + 2] += tdir[2];
            }
        }

        std::vector<float> tangents(vertexCount * 4, 0.0f);
        for (size_t i = 0; i < vertexCount; ++i) {
            const float* n = &normals[i * nStride];
            const float* t = &tan1[i * 3];

            // Gram-Schmidt
            float nDotT = dot(n, t);
            float* out = &tangents[i * 4];
            out[0] = t[0] - n[0] * nDotT;
            out[1] = t[1] - n[1] * nDotT;
            out[2] = t[2] - n[2] * nDotT;
            normalizeInPlace(out);

            float nCrossT[3];
            cross(n, t, nCrossT);
            out[3] = dot(nCrossT, &tan2[i * 3]) < 0.0f ? -1.0f : 1.0f;
        }

        VertexAttribute attribute;
        attribute.data = std::move(tangents);
        attribute.componentCount = 4;
        geometry.attributes[AttributeSlot::Tangent] = std::move(attribute);
        return true;
    }

} // namespace gltf2mesh
