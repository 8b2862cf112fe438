#include "gltf2mesh/MeshAssembler.hpp"
#include "gltf2mesh/GeometryProcessor.hpp"
#include "gltf2mesh/Errors.hpp"
#include "gltf2mesh/Logger.hpp"
#include <limits>
#include <type_traits>

namespace gltf2mesh {

    namespace {
        template <typename Out, typename In>
        std::vector<Out> convert(const std::vector<In>& values) {
            return std::vector<Out>(values.begin(), values.end());
        }

        std::string primitiveLabel(size_t meshIndex, size_t primitiveIndex) {
            return "mesh " + std::to_string(meshIndex) + ", primitive " + std::to_string(primitiveIndex);
        }
    }

    VertexAttribute MeshAssembler::renormalizeWeights(const VertexAttribute& weights) {
        // La somma annulla l'eventuale normalizzazione intera: il risultato e' sempre float
        std::vector<float> result = std::visit([](const auto& values) {
            const size_t count = values.size() / 4;
            std::vector<float> out(count * 3);
            for (size_t i = 0; i < count; ++i) {
                float w1 = static_cast<float>(values[i * 4]);
                float w2 = static_cast<float>(values[i * 4 + 1]);
                float w3 = static_cast<float>(values[i * 4 + 2]);
                float w4 = static_cast<float>(values[i * 4 + 3]);
                float sum = w1 + w2 + w3 + w4;
                out[i * 3] = w1 / sum;
                out[i * 3 + 1] = w2 / sum;
                out[i * 3 + 2] = w3 / sum;
            }
            return out;
        }, weights.data);

        VertexAttribute attribute;
        attribute.data = std::move(result);
        attribute.componentCount = 3;
        return attribute;
    }

    VertexAttribute MeshAssembler::expandColor(const VertexAttribute& color) {
        VertexAttribute attribute;
        attribute.componentCount = 4;
        attribute.normalized = color.normalized;
        attribute.data = std::visit([&color](const auto& values) -> AttributeData {
            using T = typename std::decay_t<decltype(values)>::value_type;
            // Per i colori interi normalizzati 1.0 corrisponde al massimo del tipo
            T alpha = T(1);
            if constexpr (std::is_integral_v<T>) {
                if (color.normalized) {
                    alpha = std::numeric_limits<T>::max();
                }
            }

            const size_t count = values.size() / 3;
            std::vector<T> out(count * 4);
            for (size_t i = 0; i < count; ++i) {
                out[i * 4] = values[i * 3];
                out[i * 4 + 1] = values[i * 3 + 1];
                out[i * 4 + 2] = values[i * 3 + 2];
                out[i * 4 + 3] = alpha;
            }
            return out;
        }, color.data);
        return attribute;
    }

    IndexBuffer MeshAssembler::toIndexBuffer(DecodedArray&& indices, size_t vertexCount, IndexPolicy policy) {
        IndexBuffer buffer;

        if (auto* u8 = std::get_if<std::vector<uint8_t>>(&indices)) {
            if (policy == IndexPolicy::Widen32) {
                buffer.data = convert<uint32_t>(*u8);
            } else {
                buffer.data = convert<uint16_t>(*u8);
            }
        } else if (auto* u16 = std::get_if<std::vector<uint16_t>>(&indices)) {
            if (policy == IndexPolicy::Widen32) {
                buffer.data = convert<uint32_t>(*u16);
            } else {
                buffer.data = std::move(*u16);
            }
        } else if (auto* u32 = std::get_if<std::vector<uint32_t>>(&indices)) {
            if (policy == IndexPolicy::Shrink16 && vertexCount <= 0xFFFF) {
                // Validati prima della conversione: valori oltre 16 bit verrebbero troncati
                for (uint32_t index : *u32) {
                    if (index >= vertexCount) {
                        throw MalformedDataError("Index " + std::to_string(index) +
                                                 " out of range for " + std::to_string(vertexCount) + " vertices");
                    }
                }
                buffer.data = convert<uint16_t>(*u32);
            } else {
                buffer.data = std::move(*u32);
            }
        } else {
            throw MalformedDataError("Index accessor must use an unsigned integer component type");
        }

        for (size_t i = 0; i < buffer.size(); ++i) {
            if (buffer.at(i) >= vertexCount) {
                throw MalformedDataError("Index " + std::to_string(buffer.at(i)) +
                                         " out of range for " + std::to_string(vertexCount) + " vertices");
            }
        }
        return buffer;
    }

    Geometry MeshAssembler::assemble(const Document& document,
                                     const BufferViewTable& bufferViews,
                                     size_t meshIndex,
                                     size_t primitiveIndex,
                                     const LoaderOptions& options) {
        if (meshIndex >= document.meshes.size() ||
            primitiveIndex >= document.meshes[meshIndex].primitives.size()) {
            throw MalformedDataError("No such primitive: " + primitiveLabel(meshIndex, primitiveIndex));
        }
        const Primitive& primitive = document.meshes[meshIndex].primitives[primitiveIndex];

        if (primitive.hasExtension(extensions::KHR_DRACO_MESH_COMPRESSION)) {
            throw UnsupportedFeatureError(extensions::KHR_DRACO_MESH_COMPRESSION, meshIndex, primitiveIndex);
        }

        Geometry geometry;

        for (const auto& entry : primitive.attributes) {
            const std::string& semantic = entry.first;
            auto slot = slotForSemantic(semantic);
            if (!slot) {
                Logger::debug("Skipping attribute " + semantic + " of " + primitiveLabel(meshIndex, primitiveIndex));
                continue;
            }

            DecodedAccessor decoded = AccessorDecoder::decode(document, bufferViews, entry.second);

            VertexAttribute attribute;
            attribute.componentCount = decoded.componentCount;
            attribute.normalized = decoded.normalized;
            attribute.data = AccessorDecoder::toAttributeData(std::move(decoded.data));

            if (*slot == AttributeSlot::Weight && attribute.componentCount == 4) {
                attribute = renormalizeWeights(attribute);
            } else if (*slot == AttributeSlot::Color && attribute.componentCount == 3) {
                attribute = expandColor(attribute);
            }

            if (*slot == AttributeSlot::Position) {
                const Accessor& accessor = document.accessors[entry.second];
                if (accessor.min.size() >= 3 && accessor.max.size() >= 3) {
                    BoundingBox box{};
                    for (size_t k = 0; k < 3; ++k) {
                        box.min[k] = static_cast<float>(accessor.min[k]);
                        box.max[k] = static_cast<float>(accessor.max[k]);
                    }
                    geometry.boundingBox = box;
                }
            }

            geometry.attributes[*slot] = std::move(attribute);
        }

        const size_t vertexCount = geometry.vertexCount();
        if (geometry.has(AttributeSlot::Position)) {
            for (const auto& entry : geometry.attributes) {
                if (entry.second.vertexCount() != vertexCount) {
                    throw MalformedDataError(std::string("Attribute ") + attributeName(entry.first) + " has " +
                                             std::to_string(entry.second.vertexCount()) + " vertices, expected " +
                                             std::to_string(vertexCount) + " (" +
                                             primitiveLabel(meshIndex, primitiveIndex) + ")");
                }
            }
        }

        if (primitive.indices) {
            DecodedAccessor indices = AccessorDecoder::decode(document, bufferViews, *primitive.indices, true);
            geometry.indices = toIndexBuffer(std::move(indices.data), vertexCount, options.indexPolicy);
        }

        geometry.mode = primitiveModeFromGltf(primitive.mode);

        if (!geometry.has(AttributeSlot::Normal) && vertexCount > 0) {
            GeometryProcessor::generateNormals(geometry);
        }
        if (options.generateTangents && !geometry.has(AttributeSlot::Tangent) && geometry.has(AttributeSlot::Uv)) {
            GeometryProcessor::generateTangents(geometry);
        }

        Logger::debug("Assembled " + primitiveLabel(meshIndex, primitiveIndex) + ": " +
                      std::to_string(vertexCount) + " vertices, mode " + toString(geometry.mode));
        return geometry;
    }

} // namespace gltf2mesh
