#include "gltf2mesh/AccessorDecoder.hpp"
#include "gltf2mesh/Errors.hpp"
#include <cstring>
#include <limits>
#include <type_traits>

namespace gltf2mesh {

    namespace {
        // componentCount * count elementi di T, senza overflow sulla dimensione in byte
        template <typename T>
        size_t elementCount(int componentCount, size_t count) {
            const size_t elementBytes = sizeof(T) * static_cast<size_t>(componentCount);
            if (count > std::numeric_limits<size_t>::max() / elementBytes) {
                throw MalformedDataError("Accessor count " + std::to_string(count) + " is too large");
            }
            return static_cast<size_t>(componentCount) * count;
        }

        template <typename T>
        std::vector<T> readElements(const std::vector<uint8_t>& bytes,
                                    size_t byteOffset,
                                    size_t byteStride,
                                    int componentCount,
                                    size_t count) {
            const size_t elementBytes = sizeof(T) * static_cast<size_t>(componentCount);
            const size_t stride = byteStride > 0 ? byteStride : elementBytes;
            if (stride < elementBytes) {
                throw MalformedDataError("byteStride " + std::to_string(stride) +
                                         " is smaller than the element size " + std::to_string(elementBytes));
            }
            if (count == 0) {
                return {};
            }

            // Ogni termine e' confrontato con lo spazio rimasto: nessuna somma puo' andare in overflow
            const size_t size = bytes.size();
            if (byteOffset > size || elementBytes > size - byteOffset ||
                count - 1 > (size - byteOffset - elementBytes) / stride) {
                throw MalformedDataError("Accessor of " + std::to_string(count) + " elements at offset " +
                                         std::to_string(byteOffset) + " reads past a buffer view of " +
                                         std::to_string(size) + " bytes");
            }

            std::vector<T> out(elementCount<T>(componentCount, count));
            if (stride == elementBytes) {
                // Dati contigui: una sola copia
                std::memcpy(out.data(), bytes.data() + byteOffset, elementBytes * count);
            } else {
                for (size_t i = 0; i < count; ++i) {
                    std::memcpy(out.data() + i * static_cast<size_t>(componentCount),
                                bytes.data() + byteOffset + i * stride,
                                elementBytes);
                }
            }
            return out;
        }

        template <typename T>
        DecodedArray readOrZero(const std::vector<uint8_t>* bytes,
                                size_t byteOffset,
                                size_t byteStride,
                                int componentCount,
                                size_t count) {
            if (!bytes) {
                return std::vector<T>(elementCount<T>(componentCount, count), T{});
            }
            return readElements<T>(*bytes, byteOffset, byteStride, componentCount, count);
        }

        DecodedArray readTyped(int componentType,
                               const std::vector<uint8_t>* bytes,
                               size_t byteOffset,
                               size_t byteStride,
                               int componentCount,
                               size_t count) {
            switch (componentType) {
                case component_type::BYTE:
                    return readOrZero<int8_t>(bytes, byteOffset, byteStride, componentCount, count);
                case component_type::UNSIGNED_BYTE:
                    return readOrZero<uint8_t>(bytes, byteOffset, byteStride, componentCount, count);
                case component_type::SHORT:
                    return readOrZero<int16_t>(bytes, byteOffset, byteStride, componentCount, count);
                case component_type::UNSIGNED_SHORT:
                    return readOrZero<uint16_t>(bytes, byteOffset, byteStride, componentCount, count);
                case component_type::UNSIGNED_INT:
                    return readOrZero<uint32_t>(bytes, byteOffset, byteStride, componentCount, count);
                default:
                    return readOrZero<float>(bytes, byteOffset, byteStride, componentCount, count);
            }
        }

        std::vector<float> dequantize(const DecodedArray& raw,
                                      const std::vector<double>& decodeMatrix,
                                      int componentCount,
                                      size_t count) {
            const size_t n = static_cast<size_t>(componentCount);
            if (decodeMatrix.size() != (n + 1) * (n + 1)) {
                throw MalformedDataError("decodeMatrix must have " + std::to_string((n + 1) * (n + 1)) +
                                         " entries, got " + std::to_string(decodeMatrix.size()));
            }

            std::vector<float> scale(n);
            std::vector<float> offset(n);
            for (size_t k = 0; k < n; ++k) {
                scale[k] = static_cast<float>(decodeMatrix[k * (n + 1) + k]);
                offset[k] = static_cast<float>(decodeMatrix[n * (n + 1) + k]);
            }

            std::vector<float> decoded(n * count);
            std::visit([&](const auto& values) {
                for (size_t i = 0; i < count; ++i) {
                    for (size_t k = 0; k < n; ++k) {
                        decoded[i * n + k] = static_cast<float>(values[i * n + k]) * scale[k] + offset[k];
                    }
                }
            }, raw);
            return decoded;
        }
    }

    size_t DecodedAccessor::length() const {
        return std::visit([](const auto& values) { return values.size(); }, data);
    }

    int AccessorDecoder::componentCount(const std::string& type) {
        if (type == "SCALAR") return 1;
        if (type == "VEC2") return 2;
        if (type == "VEC3") return 3;
        if (type == "VEC4") return 4;
        if (type == "MAT2") return 4;
        if (type == "MAT3") return 9;
        if (type == "MAT4") return 16;
        return 0;
    }

    size_t AccessorDecoder::elementSize(int componentType) {
        switch (componentType) {
            case component_type::BYTE:
            case component_type::UNSIGNED_BYTE:
                return 1;
            case component_type::SHORT:
            case component_type::UNSIGNED_SHORT:
                return 2;
            default:
                return 4;
        }
    }

    DecodedAccessor AccessorDecoder::decode(const Document& document,
                                            const BufferViewTable& bufferViews,
                                            size_t accessorIndex,
                                            bool isIndexBuffer) {
        if (accessorIndex >= document.accessors.size()) {
            throw MalformedDataError("Accessor index " + std::to_string(accessorIndex) + " out of range");
        }
        const Accessor& accessor = document.accessors[accessorIndex];

        int size = componentCount(accessor.type);
        if (size == 0 && isIndexBuffer) {
            size = 1;
        }
        if (size == 0) {
            throw MalformedDataError("Accessor " + std::to_string(accessorIndex) +
                                     " has unknown type '" + accessor.type + "'");
        }

        const std::vector<uint8_t>* bytes = nullptr;
        size_t byteStride = 0;
        if (accessor.bufferView) {
            size_t viewIndex = *accessor.bufferView;
            if (viewIndex >= bufferViews.size() || viewIndex >= document.bufferViews.size()) {
                throw MalformedDataError("Buffer view index " + std::to_string(viewIndex) + " out of range");
            }
            bytes = &bufferViews[viewIndex];
            // byteStride uguale alla dimensione dell'elemento equivale a dati contigui
            const auto& stride = document.bufferViews[viewIndex].byteStride;
            if (stride) {
                byteStride = *stride;
            }
        }

        DecodedAccessor result;
        result.componentCount = size;
        result.normalized = accessor.normalized;
        result.data = readTyped(accessor.componentType, bytes, accessor.byteOffset, byteStride, size, accessor.count);

        if (accessor.decodeMatrix) {
            result.data = dequantize(result.data, *accessor.decodeMatrix, size, accessor.count);
            result.normalized = false;
        }

        return result;
    }

    AttributeData AccessorDecoder::toAttributeData(DecodedArray&& array) {
        return std::visit([](auto&& values) -> AttributeData {
            using T = typename std::decay_t<decltype(values)>::value_type;
            if constexpr (std::is_same_v<T, uint32_t>) {
                return std::vector<float>(values.begin(), values.end());
            } else {
                return std::move(values);
            }
        }, std::move(array));
    }

} // namespace gltf2mesh
