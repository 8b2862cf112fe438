#pragma once
#include <string>
#include <vector>
#include <map>
#include <array>
#include <variant>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace gltf2mesh {

    // L'ordine corrisponde alle alternative di AttributeData
    enum class ElementType {
        Byte = 0,
        UByte,
        Short,
        UShort,
        Float
    };

    using AttributeData = std::variant<
            std::vector<int8_t>,
            std::vector<uint8_t>,
            std::vector<int16_t>,
            std::vector<uint16_t>,
            std::vector<float>>;

    struct VertexAttribute {
        AttributeData data;
        int componentCount = 0;
        // Interi da normalizzare in [0,1] o [-1,1] al momento dell'upload
        bool normalized = false;

        ElementType elementType() const { return static_cast<ElementType>(data.index()); }

        // Numero totale di componenti memorizzate
        size_t length() const;

        size_t vertexCount() const {
            return componentCount > 0 ? length() / static_cast<size_t>(componentCount) : 0;
        }

        const std::vector<float>* floats() const { return std::get_if<std::vector<float>>(&data); }
    };

    enum class AttributeSlot {
        Position = 0,
        Normal,
        Tangent,
        Uv,
        Uv1,
        Weight,
        Joint,
        Color
    };

    // Nome interno dell'attributo ("position", "uv", ...)
    const char* attributeName(AttributeSlot slot);

    // Semantica glTF ("POSITION", "TEXCOORD_0", ...)
    const char* semanticName(AttributeSlot slot);

    // Semantiche non riconosciute -> std::nullopt
    std::optional<AttributeSlot> slotForSemantic(const std::string& semantic);

    using IndexData = std::variant<std::vector<uint16_t>, std::vector<uint32_t>>;

    struct IndexBuffer {
        IndexData data;

        size_t size() const;
        uint32_t at(size_t i) const;

        // 16 o 32
        int width() const { return data.index() == 0 ? 16 : 32; }
    };

    enum class PrimitiveMode {
        Points = 0,
        Lines,
        LineLoop,
        LineStrip,
        Triangles,
        TriangleStrip,
        TriangleFan
    };

    // Indice mode glTF 0..6; assente o fuori range -> Triangles
    PrimitiveMode primitiveModeFromGltf(std::optional<int> mode);

    const char* toString(PrimitiveMode mode);
    const char* toString(ElementType type);

    struct BoundingBox {
        std::array<float, 3> min;
        std::array<float, 3> max;
    };

/**
 * @struct Geometry
 * @brief Geometria decodificata di una primitive glTF
 *
 * Viene modificata solo da MeshAssembler e GeometryProcessor finche'
 * l'assembler ne detiene la proprieta' esclusiva; una volta restituita
 * al chiamante va trattata come immutabile.
 */
    struct Geometry {
        std::map<AttributeSlot, VertexAttribute> attributes;
        std::optional<IndexBuffer> indices;
        PrimitiveMode mode = PrimitiveMode::Triangles;
        std::optional<BoundingBox> boundingBox;

        bool has(AttributeSlot slot) const { return attributes.count(slot) != 0; }

        const VertexAttribute* find(AttributeSlot slot) const {
            auto it = attributes.find(slot);
            return it == attributes.end() ? nullptr : &it->second;
        }

        // Dall'attributo position, 0 se assente
        size_t vertexCount() const;
    };

} // namespace gltf2mesh
