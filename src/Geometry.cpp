#include "gltf2mesh/Geometry.hpp"

namespace gltf2mesh {

    namespace {
        struct SemanticEntry {
            AttributeSlot slot;
            const char* semantic;
            const char* name;
        };

        const std::array<SemanticEntry, 8> kSemanticTable = {{
                {AttributeSlot::Position, "POSITION", "position"},
                {AttributeSlot::Normal, "NORMAL", "normal"},
                {AttributeSlot::Tangent, "TANGENT", "tangent"},
                {AttributeSlot::Uv, "TEXCOORD_0", "uv"},
                {AttributeSlot::Uv1, "TEXCOORD_1", "uv1"},
                {AttributeSlot::Weight, "WEIGHTS_0", "weight"},
                {AttributeSlot::Joint, "JOINTS_0", "joint"},
                {AttributeSlot::Color, "COLOR_0", "color"},
        }};

        const std::array<PrimitiveMode, 7> kModeTable = {
                PrimitiveMode::Points,
                PrimitiveMode::Lines,
                PrimitiveMode::LineLoop,
                PrimitiveMode::LineStrip,
                PrimitiveMode::Triangles,
                PrimitiveMode::TriangleStrip,
                PrimitiveMode::TriangleFan,
        };
    }

    size_t VertexAttribute::length() const {
        return std::visit([](const auto& values) { return values.size(); }, data);
    }

    const char* attributeName(AttributeSlot slot) {
        return kSemanticTable[static_cast<size_t>(slot)].name;
    }

    const char* semanticName(AttributeSlot slot) {
        return kSemanticTable[static_cast<size_t>(slot)].semantic;
    }

    std::optional<AttributeSlot> slotForSemantic(const std::string& semantic) {
        for (const auto& entry : kSemanticTable) {
            if (semantic == entry.semantic) {
                return entry.slot;
            }
        }
        return std::nullopt;
    }

    size_t IndexBuffer::size() const {
        return std::visit([](const auto& values) { return values.size(); }, data);
    }

    uint32_t IndexBuffer::at(size_t i) const {
        return std::visit([i](const auto& values) { return static_cast<uint32_t>(values[i]); }, data);
    }

    PrimitiveMode primitiveModeFromGltf(std::optional<int> mode) {
        if (!mode || *mode < 0 || *mode >= static_cast<int>(kModeTable.size())) {
            return PrimitiveMode::Triangles;
        }
        return kModeTable[static_cast<size_t>(*mode)];
    }

    const char* toString(PrimitiveMode mode) {
        switch (mode) {
            case PrimitiveMode::Points: return "points";
            case PrimitiveMode::Lines: return "lines";
            case PrimitiveMode::LineLoop: return "lineloop";
            case PrimitiveMode::LineStrip: return "linestrip";
            case PrimitiveMode::Triangles: return "triangles";
            case PrimitiveMode::TriangleStrip: return "trianglestrip";
            case PrimitiveMode::TriangleFan: return "trianglefan";
        }
        return "triangles";
    }

    const char* toString(ElementType type) {
        switch (type) {
            case ElementType::Byte: return "byte";
            case ElementType::UByte: return "ubyte";
            case ElementType::Short: return "short";
            case ElementType::UShort: return "ushort";
            case ElementType::Float: return "float";
        }
        return "float";
    }

    size_t Geometry::vertexCount() const {
        const VertexAttribute* position = find(AttributeSlot::Position);
        return position ? position->vertexCount() : 0;
    }

} // namespace gltf2mesh
