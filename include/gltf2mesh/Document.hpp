#pragma once
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <algorithm>
#include <cstdint>
#include <cstddef>

namespace gltf2mesh {

    namespace extensions {
        constexpr const char* KHR_DRACO_MESH_COMPRESSION = "KHR_draco_mesh_compression";
        constexpr const char* WEB3D_QUANTIZED_ATTRIBUTES = "WEB3D_quantized_attributes";
    }

    namespace component_type {
        constexpr int BYTE = 5120;
        constexpr int UNSIGNED_BYTE = 5121;
        constexpr int SHORT = 5122;
        constexpr int UNSIGNED_SHORT = 5123;
        constexpr int UNSIGNED_INT = 5125;
        constexpr int FLOAT = 5126;
    }

    struct Buffer {
        // Assente per il chunk BIN di un GLB
        std::optional<std::string> uri;
        size_t byteLength = 0;
    };

    struct BufferView {
        size_t buffer = 0;
        size_t byteOffset = 0;
        size_t byteLength = 0;
        std::optional<size_t> byteStride;
    };

    struct Accessor {
        std::optional<size_t> bufferView;
        size_t byteOffset = 0;
        int componentType = component_type::FLOAT;
        std::string type;
        size_t count = 0;
        bool normalized = false;
        std::vector<double> min;
        std::vector<double> max;

        // WEB3D_quantized_attributes.decodeMatrix, row-major
        std::optional<std::vector<double>> decodeMatrix;
    };

    struct Primitive {
        std::map<std::string, size_t> attributes;
        std::optional<size_t> indices;
        std::optional<int> mode;
        std::vector<std::string> extensions;

        bool hasExtension(const std::string& name) const {
            return std::find(extensions.begin(), extensions.end(), name) != extensions.end();
        }
    };

    struct Mesh {
        std::string name;
        std::vector<Primitive> primitives;
    };

    /**
     * @struct Document
     * @brief Sottoinsieme del JSON glTF 2.0 usato per decodificare le mesh
     *
     * Immutabile dopo il parsing; vive solo per la durata di un caricamento.
     */
    struct Document {
        std::vector<Buffer> buffers;
        std::vector<BufferView> bufferViews;
        std::vector<Accessor> accessors;
        std::vector<Mesh> meshes;
    };

    // Byte di ogni buffer view, gia' ritagliati dal buffer sorgente
    using BufferViewTable = std::vector<std::vector<uint8_t>>;

} // namespace gltf2mesh
