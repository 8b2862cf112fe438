#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace gltf2mesh {

    struct GlbContainer {
        static constexpr uint32_t MAGIC = 0x46546C67;       // "glTF"
        static constexpr uint32_t CHUNK_JSON = 0x4E4F534A;  // "JSON"
        static constexpr uint32_t CHUNK_BIN = 0x004E4942;   // "BIN\0"

        std::string json;
        std::optional<std::vector<uint8_t>> bin;

        static bool isGlb(const std::vector<uint8_t>& bytes);

        // @throws LoadError per header, versione o chunk non validi
        static GlbContainer parse(const std::vector<uint8_t>& bytes);
    };

} // namespace gltf2mesh
