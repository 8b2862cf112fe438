#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace gltf2mesh {

    class Hasher {
    public:
        // SHA-256 in esadecimale minuscolo
        static std::string sha256(const std::vector<uint8_t>& data);
        static std::string sha256_file(const std::string& path);
    };

} // namespace gltf2mesh
