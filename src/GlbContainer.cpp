#include "gltf2mesh/GlbContainer.hpp"
#include "gltf2mesh/Errors.hpp"
#include "gltf2mesh/Logger.hpp"
#include <cstddef>

namespace gltf2mesh {

    namespace {
        // Il formato GLB e' little-endian
        uint32_t readU32(const std::vector<uint8_t>& bytes, size_t offset) {
            return static_cast<uint32_t>(bytes[offset]) |
                   (static_cast<uint32_t>(bytes[offset + 1]) << 8) |
                   (static_cast<uint32_t>(bytes[offset + 2]) << 16) |
                   (static_cast<uint32_t>(bytes[offset + 3]) << 24);
        }
    }

    bool GlbContainer::isGlb(const std::vector<uint8_t>& bytes) {
        return bytes.size() >= 4 && readU32(bytes, 0) == MAGIC;
    }

    GlbContainer GlbContainer::parse(const std::vector<uint8_t>& bytes) {
        if (bytes.size() < 12) {
            throw LoadError("Invalid glTF binary format: file too small");
        }
        if (readU32(bytes, 0) != MAGIC) {
            throw LoadError("Invalid glTF binary format: Invalid header");
        }
        uint32_t version = readU32(bytes, 4);
        if (version != 2) {
            throw LoadError("Only glTF 2.0 is supported, got binary version " + std::to_string(version));
        }
        size_t length = readU32(bytes, 8);
        if (length > bytes.size()) {
            throw LoadError("Invalid glTF binary format: truncated. Expected " +
                            std::to_string(length) + " bytes, got " + std::to_string(bytes.size()));
        }

        GlbContainer container;
        bool hasJson = false;

        size_t offset = 12;
        while (offset + 8 <= length) {
            size_t chunkLength = readU32(bytes, offset);
            uint32_t chunkType = readU32(bytes, offset + 4);
            offset += 8;

            if (offset + chunkLength > length) {
                throw LoadError("Invalid glTF binary format: chunk exceeds file length");
            }

            auto begin = bytes.begin() + static_cast<std::ptrdiff_t>(offset);
            auto end = begin + static_cast<std::ptrdiff_t>(chunkLength);

            if (chunkType == CHUNK_JSON && !hasJson) {
                container.json.assign(begin, end);
                hasJson = true;
            } else if (chunkType == CHUNK_BIN && !container.bin) {
                container.bin = std::vector<uint8_t>(begin, end);
            } else {
                Logger::debug("Skipping GLB chunk of type " + std::to_string(chunkType));
            }

            offset += chunkLength;
        }

        if (!hasJson) {
            throw LoadError("Invalid glTF binary format: Can't find JSON.");
        }
        return container;
    }

} // namespace gltf2mesh
