#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include "gltf2mesh/Document.hpp"
#include "gltf2mesh/ResourceFetcher.hpp"

namespace gltf2mesh {

/**
 * @class BufferResolver
 * @brief Trasforma l'uri di un buffer glTF nei suoi byte
 *
 * Le data URI base64 vengono decodificate senza I/O; gli altri uri sono
 * risolti rispetto a basePath e letti tramite il ResourceFetcher.
 */
    class BufferResolver {
    public:
        BufferResolver(ResourceFetcher& fetcher, std::string basePath);

        // Percorso finale passato al fetcher (le data URI restano invariate)
        std::string resolvePath(const std::string& uri) const;

        /**
         * @param embeddedBin Chunk BIN del GLB, usato dai buffer senza uri (puo' essere nullptr)
         * @throws BufferLoadError se il fetch fallisce o manca il chunk BIN
         * @throws BufferCompletenessError se i byte sono meno di byteLength
         */
        std::vector<uint8_t> resolve(const Buffer& buffer, const std::vector<uint8_t>* embeddedBin) const;

    private:
        ResourceFetcher& fetcher;
        std::string basePath;
    };

} // namespace gltf2mesh
