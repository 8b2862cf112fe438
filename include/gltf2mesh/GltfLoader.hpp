#pragma once
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <cstdint>
#include "gltf2mesh/Document.hpp"
#include "gltf2mesh/Geometry.hpp"
#include "gltf2mesh/LoaderOptions.hpp"
#include "gltf2mesh/ResourceFetcher.hpp"

namespace gltf2mesh {

    struct LoadResult {
        std::string sourceUrl;
        std::string documentSha256;
        std::vector<std::string> meshNames;
        // Una lista di Geometry per mesh, una Geometry per primitive
        std::vector<std::vector<Geometry>> meshes;
    };

    using RawBuffers = std::vector<std::vector<uint8_t>>;

    class GltfLoader {
    public:
        explicit GltfLoader(LoaderOptions options = LoaderOptions(),
                            std::shared_ptr<ResourceFetcher> fetcher = nullptr);

        /**
         * @brief Carica un asset .gltf o .glb da file o URL http(s)
         *
         * @throws LoadError per URL vuoto, content type non glTF o documento non valido
         * @throws BufferLoadError, BufferCompletenessError, UnsupportedFeatureError, MalformedDataError
         */
        LoadResult load(const std::string& url) const;

        // Asset gia' in memoria; sourceUrl serve a risolvere i buffer esterni
        LoadResult loadFromMemory(const std::vector<uint8_t>& bytes,
                                  const std::string& sourceUrl,
                                  const std::string& contentType = "") const;

        // Salta la risoluzione dei buffer: buffers deve contenerne uno per ogni buffer dichiarato
        LoadResult parse(const Document& document, const RawBuffers& buffers) const;

        RawBuffers loadBuffers(const Document& document,
                               const std::string& bufferRootPath,
                               const std::vector<uint8_t>* embeddedBin) const;

        // @throws MalformedDataError se una view esce dal suo buffer
        static BufferViewTable sliceBufferViews(const Document& document, const RawBuffers& buffers);

        const LoaderOptions& getOptions() const { return options; }

    private:
        LoaderOptions options;
        std::shared_ptr<ResourceFetcher> fetcher;

        unsigned int workers() const;
    };

} // namespace gltf2mesh
