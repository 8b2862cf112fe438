#pragma once
#include <string>
#include "gltf2mesh/GltfLoader.hpp"
#include "gltf2mesh/LoaderOptions.hpp"

namespace gltf2mesh {

    class Server {
    public:
        // I file locali sono leggibili solo sotto assetRoot; vuoto: solo URL http(s)
        Server(LoaderOptions options, const std::string& assetRoot);

        // Bloccante: GET /health, POST /decode {"url": "..."}
        void start(int port);

        const GltfLoader& getLoader() const { return loader; }

    private:
        GltfLoader loader;
    };

} // namespace gltf2mesh
