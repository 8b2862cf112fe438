#pragma once
#include <nlohmann/json.hpp>
#include "gltf2mesh/Geometry.hpp"
#include "gltf2mesh/GltfLoader.hpp"

namespace gltf2mesh {

    class Summary {
    public:
        // mode, vertexCount, tabella attributi, indici e bounding box di una Geometry
        static nlohmann::json toJson(const Geometry& geometry);

        static nlohmann::json toJson(const LoadResult& result);
    };

} // namespace gltf2mesh
