#pragma once
#include <array>
#include <vector>
#include <cstdint>
#include "gltf2mesh/Geometry.hpp"

namespace gltf2mesh {

    class GeometryProcessor {
    public:
        /**
         * @brief Calcola le normali per vertice, pesate per area
         *
         * Sostituisce un eventuale attributo normal. I vertici con normale
         * accumulata nulla restano (0,0,0).
         *
         * @return false se la geometria non ha posizioni o non e' fatta di triangoli
         */
        static bool generateNormals(Geometry& geometry);

        /**
         * @brief Calcola le tangenti (xyz + segno di handedness in w)
         *
         * Richiede gli attributi uv e normal float; se mancano
         * registra un warning e lascia la geometria invariata.
         */
        static bool generateTangents(Geometry& geometry);

        // Terne di vertici dei triangoli, espandendo strip e fan
        static std::vector<std::array<uint32_t, 3>> triangles(const Geometry& geometry);
    };

} // namespace gltf2mesh
