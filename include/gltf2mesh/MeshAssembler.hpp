#pragma once
#include <cstddef>
#include "gltf2mesh/Document.hpp"
#include "gltf2mesh/Geometry.hpp"
#include "gltf2mesh/AccessorDecoder.hpp"
#include "gltf2mesh/LoaderOptions.hpp"

namespace gltf2mesh {

    class MeshAssembler {
    public:
        /**
         * @brief Costruisce la Geometry di una primitive
         *
         * Indipendente dalle altre primitive: puo' girare in parallelo.
         * Se la primitive non ha normali vengono generate; le tangenti
         * solo con options.generateTangents.
         *
         * @throws UnsupportedFeatureError per primitive compresse con Draco
         * @throws MalformedDataError per attributi incoerenti o indici fuori range
         */
        static Geometry assemble(const Document& document,
                                 const BufferViewTable& bufferViews,
                                 size_t meshIndex,
                                 size_t primitiveIndex,
                                 const LoaderOptions& options);

        // WEIGHTS_0 vec4 -> 3 componenti float divise per la somma dei 4 pesi
        static VertexAttribute renormalizeWeights(const VertexAttribute& weights);

        // COLOR_0 vec3 -> vec4 con alpha pieno
        static VertexAttribute expandColor(const VertexAttribute& color);

        static IndexBuffer toIndexBuffer(DecodedArray&& indices, size_t vertexCount, IndexPolicy policy);
    };

} // namespace gltf2mesh
