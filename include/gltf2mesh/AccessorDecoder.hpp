#pragma once
#include <string>
#include <vector>
#include <variant>
#include <cstdint>
#include <cstddef>
#include "gltf2mesh/Document.hpp"
#include "gltf2mesh/Geometry.hpp"

namespace gltf2mesh {

    // Una alternativa per ogni componentType glTF (5120..5126)
    using DecodedArray = std::variant<
            std::vector<int8_t>,
            std::vector<uint8_t>,
            std::vector<int16_t>,
            std::vector<uint16_t>,
            std::vector<uint32_t>,
            std::vector<float>>;

    struct DecodedAccessor {
        DecodedArray data;
        int componentCount = 0;
        bool normalized = false;

        size_t length() const;
    };

    class AccessorDecoder {
    public:
        // SCALAR=1 ... MAT4=16, 0 per tipi sconosciuti
        static int componentCount(const std::string& type);

        // Dimensione in byte dell'elemento; componentType sconosciuti valgono come float
        static size_t elementSize(int componentType);

        /**
         * @brief Ricostruisce l'array tipizzato di un accessor
         *
         * Se l'accessor ha l'estensione WEB3D_quantized_attributes il
         * risultato e' sempre float (raw * scale + offset).
         *
         * @param isIndexBuffer Se true, un type assente vale SCALAR
         * @throws MalformedDataError per indici fuori range o letture oltre il buffer view
         */
        static DecodedAccessor decode(const Document& document,
                                      const BufferViewTable& bufferViews,
                                      size_t accessorIndex,
                                      bool isIndexBuffer = false);

        /**
         * @brief Politica di conversione verso i tipi degli attributi
         *
         * I buffer di attributi non supportano uint32: questi dati
         * vengono convertiti in float. Gli altri tipi restano invariati.
         */
        static AttributeData toAttributeData(DecodedArray&& array);
    };

} // namespace gltf2mesh
