#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace gltf2mesh {

    class Base64 {
    public:
        /**
         * @brief Decodifica la sequenza base64 che inizia a charStart
         *
         * Fino a due '=' finali vengono ignorati. L'output ha
         * floor(len * 3 / 4) byte, dove len e' la lunghezza senza padding.
         *
         * @throws MalformedDataError se compare un carattere fuori alfabeto
         */
        static std::vector<uint8_t> decode(const std::string& input, size_t charStart = 0);
    };

} // namespace gltf2mesh
