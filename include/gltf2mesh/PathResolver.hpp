#pragma once
#include <string>

namespace gltf2mesh {

    class PathResolver {
    public:
        /**
         * @brief Risolve un percorso relativo rispetto a una directory base
         *
         * I segmenti iniziali "./" vengono scartati, ogni "../" iniziale
         * rimuove l'ultima directory di basePath. Percorsi assoluti
         * (che iniziano con '/') e basePath vuoto restano invariati.
         */
        static std::string resolve(const std::string& path, const std::string& basePath);

        // "data:...base64," -> true
        static bool isDataUri(const std::string& uri);

        // Offset del primo carattere base64 di una data URI, std::string::npos se assente
        static size_t dataUriPayloadOffset(const std::string& uri);

        // Tutto cio' che precede l'ultimo '/', stringa vuota se non c'e'
        static std::string parentOf(const std::string& url);
    };

} // namespace gltf2mesh
