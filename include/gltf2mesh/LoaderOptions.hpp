#pragma once
#include <string>

namespace gltf2mesh {

    // Larghezza degli indici in uscita
    enum class IndexPolicy {
        Shrink16,   // 16 bit quando vertexCount <= 0xFFFF, altrimenti 32
        Widen32     // sempre 32 bit
    };

    IndexPolicy parseIndexPolicy(const std::string& name);
    const char* toString(IndexPolicy policy);

    struct LoaderOptions {
        // Vuoti: ricavati dall'URL del documento
        std::string rootPath;
        std::string bufferRootPath;

        IndexPolicy indexPolicy = IndexPolicy::Shrink16;
        bool generateTangents = false;

        // 0: un worker per core
        unsigned int workerCount = 0;
        unsigned int httpTimeoutSeconds = 30;

        // Dai valori di EnvironmentHandler (init() deve essere gia' stato chiamato)
        static LoaderOptions fromEnvironment();
    };

} // namespace gltf2mesh
