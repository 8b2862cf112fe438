#pragma once
#include <string>
#include "gltf2mesh/Logger.hpp"

namespace gltf2mesh {

    class EnvironmentHandler {
    public:
        static EnvironmentHandler& instance();

        // Legge le variabili GLTF2MESH_*; valori non validi -> std::runtime_error
        void init();

        int getPort() const;
        unsigned int getWorkerCount() const;
        const std::string& getIndexPolicy() const;
        bool getGenerateTangents() const;
        unsigned int getHttpTimeoutSeconds() const;
        LogLevel getLogLevel() const;
        // Radice dei file locali serviti da /decode, vuota se non configurata
        const std::string& getAssetRoot() const;

    private:
        EnvironmentHandler() = default;

        int port = 8080;
        unsigned int workerCount = 0;
        std::string indexPolicy = "shrink16";
        bool generateTangents = false;
        unsigned int httpTimeoutSeconds = 30;
        LogLevel logLevel = LogLevel::Info;
        std::string assetRoot;
    };

} // namespace gltf2mesh
