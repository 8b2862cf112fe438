#include "gltf2mesh/EnvironmentHandler.hpp"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <thread>

namespace gltf2mesh {

    namespace {
        const char* env(const char* name) {
            const char* value = std::getenv(name);
            return (value && *value) ? value : nullptr;
        }

        unsigned long parseUnsigned(const char* name, const char* value) {
            try {
                size_t consumed = 0;
                unsigned long parsed = std::stoul(value, &consumed);
                if (consumed != std::string(value).size()) {
                    throw std::invalid_argument(value);
                }
                return parsed;
            } catch (const std::exception&) {
                throw std::runtime_error(std::string("Invalid value for ") + name + ": " + value);
            }
        }
    }

    EnvironmentHandler& EnvironmentHandler::instance() {
        static EnvironmentHandler instance;
        return instance;
    }

    void EnvironmentHandler::init() {
        if (const char* value = env("GLTF2MESH_PORT")) {
            unsigned long parsed = parseUnsigned("GLTF2MESH_PORT", value);
            if (parsed == 0 || parsed > 65535) {
                throw std::runtime_error(std::string("GLTF2MESH_PORT out of range: ") + value);
            }
            port = static_cast<int>(parsed);
        }

        workerCount = std::max(1u, std::thread::hardware_concurrency());
        if (const char* value = env("GLTF2MESH_WORKERS")) {
            unsigned long parsed = parseUnsigned("GLTF2MESH_WORKERS", value);
            if (parsed == 0) {
                throw std::runtime_error("GLTF2MESH_WORKERS must be at least 1");
            }
            workerCount = static_cast<unsigned int>(parsed);
        }

        if (const char* value = env("GLTF2MESH_INDEX_POLICY")) {
            std::string policy = value;
            if (policy != "shrink16" && policy != "widen32") {
                throw std::runtime_error("GLTF2MESH_INDEX_POLICY must be shrink16 or widen32, got: " + policy);
            }
            indexPolicy = policy;
        }

        if (const char* value = env("GLTF2MESH_GENERATE_TANGENTS")) {
            std::string flag = value;
            if (flag != "0" && flag != "1") {
                throw std::runtime_error("GLTF2MESH_GENERATE_TANGENTS must be 0 or 1, got: " + flag);
            }
            generateTangents = flag == "1";
        }

        if (const char* value = env("GLTF2MESH_HTTP_TIMEOUT_S")) {
            httpTimeoutSeconds = static_cast<unsigned int>(parseUnsigned("GLTF2MESH_HTTP_TIMEOUT_S", value));
        }

        assetRoot.clear();
        if (const char* value = env("GLTF2MESH_ASSET_ROOT")) {
            if (!std::filesystem::is_directory(value)) {
                throw std::runtime_error(std::string("GLTF2MESH_ASSET_ROOT is not a directory: ") + value);
            }
            assetRoot = value;
        }

        if (const char* value = env("GLTF2MESH_LOG_LEVEL")) {
            logLevel = Logger::parseLevel(value);
        }
        Logger::setLevel(logLevel);

        Logger::debug("Configuration: port=" + std::to_string(port) +
                      " workers=" + std::to_string(workerCount) +
                      " indexPolicy=" + indexPolicy +
                      " generateTangents=" + (generateTangents ? "1" : "0") +
                      " httpTimeout=" + std::to_string(httpTimeoutSeconds) + "s" +
                      " assetRoot=" + (assetRoot.empty() ? "<none>" : assetRoot));
    }

    int EnvironmentHandler::getPort() const {
        return port;
    }

    unsigned int EnvironmentHandler::getWorkerCount() const {
        return workerCount;
    }

    const std::string& EnvironmentHandler::getIndexPolicy() const {
        return indexPolicy;
    }

    bool EnvironmentHandler::getGenerateTangents() const {
        return generateTangents;
    }

    unsigned int EnvironmentHandler::getHttpTimeoutSeconds() const {
        return httpTimeoutSeconds;
    }

    LogLevel EnvironmentHandler::getLogLevel() const {
        return logLevel;
    }

    const std::string& EnvironmentHandler::getAssetRoot() const {
        return assetRoot;
    }

} // namespace gltf2mesh
