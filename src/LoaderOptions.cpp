#include "gltf2mesh/LoaderOptions.hpp"
#include "gltf2mesh/EnvironmentHandler.hpp"
#include <stdexcept>

namespace gltf2mesh {

    IndexPolicy parseIndexPolicy(const std::string& name) {
        if (name == "shrink16") return IndexPolicy::Shrink16;
        if (name == "widen32") return IndexPolicy::Widen32;
        throw std::runtime_error("Unknown index policy: " + name);
    }

    const char* toString(IndexPolicy policy) {
        return policy == IndexPolicy::Widen32 ? "widen32" : "shrink16";
    }

    LoaderOptions LoaderOptions::fromEnvironment() {
        const auto& env = EnvironmentHandler::instance();

        LoaderOptions options;
        options.indexPolicy = parseIndexPolicy(env.getIndexPolicy());
        options.generateTangents = env.getGenerateTangents();
        options.workerCount = env.getWorkerCount();
        options.httpTimeoutSeconds = env.getHttpTimeoutSeconds();
        return options;
    }

} // namespace gltf2mesh
