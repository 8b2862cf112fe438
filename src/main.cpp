#include "gltf2mesh/Server.hpp"
#include "gltf2mesh/Summary.hpp"
#include "gltf2mesh/GltfLoader.hpp"
#include "gltf2mesh/EnvironmentHandler.hpp"
#include "gltf2mesh/Errors.hpp"
#include "gltf2mesh/Logger.hpp"
#include <iostream>

int main(int argc, char** argv) {
    try {
        auto& env = gltf2mesh::EnvironmentHandler::instance();
        env.init();

        gltf2mesh::LoaderOptions options = gltf2mesh::LoaderOptions::fromEnvironment();

        // Con un argomento: decodifica una volta e stampa il riepilogo
        if (argc > 1) {
            gltf2mesh::GltfLoader loader(options);
            gltf2mesh::LoadResult result = loader.load(argv[1]);
            std::cout << gltf2mesh::Summary::toJson(result).dump(2) << std::endl;
            return 0;
        }

        gltf2mesh::Server server(options, env.getAssetRoot());
        server.start(env.getPort());
    } catch (const gltf2mesh::Error& e) {
        gltf2mesh::Logger::error(std::string("[") + e.kind() + "] " + e.what());
        return 1;
    } catch (const std::exception& e) {
        gltf2mesh::Logger::error(e.what());
        return 1;
    }
    return 0;
}
