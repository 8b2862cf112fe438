#include "gltf2mesh/Server.hpp"
#include "gltf2mesh/ResourceFetcher.hpp"
#include "gltf2mesh/Summary.hpp"
#include "gltf2mesh/Errors.hpp"
#include "gltf2mesh/Logger.hpp"
#include <httplib.h>

#include <nlohmann/json.hpp>
#include <iostream>
#include <stdexcept>
#include <memory>

using json = nlohmann::json;

namespace gltf2mesh {

    Server::Server(LoaderOptions options, const std::string& assetRoot)
            : loader(options, std::make_shared<ConfinedFetcher>(assetRoot, options.httpTimeoutSeconds)) {
        if (assetRoot.empty()) {
            Logger::info("Local file access disabled: /decode accepts only http(s) urls");
        } else {
            Logger::info("Serving local assets from " + assetRoot);
        }
    }

    void Server::start(int port) {
        httplib::Server svr;

        std::cout << "[gltf2mesh] Server started on port " << port << std::endl;

        // Health check endpoint
        svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("{\"status\":\"healthy\",\"service\":\"gltf2mesh\"}", "application/json");
        });

        // Decode endpoint
        svr.Post("/decode", [this](const httplib::Request& req, httplib::Response& res) {
            gltf2mesh::Logger::info("Received /decode POST request");
            try {
                auto body = json::parse(req.body);
                std::string url = body.at("url");

                LoadResult result = loader.load(url);

                res.set_content(Summary::toJson(result).dump(), "application/json");
            } catch (const Error& e) {
                gltf2mesh::Logger::error(std::string("Error in /decode: ") + e.what());
                res.status = 400;
                res.set_content(json{{"error", e.what()}, {"kind", e.kind()}}.dump(), "application/json");
            } catch (const std::exception& e) {
                gltf2mesh::Logger::error(std::string("Error in /decode: ") + e.what());
                res.status = 400;
                res.set_content(json{{"error", e.what()}, {"kind", "request"}}.dump(), "application/json");
            }
        });

        std::cout << "[gltf2mesh] Server listening on port " << port << std::endl;
        if (!svr.listen("0.0.0.0", port)) {
            throw std::runtime_error("Unable to listen on port " + std::to_string(port));
        }
    }

} // namespace gltf2mesh
