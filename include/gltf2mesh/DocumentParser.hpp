#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "gltf2mesh/Document.hpp"

namespace gltf2mesh {

    class DocumentParser {
    public:
        // @throws LoadError per JSON non valido o campi obbligatori mancanti
        static Document parse(const std::string& jsonText);
        static Document parse(const nlohmann::json& root);
    };

} // namespace gltf2mesh
