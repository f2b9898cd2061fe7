#include "pipeline/site_config.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace lodbook {

namespace {

std::string resolve_path(const std::string& path, const std::string& base_dir) {
    if (path.empty() || base_dir.empty() || fs::path(path).is_absolute()) {
        return path;
    }
    return (fs::path(base_dir) / path).lexically_normal().string();
}

}  // namespace

SiteConfig SiteConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse config file " + path + ": " + e.what());
    }

    return from_json(j, fs::path(path).parent_path().string());
}

SiteConfig SiteConfig::from_json(const json& j, const std::string& base_dir) {
    if (!j.is_object()) {
        throw std::invalid_argument("Site configuration must be a JSON object");
    }

    SiteConfig config;

    config.url = j.value("url", "");
    config.baseurl = j.value("baseurl", "");

    if (j.contains("lod_source") && j["lod_source"].is_object()) {
        const json& source = j["lod_source"];
        config.data_file = resolve_path(source.value("data", ""), base_dir);
        if (source.contains("context")) {
            config.lod_context = source["context"];
        }
    }

    if (j.contains("data_types")) {
        config.types = TypeRegistry::from_json(j["data_types"]);
    }

    if (j.contains("documents") && j["documents"].is_array()) {
        for (const auto& entry : j["documents"]) {
            DocumentInfo info = DocumentInfo::from_json(entry);
            info.source_path = resolve_path(info.source_path, base_dir);
            config.documents.push_back(info);
        }
    }

    if (j.contains("data_collections") && j["data_collections"].is_array()) {
        for (const auto& entry : j["data_collections"]) {
            config.collections.push_back(CollectionStyle::from_json(entry));
        }
    }

    config.text_container = j.value("text_container", config.text_container);
    config.context_words = j.value("context_words", config.context_words);
    config.output_directory = resolve_path(j.value("output_directory", config.output_directory), base_dir);
    config.verbose = j.value("verbose", config.verbose);

    return config;
}

json SiteConfig::to_json() const {
    json j;

    j["url"] = url;
    j["baseurl"] = baseurl;

    json source;
    source["data"] = data_file;
    if (!lod_context.is_null()) {
        source["context"] = lod_context;
    }
    j["lod_source"] = source;

    j["data_types"] = types.to_json();

    json docs = json::array();
    for (const auto& info : documents) {
        docs.push_back(info.to_json());
    }
    j["documents"] = docs;

    if (!collections.empty()) {
        json styles = json::array();
        for (const auto& style : collections) {
            styles.push_back(style.to_json());
        }
        j["data_collections"] = styles;
    }

    j["text_container"] = text_container;
    j["context_words"] = context_words;
    j["output_directory"] = output_directory;
    j["verbose"] = verbose;

    return j;
}

void SiteConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to write config file: " + path);
    }
    file << to_json().dump(2);
}

bool SiteConfig::validate(std::string& error_message) const {
    if (data_file.empty()) {
        error_message = "lod_source.data is required";
        return false;
    }

    if (!baseurl.empty() && (baseurl.front() != '/' || baseurl.back() == '/')) {
        error_message = "baseurl must start with '/' and must not end with '/': " + baseurl;
        return false;
    }

    if (context_words <= 0) {
        error_message = "context_words must be positive";
        return false;
    }

    if (text_container.empty()) {
        error_message = "text_container must not be empty";
        return false;
    }

    if (output_directory.empty()) {
        error_message = "output_directory must not be empty";
        return false;
    }

    for (const auto& info : documents) {
        if (info.source_path.empty()) {
            error_message = "Document without a path: " + info.title;
            return false;
        }
        if (info.url.empty()) {
            error_message = "Document without a url: " + info.source_path;
            return false;
        }
    }

    return true;
}

json SiteConfig::resolve_context(const json& declared_context) const {
    if (!lod_context.is_null()) {
        return lod_context;
    }
    if (!declared_context.is_null()) {
        return declared_context;
    }
    return "http://schema.org/";
}

} // namespace lodbook
