#include "codec/jsonld_codec.hpp"

namespace lodbook {

JsonLdCodec::JsonLdCodec(const nlohmann::json& context, int indent)
    : context_(context), indent_(indent) {
    bool empty_context = context_.is_null() ||
                         (context_.is_string() && context_.get<std::string>().empty()) ||
                         (context_.is_object() && context_.empty());
    if (empty_context) {
        context_ = "http://schema.org/";
    }
}

nlohmann::json JsonLdCodec::encode(const GraphNode& graph) const {
    nlohmann::json j;
    j["@context"] = context_;
    j["@graph"] = graph.to_json();
    return j;
}

std::string JsonLdCodec::serialize(const GraphNode& graph) const {
    return encode(graph).dump(indent_);
}

std::string JsonLdCodec::serialize_for_script(const GraphNode& graph) const {
    std::string text = serialize(graph);
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        // "</" would close the script element early
        if (text[i] == '<' && i + 1 < text.size() && text[i + 1] == '/') {
            out += "<\\/";
            ++i;
            continue;
        }
        out += text[i];
    }
    return out;
}

} // namespace lodbook
