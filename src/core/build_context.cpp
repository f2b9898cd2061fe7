#include "core/build_context.hpp"
#include <cctype>

namespace lodbook {

std::string BuildContext::entity_uri(const std::string& collection, const std::string& name) const {
    return site_url + entity_url(collection, name);
}

std::string BuildContext::entity_url(const std::string& collection, const std::string& name) const {
    return base_url + "/" + collection + "/" + slugify(name) + "/";
}

std::string BuildContext::page_uri(const std::string& page_url) const {
    return site_url + base_url + page_url;
}

std::string slugify(const std::string& name) {
    std::string slug;
    slug.reserve(name.size());
    bool pending_dash = false;

    for (unsigned char c : name) {
        bool keep = c >= 0x80 || std::isalnum(c);
        if (!keep) {
            pending_dash = true;
            continue;
        }
        if (pending_dash && !slug.empty()) {
            slug += '-';
        }
        pending_dash = false;
        slug += c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c);
    }

    return slug;
}

} // namespace lodbook
