#include "render/marker_renderer.hpp"
#include "linking/reference_index.hpp"
#include "html/html_document.hpp"
#include "text/tokenizer.hpp"
#include <algorithm>
#include <cctype>

namespace lodbook {

namespace {

bool is_marker_tag(const std::string& name) {
    return name == "lod" || name == "lod_ignore";
}

bool is_marker_close(const std::string& name) {
    return name == "endlod" || name == "endlod_ignore";
}

}  // namespace

MarkerRenderer::MarkerRenderer(const BuildContext& context) : context_(context) {}

std::string MarkerRenderer::render(const std::string& source, const std::string& subject) const {
    size_t pos = 0;
    std::vector<std::string> open;
    bool closed = false;
    return render_block(source, pos, open, closed, subject);
}

std::string MarkerRenderer::render_link(const std::string& name, const std::string& content) const {
    const Record* record = context_.store.find(name);
    if (!record) {
        context_.advisories.report(AdvisoryKind::UNRESOLVED_REFERENCE, name,
                                   "marker names no record, left unlinked");
        return content;
    }

    if (!context_.types.has(record->type)) {
        context_.advisories.report(AdvisoryKind::UNCONFIGURED_TYPE, record->type,
                                   "marker for " + name + " uses an unconfigured type");
    }
    std::string collection = context_.types.collection(record->type);

    std::string html = "<a class=\"";
    html += kLinkClass;
    html += "\" data-name=\"" + escape_attribute(name) + "\"";
    html += " data-collection=\"" + escape_attribute(collection) + "\"";
    html += " property=\"name\"";
    html += " href=\"" + escape_attribute(context_.entity_url(collection, name)) + "\">";
    html += content;
    html += "</a>";
    return html;
}

std::string MarkerRenderer::render_ignore(const std::string& content) {
    return std::string("<span class=\"") + kIgnoreClass + "\">" + content + "</span>";
}

bool MarkerRenderer::next_tag(const std::string& text, size_t from, Tag& tag) {
    while (true) {
        size_t open = text.find("{%", from);
        if (open == std::string::npos) {
            return false;
        }
        size_t close = text.find("%}", open + 2);
        if (close == std::string::npos) {
            return false;
        }

        // Whitespace-control dashes: {%- name -%}
        size_t body_begin = open + 2;
        size_t body_end = close;
        if (body_begin < body_end && text[body_begin] == '-') body_begin++;
        if (body_end > body_begin && text[body_end - 1] == '-') body_end--;

        std::string body = trim(text.substr(body_begin, body_end - body_begin));
        if (body.empty()) {
            from = close + 2;
            continue;
        }

        size_t space = 0;
        while (space < body.size() && !std::isspace(static_cast<unsigned char>(body[space]))) {
            space++;
        }

        tag.begin = open;
        tag.end = close + 2;
        tag.name = body.substr(0, space);
        tag.args = trim(body.substr(space));
        return true;
    }
}

std::string MarkerRenderer::render_block(const std::string& text,
                                         size_t& pos,
                                         std::vector<std::string>& open,
                                         bool& closed,
                                         const std::string& subject) const {
    std::string out;
    closed = false;

    Tag tag;
    while (next_tag(text, pos, tag)) {
        out += text.substr(pos, tag.begin - pos);

        if (!open.empty() && tag.name == open.back()) {
            pos = tag.end;
            closed = true;
            return out;
        }

        // Closer of an enclosing block: this block is unterminated
        if (std::find(open.begin(), open.end(), tag.name) != open.end()) {
            pos = tag.begin;
            return out;
        }

        if (is_marker_close(tag.name)) {
            context_.advisories.report(AdvisoryKind::MALFORMED_MARKER, subject,
                                       "{% " + tag.name + " %} without opening tag");
            out += text.substr(tag.begin, tag.end - tag.begin);
            pos = tag.end;
            continue;
        }

        if (!is_marker_tag(tag.name)) {
            out += text.substr(tag.begin, tag.end - tag.begin);
            pos = tag.end;
            continue;
        }

        pos = tag.end;
        open.push_back("end" + tag.name);
        bool inner_closed = false;
        std::string content = render_block(text, pos, open, inner_closed, subject);
        open.pop_back();

        if (!inner_closed) {
            context_.advisories.report(AdvisoryKind::MALFORMED_MARKER, subject,
                                       "{% " + tag.name + " %} is never closed");
            out += text.substr(tag.begin, tag.end - tag.begin);
            out += content;
            continue;
        }

        if (tag.name == "lod_ignore") {
            out += render_ignore(content);
            continue;
        }

        std::string name = tag.args.empty() ? trim(content) : tag.args;
        if (name.empty()) {
            context_.advisories.report(AdvisoryKind::MALFORMED_MARKER, subject,
                                       "{% lod %} with nothing to look up");
            out += content;
            continue;
        }
        out += render_link(name, content);
    }

    out += text.substr(pos);
    pos = text.size();
    return out;
}

} // namespace lodbook
