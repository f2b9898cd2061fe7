#include "cli/cli.hpp"
#include "pipeline/site_builder.hpp"
#include "pipeline/site_config.hpp"
#include <iostream>
#include <filesystem>

namespace fs = std::filesystem;

using namespace lodbook;

// ============== Helper Functions ==============

// Load the site configuration and apply --quiet
SiteConfig load_config(const Args& args) {
    std::string config_path = args.require("config");
    SiteConfig config = SiteConfig::from_json_file(config_path);

    if (args.flag("quiet")) {
        config.verbose = false;
    }
    return config;
}

void print_advisories(const AdvisoryLog& advisories) {
    if (advisories.empty()) {
        return;
    }
    std::cout << "Advisories:\n";
    for (const auto& [kind, count] : advisories.count_by_kind()) {
        std::cout << "  " << kind << ": " << count << "\n";
    }
}

// ============== lodbook build ==============
int cmd_build(const Args& args) {
    SiteConfig config = load_config(args);
    if (args.has("output")) {
        config.output_directory = args.get("output").value;
    }
    config.context_words = args.get("context-words").as_int(config.context_words);

    if (config.verbose) {
        std::cout << "Building site into: " << config.output_directory << "\n";
    }

    SiteBuilder builder(config);
    BuildStatistics stats = builder.build();

    if (config.verbose) {
        stats.print_summary();
        print_advisories(builder.advisories());
    }

    return stats.documents_failed > 0 ? 1 : 0;
}

// ============== lodbook graph ==============
int cmd_graph(const Args& args) {
    SiteConfig config = load_config(args);
    config.verbose = false;
    std::string name = args.require("name");

    SiteBuilder builder(config);

    if (!args.flag("mentions")) {
        auto graph = builder.entity_graph(name);
        if (!graph) {
            std::cerr << "No record named: " << name << "\n";
            return 1;
        }
        std::cout << builder.codec().serialize(*graph) << "\n";
        return 0;
    }

    // Back-references need every document linked first
    builder.process_documents();
    builder.process_entities();

    for (const auto& page : builder.entity_pages()) {
        if (page.title == name) {
            std::cout << page.to_json().dump(2) << "\n";
            return 0;
        }
    }

    std::cerr << "No entity page for: " << name << "\n";
    return 1;
}

// ============== lodbook link ==============
int cmd_link(const Args& args) {
    SiteConfig config = load_config(args);
    std::string input_path = args.require("input");

    // Progress goes to stdout, which may be carrying the page
    bool to_stdout = !args.has("output");
    if (to_stdout) {
        config.verbose = false;
    }

    SiteBuilder builder(config);

    DocumentInfo info;
    info.source_path = input_path;
    info.title = args.get("title", fs::path(input_path).stem().string()).value;
    info.chapter = args.get("chapter").value;
    info.url = args.get("url").value;

    NarrativeDocument document = builder.link_document(info, read_file(input_path));

    if (to_stdout) {
        std::cout << document.to_html();
        return 0;
    }

    std::string output_path = args.get("output").value;
    write_file(output_path, document.to_html());
    std::cout << "Wrote " << output_path << "\n";
    print_advisories(builder.advisories());
    return 0;
}

// ============== lodbook check ==============
int cmd_check(const Args& args) {
    SiteConfig config = SiteConfig::from_json_file(args.require("config"));

    std::string error;
    if (!config.validate(error)) {
        std::cerr << "Invalid configuration: " << error << "\n";
        return 1;
    }

    config.verbose = false;
    SiteBuilder builder(config);

    std::cout << "Configuration OK\n";
    std::cout << "  Records: " << builder.records().size() << "\n";
    std::cout << "  Types: " << config.types.size() << "\n";
    std::cout << "  Documents: " << config.documents.size() << "\n";

    int missing = 0;
    for (const auto& info : config.documents) {
        if (!fs::exists(info.source_path)) {
            std::cerr << "  Missing document: " << info.source_path << "\n";
            missing++;
        }
    }

    int unconfigured = 0;
    for (const auto& record : builder.records().records()) {
        if (!config.types.has(record.type)) {
            unconfigured++;
        }
    }
    if (unconfigured > 0) {
        std::cout << "  Records with unconfigured types: " << unconfigured << "\n";
    }

    return missing > 0 ? 1 : 0;
}

int main(int argc, char** argv) {
    CLI cli("lodbook", "1.0.0");

    // lodbook build
    cli.register_command({
        "build",
        "Link every document and publish entity and document graphs",
        {
            {"config", "c", "Site configuration JSON file", "", true, false},
            {"output", "o", "Output directory (overrides output_directory)", "", false, false},
            {"context-words", "w", "Words on each side of a mention (overrides context_words)", "", false, false},
            {"quiet", "q", "Suppress progress output", "", false, true}
        },
        cmd_build
    });

    // lodbook graph
    cli.register_command({
        "graph",
        "Print the compiled graph of one entity",
        {
            {"config", "c", "Site configuration JSON file", "", true, false},
            {"name", "n", "Entity name", "", true, false},
            {"mentions", "m", "Link all documents first and include mentions", "", false, true}
        },
        cmd_graph
    });

    // lodbook link
    cli.register_command({
        "link",
        "Link one chapter and print the rendered HTML",
        {
            {"config", "c", "Site configuration JSON file", "", true, false},
            {"input", "i", "Chapter source (HTML with lod markers)", "", true, false},
            {"output", "o", "Write the HTML here instead of stdout", "", false, false},
            {"title", "t", "Document title", "", false, false},
            {"chapter", "n", "Chapter number", "", false, false},
            {"url", "u", "Site-relative URL of the document", "", false, false},
            {"quiet", "q", "Suppress progress output", "", false, true}
        },
        cmd_link
    });

    // lodbook check
    cli.register_command({
        "check",
        "Validate a configuration and its records",
        {
            {"config", "c", "Site configuration JSON file", "", true, false}
        },
        cmd_check
    });

    return cli.run(argc, argv);
}
