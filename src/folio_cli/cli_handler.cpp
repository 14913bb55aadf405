#include "folio_cli/cli_handler.hpp"

#include <memory>

#include "folio_cli/settings.hpp"
#include "folio_core/config/data_source_config.hpp"
#include "folio_core/fs/file_system.hpp"
#include "folio_core/services/filesystem_data_source.hpp"

namespace folio_cli {

namespace {

nlohmann::ordered_json collection_to_json(const folio_core::ItemCollection& collection) {
    nlohmann::ordered_json out = nlohmann::ordered_json::object();
    for (const auto& [id, item] : collection) {
        out[id] = item.to_json();
    }
    return out;
}

}  // namespace

CliHandler::CliHandler(std::ostream& out) : out_(out) {}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];

    if (command == "ingest" || command == "i") {
        options.command = Command::Ingest;
        for (int i = 2; i < argc; ++i) {
            std::string flag = argv[i];

            if (flag == "--dump" || flag == "-d") {
                options.dump = true;
                continue;
            }
            if (i + 1 >= argc) {
                throw CliError("Missing value for " + flag);
            }
            std::string value = argv[++i];

            if (flag == "--source" || flag == "-s") {
                options.source_root = value;
            } else if (flag == "--config" || flag == "-c") {
                options.config_path = value;
            } else if (flag == "--syntax") {
                options.attribute_syntax = value;
            } else {
                throw CliError("Unknown option: " + flag);
            }
        }
        if (options.source_root.empty() && options.config_path.empty()) {
            throw CliError("Ingest command requires a site directory. Usage: ingest --source <dir>");
        }
    } else if (command == "help" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Ingest:
            handle_ingest_command(options);
            break;
        case Command::Help:
        default:
            handle_help_command();
            break;
    }
}

void CliHandler::handle_ingest_command(const CliOptions& options) {
    Settings settings = options.config_path.empty()
                            ? Settings::from_json(nlohmann::json::object())
                            : Settings::from_file(options.config_path);
    if (!options.source_root.empty()) {
        settings.source_root = options.source_root;
    }
    if (!options.attribute_syntax.empty()) {
        settings.attribute_syntax = options.attribute_syntax;
    }

    auto config = folio_core::DataSourceConfig::from_json(settings.to_data_source_params());
    folio_core::FilesystemDataSource source(std::move(config),
                                            std::make_shared<folio_core::LocalFileSystem>());
    source.configure();
    source.process();

    if (options.dump) {
        // Text files are not required to be UTF-8; invalid bytes become U+FFFD.
        out_ << collections_to_json(source).dump(
                    2, ' ', false, nlohmann::ordered_json::error_handler_t::replace)
             << std::endl;
    } else {
        print_summary(source);
    }
}

nlohmann::ordered_json CliHandler::collections_to_json(const folio_core::DataSource& source) {
    nlohmann::ordered_json out;
    out["items"] = collection_to_json(source.items());
    out["layouts"] = collection_to_json(source.layouts());
    out["includes"] = collection_to_json(source.includes());
    return out;
}

void CliHandler::print_summary(const folio_core::DataSource& source) {
    size_t binary_items = 0;
    for (const auto& [id, item] : source.items()) {
        if (item.is_binary()) ++binary_items;
    }

    out_ << "Items:    " << source.items().size() << " (" << binary_items << " binary)" << std::endl;
    out_ << "Layouts:  " << source.layouts().size() << std::endl;
    out_ << "Includes: " << source.includes().size() << std::endl;
}

void CliHandler::handle_help_command() {
    out_ << "Usage: folio <command> [options]" << std::endl;
    out_ << std::endl;
    out_ << "Commands:" << std::endl;
    out_ << "  ingest, i     Read a site directory and report its items" << std::endl;
    out_ << "      --source, -s <dir>     Site directory (content/, layouts/, includes/)" << std::endl;
    out_ << "      --config, -c <file>    JSON settings file" << std::endl;
    out_ << "      --syntax <yaml|json>   Attribute syntax for sidecars and frontmatter" << std::endl;
    out_ << "      --dump, -d             Print the collections as JSON" << std::endl;
    out_ << "  help          Show this message" << std::endl;
}

}  // namespace folio_cli
