#pragma once

#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "folio_core/services/data_source.hpp"

namespace folio_cli
{

  enum class Command
  {
    Ingest,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string source_root;
    std::string config_path;
    std::string attribute_syntax;
    bool dump = false;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    explicit CliHandler(std::ostream &out = std::cout);

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Parse command line arguments
    CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command
    void execute_command(const CliOptions &options);

    // Collections of a processed data source as one JSON document
    static nlohmann::ordered_json collections_to_json(const folio_core::DataSource &source);

  private:
    std::ostream &out_;

    // Command handlers
    void handle_ingest_command(const CliOptions &options);
    void handle_help_command();

    void print_summary(const folio_core::DataSource &source);
  };

}
