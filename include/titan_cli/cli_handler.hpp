#pragma once

#include <optional>
#include <string>
#include <vector>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include "titan_core/services/answer_service.hpp"

namespace titan_cli
{

  enum class Command
  {
    Answer,
    Eval,
    Route,
    Search,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string file_path;
    std::string output_path = "predictions.json";
    std::string query;
    std::optional<int> year;
    int top_k = 5;
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
    explicit CliHandler(const std::string &api_base_url);
    ~CliHandler();

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Allow move constructor and assignment
    CliHandler(CliHandler &&) noexcept;
    CliHandler &operator=(CliHandler &&) noexcept;

    // Parse command line arguments
    CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command
    void execute_command(const CliOptions &options);

    std::string get_api_base_url() const;

  private:
    std::string api_base_url_;
    CURL *curl_handle_;

    // Command handlers
    void handle_answer_command(const CliOptions &options);
    void handle_eval_command(const CliOptions &options);
    void handle_route_command(const CliOptions &options);
    void handle_search_command(const CliOptions &options);

    // Posts every question to /answer in order; failed requests fall back to the default letter
    std::vector<titan_core::Prediction> answer_all(const std::vector<titan_core::Question> &questions);

    // HTTP methods
    nlohmann::json make_post_request(const std::string &endpoint, const nlohmann::json &data);

    // Helper methods
    void setup_curl_handle();
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    static nlohmann::json read_json_file(const std::string &path);
    static nlohmann::json question_to_json(const titan_core::Question &question);
    void print_route_response(const nlohmann::json &response);
    void print_search_response(const nlohmann::json &response);
    void print_error(const std::string &error);
    void print_help();
    std::string build_url(const std::string &endpoint);
  };

}
