#include "titan_cli/cli_handler.hpp"
#include <fstream>
#include <stdexcept>
#include <iostream>
#include <iomanip> // Required for std::fixed and std::setprecision

namespace titan_cli {

CliHandler::CliHandler(const std::string& api_base_url)
    : api_base_url_(api_base_url), curl_handle_(nullptr) {
    setup_curl_handle();
}

CliHandler::~CliHandler() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

CliHandler::CliHandler(CliHandler&& other) noexcept
    : api_base_url_(std::move(other.api_base_url_))
    , curl_handle_(other.curl_handle_) {
    other.curl_handle_ = nullptr;
}

CliHandler& CliHandler::operator=(CliHandler&& other) noexcept {
    if (this != &other) {
        if (curl_handle_) {
            curl_easy_cleanup(curl_handle_);
        }
        api_base_url_ = std::move(other.api_base_url_);
        curl_handle_ = other.curl_handle_;
        other.curl_handle_ = nullptr;
    }
    return *this;
}

void CliHandler::setup_curl_handle() {
    curl_handle_ = curl_easy_init();
    if (!curl_handle_) {
        throw CliError("Failed to initialize CURL");
    }
}

size_t CliHandler::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append((char*)contents, size * nmemb);
    return size * nmemb;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];

    if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
        return options;
    } else if (command == "answer" || command == "a") {
        options.command = Command::Answer;
    } else if (command == "eval" || command == "e") {
        options.command = Command::Eval;
    } else if (command == "route" || command == "r") {
        options.command = Command::Route;
    } else if (command == "search" || command == "s") {
        options.command = Command::Search;
    } else {
        throw CliError("Unknown command: " + command);
    }

    for (int i = 2; i < argc; i += 2) {
        std::string flag = argv[i];
        if (i + 1 >= argc) {
            throw CliError("Missing value for " + flag);
        }
        std::string value = argv[i + 1];

        try {
            if (flag == "--file" || flag == "-f") {
                options.file_path = value;
            } else if (flag == "--out" || flag == "-o") {
                options.output_path = value;
            } else if (flag == "--query" || flag == "-q") {
                options.query = value;
            } else if (flag == "--year" || flag == "-y") {
                options.year = std::stoi(value);
            } else if (flag == "--top-k" || flag == "-k") {
                options.top_k = std::stoi(value);
            } else {
                throw CliError("Unknown option: " + flag);
            }
        } catch (const std::invalid_argument&) {
            throw CliError("Expected a number for " + flag + ", got: " + value);
        } catch (const std::out_of_range&) {
            throw CliError("Number out of range for " + flag + ": " + value);
        }
    }

    if ((options.command == Command::Answer || options.command == Command::Eval) &&
        options.file_path.empty()) {
        throw CliError("This command requires a questions file. Usage: " + command + " --file <questions.json>");
    }
    if ((options.command == Command::Route || options.command == Command::Search) &&
        options.query.empty()) {
        throw CliError("This command requires a query. Usage: " + command + " --query <query>");
    }
    if (options.top_k <= 0) {
        throw CliError("--top-k must be greater than 0");
    }

    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Answer:
            handle_answer_command(options);
            break;
        case Command::Eval:
            handle_eval_command(options);
            break;
        case Command::Route:
            handle_route_command(options);
            break;
        case Command::Search:
            handle_search_command(options);
            break;
        case Command::Help:
            print_help();
            break;
    }
}

nlohmann::json CliHandler::read_json_file(const std::string& path) {
    std::ifstream stream(path);
    if (!stream.is_open()) {
        throw CliError("Failed to open file: " + path);
    }
    try {
        return nlohmann::json::parse(stream);
    } catch (const nlohmann::json::parse_error& e) {
        throw CliError("Failed to parse JSON in '" + path + "': " + e.what());
    }
}

nlohmann::json CliHandler::question_to_json(const titan_core::Question& question) {
    nlohmann::json out = {
        {"qid", question.id},
        {"question", question.text},
        {"choices", question.options}
    };
    return out;
}

std::vector<titan_core::Prediction> CliHandler::answer_all(const std::vector<titan_core::Question>& questions) {
    std::vector<titan_core::Prediction> predictions;
    predictions.reserve(questions.size());

    for (std::size_t i = 0; i < questions.size(); ++i) {
        const auto& question = questions[i];
        std::cout << "Processing question " << (i + 1) << "/" << questions.size()
                  << " (" << question.id << ")... " << std::flush;

        titan_core::Prediction prediction;
        prediction.question_id = question.id;
        try {
            nlohmann::json response = make_post_request("/answer", question_to_json(question));
            const auto& data = response.at("data");
            prediction.answer = data.at("answer").get<std::string>();
            prediction.unsafe = data.value("unsafe", false);
            prediction.degraded = data.value("degraded", false);
            std::cout << prediction.answer << (prediction.degraded ? " (degraded)" : "") << std::endl;
        } catch (const std::exception& e) {
            prediction.degraded = true;
            std::cout << prediction.answer << " (default)" << std::endl;
            print_error("Question " + question.id + " failed: " + e.what());
        }
        predictions.push_back(std::move(prediction));
    }
    return predictions;
}

void CliHandler::handle_answer_command(const CliOptions& options) {
    auto questions = titan_core::questions_from_json(read_json_file(options.file_path));
    std::cout << "Answering " << questions.size() << " questions from " << options.file_path << std::endl;

    auto predictions = answer_all(questions);

    std::ofstream out(options.output_path);
    if (!out.is_open()) {
        throw CliError("Failed to open output file: " + options.output_path);
    }
    out << titan_core::predictions_to_json(predictions).dump(2) << std::endl;
    std::cout << "Wrote " << predictions.size() << " predictions to " << options.output_path << std::endl;
}

void CliHandler::handle_eval_command(const CliOptions& options) {
    auto questions = titan_core::questions_from_json(read_json_file(options.file_path));
    auto predictions = answer_all(questions);
    auto report = titan_core::evaluate(questions, predictions);

    std::cout << "\n=== Evaluation ===" << std::endl;
    std::cout << "Questions: " << report.total << std::endl;
    std::cout << "Graded:    " << report.graded << std::endl;
    std::cout << "Correct:   " << report.correct << std::endl;
    std::cout << "Accuracy:  " << std::fixed << std::setprecision(2) << report.accuracy() * 100.0 << "%" << std::endl;
    if (!report.incorrect_ids.empty()) {
        std::cout << "Incorrect:";
        for (const auto& id : report.incorrect_ids) {
            std::cout << " " << id;
        }
        std::cout << std::endl;
    }
}

void CliHandler::handle_route_command(const CliOptions& options) {
    nlohmann::json request_data = {
        {"query", options.query}
    };

    try {
        nlohmann::json response = make_post_request("/route", request_data);
        print_route_response(response);
    } catch (const std::exception& e) {
        print_error("Failed to route: " + std::string(e.what()));
    }
}

void CliHandler::handle_search_command(const CliOptions& options) {
    std::cout << "Hybrid search for: " << options.query << " (top_k: " << options.top_k << ")" << std::endl;

    nlohmann::json request_data = {
        {"query", options.query},
        {"top_k", options.top_k}
    };
    if (options.year) {
        request_data["year"] = *options.year;
    }

    try {
        nlohmann::json response = make_post_request("/search", request_data);
        print_search_response(response);
    } catch (const std::exception& e) {
        print_error("Failed to search: " + std::string(e.what()));
    }
}

nlohmann::json CliHandler::make_post_request(const std::string& endpoint, const nlohmann::json& data) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string url = build_url(endpoint);
    std::string request_json = data.dump();
    std::string response_buffer;
    struct curl_slist* headers = curl_slist_append(nullptr, "Content-Type: application/json");

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_json.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl_handle_);
    curl_slist_free_all(headers);
    if (res != CURLE_OK) {
        throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code != 200) {
        throw CliError("HTTP request failed with status code: " + std::to_string(http_code));
    }

    return nlohmann::json::parse(response_buffer);
}

std::string CliHandler::get_api_base_url() const {
    return api_base_url_;
}

void CliHandler::print_route_response(const nlohmann::json& response) {
    const auto& data = response.at("data");
    std::cout << "Mode: " << data.value("mode", std::string("?")) << std::endl;
    if (!data["matched_pattern"].is_null()) {
        std::cout << "Matched pattern: " << data["matched_pattern"].get<std::string>() << std::endl;
    }
    if (!data["year"].is_null()) {
        std::cout << "Year: " << data["year"].get<int>() << std::endl;
    }
    if (!data["category_hint"].is_null()) {
        std::cout << "Category: " << data["category_hint"].get<std::string>() << std::endl;
    }
    if (data.contains("entities") && !data["entities"].empty()) {
        std::cout << "Entities:";
        for (const auto& entity : data["entities"]) {
            std::cout << " [" << entity.get<std::string>() << "]";
        }
        std::cout << std::endl;
    }
}

void CliHandler::print_search_response(const nlohmann::json& response) {
    std::cout << "\n=== Hybrid Search Results ===" << std::endl;

    const auto& data = response.at("data");
    if (data.value("semantic_degraded", false)) {
        std::cout << "(semantic leg unavailable, lexical results only)" << std::endl;
    }
    if (!data.contains("results") || data["results"].empty()) {
        std::cout << "No results found." << std::endl;
        return;
    }

    for (const auto& result : data["results"]) {
        std::string text = result.value("text", std::string());
        std::cout << "  • " << result.value("id", std::string("?"))
                  << " [" << result.value("doc_type", std::string()) << " "
                  << result.value("valid_from", 0) << "-" << result.value("valid_until", 0) << "]"
                  << " | " << result.value("retrieval", std::string())
                  << " | Score: " << std::fixed << std::setprecision(4) << result.value("score", 0.0) << std::endl;
        std::cout << "    Content: " << text.substr(0, 100);
        if (text.length() > 100) {
            std::cout << "...";
        }
        std::cout << std::endl << std::endl;
    }
}

void CliHandler::print_error(const std::string& error) {
    std::cerr << "Error: " << error << std::endl;
}

void CliHandler::print_help() {
    std::cout << R"(
Titan Shield CLI - Vietnamese multiple-choice QA

Usage: titan_cli <command> [options]

Commands:
  answer, a     Answer every question in a file and write predictions
    --file, -f <path>    Questions JSON array ({qid, question, choices})
    --out, -o <path>     Predictions output (default: predictions.json)

  eval, e       Answer a labelled file and report accuracy
    --file, -f <path>    Questions JSON array with gold "answer" letters

  route, r      Show the routing decision for a query
    --query, -q <query>  Query text

  search, s     Run hybrid retrieval
    --query, -q <query>  Query text
    --year, -y <year>    Target year for temporal filtering
    --top-k, -k <num>    Number of results to return (default: 5)

  help, h       Show this help

Environment:
  API_BASE_URL  Server address (default: http://127.0.0.1:3030)
)" << std::endl;
}

std::string CliHandler::build_url(const std::string& endpoint) {
    return api_base_url_ + endpoint;
}

}  // namespace titan_cli
