#include "titan_core/services/prompt_builder.hpp"

namespace titan_core {

namespace {

constexpr double ANSWER_TEMPERATURE = 0.1;
constexpr int ANSWER_MAX_TOKENS = 512;

CompletionRequest make_request(std::string system_prompt, std::string user_prompt) {
  CompletionRequest request;
  request.system_prompt = std::move(system_prompt);
  request.user_prompt = std::move(user_prompt);
  request.temperature = ANSWER_TEMPERATURE;
  request.max_tokens = ANSWER_MAX_TOKENS;
  return request;
}

std::string answer_instruction(std::size_t option_count) {
  return "Kết thúc câu trả lời bằng một dòng duy nhất theo mẫu \"Đáp án: X\", trong đó X là " +
         PromptBuilder::letter_range(option_count) + ".";
}

}  // namespace

std::string PromptBuilder::letter_range(std::size_t option_count) {
  if (option_count == 0) {
    return "A";
  }
  if (option_count == 1) {
    return option_letter(0);
  }
  std::string out;
  for (std::size_t i = 0; i + 1 < option_count; ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += option_letter(i);
  }
  out += " hoặc " + option_letter(option_count - 1);
  return out;
}

std::string PromptBuilder::format_options(const std::vector<std::string> &options) {
  std::string out;
  for (std::size_t i = 0; i < options.size(); ++i) {
    out += option_letter(i) + ") " + options[i] + "\n";
  }
  return out;
}

std::string PromptBuilder::format_context(const std::vector<ScoredChunk> &context) {
  std::string out;
  std::size_t number = 1;
  for (const auto &scored : context) {
    if (!scored.chunk) {
      continue;
    }
    if (!out.empty()) {
      out += "\n\n";
    }
    out += "[" + std::to_string(number++) + "] (" + scored.chunk->source + ") " + scored.chunk->text;
  }
  return out;
}

CompletionRequest PromptBuilder::build_reading(const Question &question) {
  std::string system =
      "Bạn là một chuyên gia phân tích văn bản. Hãy đọc đoạn văn bản được cung cấp và trả lời "
      "câu hỏi dựa HOÀN TOÀN trên thông tin trong đoạn văn. Không sử dụng kiến thức bên ngoài.";
  std::string user = "ĐỀ BÀI:\n" + question.text + "\n\nCÁC LỰA CHỌN:\n" +
                     format_options(question.options) + "\n" +
                     answer_instruction(question.options.size());
  return make_request(std::move(system), std::move(user));
}

CompletionRequest PromptBuilder::build_stem(const Question &question) {
  std::string system =
      "Bạn là một chuyên gia toán học và khoa học. Hãy giải quyết câu hỏi bằng cách suy nghĩ "
      "từng bước: xác định dữ kiện, chọn công thức, tính toán rồi kiểm tra kết quả.";
  std::string user = "Câu hỏi: " + question.text + "\n\nCác lựa chọn:\n" +
                     format_options(question.options) + "\n" +
                     answer_instruction(question.options.size());
  return make_request(std::move(system), std::move(user));
}

CompletionRequest PromptBuilder::build_rag(const Question &question,
                                           const std::vector<ScoredChunk> &context) {
  std::string context_text = format_context(context);
  if (context_text.empty()) {
    return build_rag_without_context(question);
  }

  std::string system =
      "Bạn là một trợ lý thông minh chuyên trả lời câu hỏi trắc nghiệm dựa trên thông tin được "
      "cung cấp. Chỉ trả lời dựa trên ngữ cảnh. Nếu ngữ cảnh không đủ, hãy chọn đáp án hợp lý "
      "nhất.";
  std::string user = "NGỮ CẢNH:\n" + context_text + "\n\nCÂU HỎI: " + question.text +
                     "\n\nCÁC LỰA CHỌN:\n" + format_options(question.options) + "\n" +
                     answer_instruction(question.options.size());
  return make_request(std::move(system), std::move(user));
}

CompletionRequest PromptBuilder::build_rag_without_context(const Question &question) {
  std::string system =
      "Bạn là một trợ lý thông minh chuyên trả lời câu hỏi trắc nghiệm về Việt Nam. Hãy dùng "
      "kiến thức của bạn để chọn đáp án chính xác nhất.";
  std::string user = "CÂU HỎI: " + question.text + "\n\nCÁC LỰA CHỌN:\n" +
                     format_options(question.options) + "\n" +
                     answer_instruction(question.options.size());
  return make_request(std::move(system), std::move(user));
}

CompletionRequest PromptBuilder::build(const Question &question,
                                       RouteMode mode,
                                       const std::vector<ScoredChunk> &context) {
  switch (mode) {
    case RouteMode::Reading:
      return build_reading(question);
    case RouteMode::Stem:
      return build_stem(question);
    case RouteMode::Rag:
      break;
  }
  return build_rag(question, context);
}

}  // namespace titan_core
