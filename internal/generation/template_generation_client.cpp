#include "template_generation_client.hpp"

#include <array>
#include <sstream>
#include <vector>

namespace muse::generation {

namespace {

constexpr std::array<const char*, 4> kOpenings = {
    "It began on the night the lighthouse went dark,",
    "Nobody in the valley remembered who first said it,",
    "The letter arrived three years too late,",
    "Under the old market there was a second city,",
};

constexpr std::array<const char*, 4> kTurns = {
    "and every answer opened a stranger question.",
    "and the price of the truth kept rising.",
    "and the one person who knew was already leaving.",
    "and what looked like an ending was a door.",
};

constexpr std::array<const char*, 3> kReasons = {
    "clear and engaging",
    "solid but could go further",
    "promising with rough edges",
};

uint32_t CountWords(const std::string& text) {
  std::istringstream in(text);
  std::string        word;
  uint32_t           count = 0;
  while (in >> word) ++count;
  return count;
}

std::string LastQuoted(const std::string& prompt) {
  const auto close = prompt.rfind('"');
  if (close == std::string::npos || close == 0) return "an unexpected idea";
  const auto open = prompt.rfind('"', close - 1);
  if (open == std::string::npos) return "an unexpected idea";
  return prompt.substr(open + 1, close - open - 1);
}

} // namespace

TemplateGenerationClient::TemplateGenerationClient(uint64_t seed) : rng_(seed == 0 ? std::random_device{}() : seed) {
}

muse::generation::v1::CompletionResponse TemplateGenerationClient::Complete(const muse::generation::v1::CompletionRequest& request) {
  std::string prompt;
  for (const auto& message : request.messages()) {
    prompt += message.content();
    prompt += "\n";
  }

  muse::generation::v1::CompletionResponse response;
  {
    std::lock_guard lock(mutex_);
    response.set_text(prompt.find("<evaluation>") != std::string::npos ? Evaluate(prompt) : Compose(prompt));
  }
  response.set_prompt_tokens(CountWords(prompt));
  response.set_completion_tokens(CountWords(response.text()));
  return response;
}

std::string TemplateGenerationClient::Evaluate(const std::string& prompt) {
  std::uniform_int_distribution<int>         score(55, 95);
  std::uniform_int_distribution<std::size_t> reason(0, kReasons.size() - 1);

  std::ostringstream out;
  out << "<evaluation>\n";
  std::istringstream in(prompt);
  std::string        line;
  while (std::getline(in, line)) {
    if (line.rfind("- ", 0) != 0) continue;
    out << line.substr(2) << ": " << score(rng_) << " - " << kReasons[reason(rng_)] << "\n";
  }
  out << "</evaluation>\n";
  return out.str();
}

std::string TemplateGenerationClient::Compose(const std::string& prompt) {
  std::uniform_int_distribution<std::size_t> opening(0, kOpenings.size() - 1);
  std::uniform_int_distribution<std::size_t> turn(0, kTurns.size() - 1);

  const auto subject = LastQuoted(prompt);

  std::ostringstream out;
  out << kOpenings[opening(rng_)] << " a story shaped by " << subject << ", " << kTurns[turn(rng_)] << "\n";
  out << "What stays with the reader is how " << subject << " changes the people who touch it, " << kTurns[turn(rng_)];
  return out.str();
}

} // namespace muse::generation
