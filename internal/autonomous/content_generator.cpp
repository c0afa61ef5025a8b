#include "content_generator.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace muse::autonomous {

namespace v1 = muse::autonomous::v1;

namespace {

const std::vector<std::string> kThemes = {
    "an unknown adventure", "a creative discovery", "a promise kept too late", "the cost of remembering",
};

const std::vector<std::string> kTraits = {
    "mysterious", "intellectual", "brave", "delicate", "passionate",
};

const std::vector<std::string> kConcepts = {
    "a world where magic and science coexist", "a future city", "an ancient civilization", "another world", "a parallel world",
};

const std::vector<std::string> kMotifs = {
    "a map with one road missing", "a song nobody admits to knowing", "rain that falls upward",
    "a borrowed name",             "a clock that runs on grief",      "the last ferry of the season",
};

std::string Quote(const std::string& text) {
  return "\"" + text + "\"";
}

} // namespace

ContentGenerator::ContentGenerator(std::shared_ptr<generation::GenerationClient> client, ContentGeneratorOptions options)
    : client_(std::move(client)),
      options_(std::move(options)),
      breaker_(options_.breaker),
      rng_(options_.seed == 0 ? std::random_device{}() : options_.seed) {
  options_.retry.should_retry = [](const std::exception& e, uint32_t) { return util::IsRetryableGenerationError(e); };
}

double ContentGenerator::Confidence(model::ContentType type) {
  switch (type) {
    case v1::CONTENT_TYPE_PLOT:
      return 0.8;
    case v1::CONTENT_TYPE_CHARACTER:
      return 0.7;
    case v1::CONTENT_TYPE_WORLD_SETTING:
      return 0.6;
    default:
      return 0.5;
  }
}

v1::GeneratedContent ContentGenerator::Generate(model::ContentType type, uint32_t token_budget, const Checkpoint& checkpoint) {
  observability::SpanScope span("content.generate");
  span.SetAttribute("content_type", model::ToString(type));

  v1::GeneratedContent content;
  Round                round;

  switch (type) {
    case v1::CONTENT_TYPE_PLOT: {
      const auto theme = Pick(kThemes);
      auto*      plot  = content.mutable_plot();
      plot->set_theme(theme);

      Call("You are an experimental novelist.", "Create a new plot outline. Theme: " + Quote(theme), token_budget, checkpoint, content, round);
      std::string draft = round.text;
      plot->set_rounds(1);

      if (Call("You are a logical, demanding editor.",
               "Critique this plot outline and list the three most important fixes.\n\n" + draft + "\nTheme: " + Quote(theme), token_budget,
               checkpoint, content, round)) {
        const auto critique = round.text;
        plot->set_rounds(2);
        if (Call("You are an experimental novelist.",
                 "Revise the plot outline using the editor's notes.\n\nOutline:\n" + draft + "\n\nNotes:\n" + critique + "\nTheme: " + Quote(theme),
                 token_budget, checkpoint, content, round)) {
          draft = round.text;
          plot->set_rounds(3);
        }
      }
      plot->set_text(draft);
      break;
    }
    case v1::CONTENT_TYPE_CHARACTER: {
      const auto trait     = Pick(kTraits);
      auto*      character = content.mutable_character();
      character->set_trait(trait);

      Call("You are an emotionally perceptive writer.", "Create a compelling character who is " + Quote(trait), token_budget, checkpoint,
           content, round);
      std::string text = round.text;
      if (Call("You are an emotionally perceptive writer.", "Deepen this character's voice and history.\n\n" + text + "\nTrait: " + Quote(trait),
               token_budget, checkpoint, content, round)) {
        text = round.text;
      }
      character->set_text(text);
      break;
    }
    case v1::CONTENT_TYPE_WORLD_SETTING: {
      const auto core_concept = Pick(kConcepts);
      auto*      world        = content.mutable_world_setting();
      world->set_core_concept(core_concept);

      Call("You are a logical world builder.", "Design a world setting based on " + Quote(core_concept), token_budget, checkpoint, content, round);
      std::string text = round.text;
      if (Call("You are a logical world builder.", "Check this setting for contradictions and fill the gaps.\n\n" + text + "\nConcept: " + Quote(core_concept),
               token_budget, checkpoint, content, round)) {
        text = round.text;
      }
      world->set_text(text);
      break;
    }
    case v1::CONTENT_TYPE_INSPIRATION: {
      auto* inspiration = content.mutable_inspiration();
      for (int i = 0; i < 3; ++i) inspiration->add_sources(Pick(kMotifs));

      std::string motifs;
      for (const auto& source : inspiration->sources()) motifs += "- " + source + "\n";
      Call("You find unexpected connections.", "Combine these motifs into one short story seed:\n" + motifs + "Seed: " + Quote(inspiration->sources(0)),
           token_budget, checkpoint, content, round);
      inspiration->set_text(round.text);
      break;
    }
    default:
      throw util::ValidationError("cannot generate content of type " + std::to_string(static_cast<int>(type)));
  }

  span.SetAttribute("tokens", static_cast<std::int64_t>(content.tokens_used()));
  span.SetAttribute("api_calls", static_cast<std::int64_t>(content.api_calls()));
  return content;
}

bool ContentGenerator::Call(const std::string&    system_prompt,
                            const std::string&    user_prompt,
                            uint32_t              budget,
                            const Checkpoint&     checkpoint,
                            v1::GeneratedContent& content,
                            Round&                out) {
  // The first call always runs; later rounds need budget left.
  if (content.api_calls() > 0 && budget > 0 && content.tokens_used() >= budget) return false;
  if (checkpoint) checkpoint();

  const uint32_t remaining = budget == 0 ? 0 : budget - std::min(budget, content.tokens_used());
  const auto     request   = generation::MakeRequest(system_prompt, user_prompt, remaining, options_.temperature);

  const auto response = util::Retry([&] { return breaker_.Execute([&] { return client_->Complete(request); }); }, options_.retry);

  out.text   = response.text();
  out.tokens = generation::TotalTokens(response);
  content.set_tokens_used(content.tokens_used() + out.tokens);
  content.set_api_calls(content.api_calls() + 1);
  return true;
}

std::string ContentGenerator::Pick(const std::vector<std::string>& options) {
  std::lock_guard                            lock(rng_mutex_);
  std::uniform_int_distribution<std::size_t> dist(0, options.size() - 1);
  return options[dist(rng_)];
}

} // namespace muse::autonomous
