#include "generation_client.hpp"

namespace muse::generation {

muse::generation::v1::CompletionRequest MakeRequest(const std::string& system_prompt,
                                                     const std::string& user_prompt,
                                                     uint32_t           max_tokens,
                                                     double             temperature) {
  muse::generation::v1::CompletionRequest request;
  if (!system_prompt.empty()) {
    auto* system = request.add_messages();
    system->set_role("system");
    system->set_content(system_prompt);
  }
  auto* user = request.add_messages();
  user->set_role("user");
  user->set_content(user_prompt);
  request.set_max_tokens(max_tokens);
  request.set_temperature(temperature);
  return request;
}

} // namespace muse::generation
