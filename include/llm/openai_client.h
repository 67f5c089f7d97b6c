#pragma once

/**
 * @file openai_client.h
 * @brief libcurl client for OpenAI-compatible /chat/completions endpoints
 *
 * One client serves every session. Transfers run on curl multi handles
 * driven by the caller's thread, and all handles share one connection
 * cache, DNS cache and TLS session cache.
 */

#include "llm/completion_client.h"
#include "config.h"
#include <memory>

namespace livetalk {
namespace llm {

class OpenAIClient : public ICompletionClient {
public:
    explicit OpenAIClient(const LLMConfig& config);
    ~OpenAIClient() override;

    // Non-copyable
    OpenAIClient(const OpenAIClient&) = delete;
    OpenAIClient& operator=(const OpenAIClient&) = delete;

    std::unique_ptr<CompletionStream> stream(const ChatMessages& messages,
                                             Profile profile = Profile::Main) override;

    Result<std::string> summarize(const ChatMessages& messages,
                                  const std::string& summary_prompt,
                                  const CancellationToken& token) override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief Request body for a chat completion call
 */
std::string build_request_body(const ModelProfile& profile, const ChatMessages& messages, bool stream);

/**
 * @brief base_url + "/chat/completions", tolerating a trailing slash
 */
std::string completions_url(const std::string& base_url);

} // namespace llm
} // namespace livetalk
