#pragma once

#include "common.h"
#include "config.h"
#include "errors.h"
#include <boost/asio/io_context.hpp>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <memory>
#include <functional>

namespace voxlink {

/**
 * @brief Gemini generateContent client for structured JSON replies
 *
 * Requests run on a worker thread (curl_easy_perform blocks); completions are
 * posted back onto the io_context so callers stay on the session thread.
 * Every request is bounded by ClassifierConfig::timeout_ms.
 */
class LLMClient {
public:
    using Callback = std::function<void(Result<std::string> text)>;

    LLMClient(boost::asio::io_context& ioc, const ClassifierConfig& config);
    ~LLMClient();

    // Non-copyable
    LLMClient(const LLMClient&) = delete;
    LLMClient& operator=(const LLMClient&) = delete;

    /**
     * @brief Queue a prompt whose reply must follow `response_schema`
     * @param callback Receives the first candidate's text (the JSON document)
     */
    void generate_json_async(const std::string& prompt,
                             const nlohmann::json& response_schema,
                             Callback callback);

    /// Request body for :generateContent
    static std::string build_request_body(const std::string& prompt, const nlohmann::json& response_schema);

    /// Concatenated text parts of the first candidate, or ParseError
    static Result<std::string> extract_candidate_text(const std::string& response_body);

    // Check if client is ready (API key configured)
    bool is_ready() const;

    /// Requests queued or running
    size_t pending_count() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voxlink
