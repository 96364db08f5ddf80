#include "llm_client.h"
#include "logger.h"
#include <boost/asio/post.hpp>
#include <curl/curl.h>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <sstream>
#include <thread>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace voxlink {

class LLMClient::Impl {
public:
    Impl(boost::asio::io_context& ioc, const ClassifierConfig& config)
        : ioc_(ioc), config_(config), running_(true), active_requests_(0) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        worker_ = std::thread(&Impl::worker_thread, this);
    }

    ~Impl() {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            running_ = false;
        }
        queue_cv_.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }
        curl_global_cleanup();
    }

    void generate_json_async(const std::string& prompt, const json& schema, Callback callback) {
        Task task;
        task.body = build_request_body(prompt, schema);
        task.callback = std::move(callback);
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (!running_) {
                Logger::warn("LLMClient is shutdown, request dropped");
                return;
            }
            task_queue_.push(std::move(task));
        }
        queue_cv_.notify_one();
    }

    bool is_ready() const {
        return !config_.api_key.empty();
    }

    size_t pending_count() const {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        return task_queue_.size() + active_requests_;
    }

private:
    struct Task {
        std::string body;
        Callback callback;
    };

    void worker_thread() {
        while (true) {
            Task task;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                queue_cv_.wait(lock, [this] {
                    return !task_queue_.empty() || !running_;
                });
                if (!running_) {
                    break;
                }
                task = std::move(task_queue_.front());
                task_queue_.pop();
                active_requests_++;
            }

            Result<std::string> result = perform(task.body);

            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                active_requests_--;
            }

            Callback callback = std::move(task.callback);
            boost::asio::post(ioc_, [callback, result]() {
                if (callback) callback(result);
            });
        }
    }

    Result<std::string> perform(const std::string& request_json) {
        if (config_.api_key.empty()) {
            return make_config_error("Classifier API key not configured");
        }

        std::string url = config_.endpoint + "/models/" + config_.model + ":generateContent";
        LOG_CONTEXT("Starting HTTP request to: " + url);

        CURL* curl = curl_easy_init();
        if (!curl) {
            return make_network_error("Failed to initialize CURL");
        }

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");
        std::string key_header = "x-goog-api-key: " + config_.api_key;
        headers = curl_slist_append(headers, key_header.c_str());

        std::string response_buffer;

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request_json.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeout_ms));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config_.connect_timeout_ms));
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        CURLcode res = curl_easy_perform(curl);
        long http_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);

        if (res == CURLE_OPERATION_TIMEDOUT) {
            return make_timeout_error("Classifier request timed out after " +
                                      std::to_string(config_.timeout_ms) + "ms");
        }
        if (res != CURLE_OK) {
            return make_network_error(curl_easy_strerror(res));
        }
        if (http_code < 200 || http_code >= 300) {
            std::ostringstream oss;
            oss << "HTTP " << http_code << ": " << response_buffer.substr(0, 200);
            return make_network_error(oss.str());
        }
        return extract_candidate_text(response_buffer);
    }

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
        std::string* buffer = static_cast<std::string*>(userp);
        size_t total_size = size * nmemb;
        buffer->append(static_cast<char*>(contents), total_size);
        return total_size;
    }

    boost::asio::io_context& ioc_;
    ClassifierConfig config_;
    std::thread worker_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::queue<Task> task_queue_;
    bool running_;
    size_t active_requests_;
};

LLMClient::LLMClient(boost::asio::io_context& ioc, const ClassifierConfig& config)
    : pimpl_(std::make_unique<Impl>(ioc, config)) {}

LLMClient::~LLMClient() = default;

void LLMClient::generate_json_async(const std::string& prompt, const json& response_schema,
                                    Callback callback) {
    pimpl_->generate_json_async(prompt, response_schema, std::move(callback));
}

std::string LLMClient::build_request_body(const std::string& prompt, const json& response_schema) {
    json request;
    request["contents"] = json::array({
        {{"role", "user"}, {"parts", json::array({{{"text", prompt}}})}}
    });
    request["generationConfig"]["responseMimeType"] = "application/json";
    if (!response_schema.is_null()) {
        request["generationConfig"]["responseSchema"] = response_schema;
    }
    return request.dump();
}

Result<std::string> LLMClient::extract_candidate_text(const std::string& response_body) {
    try {
        json response_json = json::parse(response_body);
        if (!response_json.contains("candidates") || !response_json["candidates"].is_array() ||
            response_json["candidates"].empty()) {
            return make_parse_error("No candidates in response");
        }
        const json& candidate = response_json["candidates"][0];
        if (!candidate.contains("content") || !candidate["content"].contains("parts")) {
            return make_parse_error("Candidate has no content parts");
        }
        std::string text;
        for (const auto& part : candidate["content"]["parts"]) {
            if (part.contains("text") && part["text"].is_string()) {
                text += part["text"].get<std::string>();
            }
        }
        if (text.empty()) {
            return make_parse_error("Candidate text is empty");
        }
        return text;
    } catch (const json::exception& e) {
        return make_parse_error("JSON parse error: " + std::string(e.what()));
    }
}

bool LLMClient::is_ready() const {
    return pimpl_->is_ready();
}

size_t LLMClient::pending_count() const {
    return pimpl_->pending_count();
}

} // namespace voxlink
