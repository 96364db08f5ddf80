#include "memory/memory_store_client.h"
#include "logger.h"
#include "utils.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace voxlink {

namespace {

std::string id_to_string(const json& id) {
    if (id.is_string()) return id.get<std::string>();
    if (id.is_number_integer()) return std::to_string(id.get<int64_t>());
    if (id.is_null()) return "";
    return id.dump();
}

std::vector<MemoryRecord> records_from_items(const json& items) {
    std::vector<MemoryRecord> records;
    if (!items.is_array()) return records;
    for (const auto& item : items) {
        if (!item.is_object()) continue;
        MemoryRecord r;
        r.id = item.contains("id") ? id_to_string(item["id"]) : "";
        r.content = item.value("data", "");
        r.category = "Unknown";
        if (item.contains("categories") && item["categories"].is_array() && !item["categories"].empty() &&
            item["categories"][0].is_string()) {
            r.category = item["categories"][0].get<std::string>();
        }
        if (item.contains("tags") && item["tags"].is_array()) {
            for (const auto& t : item["tags"]) {
                if (t.is_string()) r.tags.push_back(t.get<std::string>());
            }
        }
        r.created_ms = item.contains("created_ms") && item["created_ms"].is_number()
                           ? item["created_ms"].get<int64_t>()
                           : epoch_ms();
        records.push_back(std::move(r));
    }
    return records;
}

} // namespace

MemoryStoreClient::MemoryStoreClient(Transport& transport, const MemoryStoreConfig& config)
    : transport_(transport), config_(config) {}

MemoryStoreClient::~MemoryStoreClient() {
    transport_.close();
}

// --- Raw operations ---

void MemoryStoreClient::insert(const std::string& content, const std::string& category,
                               const std::vector<std::string>& tags, InsertCallback callback) {
    emit_log("Archiving to sector [" + category + "]: \"" + utils::preview(content, 20) + "\"");

    json request = {
        {"type", "insert"},
        {"partition", config_.partition},
        {"data", content},
        {"tags", tags},
        {"categories", json::array({category})}
    };

    Operation op;
    op.request = request.dump();
    op.resolve = [this, callback](const json& msg) {
        std::string type = msg.value("type", "");
        if (type != "inserted") {
            callback(make_parse_error("Unexpected response: " + type));
            return;
        }
        std::string id = msg.contains("id") ? id_to_string(msg["id"]) : "";
        emit_log("Archive confirmed. ID: " + id, Severity::Success);
        callback(id);
    };
    op.reject = [callback](const Error& error) { callback(error); };
    enqueue(std::move(op));
}

void MemoryStoreClient::fetch_all(FetchCallback callback) {
    emit_log("Initiating full memory dump...");

    json request = {
        {"type", "search"},
        {"partition", config_.partition},
        {"tags", json::array()},
        {"categories", json::array()}
    };

    Operation op;
    op.request = request.dump();
    op.resolve = [this, callback](const json& msg) {
        std::string type = msg.value("type", "");
        if (type != "search_results") {
            callback(make_parse_error("Unexpected response: " + type));
            return;
        }
        std::vector<MemoryRecord> records = records_from_items(msg.contains("items") ? msg["items"] : json());
        emit_log("Memory dump complete. " + std::to_string(records.size()) + " records found.", Severity::Success);
        callback(std::move(records));
    };
    op.reject = [callback](const Error& error) { callback(error); };
    enqueue(std::move(op));
}

// --- Degrading helpers ---

void MemoryStoreClient::save_memory(const std::string& content, const std::string& category,
                                    const std::vector<std::string>& tags,
                                    std::function<void(const std::string&)> callback) {
    insert(content, category, tags, [this, callback](Result<std::string> id) {
        if (id) {
            callback(id.value());
            return;
        }
        emit_log("Write Protocol Failed: " + id.error().message, Severity::Error);
        callback("offline-id-" + std::to_string(epoch_ms()));
    });
}

void MemoryStoreClient::get_all_memories(std::function<void(const std::vector<MemoryRecord>&)> callback) {
    fetch_all([this, callback](Result<std::vector<MemoryRecord>> records) {
        if (records) {
            callback(records.value());
            return;
        }
        emit_log("Read Protocol Failed: " + records.error().message, Severity::Error);
        callback({});
    });
}

void MemoryStoreClient::search_memories(const std::string& query, const std::vector<std::string>& tags,
                                        std::function<void(const std::vector<MemoryRecord>&)> callback) {
    if (is_vacuous_query(query, tags)) {
        callback({});
        return;
    }

    std::string message = "Searching archives: \"" + query + "\"";
    if (!tags.empty()) message += " [" + utils::join(tags, ",") + "]";
    emit_log(message);

    size_t limit = config_.search_limit;
    fetch_all([this, callback, query, tags, limit](Result<std::vector<MemoryRecord>> records) {
        if (!records) {
            emit_log("Search Protocol Failed: " + records.error().message, Severity::Error);
            callback({});
            return;
        }
        std::vector<MemoryRecord> results = search_records(records.value(), query, tags, limit);
        if (!results.empty()) {
            emit_log("Search complete. " + std::to_string(results.size()) + " relevant records identified.",
                     Severity::Success);
        } else {
            emit_log("Search complete. No relevant records found.");
        }
        callback(results);
    });
}

// --- Log observers ---

size_t MemoryStoreClient::subscribe(LogListener listener) {
    size_t token = next_token_++;
    listeners_[token] = std::move(listener);
    return token;
}

void MemoryStoreClient::unsubscribe(size_t token) {
    listeners_.erase(token);
}

void MemoryStoreClient::emit_log(const std::string& message, Severity severity) {
    if (severity == Severity::Error) {
        Logger::error("[MemoryDB] " + message);
    } else {
        LOG_MEMORY(message);
    }
    // Copy: a listener may unsubscribe itself
    auto listeners = listeners_;
    for (const auto& entry : listeners) {
        entry.second(message, severity);
    }
}

// --- Queue and connection ---

void MemoryStoreClient::enqueue(Operation op) {
    queue_.push_back(std::move(op));
    process_queue();
}

void MemoryStoreClient::process_queue() {
    if (pending_ || connecting_ || queue_.empty()) return;

    if (!authenticated_ || !transport_.is_open()) {
        authenticated_ = false;
        connect();
        return;
    }

    pending_ = std::make_unique<Operation>(std::move(queue_.front()));
    queue_.pop_front();
    transport_.send(pending_->request);
}

void MemoryStoreClient::connect() {
    connecting_ = true;
    emit_log("Initiating uplink to Memory Core...");

    Transport::Handlers handlers;
    handlers.on_open = [this]() { on_open(); };
    handlers.on_message = [this](const std::string& raw) { on_message(raw); };
    handlers.on_error = [this](const Error& error) { on_transport_error(error); };
    handlers.on_close = [this]() { on_transport_close(); };
    transport_.open(std::move(handlers));
}

void MemoryStoreClient::on_open() {
    emit_log("Uplink established. Transmitting auth codes...");
    json auth = {
        {"type", "auth"},
        {"login", config_.login},
        {"password", config_.password}
    };
    transport_.send(auth.dump());
}

void MemoryStoreClient::on_message(const std::string& raw) {
    json msg;
    try {
        msg = json::parse(raw);
    } catch (const json::exception& e) {
        Logger::error("[MemoryDB] Parse error: " + std::string(e.what()));
        return;
    }
    std::string type = msg.is_object() ? msg.value("type", "") : "";

    if (type == "auth_ok") {
        authenticated_ = true;
        connecting_ = false;
        emit_log("Memory Core access: GRANTED.", Severity::Success);
        process_queue();
        return;
    }

    if (!authenticated_) {
        if (type == "error") {
            std::string reason = msg.value("message", "unknown");
            emit_log("Auth Failure: " + reason, Severity::Error);
            transport_.close();
            fail_connect(make_auth_error("Auth Failure: " + reason));
        }
        return;
    }

    if (!pending_) {
        Logger::warn("[MemoryDB] Unsolicited message: " + type);
        return;
    }

    std::unique_ptr<Operation> op = std::move(pending_);
    if (type == "error") {
        std::string reason = msg.value("message", "unknown");
        emit_log("Operation Error: " + reason, Severity::Error);
        op->reject(make_remote_error(reason));
    } else {
        op->resolve(msg);
    }
    process_queue();
}

void MemoryStoreClient::on_transport_error(const Error& error) {
    emit_log("Memory Core socket malfunction.", Severity::Error);
    Logger::debug("[MemoryDB] " + error.message);
    if (connecting_ || !authenticated_) {
        fail_connect(make_network_error("Connection failed: " + error.message));
        return;
    }
    authenticated_ = false;
    fail_pending(make_network_error("Connection error during request"));
}

void MemoryStoreClient::on_transport_close() {
    if (authenticated_) {
        emit_log("Memory Core uplink terminated.");
    }
    if (connecting_ || !authenticated_) {
        fail_connect(make_network_error("Connection closed before auth"));
        return;
    }
    authenticated_ = false;
    fail_pending(make_network_error("Connection closed"));
}

// The operation at the head of the queue triggered this connect attempt
void MemoryStoreClient::fail_connect(const Error& error) {
    connecting_ = false;
    authenticated_ = false;
    if (!queue_.empty()) {
        Operation op = std::move(queue_.front());
        queue_.pop_front();
        op.reject(error);
    }
    process_queue();
}

void MemoryStoreClient::fail_pending(const Error& error) {
    if (pending_) {
        std::unique_ptr<Operation> op = std::move(pending_);
        op->reject(error);
    }
    process_queue();
}

void MemoryStoreClient::disconnect() {
    transport_.close();
    authenticated_ = false;
    connecting_ = false;
    std::unique_ptr<Operation> pending = std::move(pending_);
    std::deque<Operation> queued;
    queued.swap(queue_);
    Error error = make_network_error("Disconnected");
    if (pending) pending->reject(error);
    for (auto& op : queued) op.reject(error);
}

} // namespace voxlink
