#pragma once

#include "common.h"
#include "config.h"
#include "errors.h"
#include "memory/memory_record.h"
#include "net/transport.h"
#include <nlohmann/json_fwd.hpp>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace voxlink {

/**
 * @brief Client for the remote memory backend
 *
 * One authenticated connection; every operation goes through a FIFO and at
 * most one request is on the wire at a time, because responses carry no
 * correlation id and are matched to requests by arrival order.
 *
 * Connection: transport open -> {type:"auth"} -> wait for {type:"auth_ok"}.
 * An {type:"error"} or transport failure before auth_ok fails the operation
 * that triggered the connect. The next operation reconnects.
 *
 * All methods and callbacks run on the io_context thread.
 */
class MemoryStoreClient {
public:
    using LogListener = std::function<void(const std::string& message, Severity severity)>;
    using InsertCallback = std::function<void(Result<std::string> id)>;
    using FetchCallback = std::function<void(Result<std::vector<MemoryRecord>> records)>;

    MemoryStoreClient(Transport& transport, const MemoryStoreConfig& config);
    ~MemoryStoreClient();

    MemoryStoreClient(const MemoryStoreClient&) = delete;
    MemoryStoreClient& operator=(const MemoryStoreClient&) = delete;

    // Raw operations: failures are delivered as errors

    void insert(const std::string& content, const std::string& category,
                const std::vector<std::string>& tags, InsertCallback callback);
    void fetch_all(FetchCallback callback);

    // Degrading helpers: never fail, failures become log events

    /// Id from the backend, or "offline-id-<epoch ms>" on failure
    void save_memory(const std::string& content, const std::string& category,
                     const std::vector<std::string>& tags,
                     std::function<void(const std::string& id)> callback);

    /// All records, or empty on failure
    void get_all_memories(std::function<void(const std::vector<MemoryRecord>&)> callback);

    /// Filtered records (see search_records), or empty on failure / vacuous query
    void search_memories(const std::string& query, const std::vector<std::string>& tags,
                         std::function<void(const std::vector<MemoryRecord>&)> callback);

    // Log observers

    size_t subscribe(LogListener listener);
    void unsubscribe(size_t token);

    bool is_authenticated() const { return authenticated_; }

    /// Operations waiting behind the pending one
    size_t queued_count() const { return queue_.size(); }
    bool has_pending() const { return pending_ != nullptr; }

    /// Drop the connection; queued operations fail
    void disconnect();

private:
    struct Operation {
        std::string request;
        std::function<void(const nlohmann::json& response)> resolve;
        std::function<void(const Error&)> reject;
    };

    void enqueue(Operation op);
    void process_queue();
    void connect();
    void on_open();
    void on_message(const std::string& raw);
    void on_transport_error(const Error& error);
    void on_transport_close();
    void fail_connect(const Error& error);
    void fail_pending(const Error& error);
    void emit_log(const std::string& message, Severity severity = Severity::Info);

    Transport& transport_;
    MemoryStoreConfig config_;
    std::deque<Operation> queue_;
    std::unique_ptr<Operation> pending_;
    bool connecting_ = false;
    bool authenticated_ = false;
    std::map<size_t, LogListener> listeners_;
    size_t next_token_ = 1;
};

} // namespace voxlink
