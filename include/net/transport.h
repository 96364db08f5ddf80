#pragma once

#include "errors.h"
#include <cstddef>
#include <functional>
#include <string>

namespace voxlink {

/**
 * @brief Persistent duplex message transport (one text frame per message)
 *
 * All handlers run on the owning io_context. After close() no handler is
 * invoked again for that connection.
 */
class Transport {
public:
    struct Handlers {
        std::function<void()> on_open;
        std::function<void(const std::string&)> on_message;
        std::function<void(const Error&)> on_error;
        std::function<void()> on_close;
    };

    virtual ~Transport() = default;

    /// Start connecting; on_open or on_error follows. Replaces any prior connection.
    virtual void open(Handlers handlers) = 0;

    /// Queue one text message; dropped with a warning when not open
    virtual void send(const std::string& message) = 0;

    virtual void close() = 0;

    virtual bool is_open() const = 0;

    /// Messages accepted by send() but not yet written to the wire
    virtual size_t pending_writes() const = 0;
};

} // namespace voxlink
