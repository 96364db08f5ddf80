#include "state_machine.h"

namespace voxlink {

const char* connection_state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "DISCONNECTED";
        case ConnectionState::Connecting: return "CONNECTING";
        case ConnectionState::Connected: return "CONNECTED";
        case ConnectionState::Error: return "ERROR";
        default: return "UNKNOWN";
    }
}

const char* recording_state_name(RecordingState state) {
    switch (state) {
        case RecordingState::Idle: return "IDLE";
        case RecordingState::Recording: return "RECORDING";
        default: return "UNKNOWN";
    }
}

class StateMachine::Impl {
public:
    Impl() : connection_(ConnectionState::Disconnected), recording_(RecordingState::Idle) {}

    ConnectionState connection_state() const {
        return connection_;
    }

    RecordingState recording_state() const {
        return recording_;
    }

    bool on_connect_requested() {
        switch (connection_) {
            case ConnectionState::Disconnected:
            case ConnectionState::Error:
                connection_ = ConnectionState::Connecting;
                recording_ = RecordingState::Idle;
                return true;
            case ConnectionState::Connecting:
            case ConnectionState::Connected:
                break;
        }
        return false;
    }

    bool on_channel_open() {
        if (connection_ != ConnectionState::Connecting) return false;
        connection_ = ConnectionState::Connected;
        return true;
    }

    bool on_connect_failed() {
        if (connection_ != ConnectionState::Connecting) return false;
        connection_ = ConnectionState::Error;
        return true;
    }

    void on_teardown() {
        connection_ = ConnectionState::Disconnected;
        recording_ = RecordingState::Idle;
    }

    bool on_start_phrase() {
        if (connection_ != ConnectionState::Connected || recording_ != RecordingState::Idle) {
            return false;
        }
        recording_ = RecordingState::Recording;
        return true;
    }

    bool on_stop_phrase() {
        if (recording_ != RecordingState::Recording) return false;
        recording_ = RecordingState::Idle;
        return true;
    }

private:
    ConnectionState connection_;
    RecordingState recording_;
};

StateMachine::StateMachine() : pimpl_(std::make_unique<Impl>()) {}
StateMachine::~StateMachine() = default;

ConnectionState StateMachine::connection_state() const {
    return pimpl_->connection_state();
}

RecordingState StateMachine::recording_state() const {
    return pimpl_->recording_state();
}

bool StateMachine::is_connected() const {
    return pimpl_->connection_state() == ConnectionState::Connected;
}

bool StateMachine::is_recording() const {
    return is_connected() && pimpl_->recording_state() == RecordingState::Recording;
}

bool StateMachine::on_connect_requested() {
    return pimpl_->on_connect_requested();
}

bool StateMachine::on_channel_open() {
    return pimpl_->on_channel_open();
}

bool StateMachine::on_connect_failed() {
    return pimpl_->on_connect_failed();
}

void StateMachine::on_teardown() {
    pimpl_->on_teardown();
}

bool StateMachine::on_start_phrase() {
    return pimpl_->on_start_phrase();
}

bool StateMachine::on_stop_phrase() {
    return pimpl_->on_stop_phrase();
}

} // namespace voxlink
