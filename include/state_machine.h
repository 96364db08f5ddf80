#pragma once

#include <memory>

namespace voxlink {

/**
 * @brief Connection state of the live session
 */
enum class ConnectionState {
    Disconnected,  ///< No channel; terminal and re-entrant
    Connecting,    ///< Channel requested, waiting for open acknowledgment
    Connected,     ///< Channel open, microphone streaming
    Error          ///< Connect failed before the channel opened
};

/**
 * @brief Recording sub-state, meaningful only while Connected
 */
enum class RecordingState {
    Idle,       ///< Each turn is augmented on its own
    Recording   ///< Turns accumulate until the stop phrase
};

const char* connection_state_name(ConnectionState state);
const char* recording_state_name(RecordingState state);

/**
 * @brief State machine for the session lifecycle
 *
 * - Disconnected/Error -> Connecting (connect requested)
 * - Connecting -> Connected (channel open acknowledgment)
 * - Connecting -> Error (channel failed before opening)
 * - any -> Disconnected (teardown)
 *
 * Recording, while Connected:
 * - Idle -> Recording (start phrase)
 * - Recording -> Idle (stop phrase)
 *
 * Every transition method returns false and leaves the state unchanged when
 * the transition is not allowed from the current state.
 */
class StateMachine {
public:
    StateMachine();
    ~StateMachine();

    ConnectionState connection_state() const;
    RecordingState recording_state() const;

    bool is_connected() const;
    bool is_recording() const;

    bool on_connect_requested();
    bool on_channel_open();
    bool on_connect_failed();

    /**
     * @brief Return to Disconnected/Idle from any state
     */
    void on_teardown();

    bool on_start_phrase();
    bool on_stop_phrase();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voxlink
