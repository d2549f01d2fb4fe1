#pragma once

#include <cstddef>


namespace arbwire::core::config {

// ===============================================
// Transport ring sizes (power of two)
// ===============================================

// Inbound text frames (transport IO thread → poll thread)
inline constexpr std::size_t RX_FRAME_RING_CAPACITY = 1024;

// Control-plane events (close / error). Must never overflow.
inline constexpr std::size_t CONTROL_RING_CAPACITY = 64;

// Connection signals (Connection → Session)
inline constexpr std::size_t SIGNAL_RING_CAPACITY = 32;

// Upper bound of frames handled by a single Session::poll() call.
// Keeps one poll bounded while a burst is still being drained.
inline constexpr std::size_t MAX_FRAMES_PER_POLL = 512;

} // namespace arbwire::core::config
