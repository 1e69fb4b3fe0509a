/**
 * RingBuffer.cpp - Lock-free SPSC implementation
 * Note: Most logic is in header (template class)
 */

#include "gideon/audio/RingBuffer.hpp"

namespace gideon::audio {

// Capture and playback both move float samples
template class RingBuffer<float>;

} // namespace gideon::audio
