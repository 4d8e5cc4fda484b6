//
//  sample_transform.hpp
//  FseqForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>

#include "sample_buffer.hpp"

namespace fseqforge {

// Mix interleaved channels down to one by integer mean (truncated toward zero).
// Mono input is returned unchanged.
SampleBuffer to_mono(const SampleBuffer &in);

// Linear-interpolating resampler. Output length per channel is
// floor(frames * dst_rate / src_rate); values are clamped to int16 and truncated.
// Returns the input unchanged when the rates match.
SampleBuffer resample_linear(const SampleBuffer &in, uint32_t dst_rate);

}  // namespace fseqforge
