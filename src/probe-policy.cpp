// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "probe-policy.hpp"

#include <iterator>

// --------------------------------------------------------------------------------------------------------------------

ProbePolicy::ProbePolicy()
    : formats(std::begin(kSampleFormatsToTry), std::end(kSampleFormatsToTry)),
      fallbackRates(std::begin(kFallbackRatesToTry), std::end(kFallbackRatesToTry)),
      hintPrefixes(std::begin(kHardwareHintPrefixes), std::end(kHardwareHintPrefixes))
{
    for (uint32_t c = 1; c <= ASOUND_PROBE_FALLBACK_MAX_CHANNELS; ++c)
        fallbackChannels.push_back(c);
}

// --------------------------------------------------------------------------------------------------------------------
