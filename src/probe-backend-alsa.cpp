// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "probe-backend.hpp"
#include "probe-config.hpp"
#include "probe-types.hpp"

#include <cerrno>
#include <cstdlib>
#include <memory>

//#define ALSA_PCM_NEW_HW_PARAMS_API
//#define ALSA_PCM_NEW_SW_PARAMS_API
#include <alsa/asoundlib.h>

// --------------------------------------------------------------------------------------------------------------------

struct ProbeSession {
    snd_pcm_t* pcm = nullptr;
    snd_pcm_hw_params_t* params = nullptr;

    // set on the first rejected parameter or after a commit
    bool poisoned = false;
};

// --------------------------------------------------------------------------------------------------------------------

#if ASOUND_PROBE_DEBUG < 2
static void _snd_lib_error_silence(const char*, int, const char*, int, const char*, ...) {}
#endif

static snd_pcm_format_t getAlsaFormat(const SampleFormat format)
{
    switch (format)
    {
    case kSampleFormatInvalid:
        break;
    case kSampleFormat8:
        return SND_PCM_FORMAT_U8;
    case kSampleFormat16:
        return SND_PCM_FORMAT_S16;
    case kSampleFormat24Packed:
       #if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
        return SND_PCM_FORMAT_S24_3BE;
       #else
        return SND_PCM_FORMAT_S24_3LE;
       #endif
    case kSampleFormat24:
        return SND_PCM_FORMAT_S24;
    case kSampleFormat32:
        return SND_PCM_FORMAT_S32;
    }

    return SND_PCM_FORMAT_UNKNOWN;
}

static std::string getHintString(const void* const hint, const char* const id)
{
    std::string ret;

    if (char* const value = snd_device_name_get_hint(hint, id))
    {
        ret = value;
        std::free(value);
    }

    return ret;
}

// --------------------------------------------------------------------------------------------------------------------

bool enumerateProbeHints(std::vector<DeviceHint>& hints)
{
    void** names = nullptr;

    if (snd_device_name_hint(-1, "pcm", &names) != 0 || names == nullptr)
    {
        DEBUGPRINT("snd_device_name_hint fail");
        return false;
    }

    for (void** n = names; *n != nullptr; ++n)
    {
        DeviceHint hint;
        hint.name = getHintString(*n, "NAME");

        if (hint.name.empty())
            continue;

        hint.description = getHintString(*n, "DESC");
        hint.ioid = getHintString(*n, "IOID");
        hints.push_back(hint);
    }

    snd_device_name_free_hint(names);
    return true;
}

// --------------------------------------------------------------------------------------------------------------------

ProbeSession* openProbeSession(const char* const deviceID, const bool playback)
{
    std::unique_ptr<ProbeSession> session = std::unique_ptr<ProbeSession>(new ProbeSession);

    int err;
    unsigned uintParam;
    const snd_pcm_stream_t mode = playback ? SND_PCM_STREAM_PLAYBACK : SND_PCM_STREAM_CAPTURE;

    constexpr int flags = 0
                        | SND_PCM_NONBLOCK
                        | SND_PCM_NO_AUTO_CHANNELS
                        | SND_PCM_NO_AUTO_FORMAT
                        | SND_PCM_NO_AUTO_RESAMPLE
                        | SND_PCM_NO_SOFTVOL;

    if ((err = snd_pcm_open(&session->pcm, deviceID, mode, flags)) < 0)
    {
        DEBUGPRINT("snd_pcm_open %s fail %d %s", deviceID, playback, snd_strerror(err));
        return nullptr;
    }

    if ((err = snd_pcm_hw_params_malloc(&session->params)) < 0)
    {
        DEBUGPRINT("snd_pcm_hw_params_malloc fail %s", snd_strerror(err));
        goto error;
    }

    if ((err = snd_pcm_hw_params_any(session->pcm, session->params)) < 0)
    {
        DEBUGPRINT("snd_pcm_hw_params_any fail %s", snd_strerror(err));
        goto error;
    }

    if ((err = snd_pcm_hw_params_set_rate_resample(session->pcm, session->params, 0)) != 0)
    {
        DEBUGPRINT("snd_pcm_hw_params_set_rate_resample fail %s", snd_strerror(err));
        goto error;
    }

    // only native rates count, make sure resampling really is off
    if ((err = snd_pcm_hw_params_get_rate_resample(session->pcm, session->params, &uintParam)) != 0 || uintParam != 0)
    {
        DEBUGPRINT("snd_pcm_hw_params_get_rate_resample fail %s", snd_strerror(err));
        goto error;
    }

    return session.release();

error:
    if (session->params != nullptr)
        snd_pcm_hw_params_free(session->params);
    snd_pcm_close(session->pcm);
    return nullptr;
}

void closeProbeSession(ProbeSession* const session)
{
    if (session == nullptr)
        return;

    if (session->params != nullptr)
        snd_pcm_hw_params_free(session->params);

    snd_pcm_close(session->pcm);
    delete session;
}

// --------------------------------------------------------------------------------------------------------------------

bool getProbeSessionInfo(ProbeSession* const session, ProbeDeviceInfo& info)
{
    snd_pcm_info_t* pcminfo;
    snd_pcm_info_alloca(&pcminfo);

    int err;
    if ((err = snd_pcm_info(session->pcm, pcminfo)) != 0)
    {
        DEBUGPRINT("snd_pcm_info fail %s", snd_strerror(err));
        return false;
    }

    if (const char* const name = snd_pcm_info_get_name(pcminfo))
        info.description = name;

    info.deviceNumber = snd_pcm_info_get_device(pcminfo);
    info.subDeviceNumber = snd_pcm_info_get_subdevice(pcminfo);
    info.subDeviceCount = snd_pcm_info_get_subdevices_count(pcminfo);
    return true;
}

bool queryProbeSessionBounds(ProbeSession* const session, const ProbeParam param, uint32_t& min, uint32_t& max)
{
    if (session->poisoned)
        return false;

    int err;
    int dir = 0;
    unsigned minParam = 0, maxParam = 0;

    switch (param)
    {
    case kProbeParamRate:
        if ((err = snd_pcm_hw_params_get_rate_min(session->params, &minParam, &dir)) != 0)
            break;
        err = snd_pcm_hw_params_get_rate_max(session->params, &maxParam, &dir);
        break;
    case kProbeParamChannels:
        if ((err = snd_pcm_hw_params_get_channels_min(session->params, &minParam)) != 0)
            break;
        err = snd_pcm_hw_params_get_channels_max(session->params, &maxParam);
        break;
    case kProbeParamBufferTime:
        if ((err = snd_pcm_hw_params_get_buffer_time_min(session->params, &minParam, &dir)) != 0)
            break;
        err = snd_pcm_hw_params_get_buffer_time_max(session->params, &maxParam, &dir);
        break;
    case kProbeParamPeriodTime:
        if ((err = snd_pcm_hw_params_get_period_time_min(session->params, &minParam, &dir)) != 0)
            break;
        err = snd_pcm_hw_params_get_period_time_max(session->params, &maxParam, &dir);
        break;
    default:
        return false;
    }

    if (err != 0)
    {
        DEBUGPRINT("query bounds %d fail %s", param, snd_strerror(err));
        return false;
    }

    min = minParam;
    max = maxParam;
    return true;
}

bool setProbeSessionParam(ProbeSession* const session, const ProbeParam param, const uint32_t value)
{
    if (session->poisoned)
        return false;

    snd_pcm_t* const pcm = session->pcm;
    snd_pcm_hw_params_t* const params = session->params;

    int err;
    int dir = 0;
    unsigned uintParam = value;

    switch (param)
    {
    case kProbeParamFormat:
    {
        const snd_pcm_format_t format = getAlsaFormat(static_cast<SampleFormat>(value));
        snd_pcm_format_t actual = SND_PCM_FORMAT_UNKNOWN;

        if (format == SND_PCM_FORMAT_UNKNOWN)
            err = -EINVAL;
        else if ((err = snd_pcm_hw_params_set_format(pcm, params, format)) == 0)
            err = snd_pcm_hw_params_get_format(params, &actual);

        if (err == 0 && actual != format)
            err = -EINVAL;
        break;
    }
    case kProbeParamRate:
        if ((err = snd_pcm_hw_params_set_rate(pcm, params, value, 0)) == 0)
            err = snd_pcm_hw_params_get_rate(params, &uintParam, &dir);
        break;
    case kProbeParamChannels:
        if ((err = snd_pcm_hw_params_set_channels(pcm, params, value)) == 0)
            err = snd_pcm_hw_params_get_channels(params, &uintParam);
        break;
    case kProbeParamBufferTime:
        err = snd_pcm_hw_params_set_buffer_time_near(pcm, params, &uintParam, &dir);
        break;
    case kProbeParamPeriodTime:
        err = snd_pcm_hw_params_set_period_time_near(pcm, params, &uintParam, &dir);
        break;
    default:
        err = -EINVAL;
        break;
    }

    if (err == 0 && uintParam != value)
        err = -EINVAL;

    if (err != 0)
    {
        DEBUGPRINT("set param %d %u fail %s", param, value, snd_strerror(err));
        session->poisoned = true;
        return false;
    }

    return true;
}

bool commitProbeSession(ProbeSession* const session)
{
    if (session->poisoned)
        return false;

    session->poisoned = true;

    int err;
    if ((err = snd_pcm_hw_params(session->pcm, session->params)) != 0)
    {
        DEBUGPRINT("snd_pcm_hw_params fail %s", snd_strerror(err));
        return false;
    }

    return true;
}

void initProbeBackend()
{
   #if ASOUND_PROBE_DEBUG < 2
    // the handler is process-wide, so it is set once here and never from the workers
    snd_lib_error_set_handler(_snd_lib_error_silence);
   #endif
}

void cleanupProbeBackend()
{
   #if ASOUND_PROBE_DEBUG < 2
    snd_lib_error_set_handler(nullptr);
   #endif

    snd_config_update_free_global();
}

// --------------------------------------------------------------------------------------------------------------------
