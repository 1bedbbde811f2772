#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>
#include <flora/audio/audio_capture.h>
#include <iostream>

namespace flora::audio {

struct AudioCapture::Impl {
    ma_device device;
    ma_context context;
    bool deviceInitialized = false;
    bool contextInitialized = false;
};

namespace {

struct CaptureDeviceList {
    ma_device_info* devices = nullptr;
    ma_uint32 count = 0;
};

bool enumerateCaptureDevices(ma_context& context, CaptureDeviceList& list) {
    ma_device_info* playback = nullptr;
    ma_uint32 playbackCount = 0;
    return ma_context_get_devices(&context, &playback, &playbackCount,
                                  &list.devices, &list.count) == MA_SUCCESS;
}

} // namespace

AudioCapture::AudioCapture() : impl_(std::make_unique<Impl>()) {}

AudioCapture::~AudioCapture() {
    shutdown();
}

std::vector<AudioDeviceInfo> AudioCapture::listDevices() {
    std::vector<AudioDeviceInfo> devices;

    ma_context context;
    if (ma_context_init(nullptr, 0, nullptr, &context) != MA_SUCCESS) {
        std::cerr << "[AudioCapture] Failed to initialize context for device enumeration\n";
        return devices;
    }

    CaptureDeviceList list;
    if (enumerateCaptureDevices(context, list)) {
        for (ma_uint32 i = 0; i < list.count; i++) {
            devices.push_back({list.devices[i].name, i, list.devices[i].isDefault != 0});
        }
    } else {
        std::cerr << "[AudioCapture] Failed to enumerate devices\n";
    }

    ma_context_uninit(&context);
    return devices;
}

bool AudioCapture::init(uint32_t sampleRate, uint32_t bufferFrames, int deviceIndex) {
    if (initialized_) {
        shutdown();
    }

    sampleRate_ = sampleRate;

    samples_.reset(bufferFrames);

    if (ma_context_init(nullptr, 0, nullptr, &impl_->context) != MA_SUCCESS) {
        std::cerr << "[AudioCapture] Failed to initialize context\n";
        return false;
    }
    impl_->contextInitialized = true;

    ma_device_config config = ma_device_config_init(ma_device_type_capture);
    config.capture.format = ma_format_f32;
    config.capture.channels = 1;
    config.sampleRate = sampleRate_;
    config.dataCallback = &AudioCapture::dataCallback;
    config.pUserData = this;
    config.periodSizeInFrames = 256;

    CaptureDeviceList list;
    if (deviceIndex >= 0 && enumerateCaptureDevices(impl_->context, list)) {
        if (static_cast<ma_uint32>(deviceIndex) < list.count) {
            config.capture.pDeviceID = &list.devices[deviceIndex].id;
            std::cout << "[AudioCapture] Using device: " << list.devices[deviceIndex].name << "\n";
        } else {
            std::cerr << "[AudioCapture] No capture device " << deviceIndex
                      << " (" << list.count << " available), using default\n";
        }
    }

    if (ma_device_init(&impl_->context, &config, &impl_->device) != MA_SUCCESS) {
        std::cerr << "[AudioCapture] Failed to initialize capture device\n";
        ma_context_uninit(&impl_->context);
        impl_->contextInitialized = false;
        return false;
    }

    impl_->deviceInitialized = true;
    initialized_ = true;

    std::cout << "[AudioCapture] Initialized: " << sampleRate_ << "Hz, mono\n";
    return true;
}

void AudioCapture::shutdown() {
    if (capturing_) {
        stop();
    }

    if (impl_->deviceInitialized) {
        ma_device_uninit(&impl_->device);
        impl_->deviceInitialized = false;
    }

    if (impl_->contextInitialized) {
        ma_context_uninit(&impl_->context);
        impl_->contextInitialized = false;
    }

    initialized_ = false;
}

bool AudioCapture::start() {
    if (!initialized_) return false;
    if (capturing_) return true;

    if (ma_device_start(&impl_->device) != MA_SUCCESS) {
        std::cerr << "[AudioCapture] Failed to start capture\n";
        return false;
    }
    capturing_ = true;
    std::cout << "[AudioCapture] Started capturing\n";
    return true;
}

void AudioCapture::stop() {
    if (!initialized_ || !capturing_) return;

    if (ma_device_stop(&impl_->device) != MA_SUCCESS) {
        std::cerr << "[AudioCapture] Failed to stop capture\n";
        return;
    }
    capturing_ = false;
}

uint32_t AudioCapture::readLatest(float* output, uint32_t frameCount, std::chrono::milliseconds timeout) {
    if (!initialized_) return 0;
    return samples_.readLatest(output, frameCount, timeout);
}

void AudioCapture::dataCallback(ma_device* pDevice, void* output, const void* input, ma_uint32 frameCount) {
    (void)output;

    AudioCapture* capture = static_cast<AudioCapture*>(pDevice->pUserData);
    capture->samples_.push(static_cast<const float*>(input), frameCount);
}

} // namespace flora::audio
