/**
 * @file stft.cpp
 * @brief FFTW backed STFT / ISTFT
 */

#include "audioprint/dsp/stft.hpp"

#include <cmath>
#include <cstring>

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace audioprint {
namespace dsp {

// The FFTW planner is not thread-safe; fftwf_execute is.
std::mutex& fftwPlannerMutex() {
    static std::mutex mutex;
    return mutex;
}

Stft::Stft(const Config& config)
    : config_(config)
{
    if (config_.n_fft <= 0 || config_.hop_length <= 0) {
        throw std::runtime_error("Invalid STFT framing: n_fft=" + std::to_string(config_.n_fft) +
                                 " hop_length=" + std::to_string(config_.hop_length));
    }
    window_ = createHannWindow(config_.n_fft);
    initializeFFTW();
}

Stft::~Stft() {
    cleanupFFTW();
}

void Stft::initializeFFTW() {
    std::lock_guard<std::mutex> lock(fftwPlannerMutex());

    time_buffer_ = fftwf_alloc_real(config_.n_fft);
    freq_buffer_ = fftwf_alloc_complex(config_.n_fft / 2 + 1);  // r2c only needs N/2+1 outputs
    if (!time_buffer_ || !freq_buffer_) {
        if (time_buffer_) fftwf_free(time_buffer_);
        if (freq_buffer_) fftwf_free(freq_buffer_);
        time_buffer_ = nullptr;
        freq_buffer_ = nullptr;
        throw std::runtime_error("Failed to allocate FFTW buffers");
    }

    // FFTW_ESTIMATE keeps the chosen algorithm, and therefore the rounding, identical run to run
    forward_plan_ = fftwf_plan_dft_r2c_1d(config_.n_fft, time_buffer_, freq_buffer_, FFTW_ESTIMATE);
    inverse_plan_ = fftwf_plan_dft_c2r_1d(config_.n_fft, freq_buffer_, time_buffer_, FFTW_ESTIMATE);
    if (!forward_plan_ || !inverse_plan_) {
        if (forward_plan_) fftwf_destroy_plan(forward_plan_);
        if (inverse_plan_) fftwf_destroy_plan(inverse_plan_);
        fftwf_free(time_buffer_);
        fftwf_free(freq_buffer_);
        forward_plan_ = nullptr;
        inverse_plan_ = nullptr;
        time_buffer_ = nullptr;
        freq_buffer_ = nullptr;
        throw std::runtime_error("Failed to create FFTW plans (size=" + std::to_string(config_.n_fft) + ")");
    }
}

void Stft::cleanupFFTW() {
    std::lock_guard<std::mutex> lock(fftwPlannerMutex());

    if (forward_plan_) {
        fftwf_destroy_plan(forward_plan_);
        forward_plan_ = nullptr;
    }
    if (inverse_plan_) {
        fftwf_destroy_plan(inverse_plan_);
        inverse_plan_ = nullptr;
    }
    if (time_buffer_) {
        fftwf_free(time_buffer_);
        time_buffer_ = nullptr;
    }
    if (freq_buffer_) {
        fftwf_free(freq_buffer_);
        freq_buffer_ = nullptr;
    }
}

std::vector<float> Stft::createHannWindow(int size) {
    std::vector<float> window(size);
    for (int i = 0; i < size; ++i) {
        window[i] = static_cast<float>(0.5 - 0.5 * std::cos(2.0 * M_PI * i / size));
    }
    return window;
}

std::vector<float> Stft::binFrequencies(int n_fft, int sample_rate) {
    std::vector<float> freqs(n_fft / 2 + 1);
    for (std::size_t k = 0; k < freqs.size(); ++k) {
        freqs[k] = static_cast<float>(static_cast<double>(k) * sample_rate / n_fft);
    }
    return freqs;
}

int Stft::numFrames(std::size_t length) const {
    return 1 + static_cast<int>(length / static_cast<std::size_t>(config_.hop_length));
}

void Stft::loadFrame(const std::vector<float>& signal, int frame_index) {
    const long long length = static_cast<long long>(signal.size());
    const long long start = static_cast<long long>(frame_index) * config_.hop_length - config_.n_fft / 2;

    for (int j = 0; j < config_.n_fft; ++j) {
        const long long idx = start + j;
        const float sample = (idx >= 0 && idx < length) ? signal[static_cast<std::size_t>(idx)] : 0.0f;
        time_buffer_[j] = sample * window_[j];
    }
}

void Stft::forEachFrame(const std::vector<float>& signal, const FrameCallback& callback) {
    const int frames = numFrames(signal.size());
    const int bins = getNumBins();
    std::vector<std::complex<float>> spectrum(bins);

    for (int t = 0; t < frames; ++t) {
        loadFrame(signal, t);
        fftwf_execute(forward_plan_);

        for (int k = 0; k < bins; ++k) {
            spectrum[k] = std::complex<float>(freq_buffer_[k][0], freq_buffer_[k][1]);
        }
        callback(t, spectrum.data());
    }
}

ComplexSpectrogram Stft::forward(const std::vector<float>& signal) {
    ComplexSpectrogram result;
    result.num_frames = numFrames(signal.size());
    result.num_bins = getNumBins();
    result.data.resize(static_cast<std::size_t>(result.num_frames) * result.num_bins);

    forEachFrame(signal, [&result](int t, const std::complex<float>* spectrum) {
        std::copy(spectrum, spectrum + result.num_bins, result.frame(t));
    });

    return result;
}

std::vector<float> Stft::inverse(const ComplexSpectrogram& spectrogram, std::size_t length) {
    const int n_fft = config_.n_fft;
    const int bins = getNumBins();
    if (spectrogram.num_bins != bins) {
        throw std::runtime_error("Spectrogram bin count " + std::to_string(spectrogram.num_bins) +
                                 " does not match FFT size " + std::to_string(n_fft));
    }

    std::vector<double> audio(length, 0.0);
    std::vector<double> window_sum(length, 0.0);
    const long long out_length = static_cast<long long>(length);

    for (int t = 0; t < spectrogram.num_frames; ++t) {
        // c2r overwrites its input, so refill the buffer every frame
        const std::complex<float>* frame = spectrogram.frame(t);
        for (int k = 0; k < bins; ++k) {
            freq_buffer_[k][0] = frame[k].real();
            freq_buffer_[k][1] = frame[k].imag();
        }

        fftwf_execute(inverse_plan_);

        // Window and overlap-add (FFTW's inverse is unnormalised)
        const long long start = static_cast<long long>(t) * config_.hop_length - n_fft / 2;
        for (int j = 0; j < n_fft; ++j) {
            const long long pos = start + j;
            if (pos < 0 || pos >= out_length) {
                continue;
            }
            audio[pos] += static_cast<double>(time_buffer_[j]) / n_fft * window_[j];
            window_sum[pos] += static_cast<double>(window_[j]) * window_[j];
        }
    }

    std::vector<float> result(length, 0.0f);
    for (std::size_t i = 0; i < length; ++i) {
        if (window_sum[i] > 1e-10) {
            result[i] = static_cast<float>(audio[i] / window_sum[i]);
        }
    }
    return result;
}

}  // namespace dsp
}  // namespace audioprint
